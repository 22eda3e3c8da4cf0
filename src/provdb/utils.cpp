#include "./utils.hpp"

#include <sodium.h>

#include <cctype>
#include <cstdio>
#include <ctime>

namespace ProvDB {

std::string bin2hex(const uint8_t* data, size_t size) {
	std::string hex_str(size*2 + 1, '\0');
	sodium_bin2hex(hex_str.data(), hex_str.size(), data, size);
	hex_str.resize(size*2); // drop the terminator
	return hex_str;
}

std::string bin2hex(const std::vector<uint8_t>& data) {
	return bin2hex(data.data(), data.size());
}

std::string toLower(std::string_view str) {
	std::string lower;
	lower.reserve(str.size());
	for (const char c : str) {
		lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
	}
	return lower;
}

std::vector<std::string> splitDotted(std::string_view path) {
	std::vector<std::string> parts;
	size_t start = 0;
	while (true) {
		const size_t next = path.find('.', start);
		if (next == std::string_view::npos) {
			parts.emplace_back(path.substr(start));
			break;
		}
		parts.emplace_back(path.substr(start, next - start));
		start = next + 1;
	}
	return parts;
}

static void utcFromTime(const std::time_t t, std::tm& tm) {
#if defined(_WIN32) || defined(WIN32)
	gmtime_s(&tm, &t);
#else
	utcFromTime(t, tm);
#endif
}

static std::time_t timeFromUTC(std::tm& tm) {
#if defined(_WIN32) || defined(WIN32)
	return _mkgmtime(&tm);
#else
	return timegm(&tm);
#endif
}

std::string timestampToString(const Timestamp ts) {
	const int64_t total_us = ts.time_since_epoch().count();
	int64_t secs = total_us / 1'000'000;
	int64_t us = total_us % 1'000'000;
	if (us < 0) {
		us += 1'000'000;
		secs -= 1;
	}

	const std::time_t t = static_cast<std::time_t>(secs);
	std::tm tm {};
	utcFromTime(t, tm);

	char buffer[64];
	std::snprintf(
		buffer, sizeof(buffer),
		"%04d-%02d-%02dT%02d:%02d:%02d.%06d+00:00",
		tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
		tm.tm_hour, tm.tm_min, tm.tm_sec,
		static_cast<int>(us)
	);
	return buffer;
}

bool timestampFromString(std::string_view str_in, Timestamp& ts_out) {
	const std::string str {str_in};

	int year {0}, month {0}, day {0}, hour {0}, minute {0}, second {0};
	int consumed {0};
	if (std::sscanf(str.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
		return false;
	}

	size_t pos = static_cast<size_t>(consumed);

	int64_t micros {0};
	if (pos < str.size() && str[pos] == '.') {
		pos++;
		int digits {0};
		while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
			if (digits < 6) { // anything finer is dropped
				micros = micros*10 + (str[pos] - '0');
				digits++;
			}
			pos++;
		}
		if (digits == 0) {
			return false;
		}
		for (; digits < 6; digits++) {
			micros *= 10;
		}
	}

	int64_t offset_s {0};
	if (pos < str.size()) {
		if (str[pos] == 'Z') {
			pos++;
		} else if (str[pos] == '+' || str[pos] == '-') {
			int off_h {0}, off_m {0};
			if (str.size() - pos != 6 || std::sscanf(str.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2) {
				return false;
			}
			offset_s = (off_h*3600 + off_m*60) * (str[pos] == '-' ? -1 : 1);
			pos += 6;
		} else {
			return false;
		}
	}

	if (pos != str.size()) {
		return false;
	}

	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
		return false;
	}

	std::tm tm {};
	tm.tm_year = year - 1900;
	tm.tm_mon = month - 1;
	tm.tm_mday = day;
	tm.tm_hour = hour;
	tm.tm_min = minute;
	tm.tm_sec = second;

	const int64_t secs = static_cast<int64_t>(timeFromUTC(tm)) - offset_s;
	ts_out = Timestamp{std::chrono::microseconds{secs*1'000'000 + micros}};
	return true;
}

} // ProvDB
