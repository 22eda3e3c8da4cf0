#include "./storage.hpp"

#include "./errors.hpp"

#include <nlohmann/json.hpp>
#include <zstd.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <vector>
#include <iostream>

namespace ProvDB::backend {

static bool isZSTDFrame(const std::vector<uint8_t>& data) {
	if (data.size() < 4) {
		return false;
	}
	const uint32_t magic =
		uint32_t(data[0]) |
		uint32_t(data[1]) << 8 |
		uint32_t(data[2]) << 16 |
		uint32_t(data[3]) << 24
	;
	return magic == ZSTD_MAGICNUMBER;
}

static bool compressZSTD(const std::string& in, std::vector<uint8_t>& out) {
	out.resize(ZSTD_compressBound(in.size()));
	const size_t ret = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), 0); // 0 is default
	if (ZSTD_isError(ret)) {
		std::cerr << "FS error: compression failed: " << ZSTD_getErrorName(ret) << "\n";
		return false;
	}
	out.resize(ret);
	return true;
}

static bool decompressZSTD(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
	std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx {ZSTD_createDCtx(), &ZSTD_freeDCtx};
	if (!dctx) {
		std::cerr << "FS error: failed to create zstd decompression context\n";
		return false;
	}

	std::vector<uint8_t> out_buffer(ZSTD_DStreamOutSize());
	ZSTD_inBuffer input {in.data(), in.size(), 0};

	size_t last_ret {0};
	bool output_full {false};
	// keep going while there is input, or the last call might have left data in the context
	while (input.pos < input.size || output_full) {
		ZSTD_outBuffer output {out_buffer.data(), out_buffer.size(), 0};
		last_ret = ZSTD_decompressStream(dctx.get(), &output, &input);
		if (ZSTD_isError(last_ret)) {
			std::cerr << "FS error: decompression error: " << ZSTD_getErrorName(last_ret) << "\n";
			return false;
		}
		out.insert(out.end(), out_buffer.data(), out_buffer.data() + output.pos);
		output_full = output.pos == output.size;
	}

	if (last_ret != 0) {
		std::cerr << "FS error: truncated zstd frame\n";
		return false;
	}

	return true;
}

FilesystemStorage::FilesystemStorage(std::string_view storage_path) : _storage_path(storage_path) {
}

FilesystemStorage::~FilesystemStorage(void) {
}

std::filesystem::path FilesystemStorage::pathFor(std::string_view filename) const {
	if (filename.size() < oid_filename_length) {
		return std::filesystem::path{_storage_path} / filename;
	}

	// 2 levels of 1byte subfolders
	return std::filesystem::path{_storage_path}
		/ std::string{filename.substr(0, 2)}
		/ std::string{filename.substr(2, 2)}
		/ filename
	;
}

bool FilesystemStorage::exists(std::string_view filename) const {
	return std::filesystem::is_regular_file(pathFor(filename));
}

void FilesystemStorage::store(std::string_view filename, const nlohmann::json& data, bool compress) {
	storeAbsolute(pathFor(filename), data, compress);
}

nlohmann::json FilesystemStorage::load(std::string_view filename) const {
	return loadAbsolute(pathFor(filename));
}

void FilesystemStorage::storeAbsolute(const std::filesystem::path& path, const nlohmann::json& data, bool compress) {
	std::error_code err;
	if (path.has_parent_path()) {
		std::filesystem::create_directories(path.parent_path(), err);
		if (!std::filesystem::is_directory(path.parent_path())) {
			std::cerr << "FS error: failed to create directory '" << path.parent_path().generic_u8string() << "'\n";
			throw Error("failed to create directory '" + path.parent_path().generic_u8string() + "'");
		}
	}

	std::vector<uint8_t> file_data;
	if (compress) {
		if (!compressZSTD(data.dump(), file_data)) {
			throw Error("failed to compress record '" + path.generic_u8string() + "'");
		}
	} else {
		// keys are sorted by nlohmann::json already
		const std::string text = data.dump(2);
		file_data.assign(text.cbegin(), text.cend());
	}

	// write next to the target, and only replace it once complete
	std::filesystem::path tmp_path = path;
	tmp_path.replace_filename("." + path.filename().generic_u8string() + ".tmp");

	{
		std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
		if (!file.is_open()) {
			std::cerr << "FS error: failed to open '" << tmp_path.generic_u8string() << "' for writing\n";
			throw Error("failed to open '" + tmp_path.generic_u8string() + "' for writing");
		}
		file.write(reinterpret_cast<const char*>(file_data.data()), file_data.size());
		file.flush();
		if (!file.good()) {
			file.close();
			std::filesystem::remove(tmp_path, err);
			std::cerr << "FS error: failed writing '" << tmp_path.generic_u8string() << "'\n";
			throw Error("failed writing '" + tmp_path.generic_u8string() + "'");
		}
	}

	std::filesystem::rename(tmp_path, path, err);
	if (err) {
		std::filesystem::remove(tmp_path, err);
		std::cerr << "FS error: failed to move record into place '" << path.generic_u8string() << "'\n";
		throw Error("failed to move record into place '" + path.generic_u8string() + "'");
	}
}

nlohmann::json FilesystemStorage::loadAbsolute(const std::filesystem::path& path) const {
	if (!std::filesystem::is_regular_file(path)) {
		throw NotFound("no record at '" + path.generic_u8string() + "'");
	}

	std::vector<uint8_t> file_data;
	{
		std::ifstream file(path, std::ios::binary);
		if (!file.is_open()) {
			std::cerr << "FS error: failed to open '" << path.generic_u8string() << "'\n";
			throw Error("failed to open '" + path.generic_u8string() + "'");
		}
		file_data.assign(std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{});
	}

	if (isZSTDFrame(file_data)) {
		std::vector<uint8_t> decompressed;
		if (!decompressZSTD(file_data, decompressed)) {
			throw Error("failed to decompress '" + path.generic_u8string() + "'");
		}
		file_data = std::move(decompressed);
	}

	auto j = nlohmann::json::parse(file_data, nullptr, false);
	if (j.is_discarded()) {
		std::cerr << "FS error: failed to parse '" << path.generic_u8string() << "'\n";
		throw Error("record '" + path.generic_u8string() + "' is not valid json");
	}

	return j;
}

} // ProvDB::backend
