#include "./commands.hpp"

#include "../provdb/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <vector>

namespace ProvDB::Tool {

bool loadConfigFile(std::string_view path, DatabaseConfig& conf) {
	std::ifstream file{std::string{path}};
	if (!file.is_open()) {
		std::cerr << "TL error: failed to open config file '" << path << "'\n";
		return false;
	}

	auto config_json = nlohmann::json::parse(file, nullptr, false);
	if (config_json.is_discarded()) {
		std::cerr << "TL error: config file '" << path << "' is not valid json\n";
		return false;
	}

	return loadJsonIntoConfig(config_json, conf);
}

static void warnIfDisallowed(const TypeRegistry& types, const nlohmann::json& record) {
	if (!record.is_object() || !record.contains("@type") || !record.at("@type").is_string()) {
		return;
	}
	const auto& tag = record.at("@type").get_ref<const std::string&>();
	if (!types.isAllowed(tag)) {
		std::cerr << "TL warning: type '" << tag << "' is outside the allowed namespaces\n";
	}
}

int cmdRoots(const backend::FilesystemStorage& storage, std::ostream& out) {
	const auto root = storage.load("root");
	if (!root.contains("entries") || !root.at("entries").is_object()) {
		std::cerr << "TL error: root record has no entries\n";
		return 1;
	}

	for (const auto& [name, ref] : root.at("entries").items()) {
		out << name << " -> " << ref.value("@oid", "?") << " (" << ref.value("@type", "?") << ")\n";
	}
	return 0;
}

int cmdDump(const backend::FilesystemStorage& storage, const TypeRegistry& types, std::string_view oid, std::ostream& out) {
	const auto record = storage.load(toLower(oid));
	warnIfDisallowed(types, record);
	out << record.dump(2) << "\n";
	return 0;
}

int cmdKeys(
	const backend::FilesystemStorage& storage,
	std::string_view name,
	const std::optional<std::string>& min,
	const std::optional<std::string>& max,
	std::ostream& out
) {
	const auto index = storage.load(std::string{name} + "-index");
	if (index.value("@type", "") != "provdb.Index" || !index.contains("entries") || !index.at("entries").is_array()) {
		std::cerr << "TL error: '" << name << "' is not an index\n";
		return 1;
	}

	std::vector<std::string> keys;
	for (const auto& entry : index.at("entries")) {
		if (!entry.is_array() || entry.empty() || !entry.at(0).is_string()) {
			std::cerr << "TL error: malformed entry in index '" << name << "'\n";
			return 1;
		}

		const auto& key = entry.at(0).get_ref<const std::string&>();
		if (min.has_value() && key < *min) {
			continue;
		}
		if (max.has_value() && key > *max) {
			continue;
		}
		keys.push_back(key);
	}

	std::sort(keys.begin(), keys.end());
	for (const auto& key : keys) {
		out << key << "\n";
	}
	return 0;
}

} // ProvDB::Tool
