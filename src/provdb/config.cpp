#include "./config.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace ProvDB {

bool loadJsonIntoConfig(const nlohmann::json& config_json, DatabaseConfig& conf) {
	if (!config_json.is_object()) {
		std::cerr << "DB error: config is not a json object\n";
		return false;
	}

	if (!config_json.contains("provdb")) {
		// nothing for us, keep defaults
		return true;
	}

	const auto& db_j = config_json.at("provdb");
	if (!db_j.is_object()) {
		std::cerr << "JSON error: 'provdb' is not an object\n";
		return false;
	}

	for (const auto& [key, value] : db_j.items()) {
		if (key == "storage_path") {
			if (!value.is_string()) {
				std::cerr << "JSON error: wrong value type in provdb::" << key << " = " << value << "\n";
				return false;
			}
			conf.storage_path = value.get_ref<const std::string&>();
		} else if (key == "compress") {
			if (!value.is_boolean()) {
				std::cerr << "JSON error: wrong value type in provdb::" << key << " = " << value << "\n";
				return false;
			}
			conf.compress = value.get<bool>();
		} else if (key == "verbose") {
			if (!value.is_boolean()) {
				std::cerr << "JSON error: wrong value type in provdb::" << key << " = " << value << "\n";
				return false;
			}
			conf.verbose = value.get<bool>();
		} else if (key == "allowed_namespaces") {
			if (!value.is_array()) {
				std::cerr << "JSON error: wrong value type in provdb::" << key << " = " << value << "\n";
				return false;
			}
			std::vector<std::string> namespaces;
			for (const auto& ns : value) {
				if (!ns.is_string()) {
					std::cerr << "JSON error: wrong value type in provdb::" << key << " entry = " << ns << "\n";
					return false;
				}
				namespaces.push_back(ns.get<std::string>());
			}
			conf.allowed_namespaces = std::move(namespaces);
		} else {
			std::cerr << "DB warning: unknown config key provdb::" << key << "\n";
		}
	}

	return true;
}

} // ProvDB
