#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace ProvDB {

struct DatabaseConfig {
	std::string storage_path {"provdb_store"};
	// zstd for records of types that allow it
	bool compress {true};
	// namespaces of type tags that may be read back, "provdb" is always added
	std::vector<std::string> allowed_namespaces {"provdb", "renku"};
	bool verbose {false};
};

// reads the "provdb" object of config_json, unknown keys are ignored
// returns false on wrong value types, conf may be partially updated then
bool loadJsonIntoConfig(const nlohmann::json& config_json, DatabaseConfig& conf);

} // ProvDB
