#pragma once

#include "../provdb/config.hpp"
#include "../provdb/storage.hpp"
#include "../provdb/type_registry.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

// provdb_tool commands, they work on the raw records of a storage directory,
// so no domain types need to be registered.
// results go to out, diagnostics to std::cerr. return the process exit code.
// storage errors propagate (NotFound, Error)
namespace ProvDB::Tool {

bool loadConfigFile(std::string_view path, DatabaseConfig& conf);

// "<name> -> <oid> (<type>)" per root entry
int cmdRoots(const backend::FilesystemStorage& storage, std::ostream& out);

// the record, indented. warns about types outside the allowed namespaces
int cmdDump(const backend::FilesystemStorage& storage, const TypeRegistry& types, std::string_view oid, std::ostream& out);

// one key per line, sorted, bounds are inclusive like Index::keys()
int cmdKeys(
	const backend::FilesystemStorage& storage,
	std::string_view name,
	const std::optional<std::string>& min,
	const std::optional<std::string>& max,
	std::ostream& out
);

} // ProvDB::Tool
