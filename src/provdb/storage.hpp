#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace ProvDB::backend {

// one file per record, named after its oid
struct FilesystemStorage {
	// filenames at least this long are hashes, and get sharded as aa/bb/aabb...
	static constexpr size_t oid_filename_length {64};

	FilesystemStorage(std::string_view storage_path = "provdb_store");
	~FilesystemStorage(void);

	std::string _storage_path;

	std::filesystem::path pathFor(std::string_view filename) const;
	bool exists(std::string_view filename) const;

	// compressed records are zstd frames of compact json, the rest is indented json
	// throws Error on io failure
	void store(std::string_view filename, const nlohmann::json& data, bool compress);
	// throws NotFound if there is no such record, Error if it is unreadable
	nlohmann::json load(std::string_view filename) const;

	// same as store()/load(), but outside the sharded layout
	void storeAbsolute(const std::filesystem::path& path, const nlohmann::json& data, bool compress);
	nlohmann::json loadAbsolute(const std::filesystem::path& path) const;
};

} // ProvDB::backend
