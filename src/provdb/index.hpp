#pragma once

#include "./types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ProvDB {

struct Database;

// named, ordered key -> object mapping, persisted as its own record ("<name>-index").
// keys come from a dotted attribute path, or are given explicitly.
// thin view, the entries live in the DBComp::IndexData state of _o
struct Index {
	Database& _db;
	Object _o;

	Index(Database& db, Object o);

	Object object(void) const { return _o; }

	std::string name(void);
	std::string objectType(void);
	std::string attribute(void);
	std::string keyType(void);

	// throws InvariantViolation on type or key mismatch
	void add(Object object, std::optional<std::string> key = std::nullopt, Object key_object = entt::null, bool verify = true);
	// like add(), and throws NotFound if the key is not present
	void remove(Object object, std::optional<std::string> key = std::nullopt, Object key_object = entt::null, bool verify = true);

	// key object would be stored under
	std::string generateKey(Object object, Object key_object = entt::null);

	// entt::null if missing
	Object get(const std::string& key);
	Object pop(const std::string& key);
	bool contains(const std::string& key);
	size_t size(void);

	// sorted, bounds are inclusive unless excluded
	std::vector<std::string> keys(
		const std::optional<std::string>& min = std::nullopt,
		const std::optional<std::string>& max = std::nullopt,
		bool excludemin = false,
		bool excludemax = false
	);
	std::vector<Object> values(void);
	std::vector<std::pair<std::string, Object>> items(void);

	private:
		void checkObjectType(Object object);
		std::string verifyAndGetKey(Object object, Object key_object, const std::optional<std::string>& key, bool verify);
		std::string resolveAttribute(Object object, const std::string& attribute);
};

} // ProvDB
