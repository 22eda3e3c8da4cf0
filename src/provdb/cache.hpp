#pragma once

#include "./types.hpp"

#include <entt/container/dense_map.hpp>

#include <string>

namespace ProvDB {

// oid -> live object, at most one live object per oid
struct Cache {
	ObjectRegistry& _reg;
	entt::dense_map<std::string, Object> _entries;

	Cache(ObjectRegistry& reg);

	// entt::null if not cached
	Object get(const std::string& oid) const;
	// removes and returns, entt::null if not cached
	Object pop(const std::string& oid);
	bool contains(const std::string& oid) const;
	size_t size(void) const;
	void clear(void);

	// throws InvariantViolation if o is not a valid entity of _reg, carries a different oid,
	// or another object is already cached under oid.
	// validity is all that can be checked, an Object of another registry that happens
	// to have a valid id here is not detected.
	void set(const std::string& oid, Object o);

	// assigns oid to a fresh object and caches it as a ghost
	// throws InvariantViolation if o already has an oid or oid is taken
	void newGhost(const std::string& oid, Object o);
};

} // ProvDB
