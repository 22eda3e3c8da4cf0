#include "./cache.hpp"

#include "./components.hpp"
#include "./errors.hpp"

namespace ProvDB {

Cache::Cache(ObjectRegistry& reg) : _reg(reg) {
}

Object Cache::get(const std::string& oid) const {
	const auto it = _entries.find(oid);
	if (it == _entries.cend()) {
		return entt::null;
	}
	return it->second;
}

Object Cache::pop(const std::string& oid) {
	const auto it = _entries.find(oid);
	if (it == _entries.end()) {
		return entt::null;
	}
	const Object o = it->second;
	_entries.erase(it);
	return o;
}

bool Cache::contains(const std::string& oid) const {
	return _entries.contains(oid);
}

size_t Cache::size(void) const {
	return _entries.size();
}

void Cache::clear(void) {
	_entries.clear();
}

void Cache::set(const std::string& oid, Object o) {
	if (!_reg.valid(o)) {
		throw InvariantViolation("cached object is not a valid entity of this database");
	}

	if (!_reg.all_of<DBComp::OID>(o)) {
		throw InvariantViolation("cached object has no oid");
	}

	if (_reg.get<DBComp::OID>(o).v != oid) {
		throw InvariantViolation("cache key '" + oid + "' does not match object oid '" + _reg.get<DBComp::OID>(o).v + "'");
	}

	const Object existing = get(oid);
	if (existing != entt::null && existing != o) {
		throw InvariantViolation("a different object with oid '" + oid + "' is already cached");
	}

	_entries.insert_or_assign(oid, o);
}

void Cache::newGhost(const std::string& oid, Object o) {
	if (!_reg.valid(o)) {
		throw InvariantViolation("ghost object is not a valid entity of this database");
	}

	if (_reg.all_of<DBComp::OID>(o)) {
		throw InvariantViolation("object already has an oid");
	}

	if (contains(oid)) {
		throw InvariantViolation("duplicate oid '" + oid + "'");
	}

	_reg.emplace<DBComp::OID>(o, oid);
	_reg.emplace_or_replace<DBComp::Ephemeral::Ghost>(o);
	set(oid, o);
}

} // ProvDB
