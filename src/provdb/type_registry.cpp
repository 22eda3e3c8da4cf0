#include "./type_registry.hpp"

#include "./errors.hpp"

#include <algorithm>

namespace ProvDB {

TypeRegistry::TypeRegistry(const std::vector<std::string>& allowed_namespaces) : _allowed_namespaces(allowed_namespaces) {
	if (std::find(_allowed_namespaces.cbegin(), _allowed_namespaces.cend(), "provdb") == _allowed_namespaces.cend()) {
		_allowed_namespaces.push_back("provdb");
	}
}

bool TypeRegistry::isAllowed(std::string_view tag) const {
	const auto dot_pos = tag.find('.');
	if (dot_pos == std::string_view::npos || dot_pos == 0) {
		return false;
	}

	const auto tag_namespace = tag.substr(0, dot_pos);
	return std::find(_allowed_namespaces.cbegin(), _allowed_namespaces.cend(), tag_namespace) != _allowed_namespaces.cend();
}

void TypeRegistry::checkAllowed(std::string_view tag) const {
	if (!isAllowed(tag)) {
		throw DisallowedType("type '" + std::string{tag} + "' is not allowed");
	}
}

void TypeRegistry::registerPersistent(PersistentType&& pt) {
	if (!isAllowed(pt.tag)) {
		throw InvariantViolation("type tag '" + pt.tag + "' is outside of the allowed namespaces");
	}
	if (_persistent.contains(pt.tag) || _values.contains(pt.tag)) {
		throw InvariantViolation("type tag '" + pt.tag + "' registered twice");
	}
	if (_persistent_by_type.contains(pt.type_id)) {
		throw InvariantViolation("type for '" + pt.tag + "' is already registered as '" + _persistent_by_type.at(pt.type_id) + "'");
	}

	_persistent_by_type.emplace(pt.type_id, pt.tag);
	const std::string tag = pt.tag;
	_persistent.emplace(tag, std::move(pt));
}

void TypeRegistry::registerValue(std::string_view tag_in, entt::id_type type_id, bool primitive) {
	const std::string tag {tag_in};
	if (!isAllowed(tag)) {
		throw InvariantViolation("type tag '" + tag + "' is outside of the allowed namespaces");
	}
	if (_persistent.contains(tag) || _values.contains(tag)) {
		throw InvariantViolation("type tag '" + tag + "' registered twice");
	}
	if (_values_by_type.contains(type_id)) {
		throw InvariantViolation("value type for '" + tag + "' is already registered as '" + _values_by_type.at(type_id) + "'");
	}

	_values_by_type.emplace(type_id, tag);
	_values.emplace(tag, ValueType{tag, type_id, primitive});
}

const TypeRegistry::PersistentType* TypeRegistry::findPersistent(std::string_view tag) const {
	const auto it = _persistent.find(std::string{tag});
	if (it == _persistent.cend()) {
		return nullptr;
	}
	return &it->second;
}

const TypeRegistry::PersistentType* TypeRegistry::findPersistent(entt::id_type type_id) const {
	const auto it = _persistent_by_type.find(type_id);
	if (it == _persistent_by_type.cend()) {
		return nullptr;
	}
	return findPersistent(it->second);
}

const TypeRegistry::ValueType* TypeRegistry::findValue(std::string_view tag) const {
	const auto it = _values.find(std::string{tag});
	if (it == _values.cend()) {
		return nullptr;
	}
	return &it->second;
}

const TypeRegistry::ValueType* TypeRegistry::findValue(entt::id_type type_id) const {
	const auto it = _values_by_type.find(type_id);
	if (it == _values_by_type.cend()) {
		return nullptr;
	}
	return findValue(it->second);
}

TypeRegistry::PersistentType& TypeRegistry::persistentByType(entt::id_type type_id) {
	const auto it = _persistent_by_type.find(type_id);
	if (it == _persistent_by_type.cend()) {
		throw InvariantViolation("type is not registered");
	}
	return _persistent.at(it->second);
}

const TypeRegistry::PersistentType& TypeRegistry::persistentByType(entt::id_type type_id) const {
	const auto it = _persistent_by_type.find(type_id);
	if (it == _persistent_by_type.cend()) {
		throw InvariantViolation("type is not registered");
	}
	return _persistent.at(it->second);
}

} // ProvDB
