#include "./index.hpp"

#include "./database.hpp"
#include "./components.hpp"
#include "./errors.hpp"
#include "./utils.hpp"

#include <variant>

namespace ProvDB {

template<>
bool TypeRegistry::state_get_json<DBComp::IndexData>(ObjectWriter& w, const ObjectHandle h, nlohmann::json& j) {
	if (!h.all_of<DBComp::IndexData>()) {
		return false;
	}

	const auto& data = h.get<DBComp::IndexData>();
	j = nlohmann::json::object();
	j["name"] = data.name;
	j["object_type"] = data.object_type;
	j["attribute"] = data.attribute.empty() ? nlohmann::json(nullptr) : nlohmann::json(data.attribute);
	j["key_type"] = data.key_type.empty() ? nlohmann::json(nullptr) : nlohmann::json(data.key_type);
	// [key, reference] pairs, keys are free form and may start with '@'
	j["entries"] = nlohmann::json::array();
	for (const auto& [key, o] : data.entries) {
		j["entries"].push_back(nlohmann::json::array({key, w.encode(o)}));
	}

	return true;
}

template<>
bool TypeRegistry::state_emplace_or_replace_json<DBComp::IndexData>(ObjectReader& r, ObjectHandle h, const nlohmann::json& j) {
	DBComp::IndexData data;

	r.decode(j.at("name"), data.name);
	r.decode(j.at("object_type"), data.object_type);
	r.checkPersistentTag(data.object_type);

	if (j.contains("attribute") && !j.at("attribute").is_null()) {
		r.decode(j.at("attribute"), data.attribute);
	}
	if (j.contains("key_type") && !j.at("key_type").is_null()) {
		r.decode(j.at("key_type"), data.key_type);
		r.checkPersistentTag(data.key_type);
	}

	const auto& entries = j.at("entries");
	if (!entries.is_array()) {
		throw Error("index entries are not a list");
	}
	for (const auto& entry : entries) {
		if (!entry.is_array() || entry.size() != 2) {
			throw Error("malformed entry in index '" + data.name + "'");
		}
		std::string key;
		Object o {entt::null};
		r.decode(entry.at(0), key);
		r.decode(entry.at(1), o);
		data.entries.insert_or_assign(std::move(key), o);
	}

	h.emplace_or_replace<DBComp::IndexData>(std::move(data));
	return true;
}

Index::Index(Database& db, Object o) : _db(db), _o(o) {
	if (_db.typeOf(o) != Database::index_type) {
		throw InvariantViolation("object is not an index");
	}
}

std::string Index::name(void) {
	return _db.state<DBComp::IndexData>(_o).name;
}

std::string Index::objectType(void) {
	return _db.state<DBComp::IndexData>(_o).object_type;
}

std::string Index::attribute(void) {
	return _db.state<DBComp::IndexData>(_o).attribute;
}

std::string Index::keyType(void) {
	return _db.state<DBComp::IndexData>(_o).key_type;
}

void Index::add(Object object, std::optional<std::string> key, Object key_object, bool verify) {
	checkObjectType(object);
	const std::string k = verifyAndGetKey(object, key_object, key, verify);
	_db.modify<DBComp::IndexData>(_o).entries.insert_or_assign(k, object);
}

void Index::remove(Object object, std::optional<std::string> key, Object key_object, bool verify) {
	checkObjectType(object);
	const std::string k = verifyAndGetKey(object, key_object, key, verify);
	if (!contains(k)) {
		throw NotFound("no key '" + k + "' in index '" + name() + "'");
	}
	_db.modify<DBComp::IndexData>(_o).entries.erase(k);
}

std::string Index::generateKey(Object object, Object key_object) {
	return verifyAndGetKey(object, key_object, std::nullopt, false);
}

Object Index::get(const std::string& key) {
	const auto& entries = _db.state<DBComp::IndexData>(_o).entries;
	const auto it = entries.find(key);
	if (it == entries.cend()) {
		return entt::null;
	}
	return it->second;
}

Object Index::pop(const std::string& key) {
	const Object o = get(key);
	if (o == entt::null) {
		return entt::null;
	}
	_db.modify<DBComp::IndexData>(_o).entries.erase(key);
	return o;
}

bool Index::contains(const std::string& key) {
	return _db.state<DBComp::IndexData>(_o).entries.count(key) != 0;
}

size_t Index::size(void) {
	return _db.state<DBComp::IndexData>(_o).entries.size();
}

std::vector<std::string> Index::keys(const std::optional<std::string>& min, const std::optional<std::string>& max, bool excludemin, bool excludemax) {
	const auto& entries = _db.state<DBComp::IndexData>(_o).entries;

	auto it = entries.cbegin();
	if (min.has_value()) {
		it = excludemin ? entries.upper_bound(*min) : entries.lower_bound(*min);
	}

	std::vector<std::string> result;
	for (; it != entries.cend(); it++) {
		if (max.has_value()) {
			if (excludemax ? it->first >= *max : it->first > *max) {
				break;
			}
		}
		result.push_back(it->first);
	}

	return result;
}

std::vector<Object> Index::values(void) {
	std::vector<Object> result;
	for (const auto& [key, o] : _db.state<DBComp::IndexData>(_o).entries) {
		result.push_back(o);
	}
	return result;
}

std::vector<std::pair<std::string, Object>> Index::items(void) {
	const auto& entries = _db.state<DBComp::IndexData>(_o).entries;
	return std::vector<std::pair<std::string, Object>>(entries.cbegin(), entries.cend());
}

void Index::checkObjectType(Object object) {
	const std::string object_type = objectType();
	if (_db.typeOf(object) != object_type) {
		throw InvariantViolation("cannot add objects of type '" + _db.typeOf(object) + "' to index '" + name() + "' of '" + object_type + "'");
	}
}

std::string Index::verifyAndGetKey(Object object, Object key_object, const std::optional<std::string>& key, bool verify) {
	// copies, resolving attributes may load other objects
	const auto& data = _db.state<DBComp::IndexData>(_o);
	const std::string index_name = data.name;
	const std::string attribute = data.attribute;
	const std::string key_type = data.key_type;

	if (!key_type.empty()) {
		if (key_object == entt::null || _db.typeOf(key_object) != key_type) {
			throw InvariantViolation("invalid key object for index '" + index_name + "', expected '" + key_type + "'");
		}
	} else if (key_object != entt::null) {
		throw InvariantViolation("index '" + index_name + "' does not accept key objects");
	}

	if (!attribute.empty()) {
		const std::string correct_key = resolveAttribute(key_object != entt::null ? key_object : object, attribute);
		if (key.has_value()) {
			if (!verify) {
				return *key;
			}
			if (*key != correct_key) {
				throw InvariantViolation("incorrect key '" + *key + "' for index '" + index_name + "', expected '" + correct_key + "'");
			}
		}
		return correct_key;
	}

	if (!key.has_value()) {
		throw InvariantViolation("no key is provided for index '" + index_name + "'");
	}

	return *key;
}

std::string Index::resolveAttribute(Object object, const std::string& attribute) {
	const auto path = splitDotted(attribute);

	Object current = object;
	for (size_t i = 0; i < path.size(); i++) {
		if (current == entt::null) {
			throw InvariantViolation("attribute path '" + attribute + "' passes through an empty reference");
		}

		// intermediate objects might still be ghosts
		ObjectHandle h = _db.activate(current);

		const std::string& tag = h.get<DBComp::Type>().tag;
		const auto* pt = _db.types().findPersistent(tag);
		if (pt == nullptr) {
			throw InvariantViolation("unregistered type '" + tag + "'");
		}

		const auto attr_it = pt->attributes.find(path[i]);
		if (attr_it == pt->attributes.cend()) {
			throw InvariantViolation("type '" + tag + "' has no attribute '" + path[i] + "'");
		}

		const AttributeValue value = attr_it->second(h);

		if (i + 1 == path.size()) {
			if (!std::holds_alternative<std::string>(value)) {
				throw InvariantViolation("attribute path '" + attribute + "' does not end in a key");
			}
			return std::get<std::string>(value);
		}

		if (!std::holds_alternative<Object>(value)) {
			throw InvariantViolation("attribute '" + path[i] + "' of '" + tag + "' is not an object");
		}
		current = std::get<Object>(value);
	}

	throw InvariantViolation("empty attribute path");
}

} // ProvDB
