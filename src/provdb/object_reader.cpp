#include "./object_reader.hpp"

#include "./database.hpp"
#include "./components.hpp"
#include "./errors.hpp"
#include "./oid.hpp"

namespace ProvDB {

ObjectReader::ObjectReader(Database& db) : _db(db) {
}

ObjectHandle ObjectReader::deserialize(const nlohmann::json& data) {
	if (!data.is_object() || !data.contains("@type") || !data.contains("@oid")) {
		throw Error("record is missing its type or oid");
	}

	const std::string tag = data.at("@type").get<std::string>();
	const std::string oid = data.at("@oid").get<std::string>();

	checkPersistentTag(tag);

	auto& reg = _db.registry();
	ObjectHandle h{reg, reg.create()};
	h.emplace<DBComp::Type>(tag);
	h.emplace<DBComp::OID>(oid);

	// references back to this record, from within its own state, resolve to h
	_db.preCache(oid, h.entity());

	try {
		fillState(h, tag, data);
	} catch (...) {
		_db.dropPreCached(oid);
		h.destroy();
		throw;
	}

	return h;
}

void ObjectReader::setGhostState(ObjectHandle h, const nlohmann::json& data) {
	if (!h.all_of<DBComp::OID, DBComp::Type>()) {
		throw InvariantViolation("ghost without oid");
	}

	if (!data.is_object() || data.value("@oid", "") != h.get<DBComp::OID>().v) {
		throw InvariantViolation("record does not belong to object '" + h.get<DBComp::OID>().v + "'");
	}

	const std::string tag = data.at("@type").get<std::string>();
	checkPersistentTag(tag);
	if (tag != h.get<DBComp::Type>().tag) {
		throw InvariantViolation("record of '" + h.get<DBComp::OID>().v + "' has type '" + tag + "', expected '" + h.get<DBComp::Type>().tag + "'");
	}

	fillState(h, tag, data);
	h.remove<DBComp::Ephemeral::Ghost>();
}

void ObjectReader::checkPersistentTag(const std::string& tag) const {
	_db.types().checkAllowed(tag);
	if (_db.types().findPersistent(tag) == nullptr) {
		throw DisallowedType("unknown type '" + tag + "'");
	}
}

void ObjectReader::decode(const nlohmann::json& j, bool& out) {
	if (!j.is_boolean()) {
		throw Error("expected a boolean, got " + std::string{j.type_name()});
	}
	out = j.get<bool>();
}

void ObjectReader::decode(const nlohmann::json& j, std::string& out) {
	if (!j.is_string()) {
		throw Error("expected a string, got " + std::string{j.type_name()});
	}
	out = j.get<std::string>();
}

void ObjectReader::decode(const nlohmann::json& j, Timestamp& out) {
	out = j.get<Timestamp>();
}

void ObjectReader::decode(const nlohmann::json& j, Object& out) {
	if (j.is_null()) {
		out = entt::null;
		return;
	}

	if (!j.is_object() || !j.value("@reference", false)) {
		throw Error("expected an object reference");
	}

	const std::string tag = j.at("@type").get<std::string>();
	const std::string oid = j.at("@oid").get<std::string>();

	checkPersistentTag(tag);

	if (const Object cached = _db.getCached(oid); cached != entt::null) {
		out = cached;
		return;
	}

	auto& reg = _db.registry();
	ObjectHandle ghost{reg, reg.create()};
	ghost.emplace<DBComp::Type>(tag);
	_db.newGhost(oid, ghost.entity());
	out = ghost.entity();
}

const nlohmann::json& ObjectReader::tupleValues(const nlohmann::json& j, size_t expected_size) {
	if (!j.is_object() || j.value("@type", "") != "tuple") {
		throw Error("expected a tuple record");
	}

	const auto& values = j.at("@value");
	if (!values.is_array() || values.size() != expected_size) {
		throw Error("tuple record has " + std::to_string(values.size()) + " elements, expected " + std::to_string(expected_size));
	}

	return values;
}

const nlohmann::json& ObjectReader::setValues(const nlohmann::json& j) {
	const std::string tag = j.is_object() ? j.value("@type", "") : "";
	if (tag != "set" && tag != "frozenset") {
		throw Error("expected a set record");
	}

	const auto& values = j.at("@value");
	if (!values.is_array()) {
		throw Error("set record holds " + std::string{values.type_name()});
	}

	return values;
}

const nlohmann::json& ObjectReader::valueFields(entt::id_type type_id, const nlohmann::json& j) const {
	const auto* vt = _db.types().findValue(type_id);
	if (vt == nullptr) {
		throw InvariantViolation("value of an unregistered type");
	}

	if (!j.is_object() || !j.contains("@type") || !j.contains("@value")) {
		throw Error("expected a '" + vt->tag + "' value record");
	}

	const std::string tag = j.at("@type").get<std::string>();
	_db.types().checkAllowed(tag);
	if (tag != vt->tag) {
		throw DisallowedType("value of type '" + tag + "' where '" + vt->tag + "' was expected");
	}

	return j.at("@value");
}

void ObjectReader::fillState(ObjectHandle h, const std::string& tag, const nlohmann::json& data) {
	const auto* pt = _db.types().findPersistent(tag);
	if (pt == nullptr || pt->deserl == nullptr) {
		throw DisallowedType("no deserializer for type '" + tag + "'");
	}

	nlohmann::json state;
	if (data.contains("@value")) {
		state = data.at("@value");
	} else {
		state = nlohmann::json::object();
		for (const auto& [key, value] : data.items()) {
			if (!key.empty() && key.front() == '@') {
				continue;
			}
			state[key] = value;
		}
	}

	if (!pt->deserl(*this, h, state)) {
		throw Error("failed to read state of '" + tag + "' object '" + h.get<DBComp::OID>().v + "'");
	}

	// remember if the oid follows the domain id, so a later change of the id is caught
	if (pt->domain_id) {
		const std::string domain_id = pt->domain_id(h);
		if (!domain_id.empty() && hashID(domain_id) == h.get<DBComp::OID>().v) {
			h.emplace_or_replace<DBComp::Ephemeral::DerivedOID>();
		}
	}
}

} // ProvDB
