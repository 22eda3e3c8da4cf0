#include "./object_writer.hpp"

#include "./database.hpp"
#include "./components.hpp"
#include "./errors.hpp"

namespace ProvDB {

namespace {

// restores the current object, also when a serializer throws
struct CurrentScope {
	Object& _current;
	const Object _prev;

	CurrentScope(Object& current, Object o) : _current(current), _prev(current) {
		_current = o;
	}

	~CurrentScope(void) {
		_current = _prev;
	}
};

} // anon

ObjectWriter::ObjectWriter(Database& db) : _db(db) {
}

nlohmann::json ObjectWriter::serialize(ObjectHandle h) {
	auto& reg = _db.registry();
	if (h.registry() != &reg || !reg.valid(h.entity())) {
		throw InvariantViolation("object is not associated with this database");
	}

	if (!h.all_of<DBComp::OID>()) {
		throw InvariantViolation("object does not have an oid");
	}

	// ghosts have no state to write
	_db.activate(h.entity());

	const std::string tag = h.get<DBComp::Type>().tag;
	const auto* pt = _db.types().findPersistent(tag);
	if (pt == nullptr || pt->serl == nullptr) {
		throw InvariantViolation("no serializer for type '" + tag + "'");
	}

	nlohmann::json state;
	{
		CurrentScope scope{_current, h.entity()};
		if (!pt->serl(*this, h, state)) {
			throw InvariantViolation("object of type '" + tag + "' is missing its state");
		}
	}

	nlohmann::json data;
	if (state.is_object()) {
		for (const auto& [key, value] : state.items()) {
			checkKey(key);
		}
		data = std::move(state);
	} else {
		data = nlohmann::json::object();
		data["@value"] = std::move(state);
	}

	data["@type"] = tag;
	data["@oid"] = h.get<DBComp::OID>().v;

	return data;
}

nlohmann::json ObjectWriter::encode(Object o) {
	if (o == entt::null) {
		return nullptr;
	}

	auto& reg = _db.registry();
	if (!reg.valid(o)) {
		throw InvariantViolation("reference to an object that is not a valid entity of this database");
	}

	ObjectHandle h{reg, o};
	cascade(h);

	return {
		{"@type", h.get<DBComp::Type>().tag},
		{"@oid", h.get<DBComp::OID>().v},
		{"@reference", true},
	};
}

void ObjectWriter::checkKey(std::string_view key) {
	if (!key.empty() && key.front() == '@') {
		throw InvariantViolation("key '" + std::string{key} + "' is reserved");
	}
}

nlohmann::json ObjectWriter::wrapValue(entt::id_type type_id, nlohmann::json&& fields) {
	const auto* vt = _db.types().findValue(type_id);
	if (vt == nullptr) {
		throw InvariantViolation("value of an unregistered type");
	}

	if (!vt->primitive && (!fields.is_object() || !fields.contains("id"))) {
		throw InvariantViolation("value of type '" + vt->tag + "' has no id");
	}

	return {
		{"@type", vt->tag},
		{"@value", std::move(fields)},
	};
}

nlohmann::json ObjectWriter::tagTuple(nlohmann::json&& values) {
	return {
		{"@type", "tuple"},
		{"@value", std::move(values)},
	};
}

nlohmann::json ObjectWriter::tagSet(nlohmann::json&& values) {
	return {
		{"@type", "set"},
		{"@value", std::move(values)},
	};
}

void ObjectWriter::cascade(ObjectHandle h) {
	if (!h.all_of<DBComp::OID>()) {
		// assigns the oid and queues it
		_db.registerObject(h.entity());
		return;
	}

	if (h.entity() == _current) {
		return;
	}

	if (h.any_of<DBComp::Ephemeral::New, DBComp::Ephemeral::DirtyTag>()) {
		_db.enqueue(h.entity());
	}
}

} // ProvDB
