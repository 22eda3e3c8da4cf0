#include "./database.hpp"

#include "./utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace ProvDB {

template<>
bool TypeRegistry::state_get_json<DBComp::Root>(ObjectWriter& w, const ObjectHandle h, nlohmann::json& j) {
	if (!h.all_of<DBComp::Root>()) {
		return false;
	}

	j = nlohmann::json::object();
	j["entries"] = w.encode(h.get<DBComp::Root>().entries);
	return true;
}

template<>
bool TypeRegistry::state_emplace_or_replace_json<DBComp::Root>(ObjectReader& r, ObjectHandle h, const nlohmann::json& j) {
	DBComp::Root root;
	r.decode(j.at("entries"), root.entries);
	h.emplace_or_replace<DBComp::Root>(std::move(root));
	return true;
}

Database::LoadScope::LoadScope(Database& db) : _db(db), _prev(db._load_scope) {
	_db._load_scope = this;
}

Database::LoadScope::~LoadScope(void) {
	_db._load_scope = _prev;
}

Database::Database(const DatabaseConfig& conf) :
	_conf(conf),
	_types(conf.allowed_namespaces),
	_storage(conf.storage_path),
	_cache(_reg),
	_writer(*this),
	_reader(*this)
{
	_types.registerType<DBComp::Root>(root_type, false);
	_types.registerType<DBComp::IndexData>(index_type, false);
}

Database::Database(std::string_view storage_path) :
	Database(DatabaseConfig{std::string{storage_path}})
{
}

Database::~Database(void) {
	if (!_pending.empty() && _conf.verbose) {
		std::cout << "DB: dropping " << _pending.size() << " uncommitted objects\n";
	}
}

ObjectHandle Database::handle(Object o) {
	if (!_reg.valid(o)) {
		throw InvariantViolation("object is not associated with this database");
	}
	return {_reg, o};
}

void Database::registerObject(Object o) {
	ObjectHandle h = handle(o);

	if (h.all_of<DBComp::Ephemeral::Ghost>()) {
		activate(o);
	}

	if (!h.all_of<DBComp::OID>()) {
		bool derived {false};
		const std::string oid = generateOID(h, derived);
		// a refused object stays unsaved
		checkClash(oid, o);

		h.emplace<DBComp::OID>(oid);
		h.emplace<DBComp::Ephemeral::New>();
		if (derived) {
			h.emplace_or_replace<DBComp::Ephemeral::DerivedOID>();
		}
	} else {
		checkOID(h);
		if (!h.all_of<DBComp::Ephemeral::New>()) {
			h.emplace_or_replace<DBComp::Ephemeral::DirtyTag>();
		}
	}

	enqueue(o);
}

void Database::enqueue(Object o) {
	ObjectHandle h = handle(o);
	if (!h.all_of<DBComp::OID>()) {
		throw InvariantViolation("only objects with an oid can be queued");
	}

	const std::string& oid = h.get<DBComp::OID>().v;
	checkClash(oid, o);

	if (_pending.count(oid) == 0) {
		_pending.emplace(oid, o);
	}
}

void Database::checkClash(const std::string& oid, Object o) const {
	const Object cached = _cache.get(oid);
	if (cached != entt::null && cached != o) {
		throw InvariantViolation("a different object with oid '" + oid + "' is already live");
	}

	const auto it = _pending.find(oid);
	if (it != _pending.cend() && it->second != o) {
		throw InvariantViolation("a different object with oid '" + oid + "' is already queued");
	}
}

void Database::add(Object o, std::string_view oid) {
	addRootEntry(std::string{oid}, o, std::string{oid});
}

Index Database::addIndex(std::string_view name_in, std::string_view object_type, std::string_view attribute, std::string_view key_type) {
	const std::string name {name_in};

	if (name.empty() || name != toLower(name)) {
		throw InvariantViolation("index name '" + name + "' must be all lowercase");
	}

	if (_types.findPersistent(object_type) == nullptr) {
		throw InvariantViolation("index '" + name + "' over unregistered type '" + std::string{object_type} + "'");
	}

	if (!key_type.empty() && _types.findPersistent(key_type) == nullptr) {
		throw InvariantViolation("index '" + name + "' keyed by unregistered type '" + std::string{key_type} + "'");
	}

	ObjectHandle h = create<DBComp::IndexData>(DBComp::IndexData{
		name,
		std::string{object_type},
		std::string{attribute},
		std::string{key_type},
		{},
	});

	try {
		addRootEntry(name, h.entity(), name + "-index");
	} catch (const InvariantViolation&) {
		h.destroy();
		throw;
	}

	if (_conf.verbose) {
		std::cout << "DB: added index '" << name << "' over '" << object_type << "'\n";
	}

	return {*this, h.entity()};
}

Index Database::index(std::string_view name) {
	const auto& entries = rootEntries();
	const auto it = entries.find(std::string{name});
	if (it == entries.cend()) {
		throw NotFound("no index named '" + std::string{name} + "'");
	}
	return {*this, it->second};
}

ObjectHandle Database::get(std::string_view oid_in) {
	const std::string oid {oid_in};

	if (oid == root_oid) {
		return rootHandle();
	}

	const auto& entries = rootEntries();
	if (const auto it = entries.find(oid); it != entries.cend()) {
		return handle(it->second);
	}

	if (const Object cached = getCached(oid); cached != entt::null) {
		return handle(cached);
	}

	ObjectHandle h = load(oid);

	if (_load_scope == nullptr) {
		// drop interned values whose last holder is gone
		_reader._values.sweep();
	}

	return h;
}

ObjectHandle Database::getByID(std::string_view id) {
	return get(hashID(id));
}

Object Database::getCached(const std::string& oid) const {
	if (const Object o = _cache.get(oid); o != entt::null) {
		return o;
	}

	for (const LoadScope* scope = _load_scope; scope != nullptr; scope = scope->_prev) {
		const auto it = scope->_entries.find(oid);
		if (it != scope->_entries.cend()) {
			return it->second;
		}
	}

	if (const auto it = _pending.find(oid); it != _pending.cend()) {
		return it->second;
	}

	return entt::null;
}

Object Database::newGhost(const std::string& oid, Object o) {
	_cache.newGhost(oid, o);
	return o;
}

ObjectHandle Database::activate(Object o) {
	ObjectHandle h = handle(o);

	if (h.all_of<DBComp::Ephemeral::Ghost>()) {
		const std::string oid = h.get<DBComp::OID>().v;
		const auto data = loadRecord(oid);
		try {
			_reader.setGhostState(h, data);
		} catch (const nlohmann::json::exception& e) {
			throw Error("malformed record '" + oid + "': " + e.what());
		}

		if (_conf.verbose) {
			std::cout << "DB: activated ghost '" << oid << "'\n";
		}
	}

	return h;
}

ObjectState Database::lifecycle(Object o) {
	ObjectHandle h = handle(o);

	if (!h.all_of<DBComp::OID>()) {
		return ObjectState::UNSAVED;
	}
	if (h.all_of<DBComp::Ephemeral::Ghost>()) {
		return ObjectState::GHOST;
	}
	if (h.all_of<DBComp::Ephemeral::New>()) {
		return ObjectState::PENDING;
	}
	if (h.all_of<DBComp::Ephemeral::DirtyTag>()) {
		return ObjectState::DIRTY;
	}
	return ObjectState::CLEAN;
}

std::string Database::oidOf(Object o) {
	ObjectHandle h = handle(o);
	if (!h.all_of<DBComp::OID>()) {
		return {};
	}
	return h.get<DBComp::OID>().v;
}

const std::string& Database::typeOf(Object o) {
	return handle(o).get<DBComp::Type>().tag;
}

size_t Database::commit(void) {
	size_t written {0};

	// storing an object can queue the objects it references
	while (!_pending.empty()) {
		const auto it = _pending.begin();
		const std::string oid = it->first;
		const Object o = it->second;
		_pending.erase(it);

		ObjectHandle h = handle(o);
		if (h.any_of<DBComp::Ephemeral::New, DBComp::Ephemeral::DirtyTag>()) {
			storeObject(h);
			written++;
		} else if (!_cache.contains(oid)) {
			_cache.set(oid, o);
		}
	}

	const size_t swept = _reader._values.sweep();

	if (_conf.verbose) {
		std::cout << "DB: commit wrote " << written << " records, dropped " << swept << " expired values\n";
	}

	return written;
}

void Database::clear(void) {
	_pending.clear();
	_cache.clear();
	_reader._values.clear();
	_reg.clear();
	_root = entt::null;

	createEmptyRoot();
}

const std::map<std::string, Object>& Database::rootEntries(void) {
	return rootHandle().get<DBComp::Root>().entries;
}

void Database::removeRootObject(std::string_view name_in) {
	const std::string name {name_in};

	ObjectHandle root = rootHandle();
	auto& entries = root.get<DBComp::Root>().entries;
	const auto it = entries.find(name);
	if (it == entries.end()) {
		throw NotFound("'" + name + "' is not in the root mapping");
	}

	const Object o = it->second;
	entries.erase(it);

	removeFromCache(o);
	registerObject(root.entity());
}

void Database::removeFromCache(Object o) {
	const std::string oid = oidOf(o);
	if (oid.empty()) {
		return;
	}

	if (_cache.get(oid) == o) {
		_cache.pop(oid);
	}

	if (const auto it = _pending.find(oid); it != _pending.end() && it->second == o) {
		_pending.erase(it);
	}

	for (LoadScope* scope = _load_scope; scope != nullptr; scope = scope->_prev) {
		if (const auto it = scope->_entries.find(oid); it != scope->_entries.end() && it->second == o) {
			scope->_entries.erase(it);
		}
	}
}

void Database::persistToPath(Object o, const std::filesystem::path& path) {
	ObjectHandle h = handle(o);
	const auto data = _writer.serialize(h);
	_storage.storeAbsolute(path, data, shouldCompress(h));
}

ObjectHandle Database::getFromPath(const std::filesystem::path& path, std::string_view override_type) {
	auto data = _storage.loadAbsolute(path);

	if (!override_type.empty()) {
		if (!data.is_object() || !data.contains("@type")) {
			throw Error("record '" + path.generic_u8string() + "' has no type to override");
		}
		data["@type"] = std::string{override_type};
	}

	LoadScope scope{*this};
	return deserializeRecord(data, path.generic_u8string());
}

void Database::preCache(const std::string& oid, Object o) {
	if (_load_scope == nullptr) {
		throw InvariantViolation("objects can only be deserialized inside a load");
	}
	_load_scope->_entries.insert_or_assign(oid, o);
}

void Database::dropPreCached(const std::string& oid) {
	if (_load_scope != nullptr) {
		_load_scope->_entries.erase(oid);
	}
}

ObjectHandle Database::rootHandle(void) {
	if (_root == entt::null) {
		initializeRoot();
	}
	return activate(_root);
}

void Database::initializeRoot(void) {
	if (!_storage.exists(filenameFor(root_oid))) {
		createEmptyRoot();
		return;
	}

	ObjectHandle h = load(root_oid);
	if (h.get<DBComp::Type>().tag != root_type) {
		throw InvariantViolation("record '" + std::string{root_oid} + "' is not a root mapping");
	}
	_root = h.entity();

	if (_conf.verbose) {
		std::cout << "DB: loaded root with " << h.get<DBComp::Root>().entries.size() << " entries\n";
	}
}

void Database::createEmptyRoot(void) {
	ObjectHandle h = create<DBComp::Root>();
	h.emplace<DBComp::OID>(root_oid);

	if (_storage.exists(filenameFor(root_oid))) {
		// replaces the stored one on the next commit
		h.emplace<DBComp::Ephemeral::DirtyTag>();
	} else {
		h.emplace<DBComp::Ephemeral::New>();
	}

	_root = h.entity();
	_cache.set(root_oid, _root);
	enqueue(_root);
}

void Database::addRootEntry(const std::string& name, Object o, const std::string& oid) {
	ObjectHandle h = handle(o);

	if (oid.empty()) {
		throw InvariantViolation("root objects need an oid");
	}

	if (name.front() == '@' || oid.front() == '@') {
		throw InvariantViolation("'" + name + "' is reserved, root names can not start with '@'");
	}

	if (h.all_of<DBComp::OID>() && h.get<DBComp::OID>().v != oid) {
		throw InvariantViolation("object already has oid '" + h.get<DBComp::OID>().v + "'");
	}

	ObjectHandle root = rootHandle();
	auto& entries = root.get<DBComp::Root>().entries;
	if (entries.count(name) != 0) {
		throw InvariantViolation("index or object '" + name + "' already exists");
	}

	if (!h.all_of<DBComp::OID>()) {
		checkClash(oid, o);
		h.emplace<DBComp::OID>(oid);
		h.emplace<DBComp::Ephemeral::New>();
	}

	entries.emplace(name, o);

	registerObject(o);
	registerObject(root.entity());
}

std::string Database::filenameFor(const std::string& oid) const {
	return toLower(oid);
}

nlohmann::json Database::loadRecord(const std::string& oid) {
	const std::string filename = filenameFor(oid);
	if (!_storage.exists(filename)) {
		throw NotFound("no object with oid '" + oid + "'");
	}
	return _storage.load(filename);
}

ObjectHandle Database::load(const std::string& oid) {
	const auto data = loadRecord(oid);
	if (!data.is_object() || data.value("@oid", "") != oid) {
		throw Error("record '" + filenameFor(oid) + "' does not belong to oid '" + oid + "'");
	}

	LoadScope scope{*this};
	ObjectHandle h = deserializeRecord(data, oid);
	_cache.set(oid, h.entity());

	if (_conf.verbose) {
		std::cout << "DB: loaded '" << oid << "' of type '" << h.get<DBComp::Type>().tag << "'\n";
	}

	return h;
}

ObjectHandle Database::deserializeRecord(const nlohmann::json& data, const std::string& what) {
	try {
		return _reader.deserialize(data);
	} catch (const nlohmann::json::exception& e) {
		std::cerr << "DB error: malformed record '" << what << "': " << e.what() << "\n";
		throw Error("malformed record '" + what + "': " + e.what());
	}
}

std::string Database::generateOID(ObjectHandle h, bool& derived) {
	const auto* pt = _types.findPersistent(h.get<DBComp::Type>().tag);
	if (pt != nullptr && pt->domain_id) {
		const std::string domain_id = pt->domain_id(h);
		if (!domain_id.empty()) {
			derived = true;
			return hashID(domain_id);
		}
	}

	derived = false;
	return _oid_gen();
}

void Database::checkOID(ObjectHandle h) {
	if (!h.all_of<DBComp::Ephemeral::DerivedOID>()) {
		return;
	}

	const auto* pt = _types.findPersistent(h.get<DBComp::Type>().tag);
	if (pt == nullptr || !pt->domain_id) {
		return;
	}

	const std::string& oid = h.get<DBComp::OID>().v;
	const std::string expected = hashID(pt->domain_id(h));
	if (oid != expected) {
		throw InvariantViolation("object has oid '" + oid + "', but its id hashes to '" + expected + "'");
	}
}

bool Database::shouldCompress(ObjectHandle h) const {
	if (!_conf.compress) {
		return false;
	}

	const auto* pt = _types.findPersistent(h.get<DBComp::Type>().tag);
	return pt != nullptr && pt->compress;
}

void Database::storeObject(ObjectHandle h) {
	checkOID(h);

	const auto data = _writer.serialize(h);
	const std::string oid = h.get<DBComp::OID>().v;

	_storage.store(filenameFor(oid), data, shouldCompress(h));

	_cache.set(oid, h.entity());
	h.remove<DBComp::Ephemeral::New, DBComp::Ephemeral::DirtyTag>();
}

} // ProvDB
