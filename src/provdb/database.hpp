#pragma once

#include "./types.hpp"
#include "./components.hpp"
#include "./errors.hpp"
#include "./config.hpp"
#include "./type_registry.hpp"
#include "./storage.hpp"
#include "./cache.hpp"
#include "./oid.hpp"
#include "./object_writer.hpp"
#include "./object_reader.hpp"
#include "./index.hpp"

#include <entt/container/dense_map.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace ProvDB {

// owns every live object of one storage directory.
// reads go root mapping -> cache -> load scopes -> pending -> storage,
// writes are queued and only hit storage on commit().
// single threaded, callers serialize access.
struct Database {
	static constexpr const char* root_oid {"root"};
	static constexpr const char* root_type {"provdb.Root"};
	static constexpr const char* index_type {"provdb.Index"};

	// pre-cache of one load, lives on the stack of the loading call.
	// objects under construction are reachable by oid while their own references resolve.
	struct LoadScope {
		Database& _db;
		LoadScope* _prev {nullptr};
		entt::dense_map<std::string, Object> _entries;

		LoadScope(Database& db);
		~LoadScope(void);

		LoadScope(const LoadScope&) = delete;
		LoadScope& operator=(const LoadScope&) = delete;
	};

	DatabaseConfig _conf;

	ObjectRegistry _reg;
	TypeRegistry _types;
	backend::FilesystemStorage _storage;
	Cache _cache;
	OIDGenerator_128_128 _oid_gen;

	// oid -> object, to be written by the next commit()
	entt::dense_map<std::string, Object> _pending;
	LoadScope* _load_scope {nullptr};

	ObjectWriter _writer;
	ObjectReader _reader;

	// loaded on first use, so callers can register their types first
	Object _root {entt::null};

	Database(const DatabaseConfig& conf);
	Database(std::string_view storage_path);
	~Database(void);

	Database(const Database&) = delete;
	Database& operator=(const Database&) = delete;

	ObjectRegistry& registry(void) { return _reg; }
	TypeRegistry& types(void) { return _types; }
	backend::FilesystemStorage& storage(void) { return _storage; }
	Cache& cache(void) { return _cache; }
	ObjectReader& reader(void) { return _reader; }
	ObjectWriter& writer(void) { return _writer; }
	const DatabaseConfig& config(void) const { return _conf; }

	// throws InvariantViolation if o is not a valid entity of this database.
	// Object ids are per registry, a foreign id that is also valid here can not be told apart.
	ObjectHandle handle(Object o);

	// new unsaved object, T has to be registered
	template<typename T, typename... Args>
	ObjectHandle create(Args&&... args) {
		ObjectHandle h{_reg, _reg.create()};
		h.emplace<DBComp::Type>(_types.tagOf<T>());
		h.emplace<T>(std::forward<Args>(args)...);
		return h;
	}

	// assigns an oid if there is none, marks o changed and queues it
	void registerObject(Object o);
	// queues o as is, o needs an oid
	void enqueue(Object o);
	// throws InvariantViolation if another object is live or queued under oid
	void checkClash(const std::string& oid, Object o) const;

	// singleton under the root mapping at an explicit oid
	void add(Object o, std::string_view oid);

	Index addIndex(
		std::string_view name,
		std::string_view object_type,
		std::string_view attribute = {},
		std::string_view key_type = {}
	);

	template<typename T>
	Index addIndex(std::string_view name, std::string_view attribute = {}) {
		return addIndex(name, _types.tagOf<T>(), attribute);
	}

	template<typename T, typename K>
	Index addIndex(std::string_view name, std::string_view attribute) {
		return addIndex(name, _types.tagOf<T>(), attribute, _types.tagOf<K>());
	}

	// throws NotFound
	Index index(std::string_view name);

	// "root" is the root mapping itself, even before it was ever stored.
	// throws NotFound, DisallowedType, Error
	ObjectHandle get(std::string_view oid);
	ObjectHandle getByID(std::string_view id);

	// entt::null if the oid has no live object
	Object getCached(const std::string& oid) const;

	// ghost placeholder for oid, see Cache::newGhost()
	Object newGhost(const std::string& oid, Object o);

	// loads the state of a ghost, no-op otherwise
	ObjectHandle activate(Object o);

	template<typename T>
	const T& state(Object o) {
		ObjectHandle h = activate(o);
		if (!h.all_of<T>()) {
			throw InvariantViolation("object of type '" + h.get<DBComp::Type>().tag + "' does not hold the requested state");
		}
		return h.get<T>();
	}

	// like state(), and registers the object as changed
	template<typename T>
	T& modify(Object o) {
		ObjectHandle h = activate(o);
		if (!h.all_of<T>()) {
			throw InvariantViolation("object of type '" + h.get<DBComp::Type>().tag + "' does not hold the requested state");
		}
		registerObject(o);
		return h.get<T>();
	}

	ObjectState lifecycle(Object o);
	// empty if no oid is assigned yet
	std::string oidOf(Object o);
	const std::string& typeOf(Object o);

	// stores every new or changed object reachable from the pending set
	// returns the number of records written
	size_t commit(void);

	size_t pendingCount(void) const { return _pending.size(); }

	// forget every live object, the root mapping starts out empty.
	// storage is not touched until the next commit.
	void clear(void);

	const std::map<std::string, Object>& rootEntries(void);
	void removeRootObject(std::string_view name);
	void removeFromCache(Object o);

	void persistToPath(Object o, const std::filesystem::path& path);
	// the loaded object is not cached, override_type retags the record
	ObjectHandle getFromPath(const std::filesystem::path& path, std::string_view override_type = {});

	// used by ObjectReader
	void preCache(const std::string& oid, Object o);
	void dropPreCached(const std::string& oid);

	private:
		ObjectHandle rootHandle(void);
		void initializeRoot(void);
		void createEmptyRoot(void);
		// name -> o in the root mapping, o gets oid unless it has one
		void addRootEntry(const std::string& name, Object o, const std::string& oid);

		std::string filenameFor(const std::string& oid) const;
		nlohmann::json loadRecord(const std::string& oid);
		// storage -> cache, skips the root mapping and cache lookups
		ObjectHandle load(const std::string& oid);
		ObjectHandle deserializeRecord(const nlohmann::json& data, const std::string& what);

		std::string generateOID(ObjectHandle h, bool& derived);
		void checkOID(ObjectHandle h);
		bool shouldCompress(ObjectHandle h) const;
		void storeObject(ObjectHandle h);
};

} // ProvDB
