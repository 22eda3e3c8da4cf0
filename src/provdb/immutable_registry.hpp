#pragma once

#include <entt/core/type_info.hpp>
#include <entt/container/dense_map.hpp>

#include <memory>
#include <string>

namespace ProvDB {

// interns immutable values by their id, so equal ids share one instance.
// holds only weak references, a value dies with its last user.
// not thread safe, every ObjectReader owns its own.
struct ImmutableRegistry {
	struct Entry {
		entt::id_type type_id {0};
		std::weak_ptr<const void> ptr;
	};

	entt::dense_map<std::string, Entry> _entries;

	// nullptr if there is no live instance of V with that id
	template<typename V>
	std::shared_ptr<const V> find(const std::string& id) {
		const auto it = _entries.find(id);
		if (it == _entries.end()) {
			return nullptr;
		}

		if (it->second.type_id != entt::type_id<V>().hash()) {
			return nullptr;
		}

		auto sp = it->second.ptr.lock();
		if (!sp) {
			_entries.erase(it);
			return nullptr;
		}

		return std::static_pointer_cast<const V>(sp);
	}

	// returns the live instance with the same id if there is one, otherwise registers v
	template<typename V>
	std::shared_ptr<const V> intern(std::shared_ptr<const V> v) {
		if (!v) {
			return v;
		}

		if (auto existing = find<V>(v->id); existing) {
			return existing;
		}

		_entries.insert_or_assign(v->id, Entry{entt::type_id<V>().hash(), std::shared_ptr<const void>{v}});
		return v;
	}

	// drops entries whose value is gone, returns how many
	size_t sweep(void);

	size_t size(void) const;
	void clear(void);
};

} // ProvDB
