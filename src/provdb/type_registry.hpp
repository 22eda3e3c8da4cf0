#pragma once

#include "./types.hpp"

#include <entt/core/type_info.hpp>
#include <entt/container/dense_map.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <type_traits>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ProvDB {

struct ObjectWriter;
struct ObjectReader;

// result of one attribute step, either the key itself or an object to descend into
using AttributeValue = std::variant<std::string, Object>;

// maps stable type tags to the functions that turn object state into json and back.
// tags double as the trust boundary for stored data, only tags in an allowed namespace resolve.
struct TypeRegistry {
	using serialize_fn = bool(*)(ObjectWriter& w, const ObjectHandle h, nlohmann::json& out);
	using deserialize_fn = bool(*)(ObjectReader& r, ObjectHandle h, const nlohmann::json& in);
	using domain_id_fn = std::function<std::string(const ObjectHandle h)>;
	using attribute_fn = std::function<AttributeValue(const ObjectHandle h)>;

	// identity bearing types, stored as their own record
	struct PersistentType {
		std::string tag;
		entt::id_type type_id {0};
		serialize_fn serl {nullptr};
		deserialize_fn deserl {nullptr};
		bool compress {true};
		// empty means the oid is random
		domain_id_fn domain_id;
		entt::dense_map<std::string, attribute_fn> attributes;
	};

	// embedded in the record of the object holding them
	struct ValueType {
		std::string tag;
		entt::id_type type_id {0};
		// wrapper around a single primitive, has no id field
		bool primitive {false};
	};

	std::vector<std::string> _allowed_namespaces;

	entt::dense_map<std::string, PersistentType> _persistent;
	entt::dense_map<entt::id_type, std::string> _persistent_by_type;

	entt::dense_map<std::string, ValueType> _values;
	entt::dense_map<entt::id_type, std::string> _values_by_type;

	// "provdb" is always allowed, it holds the builtin types
	TypeRegistry(const std::vector<std::string>& allowed_namespaces = {"renku"});

	bool isAllowed(std::string_view tag) const;
	// throws DisallowedType
	void checkAllowed(std::string_view tag) const;

	template<typename T>
	static bool state_get_json(ObjectWriter&, const ObjectHandle h, nlohmann::json& j) {
		if (!h.template all_of<T>()) {
			return false;
		}

		if constexpr (!std::is_empty_v<T>) {
			j = h.template get<T>();
		} else {
			j = nlohmann::json::object();
		}
		return true;
	}

	template<typename T>
	static bool state_emplace_or_replace_json(ObjectReader&, ObjectHandle h, const nlohmann::json& j) {
		if constexpr (std::is_empty_v<T>) {
			h.template emplace_or_replace<T>();
		} else {
			h.template emplace_or_replace<T>(j.get<T>());
		}
		return true;
	}

	// throws InvariantViolation on a tag outside the allowed namespaces or a duplicate
	void registerPersistent(PersistentType&& pt);

	template<typename T>
	void registerType(
		std::string_view tag,
		bool compress = true,
		serialize_fn serl = state_get_json<T>,
		deserialize_fn deserl = state_emplace_or_replace_json<T>
	) {
		PersistentType pt;
		pt.tag = tag;
		pt.type_id = entt::type_id<T>().hash();
		pt.serl = serl;
		pt.deserl = deserl;
		pt.compress = compress;
		registerPersistent(std::move(pt));
	}

	// fn: std::string(const T&), the oid becomes hashID() of the result
	template<typename T, typename Fn>
	void registerDomainID(Fn&& fn) {
		persistentByType(entt::type_id<T>().hash()).domain_id =
			[fn = std::forward<Fn>(fn)](const ObjectHandle h) -> std::string {
				return fn(h.template get<T>());
			}
		;
	}

	// fn: AttributeValue(const T&), used by index key derivation
	template<typename T, typename Fn>
	void registerAttribute(std::string_view name, Fn&& fn) {
		persistentByType(entt::type_id<T>().hash()).attributes.insert_or_assign(
			std::string{name},
			[fn = std::forward<Fn>(fn)](const ObjectHandle h) -> AttributeValue {
				return fn(h.template get<T>());
			}
		);
	}

	void registerValue(std::string_view tag, entt::id_type type_id, bool primitive);

	template<typename V>
	void registerValue(std::string_view tag, bool primitive = false) {
		registerValue(tag, entt::type_id<V>().hash(), primitive);
	}

	// stored as {"@type": tag, "@value": <underlying value>}
	template<typename E>
	void registerEnum(std::string_view tag) {
		static_assert(std::is_enum_v<E>, "registerEnum() needs an enum");
		registerValue(tag, entt::type_id<E>().hash(), true);
	}

	// nullptr if unknown
	const PersistentType* findPersistent(std::string_view tag) const;
	const PersistentType* findPersistent(entt::id_type type_id) const;
	const ValueType* findValue(std::string_view tag) const;
	const ValueType* findValue(entt::id_type type_id) const;

	template<typename T>
	const std::string& tagOf(void) const {
		return persistentByType(entt::type_id<T>().hash()).tag;
	}

	private:
		// throws InvariantViolation if T was never registered
		PersistentType& persistentByType(entt::id_type type_id);
		const PersistentType& persistentByType(entt::id_type type_id) const;
};

} // ProvDB

// make specializations known
namespace ProvDB::Components {
	struct Root;
	struct IndexData;
}

namespace ProvDB {
	template<> bool TypeRegistry::state_get_json<Components::Root>(ObjectWriter& w, const ObjectHandle h, nlohmann::json& j);
	template<> bool TypeRegistry::state_emplace_or_replace_json<Components::Root>(ObjectReader& r, ObjectHandle h, const nlohmann::json& j);
	template<> bool TypeRegistry::state_get_json<Components::IndexData>(ObjectWriter& w, const ObjectHandle h, nlohmann::json& j);
	template<> bool TypeRegistry::state_emplace_or_replace_json<Components::IndexData>(ObjectReader& r, ObjectHandle h, const nlohmann::json& j);
} // ProvDB
