#pragma once

#include "./types.hpp"
#include "./errors.hpp"
#include "./immutable_registry.hpp"
#include "./json/builtin_types.hpp"

#include <entt/core/type_info.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace ProvDB {

struct Database;

// rebuilds objects from json records.
// references resolve to the live instance if there is one, otherwise to a ghost.
// every stored type tag is checked against the allowed namespaces first.
struct ObjectReader {
	Database& _db;

	// immutable values read through this reader
	ImmutableRegistry _values;

	ObjectReader(Database& db);

	// new object from a full record, published to the active load scope before its state is read
	// throws DisallowedType, Error
	ObjectHandle deserialize(const nlohmann::json& data);

	// fills the state of a ghost, h has to carry the same oid and type as the record
	void setGhostState(ObjectHandle h, const nlohmann::json& data);

	// throws DisallowedType if tag is not allowed or not a registered persistent type
	void checkPersistentTag(const std::string& tag) const;

	void decode(const nlohmann::json& j, bool& out);

	template<typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
	void decode(const nlohmann::json& j, T& out) {
		if (!j.is_number()) {
			throw Error("expected a number, got " + std::string{j.type_name()});
		}
		out = j.get<T>();
	}

	void decode(const nlohmann::json& j, std::string& out);
	void decode(const nlohmann::json& j, Timestamp& out);
	void decode(const nlohmann::json& j, Object& out);

	template<typename T>
	void decode(const nlohmann::json& j, std::optional<T>& out) {
		if (j.is_null()) {
			out.reset();
			return;
		}
		T v{};
		decode(j, v);
		out = std::move(v);
	}

	template<typename T>
	void decode(const nlohmann::json& j, std::vector<T>& out) {
		if (!j.is_array()) {
			throw Error("expected an array, got " + std::string{j.type_name()});
		}
		out.clear();
		out.reserve(j.size());
		for (const auto& je : j) {
			T e{};
			decode(je, e);
			out.push_back(std::move(e));
		}
	}

	template<typename T>
	void decode(const nlohmann::json& j, std::map<std::string, T>& out) {
		if (!j.is_object()) {
			throw Error("expected an object, got " + std::string{j.type_name()});
		}
		out.clear();
		for (const auto& [key, je] : j.items()) {
			if (!key.empty() && key.front() == '@') {
				throw Error("unexpected '" + key + "' in a plain mapping");
			}
			T e{};
			decode(je, e);
			out.emplace(key, std::move(e));
		}
	}

	// "set" and "frozenset" records both read into a std::set
	template<typename T>
	void decode(const nlohmann::json& j, std::set<T>& out) {
		out.clear();
		for (const auto& je : setValues(j)) {
			T e{};
			decode(je, e);
			out.insert(std::move(e));
		}
	}

	template<typename A, typename B>
	void decode(const nlohmann::json& j, std::pair<A, B>& out) {
		const auto& values = tupleValues(j, 2);
		decode(values.at(0), out.first);
		decode(values.at(1), out.second);
	}

	template<typename... Ts>
	void decode(const nlohmann::json& j, std::tuple<Ts...>& out) {
		const auto& values = tupleValues(j, sizeof...(Ts));
		decodeTuple(values, out, std::index_sequence_for<Ts...>{});
	}

	// deduplicated by id, V needs a string id member
	template<typename V>
	void decode(const nlohmann::json& j, std::shared_ptr<const V>& out) {
		if (j.is_null()) {
			out.reset();
			return;
		}

		const auto& fields = valueFields(entt::type_id<V>().hash(), j);
		if (fields.is_object() && fields.contains("id") && fields.at("id").is_string()) {
			if (auto existing = _values.find<V>(fields.at("id").get<std::string>()); existing) {
				out = std::move(existing);
				return;
			}
		}

		auto v = std::make_shared<V>();
		fields.get_to(*v);
		out = _values.intern<V>(std::move(v));
	}

	template<typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
	void decode(const nlohmann::json& j, E& out) {
		const auto& value = valueFields(entt::type_id<E>().hash(), j);
		if (!value.is_number_integer()) {
			throw Error("expected an enum value, got " + std::string{value.type_name()});
		}
		out = static_cast<E>(value.get<std::underlying_type_t<E>>());
	}

	template<typename V, std::enable_if_t<std::is_class_v<V>, int> = 0>
	void decode(const nlohmann::json& j, V& out) {
		valueFields(entt::type_id<V>().hash(), j).get_to(out);
	}

	private:
		template<typename... Ts, size_t... Is>
		void decodeTuple(const nlohmann::json& values, std::tuple<Ts...>& out, std::index_sequence<Is...>) {
			(decode(values.at(Is), std::get<Is>(out)), ...);
		}

		static const nlohmann::json& tupleValues(const nlohmann::json& j, size_t expected_size);
		static const nlohmann::json& setValues(const nlohmann::json& j);
		// checks the tag of a wrapped value, returns its fields
		const nlohmann::json& valueFields(entt::id_type type_id, const nlohmann::json& j) const;
		void fillState(ObjectHandle h, const std::string& tag, const nlohmann::json& data);
};

} // ProvDB
