#pragma once

#include "./types.hpp"
#include "./json/builtin_types.hpp"

#include <entt/core/type_info.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace ProvDB {

struct Database;

// turns object state into json records.
// referenced objects become {"@type","@oid","@reference"} stubs and, if they are new or changed,
// are queued for the same commit.
struct ObjectWriter {
	Database& _db;

	// the object whose record is being built, not queued again when it references itself
	Object _current {entt::null};

	ObjectWriter(Database& db);

	// throws InvariantViolation if h has no oid or belongs to another database
	nlohmann::json serialize(ObjectHandle h);

	nlohmann::json encode(std::nullptr_t) { return nullptr; }
	nlohmann::json encode(bool v) { return v; }

	template<typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
	nlohmann::json encode(T v) { return v; }

	nlohmann::json encode(const std::string& v) { return v; }
	nlohmann::json encode(const char* v) { return v; }
	nlohmann::json encode(const Timestamp& ts) { return ts; }

	nlohmann::json encode(Object o);

	template<typename T>
	nlohmann::json encode(const std::optional<T>& v) {
		if (!v.has_value()) {
			return nullptr;
		}
		return encode(*v);
	}

	template<typename T>
	nlohmann::json encode(const std::vector<T>& v) {
		nlohmann::json j = nlohmann::json::array();
		for (const auto& e : v) {
			j.push_back(encode(e));
		}
		return j;
	}

	template<typename T>
	nlohmann::json encode(const std::map<std::string, T>& m) {
		nlohmann::json j = nlohmann::json::object();
		for (const auto& [key, e] : m) {
			checkKey(key);
			j[key] = encode(e);
		}
		return j;
	}

	template<typename T>
	nlohmann::json encode(const std::set<T>& s) {
		nlohmann::json values = nlohmann::json::array();
		for (const auto& e : s) {
			values.push_back(encode(e));
		}
		return tagSet(std::move(values));
	}

	template<typename A, typename B>
	nlohmann::json encode(const std::pair<A, B>& p) {
		nlohmann::json values = nlohmann::json::array();
		values.push_back(encode(p.first));
		values.push_back(encode(p.second));
		return tagTuple(std::move(values));
	}

	template<typename... Ts>
	nlohmann::json encode(const std::tuple<Ts...>& t) {
		nlohmann::json values = nlohmann::json::array();
		std::apply([this, &values](const auto&... e) { (values.push_back(encode(e)), ...); }, t);
		return tagTuple(std::move(values));
	}

	// immutable values, written like any other value
	template<typename V>
	nlohmann::json encode(const std::shared_ptr<const V>& v) {
		if (!v) {
			return nullptr;
		}
		return encode(*v);
	}

	// enums are stored by their underlying value, E has to be registered with registerEnum()
	template<typename E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
	nlohmann::json encode(E v) {
		return wrapValue(entt::type_id<E>().hash(), static_cast<std::underlying_type_t<E>>(v));
	}

	// structured values, V has to be registered as a value type and have nlohmann to_json
	template<typename V, std::enable_if_t<std::is_class_v<V>, int> = 0>
	nlohmann::json encode(const V& v) {
		return wrapValue(entt::type_id<V>().hash(), nlohmann::json(v));
	}

	// '@' prefixed keys are reserved for record markers
	static void checkKey(std::string_view key);

	private:
		nlohmann::json wrapValue(entt::id_type type_id, nlohmann::json&& fields);
		static nlohmann::json tagTuple(nlohmann::json&& values);
		static nlohmann::json tagSet(nlohmann::json&& values);
		void cascade(ObjectHandle h);
};

} // ProvDB
