#pragma once

#include "../types.hpp"
#include "../errors.hpp"
#include "../utils.hpp"

#include <nlohmann/json.hpp>

#include <tuple>
#include <utility>

// tagged forms for values json has no native type for

namespace nlohmann {

template<>
struct adl_serializer<ProvDB::Timestamp> {
	static void to_json(json& j, const ProvDB::Timestamp& ts) {
		j = json{
			{"@type", "datetime"},
			{"@value", ProvDB::timestampToString(ts)},
		};
	}

	static void from_json(const json& j, ProvDB::Timestamp& ts) {
		if (!j.is_object() || j.value("@type", "") != "datetime") {
			throw ProvDB::Error("expected a datetime record");
		}

		const auto str = j.at("@value").get<std::string>();
		if (!ProvDB::timestampFromString(str, ts)) {
			throw ProvDB::Error("malformed timestamp '" + str + "'");
		}
	}
};

template<typename... Args>
struct adl_serializer<std::tuple<Args...>> {
	static void to_json(json& j, const std::tuple<Args...>& t) {
		json values = json::array();
		std::apply([&values](const auto&... e) { (values.push_back(json(e)), ...); }, t);
		j = json{
			{"@type", "tuple"},
			{"@value", std::move(values)},
		};
	}

	static void from_json(const json& j, std::tuple<Args...>& t) {
		if (!j.is_object() || j.value("@type", "") != "tuple") {
			throw ProvDB::Error("expected a tuple record");
		}

		const auto& values = j.at("@value");
		if (!values.is_array() || values.size() != sizeof...(Args)) {
			throw ProvDB::Error("tuple record has the wrong number of elements");
		}

		fromValues(values, t, std::index_sequence_for<Args...>{});
	}

	template<size_t... Is>
	static void fromValues(const json& values, std::tuple<Args...>& t, std::index_sequence<Is...>) {
		(values.at(Is).get_to(std::get<Is>(t)), ...);
	}
};

template<typename A, typename B>
struct adl_serializer<std::pair<A, B>> {
	static void to_json(json& j, const std::pair<A, B>& p) {
		j = json{
			{"@type", "tuple"},
			{"@value", json::array({json(p.first), json(p.second)})},
		};
	}

	static void from_json(const json& j, std::pair<A, B>& p) {
		if (!j.is_object() || j.value("@type", "") != "tuple") {
			throw ProvDB::Error("expected a tuple record");
		}

		const auto& values = j.at("@value");
		if (!values.is_array() || values.size() != 2) {
			throw ProvDB::Error("pair record needs exactly 2 elements");
		}

		values.at(0).get_to(p.first);
		values.at(1).get_to(p.second);
	}
};

// references carry identity, only ObjectWriter/ObjectReader know how to resolve them
template<>
struct adl_serializer<ProvDB::Object> {
	static void to_json(json&, const ProvDB::Object&) {
		throw ProvDB::InvariantViolation("object references can only be written through an ObjectWriter");
	}

	static void from_json(const json&, ProvDB::Object&) {
		throw ProvDB::InvariantViolation("object references can only be read through an ObjectReader");
	}
};

} // nlohmann
