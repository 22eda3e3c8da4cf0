#pragma once

#include <entt/entity/registry.hpp>
#include <entt/entity/handle.hpp>

#include <chrono>
#include <cstdint>

namespace ProvDB {

// internal id, only meaningful inside the Database that created it
enum class Object : uint32_t {};
using ObjectRegistry = entt::basic_registry<Object>;
using ObjectHandle = entt::basic_handle<ObjectRegistry>;

// microsecond resolution, same as the stored text form
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

enum class ObjectState : uint8_t {
	UNSAVED, // no oid yet
	PENDING, // oid assigned, never stored
	CLEAN,
	DIRTY, // changed since it was last stored
	GHOST, // oid known, state not loaded
};

} // ProvDB
