#pragma once

#include "./types.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace ProvDB {

std::string bin2hex(const uint8_t* data, size_t size);
std::string bin2hex(const std::vector<uint8_t>& data);

std::string toLower(std::string_view str);

// "a.b.c" -> {"a", "b", "c"}
std::vector<std::string> splitDotted(std::string_view path);

// "2024-03-01T12:30:05.000250+00:00"
std::string timestampToString(const Timestamp ts);
// accepts an optional fraction and a Z or +-HH:MM suffix
bool timestampFromString(std::string_view str, Timestamp& ts_out);

} // ProvDB
