#pragma once

#include <string>
#include <string_view>
#include <array>
#include <cstdint>

namespace ProvDB {

// lowercase hex sha256 of a domain id, 64 chars
std::string hashID(std::string_view id);

struct OIDGeneratorI {
	virtual ~OIDGeneratorI(void) {}
	virtual std::string operator()(void) = 0;
};

// 128bit session namespace followed by 128bit random, hex encoded (64 chars).
// both parts come from the os csprng (libsodium randombytes)
struct OIDGenerator_128_128 final : public OIDGeneratorI {
	private:
		std::array<uint8_t, 16> _oid_namespace;

	public:
		OIDGenerator_128_128(void); // default randomly initializes namespace
		OIDGenerator_128_128(const std::array<uint8_t, 16>& oid_namespace);

		std::string operator()(void) override;
};

} // ProvDB
