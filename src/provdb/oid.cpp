#include "./oid.hpp"

#include "./utils.hpp"
#include "./errors.hpp"

#include <sodium.h>

#include <vector>

namespace ProvDB {

std::string hashID(std::string_view id) {
	std::array<uint8_t, crypto_hash_sha256_BYTES> hash;
	crypto_hash_sha256(hash.data(), reinterpret_cast<const uint8_t*>(id.data()), id.size());
	return bin2hex(hash.data(), hash.size());
}

static void initSodium(void) {
	// idempotent, 1 means already initialized
	if (sodium_init() < 0) {
		throw Error("failed to initialize libsodium");
	}
}

OIDGenerator_128_128::OIDGenerator_128_128(void) {
	initSodium();
	randombytes_buf(_oid_namespace.data(), _oid_namespace.size());
}

OIDGenerator_128_128::OIDGenerator_128_128(const std::array<uint8_t, 16>& oid_namespace) :
	_oid_namespace(oid_namespace)
{
	initSodium();
}

std::string OIDGenerator_128_128::operator()(void) {
	std::vector<uint8_t> new_oid(_oid_namespace.cbegin(), _oid_namespace.cend());
	new_oid.resize(new_oid.size() + 16);

	randombytes_buf(new_oid.data() + _oid_namespace.size(), 16);

	return bin2hex(new_oid);
}

} // ProvDB
