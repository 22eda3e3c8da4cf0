#pragma once

#include <stdexcept>

namespace ProvDB {

struct Error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

// missing record, unknown oid or unknown id
struct NotFound : public Error {
	using Error::Error;
};

// programmer error, never recovered from
struct InvariantViolation : public Error {
	using Error::Error;
};

// stored type tag outside of the trusted set
struct DisallowedType : public Error {
	using Error::Error;
};

} // ProvDB
