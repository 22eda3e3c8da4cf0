#pragma once

#include "./types.hpp"

#include <map>
#include <string>

namespace ProvDB::Components {

	// storage key, never changes once assigned
	struct OID {
		std::string v;
	};

	// registered type tag, eg "renku.domain_model.dataset.Dataset"
	struct Type {
		std::string tag;
	};

	// the reserved root mapping, name -> index or singleton
	struct Root {
		std::map<std::string, Object> entries;
	};

	struct IndexData {
		std::string name;
		std::string object_type;
		// dotted path, empty if keys are always explicit
		std::string attribute;
		// type tag of key objects, empty if none are accepted
		std::string key_type;
		std::map<std::string, Object> entries;
	};

	// not written to storage
	namespace Ephemeral {

		// oid and type known, state component not loaded yet
		struct Ghost {};

		// never stored
		struct New {};

		// stored before, changed since
		struct DirtyTag {};

		// oid is the hash of the current domain id
		struct DerivedOID {};

	} // Ephemeral

} // ProvDB::Components

namespace DBComp = ProvDB::Components;
