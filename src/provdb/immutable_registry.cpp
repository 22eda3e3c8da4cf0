#include "./immutable_registry.hpp"

#include <vector>

namespace ProvDB {

size_t ImmutableRegistry::sweep(void) {
	std::vector<std::string> expired;
	for (const auto& [id, entry] : _entries) {
		if (entry.ptr.expired()) {
			expired.push_back(id);
		}
	}

	for (const auto& id : expired) {
		_entries.erase(id);
	}

	return expired.size();
}

size_t ImmutableRegistry::size(void) const {
	return _entries.size();
}

void ImmutableRegistry::clear(void) {
	_entries.clear();
}

} // ProvDB
