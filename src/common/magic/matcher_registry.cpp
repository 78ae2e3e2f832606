#include "magic/matcher_registry.hpp"

#include <mutex>
#include <utility>

namespace duckdb {

void MatcherRegistry::Register(const std::string &key, byte_predicate_t predicate) {
	std::unique_lock<std::shared_mutex> guard(lock);
	predicates[key].push_back(std::move(predicate));
}

bool MatcherRegistry::IsRegistered(const std::string &key) const {
	std::shared_lock<std::shared_mutex> guard(lock);
	return predicates.find(key) != predicates.end();
}

// The list is copied under the shared lock and the predicates run after it is released,
// so a predicate may register further predicates.
bool MatcherRegistry::Matches(const std::string &key, const_data_ptr_t input, idx_t size) const {
	PredicateList candidates;
	{
		std::shared_lock<std::shared_mutex> guard(lock);
		auto entry = predicates.find(key);
		if (entry == predicates.end()) {
			return false;
		}
		candidates = entry->second;
	}
	for (auto &predicate : candidates) {
		if (predicate(input, size)) {
			return true;
		}
	}
	return false;
}

idx_t MatcherRegistry::Size() const {
	std::shared_lock<std::shared_mutex> guard(lock);
	return predicates.size();
}

} // namespace duckdb
