#pragma once

#include "duckdb.hpp"

#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace duckdb {

typedef std::function<bool(const_data_ptr_t input, idx_t size)> byte_predicate_t;

// Append-only map from a key (MIME type or extension) to predicates. Lookups take a
// shared lock and may run concurrently; registration takes the exclusive lock.
// Keys are used as given; callers normalize them.
class MatcherRegistry {
public:
	using PredicateList = std::vector<byte_predicate_t>;

	void Register(const std::string &key, byte_predicate_t predicate);
	bool IsRegistered(const std::string &key) const;
	// True if any predicate registered for `key` accepts the input, false for an
	// unknown key.
	bool Matches(const std::string &key, const_data_ptr_t input, idx_t size) const;
	idx_t Size() const;

private:
	mutable std::shared_mutex lock;
	std::unordered_map<std::string, PredicateList> predicates;
};

} // namespace duckdb
