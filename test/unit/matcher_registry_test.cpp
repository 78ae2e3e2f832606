#include "magic/matcher_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace duckdb {
namespace {

bool FirstByteIs(const_data_ptr_t input, idx_t size, data_t expected) {
	return size > 0 && input[0] == expected;
}

bool Probe(const MatcherRegistry &registry, const std::string &key, const std::string &input) {
	return registry.Matches(key, reinterpret_cast<const_data_ptr_t>(input.data()), input.size());
}

} // namespace

TEST(MatcherRegistryTest, UnknownKeyNeverMatches) {
	MatcherRegistry registry;
	EXPECT_FALSE(registry.IsRegistered("image/png"));
	EXPECT_FALSE(Probe(registry, "image/png", "anything"));
	EXPECT_EQ(registry.Size(), 0u);
}

TEST(MatcherRegistryTest, AnyPredicateOfTheKeyMatches) {
	MatcherRegistry registry;
	registry.Register("x/ab", [](const_data_ptr_t input, idx_t size) { return FirstByteIs(input, size, 'a'); });
	EXPECT_TRUE(registry.IsRegistered("x/ab"));
	EXPECT_TRUE(Probe(registry, "x/ab", "a"));
	EXPECT_FALSE(Probe(registry, "x/ab", "b"));

	registry.Register("x/ab", [](const_data_ptr_t input, idx_t size) { return FirstByteIs(input, size, 'b'); });
	EXPECT_TRUE(Probe(registry, "x/ab", "a"));
	EXPECT_TRUE(Probe(registry, "x/ab", "b"));
	EXPECT_FALSE(Probe(registry, "x/ab", "c"));
	EXPECT_FALSE(Probe(registry, "x/ab", ""));
	EXPECT_EQ(registry.Size(), 1u);
}

TEST(MatcherRegistryTest, KeysAreExact) {
	MatcherRegistry registry;
	registry.Register(".png", [](const_data_ptr_t, idx_t) { return true; });
	EXPECT_TRUE(registry.IsRegistered(".png"));
	EXPECT_FALSE(registry.IsRegistered("png"));
	EXPECT_FALSE(registry.IsRegistered(".PNG"));
}

TEST(MatcherRegistryTest, StopsAtFirstAcceptingPredicate) {
	MatcherRegistry registry;
	std::atomic<int> second_calls(0);
	registry.Register("k", [](const_data_ptr_t, idx_t) { return true; });
	registry.Register("k", [&second_calls](const_data_ptr_t, idx_t) {
		second_calls++;
		return true;
	});
	EXPECT_TRUE(Probe(registry, "k", "x"));
	EXPECT_EQ(second_calls.load(), 0);
}

TEST(MatcherRegistryTest, PredicateMayRegisterWhileMatching) {
	MatcherRegistry registry;
	registry.Register("k", [&registry](const_data_ptr_t, idx_t) {
		registry.Register("k2", [](const_data_ptr_t, idx_t) { return true; });
		registry.Register("k", [](const_data_ptr_t, idx_t) { return true; });
		return false;
	});
	EXPECT_FALSE(registry.Matches("k", nullptr, 0));
	EXPECT_TRUE(registry.IsRegistered("k2"));
	// the predicate added during the first lookup is seen by the next one
	EXPECT_TRUE(registry.Matches("k", nullptr, 0));
}

TEST(MatcherRegistryTest, ConcurrentReadersAndWriters) {
	MatcherRegistry registry;
	registry.Register("base", [](const_data_ptr_t, idx_t) { return true; });

	constexpr int WRITERS = 4;
	constexpr int READERS = 4;
	constexpr int ROUNDS = 200;
	std::atomic<bool> reader_failed(false);
	std::vector<std::thread> threads;
	for (int w = 0; w < WRITERS; w++) {
		threads.emplace_back([&registry, w]() {
			for (int i = 0; i < ROUNDS; i++) {
				registry.Register("key-" + std::to_string(w), [](const_data_ptr_t, idx_t) { return false; });
			}
		});
	}
	for (int r = 0; r < READERS; r++) {
		threads.emplace_back([&registry, &reader_failed]() {
			for (int i = 0; i < ROUNDS; i++) {
				if (!Probe(registry, "base", "x")) {
					reader_failed = true;
				}
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}

	EXPECT_FALSE(reader_failed.load());
	EXPECT_EQ(registry.Size(), static_cast<idx_t>(WRITERS + 1));
	for (int w = 0; w < WRITERS; w++) {
		EXPECT_TRUE(registry.IsRegistered("key-" + std::to_string(w)));
	}
}

} // namespace duckdb
