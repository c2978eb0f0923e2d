#include "memo_cache/store.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <string>

using namespace memo_cache;

namespace {
CacheKey key(std::int64_t v) {
  return *KeyBuilder{}.build({Arg::integer(v)}, {});
}
CacheKey list_key(std::int64_t a, std::int64_t b) {
  return *KeyBuilder{}.build({Arg::list({Arg::integer(a), Arg::integer(b)})}, {});
}
} // namespace

TEST_CASE("Store evicts exactly one entry per new key at capacity",
          "[store][eviction]") {
  CacheStore<std::string> s(2, make_policy(Algorithm::Fifo));
  CHECK_FALSE(s.put(key(1), "one").has_value());
  CHECK_FALSE(s.put(key(2), "two").has_value());
  auto evicted = s.put(key(3), "three");
  REQUIRE(evicted.has_value());
  CHECK(*evicted == key(1));
  CHECK(s.size() == 2);
  CHECK_FALSE(s.contains(key(1)));
  CHECK(s.get(key(3)) == "three");
  s.check_invariants();
}

TEST_CASE("Overwriting a present key never evicts", "[store]") {
  CacheStore<int> s(2, make_policy(Algorithm::Lru));
  s.put(key(1), 1);
  s.put(key(2), 2);
  CHECK_FALSE(s.put(key(1), 10).has_value());
  CHECK(s.size() == 2);
  CHECK(s.get(key(1)) == 10);
}

TEST_CASE("Hits update frequency and recency metadata", "[store]") {
  CacheStore<int> s(std::nullopt, make_policy(Algorithm::Lfu));
  s.put(key(1), 1);
  s.put(key(2), 2);
  const auto before = s.peek(key(1))->last_access;
  s.get(key(1));
  s.get(key(1));
  const auto *e = s.peek(key(1));
  REQUIRE(e != nullptr);
  CHECK(e->frequency == 3);
  CHECK(e->last_access > before);
  CHECK(s.peek(key(2))->frequency == 1);
  CHECK(e->seq < s.peek(key(2))->seq);
}

TEST_CASE("Structural keys live beside hashed keys", "[store][structural]") {
  CacheStore<int> s(3, make_policy(Algorithm::Lru));
  s.put(list_key(1, 2), 12);
  s.put(key(5), 5);
  s.put(list_key(3, 4), 34);
  CHECK(s.structural_size() == 2);
  CHECK(s.get(list_key(1, 2)) == 12);
  CHECK_FALSE(s.get(list_key(2, 1)).has_value());

  // key(5) is now the least recently used
  auto evicted = s.put(list_key(9, 9), 99);
  REQUIRE(evicted.has_value());
  CHECK(*evicted == key(5));
  CHECK(s.erase(list_key(3, 4)));
  CHECK(s.structural_size() == 2);
  s.check_invariants();
}

TEST_CASE("Clear empties index, entries and policy", "[store]") {
  CacheStore<int> s(4, make_policy(Algorithm::Lfu));
  for (int i = 0; i < 4; ++i)
    s.put(key(i), i);
  s.put(list_key(0, 0), 0);
  s.clear();
  CHECK(s.size() == 0);
  CHECK(s.policy().size() == 0);
  CHECK_FALSE(s.contains(key(1)));
  s.check_invariants();
}

TEST_CASE("Zero capacity is rejected", "[store][config]") {
  CHECK_THROWS_AS(CacheStore<int>(0, make_policy(Algorithm::Lru)),
                  ConfigurationError);
  CHECK_THROWS_AS(CacheStore<int>(2, nullptr), ConfigurationError);
}

TEST_CASE("Keys that never equal themselves still leave the index cleanly",
          "[store][nan]") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const auto nan_key = [&] {
    return CacheKey::hashable(7, {Arg::real(nan)}, {});
  };
  CacheStore<int> s(2, make_policy(Algorithm::Lru));
  std::uint64_t last_id = 0;
  for (int i = 0; i < 5; ++i) {
    s.put(nan_key(), i, std::nullopt, &last_id);
    CHECK(s.size() <= 2);
    s.check_invariants();
  }
  CHECK_FALSE(s.contains(nan_key()));
  CHECK_FALSE(s.erase(nan_key()));
  CHECK(s.erase_id(last_id));
  CHECK(s.size() == 1);
  s.check_invariants();

  s.put(key(1), 1);
  CHECK(s.get(key(1)) == 1);
  s.check_invariants();
}

TEST_CASE("Distinct keys sharing a hash are told apart", "[store]") {
  CacheStore<int> s(std::nullopt, make_policy(Algorithm::Fifo));
  s.put(CacheKey::hashable(1, {Arg::integer(10)}, {}), 10);
  s.put(CacheKey::hashable(1, {Arg::integer(20)}, {}), 20);
  CHECK(s.size() == 2);
  CHECK(s.get(CacheKey::hashable(1, {Arg::integer(20)}, {})) == 20);
  CHECK(s.erase(CacheKey::hashable(1, {Arg::integer(10)}, {})));
  CHECK(s.get(CacheKey::hashable(1, {Arg::integer(20)}, {})) == 20);
  s.check_invariants();
}

TEST_CASE("Overwriting a key refreshes its LRU position", "[store][lru]") {
  CacheStore<int> s(2, make_policy(Algorithm::Lru));
  CHECK(s.capacity() == 2u);
  s.put(key(1), 1);
  s.put(key(2), 2);
  s.put(key(1), 11);
  auto evicted = s.put(key(3), 3);
  REQUIRE(evicted.has_value());
  CHECK(*evicted == key(2));
  CHECK(s.get(key(1)) == 11);
}
