#pragma once

#include "memo_cache/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace memo_cache {

struct CacheInfo {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::size_t current_size{0};
  std::optional<std::size_t> max_size;
  Algorithm algorithm{Algorithm::Lru};
  std::optional<Duration> ttl;
  bool thread_safe{true};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t bypasses{0};
};

// Hit/miss/eviction counters are only touched inside the cache's critical
// section. Bypassed calls never enter it, so that counter is atomic.
class StatisticsRecorder {
public:
  StatisticsRecorder(std::optional<std::size_t> max_size, Algorithm algorithm,
                     std::optional<Duration> ttl, bool thread_safe)
      : max_size_(max_size), algorithm_(algorithm), ttl_(ttl),
        thread_safe_(thread_safe) {}

  void record_hit() { ++hits_; }
  void record_miss() { ++misses_; }
  void record_eviction() { ++evictions_; }
  void record_bypass() { bypasses_.fetch_add(1, std::memory_order_relaxed); }
  void reset();

  CacheInfo snapshot(std::size_t current_size,
                     std::uint64_t expirations) const;

private:
  std::optional<std::size_t> max_size_;
  Algorithm algorithm_;
  std::optional<Duration> ttl_;
  bool thread_safe_;
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t evictions_{0};
  std::atomic<std::uint64_t> bypasses_{0};
};

// "name:value" lines; unset max_size and ttl render as "none".
std::string format_info(const CacheInfo &info);

} // namespace memo_cache
