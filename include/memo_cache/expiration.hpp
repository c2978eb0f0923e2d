#pragma once

#include "memo_cache/store.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

namespace memo_cache {

// Adds time-to-live semantics on top of a CacheStore. Every entry shares the
// same ttl, so deadlines are queued in insertion order and a sweep only ever
// looks at the front. Without a ttl every call forwards straight to the store.
template <typename V> class ExpirationTracker {
public:
  using NowFn = std::function<TimePoint()>;

  ExpirationTracker(CacheStore<V> &store, std::optional<Duration> ttl,
                    NowFn now = &Clock::now)
      : store_(store), ttl_(ttl), now_(std::move(now)) {}

  std::optional<V> get(const CacheKey &key) {
    if (!ttl_)
      return store_.get(key);
    const auto *e = store_.peek(key);
    if (!e)
      return std::nullopt;
    if (e->expires_at && *e->expires_at <= now_()) {
      store_.erase(key);
      ++expirations_;
      return std::nullopt;
    }
    return store_.get(key);
  }

  std::optional<CacheKey> put(const CacheKey &key, V value) {
    if (!ttl_)
      return store_.put(key, std::move(value));
    const auto deadline = deadline_from(now_());
    std::uint64_t id = 0;
    auto evicted = store_.put(key, std::move(value), deadline, &id);
    deadlines_.emplace_back(deadline, id);
    return evicted;
  }

  bool contains(const CacheKey &key) {
    if (!ttl_)
      return store_.contains(key);
    const auto *e = store_.peek(key);
    return e && !(e->expires_at && *e->expires_at <= now_());
  }

  bool erase(const CacheKey &key) { return store_.erase(key); }

  // Drops every entry whose deadline has passed. Queue items whose entry was
  // evicted, invalidated or re-stamped by an overwrite are discarded.
  std::size_t sweep() {
    if (!ttl_ || deadlines_.empty())
      return 0;
    const auto now = now_();
    std::size_t removed = 0;
    while (!deadlines_.empty() && deadlines_.front().first <= now) {
      const auto id = deadlines_.front().second;
      deadlines_.pop_front();
      const auto *e = store_.peek_id(id);
      if (!e || !e->expires_at || *e->expires_at > now)
        continue;
      store_.erase_id(id);
      ++removed;
    }
    if (removed) {
      expirations_ += removed;
      spdlog::trace("memo_cache: expired {} entries, {} live", removed,
                    store_.size());
    }
    return removed;
  }

  std::size_t size() {
    sweep();
    return store_.size();
  }

  void clear() {
    store_.clear();
    deadlines_.clear();
  }

  std::optional<Duration> ttl() const { return ttl_; }
  std::uint64_t expirations() const { return expirations_; }
  void reset_counters() { expirations_ = 0; }

private:
  // Saturates at TimePoint::max() instead of wrapping into the past.
  TimePoint deadline_from(TimePoint now) const {
    const auto span = std::chrono::duration_cast<TimePoint::duration>(
        std::min(*ttl_, kMaxTtl));
    if (now.time_since_epoch() > TimePoint::duration::max() - span)
      return TimePoint::max();
    return now + span;
  }

  CacheStore<V> &store_;
  std::optional<Duration> ttl_;
  NowFn now_;
  std::deque<std::pair<TimePoint, std::uint64_t>> deadlines_;
  std::uint64_t expirations_{0};
};

} // namespace memo_cache
