#pragma once

#include "memo_cache/config.hpp"
#include "memo_cache/expiration.hpp"
#include "memo_cache/guard.hpp"
#include "memo_cache/key_builder.hpp"
#include "memo_cache/policy.hpp"
#include "memo_cache/stats.hpp"
#include "memo_cache/store.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace memo_cache {

// One cache bound to one computation. A wrapping layer turns a call into
// fetch_or_compute(args, kwargs, [&] { return f(args...); }).
template <typename V> class CacheController {
public:
  using ComputeFn = std::function<V()>;

  explicit CacheController(MemoConfig cfg,
                           typename ExpirationTracker<V>::NowFn now = &Clock::now)
      : cfg_(std::move(cfg)), algorithm_(validate_config(cfg_)),
        guard_(make_guard(cfg_.thread_safe)),
        store_(capacity_of(cfg_), make_policy(algorithm_)),
        expiry_(store_, cfg_.ttl, std::move(now)),
        stats_(store_.capacity(), store_.policy().algorithm(), expiry_.ttl(),
               guard_->thread_safe()) {
    spdlog::debug("memo_cache: created algorithm={} max_size={} ttl_ms={} "
                  "thread_safe={}",
                  to_string(algorithm_),
                  cfg_.max_size ? std::to_string(*cfg_.max_size) : "none",
                  cfg_.ttl ? std::to_string(cfg_.ttl->count()) : "none",
                  cfg_.thread_safe);
  }

  CacheController(const CacheController &) = delete;
  CacheController &operator=(const CacheController &) = delete;

  // Whatever compute throws reaches the caller; nothing is stored then.
  V fetch_or_compute(const Args &positional, const KwArgs &keywords,
                     const ComputeFn &compute) {
    std::string err;
    auto key = keys_.build(positional, keywords, &err);
    if (!key) {
      spdlog::debug("memo_cache: bypassing cache: {}", err);
      stats_.record_bypass();
      return compute();
    }

    std::lock_guard<IConcurrencyGuard> lock(*guard_);
    expiry_.sweep();
    if (auto cached = expiry_.get(*key)) {
      stats_.record_hit();
      return std::move(*cached);
    }

    V value = compute();
    auto evicted = expiry_.put(*key, value);
    if (evicted) {
      stats_.record_eviction();
      spdlog::trace("memo_cache: evicted {} for {}", evicted->repr(),
                    key->repr());
    }
    stats_.record_miss();
    return value;
  }

  V fetch_or_compute(const Args &positional, const ComputeFn &compute) {
    return fetch_or_compute(positional, KwArgs{}, compute);
  }

  // Removes the entry for one call signature. False if absent or the
  // arguments cannot form a key.
  bool invalidate(const Args &positional, const KwArgs &keywords = {}) {
    auto key = keys_.build(positional, keywords);
    if (!key)
      return false;
    std::lock_guard<IConcurrencyGuard> lock(*guard_);
    expiry_.sweep();
    return expiry_.erase(*key);
  }

  // Drops all entries and resets every counter.
  void cache_clear() {
    std::lock_guard<IConcurrencyGuard> lock(*guard_);
    expiry_.clear();
    expiry_.reset_counters();
    stats_.reset();
    spdlog::debug("memo_cache: cleared");
  }

  CacheInfo cache_info() {
    std::lock_guard<IConcurrencyGuard> lock(*guard_);
    return stats_.snapshot(expiry_.size(), expiry_.expirations());
  }

  void check_invariants() {
    std::lock_guard<IConcurrencyGuard> lock(*guard_);
    store_.check_invariants();
  }

  const MemoConfig &config() const { return cfg_; }
  Algorithm algorithm() const { return algorithm_; }

private:
  static std::optional<std::size_t> capacity_of(const MemoConfig &cfg) {
    if (!cfg.max_size)
      return std::nullopt;
    return static_cast<std::size_t>(*cfg.max_size);
  }

  MemoConfig cfg_;
  Algorithm algorithm_;
  std::unique_ptr<IConcurrencyGuard> guard_;
  KeyBuilder keys_;
  CacheStore<V> store_;
  ExpirationTracker<V> expiry_;
  StatisticsRecorder stats_;
};

} // namespace memo_cache
