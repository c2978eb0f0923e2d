#pragma once

#include "memo_cache/key_builder.hpp"
#include "memo_cache/policy.hpp"
#include "memo_cache/types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace memo_cache {

template <typename V> struct Entry {
  CacheKey key;
  V value;
  std::uint64_t seq{0};
  std::uint64_t frequency{1};
  std::uint64_t last_access{0};
  std::optional<TimePoint> expires_at;
};

// Key -> entry map with a pluggable eviction policy. Not synchronized; the
// owning controller serializes access.
template <typename V> class CacheStore {
public:
  CacheStore(std::optional<std::size_t> capacity,
             std::unique_ptr<IEvictionPolicy> policy)
      : capacity_(capacity), policy_(std::move(policy)) {
    if (!policy_)
      throw ConfigurationError("store requires an eviction policy");
    if (capacity_ && *capacity_ == 0)
      throw ConfigurationError("store capacity must be positive");
  }

  // Hit updates recency/frequency metadata.
  std::optional<V> get(const CacheKey &key) {
    auto id = find_id(key);
    if (!id)
      return std::nullopt;
    auto &e = entries_.at(*id);
    ++e.frequency;
    e.last_access = ++clock_;
    policy_->on_access(*id);
    return e.value;
  }

  // Lookup without touching policy state.
  const Entry<V> *peek(const CacheKey &key) const {
    auto id = find_id(key);
    if (!id)
      return nullptr;
    return &entries_.at(*id);
  }

  const Entry<V> *peek_id(std::uint64_t id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
  }

  // Returns the evicted key when a new key displaced an old one. A key that
  // is already present is overwritten in place, counts as an access for the
  // policy and never evicts.
  std::optional<CacheKey> put(const CacheKey &key, V value,
                              std::optional<TimePoint> expires_at = std::nullopt,
                              std::uint64_t *id_out = nullptr) {
    if (auto id = find_id(key)) {
      auto &e = entries_.at(*id);
      e.value = std::move(value);
      e.expires_at = expires_at;
      e.last_access = ++clock_;
      policy_->on_access(*id);
      if (id_out)
        *id_out = *id;
      return std::nullopt;
    }

    std::optional<CacheKey> evicted;
    if (capacity_ && entries_.size() >= *capacity_) {
      auto victim = policy_->pick_victim();
      if (!victim || !entries_.contains(*victim))
        throw InvariantViolation("eviction policy '" + policy_->name() +
                                 "' returned no valid victim at capacity");
      evicted = entries_.at(*victim).key;
      erase_id(*victim);
    }

    const std::uint64_t id = ++seq_;
    Entry<V> e{key, std::move(value), id, 1, ++clock_, expires_at};
    if (key.is_hashable())
      hashed_.emplace(key.hash(), id);
    else
      structural_.push_back(id);
    entries_.emplace(id, std::move(e));
    policy_->on_insert(id);
    if (id_out)
      *id_out = id;
    return evicted;
  }

  bool contains(const CacheKey &key) const { return find_id(key).has_value(); }

  bool erase(const CacheKey &key) {
    auto id = find_id(key);
    if (!id)
      return false;
    return erase_id(*id);
  }

  bool erase_id(std::uint64_t id) {
    auto it = entries_.find(id);
    if (it == entries_.end())
      return false;
    if (it->second.key.is_hashable()) {
      // Match on id: a key whose arguments are not reflexively equal would
      // never find itself.
      auto [first, last] = hashed_.equal_range(it->second.key.hash());
      for (auto pos = first; pos != last; ++pos) {
        if (pos->second == id) {
          hashed_.erase(pos);
          break;
        }
      }
    } else {
      auto pos = std::find(structural_.begin(), structural_.end(), id);
      if (pos != structural_.end()) {
        *pos = structural_.back();
        structural_.pop_back();
      }
    }
    policy_->on_erase(id);
    entries_.erase(it);
    return true;
  }

  void clear() {
    entries_.clear();
    hashed_.clear();
    structural_.clear();
    policy_->clear();
  }

  std::size_t size() const { return entries_.size(); }
  std::size_t structural_size() const { return structural_.size(); }
  std::optional<std::size_t> capacity() const { return capacity_; }
  const IEvictionPolicy &policy() const { return *policy_; }

  void check_invariants() const {
    if (hashed_.size() + structural_.size() != entries_.size())
      throw InvariantViolation("key index size " +
                               std::to_string(hashed_.size() + structural_.size()) +
                               " != entry count " + std::to_string(entries_.size()));
    if (policy_->size() != entries_.size())
      throw InvariantViolation("policy tracks " + std::to_string(policy_->size()) +
                               " ids, store holds " + std::to_string(entries_.size()));
    if (capacity_ && entries_.size() > *capacity_)
      throw InvariantViolation("store exceeds capacity");
  }

private:
  std::optional<std::uint64_t> find_id(const CacheKey &key) const {
    if (key.is_hashable()) {
      auto [first, last] = hashed_.equal_range(key.hash());
      for (auto it = first; it != last; ++it) {
        if (entries_.at(it->second).key == key)
          return it->second;
      }
      return std::nullopt;
    }
    for (auto id : structural_) {
      if (entries_.at(id).key == key)
        return id;
    }
    return std::nullopt;
  }

  std::optional<std::size_t> capacity_;
  std::unique_ptr<IEvictionPolicy> policy_;
  std::unordered_map<std::uint64_t, Entry<V>> entries_;
  std::unordered_multimap<std::size_t, std::uint64_t> hashed_;
  std::vector<std::uint64_t> structural_;
  std::uint64_t seq_{0};
  std::uint64_t clock_{0};
};

} // namespace memo_cache
