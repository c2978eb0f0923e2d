#pragma once

#include "memo_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace memo_cache {

// Ordering bookkeeping for one store. Policies see entry ids only; the store
// owns keys and values. Every hook is O(1) amortized.
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual Algorithm algorithm() const = 0;
  virtual void on_insert(std::uint64_t id) = 0;
  virtual void on_access(std::uint64_t id) = 0;
  virtual void on_erase(std::uint64_t id) = 0;
  virtual std::optional<std::uint64_t> pick_victim() const = 0;
  virtual std::size_t size() const = 0;
  virtual void clear() = 0;
};

std::unique_ptr<IEvictionPolicy> make_policy(Algorithm algorithm);
// Throws ConfigurationError for an unknown name.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace memo_cache
