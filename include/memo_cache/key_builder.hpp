#pragma once

#include "memo_cache/arg.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace memo_cache {

// Identity of one call signature. Hashable keys carry a precomputed hash and
// are found through a hash index; structural keys have no hash and are found
// by comparing against every other structural key.
class CacheKey {
public:
  enum class Form { Hashable, Structural };

  static CacheKey hashable(std::size_t hash, Args positional, KwArgs keywords);
  static CacheKey structural(Args positional, KwArgs keywords);

  Form form() const { return form_; }
  bool is_hashable() const { return form_ == Form::Hashable; }
  std::size_t hash() const { return hash_; }
  const Args &positional() const { return positional_; }
  const KwArgs &keywords() const { return keywords_; }

  bool operator==(const CacheKey &other) const;
  std::string repr() const;

private:
  CacheKey(Form form, std::size_t hash, Args positional, KwArgs keywords)
      : form_(form), hash_(hash), positional_(std::move(positional)),
        keywords_(std::move(keywords)) {}

  Form form_;
  std::size_t hash_;
  Args positional_;
  KwArgs keywords_;
};

class KeyBuilder {
public:
  // Keyword arguments are sorted by name first. Returns nullopt (reason in
  // err) when an argument is neither hashable nor comparable, or a keyword
  // name repeats; callers treat that as "do not cache this call".
  std::optional<CacheKey> build(const Args &positional, const KwArgs &keywords,
                                std::string *err = nullptr) const;
};

} // namespace memo_cache
