#pragma once

#include "memo_cache/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace memo_cache {

struct MemoConfig {
  std::optional<Duration> ttl;           // unset: entries never expire
  std::optional<std::int64_t> max_size;  // unset: unbounded
  std::string algorithm{"lru"};          // lru | lfu | fifo
  bool thread_safe{true};
};

// Throws ConfigurationError on max_size <= 0, ttl <= 0, ttl > kMaxTtl or an unknown
// algorithm. Returns the parsed algorithm.
Algorithm validate_config(const MemoConfig &cfg);

// Reads {"ttl_ms":..,"max_size":..,"algorithm":"..","thread_safe":..}.
// Missing fields keep the value already in cfg. On any error cfg is left
// untouched and false is returned with the reason in err.
bool parse_config_json(const std::string &text, MemoConfig &cfg,
                       std::string *err = nullptr);
bool load_config_file(const std::string &path, MemoConfig &cfg,
                      std::string *err = nullptr);

} // namespace memo_cache
