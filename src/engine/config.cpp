#include "memo_cache/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>

namespace memo_cache {
namespace {
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::int64_t>(std::stoll(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
} // namespace

std::string to_string(Algorithm algorithm) {
  switch (algorithm) {
  case Algorithm::Lru:
    return "lru";
  case Algorithm::Lfu:
    return "lfu";
  case Algorithm::Fifo:
    return "fifo";
  }
  return "lru";
}

std::optional<Algorithm> parse_algorithm(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "lru")
    return Algorithm::Lru;
  if (lower == "lfu")
    return Algorithm::Lfu;
  if (lower == "fifo")
    return Algorithm::Fifo;
  return std::nullopt;
}

Algorithm validate_config(const MemoConfig &cfg) {
  if (cfg.max_size && *cfg.max_size <= 0)
    throw ConfigurationError("max_size must be a positive integer, got " +
                             std::to_string(*cfg.max_size));
  if (cfg.ttl && cfg.ttl->count() <= 0)
    throw ConfigurationError("ttl must be a positive duration, got " +
                             std::to_string(cfg.ttl->count()) + "ms");
  if (cfg.ttl && *cfg.ttl > kMaxTtl)
    throw ConfigurationError("ttl exceeds the maximum of " +
                             std::to_string(kMaxTtl.count()) + "ms");
  auto algorithm = parse_algorithm(cfg.algorithm);
  if (!algorithm)
    throw ConfigurationError("unrecognized algorithm '" + cfg.algorithm +
                             "', expected lru, lfu or fifo");
  return *algorithm;
}

bool parse_config_json(const std::string &text, MemoConfig &cfg,
                       std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  MemoConfig next = cfg;
  std::int64_t i = 0;
  std::string s;
  bool b = false;
  try {
    if (extract_i64(text, "ttl_ms", i))
      next.ttl = Duration(i);
    if (extract_i64(text, "max_size", i))
      next.max_size = i;
  } catch (const std::out_of_range &) {
    if (err)
      *err = "numeric field out of range";
    return false;
  }
  if (extract_string(text, "algorithm", s))
    next.algorithm = s;
  if (extract_bool(text, "thread_safe", b))
    next.thread_safe = b;

  try {
    validate_config(next);
  } catch (const ConfigurationError &e) {
    if (err)
      *err = e.what();
    return false;
  }
  cfg = next;
  return true;
}

bool load_config_file(const std::string &path, MemoConfig &cfg,
                      std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    spdlog::warn("memo_cache: config file {} not found", path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  std::string reason;
  if (!parse_config_json(ss.str(), cfg, &reason)) {
    spdlog::warn("memo_cache: rejected config {}: {}", path, reason);
    if (err)
      *err = reason;
    return false;
  }
  return true;
}

} // namespace memo_cache
