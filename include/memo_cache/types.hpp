#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace memo_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Largest ttl whose conversion to clock ticks does not overflow.
inline constexpr Duration kMaxTtl =
    std::chrono::duration_cast<Duration>(TimePoint::duration::max());

enum class Algorithm { Lru, Lfu, Fifo };

std::string to_string(Algorithm algorithm);
std::optional<Algorithm> parse_algorithm(const std::string &name);

// Invalid max_size / ttl / algorithm at construction.
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Store or policy bookkeeping disagrees with itself. Programming error.
class InvariantViolation : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace memo_cache
