#include "memo_cache/stats.hpp"

#include <sstream>

namespace memo_cache {

void StatisticsRecorder::reset() {
  hits_ = 0;
  misses_ = 0;
  evictions_ = 0;
  bypasses_.store(0, std::memory_order_relaxed);
}

CacheInfo StatisticsRecorder::snapshot(std::size_t current_size,
                                       std::uint64_t expirations) const {
  CacheInfo info;
  info.hits = hits_;
  info.misses = misses_;
  info.current_size = current_size;
  info.max_size = max_size_;
  info.algorithm = algorithm_;
  info.ttl = ttl_;
  info.thread_safe = thread_safe_;
  info.evictions = evictions_;
  info.expirations = expirations;
  info.bypasses = bypasses_.load(std::memory_order_relaxed);
  return info;
}

std::string format_info(const CacheInfo &info) {
  std::ostringstream os;
  os << "hits:" << info.hits << "\n";
  os << "misses:" << info.misses << "\n";
  os << "current_size:" << info.current_size << "\n";
  os << "max_size:";
  if (info.max_size)
    os << *info.max_size;
  else
    os << "none";
  os << "\n";
  os << "algorithm:" << to_string(info.algorithm) << "\n";
  os << "ttl_ms:";
  if (info.ttl)
    os << info.ttl->count();
  else
    os << "none";
  os << "\n";
  os << "thread_safe:" << (info.thread_safe ? 1 : 0) << "\n";
  os << "evictions:" << info.evictions << "\n";
  os << "expirations:" << info.expirations << "\n";
  os << "bypasses:" << info.bypasses << "\n";
  return os.str();
}

} // namespace memo_cache
