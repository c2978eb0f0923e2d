#include "memo_cache/guard.hpp"

#include <mutex>

namespace memo_cache {
namespace {

class NullGuard final : public IConcurrencyGuard {
public:
  void lock() override {}
  void unlock() override {}
  bool thread_safe() const override { return false; }
};

// Recursive so a computation may call back into the same cache on its own
// thread (memoized recursion) without deadlocking.
class MutexGuard final : public IConcurrencyGuard {
public:
  void lock() override { mutex_.lock(); }
  void unlock() override { mutex_.unlock(); }
  bool thread_safe() const override { return true; }

private:
  std::recursive_mutex mutex_;
};

} // namespace

std::unique_ptr<IConcurrencyGuard> make_guard(bool thread_safe) {
  if (thread_safe)
    return std::make_unique<MutexGuard>();
  return std::make_unique<NullGuard>();
}

} // namespace memo_cache
