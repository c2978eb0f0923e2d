#pragma once

#include <memory>

namespace memo_cache {

// Critical-section strategy, chosen once per cache. Satisfies BasicLockable
// so callers hold it through std::lock_guard.
class IConcurrencyGuard {
public:
  virtual ~IConcurrencyGuard() = default;
  virtual void lock() = 0;
  virtual void unlock() = 0;
  virtual bool thread_safe() const = 0;
};

// thread_safe=false gives a no-op guard: concurrent misses may compute twice
// and concurrent mutation is undefined. thread_safe=true gives one
// re-entrant lock held across lookup, computation and insert.
std::unique_ptr<IConcurrencyGuard> make_guard(bool thread_safe);

} // namespace memo_cache
