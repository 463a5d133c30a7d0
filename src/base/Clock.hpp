#ifndef __WT_CLOCK__
#define __WT_CLOCK__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Monotonic millisecond time source used by the event loop and the
 * output relay.
 */
class Clock {
 public:
  virtual ~Clock() {}

  /** @brief Milliseconds since an arbitrary, fixed epoch. */
  virtual int64_t nowMs() = 0;
};

/**
 * @brief Production clock backed by `std::chrono::steady_clock`.
 */
class SteadyClock : public Clock {
 public:
  virtual ~SteadyClock() {}

  virtual int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }
};
}  // namespace wt

#endif  // __WT_CLOCK__
