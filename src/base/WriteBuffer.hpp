#ifndef __WT_WRITE_BUFFER__
#define __WT_WRITE_BUFFER__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Pending input for a child process that the input pipe has not
 * accepted yet.
 *
 * Once the buffered size reaches the high-water mark, writers are told to
 * wait for a drain before sending more.
 */
class WriteBuffer {
 public:
  static constexpr size_t DEFAULT_HIGH_WATER_MARK = 16 * 1024;

  explicit WriteBuffer(size_t _highWaterMark = DEFAULT_HIGH_WATER_MARK)
      : highWaterMark(_highWaterMark), totalBytes(0), writeOffset(0) {}

  /**
   * @brief Returns true while the buffered size is under the high-water mark.
   */
  bool canAcceptMore() const { return totalBytes < highWaterMark; }

  bool hasPendingData() const { return !pending.empty(); }

  size_t size() const { return totalBytes; }

  size_t getHighWaterMark() const { return highWaterMark; }

  void enqueue(const string &data) {
    if (data.empty()) return;
    pending.push_back(data);
    totalBytes += data.size();
  }

  /**
   * @brief Returns a pointer to the next bytes to write and the count.
   * @return nullptr if the buffer is empty.
   */
  const char *peekData(size_t *count) const {
    if (pending.empty()) {
      *count = 0;
      return nullptr;
    }
    const string &front = pending.front();
    *count = front.size() - writeOffset;
    return front.data() + writeOffset;
  }

  /**
   * @brief Drops `bytesWritten` bytes from the front after a successful
   * write.
   */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      size_t available = pending.front().size() - writeOffset;
      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  size_t highWaterMark;
  std::deque<string> pending;
  size_t totalBytes;
  // Offset into the front chunk after a partial write
  size_t writeOffset;
};
}  // namespace wt

#endif  // __WT_WRITE_BUFFER__
