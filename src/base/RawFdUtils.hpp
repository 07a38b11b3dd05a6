#ifndef __PT_RAW_FD_UTILS__
#define __PT_RAW_FD_UTILS__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Simple blocking wrappers around POSIX read/write loops on ptys and
 * the local console.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutUs` for any of `fds` to become readable.
   * @return The subset of `fds` with data (or EOF) pending.
   */
  static set<int> waitForData(const vector<int>& fds, int64_t timeoutUs);
};
}  // namespace pt
#endif  // __PT_RAW_FD_UTILS__
