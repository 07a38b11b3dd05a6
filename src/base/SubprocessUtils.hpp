#ifndef __PT_SUBPROCESS_UTILS__
#define __PT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Runs shell commands on behalf of session callbacks.
 *
 * Virtual so tests can observe commands without spawning anything.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs `command` through the shell with `input` on its stdin.
   * @return The exit status reported by pclose.
   */
  virtual int SubprocessFromString(const string& command, const string& input);
};
}  // namespace pt

#endif  // __PT_SUBPROCESS_UTILS__
