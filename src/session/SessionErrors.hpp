#ifndef __PT_SESSION_ERRORS__
#define __PT_SESSION_ERRORS__

#include "Headers.hpp"

namespace pt {
/** @brief Raised when an operation names a session that was never
 * registered. */
class UnknownSessionError : public std::runtime_error {
 public:
  explicit UnknownSessionError(const string& name)
      : std::runtime_error("Unknown session: " + name), sessionName(name) {}

  const string sessionName;
};

/** @brief Raised at setup when two session configs share a name. */
class DuplicateNameError : public std::runtime_error {
 public:
  explicit DuplicateNameError(const string& name)
      : std::runtime_error("Duplicate session name: " + name),
        sessionName(name) {}

  const string sessionName;
};
}  // namespace pt

#endif  // __PT_SESSION_ERRORS__
