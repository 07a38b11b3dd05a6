#ifndef __PT_EXIT_CALLBACK_DISPATCHER__
#define __PT_EXIT_CALLBACK_DISPATCHER__

#include "SessionRecord.hpp"

namespace pt {
/**
 * @brief Hands a finished process's output to the session's `onExit`
 * callback.
 */
class ExitCallbackDispatcher {
 public:
  /**
   * @brief Invokes `session.onExit(lines)` if one is set.
   *
   * Failures inside the callback are logged and never propagate.
   * @return false if the callback threw.
   */
  bool dispatch(SessionRecord& session, const vector<string>& lines);
};
}  // namespace pt

#endif  // __PT_EXIT_CALLBACK_DISPATCHER__
