#ifndef __PT_SESSION_CONFIG__
#define __PT_SESSION_CONFIG__

#include "Headers.hpp"

namespace pt {
/** @brief Receives every line a session's process printed once it exits. */
typedef function<void(const vector<string>&)> ExitCallback;
/** @brief Rewrites a launch command right before the first launch. */
typedef function<string(const string&)> LaunchTransform;

/**
 * @brief Setup-time description of one session.
 */
struct SessionConfig {
  string name;
  string launchSpec;
  string viewTag;
  ExitCallback onExit;
  LaunchTransform onBeforeLaunch;
};
}  // namespace pt

#endif  // __PT_SESSION_CONFIG__
