#ifndef __PT_SESSION_RECORD__
#define __PT_SESSION_RECORD__

#include "SessionConfig.hpp"
#include "ViewHost.hpp"

namespace pt {
enum class SessionState {
  IDLE,
  RUNNING_HIDDEN,
  RUNNING_VISIBLE,
};

inline string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::IDLE:
      return "idle";
    case SessionState::RUNNING_HIDDEN:
      return "hidden";
    case SessionState::RUNNING_VISIBLE:
      return "visible";
  }
  return "unknown";
}

/**
 * @brief Runtime state of one configured session.
 *
 * Only `SessionController` mutates a record after registration.
 */
struct SessionRecord {
  explicit SessionRecord(const SessionConfig& config)
      : name(config.name),
        launchSpec(config.launchSpec),
        viewTag(config.viewTag),
        exited(false),
        launchTransformApplied(false),
        onExit(config.onExit),
        onBeforeLaunch(config.onBeforeLaunch) {}

  inline SessionState getState() const {
    if (!viewHandle) {
      return SessionState::IDLE;
    }
    if (!windowHandle) {
      return SessionState::RUNNING_HIDDEN;
    }
    return SessionState::RUNNING_VISIBLE;
  }

  const string name;
  string launchSpec;
  const string viewTag;
  optional<ViewHandle> viewHandle;
  optional<WindowHandle> windowHandle;
  optional<LayoutToken> savedLayout;
  /** @brief True when the last close came from the process exiting. */
  bool exited;
  /** @brief Set once `onBeforeLaunch` has been folded into `launchSpec`. */
  bool launchTransformApplied;
  ExitCallback onExit;
  LaunchTransform onBeforeLaunch;
  /** @brief Serializes transitions on this record. */
  recursive_mutex sessionMutex;
};
}  // namespace pt

#endif  // __PT_SESSION_RECORD__
