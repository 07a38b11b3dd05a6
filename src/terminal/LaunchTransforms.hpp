#ifndef __PT_LAUNCH_TRANSFORMS__
#define __PT_LAUNCH_TRANSFORMS__

#include "SessionConfig.hpp"
#include "SubprocessUtils.hpp"

namespace pt {
/**
 * @brief Ready-made `onBeforeLaunch` transforms and `onExit` callbacks for
 * sessions defined in the config file.
 */
class LaunchTransforms {
 public:
  /**
   * @brief Expands `$VAR`, `${VAR}` and a leading `~` from the environment.
   *
   * Unset variables expand to nothing; `\$` stays a literal dollar sign.
   */
  static string expandEnvironment(const string& command);

  static LaunchTransform environmentExpander();

  /** @brief Writes the captured lines to `path`, one per line. */
  static ExitCallback writeLinesToFile(const string& path);

  /** @brief Pipes the captured lines into `command` through the shell. */
  static ExitCallback pipeLinesToCommand(
      shared_ptr<SubprocessUtils> subprocessUtils, const string& command);

  /** @brief Runs each callback in order; the first failure stops the rest. */
  static ExitCallback chain(const vector<ExitCallback>& callbacks);

  static string joinLines(const vector<string>& lines);
};
}  // namespace pt

#endif  // __PT_LAUNCH_TRANSFORMS__
