#ifndef __PT_SESSION_CONFIG_PARSER__
#define __PT_SESSION_CONFIG_PARSER__

#include "SessionConfig.hpp"
#include "SimpleIni.h"
#include "SubprocessUtils.hpp"

namespace pt {
/** @brief Default prefix key inside a session window: Ctrl-]. */
const char DEFAULT_PREFIX_KEY = 0x1d;

/**
 * @brief Everything permterm reads from its ini file.
 */
struct PermTermConfig {
  PermTermConfig()
      : silent(false), maxlogsize("20971520"), prefixKey(DEFAULT_PREFIX_KEY) {}

  vector<SessionConfig> sessions;
  optional<int> verbose;
  bool silent;
  string maxlogsize;
  char prefixKey;
};

/**
 * @brief Turns `[session:<name>]` ini sections and `name=command` flags into
 * session configs with their callbacks wired up.
 *
 * Keys per session: `cmd`, `tag`, `expand_env`, `output_file`,
 * `output_command`. Sessions come out in file order.
 */
class SessionConfigParser {
 public:
  explicit SessionConfigParser(shared_ptr<SubprocessUtils> _subprocessUtils)
      : subprocessUtils(_subprocessUtils) {}

  /** @brief Throws `std::runtime_error` when the file cannot be parsed. */
  PermTermConfig loadFile(const string& path);
  PermTermConfig loadString(const string& contents);

  /** @brief Parses a `--session name=command` flag. */
  SessionConfig parseSessionFlag(const string& flag);

  /**
   * @brief Accepts `C-x`, `ctrl-x`, `^x` (control chords) or a single
   * character.
   */
  static char parsePrefixKey(const string& key);

  static string defaultViewTag(const string& name);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;

  PermTermConfig parseIni(CSimpleIniA& ini);
  SessionConfig buildSession(const string& name, const string& command,
                             const string& tag, bool expandEnv,
                             const string& outputFile,
                             const string& outputCommand);
};
}  // namespace pt

#endif  // __PT_SESSION_CONFIG_PARSER__
