#ifndef __PT_SESSION_CONSOLE__
#define __PT_SESSION_CONSOLE__

#include "Console.hpp"
#include "PtyViewHost.hpp"
#include "SessionController.hpp"

namespace pt {
/**
 * @brief Interactive loop of the `permterm` binary.
 *
 * With no session on screen a menu lists the sessions: `1`-`9` toggle one,
 * `q` quits. Inside a session every key goes to its process except the
 * prefix key, which is followed by a digit (toggle that session), `d` (hide
 * the current session), `q` (quit) or the prefix key again (send it
 * through).
 */
class SessionConsole {
 public:
  SessionConsole(shared_ptr<Console> _console, shared_ptr<PtyViewHost> _host,
                 shared_ptr<SessionController> _controller, char _prefixKey);

  /** @brief Runs until the user quits. */
  void run();
  /** @brief Handles keystrokes read from the console. */
  void handleInput(const string& input);
  /** @brief Text of the session menu, ready to write to a raw tty. */
  string renderMenu();

  void shutdown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    shuttingDown = true;
  }
  bool isShuttingDown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    return shuttingDown;
  }

 protected:
  shared_ptr<Console> console;
  shared_ptr<PtyViewHost> host;
  shared_ptr<SessionController> controller;
  char prefixKey;
  bool prefixPending;
  bool menuVisible;
  string lastMenu;
  bool shuttingDown;
  recursive_mutex shutdownMutex;

  void handlePrefixCommand(char c);
  void toggleIndex(int index);
  void hideCurrent();
  /** @brief Redraws the menu when no session window is on screen and it
   * changed. */
  void refreshMenu(bool force);
  static string describeKey(char key);
};
}  // namespace pt

#endif  // __PT_SESSION_CONSOLE__
