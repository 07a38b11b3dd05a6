#ifndef __PT_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __PT_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"

namespace pt {
/**
 * @brief Puts the controlling tty into raw mode and reports its size.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : isSetup(false) {
    termios terminal_local;
    tcgetattr(STDIN_FILENO, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
  }

  virtual ~PseudoTerminalConsole() {}

  virtual void setup() {
    termios terminal_local;
    tcgetattr(STDIN_FILENO, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local);
    isSetup = true;
  }

  virtual void teardown() {
    if (!isSetup) {
      return;
    }
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
    isSetup = false;
  }

  virtual ConsoleSize getSize() {
    winsize win;
    ConsoleSize size;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) < 0 || win.ws_row == 0) {
      size.rows = 24;
      size.cols = 80;
      return size;
    }
    size.rows = win.ws_row;
    size.cols = win.ws_col;
    return size;
  }

  virtual int getFd() { return STDOUT_FILENO; }

  virtual int getInputFd() { return STDIN_FILENO; }

 protected:
  /** @brief Backup of the terminal's `termios` state for teardown. */
  termios terminal_backup;
  bool isSetup;
};
}  // namespace pt

#endif
