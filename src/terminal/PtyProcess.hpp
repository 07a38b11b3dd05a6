#ifndef __PT_PTY_PROCESS__
#define __PT_PTY_PROCESS__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Runs one command on a pseudo-terminal and buffers what it prints.
 *
 * The buffer keeps the most recent lines (with terminal control sequences
 * removed) for exit callbacks, plus a raw tail that is replayed when a
 * window re-attaches to the process.
 */
class PtyProcess {
 public:
  PtyProcess();
  ~PtyProcess();

  /** @brief Forks `/bin/sh -c command` on a new pty. */
  void start(const string& command);
  /**
   * @brief Reads whatever the pty has ready and returns the raw bytes.
   *
   * When the process has ended, reaps it and flips `isRunning()` to false.
   */
  string poll();
  /** @brief Writes raw bytes (keystrokes) into the process. */
  void appendData(const string& data);
  /** @brief Updates the pty window size using TIOCSWINSZ. */
  void updateTerminalSize(int cols, int rows);
  /** @brief Kills and reaps the process if it is still alive. */
  void stop();

  inline bool isRunning() { return run; }
  inline int getFd() { return masterFd; }
  inline pid_t getPid() { return childPid; }
  inline const string& getRawTail() { return rawTail; }

  /** @brief Every buffered line, including an unterminated last line. */
  vector<string> getLines();

  /** @brief Removes CSI/OSC escape sequences and other control bytes. */
  static string stripControlSequences(const string& raw);

 protected:
  int masterFd;
  pid_t childPid;
  bool run;
  deque<string> buffer;
  /** @brief True while `buffer.back()` is still waiting for its newline. */
  bool partialLine;
  int64_t bufferLength;
  string rawTail;

  void appendToBuffer(const string& text);
  void reap(bool block);
  void markFinished();
};
}  // namespace pt

#endif  // __PT_PTY_PROCESS__
