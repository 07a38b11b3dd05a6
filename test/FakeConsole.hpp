#ifndef __PT_FAKE_CONSOLE_HPP__
#define __PT_FAKE_CONSOLE_HPP__

#include "Console.hpp"

namespace pt {
/**
 * @brief Console that keeps everything written to it in memory.
 */
class FakeConsole : public Console {
 public:
  FakeConsole() : didSetup(false), didTeardown(false) {
    size.rows = 30;
    size.cols = 100;
  }

  virtual ~FakeConsole() {}

  virtual ConsoleSize getSize() { return size; }
  virtual void setup() { didSetup = true; }
  virtual void teardown() { didTeardown = true; }
  virtual int getFd() { return -1; }
  virtual int getInputFd() { return -1; }
  virtual void write(const string& s) { output.append(s); }

  ConsoleSize size;
  string output;
  bool didSetup;
  bool didTeardown;
};
}  // namespace pt

#endif  // __PT_FAKE_CONSOLE_HPP__
