#ifndef __PT_CONSOLE_HPP__
#define __PT_CONSOLE_HPP__

#include "Headers.hpp"
#include "RawFdUtils.hpp"

namespace pt {
/** @brief Size of the local console in character cells. */
struct ConsoleSize {
  int rows;
  int cols;

  bool operator==(const ConsoleSize& other) const {
    return rows == other.rows && cols == other.cols;
  }
  bool operator!=(const ConsoleSize& other) const { return !(*this == other); }
};

/**
 * @brief Abstract local console that session windows are drawn on.
 */
class Console {
 public:
  virtual ~Console() {}

  virtual ConsoleSize getSize() = 0;
  /** @brief Prepares the console before permterm takes it over. */
  virtual void setup() = 0;
  /** @brief Restores the console state before permterm exits. */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives output. */
  virtual int getFd() = 0;
  /** @brief Descriptor that keystrokes are read from. */
  virtual int getInputFd() = 0;

  virtual void write(const string& s) {
    RawFdUtils::writeAll(getFd(), &s[0], s.length());
  }
};
}  // namespace pt

#endif
