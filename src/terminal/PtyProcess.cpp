#include "PtyProcess.hpp"

#include "RawFdUtils.hpp"

namespace pt {
#define BUF_SIZE (16 * 1024)
#define MAX_BUFFER_LINES (1024)
#define MAX_BUFFER_CHARS (128 * MAX_BUFFER_LINES)
#define MAX_RAW_TAIL (64 * 1024)

PtyProcess::PtyProcess()
    : masterFd(-1),
      childPid(-1),
      run(false),
      partialLine(false),
      bufferLength(0) {}

PtyProcess::~PtyProcess() {
  stop();
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}

void PtyProcess::start(const string& command) {
  if (run) {
    STFATAL << "Tried to start a pty process twice";
  }
  pid_t pid = forkpty(&masterFd, NULL, NULL, NULL);
  switch (pid) {
    case -1:
      FATAL_FAIL(pid);
      break;
    case 0: {
      setenv("PERMTERM_VERSION", PT_VERSION, 1);
      // Give the child the default SIGCHLD/SIGPIPE dispositions regardless
      // of what permterm installed for itself.
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      execl("/bin/sh", "sh", "-c", command.c_str(), NULL);
      // only get here if execl fails
      _exit(127);
    }
    default: {
      // parent
      childPid = pid;
      run = true;
      int flags = fcntl(masterFd, F_GETFL, 0);
      FATAL_FAIL(flags);
      FATAL_FAIL(fcntl(masterFd, F_SETFL, flags | O_NONBLOCK));
      VLOG(1) << "pty opened " << masterFd << " for pid " << childPid;
      break;
    }
  }
}

string PtyProcess::poll() {
  if (!run) {
    return string();
  }
  char b[BUF_SIZE];
  int rc = ::read(masterFd, b, BUF_SIZE);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return string();
    }
    // Linux reports EIO on the master once the child side is gone.
    if (localErrno != EIO) {
      LOG(ERROR) << "Terminal failure on pid " << childPid << ": "
                 << strerror(localErrno);
    }
    markFinished();
    return string();
  }
  if (rc == 0) {
    markFinished();
    return string();
  }

  string newChars(b, rc);
  rawTail.append(newChars);
  if (rawTail.length() > MAX_RAW_TAIL) {
    rawTail.erase(0, rawTail.length() - MAX_RAW_TAIL);
  }
  appendToBuffer(stripControlSequences(newChars));
  VLOG(4) << "Read " << rc << " bytes, buffer lines: " << buffer.size();
  return newChars;
}

void PtyProcess::appendData(const string& data) {
  if (!run) {
    VLOG(1) << "Dropping input for finished pid " << childPid;
    return;
  }
  try {
    RawFdUtils::writeAll(masterFd, &data[0], data.length());
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Cannot write to pid " << childPid << ": " << re.what();
    markFinished();
  }
}

void PtyProcess::updateTerminalSize(int cols, int rows) {
  if (masterFd < 0) {
    return;
  }
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  ioctl(masterFd, TIOCSWINSZ, &tmpwin);
}

void PtyProcess::stop() {
  if (!run) {
    return;
  }
  LOG(INFO) << "Killing pid " << childPid;
  kill(childPid, SIGKILL);
  run = false;
  reap(true);
}

vector<string> PtyProcess::getLines() {
  vector<string> lines(buffer.begin(), buffer.end());
  if (partialLine && !lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  return lines;
}

string PtyProcess::stripControlSequences(const string& raw) {
  string s;
  s.reserve(raw.length());
  for (size_t a = 0; a < raw.length(); a++) {
    unsigned char c = raw[a];
    if (c == 0x1b) {
      if (a + 1 >= raw.length()) {
        break;
      }
      unsigned char next = raw[a + 1];
      if (next == '[') {
        // CSI: parameters then a final byte in 0x40-0x7e
        a += 2;
        while (a < raw.length() &&
               !(raw[a] >= 0x40 && raw[a] <= 0x7e)) {
          a++;
        }
      } else if (next == ']') {
        // OSC: terminated by BEL or ESC backslash
        a += 2;
        while (a < raw.length() && raw[a] != '\a' &&
               !(raw[a] == 0x1b && a + 1 < raw.length() &&
                 raw[a + 1] == '\\')) {
          a++;
        }
        if (a < raw.length() && raw[a] == 0x1b) {
          a++;
        }
      } else if (next == '(' || next == ')') {
        // Character set designation takes one more byte
        a += 2;
      } else {
        a++;
      }
      continue;
    }
    if (c == '\n' || c == '\t' || c >= 0x20) {
      if (c != 0x7f) {
        s.push_back(char(c));
      }
    }
  }
  return s;
}

void PtyProcess::appendToBuffer(const string& text) {
  for (char c : text) {
    if (!partialLine) {
      buffer.push_back(string());
      partialLine = true;
    }
    if (c == '\n') {
      partialLine = false;
      continue;
    }
    buffer.back().push_back(c);
    bufferLength++;
  }

  if (buffer.size() > MAX_BUFFER_LINES) {
    int amountToErase = buffer.size() - MAX_BUFFER_LINES;
    for (auto it = buffer.begin();
         it != buffer.end() && it != (buffer.begin() + amountToErase); it++) {
      bufferLength -= it->length();
    }
    buffer.erase(buffer.begin(), buffer.begin() + amountToErase);
  }
  while (bufferLength > MAX_BUFFER_CHARS && buffer.size() > 1) {
    bufferLength -= buffer.begin()->length();
    buffer.pop_front();
  }
}

void PtyProcess::reap(bool block) {
  if (childPid <= 0) {
    return;
  }
  int status;
  int rc = waitpid(childPid, &status, block ? 0 : WNOHANG);
  if (rc < 0 && GetErrno() != ECHILD) {
    FATAL_FAIL(rc);
  }
  if (rc != 0) {
    VLOG(1) << "Reaped pid " << childPid;
    childPid = -1;
  }
}

void PtyProcess::markFinished() {
  LOG(INFO) << "Terminal session ended for pid " << childPid;
  run = false;
  reap(true);
}
}  // namespace pt
