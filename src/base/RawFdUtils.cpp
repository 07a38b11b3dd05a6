#include "RawFdUtils.hpp"

namespace pt {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::microseconds(10 * 1000));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error("Cannot write to fd");
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

set<int> RawFdUtils::waitForData(const vector<int>& fds, int64_t timeoutUs) {
  fd_set rfd;
  timeval tv;

  FD_ZERO(&rfd);
  int maxfd = -1;
  for (int fd : fds) {
    if (fd < 0) {
      continue;
    }
    FD_SET(fd, &rfd);
    maxfd = max(maxfd, fd);
  }
  tv.tv_sec = timeoutUs / 1000000;
  tv.tv_usec = timeoutUs % 1000000;
  int rc = select(maxfd + 1, &rfd, NULL, NULL, &tv);
  set<int> ready;
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      FATAL_FAIL(rc);
    }
    return ready;
  }
  for (int fd : fds) {
    if (fd >= 0 && FD_ISSET(fd, &rfd)) {
      ready.insert(fd);
    }
  }
  return ready;
}
}  // namespace pt
