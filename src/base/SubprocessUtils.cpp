#include "SubprocessUtils.hpp"

namespace pt {
int SubprocessUtils::SubprocessFromString(const string& command,
                                          const string& input) {
  FILE* pipe = popen(command.c_str(), "w");
  if (!pipe) {
    throw std::runtime_error("popen() failed for: " + command);
  }
  size_t written = fwrite(input.data(), 1, input.size(), pipe);
  int status = pclose(pipe);
  if (written != input.size()) {
    throw std::runtime_error("Short write to: " + command);
  }
  if (status == -1) {
    throw std::runtime_error("pclose() failed for: " + command);
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return status;
}
}  // namespace pt
