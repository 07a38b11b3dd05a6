#include "LaunchTransforms.hpp"

namespace pt {
namespace {
inline bool isNameChar(char c, bool first) {
  if (c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
    return true;
  }
  return !first && c >= '0' && c <= '9';
}

inline string getEnvOrEmpty(const string& name) {
  const char* value = ::getenv(name.c_str());
  if (value == NULL) {
    VLOG(1) << "Environment variable " << name << " is not set";
    return string();
  }
  return string(value);
}
}  // namespace

string LaunchTransforms::expandEnvironment(const string& command) {
  string result;
  size_t a = 0;
  if (!command.empty() && command[0] == '~' &&
      (command.length() == 1 || command[1] == '/')) {
    result = getEnvOrEmpty("HOME");
    a = 1;
  }
  for (; a < command.length(); a++) {
    char c = command[a];
    if (c == '\\' && a + 1 < command.length() && command[a + 1] == '$') {
      result.push_back('$');
      a++;
      continue;
    }
    if (c != '$' || a + 1 >= command.length()) {
      result.push_back(c);
      continue;
    }
    if (command[a + 1] == '{') {
      auto end = command.find('}', a + 2);
      if (end == string::npos) {
        // Unterminated, keep the text as written
        result.append(command.substr(a));
        break;
      }
      result.append(getEnvOrEmpty(command.substr(a + 2, end - a - 2)));
      a = end;
      continue;
    }
    if (!isNameChar(command[a + 1], true)) {
      result.push_back(c);
      continue;
    }
    size_t end = a + 1;
    while (end < command.length() && isNameChar(command[end], false)) {
      end++;
    }
    result.append(getEnvOrEmpty(command.substr(a + 1, end - a - 1)));
    a = end - 1;
  }
  return result;
}

LaunchTransform LaunchTransforms::environmentExpander() {
  return [](const string& command) { return expandEnvironment(command); };
}

ExitCallback LaunchTransforms::writeLinesToFile(const string& path) {
  return [path](const vector<string>& lines) {
    ofstream out(path, ios::out | ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Cannot open " + path + " for writing");
    }
    out << joinLines(lines);
    out.close();
    if (out.fail()) {
      throw std::runtime_error("Cannot write " + path);
    }
    LOG(INFO) << "Wrote " << lines.size() << " lines to " << path;
  };
}

ExitCallback LaunchTransforms::pipeLinesToCommand(
    shared_ptr<SubprocessUtils> subprocessUtils, const string& command) {
  return [subprocessUtils, command](const vector<string>& lines) {
    int status =
        subprocessUtils->SubprocessFromString(command, joinLines(lines));
    if (status != 0) {
      throw std::runtime_error(command + " exited with status " +
                               to_string(status));
    }
  };
}

ExitCallback LaunchTransforms::chain(const vector<ExitCallback>& callbacks) {
  return [callbacks](const vector<string>& lines) {
    for (const auto& callback : callbacks) {
      callback(lines);
    }
  };
}

string LaunchTransforms::joinLines(const vector<string>& lines) {
  string s;
  for (const auto& line : lines) {
    s.append(line);
    s.push_back('\n');
  }
  return s;
}
}  // namespace pt
