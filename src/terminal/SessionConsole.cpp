#include "SessionConsole.hpp"

namespace pt {
#define BUF_SIZE (16 * 1024)

SessionConsole::SessionConsole(shared_ptr<Console> _console,
                               shared_ptr<PtyViewHost> _host,
                               shared_ptr<SessionController> _controller,
                               char _prefixKey)
    : console(_console),
      host(_host),
      controller(_controller),
      prefixKey(_prefixKey),
      prefixPending(false),
      menuVisible(false),
      shuttingDown(false) {}

void SessionConsole::run() {
  console->setup();
  refreshMenu(true);
  ConsoleSize lastSize = console->getSize();
  char b[BUF_SIZE];

  while (!isShuttingDown()) {
    vector<int> fds = host->getViewFds();
    int inputFd = console->getInputFd();
    fds.push_back(inputFd);
    set<int> ready = RawFdUtils::waitForData(fds, 10000);

    try {
      if (ready.find(inputFd) != ready.end()) {
        int rc = ::read(inputFd, b, BUF_SIZE);
        if (rc < 0 && GetErrno() != EAGAIN && GetErrno() != EINTR) {
          FATAL_FAIL(rc);
        }
        if (rc == 0) {
          LOG(INFO) << "Console input closed";
          shutdown();
          break;
        }
        if (rc > 0) {
          VLOG(4) << "Got " << rc << " bytes from the console";
          handleInput(string(b, rc));
        }
      }

      host->update(ready);

      ConsoleSize size = console->getSize();
      if (size != lastSize) {
        lastSize = size;
        host->refreshSize();
        refreshMenu(true);
      } else {
        refreshMenu(false);
      }
    } catch (const runtime_error& re) {
      STERROR << "Error: " << re.what();
      CLOG(INFO, "stdout") << "permterm closing because of error: "
                           << re.what() << endl;
      shutdown();
    }
  }

  host->shutdown();
  console->write("\x1b[2J\x1b[H");
  console->teardown();
  CLOG(INFO, "stdout") << "permterm exited" << endl;
}

void SessionConsole::handleInput(const string& input) {
  string passthrough;
  for (char c : input) {
    if (prefixPending) {
      prefixPending = false;
      if (c == prefixKey && host->getForegroundWindow()) {
        passthrough.push_back(c);
        continue;
      }
      host->writeToForeground(passthrough);
      passthrough.clear();
      handlePrefixCommand(c);
      continue;
    }
    if (c == prefixKey) {
      prefixPending = true;
      continue;
    }
    if (host->getForegroundWindow()) {
      passthrough.push_back(c);
      continue;
    }
    // Menu keys
    if (c >= '1' && c <= '9') {
      toggleIndex(c - '1');
    } else if (c == 'q') {
      shutdown();
      return;
    }
  }
  host->writeToForeground(passthrough);
}

string SessionConsole::renderMenu() {
  string s = "\x1b[2J\x1b[H";
  s += "permterm " + string(PT_VERSION) + "\r\n\r\n";
  auto registry = controller->getRegistry();
  vector<string> names = registry->names();
  for (size_t a = 0; a < names.size(); a++) {
    auto session = registry->get(names[a]);
    string key = a < 9 ? to_string(a + 1) : string(" ");
    s += "  " + key + ") " + names[a] + "  [" +
         sessionStateToString(controller->getState(names[a])) + "]  " +
         session->launchSpec + "\r\n";
  }
  if (names.empty()) {
    s += "  No sessions configured.\r\n";
  }
  vector<string> others = host->listViews();
  if (!others.empty()) {
    s += "\r\n  Other views:";
    for (const auto& it : others) {
      s += " " + it;
    }
    s += "\r\n";
  }
  if (!host->getLastMessage().empty()) {
    s += "\r\n" + host->getLastMessage() + "\r\n";
  }
  s += "\r\nPress 1-9 to toggle a session, q to quit. Inside a session press " +
       describeKey(prefixKey) + " then a number, d to hide or q to quit.\r\n";
  return s;
}

void SessionConsole::handlePrefixCommand(char c) {
  if (c >= '1' && c <= '9') {
    toggleIndex(c - '1');
  } else if (c == 'd') {
    hideCurrent();
  } else if (c == 'q') {
    shutdown();
  } else {
    VLOG(1) << "Unbound prefix command " << int(c);
  }
}

void SessionConsole::toggleIndex(int index) {
  vector<string> names = controller->getRegistry()->names();
  if (index < 0 || index >= int(names.size())) {
    VLOG(1) << "No session at index " << index;
    return;
  }
  controller->toggle(names[index]);
  menuVisible = false;
}

void SessionConsole::hideCurrent() {
  auto registry = controller->getRegistry();
  for (const auto& name : registry->names()) {
    if (controller->getState(name) == SessionState::RUNNING_VISIBLE) {
      controller->toggle(name);
      menuVisible = false;
      return;
    }
  }
}

void SessionConsole::refreshMenu(bool force) {
  if (host->getForegroundWindow()) {
    menuVisible = false;
    return;
  }
  string menu = renderMenu();
  if (menuVisible && !force && menu == lastMenu) {
    return;
  }
  console->write(menu);
  lastMenu = menu;
  menuVisible = true;
}

string SessionConsole::describeKey(char key) {
  if (key > 0 && key < 0x20) {
    return string("Ctrl-") + char(key + '@');
  }
  return string(1, key);
}
}  // namespace pt
