#include "PtyViewHost.hpp"

#include "JsonLib.hpp"

namespace pt {
struct PtyViewHost::View {
  string id;
  string name;
  bool listed;
  shared_ptr<PtyProcess> process;
  function<void()> exitHandler;
  bool exitReported;
};

PtyViewHost::PtyViewHost(shared_ptr<Console> _console)
    : console(_console),
      nextWindowId(1),
      inputFocused(false),
      alternateScreen(false) {}

PtyViewHost::~PtyViewHost() { shutdown(); }

optional<ViewHandle> PtyViewHost::findView(const string& tagPattern) {
  std::regex pattern;
  bool literal = false;
  try {
    pattern = std::regex(tagPattern);
  } catch (const std::regex_error& re) {
    VLOG(1) << "Tag " << tagPattern << " is not a regex, matching literally";
    literal = true;
  }
  for (auto& it : views) {
    auto view = it.second;
    if (!view->process->isRunning() || view->name.empty()) {
      continue;
    }
    // The whole name has to match so one tag never picks up a longer one.
    bool matched = literal ? view->name == tagPattern
                           : std::regex_match(view->name, pattern);
    if (matched) {
      return ViewHandle({view->id});
    }
  }
  return nullopt;
}

ViewHandle PtyViewHost::createProcessView(const string& command) {
  auto view = shared_ptr<View>(new View());
  view->id = sole::uuid4().str();
  view->listed = true;
  view->exitReported = false;
  view->process.reset(new PtyProcess());
  view->process->start(command);
  ConsoleSize size = console->getSize();
  view->process->updateTerminalSize(size.cols, size.rows);
  views.insert(make_pair(view->id, view));
  LOG(INFO) << "Created view " << view->id << " running " << command;
  return ViewHandle({view->id});
}

WindowHandle PtyViewHost::bindWindow(const ViewHandle& view) {
  auto v = getView(view);
  if (!v) {
    LOG(ERROR) << "Cannot open a window on unknown " << view;
    return WindowHandle({-1});
  }
  WindowHandle window({nextWindowId++});
  windowStack.push_back(make_pair(window, view));
  inputFocused = false;
  if (!alternateScreen) {
    console->write("\x1b[?1049h");
    alternateScreen = true;
  }
  ConsoleSize size = console->getSize();
  v->process->updateTerminalSize(size.cols, size.rows);
  drawForeground();
  VLOG(1) << "Bound " << window << " to " << view;
  return window;
}

void PtyViewHost::closeWindow(const WindowHandle& window) {
  for (auto it = windowStack.begin(); it != windowStack.end(); it++) {
    if (it->first == window) {
      bool wasTop = (it + 1 == windowStack.end());
      windowStack.erase(it);
      VLOG(1) << "Closed " << window;
      if (wasTop) {
        inputFocused = false;
        if (windowStack.empty()) {
          leaveAlternateScreen();
        } else {
          drawForeground();
        }
      }
      return;
    }
  }
  VLOG(1) << "Tried to close unknown " << window;
}

bool PtyViewHost::isWindowValid(const WindowHandle& window) {
  for (const auto& it : windowStack) {
    if (it.first == window) {
      return true;
    }
  }
  return false;
}

bool PtyViewHost::isViewValid(const ViewHandle& view) {
  return views.find(view.id) != views.end();
}

void PtyViewHost::setViewName(const ViewHandle& view, const string& name) {
  auto v = getView(view);
  if (v) {
    v->name = name;
  }
}

void PtyViewHost::markUnlisted(const ViewHandle& view) {
  auto v = getView(view);
  if (v) {
    v->listed = false;
  }
}

void PtyViewHost::focusInputMode(const WindowHandle& window) {
  if (windowStack.empty() || windowStack.back().first != window) {
    VLOG(1) << "Not focusing " << window << ", it is not in front";
    return;
  }
  inputFocused = true;
}

LayoutToken PtyViewHost::captureLayout() {
  ConsoleSize size = console->getSize();
  json layout;
  layout["rows"] = size.rows;
  layout["cols"] = size.cols;
  layout["windows"] = json::array();
  for (const auto& it : windowStack) {
    layout["windows"].push_back(it.first.id);
  }
  return LayoutToken({layout.dump()});
}

void PtyViewHost::applyLayout(const LayoutToken& layout) {
  json state;
  try {
    state = json::parse(layout.state);
  } catch (const json::exception& je) {
    LOG(ERROR) << "Ignoring unreadable layout: " << je.what();
    return;
  }
  int rows = state.value("rows", 0);
  int cols = state.value("cols", 0);
  ConsoleSize current = console->getSize();
  if (rows != current.rows || cols != current.cols) {
    VLOG(1) << "Console resized since layout capture, using current size";
  }
  set<int64_t> savedWindows;
  if (state.count("windows")) {
    for (const auto& id : state["windows"]) {
      savedWindows.insert(id.get<int64_t>());
    }
  }
  for (const auto& it : windowStack) {
    if (savedWindows.find(it.first.id) == savedWindows.end()) {
      LOG(INFO) << it.first << " was opened after the layout was saved";
    }
  }
  if (windowStack.empty()) {
    leaveAlternateScreen();
    return;
  }
  auto v = getView(windowStack.back().second);
  if (v) {
    v->process->updateTerminalSize(current.cols, current.rows);
  }
  drawForeground();
}

vector<string> PtyViewHost::readAllLines(const ViewHandle& view) {
  auto v = getView(view);
  if (!v) {
    return vector<string>();
  }
  return v->process->getLines();
}

void PtyViewHost::deleteView(const ViewHandle& view) {
  auto it = views.find(view.id);
  if (it == views.end()) {
    return;
  }
  bool hadTop = !windowStack.empty() && windowStack.back().second == view;
  windowStack.erase(remove_if(windowStack.begin(), windowStack.end(),
                              [&view](const pair<WindowHandle, ViewHandle>& w) {
                                return w.second == view;
                              }),
                    windowStack.end());
  it->second->process->stop();
  views.erase(it);
  LOG(INFO) << "Deleted " << view;
  if (hadTop) {
    inputFocused = false;
    if (windowStack.empty()) {
      leaveAlternateScreen();
    } else {
      drawForeground();
    }
  }
}

void PtyViewHost::onProcessExit(const ViewHandle& view,
                                function<void()> handler) {
  auto v = getView(view);
  if (!v) {
    LOG(ERROR) << "Cannot watch unknown " << view;
    return;
  }
  v->exitHandler = handler;
}

void PtyViewHost::showMessage(const string& message) {
  LOG(INFO) << message;
  lastMessage = message;
}

vector<int> PtyViewHost::getViewFds() {
  vector<int> fds;
  for (auto& it : views) {
    if (it.second->process->isRunning()) {
      fds.push_back(it.second->process->getFd());
    }
  }
  return fds;
}

void PtyViewHost::update(const set<int>& readyFds) {
  string foregroundId;
  if (!windowStack.empty()) {
    foregroundId = windowStack.back().second.id;
  }

  vector<function<void()>> exitHandlers;
  for (auto& it : views) {
    auto view = it.second;
    if (view->process->isRunning() &&
        readyFds.find(view->process->getFd()) != readyFds.end()) {
      string data = view->process->poll();
      if (!data.empty() && view->id == foregroundId) {
        console->write(data);
      }
    }
    if (!view->process->isRunning() && !view->exitReported) {
      view->exitReported = true;
      if (view->exitHandler) {
        // One-shot
        exitHandlers.push_back(view->exitHandler);
        view->exitHandler = nullptr;
      }
    }
  }

  // Handlers may delete views, so they run once iteration is done.
  for (auto& handler : exitHandlers) {
    handler();
  }
}

void PtyViewHost::writeToForeground(const string& data) {
  if (windowStack.empty() || !inputFocused) {
    VLOG(3) << "No focused window, dropping input";
    return;
  }
  auto v = getView(windowStack.back().second);
  if (v) {
    v->process->appendData(data);
  }
}

void PtyViewHost::refreshSize() {
  if (windowStack.empty()) {
    return;
  }
  auto v = getView(windowStack.back().second);
  if (v) {
    ConsoleSize size = console->getSize();
    VLOG(1) << "Console size changed: " << size.rows << "x" << size.cols;
    v->process->updateTerminalSize(size.cols, size.rows);
  }
}

void PtyViewHost::shutdown() {
  for (auto& it : views) {
    it.second->exitHandler = nullptr;
    it.second->process->stop();
  }
  views.clear();
  windowStack.clear();
  inputFocused = false;
  leaveAlternateScreen();
}

optional<WindowHandle> PtyViewHost::getForegroundWindow() {
  if (windowStack.empty()) {
    return nullopt;
  }
  return windowStack.back().first;
}

vector<string> PtyViewHost::listViews() {
  vector<string> retval;
  for (auto& it : views) {
    if (it.second->listed) {
      retval.push_back(it.second->name.empty() ? it.second->id
                                               : it.second->name);
    }
  }
  return retval;
}

shared_ptr<PtyViewHost::View> PtyViewHost::getView(const ViewHandle& view) {
  auto it = views.find(view.id);
  if (it == views.end()) {
    return shared_ptr<View>();
  }
  return it->second;
}

void PtyViewHost::drawForeground() {
  if (windowStack.empty()) {
    return;
  }
  auto v = getView(windowStack.back().second);
  if (!v) {
    return;
  }
  console->write("\x1b[2J\x1b[H" + v->process->getRawTail());
}

void PtyViewHost::leaveAlternateScreen() {
  if (!alternateScreen) {
    return;
  }
  console->write("\x1b[?1049l");
  alternateScreen = false;
}
}  // namespace pt
