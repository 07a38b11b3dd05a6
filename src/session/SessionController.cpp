#include "SessionController.hpp"

#include "JsonLib.hpp"

namespace pt {
SessionController::SessionController(shared_ptr<SessionRegistry> _registry,
                                     shared_ptr<ViewHost> _host)
    : registry(_registry), host(_host), layoutManager(_host) {}

void SessionController::toggle(const string& name) {
  auto session = registry->get(name);

  {
    lock_guard<recursive_mutex> guard(session->sessionMutex);
    if (session->windowHandle) {
      if (host->isWindowValid(*session->windowHandle)) {
        LOG(INFO) << "Hiding session " << name;
        closeWindow(*session, false);
        return;
      }
      LOG(INFO) << "Window for " << name << " is already gone";
      session->windowHandle.reset();
      session->savedLayout.reset();
    }
  }

  // Our own lock is released while the others close so two concurrent
  // toggles cannot wait on each other.
  closeOthers(name);
  optional<ViewHandle> existing = findUnclaimedView(name, session->viewTag);

  lock_guard<recursive_mutex> guard(session->sessionMutex);
  if (session->windowHandle && host->isWindowValid(*session->windowHandle)) {
    VLOG(1) << "Session " << name << " was shown while others were closing";
    return;
  }

  optional<LayoutToken> previousLayout = session->savedLayout;
  layoutManager.capture(*session);

  if (session->viewHandle && !host->isViewValid(*session->viewHandle)) {
    LOG(INFO) << "View " << *session->viewHandle << " for " << name
              << " is gone, will relaunch";
    session->viewHandle.reset();
  }

  if (existing && !host->isViewValid(*existing)) {
    existing.reset();
  }
  if (existing) {
    if (!session->viewHandle) {
      LOG(INFO) << "Adopting existing " << *existing << " for " << name;
      session->viewHandle = existing;
      watchProcessExit(*session, *existing);
    } else if (*existing != *session->viewHandle) {
      LOG(WARNING) << "Tag " << session->viewTag << " matched " << *existing
                   << " but " << name << " owns " << *session->viewHandle;
      existing = session->viewHandle;
    }
    showView(*session, *existing);
    host->showMessage("Opened existing " + name + " terminal");
    return;
  }

  if (session->viewHandle) {
    VLOG(1) << "Tag lookup missed, reusing " << *session->viewHandle;
    showView(*session, *session->viewHandle);
    host->showMessage("Opened existing " + name + " terminal");
    return;
  }

  if (!launch(*session)) {
    session->savedLayout = previousLayout;
  }
}

void SessionController::closeOthers(const string& except) {
  registry->forEach([this, &except](SessionRecord& other) {
    if (other.name == except) {
      return;
    }
    lock_guard<recursive_mutex> guard(other.sessionMutex);
    if (other.windowHandle) {
      LOG(INFO) << "Hiding session " << other.name << " to show " << except;
      closeWindow(other, false);
    }
  });
}

void SessionController::handleProcessExit(const string& name,
                                          const ViewHandle& view) {
  auto session = registry->get(name);
  lock_guard<recursive_mutex> guard(session->sessionMutex);
  if (!session->viewHandle || *session->viewHandle != view) {
    VLOG(1) << "Ignoring exit of stale " << view << " for " << name;
    return;
  }

  LOG(INFO) << "Process for session " << name << " exited";
  if (session->windowHandle) {
    closeWindow(*session, true);
  }
  session->exited = true;

  vector<string> lines;
  bool viewValid = host->isViewValid(view);
  if (viewValid) {
    lines = host->readAllLines(view);
  }
  dispatcher.dispatch(*session, lines);

  if (viewValid) {
    host->deleteView(view);
  }
  session->viewHandle.reset();
}

SessionState SessionController::getState(const string& name) const {
  auto session = registry->get(name);
  lock_guard<recursive_mutex> guard(session->sessionMutex);
  return session->getState();
}

string SessionController::toJsonString() const {
  json state = json::array();
  registry->forEach([&state](SessionRecord& session) {
    lock_guard<recursive_mutex> guard(session.sessionMutex);
    json s;
    s["name"] = session.name;
    s["state"] = sessionStateToString(session.getState());
    s["tag"] = session.viewTag;
    s["command"] = session.launchSpec;
    s["exited"] = session.exited;
    state.push_back(s);
  });
  return state.dump();
}

void SessionController::closeWindow(SessionRecord& session,
                                    bool programExited) {
  if (!session.windowHandle) {
    return;
  }
  WindowHandle window = *session.windowHandle;
  session.windowHandle.reset();
  if (!host->isWindowValid(window)) {
    VLOG(1) << window << " for " << session.name << " already closed";
    session.savedLayout.reset();
    session.exited = programExited;
    return;
  }
  host->closeWindow(window);
  layoutManager.restore(session);
  session.exited = programExited;
}

void SessionController::showView(SessionRecord& session,
                                 const ViewHandle& view) {
  WindowHandle window = host->bindWindow(view);
  session.windowHandle = window;
  host->focusInputMode(window);
  LOG(INFO) << "Showing session " << session.name << " in " << window;
}

bool SessionController::launch(SessionRecord& session) {
  string command = session.launchSpec;
  if (session.onBeforeLaunch && !session.launchTransformApplied) {
    try {
      command = session.onBeforeLaunch(command);
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Launch transform for " << session.name
                 << " failed: " << ex.what();
      command.clear();
    } catch (...) {
      LOG(ERROR) << "Launch transform for " << session.name
                 << " threw a non-standard exception";
      command.clear();
    }
  }
  if (trim(command).empty()) {
    LOG(INFO) << "Nothing to launch for " << session.name;
    return false;
  }
  session.launchSpec = command;
  session.launchTransformApplied = true;

  LOG(INFO) << "Launching " << session.name << ": " << command;
  ViewHandle view = host->createProcessView(command);
  host->setViewName(view, session.viewTag);
  host->markUnlisted(view);
  session.viewHandle = view;

  WindowHandle window = host->bindWindow(view);
  session.windowHandle = window;

  watchProcessExit(session, view);
  host->focusInputMode(window);
  host->showMessage("Opened new " + session.name + " terminal");
  return true;
}

void SessionController::watchProcessExit(SessionRecord& session,
                                         const ViewHandle& view) {
  const string name = session.name;
  host->onProcessExit(view,
                      [this, name, view]() { handleProcessExit(name, view); });
}

optional<ViewHandle> SessionController::findUnclaimedView(
    const string& name, const string& viewTag) {
  optional<ViewHandle> found = host->findView(viewTag);
  if (!found) {
    return nullopt;
  }
  bool claimed = false;
  registry->forEach([&name, &found, &claimed](SessionRecord& other) {
    if (other.name == name) {
      return;
    }
    lock_guard<recursive_mutex> guard(other.sessionMutex);
    if (other.viewHandle && *other.viewHandle == *found) {
      claimed = true;
    }
  });
  if (claimed) {
    LOG(INFO) << "Tag " << viewTag << " matched " << *found
              << " which belongs to another session";
    return nullopt;
  }
  return found;
}
}  // namespace pt
