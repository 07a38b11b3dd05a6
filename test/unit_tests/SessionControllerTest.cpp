#include "FakeViewHost.hpp"
#include "SessionController.hpp"
#include "TestHeaders.hpp"

using namespace pt;

namespace {
SessionConfig makeConfig(const string& name, const string& command) {
  SessionConfig config;
  config.name = name;
  config.launchSpec = command;
  config.viewTag = "permterm://" + name;
  return config;
}

struct ControllerFixture {
  ControllerFixture(const vector<SessionConfig>& configs)
      : registry(new SessionRegistry()), host(new FakeViewHost()) {
    registry->registerSessions(configs);
    controller.reset(new SessionController(registry, host));
  }

  int visibleCount() {
    int count = 0;
    registry->forEach([&count](SessionRecord& session) {
      if (session.windowHandle) {
        count++;
      }
    });
    return count;
  }

  shared_ptr<SessionRegistry> registry;
  shared_ptr<FakeViewHost> host;
  shared_ptr<SessionController> controller;
};
}  // namespace

TEST_CASE("Toggling shows, hides and re-shows the same process",
          "[SessionController]") {
  ControllerFixture f({makeConfig("shell", "bash")});
  auto shell = f.registry->get("shell");

  f.controller->toggle("shell");
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_VISIBLE);
  REQUIRE(f.host->createCount == 1);
  REQUIRE(shell->viewHandle);
  ViewHandle firstView = *shell->viewHandle;
  REQUIRE(f.host->views[firstView.id].command == "bash");
  REQUIRE(f.host->views[firstView.id].name == "permterm://shell");
  REQUIRE_FALSE(f.host->views[firstView.id].listed);
  REQUIRE(f.host->messages.back() == "Opened new shell terminal");

  f.controller->toggle("shell");
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_HIDDEN);
  REQUIRE(*shell->viewHandle == firstView);
  REQUIRE(f.host->appliedLayouts == vector<string>({"layout1"}));
  REQUIRE_FALSE(shell->savedLayout);
  REQUIRE_FALSE(shell->exited);

  f.controller->toggle("shell");
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_VISIBLE);
  REQUIRE(*shell->viewHandle == firstView);
  REQUIRE(f.host->createCount == 1);
  REQUIRE(f.host->messages.back() == "Opened existing shell terminal");
  REQUIRE(f.host->focusedWindows.size() == 2);
}

TEST_CASE("Showing one session hides the others without killing them",
          "[SessionController]") {
  ControllerFixture f({makeConfig("a", "top"), makeConfig("b", "htop")});

  f.controller->toggle("a");
  ViewHandle aView = *f.registry->get("a")->viewHandle;
  f.controller->toggle("b");

  REQUIRE(f.controller->getState("a") == SessionState::RUNNING_HIDDEN);
  REQUIRE(f.controller->getState("b") == SessionState::RUNNING_VISIBLE);
  REQUIRE(*f.registry->get("a")->viewHandle == aView);
  REQUIRE(f.host->deletedViews.empty());
  REQUIRE(f.visibleCount() == 1);
  REQUIRE(f.host->openWindowCount() == 1);

  f.controller->toggle("a");
  REQUIRE(f.controller->getState("a") == SessionState::RUNNING_VISIBLE);
  REQUIRE(f.controller->getState("b") == SessionState::RUNNING_HIDDEN);
  REQUIRE(f.visibleCount() == 1);
  REQUIRE(f.host->createCount == 2);
}

TEST_CASE("At most one session is visible after any toggle",
          "[SessionController]") {
  ControllerFixture f(
      {makeConfig("a", "a"), makeConfig("b", "b"), makeConfig("c", "c")});
  vector<string> sequence = {"a", "b", "b", "c", "a", "a", "a", "c", "b"};
  for (const auto& name : sequence) {
    f.controller->toggle(name);
    REQUIRE(f.visibleCount() <= 1);
    REQUIRE(f.host->openWindowCount() == f.visibleCount());
  }
}

TEST_CASE("Process exit while visible dispatches output and tears down",
          "[SessionController]") {
  vector<vector<string>> received;
  auto config = makeConfig("picker", "fzf");
  config.onExit = [&received](const vector<string>& lines) {
    received.push_back(lines);
  };
  ControllerFixture f({config});
  auto picker = f.registry->get("picker");

  f.controller->toggle("picker");
  ViewHandle view = *picker->viewHandle;
  f.host->simulateExit(view, {"a", "b"});

  REQUIRE(received.size() == 1);
  REQUIRE(received[0] == vector<string>({"a", "b"}));
  REQUIRE(f.controller->getState("picker") == SessionState::IDLE);
  REQUIRE_FALSE(picker->viewHandle);
  REQUIRE_FALSE(picker->windowHandle);
  REQUIRE(picker->exited);
  REQUIRE(f.host->deletedViews == vector<string>({view.id}));
  REQUIRE(f.host->appliedLayouts.size() == 1);
}

TEST_CASE("Process exit while hidden still dispatches once",
          "[SessionController]") {
  int calls = 0;
  auto config = makeConfig("git", "lazygit");
  config.onExit = [&calls](const vector<string>& lines) { calls++; };
  ControllerFixture f({config});

  f.controller->toggle("git");
  f.controller->toggle("git");
  REQUIRE(f.controller->getState("git") == SessionState::RUNNING_HIDDEN);
  size_t layoutsBefore = f.host->appliedLayouts.size();

  ViewHandle view = *f.registry->get("git")->viewHandle;
  f.host->simulateExit(view, {"done"});

  REQUIRE(calls == 1);
  REQUIRE(f.controller->getState("git") == SessionState::IDLE);
  REQUIRE(f.host->appliedLayouts.size() == layoutsBefore);
  REQUIRE_FALSE(f.host->isViewValid(view));
}

TEST_CASE("Hiding by toggle never runs the exit callback",
          "[SessionController]") {
  int calls = 0;
  auto a = makeConfig("a", "a");
  a.onExit = [&calls](const vector<string>& lines) { calls++; };
  ControllerFixture f({a, makeConfig("b", "b")});

  f.controller->toggle("a");
  f.controller->toggle("a");
  f.controller->toggle("a");
  f.controller->toggle("b");
  f.controller->closeOthers("");

  REQUIRE(calls == 0);
  REQUIRE_FALSE(f.registry->get("a")->exited);
  REQUIRE(f.host->deletedViews.empty());
}

TEST_CASE("Empty launch transform aborts without changing the session",
          "[SessionController]") {
  auto config = makeConfig("git", "lazygit");
  config.onBeforeLaunch = [](const string& command) { return string(); };
  ControllerFixture f({config});

  REQUIRE_NOTHROW(f.controller->toggle("git"));
  auto git = f.registry->get("git");
  REQUIRE(f.controller->getState("git") == SessionState::IDLE);
  REQUIRE(f.host->createCount == 0);
  REQUIRE_FALSE(git->savedLayout);
  REQUIRE(git->launchSpec == "lazygit");
  REQUIRE_FALSE(git->launchTransformApplied);
}

TEST_CASE("Aborted launch still leaves other sessions hidden",
          "[SessionController]") {
  auto empty = makeConfig("empty", "");
  ControllerFixture f({makeConfig("shell", "bash"), empty});

  f.controller->toggle("shell");
  f.controller->toggle("empty");

  REQUIRE(f.controller->getState("empty") == SessionState::IDLE);
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_HIDDEN);
}

TEST_CASE("Launch transform runs once, on the first launch",
          "[SessionController]") {
  int calls = 0;
  auto config = makeConfig("shell", "sh");
  config.onBeforeLaunch = [&calls](const string& command) {
    calls++;
    return command + " -l";
  };
  ControllerFixture f({config});
  auto shell = f.registry->get("shell");

  f.controller->toggle("shell");
  REQUIRE(f.host->views[shell->viewHandle->id].command == "sh -l");
  f.host->simulateExit(*shell->viewHandle, {});

  f.controller->toggle("shell");
  REQUIRE(f.host->createCount == 2);
  REQUIRE(f.host->views[shell->viewHandle->id].command == "sh -l");
  REQUIRE(calls == 1);
}

TEST_CASE("Throwing launch transform counts as nothing to launch",
          "[SessionController]") {
  auto config = makeConfig("broken", "cmd");
  config.onBeforeLaunch = [](const string& command) -> string {
    throw std::runtime_error("no such program");
  };
  ControllerFixture f({config});

  REQUIRE_NOTHROW(f.controller->toggle("broken"));
  REQUIRE(f.controller->getState("broken") == SessionState::IDLE);
  REQUIRE(f.host->createCount == 0);
}

TEST_CASE("Throwing exit callback does not block teardown",
          "[SessionController]") {
  auto config = makeConfig("shell", "bash");
  config.onExit = [](const vector<string>& lines) {
    throw std::runtime_error("disk full");
  };
  ControllerFixture f({config});

  f.controller->toggle("shell");
  ViewHandle view = *f.registry->get("shell")->viewHandle;
  REQUIRE_NOTHROW(f.host->simulateExit(view, {"x"}));
  REQUIRE(f.controller->getState("shell") == SessionState::IDLE);
  REQUIRE(f.host->deletedViews == vector<string>({view.id}));
}

TEST_CASE("Unknown sessions are reported to the caller",
          "[SessionController]") {
  ControllerFixture f({makeConfig("shell", "bash")});
  REQUIRE_THROWS_AS(f.controller->toggle("nope"), UnknownSessionError);
  REQUIRE_THROWS_AS(f.controller->getState("nope"), UnknownSessionError);
}

TEST_CASE("Exit of a replaced view is ignored", "[SessionController]") {
  int calls = 0;
  auto config = makeConfig("shell", "bash");
  config.onExit = [&calls](const vector<string>& lines) { calls++; };
  ControllerFixture f({config});
  auto shell = f.registry->get("shell");

  f.controller->toggle("shell");
  ViewHandle oldView = *shell->viewHandle;
  f.host->simulateExit(oldView, {});
  f.controller->toggle("shell");
  ViewHandle newView = *shell->viewHandle;
  REQUIRE(newView != oldView);

  f.controller->handleProcessExit("shell", oldView);
  REQUIRE(calls == 1);
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_VISIBLE);
}

TEST_CASE("A window closed outside the controller counts as hidden",
          "[SessionController]") {
  ControllerFixture f({makeConfig("shell", "bash")});
  auto shell = f.registry->get("shell");

  f.controller->toggle("shell");
  ViewHandle view = *shell->viewHandle;
  f.host->forgetWindow(*shell->windowHandle);

  f.controller->toggle("shell");
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_VISIBLE);
  REQUIRE(*shell->viewHandle == view);
  REQUIRE(f.host->openWindowCount() == 1);
  REQUIRE(f.host->createCount == 1);
}

TEST_CASE("A view deleted outside the controller is relaunched",
          "[SessionController]") {
  ControllerFixture f({makeConfig("shell", "bash")});
  auto shell = f.registry->get("shell");

  f.controller->toggle("shell");
  f.controller->toggle("shell");
  f.host->forgetView(*shell->viewHandle);

  f.controller->toggle("shell");
  REQUIRE(f.host->createCount == 2);
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_VISIBLE);
}

TEST_CASE("A surviving view with the session's tag is adopted",
          "[SessionController]") {
  ControllerFixture f({makeConfig("shell", "bash")});
  ViewHandle orphan = f.host->createProcessView("bash");
  f.host->setViewName(orphan, "permterm://shell");

  f.controller->toggle("shell");
  auto shell = f.registry->get("shell");
  REQUIRE(*shell->viewHandle == orphan);
  REQUIRE(f.host->createCount == 1);
  REQUIRE(f.controller->getState("shell") == SessionState::RUNNING_VISIBLE);
  REQUIRE(f.host->findCalls.back() == "permterm://shell");
}

TEST_CASE("Status snapshot lists every session", "[SessionController]") {
  ControllerFixture f({makeConfig("a", "top"), makeConfig("b", "htop")});
  f.controller->toggle("b");
  string status = f.controller->toJsonString();
  REQUIRE(status.find("\"name\":\"a\"") != string::npos);
  REQUIRE(status.find("\"state\":\"idle\"") != string::npos);
  REQUIRE(status.find("\"state\":\"visible\"") != string::npos);
}

TEST_CASE("A session never takes over a view another session owns",
          "[SessionController]") {
  vector<string> gitLines;
  auto git = makeConfig("git", "lazygit");
  git.onExit = [&gitLines](const vector<string>& lines) { gitLines = lines; };
  ControllerFixture f({git, makeConfig("gitk", "gitk")});
  auto gitSession = f.registry->get("git");
  auto gitkSession = f.registry->get("gitk");

  f.controller->toggle("gitk");
  ViewHandle gitkView = *gitkSession->viewHandle;

  // The fake host matches tags by substring, so permterm://git also finds
  // gitk's view.
  f.controller->toggle("git");
  REQUIRE(f.host->createCount == 2);
  REQUIRE(*gitSession->viewHandle != gitkView);
  REQUIRE(f.host->views[gitSession->viewHandle->id].command == "lazygit");
  REQUIRE(f.controller->getState("gitk") == SessionState::RUNNING_HIDDEN);

  f.host->simulateExit(gitkView, {"gitk"});
  REQUIRE(f.controller->getState("gitk") == SessionState::IDLE);
  REQUIRE(f.controller->getState("git") == SessionState::RUNNING_VISIBLE);
  REQUIRE(gitLines.empty());

  f.host->simulateExit(*gitSession->viewHandle, {"done"});
  REQUIRE(f.controller->getState("git") == SessionState::IDLE);
  REQUIRE(gitLines == vector<string>({"done"}));
}

TEST_CASE("An adopted view reports its exit to the session",
          "[SessionController]") {
  int calls = 0;
  auto config = makeConfig("shell", "bash");
  config.onExit = [&calls](const vector<string>& lines) { calls++; };
  ControllerFixture f({config});
  ViewHandle orphan = f.host->createProcessView("bash");
  f.host->setViewName(orphan, "permterm://shell");

  f.controller->toggle("shell");
  f.host->simulateExit(orphan, {"bye"});
  REQUIRE(calls == 1);
  REQUIRE(f.controller->getState("shell") == SessionState::IDLE);
  REQUIRE(f.host->deletedViews == vector<string>({orphan.id}));
}

TEST_CASE("Callbacks throwing non-standard exceptions are contained",
          "[SessionController]") {
  auto shellConfig = makeConfig("shell", "bash");
  shellConfig.onExit = [](const vector<string>& lines) { throw 42; };
  auto gitConfig = makeConfig("git", "lazygit");
  gitConfig.onBeforeLaunch = [](const string& command) -> string {
    throw "no command";
  };
  ControllerFixture f({shellConfig, gitConfig});
  auto shell = f.registry->get("shell");

  f.controller->toggle("shell");
  ViewHandle view = *shell->viewHandle;
  f.host->simulateExit(view, {"x"});
  REQUIRE(f.controller->getState("shell") == SessionState::IDLE);
  REQUIRE(f.host->deletedViews == vector<string>({view.id}));

  f.controller->toggle("git");
  REQUIRE(f.controller->getState("git") == SessionState::IDLE);
  REQUIRE(f.host->createCount == 1);
}
