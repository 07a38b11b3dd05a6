#include "FakeConsole.hpp"
#include "SessionConsole.hpp"
#include "TestHeaders.hpp"

using namespace pt;

namespace {
const char PREFIX = 0x1d;

struct ConsoleFixture {
  ConsoleFixture()
      : console(new FakeConsole()),
        host(new PtyViewHost(console)),
        registry(new SessionRegistry()) {
    vector<SessionConfig> configs;
    SessionConfig editor;
    editor.name = "editor";
    editor.launchSpec = "cat";
    editor.viewTag = "permterm://editor";
    configs.push_back(editor);
    SessionConfig monitor;
    monitor.name = "monitor";
    monitor.launchSpec = "sleep 30";
    monitor.viewTag = "permterm://monitor";
    configs.push_back(monitor);
    registry->registerSessions(configs);
    controller.reset(new SessionController(registry, host));
    sessionConsole.reset(
        new SessionConsole(console, host, controller, PREFIX));
  }

  ~ConsoleFixture() { host->shutdown(); }

  shared_ptr<FakeConsole> console;
  shared_ptr<PtyViewHost> host;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<SessionController> controller;
  shared_ptr<SessionConsole> sessionConsole;
};
}  // namespace

TEST_CASE("The menu lists sessions in name order", "[SessionConsole]") {
  ConsoleFixture f;
  string menu = f.sessionConsole->renderMenu();
  REQUIRE(menu.find("1) editor  [idle]  cat") != string::npos);
  REQUIRE(menu.find("2) monitor  [idle]  sleep 30") != string::npos);
  REQUIRE(menu.find("Ctrl-]") != string::npos);
}

TEST_CASE("Menu digits toggle sessions", "[SessionConsole]") {
  ConsoleFixture f;
  f.sessionConsole->handleInput("2");
  REQUIRE(f.controller->getState("monitor") == SessionState::RUNNING_VISIBLE);
  REQUIRE(f.host->isInputFocused());

  // Keys now belong to the session
  f.sessionConsole->handleInput("1q");
  REQUIRE(f.controller->getState("editor") == SessionState::IDLE);
  REQUIRE_FALSE(f.sessionConsole->isShuttingDown());

  f.sessionConsole->handleInput(string(1, PREFIX) + "1");
  REQUIRE(f.controller->getState("editor") == SessionState::RUNNING_VISIBLE);
  REQUIRE(f.controller->getState("monitor") == SessionState::RUNNING_HIDDEN);

  f.sessionConsole->handleInput(string(1, PREFIX) + "d");
  REQUIRE(f.controller->getState("editor") == SessionState::RUNNING_HIDDEN);
  REQUIRE_FALSE(f.host->getForegroundWindow());

  string menu = f.sessionConsole->renderMenu();
  REQUIRE(menu.find("editor  [hidden]") != string::npos);
  REQUIRE(menu.find("monitor  [hidden]") != string::npos);
  REQUIRE(menu.find("Opened new editor terminal") != string::npos);
}

TEST_CASE("Keys reach the visible session", "[SessionConsole]") {
  ConsoleFixture f;
  f.sessionConsole->handleInput("1");
  f.sessionConsole->handleInput("hello\n");
  f.sessionConsole->handleInput(string(2, PREFIX));

  auto editor = f.registry->get("editor");
  auto start = std::chrono::steady_clock::now();
  while (true) {
    REQUIRE(std::chrono::steady_clock::now() - start <
            std::chrono::seconds(10));
    vector<string> lines = f.host->readAllLines(*editor->viewHandle);
    if (count(lines.begin(), lines.end(), "hello") >= 2) {
      break;
    }
    f.host->update(
        RawFdUtils::waitForData(f.host->getViewFds(), 100 * 1000));
  }
  REQUIRE(f.controller->getState("editor") == SessionState::RUNNING_VISIBLE);
}

TEST_CASE("q quits from the menu and after the prefix",
          "[SessionConsole]") {
  {
    ConsoleFixture f;
    f.sessionConsole->handleInput("q");
    REQUIRE(f.sessionConsole->isShuttingDown());
  }
  {
    ConsoleFixture f;
    f.sessionConsole->handleInput("1");
    f.sessionConsole->handleInput(string(1, PREFIX) + "q");
    REQUIRE(f.sessionConsole->isShuttingDown());
  }
}

TEST_CASE("Digits past the last session are ignored", "[SessionConsole]") {
  ConsoleFixture f;
  f.sessionConsole->handleInput("9");
  REQUIRE(f.controller->getState("editor") == SessionState::IDLE);
  REQUIRE(f.controller->getState("monitor") == SessionState::IDLE);
}
