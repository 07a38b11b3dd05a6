#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PseudoTerminalConsole.hpp"
#include "PtyViewHost.hpp"
#include "SessionConfigParser.hpp"
#include "SessionConsole.hpp"
#include "SessionController.hpp"

using namespace pt;

namespace {
string defaultConfigFile() {
  return sago::getConfigHome() + "/permterm/permterm.ini";
}

int listSessions(const vector<SessionConfig>& sessions) {
  auto registry = make_shared<SessionRegistry>();
  registry->registerSessions(sessions);
  // No host is needed to describe idle sessions.
  SessionController controller(registry, shared_ptr<ViewHost>());
  CLOG(INFO, "stdout") << controller.toJsonString() << endl;
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  pt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, pt::InterruptSignalHandler);
  // Exit sinks write into pipes that may close early
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("permterm",
                           "Named terminal sessions that survive hiding");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(
             defaultConfigFile()))  //
        ("session", "Add a session, as name=command",
         cxxopts::value<std::vector<std::string>>())  //
        ("list", "Print the configured sessions as JSON and exit")  //
        ("prefix", "Prefix key inside a session (C-x, ^x or a character)",
         cxxopts::value<std::string>())  //
        ("logtostdout", "log to stdout")  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(
             GetTempDirectory() + "permterm"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "permterm version " << PT_VERSION << endl;
      exit(0);
    }

    auto subprocessUtils = make_shared<SubprocessUtils>();
    SessionConfigParser parser(subprocessUtils);
    PermTermConfig config;

    string cfgfilename = result["cfgfile"].as<string>();
    if (fs::exists(cfgfilename)) {
      try {
        config = parser.loadFile(cfgfilename);
      } catch (const std::runtime_error& re) {
        CLOG(INFO, "stdout") << re.what() << endl;
        exit(1);
      }
    } else if (result.count("cfgfile")) {
      CLOG(INFO, "stdout") << "Config file not found: " << cfgfilename << endl;
      exit(1);
    }

    if (result.count("session")) {
      for (const auto& flag : result["session"].as<vector<string>>()) {
        config.sessions.push_back(parser.parseSessionFlag(flag));
      }
    }
    if (result.count("prefix")) {
      config.prefixKey =
          SessionConfigParser::parsePrefixKey(result["prefix"].as<string>());
    }

    // read verbose level (prioritize command line option over cfgfile)
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else if (config.verbose) {
      el::Loggers::setVerboseLevel(*config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    if (result.count("list")) {
      return listSessions(config.sessions);
    }

    if (config.sessions.empty()) {
      CLOG(INFO, "stdout") << "No sessions configured. Add [session:<name>] "
                              "sections to "
                           << cfgfilename << " or pass --session name=command"
                           << endl;
      exit(1);
    }
    if (!isatty(STDIN_FILENO)) {
      CLOG(INFO, "stdout") << "permterm needs an interactive terminal" << endl;
      exit(1);
    }

    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "permterm", result.count("logtostdout") > 0,
                              true, config.maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("permterm-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    auto registry = make_shared<SessionRegistry>();
    try {
      registry->registerSessions(config.sessions);
    } catch (const DuplicateNameError& dne) {
      CLOG(INFO, "stdout") << dne.what() << endl;
      exit(1);
    }

    shared_ptr<Console> console(new PseudoTerminalConsole());
    auto host = make_shared<PtyViewHost>(console);
    auto controller = make_shared<SessionController>(registry, host);
    SessionConsole sessionConsole(console, host, controller, config.prefixKey);
    LOG(INFO) << "Starting permterm with " << registry->size() << " sessions";
    sessionConsole.run();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
