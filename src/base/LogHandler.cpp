#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace pt {
namespace {
const char *LOG_FORMAT = "[%level %datetime %thread %fbase:%line] %msg";
const char *VERBOSE_LOG_FORMAT =
    "[%levshort%vlevel %datetime %thread %fbase:%line] %msg";

// <prefix>[-<kind>]-YYYY-mm-dd_HH-MM-SS_<pid>.log
string logFileName(const string &prefix, const string &kind) {
  time_t now = time(NULL);
  char stamp[32];
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", localtime(&now));
  string name = prefix;
  if (!kind.empty()) {
    name += "-" + kind;
  }
  return name + "-" + stamp + "_" + to_string(getpid()) + ".log";
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::Format, LOG_FORMAT);
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           VERBOSE_LOG_FORMAT);
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // The tty belongs to the session views.
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  return conf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, bool redirectStderrToFile,
                               string maxlogsize) {
  string logFile = createLogFile(path, logFileName(filenamePrefix, ""));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::Filename, logFile);
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    // Children of the ptys inherit their own stderr, so this only catches
    // permterm's and its libraries' own output.
    stderrToFile(path, logFileName(filenamePrefix, "stderr"));
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed while this runs, so no logging here.
  ::remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << ec.message() << endl;
    exit(1);
  }
  string fullPath = (fs::path(path) / filename).string();
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullPath = createLogFile(path, stderrFilename);
  FILE *stream = freopen(fullPath.c_str(), "w", stderr);
  if (!stream) {
    STFATAL << "Cannot redirect stderr to " << fullPath;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace pt
