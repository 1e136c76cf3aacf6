#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace sshed {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity is set explicitly from cxxopts, see setVerbosity()
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &path,
                                 const string &filenamePrefix,
                                 bool logToStdout, bool redirectStderrToFile,
                                 bool appendPid, string maxlogsize) {
  char stamp[32];
  time_t now = time(NULL);
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", localtime(&now));
  string suffix = string(stamp);
  if (appendPid) {
    suffix += "_" + std::to_string(getpid());
  }
  string logFilename = filenamePrefix + "-" + suffix + ".log";
  string stderrFilename = filenamePrefix + "-stderr-" + suffix + ".log";
  string logPath = createLogFile(path, logFilename);

  // Size checks run on every write so rollouts honor the configured limit
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path, stderrFilename);
  }
  return logPath;
}

void LogHandler::setupConsoleLogging(el::Configurations *defaultConf,
                                     bool enabled) {
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "false");
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           enabled ? "true" : "false");
  // Errors and warnings reach the user even without --debug
  defaultConf->set(el::Level::Error, el::ConfigurationType::ToStandardOutput,
                   "true");
  defaultConf->set(el::Level::Warning,
                   el::ConfigurationType::ToStandardOutput, "true");
  defaultConf->set(el::Level::Fatal, el::ConfigurationType::ToStandardOutput,
                   "true");
}

void LogHandler::setVerbosity(int level) {
  if (level < 0) {
    level = 0;
  }
  el::Loggers::setVerboseLevel(level);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so nothing may be logged.
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  if (fs::create_directories(path, ec)) {
    fs::permissions(path, fs::perms::owner_all, ec);
  }
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << ec.message();
    exit(1);
  }
  string logPath = (fs::path(path) / filename).string();
  int fd = ::open(logPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  FATAL_FAIL(::close(fd));
  return logPath;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string stderrPath = createLogFile(path, stderrFilename);
  FILE *redirected = freopen(stderrPath.c_str(), "w", stderr);
  if (redirected == NULL) {
    STFATAL << "Could not redirect stderr to " << stderrPath;
  }
  setvbuf(redirected, NULL, _IOLBF, BUFSIZ);
}

}  // namespace sshed
