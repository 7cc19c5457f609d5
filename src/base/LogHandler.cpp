#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tether {
namespace {
string startupStamp() {
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &local);
  return buffer;
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts, not from easylogging's own --v parsing.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name set with el::Helpers::setThreadName.
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

string LogHandler::logFilename(const LogOptions &options, const string &kind) {
  string name = options.filenamePrefix;
  if (!kind.empty()) {
    name += "-" + kind;
  }
  name += "-" + startupStamp();
  if (options.appendPid) {
    name += "_" + to_string(getpid());
  }
  return name + ".log";
}

void LogHandler::applyLogOptions(el::Configurations *defaultConf,
                                 const LogOptions &options) {
  el::Loggers::setVerboseLevel(options.verbosity);

  string logPath =
      createLogFile(options.directory, logFilename(options, string()));
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           options.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           options.logToStdout ? "true" : "false");
  if (options.silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
  el::Loggers::reconfigureLogger("default", *defaultConf);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  if (options.redirectStderrToFile) {
    redirectStderr(
        createLogFile(options.directory, logFilename(options, "stderr")));
  }
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

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + directory +
                             ": " + ec.message());
  }
  string fullPath = (fs::path(directory) / filename).string();
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw std::runtime_error("Cannot create log file " + fullPath + ": " +
                             strerror(errno));
  }
  ::close(fd);
  return fullPath;
}

void LogHandler::redirectStderr(const string &path) {
  FILE *stream = freopen(path.c_str(), "w", stderr);
  if (!stream) {
    STFATAL << "Cannot redirect stderr to " << path;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace tether
