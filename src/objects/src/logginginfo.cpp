#include "logginginfo.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "fxc_invalid_argument_exception.hpp"
#include "fxc_log.hpp"
#include "fxc_vector.hpp"
#include "log-config.hpp"
#include "parseloglevel.hpp"

namespace fxc {

namespace {

constexpr std::size_t kLogQueueSize = 8192;
constexpr std::string_view kLogFileRelativePath = "/log/fxconv.log";

log::sink_ptr CreateConsoleSink(log::level::level_enum level) {
  auto sink = std::make_shared<log::sinks::stderr_color_sink_mt>();
  sink->set_level(level);
  sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  return sink;
}

log::sink_ptr CreateRotatingFileSink(std::string_view dataDir, log::level::level_enum level, int64_t maxFileSize,
                                     int32_t maxNbFiles) {
  log::filename_t fileName(dataDir);
  fileName.append(kLogFileRelativePath);
  auto sink = std::make_shared<log::sinks::rotating_file_sink_mt>(
      std::move(fileName), static_cast<std::size_t>(maxFileSize), static_cast<std::size_t>(maxNbFiles));
  sink->set_level(level);
  return sink;
}

}  // namespace

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir) : _dataDir(dataDir) {
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir,
                         const schema::LogConfig &logConfig)
    : _dataDir(dataDir),
      _maxFileSizeLogFileInBytes(logConfig.maxFileSize),
      _maxNbLogFiles(logConfig.maxNbFiles),
      _logLevelConsolePos(LogPosFromLogStr(logConfig.consoleLevel)),
      _logLevelFilePos(LogPosFromLogStr(logConfig.fileLevel)) {
  if (_maxFileSizeLogFileInBytes <= 0 || _maxNbLogFiles <= 0) {
    throw invalid_argument("Invalid log file rotation settings: max size {} and max number of files {}",
                           _maxFileSizeLogFileInBytes, _maxNbLogFiles);
  }
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(LoggingInfo &&rhs) noexcept
    : _dataDir(rhs._dataDir),
      _maxFileSizeLogFileInBytes(rhs._maxFileSizeLogFileInBytes),
      _maxNbLogFiles(rhs._maxNbLogFiles),
      _logLevelConsolePos(rhs._logLevelConsolePos),
      _logLevelFilePos(rhs._logLevelFilePos),
      _destroyOutputLogger(std::exchange(rhs._destroyOutputLogger, false)) {}

LoggingInfo &LoggingInfo::operator=(LoggingInfo &&rhs) noexcept {
  if (&rhs != this) {
    swap(rhs);
  }
  return *this;
}

LoggingInfo::~LoggingInfo() {
  if (_destroyOutputLogger) {
    log::drop(kOutputLoggerName);
  }
}

void LoggingInfo::createLoggers() {
  vector<log::sink_ptr> sinks;

  if (_logLevelConsolePos != 0) {
    sinks.push_back(CreateConsoleSink(LevelFromPos(_logLevelConsolePos)));
  }
  if (_logLevelFilePos != 0) {
    sinks.push_back(CreateRotatingFileSink(_dataDir, LevelFromPos(_logLevelFilePos), _maxFileSizeLogFileInBytes,
                                           _maxNbLogFiles));
  }

  // one worker thread so that conversion output and log lines stay ordered
  log::init_thread_pool(kLogQueueSize, 1);

  if (sinks.empty()) {
    log::set_level(log::level::off);
  } else {
    auto logger = std::make_shared<log::async_logger>("", sinks.begin(), sinks.end(), log::thread_pool(),
                                                      log::async_overflow_policy::block);
    logger->set_level(LevelFromPos(std::max(_logLevelConsolePos, _logLevelFilePos)));
    log::set_default_logger(std::move(logger));
  }

  createOutputLogger();
}

void LoggingInfo::swap(LoggingInfo &rhs) noexcept {
  using std::swap;

  swap(_dataDir, rhs._dataDir);
  swap(_maxFileSizeLogFileInBytes, rhs._maxFileSizeLogFileInBytes);
  swap(_maxNbLogFiles, rhs._maxNbLogFiles);
  swap(_logLevelConsolePos, rhs._logLevelConsolePos);
  swap(_logLevelFilePos, rhs._logLevelFilePos);
  swap(_destroyOutputLogger, rhs._destroyOutputLogger);
}

void LoggingInfo::createOutputLogger() {
  // replaces the output logger of a LoggingInfo that is not destroyed yet
  log::drop(kOutputLoggerName);

  auto outputSink = std::make_shared<log::sinks::stdout_sink_mt>();
  auto outputLogger = std::make_shared<log::async_logger>(kOutputLoggerName, std::move(outputSink), log::thread_pool(),
                                                          log::async_overflow_policy::block);
  outputLogger->set_level(log::level::info);
  outputLogger->set_pattern("%v");

  log::register_logger(std::move(outputLogger));
  _destroyOutputLogger = true;
}

}  // namespace fxc
