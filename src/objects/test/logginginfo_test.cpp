#include "logginginfo.hpp"

#include <gtest/gtest.h>

#include <utility>

#include "fxc_const.hpp"
#include "fxc_invalid_argument_exception.hpp"
#include "fxc_log.hpp"
#include "log-config.hpp"

namespace fxc {
TEST(LoggingInfo, SimpleConstructor) {
  LoggingInfo loggingInfo1(LoggingInfo::WithLoggersCreation::kYes);

  log::info("test1");

  LoggingInfo loggingInfo2(LoggingInfo::WithLoggersCreation::kNo);

  log::info("test2");

  EXPECT_EQ(loggingInfo2.logConsole(), log::level::info);
  EXPECT_EQ(loggingInfo2.logFile(), log::level::off);
}

TEST(LoggingInfo, ConstructorFromLogConfig) {
  schema::LogConfig logConfig;
  logConfig.consoleLevel = "debug";
  logConfig.fileLevel = "0";
  logConfig.maxNbFiles = 3;

  LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes, kDefaultDataDir, logConfig);

  log::debug("test");

  EXPECT_EQ(loggingInfo.logConsole(), log::level::debug);
  EXPECT_EQ(loggingInfo.logFile(), log::level::off);
  EXPECT_EQ(loggingInfo.maxNbLogFiles(), 3);
  EXPECT_EQ(loggingInfo.maxFileSizeLogFileInBytes(), LoggingInfo::kDefaultFileSizeInBytes);
}

TEST(LoggingInfo, InvalidLogConfig) {
  schema::LogConfig logConfig;
  logConfig.consoleLevel = "verbose";

  EXPECT_THROW(LoggingInfo(LoggingInfo::WithLoggersCreation::kNo, kDefaultDataDir, logConfig), invalid_argument);

  logConfig.consoleLevel = "info";
  logConfig.maxFileSize = 0;

  EXPECT_THROW(LoggingInfo(LoggingInfo::WithLoggersCreation::kNo, kDefaultDataDir, logConfig), invalid_argument);
}

TEST(LoggingInfo, OutputLoggerIsRegistered) {
  {
    LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes);

    EXPECT_NE(log::get(LoggingInfo::kOutputLoggerName), nullptr);
  }

  EXPECT_EQ(log::get(LoggingInfo::kOutputLoggerName), nullptr);
}

TEST(LoggingInfo, ReentrantTest) {
  {
    LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes);

    log::info("test1");
  }

  {
    LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes);

    log::info("test2");
  }
}

TEST(LoggingInfo, MoveConstructor) {
  LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes);

  log::info("test1");

  LoggingInfo loggingInfo2(std::move(loggingInfo));

  log::info("test2");
}

TEST(LoggingInfo, MoveAssignment) {
  LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kYes);

  log::info("test1");

  LoggingInfo loggingInfo2;

  loggingInfo2 = std::move(loggingInfo);

  log::info("test2");
}
}  // namespace fxc
