#include <gtest/gtest.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "logkit/errors.hpp"
#include "logkit/logging_setup.hpp"
#include "logkit/loggerregistry.hpp"
#include "logkit/sanitizer.hpp"
#include "logkit/timeformatter.hpp"

namespace fs = std::filesystem;

namespace {

class TempDir {
 public:
  TempDir() {
    path_ = fs::temp_directory_path() /
            ("logkit_setup_" +
             std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  const fs::path& path() const { return path_; }

 private:
  fs::path path_;
};

std::string readFile(const fs::path& path) {
  std::ifstream file(path);
  return std::string((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
}

std::chrono::system_clock::time_point localTime(int year, int month, int day,
                                                int hour) {
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::size_t countLines(const std::string& text) {
  std::size_t lines = 0;
  for (char c : text) {
    if (c == '\n') ++lines;
  }
  return lines;
}

}  // namespace

class ConfigureLoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    options_.consoleStream = &console_;
    options_.terminalProbe = std::make_shared<logkit::StaticTerminalProbe>(true);
  }
  void TearDown() override { logkit::TimeFormatter::resetGlobalFormat(); }

  // Каждому тесту своё имя: реестр логгеров общий для процесса.
  std::string uniqueName(const std::string& base) const {
    return base + "_" +
           ::testing::UnitTest::GetInstance()->current_test_info()->name();
  }

  TempDir dir_;
  std::ostringstream console_;
  logkit::LoggingOptions options_;
};

// INFO-логгер с записью в файл: DEBUG отброшен, INFO в консоли цветной, в файле без цвета
TEST_F(ConfigureLoggingTest, InfoLoggerWritesConsoleAndFile) {
  const std::string name = uniqueName("app");
  const fs::path logDir = dir_.path() / "logs";

  auto logger = logkit::configureLogging(name, logDir.string(),
                                         logkit::LogLevel::LOG_INFO, true, options_);
  logger->debug("hidden");
  logger->info("Server started");
  logger->flush();

  const std::string consoleText = console_.str();
  EXPECT_EQ(countLines(consoleText), 1u);
  EXPECT_EQ(consoleText.rfind(LOGKIT_ANSI_GREEN, 0), 0u);
  EXPECT_NE(consoleText.find("[INFO] " + name + ": Server started"), std::string::npos);
  EXPECT_EQ(consoleText.find("hidden"), std::string::npos);

  const fs::path file = logDir / (name + ".log");
  ASSERT_TRUE(fs::exists(file));
  const std::string fileText = readFile(file);
  EXPECT_EQ(countLines(fileText), 1u);
  EXPECT_NE(fileText.find("[INFO] " + name + ": Server started"), std::string::npos);
  EXPECT_EQ(fileText.find('\033'), std::string::npos);
}

// Повторная настройка не дублирует обработчики
TEST_F(ConfigureLoggingTest, RepeatedSetupKeepsOneHandlerPerKind) {
  const std::string name = uniqueName("twice");
  logkit::configureLogging(name, dir_.path().string(), logkit::LogLevel::LOG_DEBUG,
                           true, options_);
  auto logger = logkit::configureLogging(name, dir_.path().string(),
                                         logkit::LogLevel::LOG_DEBUG, true, options_);

  EXPECT_EQ(logger->handlers().size(), 2u);
  EXPECT_EQ(logger->handlerCount(logkit::HandlerKind::CONSOLE), 1u);
  EXPECT_EQ(logger->handlerCount(logkit::HandlerKind::FILE), 1u);

  logger->info("once");
  logger->flush();
  EXPECT_EQ(countLines(console_.str()), 1u);
  EXPECT_EQ(countLines(readFile(dir_.path() / (name + ".log"))), 1u);
}

TEST_F(ConfigureLoggingTest, ReturnsRegistryLogger) {
  const std::string name = uniqueName("shared");
  auto logger = logkit::configureLogging(name, dir_.path().string(),
                                         logkit::LogLevel::LOG_INFO, false, options_);
  EXPECT_EQ(logger.get(), logkit::getLogger(name).get());
  EXPECT_EQ(logger->getLogLevel(), logkit::LogLevel::LOG_INFO);
}

TEST_F(ConfigureLoggingTest, EmojiStrippedEverywhere) {
  const std::string name = uniqueName("emoji");
  auto logger = logkit::configureLogging(name, dir_.path().string(),
                                         logkit::LogLevel::LOG_DEBUG, true, options_);
  logger->warning("Deploy \xF0\x9F\x9A\x80 cache \xE2\x86\x92 disk");
  logger->flush();

  const std::string fileText = readFile(dir_.path() / (name + ".log"));
  EXPECT_NE(console_.str().find("Deploy  cache --> disk"), std::string::npos);
  EXPECT_NE(fileText.find("Deploy  cache --> disk"), std::string::npos);
  EXPECT_EQ(fileText.find("\xF0\x9F"), std::string::npos);
}

TEST_F(ConfigureLoggingTest, ColorFollowsTerminalAndForceColor) {
  logkit::LoggingOptions plain = options_;
  plain.terminalProbe = std::make_shared<logkit::StaticTerminalProbe>(false);
  auto logger = logkit::configureLogging(uniqueName("plain"), dir_.path().string(),
                                         logkit::LogLevel::LOG_DEBUG, false, plain);
  logger->error("no color");
  EXPECT_EQ(console_.str().find('\033'), std::string::npos);

  console_.str("");
  logkit::LoggerConfig config;
  config.name = uniqueName("forced");
  config.path = dir_.path().string();
  config.forceColor = true;
  logger = logkit::configureLogging(config, plain);
  logger->error("colored");
  EXPECT_EQ(console_.str().rfind(LOGKIT_ANSI_RED, 0), 0u);
}

TEST_F(ConfigureLoggingTest, CreatesNestedDirectory) {
  const fs::path nested = dir_.path() / "a" / "b" / "c";
  logkit::configureLogging(uniqueName("nested"), nested.string(),
                           logkit::LogLevel::LOG_INFO, false, options_);
  EXPECT_TRUE(fs::is_directory(nested));
}

TEST_F(ConfigureLoggingTest, FileInPlaceOfDirectoryThrows) {
  const fs::path blocker = dir_.path() / "not_a_dir";
  std::ofstream(blocker.string()) << "x";

  try {
    logkit::configureLogging(uniqueName("blocked"), blocker.string(),
                             logkit::LogLevel::LOG_INFO, true, options_);
    FAIL() << "DirectoryError expected";
  } catch (const logkit::DirectoryError& e) {
    EXPECT_EQ(e.path(), blocker.string());
  }
}

// Неизвестный уровень: INFO и предупреждение через сам логгер
TEST_F(ConfigureLoggingTest, UnknownLevelFallsBackToInfo) {
  const std::string name = uniqueName("lenient");
  auto logger = logkit::configureLogging(name, dir_.path().string(),
                                         std::string("verbose"), false, options_);
  EXPECT_EQ(logger->getLogLevel(), logkit::LogLevel::LOG_INFO);
  EXPECT_NE(console_.str().find("[WARNING] " + name + ": Unknown log level 'verbose'"),
            std::string::npos);
}

TEST_F(ConfigureLoggingTest, NamedAndNumericLevels) {
  auto named = logkit::configureLogging(uniqueName("named"), dir_.path().string(),
                                        std::string("error"), false, options_);
  EXPECT_EQ(named->getLogLevel(), logkit::LogLevel::LOG_ERROR);

  auto numeric = logkit::configureLogging(uniqueName("numeric"), dir_.path().string(),
                                          30, false, options_);
  EXPECT_EQ(numeric->getLogLevel(), logkit::LogLevel::LOG_WARNING);

  auto odd = logkit::configureLogging(uniqueName("odd"), dir_.path().string(), 25,
                                      false, options_);
  EXPECT_EQ(odd->getLogLevel(), logkit::LogLevel::LOG_INFO);
  EXPECT_NE(console_.str().find("Unknown log level '25'"), std::string::npos);
}

TEST_F(ConfigureLoggingTest, SaveFalseDropsFileHandler) {
  const std::string name = uniqueName("toggle");
  auto logger = logkit::configureLogging(name, dir_.path().string(),
                                         logkit::LogLevel::LOG_INFO, true, options_);
  ASSERT_EQ(logger->handlerCount(logkit::HandlerKind::FILE), 1u);

  logger = logkit::configureLogging(name, dir_.path().string(),
                                    logkit::LogLevel::LOG_INFO, false, options_);
  EXPECT_EQ(logger->handlerCount(logkit::HandlerKind::FILE), 0u);
  EXPECT_EQ(logger->handlerCount(logkit::HandlerKind::CONSOLE), 1u);
}

TEST_F(ConfigureLoggingTest, FileNameIsSanitized) {
  auto logger = logkit::configureLogging("my app/v1", dir_.path().string(),
                                         logkit::LogLevel::LOG_INFO, true, options_);
  logger->info("x");
  logger->flush();
  EXPECT_TRUE(fs::exists(dir_.path() / "my_app_v1.log"));
  EXPECT_EQ(logkit::logFilePath(dir_.path(), ""), dir_.path() / "logger.log");
}

// Ошибочные параметры не портят прежнюю настройку
TEST_F(ConfigureLoggingTest, InvalidBackupCountKeepsPreviousSetup) {
  const std::string name = uniqueName("keep");
  auto logger = logkit::configureLogging(name, dir_.path().string(),
                                         logkit::LogLevel::LOG_WARNING, true, options_);

  logkit::LoggerConfig broken;
  broken.name = name;
  broken.path = dir_.path().string();
  broken.level = logkit::LogLevel::LOG_DEBUG;
  broken.save = false;
  broken.backupCount = 0;
  EXPECT_THROW(logkit::configureLogging(broken, options_), std::invalid_argument);

  EXPECT_EQ(logger->getLogLevel(), logkit::LogLevel::LOG_WARNING);
  EXPECT_EQ(logger->handlerCount(logkit::HandlerKind::FILE), 1u);
}

// Имена, дающие один и тот же файл, пишут через общий обработчик,
// и после полуночи в архиве остаются записи обоих логгеров
TEST_F(ConfigureLoggingTest, CollidingNamesShareOneFile) {
  auto now = std::make_shared<std::chrono::system_clock::time_point>(
      localTime(2026, 6, 10, 12));
  options_.clock = [now]() { return *now; };

  const std::string spaced = uniqueName("shared file");
  const std::string underscored = uniqueName("shared_file");
  ASSERT_EQ(logkit::safeFilename(spaced), logkit::safeFilename(underscored));

  auto first = logkit::configureLogging(spaced, dir_.path().string(),
                                        logkit::LogLevel::LOG_INFO, true, options_);
  auto second = logkit::configureLogging(underscored, dir_.path().string(),
                                         logkit::LogLevel::LOG_INFO, true, options_);

  std::shared_ptr<logkit::IHandler> firstFile;
  std::shared_ptr<logkit::IHandler> secondFile;
  for (const auto& handler : first->handlers()) {
    if (handler->kind() == logkit::HandlerKind::FILE) firstFile = handler;
  }
  for (const auto& handler : second->handlers()) {
    if (handler->kind() == logkit::HandlerKind::FILE) secondFile = handler;
  }
  ASSERT_NE(firstFile, nullptr);
  EXPECT_EQ(firstFile, secondFile);

  first->info("A day1");
  second->info("B day1");
  *now = localTime(2026, 6, 11, 9);
  first->info("A day2");
  second->info("B day2");
  first->flush();

  const fs::path active = dir_.path() / (logkit::safeFilename(spaced) + ".log");
  const std::string archived = readFile(active.string() + ".2026-06-10");
  EXPECT_NE(archived.find("A day1"), std::string::npos);
  EXPECT_NE(archived.find("B day1"), std::string::npos);
  EXPECT_EQ(archived.find("day2"), std::string::npos);

  const std::string current = readFile(active);
  EXPECT_NE(current.find("A day2"), std::string::npos);
  EXPECT_NE(current.find("B day2"), std::string::npos);
  EXPECT_EQ(current.find("day1"), std::string::npos);
}

// Неудачная настройка не меняет общий формат времени
TEST_F(ConfigureLoggingTest, FailedSetupKeepsTimeFormat) {
  logkit::LoggerConfig config;
  config.name = uniqueName("badfile");
  config.path = dir_.path().string();
  config.save = true;
  config.timeFormat = "%H:%M:%S";
  fs::create_directories(dir_.path() / (config.name + ".log"));

  EXPECT_THROW(logkit::configureLogging(config, options_), logkit::LoggingError);
  EXPECT_EQ(logkit::TimeFormatter::getGlobalFormat(),
            logkit::TimeFormatter::kDefaultFormat);
  EXPECT_FALSE(logkit::LoggerRegistry::instance().hasLogger(config.name));

  config.name = uniqueName("goodfile");
  logkit::configureLogging(config, options_);
  EXPECT_EQ(logkit::TimeFormatter::getGlobalFormat(), "%H:%M:%S");
}
