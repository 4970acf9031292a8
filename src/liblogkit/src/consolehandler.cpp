#include "logkit/consolehandler.hpp"

#include <utility>

#include "logkit/logformatter.hpp"

logkit::ConsoleHandler::ConsoleHandler(
    std::ostream& stream, std::shared_ptr<const ITerminalProbe> probe,
    std::optional<bool> forceColor)
    : stream_(stream),
      colorizer_(probe ? std::move(probe) : makeTerminalProbe(stream),
                 forceColor) {}

void logkit::ConsoleHandler::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.flush();
}

void logkit::ConsoleHandler::emit(const LogRecord& record) {
  const std::string formattedMsg =
      colorizer_.colorize(record.level, LogFormatter::format(record));

  std::lock_guard lock(mutex_);
  stream_ << formattedMsg << std::endl;
}
