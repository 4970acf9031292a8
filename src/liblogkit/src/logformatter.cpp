#include "logkit/logformatter.hpp"

#include <sstream>

#include "logkit/sanitizer.hpp"
#include "logkit/timeformatter.hpp"

namespace logkit {

std::string LogFormatter::format(const LogRecord& record) {
  std::ostringstream formatted;
  formatted << TimeFormatter::format(record.timestamp) << " ["
            << levelToString(record.level) << "] "
            << sanitizeLoggerName(record.loggerName) << ": "
            << sanitizeMessage(record.message);
  return formatted.str();
}

}  // namespace logkit
