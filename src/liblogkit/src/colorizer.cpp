#include "logkit/colorizer.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace logkit {

bool IsattyTerminalProbe::supportsColor() const {
  if (stream_ == nullptr) return false;
#ifdef _WIN32
  return _isatty(_fileno(stream_)) != 0;
#else
  if (isatty(fileno(stream_)) == 0) return false;
  const char* term = std::getenv("TERM");
  return term == nullptr || std::strcmp(term, "dumb") != 0;
#endif
}

std::shared_ptr<const ITerminalProbe> makeTerminalProbe(
    const std::ostream& stream) {
  if (&stream == &std::cout) {
    return std::make_shared<IsattyTerminalProbe>(stdout);
  }
  if (&stream == &std::cerr || &stream == &std::clog) {
    return std::make_shared<IsattyTerminalProbe>(stderr);
  }
  return std::make_shared<StaticTerminalProbe>(false);
}

Colorizer::Colorizer(std::shared_ptr<const ITerminalProbe> probe,
                     std::optional<bool> forceColor)
    : enabled_(forceColor.has_value() ? *forceColor
                                      : (probe && probe->supportsColor())) {}

std::string Colorizer::colorize(LogLevel level, const std::string& line) const {
  if (!enabled_) return line;
  return colorCode(level) + line + resetCode();
}

const char* Colorizer::colorCode(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return LOGKIT_ANSI_CYAN;
    case LogLevel::LOG_INFO:
      return LOGKIT_ANSI_GREEN;
    case LogLevel::LOG_WARNING:
      return LOGKIT_ANSI_YELLOW;
    case LogLevel::LOG_ERROR:
      return LOGKIT_ANSI_RED;
    case LogLevel::LOG_CRITICAL:
      return LOGKIT_ANSI_BOLD LOGKIT_ANSI_RED;
    default:
      return LOGKIT_ANSI_RESET;
  }
}

}  // namespace logkit
