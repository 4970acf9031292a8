#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>

#include "logkit/colorizer.hpp"
#include "logkit/ihandler.hpp"

namespace logkit {

/**
 * @class ConsoleHandler
 * @brief Пишет отформатированные записи в поток, раскрашивая их по уровню
 *
 * Если probe не передан, он подбирается по потоку через makeTerminalProbe().
 */
class ConsoleHandler : public IHandler {
 public:
  explicit ConsoleHandler(std::ostream& stream = std::cout,
                          std::shared_ptr<const ITerminalProbe> probe = nullptr,
                          std::optional<bool> forceColor = std::nullopt);
  ~ConsoleHandler() override = default;

  HandlerKind kind() const override { return HandlerKind::CONSOLE; }
  void flush() override;

  bool colorEnabled() const { return colorizer_.enabled(); }

 protected:
  void emit(const LogRecord& record) override;

 private:
  std::ostream& stream_;
  Colorizer colorizer_;
  mutable std::mutex mutex_;
};

}  // namespace logkit
