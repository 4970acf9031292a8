#include <cstdlib>
#include <iostream>

#include "../include/argumentparser.hpp"
#include "logkit/configloader.hpp"
#include "logkit/errors.hpp"
#include "logkit/logging_setup.hpp"

namespace {

void applyOverrides(const ParsedArgs &args, logkit::LoggerConfig &config) {
  if (args.name) config.name = *args.name;
  if (args.path) config.path = *args.path;
  if (args.log_level) config.level = logkit::parseLogLevel(*args.log_level);
  if (args.backup_count) config.backupCount = *args.backup_count;
  if (args.force_color) config.forceColor = args.force_color;
  if (args.save) config.save = true;
}

}  // namespace

int main(int argc, char **argv) {
  try {
    ArgumentParser parser;
    ParsedArgs args = parser.parse(argc, argv);

    if (args.help_message) {
      ArgumentParser::printHelp(std::cout);
      return EXIT_SUCCESS;
    }

    logkit::LoggerConfig config;
    if (args.config_path) {
      logkit::LoggingConfigLoader loader;
      config = loader.loadFromFile(*args.config_path);
    }
    applyOverrides(args, config);

    auto logger = logkit::configureLogging(config);
    logger->debug("Debug message");
    logger->info("Info message \xF0\x9F\x9A\x80 launched");
    logger->warning("Warning message: cache \xE2\x86\x92 disk");
    logger->error("Error message");
    logger->critical("Critical message \xE2\x9C\x85");
    logger->flush();
    return EXIT_SUCCESS;
  } catch (const logkit::DirectoryError &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "logkit-demo: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
