/**
 * @file argumentparser.cpp
 * @date October 2026
 * @brief Реализация парсера аргументов командной строки logkit-demo
 *
 * @details
 * Каждая опция со значением принимается в двух формах: "--opt=value"
 * и "--opt value".
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>

#include "logkit/loglevel.hpp"

using namespace std;

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--save") {
      args.save = true;
    } else if (arg == "--force-color") {
      args.force_color = true;
    } else if (arg == "--no-color") {
      args.force_color = false;
    } else if (arg.compare(0, 13, "--config-file") == 0) {
      args.config_path = takeValue(arg, "--config-file", i, argc, argv);
    } else if (arg.compare(0, 6, "--name") == 0) {
      args.name = takeValue(arg, "--name", i, argc, argv);
    } else if (arg.compare(0, 6, "--path") == 0) {
      args.path = takeValue(arg, "--path", i, argc, argv);
    } else if (arg.compare(0, 11, "--log-level") == 0) {
      parseLogLevel(takeValue(arg, "--log-level", i, argc, argv), args);
    } else if (arg.compare(0, 14, "--backup-count") == 0) {
      parseBackupCount(takeValue(arg, "--backup-count", i, argc, argv), args);
    } else {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
  }

  return args;
}

string ArgumentParser::takeValue(const string &arg, const string &option,
                                 int &i, int argc, char **argv) {
  if (arg.size() > option.size()) {
    if (arg[option.size()] != '=') {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
    return arg.substr(option.size() + 1);
  }
  if (i + 1 < argc) {
    return argv[++i];
  }
  throw invalid_argument("ArgumentParser: " + option + " requires a value");
}

void ArgumentParser::parseLogLevel(const string &value, ParsedArgs &args) {
  if (!logkit::tryParseLogLevel(value)) {
    throw invalid_argument("ArgumentParser: Invalid log level: " + value);
  }

  string lowerLevel;
  transform(value.begin(), value.end(), back_inserter(lowerLevel),
            [](unsigned char c) { return tolower(c); });
  args.log_level = lowerLevel;
}

void ArgumentParser::parseBackupCount(const string &value, ParsedArgs &args) {
  if (value.empty() ||
      !all_of(value.begin(), value.end(),
              [](unsigned char c) { return isdigit(c); }) ||
      value.size() > 6) {
    throw invalid_argument("ArgumentParser: Invalid backup count: " + value);
  }
  const int count = stoi(value);
  if (count < 1) {
    throw invalid_argument("ArgumentParser: Backup count must be positive");
  }
  args.backup_count = count;
}

void ArgumentParser::printHelp(ostream &out) {
  out << "Usage: logkit-demo [options]\n"
      << "  --config-file FILE   JSON configuration with a \"logging\" section\n"
      << "  --name NAME          logger name (default: logger)\n"
      << "  --path DIR           log directory (default: logs)\n"
      << "  --log-level LEVEL    debug|info|warning|error|critical or 10..50\n"
      << "  --save               also write <DIR>/<NAME>.log\n"
      << "  --backup-count N     rotated files to keep (default: 7)\n"
      << "  --force-color        color even when stdout is not a terminal\n"
      << "  --no-color           never color\n"
      << "  -h, --help           show this help\n";
}
