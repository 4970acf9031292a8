#pragma once
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

struct ParsedArgs {
  std::optional<std::string> config_path;
  std::optional<std::string> name;
  std::optional<std::string> path;
  std::optional<std::string> log_level;
  std::optional<int> backup_count;
  std::optional<bool> force_color;
  bool save = false;
  bool help_message = false;
};

class ArgumentParser {
 public:
  ParsedArgs parse(int argc, char **argv);
  static void printHelp(std::ostream &out);

 private:
  std::string takeValue(const std::string &arg, const std::string &option,
                        int &i, int argc, char **argv);
  void parseLogLevel(const std::string &value, ParsedArgs &args);
  void parseBackupCount(const std::string &value, ParsedArgs &args);
};
