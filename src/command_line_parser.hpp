#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

struct CommandHelp {
  const char* name;
  const char* description;
};

// Commands understood as the first positional argument.
const std::vector<CommandHelp>& command_help();

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "rcpilot",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","command"}}
                    }));

  // Applies argv to settings. Invalid input prints usage and exits with 1.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
