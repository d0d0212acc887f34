#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

const std::vector<CommandHelp>& command_help() {
  static const std::vector<CommandHelp> commands{
    {"upload",       "Pick local files or a folder and copy them to a remote (--overwrite)"},
    {"download",     "Pick remote files or a folder and copy them to a local folder (--overwrite)"},
    {"serve-local",  "Serve a local folder over http, webdav or ftp (--protocol)"},
    {"serve-remote", "Serve one or more remotes, one server per remote (--protocol)"},
    {"sync",         "Sync a remote path onto another remote path"},
    {"config",       "Manage extra serve flags per remote type"},
    {"help",         "Show this help"},
  };
  return commands;
}

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  auto fail = [&](const std::string& message){
    print_err(nullptr, "{}", message);
    usage();
    std::exit(1);
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](std::string key_token, bool long_form){
      // --key=value
      std::optional<std::string> inline_value;
      auto eq = key_token.find('=');
      if(eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token = key_token.substr(0, eq);
      }
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          fail("Unknown option --" + key_token);
        }
        return false;
      }
      std::string value;
      if(inline_value) {
        value = *inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          fail("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        fail("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      if(handle_option(token.substr(1), false)) {
        continue;
      }
    }

    if(positional_index >= positional_specs_.size()) {
      fail("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      fail("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - interactive front-end for rclone transfers and servers", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} <command> [options]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Commands:");
  for(const auto& command : command_help()) {
    print_out(nullptr, "  {:<14} {}", command.name, command.description);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    if(key == "command") continue;
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    const auto& default_value = entry.at("default");
    std::string default_str = default_value.is_string()
      ? default_value.get<std::string>()
      : default_value.dump();
    print_out(nullptr, "  --{:<22} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Selections: 3 | 1,4 | 2-5 | .. (up) | . or d (this folder) | empty line (cancel)");
}
