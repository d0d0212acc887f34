#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "line_reader.hpp"
#include "log.hpp"
#include "navigator.hpp"
#include "process_supervisor.hpp"
#include "rclone_client.hpp"
#include "serve_plan.hpp"
#include "settings_manager.hpp"

// Interactive workflows behind each command. Every prompt goes through the
// LineReader and every engine call through the RcloneClient.
class PilotCLI {
public:
  PilotCLI(std::shared_ptr<SettingsManager> settings,
           std::shared_ptr<RcloneClient> rclone,
           std::shared_ptr<LineReader> reader,
           std::shared_ptr<Logger> logger = nullptr);

  // Runs one command and returns the process exit code.
  int execute(const std::string& command);

  int upload();
  int download();
  int serve_local();
  int serve_remote();
  int sync();
  int manage_flags();
  void print_help() const;

  std::optional<std::string> choose_from_list(const std::vector<std::string>& items, const std::string& title);
  std::vector<std::string> choose_many_from_list(const std::vector<std::string>& items, const std::string& title);
  std::optional<Protocol> choose_protocol();
  bool confirm(const std::string& prompt, bool default_yes);

  // Replaces `rclone serve ...` for launched servers.
  void set_supervisor_command_builder(ProcessSupervisor::CommandBuilder builder);

private:
  std::string local_start() const;
  std::optional<std::string> choose_remote(const std::string& title);
  NavigationResult navigate_local(NavigationMode mode);
  NavigationResult navigate_remote(const std::string& remote, NavigationMode mode);

  int copy_selection(const NavigationResult& selection, const std::string& destination, bool local_destination);
  int run_copy(const CopyRequest& request);
  int serve(const std::vector<ServeTarget>& plan);
  ServeDefaults serve_defaults() const;
  void save_remote_flags(const nlohmann::json& flags);

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<RcloneClient> rclone_;
  std::shared_ptr<LineReader> reader_;
  std::shared_ptr<Logger> logger_;
  ProcessSupervisor::CommandBuilder command_builder_;
};
