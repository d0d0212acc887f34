#include "pilot_cli.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>

#include "command_line_parser.hpp"
#include "network.hpp"
#include "selection_parser.hpp"

namespace fs = std::filesystem;

namespace {

std::string as_remote_dir(std::string path) {
  if(!path.empty() && path.back() != ':' && path.back() != '/') path += '/';
  return path;
}

// "--flag=value" or "--flag value" -> {"--flag", "value"}
std::pair<std::string, std::string> split_flag(const std::string& text) {
  auto pos = text.find_first_of("= \t");
  if(pos == std::string::npos) return {text, std::string()};
  return {SettingsManager::trim_copy(text.substr(0, pos)),
          SettingsManager::trim_copy(text.substr(pos + 1))};
}

} // namespace

PilotCLI::PilotCLI(std::shared_ptr<SettingsManager> settings,
                   std::shared_ptr<RcloneClient> rclone,
                   std::shared_ptr<LineReader> reader,
                   std::shared_ptr<Logger> logger)
  : settings_(std::move(settings)),
    rclone_(std::move(rclone)),
    reader_(std::move(reader)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("cli")) {
  auto binary = rclone_->binary();
  command_builder_ = [binary](const ServeTarget& target) {
    return serve_arguments(target, binary);
  };
}

void PilotCLI::set_supervisor_command_builder(ProcessSupervisor::CommandBuilder builder) {
  command_builder_ = std::move(builder);
}

int PilotCLI::execute(const std::string& command) {
  const std::string name = SettingsManager::to_lower(SettingsManager::trim_copy(command));
  try {
    if(name == "upload") return upload();
    if(name == "download") return download();
    if(name == "serve-local") return serve_local();
    if(name == "serve-remote") return serve_remote();
    if(name == "sync") return sync();
    if(name == "config") return manage_flags();
    if(name.empty() || name == "help") {
      print_help();
      return 0;
    }
  } catch(const CommandError& e) {
    logger_->error("{}", e.what());
    return 1;
  } catch(const EmptyPlan& e) {
    logger_->error("{}", e.what());
    return 1;
  }
  logger_->print_err("Unknown command '{}'", command);
  print_help();
  return 1;
}

void PilotCLI::print_help() const {
  logger_->print("Commands:");
  for(const auto& info : command_help()) {
    logger_->print("  {:<14} {}", info.name, info.description);
  }
  logger_->print("Run with --help to list every option.");
}

// ---- prompts ----

std::optional<std::string> PilotCLI::choose_from_list(const std::vector<std::string>& items,
                                                      const std::string& title) {
  if(items.empty()) return std::nullopt;
  for(;;) {
    logger_->print("");
    logger_->print("{}", title);
    for(std::size_t i = 0; i < items.size(); ++i) {
      logger_->print("  {:>3}. {}", i + 1, items[i]);
    }
    auto line = reader_->read_line("> ");
    if(!line) return std::nullopt;
    const auto input = SettingsManager::trim_copy(*line);
    if(input.empty() || input == "q" || input == "Q") return std::nullopt;

    try {
      auto selection = parse_selection(input, items.size());
      if(selection.kind != Selection::Kind::Indices) {
        logger_->print_err("Enter the number of an entry");
      } else if(selection.indices.size() != 1) {
        logger_->print_err("Choose a single entry");
      } else {
        return items[selection.indices.front() - 1];
      }
    } catch(const InvalidSelection& e) {
      logger_->print_err("{}", e.what());
    }
  }
}

std::vector<std::string> PilotCLI::choose_many_from_list(const std::vector<std::string>& items,
                                                         const std::string& title) {
  if(items.empty()) return {};
  for(;;) {
    logger_->print("");
    logger_->print("{}", title);
    for(std::size_t i = 0; i < items.size(); ++i) {
      logger_->print("  {:>3}. {}", i + 1, items[i]);
    }
    logger_->print("Enter numbers or ranges, e.g. 1,3-4");
    auto line = reader_->read_line("> ");
    if(!line) return {};
    const auto input = SettingsManager::trim_copy(*line);
    if(input.empty() || input == "q" || input == "Q") return {};

    try {
      auto selection = parse_selection(input, items.size());
      if(selection.kind != Selection::Kind::Indices) {
        logger_->print_err("Enter entry numbers");
        continue;
      }
      std::vector<std::string> chosen;
      for(auto index : selection.indices) {
        chosen.push_back(items[index - 1]);
      }
      return chosen;
    } catch(const InvalidSelection& e) {
      logger_->print_err("{}", e.what());
    }
  }
}

std::optional<Protocol> PilotCLI::choose_protocol() {
  const auto configured = settings_->get<std::string>("protocol");
  if(!configured.empty()) {
    auto protocol = parse_protocol(configured);
    if(!protocol) {
      logger_->error("Unknown protocol '{}' (expected http, webdav or ftp)", configured);
    }
    return protocol;
  }

  std::vector<std::string> names;
  for(auto protocol : all_protocols()) {
    names.push_back(to_string(protocol));
  }
  auto choice = choose_from_list(names, "Serve over:");
  if(!choice) return std::nullopt;
  return parse_protocol(*choice);
}

bool PilotCLI::confirm(const std::string& prompt, bool default_yes) {
  for(;;) {
    auto line = reader_->read_line(prompt + (default_yes ? " [Y/n] " : " [y/N] "));
    if(!line) return false;
    const auto answer = SettingsManager::to_lower(SettingsManager::trim_copy(*line));
    if(answer.empty()) return default_yes;
    if(answer == "y" || answer == "yes") return true;
    if(answer == "n" || answer == "no") return false;
    logger_->print_err("Please answer y or n");
  }
}

std::optional<std::string> PilotCLI::choose_remote(const std::string& title) {
  auto remotes = rclone_->list_remotes();
  if(remotes.empty()) {
    logger_->print_err("No rclone remotes configured. Run 'rclone config' first.");
    return std::nullopt;
  }
  return choose_from_list(remotes, title);
}

// ---- navigation ----

std::string PilotCLI::local_start() const {
  auto start = settings_->get<std::string>("start_dir");
  if(start.empty()) {
    const char* home = std::getenv("HOME");
    if(home && *home) {
      start = home;
    } else {
      std::error_code ec;
      start = fs::current_path(ec).string();
      if(ec) start = ".";
    }
  }
  // a relative start never reaches the filesystem root when walking up
  std::error_code ec;
  auto absolute = fs::absolute(start, ec);
  if(!ec) start = absolute.string();
  return LocalListingProvider::normalize(start);
}

NavigationResult PilotCLI::navigate_local(NavigationMode mode) {
  LocalListingProvider provider(settings_->get<bool>("show_hidden"));
  Navigator navigator(provider, *reader_, logger_, mode);
  return navigator.run(local_start());
}

NavigationResult PilotCLI::navigate_remote(const std::string& remote, NavigationMode mode) {
  RemoteListingProvider provider(rclone_, remote);
  Navigator navigator(provider, *reader_, logger_, mode);
  return navigator.run(provider.root());
}

// ---- transfers ----

int PilotCLI::run_copy(const CopyRequest& request) {
  if(request.files_from.empty()) {
    logger_->print("Copying {} to {}", request.source, request.destination);
  } else {
    logger_->print("Copying {} item(s) from {} to {}",
                   request.files_from.size(), request.source, request.destination);
  }
  const int code = rclone_->copy(request);
  if(code != 0) {
    logger_->error("rclone copy exited with code {}", code);
    return 1;
  }
  return 0;
}

// A single entry (or the confirmed directory) is copied as is. From a
// multi-entry selection, directories are copied one by one into a folder of
// the same name and files go in one --files-from batch.
int PilotCLI::copy_selection(const NavigationResult& selection,
                             const std::string& destination,
                             bool local_destination) {
  const bool overwrite = settings_->get<bool>("overwrite");
  if(overwrite) {
    logger_->print("Overwrite mode enabled (ignoring timestamps)");
  }

  if(selection.selection.size() <= 1) {
    CopyRequest request;
    request.source = selection.paths().front();
    request.destination = destination;
    request.overwrite = overwrite;
    return run_copy(request);
  }

  int status = 0;
  std::vector<std::string> files;
  for(const auto& entry : selection.selection) {
    if(!entry.is_directory() && !overwrite) {
      files.push_back(entry.name);
      continue;
    }
    CopyRequest request;
    request.source = entry.path;
    request.overwrite = overwrite;
    if(entry.is_directory()) {
      request.destination = local_destination
        ? (fs::path(destination) / entry.name).string()
        : as_remote_dir(destination) + entry.name + "/";
    } else {
      request.destination = destination;
    }
    if(run_copy(request) != 0) status = 1;
  }

  if(!files.empty()) {
    CopyRequest request;
    request.source = selection.path;
    request.destination = destination;
    request.files_from = std::move(files);
    request.overwrite = overwrite;
    if(run_copy(request) != 0) status = 1;
  }
  return status;
}

int PilotCLI::upload() {
  logger_->print("Step 1: select local files or a folder to upload");
  auto local = navigate_local(NavigationMode::MultiSelect);
  if(!local.confirmed()) {
    logger_->print("Cancelled.");
    return 0;
  }

  logger_->print("Step 2: select the destination remote");
  auto remote = choose_remote("Upload to:");
  if(!remote) {
    logger_->print("Cancelled.");
    return 0;
  }

  logger_->print("Step 3: select the destination folder");
  auto target = navigate_remote(*remote, NavigationMode::SinglePath);
  if(!target.confirmed()) {
    logger_->print("Cancelled.");
    return 0;
  }

  int status = copy_selection(local, as_remote_dir(target.path), false);
  if(status == 0) logger_->print("Upload complete.");
  return status;
}

int PilotCLI::download() {
  logger_->print("Step 1: select the source remote");
  auto remote = choose_remote("Download from:");
  if(!remote) {
    logger_->print("Cancelled.");
    return 0;
  }

  logger_->print("Step 2: select remote files or a folder to download");
  auto source = navigate_remote(*remote, NavigationMode::MultiSelect);
  if(!source.confirmed()) {
    logger_->print("Cancelled.");
    return 0;
  }

  logger_->print("Step 3: select the local destination folder");
  auto local = navigate_local(NavigationMode::SinglePath);
  if(!local.confirmed()) {
    logger_->print("Cancelled.");
    return 0;
  }
  std::error_code ec;
  if(!fs::is_directory(local.path, ec)) {
    logger_->print_err("Invalid destination {}: a directory is required", local.path);
    return 1;
  }

  int status = copy_selection(source, local.path, true);
  if(status == 0) logger_->print("Download complete.");
  return status;
}

int PilotCLI::sync() {
  auto source_remote = choose_remote("Sync from:");
  if(!source_remote) return 0;
  auto source = navigate_remote(*source_remote, NavigationMode::SinglePath);
  if(!source.confirmed()) return 0;

  auto destination_remote = choose_remote("Sync to:");
  if(!destination_remote) return 0;
  auto destination = navigate_remote(*destination_remote, NavigationMode::SinglePath);
  if(!destination.confirmed()) return 0;

  logger_->print("{} will be made identical to {}; files only present at the destination are deleted.",
                 destination.path, source.path);
  if(!confirm("Continue?", false)) {
    logger_->print("Cancelled.");
    return 0;
  }

  logger_->print("Syncing {} to {}", source.path, destination.path);
  const int code = rclone_->sync(source.path, destination.path);
  if(code != 0) {
    logger_->error("rclone sync exited with code {}", code);
    return 1;
  }
  return 0;
}

// ---- serving ----

ServeDefaults PilotCLI::serve_defaults() const {
  auto bind_address = settings_->get<std::string>("bind_address");
  if(bind_address.empty()) {
    bind_address = detect_bind_address(logger_.get());
  }
  return ServeDefaults::from_settings(*settings_, bind_address);
}

int PilotCLI::serve(const std::vector<ServeTarget>& plan) {
  ProcessSupervisor::Options options;
  options.startup_probe = std::chrono::milliseconds(std::max(0, settings_->get<int>("startup_probe_ms")));
  options.grace_period = std::chrono::milliseconds(std::max(0, settings_->get<int>("grace_period_ms")));
  options.handle_signals = true;

  ProcessSupervisor supervisor(command_builder_, options, logger_);
  supervisor.launch(plan);

  if(supervisor.failed_count() > 0 || supervisor.running_count() == 0) {
    supervisor.report();
  }
  if(supervisor.running_count() == 0) {
    logger_->error("No server could be started");
    return 1;
  }

  for(const auto& process : supervisor.snapshot()) {
    if(process.status == ProcessStatus::Running) {
      logger_->print("Serving {} at {}", process.target.display_name(), process.target.url());
    }
  }
  logger_->print("Press Ctrl+C to stop.");

  const bool interrupted = supervisor.wait();
  supervisor.report();

  auto processes = supervisor.snapshot();
  const bool all_crashed = std::all_of(processes.begin(), processes.end(),
    [](const SupervisedProcess& process) { return process.exit_code != 0; });
  if(!interrupted && all_crashed) {
    logger_->error("Every server exited with an error");
    return 1;
  }
  return 0;
}

int PilotCLI::serve_local() {
  logger_->print("Choose the local folder to serve");
  auto folder = navigate_local(NavigationMode::SinglePath);
  if(!folder.confirmed()) {
    logger_->print("Cancelled.");
    return 0;
  }
  auto protocol = choose_protocol();
  if(!protocol) return settings_->get<std::string>("protocol").empty() ? 0 : 1;

  std::vector<ServeTarget> plan;
  try {
    plan = ServePlanBuilder(serve_defaults()).build_local(folder.path, *protocol);
  } catch(const std::out_of_range& e) {
    logger_->error("{}", e.what());
    return 1;
  }
  return serve(plan);
}

int PilotCLI::serve_remote() {
  auto remotes = rclone_->list_remotes();
  if(remotes.empty()) {
    logger_->print_err("No rclone remotes configured. Run 'rclone config' first.");
    return 1;
  }
  auto chosen = choose_many_from_list(remotes, "Remotes to serve:");
  if(chosen.empty()) {
    logger_->print("Cancelled.");
    return 0;
  }
  auto protocol = choose_protocol();
  if(!protocol) return settings_->get<std::string>("protocol").empty() ? 0 : 1;

  ServePlanBuilder builder(serve_defaults());
  std::vector<RemoteChoice> choices;
  for(const auto& remote : chosen) {
    RemoteChoice choice;
    choice.remote = remote;
    choice.type = rclone_->remote_type(remote);
    if(builder.supports_shared_drives(choice.type)) {
      choice.serve_shared = confirm("Also serve files shared with you on " + remote + "?", true);
    }
    choices.push_back(std::move(choice));
  }

  std::vector<ServeTarget> plan;
  try {
    plan = builder.build_remote(choices, *protocol);
  } catch(const std::out_of_range& e) {
    logger_->error("{}", e.what());
    return 1;
  }
  return serve(plan);
}

// ---- flag configuration ----

void PilotCLI::save_remote_flags(const nlohmann::json& flags) {
  std::string error;
  if(!settings_->set_from_json("remote_flags", flags, error)) {
    logger_->error("Unable to update flags: {}", error);
    return;
  }
  if(!settings_->save()) {
    logger_->error("Unable to persist settings to {}", settings_->settings_path().string());
    return;
  }
  logger_->print("Configuration saved.");
}

int PilotCLI::manage_flags() {
  for(;;) {
    logger_->print("");
    logger_->print("Serve flags per remote type");
    logger_->print("  1. View flags");
    logger_->print("  2. Add or edit a flag");
    logger_->print("  3. Delete a flag");
    logger_->print("  4. Exit");
    auto line = reader_->read_line("> ");
    if(!line) return 0;
    const auto choice = SettingsManager::trim_copy(*line);
    if(choice.empty() || choice == "4" || choice == "q") return 0;

    auto flags = settings_->get<nlohmann::json>("remote_flags");
    if(!flags.is_object()) flags = nlohmann::json::object();

    if(choice == "1") {
      if(flags.empty()) logger_->print("No flags configured.");
      for(auto type = flags.begin(); type != flags.end(); ++type) {
        logger_->print("{}:", type.key());
        if(!type->is_object()) continue;
        for(auto flag = type->begin(); flag != type->end(); ++flag) {
          const auto value = flag->is_string() ? flag->get<std::string>() : flag->dump();
          logger_->print("  {}{}{}", flag.key(), value.empty() ? "" : " ", value);
        }
      }
    } else if(choice == "2") {
      auto type = reader_->read_line("Remote type (e.g. drive, mega): ");
      if(!type) return 0;
      const auto type_name = SettingsManager::to_lower(SettingsManager::trim_copy(*type));
      auto flag = reader_->read_line("Flag (e.g. --vfs-read-chunk-size=64M): ");
      if(!flag) return 0;
      auto parsed = split_flag(SettingsManager::trim_copy(*flag));
      if(type_name.empty() || parsed.first.rfind("--", 0) != 0) {
        logger_->print_err("A remote type and a flag starting with -- are required");
        continue;
      }
      if(!flags[type_name].is_object()) flags[type_name] = nlohmann::json::object();
      flags[type_name][parsed.first] = parsed.second;
      save_remote_flags(flags);
    } else if(choice == "3") {
      auto type = reader_->read_line("Remote type: ");
      if(!type) return 0;
      const auto type_name = SettingsManager::to_lower(SettingsManager::trim_copy(*type));
      if(!flags.contains(type_name) || !flags[type_name].is_object()) {
        logger_->print_err("No flags found for '{}'", type_name);
        continue;
      }
      auto key = reader_->read_line("Flag to delete (e.g. --vfs-read-chunk-size): ");
      if(!key) return 0;
      const auto flag_key = split_flag(SettingsManager::trim_copy(*key)).first;
      if(flags[type_name].erase(flag_key) == 0) {
        logger_->print_err("'{}' is not set for '{}'", flag_key, type_name);
        continue;
      }
      if(flags[type_name].empty()) flags.erase(type_name);
      save_remote_flags(flags);
    } else {
      logger_->print_err("Invalid choice '{}'", choice);
    }
  }
}
