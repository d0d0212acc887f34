#include "rclone_client.hpp"

#include <algorithm>
#include <sstream>

#include "settings_manager.hpp"

namespace {

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(!line.empty()) lines.push_back(line);
  }
  return lines;
}

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

RcloneClient::RcloneClient(std::shared_ptr<CommandRunner> runner,
                           std::string binary,
                           std::shared_ptr<Logger> logger)
  : runner_(std::move(runner)),
    binary_(binary.empty() ? std::string("rclone") : std::move(binary)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("rclone")) {}

CommandResult RcloneClient::capture(const std::vector<std::string>& args) {
  std::vector<std::string> argv{binary_};
  argv.insert(argv.end(), args.begin(), args.end());
  logger_->debug("Running: {}", format_command(argv));
  return runner_->capture(argv);
}

bool RcloneClient::is_installed() {
  try {
    return capture({"version"}).exit_code == 0;
  } catch(const CommandError& e) {
    logger_->error("{}", e.what());
    return false;
  }
}

std::vector<std::string> RcloneClient::list_remotes() {
  auto result = capture({"listremotes"});
  if(result.exit_code != 0) {
    throw CommandError("rclone listremotes failed with code " + std::to_string(result.exit_code),
                       result.exit_code);
  }
  std::vector<std::string> remotes;
  for(auto line : split_lines(result.output)) {
    line = SettingsManager::trim_copy(line);
    if(!line.empty() && line.back() == ':') line.pop_back();
    if(line.empty() || ends_with(line, "-shared")) continue;
    remotes.push_back(line);
  }
  std::sort(remotes.begin(), remotes.end());
  return remotes;
}

const nlohmann::json& RcloneClient::config_dump() {
  if(config_cache_) return *config_cache_;
  config_cache_ = nlohmann::json::object();
  try {
    auto result = capture({"config", "dump"});
    if(result.exit_code != 0) {
      logger_->warn("rclone config dump failed with code {}", result.exit_code);
      return *config_cache_;
    }
    auto doc = nlohmann::json::parse(result.output);
    if(doc.is_object()) {
      config_cache_ = std::move(doc);
    }
  } catch(const nlohmann::json::exception& e) {
    logger_->warn("Unable to parse rclone config dump: {}", e.what());
  } catch(const CommandError& e) {
    logger_->warn("{}", e.what());
  }
  return *config_cache_;
}

std::string RcloneClient::remote_type(const std::string& remote) {
  std::string name = remote;
  if(!name.empty() && name.back() == ':') name.pop_back();
  const auto& dump = config_dump();
  auto it = dump.find(name);
  if(it == dump.end() || !it->is_object()) return {};
  return it->value("type", std::string());
}

std::vector<std::string> RcloneClient::list_path(const std::string& path) {
  auto result = capture({"lsf", path});
  if(result.exit_code != 0) {
    throw CommandError("rclone lsf " + path + " failed with code " + std::to_string(result.exit_code),
                       result.exit_code);
  }
  return split_lines(result.output);
}

std::vector<std::string> RcloneClient::copy_arguments(const CopyRequest& request) const {
  std::vector<std::string> argv{binary_, "copy"};
  if(request.overwrite) argv.push_back("--ignore-times");
  if(!request.files_from.empty()) {
    argv.push_back("--files-from");
    argv.push_back("-");
  }
  argv.push_back(request.source);
  argv.push_back(request.destination);
  argv.push_back("--progress");
  return argv;
}

int RcloneClient::copy(const CopyRequest& request) {
  auto argv = copy_arguments(request);
  std::string names;
  for(const auto& name : request.files_from) {
    names += name;
    names += '\n';
  }
  logger_->debug("Running: {}", format_command(argv));
  return runner_->run(argv, names);
}

int RcloneClient::sync(const std::string& source, const std::string& destination) {
  std::vector<std::string> argv{binary_, "sync", source, destination, "--progress"};
  logger_->debug("Running: {}", format_command(argv));
  return runner_->run(argv);
}
