#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "process_runner.hpp"

struct CopyRequest {
  std::string source;
  std::string destination;
  // Names relative to source, fed through --files-from on stdin. Empty copies
  // source itself.
  std::vector<std::string> files_from;
  bool overwrite = false;
};

// Every invocation of the rclone binary goes through here.
class RcloneClient {
public:
  RcloneClient(std::shared_ptr<CommandRunner> runner,
               std::string binary = "rclone",
               std::shared_ptr<Logger> logger = nullptr);

  const std::string& binary() const { return binary_; }

  bool is_installed();

  // Configured remotes without the trailing ':'; "-shared" helper remotes are
  // left out. Throws CommandError.
  std::vector<std::string> list_remotes();

  // Backend type from `rclone config dump` ("drive", "s3", ...), empty when
  // unknown. The dump is read once per client.
  std::string remote_type(const std::string& remote);

  // Raw `rclone lsf` lines; directories end in '/'. Throws CommandError.
  std::vector<std::string> list_path(const std::string& path);

  std::vector<std::string> copy_arguments(const CopyRequest& request) const;
  int copy(const CopyRequest& request);
  int sync(const std::string& source, const std::string& destination);

private:
  CommandResult capture(const std::vector<std::string>& args);
  const nlohmann::json& config_dump();

  std::shared_ptr<CommandRunner> runner_;
  std::string binary_;
  std::shared_ptr<Logger> logger_;
  std::optional<nlohmann::json> config_cache_;
};
