#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "listing_provider.hpp"

class SettingsManager;

enum class Protocol { Http, WebDav, Ftp };

const char* to_string(Protocol protocol);
std::optional<Protocol> parse_protocol(const std::string& text);
const std::vector<Protocol>& all_protocols();

struct CachePolicy {
  std::string mode = "full";
  std::string max_size = "1G";
  std::string max_age = "24h";
};

struct ServeTarget {
  Backend backend;
  std::string root;                   // "name:" for remotes, a directory for local
  Protocol protocol = Protocol::WebDav;
  int port = 0;
  CachePolicy cache;
  bool shared_drive = false;
  bool photo_read_size = false;
  std::vector<std::string> extra_flags;
  std::string bind_address;
  std::string user;
  std::string password;

  std::string display_name() const;
  std::string url() const;
};

// Full `rclone serve` argv for a target.
std::vector<std::string> serve_arguments(const ServeTarget& target, const std::string& binary);

// Everything the builder needs that does not come from the user's choices.
struct ServeDefaults {
  int base_port = 8080;
  std::string bind_address = "127.0.0.1";
  std::string user = "user";
  std::string password = "pass";
  std::string cache_mode = "full";
  std::string cache_max_size = "1G";
  std::string cache_max_size_media = "10G";
  std::string cache_max_age = "24h";
  std::vector<std::string> media_types{"drive", "google photos", "mega", "onedrive"};
  std::vector<std::string> photo_types{"google photos"};
  std::vector<std::string> shared_drive_types{"drive"};
  // remote type -> {"--flag": "value"}; an empty value adds the bare flag
  nlohmann::json remote_flags = nlohmann::json::object();

  static ServeDefaults from_settings(const SettingsManager& settings, const std::string& bind_address);
};

struct RemoteChoice {
  std::string remote;
  std::string type;            // rclone backend type, may be empty
  bool serve_shared = false;   // also serve the shared drive when the type offers one
};

class EmptyPlan : public std::runtime_error {
public:
  EmptyPlan() : std::runtime_error("Nothing selected to serve") {}
};

class ServePlanBuilder {
public:
  explicit ServePlanBuilder(ServeDefaults defaults);

  // One target per choice in order, plus a shared-drive target right after
  // each opted-in choice. Ports count up from base_port. Throws EmptyPlan.
  std::vector<ServeTarget> build_remote(const std::vector<RemoteChoice>& choices, Protocol protocol) const;
  std::vector<ServeTarget> build_local(const std::string& path, Protocol protocol) const;

  bool supports_shared_drives(const std::string& type) const;
  const ServeDefaults& defaults() const { return defaults_; }

private:
  ServeTarget make_target(Backend backend, std::string root, Protocol protocol, int port) const;
  std::vector<std::string> flags_for_type(const std::string& type) const;
  int port_at(std::size_t position) const;

  ServeDefaults defaults_;
};
