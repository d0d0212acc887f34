#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","command"},               {"aliases", {"cmd"}},                {"type","string"}, {"default",""},          {"description","Command to run (upload, download, serve-local, serve-remote, sync, config)"}, {"persistent", false}},
  {{"key","overwrite"},             {"aliases", {"o","force"}},          {"type","bool"},   {"default",false},       {"description","Overwrite files at the destination (ignore timestamps)"}, {"persistent", false}},
  {{"key","protocol"},              {"aliases", {"p","backend"}},        {"type","string"}, {"default",""},          {"description","Serve protocol: http, webdav or ftp (asked when empty)"}, {"persistent", false}},
  {{"key","rclone_binary"},         {"aliases", {"rclone"}},             {"type","string"}, {"default","rclone"},    {"description","rclone executable to invoke"}, {"persistent", true}},
  {{"key","base_port"},             {"aliases", {"port"}},               {"type","int"},    {"default",8080},        {"description","First port handed to serve targets"}, {"persistent", true}},
  {{"key","bind_address"},          {"aliases", {"addr","ip"}},          {"type","string"}, {"default",""},          {"description","Address to bind servers to (auto-detected when empty)"}, {"persistent", true}},
  {{"key","serve_user"},            {"aliases", {"user"}},               {"type","string"}, {"default","user"},      {"description","User name required by served endpoints"}, {"persistent", true}},
  {{"key","serve_pass"},            {"aliases", {"pass"}},               {"type","string"}, {"default","pass"},      {"description","Password required by served endpoints"}, {"persistent", true}},
  {{"key","cache_max_size"},        {"aliases", {"cache"}},              {"type","string"}, {"default","1G"},        {"description","VFS cache bound for low-latency backends"}, {"persistent", true}},
  {{"key","cache_max_size_media"},  {"aliases", {"media_cache"}},        {"type","string"}, {"default","10G"},       {"description","VFS cache bound for media backends"}, {"persistent", true}},
  {{"key","cache_max_age"},         {"aliases", {"cache_age"}},          {"type","string"}, {"default","24h"},       {"description","VFS cache duration"}, {"persistent", true}},
  {{"key","media_backends"},        {"type","json"},   {"default",nlohmann::json::array({"drive","google photos","mega","onedrive"})}, {"description","Remote types that get the media cache bound"}, {"persistent", true}},
  {{"key","photo_backends"},        {"type","json"},   {"default",nlohmann::json::array({"google photos"})}, {"description","Remote types that need the read-size hint"}, {"persistent", true}},
  {{"key","shared_drive_backends"}, {"type","json"},   {"default",nlohmann::json::array({"drive"})},   {"description","Remote types offering a shared drive"}, {"persistent", true}},
  {{"key","remote_flags"},          {"aliases", {"flags"}},              {"type","json"},   {"default",nlohmann::json::object()}, {"description","Extra serve flags per remote type"}, {"persistent", true}},
  {{"key","startup_probe_ms"},      {"aliases", {"probe"}},              {"type","int"},    {"default",500},         {"description","Time a server gets to fail before it counts as running"}, {"persistent", true}},
  {{"key","grace_period_ms"},       {"aliases", {"grace"}},              {"type","int"},    {"default",5000},        {"description","Wait after SIGTERM before servers are killed"}, {"persistent", true}},
  {{"key","start_dir"},             {"aliases", {"dir"}},                {"type","string"}, {"default",""},          {"description","Local directory browsing starts in ($HOME when empty)"}, {"persistent", true}},
  {{"key","show_hidden"},           {"aliases", {"hidden"}},             {"type","bool"},   {"default",false},       {"description","List dot files while browsing"}, {"persistent", true}},
  {{"key","log_file"},              {"aliases", {"log"}},                {"type","string"}, {"default",".config/logs/rcpilot.log"}, {"description","Rotating log file, relative to the workspace (empty disables)"}, {"persistent", true}},
  {{"key","verbose"},               {"aliases", {"v"}},                  {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                  {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                  {"aliases", {"persist"}},            {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!has(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return settings_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return settings_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // Reads a json array setting of strings; non-string members are skipped.
  std::vector<std::string> get_string_list(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  const nlohmann::json& specification() const { return specification_; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  const SettingSpec* find_spec(const std::string& token) const;
  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  std::vector<SettingSpec> specs_;
  nlohmann::json settings_;
  std::filesystem::path settings_path_override_;
};
