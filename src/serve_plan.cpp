#include "serve_plan.hpp"

#include <algorithm>

#include "settings_manager.hpp"

namespace {

const char* SHARED_DRIVE_FLAG = "--drive-shared-with-me";
const char* PHOTO_READ_SIZE_FLAG = "--gphotos-read-size";
constexpr int MAX_PORT = 65535;

bool contains(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

const char* to_string(Protocol protocol) {
  switch(protocol) {
    case Protocol::Http: return "http";
    case Protocol::WebDav: return "webdav";
    case Protocol::Ftp: return "ftp";
  }
  return "webdav";
}

std::optional<Protocol> parse_protocol(const std::string& text) {
  const auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(text));
  for(auto protocol : all_protocols()) {
    if(lowered == to_string(protocol)) return protocol;
  }
  return std::nullopt;
}

const std::vector<Protocol>& all_protocols() {
  static const std::vector<Protocol> protocols{Protocol::Http, Protocol::WebDav, Protocol::Ftp};
  return protocols;
}

std::string ServeTarget::display_name() const {
  std::string name = backend.is_remote() ? root : "local " + root;
  if(shared_drive) name += " (shared)";
  return name;
}

std::string ServeTarget::url() const {
  const std::string scheme = protocol == Protocol::Ftp ? "ftp" : "http";
  return scheme + "://" + bind_address + ":" + std::to_string(port) + "/";
}

std::vector<std::string> serve_arguments(const ServeTarget& target, const std::string& binary) {
  std::vector<std::string> argv{
    binary, "serve", to_string(target.protocol), target.root,
    "--addr", target.bind_address + ":" + std::to_string(target.port),
    "--user", target.user,
    "--pass", target.password,
    "--vfs-cache-mode", target.cache.mode,
    "--vfs-cache-max-size", target.cache.max_size,
    "--vfs-cache-max-age", target.cache.max_age,
  };
  if(target.photo_read_size) argv.push_back(PHOTO_READ_SIZE_FLAG);
  if(target.shared_drive) argv.push_back(SHARED_DRIVE_FLAG);
  argv.insert(argv.end(), target.extra_flags.begin(), target.extra_flags.end());
  return argv;
}

ServeDefaults ServeDefaults::from_settings(const SettingsManager& settings, const std::string& bind_address) {
  ServeDefaults defaults;
  defaults.base_port = settings.get<int>("base_port");
  defaults.bind_address = bind_address;
  defaults.user = settings.get<std::string>("serve_user");
  defaults.password = settings.get<std::string>("serve_pass");
  defaults.cache_max_size = settings.get<std::string>("cache_max_size");
  defaults.cache_max_size_media = settings.get<std::string>("cache_max_size_media");
  defaults.cache_max_age = settings.get<std::string>("cache_max_age");
  defaults.media_types = settings.get_string_list("media_backends");
  defaults.photo_types = settings.get_string_list("photo_backends");
  defaults.shared_drive_types = settings.get_string_list("shared_drive_backends");
  defaults.remote_flags = settings.get<nlohmann::json>("remote_flags");
  return defaults;
}

ServePlanBuilder::ServePlanBuilder(ServeDefaults defaults)
  : defaults_(std::move(defaults)) {}

bool ServePlanBuilder::supports_shared_drives(const std::string& type) const {
  return !type.empty() && contains(defaults_.shared_drive_types, type);
}

int ServePlanBuilder::port_at(std::size_t position) const {
  if(defaults_.base_port < 1 || defaults_.base_port > MAX_PORT ||
     position > static_cast<std::size_t>(MAX_PORT - defaults_.base_port)) {
    throw std::out_of_range("Port " + std::to_string(defaults_.base_port) + " + " +
                            std::to_string(position) + " is outside the TCP port range");
  }
  return defaults_.base_port + static_cast<int>(position);
}

std::vector<std::string> ServePlanBuilder::flags_for_type(const std::string& type) const {
  std::vector<std::string> flags;
  if(type.empty() || !defaults_.remote_flags.is_object()) return flags;
  auto it = defaults_.remote_flags.find(type);
  if(it == defaults_.remote_flags.end() || !it->is_object()) return flags;
  for(auto flag = it->begin(); flag != it->end(); ++flag) {
    if(flag.key() == SHARED_DRIVE_FLAG) continue;
    flags.push_back(flag.key());
    if(flag->is_string() && !flag->get<std::string>().empty()) {
      flags.push_back(flag->get<std::string>());
    }
  }
  return flags;
}

ServeTarget ServePlanBuilder::make_target(Backend backend, std::string root, Protocol protocol, int port) const {
  ServeTarget target;
  target.backend = std::move(backend);
  target.root = std::move(root);
  target.protocol = protocol;
  target.port = port;
  target.cache.mode = defaults_.cache_mode;
  target.cache.max_size = defaults_.cache_max_size;
  target.cache.max_age = defaults_.cache_max_age;
  target.bind_address = defaults_.bind_address;
  target.user = defaults_.user;
  target.password = defaults_.password;
  return target;
}

std::vector<ServeTarget> ServePlanBuilder::build_remote(const std::vector<RemoteChoice>& choices,
                                                        Protocol protocol) const {
  if(choices.empty()) throw EmptyPlan();

  std::vector<ServeTarget> plan;
  for(const auto& choice : choices) {
    std::string name = choice.remote;
    if(!name.empty() && name.back() == ':') name.pop_back();

    auto target = make_target(Backend::remote_named(name), name + ":", protocol, port_at(plan.size()));
    if(contains(defaults_.media_types, choice.type)) {
      target.cache.max_size = defaults_.cache_max_size_media;
    }
    target.photo_read_size = contains(defaults_.photo_types, choice.type);
    target.extra_flags = flags_for_type(choice.type);
    plan.push_back(target);

    if(choice.serve_shared && supports_shared_drives(choice.type)) {
      auto shared = target;
      shared.shared_drive = true;
      shared.port = port_at(plan.size());
      plan.push_back(std::move(shared));
    }
  }
  return plan;
}

std::vector<ServeTarget> ServePlanBuilder::build_local(const std::string& path, Protocol protocol) const {
  if(path.empty()) throw EmptyPlan();
  return {make_target(Backend::local(), path, protocol, port_at(0))};
}
