#include "serve_plan.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <algorithm>
#include <vector>

namespace {

using rcpilot::test::TestCase;
using rcpilot::test::TestContext;
using rcpilot::test::expect;

RemoteChoice choice(const std::string& remote, const std::string& type, bool shared = false) {
  RemoteChoice c;
  c.remote = remote;
  c.type = type;
  c.serve_shared = shared;
  return c;
}

bool has_flag(const std::vector<std::string>& argv, const std::string& flag) {
  return std::find(argv.begin(), argv.end(), flag) != argv.end();
}

bool test_ports_follow_plan_order(TestContext&) {
  ServePlanBuilder builder{ServeDefaults{}};
  auto plan = builder.build_remote({choice("a", "s3"), choice("b", "sftp"), choice("c", "b2")}, Protocol::WebDav);
  return expect(plan.size() == 3, "three targets") &&
         expect(plan[0].port == 8080 && plan[1].port == 8081 && plan[2].port == 8082, "8080, 8081, 8082") &&
         expect(plan[0].root == "a:" && plan[1].root == "b:" && plan[2].root == "c:", "roots in order");
}

bool test_empty_input_is_empty_plan(TestContext&) {
  ServePlanBuilder builder{ServeDefaults{}};
  bool remote_threw = false;
  bool local_threw = false;
  try {
    builder.build_remote({}, Protocol::Http);
  } catch(const EmptyPlan&) {
    remote_threw = true;
  }
  try {
    builder.build_local("", Protocol::Http);
  } catch(const EmptyPlan&) {
    local_threw = true;
  }
  return expect(remote_threw, "no remotes -> EmptyPlan") && expect(local_threw, "no path -> EmptyPlan");
}

bool test_cache_bound_by_backend_class(TestContext&) {
  ServePlanBuilder builder{ServeDefaults{}};
  auto plan = builder.build_remote({choice("work", "s3"), choice("photos", "google photos"),
                                    choice("box", "mega")}, Protocol::Http);
  auto local = builder.build_local("/srv/share", Protocol::Http);
  bool ok = expect(plan[0].cache.max_size == "1G", "s3 gets the small bound");
  ok = ok && expect(plan[1].cache.max_size == "10G", "google photos gets the media bound");
  ok = ok && expect(plan[2].cache.max_size == "10G", "mega gets the media bound");
  ok = ok && expect(local[0].cache.max_size == "1G", "local gets the small bound");
  for(const auto& target : plan) {
    ok = ok && expect(target.cache.mode == "full" && target.cache.max_age == "24h", "full cache for 24h");
  }
  return ok;
}

bool test_shared_drive_target_follows_main(TestContext&) {
  ServePlanBuilder builder{ServeDefaults{}};
  auto plan = builder.build_remote({choice("gd", "drive", true), choice("s", "s3")}, Protocol::WebDav);
  bool ok = expect(plan.size() == 3, "drive opt-in adds one target");
  ok = ok && expect(plan[0].root == "gd:" && !plan[0].shared_drive, "main drive target first");
  ok = ok && expect(plan[1].root == "gd:" && plan[1].shared_drive, "shared target right after");
  ok = ok && expect(plan[1].port == 8081 && plan[2].port == 8082, "ports stay positional");
  ok = ok && expect(has_flag(serve_arguments(plan[1], "rclone"), "--drive-shared-with-me"), "shared flag passed");
  ok = ok && expect(!has_flag(serve_arguments(plan[0], "rclone"), "--drive-shared-with-me"), "main has no shared flag");
  return ok;
}

bool test_shared_opt_in_needs_capable_type(TestContext&) {
  ServePlanBuilder builder{ServeDefaults{}};
  auto declined = builder.build_remote({choice("gd", "drive", false)}, Protocol::Http);
  auto incapable = builder.build_remote({choice("s", "s3", true)}, Protocol::Http);
  return expect(declined.size() == 1, "declined opt-in") &&
         expect(incapable.size() == 1, "s3 has no shared drive") &&
         expect(builder.supports_shared_drives("drive") && !builder.supports_shared_drives(""), "capability table");
}

bool test_photo_read_size_hint(TestContext&) {
  ServePlanBuilder builder{ServeDefaults{}};
  auto plan = builder.build_remote({choice("p", "google photos"), choice("d", "drive")}, Protocol::Http);
  return expect(has_flag(serve_arguments(plan[0], "rclone"), "--gphotos-read-size"), "photos get the hint") &&
         expect(!has_flag(serve_arguments(plan[1], "rclone"), "--gphotos-read-size"), "drive does not");
}

bool test_extra_flags_per_type(TestContext&) {
  ServeDefaults defaults;
  defaults.remote_flags = {
    {"drive", {{"--drive-chunk-size", "64M"}, {"--drive-shared-with-me", ""}, {"--fast-list", ""}}},
  };
  ServePlanBuilder builder{defaults};
  auto plan = builder.build_remote({choice("gd", "drive", true)}, Protocol::Http);
  auto main_args = serve_arguments(plan[0], "rclone");
  auto shared_args = serve_arguments(plan[1], "rclone");
  auto chunk = std::find(main_args.begin(), main_args.end(), "--drive-chunk-size");
  return expect(chunk != main_args.end() && chunk + 1 != main_args.end() && *(chunk + 1) == "64M",
                "flag value follows its key") &&
         expect(has_flag(main_args, "--fast-list"), "bare flag passed") &&
         expect(!has_flag(main_args, "--drive-shared-with-me"), "configured shared flag kept off the main target") &&
         expect(std::count(shared_args.begin(), shared_args.end(), "--drive-shared-with-me") == 1,
                "shared target has the flag once");
}

bool test_serve_arguments_layout(TestContext&) {
  ServeDefaults defaults;
  defaults.bind_address = "192.168.1.20";
  defaults.user = "alice";
  defaults.password = "secret";
  ServePlanBuilder builder{defaults};
  auto plan = builder.build_local("/srv/share", Protocol::Ftp);
  std::vector<std::string> expected{
    "rclone", "serve", "ftp", "/srv/share",
    "--addr", "192.168.1.20:8080",
    "--user", "alice", "--pass", "secret",
    "--vfs-cache-mode", "full",
    "--vfs-cache-max-size", "1G",
    "--vfs-cache-max-age", "24h",
  };
  return expect(serve_arguments(plan[0], "rclone") == expected, "serve argv layout") &&
         expect(plan[0].url() == "ftp://192.168.1.20:8080/", "ftp url");
}

bool test_duplicate_remotes_served_independently(TestContext&) {
  ServePlanBuilder builder{ServeDefaults{}};
  auto plan = builder.build_remote({choice("a", "s3"), choice("a", "s3")}, Protocol::Http);
  return expect(plan.size() == 2 && plan[0].port != plan[1].port, "same remote twice, two ports");
}

bool test_ports_must_fit_tcp_range(TestContext&) {
  ServeDefaults defaults;
  defaults.base_port = 65535;
  ServePlanBuilder builder{defaults};
  auto single = builder.build_remote({choice("a", "s3")}, Protocol::Http);
  try {
    builder.build_remote({choice("a", "s3"), choice("b", "s3")}, Protocol::Http);
  } catch(const std::out_of_range&) {
    return expect(single[0].port == 65535, "last valid port used");
  }
  return expect(false, "second target past 65535 rejected");
}

bool test_defaults_from_settings(TestContext&) {
  SettingsManager settings;
  std::string error;
  bool ok = settings.set_from_string("base_port", "9000", error);
  ok = ok && settings.set_from_string("cache_max_size_media", "20G", error);
  ok = ok && settings.set_from_json("media_backends", nlohmann::json::array({"s3"}), error);
  if(!expect(ok, "settings accepted: " + error)) return false;

  auto defaults = ServeDefaults::from_settings(settings, "10.0.0.5");
  ServePlanBuilder builder{defaults};
  auto plan = builder.build_remote({choice("s", "s3"), choice("d", "drive")}, Protocol::Http);
  return expect(plan[0].port == 9000 && plan[0].bind_address == "10.0.0.5", "port and address from settings") &&
         expect(plan[0].cache.max_size == "20G", "configured media class") &&
         expect(plan[1].cache.max_size == "1G", "drive no longer a media type") &&
         expect(plan[0].user == "user" && plan[0].password == "pass", "default credentials");
}

bool test_protocol_names(TestContext&) {
  return expect(parse_protocol("WebDAV") == Protocol::WebDav, "case-insensitive") &&
         expect(parse_protocol(" ftp ") == Protocol::Ftp, "trimmed") &&
         expect(!parse_protocol("smb").has_value(), "unknown protocol") &&
         expect(all_protocols().size() == 3, "three protocols");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"ports_follow_plan_order", test_ports_follow_plan_order},
    {"empty_input_is_empty_plan", test_empty_input_is_empty_plan},
    {"cache_bound_by_backend_class", test_cache_bound_by_backend_class},
    {"shared_drive_target_follows_main", test_shared_drive_target_follows_main},
    {"shared_opt_in_needs_capable_type", test_shared_opt_in_needs_capable_type},
    {"photo_read_size_hint", test_photo_read_size_hint},
    {"extra_flags_per_type", test_extra_flags_per_type},
    {"serve_arguments_layout", test_serve_arguments_layout},
    {"duplicate_remotes_served_independently", test_duplicate_remotes_served_independently},
    {"ports_must_fit_tcp_range", test_ports_must_fit_tcp_range},
    {"defaults_from_settings", test_defaults_from_settings},
    {"protocol_names", test_protocol_names},
  };
  return rcpilot::test::run_tests("serve plan", tests, argc, argv);
}
