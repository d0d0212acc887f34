#include "listing_provider.hpp"
#include "rclone_client.hpp"
#include "test_runner_utils.hpp"

#include <csignal>
#include <memory>
#include <vector>

namespace {

using rcpilot::test::FakeCommandRunner;
using rcpilot::test::TestCase;
using rcpilot::test::TestContext;
using rcpilot::test::expect;

struct Fixture {
  std::shared_ptr<FakeCommandRunner> runner = std::make_shared<FakeCommandRunner>();
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("rclone");
  std::shared_ptr<RcloneClient> rclone;

  explicit Fixture(TestContext& ctx) {
    ctx.logs.attach(logger);
    rclone = std::make_shared<RcloneClient>(runner, "rclone", logger);
  }
};

bool test_list_remotes_hides_shared(TestContext& ctx) {
  Fixture f(ctx);
  f.runner->respond("rclone listremotes", 0, "work:\ngdrive:\ngdrive-shared:\n\nphotos:\n");
  auto remotes = f.rclone->list_remotes();
  return expect(remotes == std::vector<std::string>({"gdrive", "photos", "work"}), "sorted, without gdrive-shared");
}

bool test_list_remotes_failure_throws(TestContext& ctx) {
  Fixture f(ctx);
  f.runner->respond("rclone listremotes", 1);
  try {
    f.rclone->list_remotes();
  } catch(const CommandError& e) {
    return expect(e.exit_code() == 1, "exit code carried");
  }
  return expect(false, "CommandError thrown");
}

bool test_remote_type_from_config_dump(TestContext& ctx) {
  Fixture f(ctx);
  f.runner->respond("rclone config dump", 0,
                    R"({"gdrive": {"type": "drive", "scope": "drive"}, "pics": {"type": "google photos"}})");
  bool ok = expect(f.rclone->remote_type("gdrive") == "drive", "drive type");
  ok = ok && expect(f.rclone->remote_type("pics:") == "google photos", "trailing colon ignored");
  ok = ok && expect(f.rclone->remote_type("missing").empty(), "unknown remote");
  ok = ok && expect(f.runner->calls_to("config").size() == 1, "dump read once");
  return ok;
}

bool test_bad_config_dump_is_tolerated(TestContext& ctx) {
  Fixture f(ctx);
  f.runner->respond("rclone config dump", 0, "not json");
  return expect(f.rclone->remote_type("gdrive").empty(), "empty type") &&
         expect(ctx.logs.contains("Unable to parse rclone config dump"), "parse failure logged");
}

bool test_is_installed(TestContext& ctx) {
  Fixture ok_fixture(ctx);
  Fixture missing(ctx);
  missing.runner->fail_to_start("rclone version");
  return expect(ok_fixture.rclone->is_installed(), "version exits 0") &&
         expect(!missing.rclone->is_installed(), "binary missing");
}

bool test_copy_arguments(TestContext& ctx) {
  Fixture f(ctx);
  CopyRequest plain;
  plain.source = "/home/u/docs";
  plain.destination = "r:backup/";
  CopyRequest batch = plain;
  batch.files_from = {"a.txt", "b.txt"};
  batch.overwrite = true;

  bool ok = expect(f.rclone->copy_arguments(plain) ==
                   std::vector<std::string>({"rclone", "copy", "/home/u/docs", "r:backup/", "--progress"}),
                   "plain copy");
  ok = ok && expect(f.rclone->copy_arguments(batch) ==
                    std::vector<std::string>({"rclone", "copy", "--ignore-times", "--files-from", "-",
                                              "/home/u/docs", "r:backup/", "--progress"}),
                    "batch copy with overwrite");

  f.rclone->copy(batch);
  const auto& call = f.runner->calls().back();
  ok = ok && expect(!call.captured && call.stdin_data == "a.txt\nb.txt\n", "names fed on stdin");
  return ok;
}

bool test_sync_arguments(TestContext& ctx) {
  Fixture f(ctx);
  f.runner->respond("rclone sync a:x/ b:y/ --progress", 2);
  const int code = f.rclone->sync("a:x/", "b:y/");
  return expect(code == 2, "exit code returned") &&
         expect(FakeCommandRunner::join(f.runner->calls().back().argv) == "rclone sync a:x/ b:y/ --progress",
                "sync argv");
}

bool test_child_starts_with_default_sigpipe(TestContext&) {
  // main ignores SIGPIPE; rclone must still be killed by a closed pipe
  auto previous = ::signal(SIGPIPE, SIG_IGN);
  ProcessCommandRunner runner;
  CommandResult result;
  try {
    result = runner.capture({"sh", "-c", "kill -PIPE $$; echo survived"});
  } catch(const CommandError&) {
    ::signal(SIGPIPE, previous);
    return expect(false, "sh started");
  }
  ::signal(SIGPIPE, previous);
  return expect(result.exit_code == 128 + SIGPIPE, "killed by SIGPIPE") &&
         expect(result.output.find("survived") == std::string::npos, "no output after the signal");
}

bool test_remote_listing(TestContext& ctx) {
  Fixture f(ctx);
  f.runner->respond("rclone lsf r:", 0, "zeta.txt\nalbums/\nAlpha.doc\n");
  f.runner->respond("rclone lsf r:albums/", 0, "2024/\n");
  RemoteListingProvider provider(f.rclone, "r:");
  auto root = provider.list(provider.root());
  bool ok = expect(root.size() == 3, "three entries");
  ok = ok && expect(root[0].name == "Alpha.doc" && root[1].name == "albums" && root[2].name == "zeta.txt",
                    "sorted by name");
  ok = ok && expect(root[1].is_directory() && root[1].path == "r:albums/", "directory path");
  ok = ok && expect(!root[2].is_directory() && root[2].path == "r:zeta.txt", "file path");

  auto nested = provider.list("r:albums/");
  ok = ok && expect(nested.size() == 1 && nested[0].path == "r:albums/2024/", "nested directory path");
  ok = ok && expect(provider.parent("r:albums/2024/") == "r:albums/", "parent of nested");
  ok = ok && expect(provider.parent("r:albums/") == "r:", "parent of top level");
  ok = ok && expect(provider.is_root("r:") && !provider.is_root("r:albums/"), "root detection");
  ok = ok && expect(provider.backend().display_name() == "r", "backend name");
  return ok;
}

bool test_remote_listing_errors(TestContext& ctx) {
  Fixture f(ctx);
  f.runner->respond("rclone lsf r:gone/", 3);
  f.runner->respond("rclone lsf r:down/", 1);
  RemoteListingProvider provider(f.rclone, "r");

  auto reason_of = [&](const std::string& path) -> std::optional<ListingError::Reason> {
    try {
      provider.list(path);
    } catch(const ListingError& e) {
      return e.reason();
    }
    return std::nullopt;
  };
  return expect(reason_of("r:gone/") == ListingError::Reason::NotFound, "exit 3 is NotFound") &&
         expect(reason_of("r:down/") == ListingError::Reason::BackendUnavailable, "other failures unavailable");
}

bool test_local_listing(TestContext&) {
  auto root = rcpilot::test::prepare_workspace("local_listing");
  rcpilot::test::write_file(root / "b.txt", "b");
  rcpilot::test::write_file(root / ".hidden", "h");
  rcpilot::test::write_file(root / "a" / "inner.txt", "i");

  LocalListingProvider visible(false);
  LocalListingProvider all(true);
  const auto base = LocalListingProvider::normalize(root.string());
  auto entries = visible.list(base);
  auto with_hidden = all.list(base);

  bool ok = expect(entries.size() == 2, "dot files skipped");
  ok = ok && expect(entries[0].name == "a" && entries[0].is_directory(), "directory a");
  ok = ok && expect(entries[1].name == "b.txt" && !entries[1].is_directory(), "file b.txt");
  ok = ok && expect(with_hidden.size() == 3, "dot files shown when asked");
  ok = ok && expect(visible.parent(entries[0].path) == base, "parent round trip");
  ok = ok && expect(visible.is_root("/") && !visible.is_root(base), "root detection");

  bool not_found = false;
  try {
    visible.list((root / "missing").string());
  } catch(const ListingError& e) {
    not_found = e.reason() == ListingError::Reason::NotFound;
  }
  ok = ok && expect(not_found, "missing directory is NotFound");

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"list_remotes_hides_shared", test_list_remotes_hides_shared},
    {"list_remotes_failure_throws", test_list_remotes_failure_throws},
    {"remote_type_from_config_dump", test_remote_type_from_config_dump},
    {"bad_config_dump_is_tolerated", test_bad_config_dump_is_tolerated},
    {"is_installed", test_is_installed},
    {"copy_arguments", test_copy_arguments},
    {"sync_arguments", test_sync_arguments},
    {"child_starts_with_default_sigpipe", test_child_starts_with_default_sigpipe},
    {"remote_listing", test_remote_listing},
    {"remote_listing_errors", test_remote_listing_errors},
    {"local_listing", test_local_listing},
  };
  return rcpilot::test::run_tests("rclone", tests, argc, argv);
}
