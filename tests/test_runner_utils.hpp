#pragma once

#include "listing_provider.hpp"
#include "line_reader.hpp"
#include "log.hpp"
#include "process_runner.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rcpilot::test {

inline std::filesystem::path prepare_workspace(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() / ("rcpilot_" + name);
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener(
      [this, label](void*,
                    const std::string& channel,
                    spdlog::level::level_enum,
                    const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!label.empty()) {
          lines_.emplace_back(label + ": " + message);
        } else {
          lines_.emplace_back(channel + ": " + message);
        }
        cv_.notify_all();
        return false;
      },
      nullptr);
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(50)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Prints what was expected when a check fails; returns the condition.
inline bool expect(bool condition, const std::string& what) {
  if(!condition) {
    std::cout << "\n    expected: " << what << "\n";
  }
  return condition;
}

// Replays canned answers; end of script reads as end of input.
class ScriptedLineReader : public LineReader {
public:
  explicit ScriptedLineReader(std::vector<std::string> lines = {})
    : lines_(std::move(lines)) {}

  std::optional<std::string> read_line(const std::string& prompt) override {
    prompts_.push_back(prompt);
    if(next_ >= lines_.size()) return std::nullopt;
    return lines_[next_++];
  }

  std::size_t consumed() const { return next_; }
  const std::vector<std::string>& prompts() const { return prompts_; }

private:
  std::vector<std::string> lines_;
  std::size_t next_ = 0;
  std::vector<std::string> prompts_;
};

// Records every invocation; answers with the result registered for the exact
// command line ("rclone lsf r:"), or exit 0 with no output.
class FakeCommandRunner : public CommandRunner {
public:
  struct Call {
    std::vector<std::string> argv;
    std::string stdin_data;
    bool captured = false;
  };

  void respond(const std::string& command_line, int exit_code, std::string output = std::string()) {
    responses_[command_line] = CommandResult{exit_code, std::move(output)};
  }

  void fail_to_start(const std::string& command_line) {
    unstartable_.push_back(command_line);
  }

  CommandResult capture(const std::vector<std::string>& argv) override {
    calls_.push_back({argv, std::string(), true});
    return lookup(argv);
  }

  int run(const std::vector<std::string>& argv, const std::string& stdin_data) override {
    calls_.push_back({argv, stdin_data, false});
    return lookup(argv).exit_code;
  }

  const std::vector<Call>& calls() const { return calls_; }

  std::vector<Call> calls_to(const std::string& subcommand) const {
    std::vector<Call> out;
    for(const auto& call : calls_) {
      if(call.argv.size() > 1 && call.argv[1] == subcommand) out.push_back(call);
    }
    return out;
  }

  static std::string join(const std::vector<std::string>& argv) {
    std::string out;
    for(const auto& arg : argv) {
      if(!out.empty()) out += ' ';
      out += arg;
    }
    return out;
  }

private:
  CommandResult lookup(const std::vector<std::string>& argv) const {
    const auto key = join(argv);
    if(std::find(unstartable_.begin(), unstartable_.end(), key) != unstartable_.end()) {
      throw CommandError("Unable to start '" + argv.front() + "': No such file or directory", 127);
    }
    auto it = responses_.find(key);
    if(it == responses_.end()) return CommandResult{};
    return it->second;
  }

  std::map<std::string, CommandResult> responses_;
  std::vector<std::string> unstartable_;
  std::vector<Call> calls_;
};

// In-memory tree rooted at "/": add("/docs/a.txt") creates /docs on the way.
class FakeListingProvider : public ListingProvider {
public:
  FakeListingProvider() : backend_(Backend::remote_named("fake")) {
    dirs_["/"];
  }

  void add_dir(const std::string& path) {
    dirs_[path];
    link(path, EntryKind::Directory);
  }

  void add_file(const std::string& path) {
    link(path, EntryKind::File);
  }

  void fail(const std::string& path, ListingError::Reason reason) {
    failures_[path] = reason;
  }

  void heal(const std::string& path) {
    failures_.erase(path);
  }

  std::size_t list_calls() const { return list_calls_; }

  const Backend& backend() const override { return backend_; }

  std::vector<Entry> list(const std::string& path) override {
    ++list_calls_;
    auto failure = failures_.find(path);
    if(failure != failures_.end()) {
      throw ListingError(failure->second, path, "scripted");
    }
    auto it = dirs_.find(path);
    if(it == dirs_.end()) {
      throw ListingError(ListingError::Reason::NotFound, path, "no such directory");
    }
    auto entries = it->second;
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b){ return a.name < b.name; });
    return entries;
  }

  bool is_root(const std::string& path) const override { return path == "/"; }

  std::string parent(const std::string& path) const override {
    auto slash = path.rfind('/');
    if(slash == std::string::npos || slash == 0) return "/";
    return path.substr(0, slash);
  }

private:
  void link(const std::string& path, EntryKind kind) {
    const auto parent_path = parent(path);
    if(parent_path != "/" && !dirs_.count(parent_path)) add_dir(parent_path);
    auto& siblings = dirs_[parent_path];
    Entry entry;
    entry.name = path.substr(path.rfind('/') + 1);
    entry.kind = kind;
    entry.path = path;
    for(const auto& existing : siblings) {
      if(existing.path == path) return;
    }
    siblings.push_back(entry);
  }

  Backend backend_;
  std::map<std::string, std::vector<Entry>> dirs_;
  std::map<std::string, ListingError::Reason> failures_;
  std::size_t list_calls_ = 0;
};

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs tests, printing '.' or 'F' each and the captured log of failures.
inline int run_tests(const std::string& suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("RCPILOT_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("RCPILOT_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace rcpilot::test
