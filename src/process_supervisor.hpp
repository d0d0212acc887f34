#pragma once

#include <asio.hpp>

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log.hpp"
#include "serve_plan.hpp"

enum class ProcessStatus { Starting, Running, Exited, Failed };

const char* to_string(ProcessStatus status);

struct SupervisedProcess {
  ServeTarget target;
  pid_t pid = -1;
  std::chrono::system_clock::time_point started_at;
  ProcessStatus status = ProcessStatus::Starting;
  int exit_code = 0;
  std::string diagnostic;

  bool alive() const {
    return status == ProcessStatus::Starting || status == ProcessStatus::Running;
  }
};

// Runs one server process per ServeTarget and tears the batch down together.
// Child exits are picked up from SIGCHLD on an io_context owned by the
// supervisor; wait() runs that context on the calling thread.
class ProcessSupervisor {
public:
  using CommandBuilder = std::function<std::vector<std::string>(const ServeTarget&)>;

  struct Options {
    std::chrono::milliseconds startup_probe{500};
    std::chrono::milliseconds grace_period{5000};
    bool handle_signals = true;   // stop on SIGINT/SIGTERM
  };

  ProcessSupervisor(CommandBuilder builder, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  // Starts every target in order; a target that cannot start is marked
  // Failed and the rest are still attempted. Throws EmptyPlan.
  void launch(const std::vector<ServeTarget>& plan);

  // Blocks until all processes have exited or an interrupt arrives, in which
  // case the survivors are shut down. Returns true when interrupted.
  bool wait();

  // Safe from any thread and from before wait() is entered.
  void interrupt();

  // SIGTERM to live processes, SIGKILL to those still up after the grace period.
  void shutdown();

  std::vector<SupervisedProcess> snapshot() const;
  std::size_t running_count() const;
  std::size_t failed_count() const;
  void report() const;

private:
  void arm_signals();
  void reap();
  bool all_exited() const;

  CommandBuilder builder_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  asio::signal_set signals_;

  mutable std::mutex mutex_;
  std::vector<SupervisedProcess> processes_;
  std::atomic<bool> interrupted_{false};
  bool stopping_ = false;
};
