#include "process_supervisor.hpp"

#include <sys/wait.h>
#include <signal.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include "process_runner.hpp"

namespace {

constexpr auto SHUTDOWN_POLL = std::chrono::milliseconds(50);

// Children lead their own process group, so signal the group first and fall
// back to the pid if the group is already gone.
void signal_child(pid_t pid, int signo) {
  if(::kill(-pid, signo) == -1) {
    ::kill(pid, signo);
  }
}

} // namespace

const char* to_string(ProcessStatus status) {
  switch(status) {
    case ProcessStatus::Starting: return "starting";
    case ProcessStatus::Running: return "running";
    case ProcessStatus::Exited: return "exited";
    case ProcessStatus::Failed: return "failed";
  }
  return "unknown";
}

ProcessSupervisor::ProcessSupervisor(CommandBuilder builder, Options options, std::shared_ptr<Logger> logger)
  : builder_(std::move(builder)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("supervisor")),
    signals_(io_, SIGCHLD) {
  if(options_.handle_signals) {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
  }
}

ProcessSupervisor::~ProcessSupervisor() {
  shutdown();
}

void ProcessSupervisor::launch(const std::vector<ServeTarget>& plan) {
  if(plan.empty()) throw EmptyPlan();

  for(const auto& target : plan) {
    SupervisedProcess process;
    process.target = target;
    process.started_at = std::chrono::system_clock::now();

    const auto argv = builder_(target);
    logger_->debug("Running: {}", format_command(argv));
    try {
      auto spawned = spawn_process(argv);
      if(spawned.ok()) {
        process.pid = spawned.pid;
        logger_->info("Started {} on port {} (pid {})", target.display_name(), target.port, spawned.pid);
      } else {
        process.status = ProcessStatus::Failed;
        process.exit_code = 127;
        process.diagnostic = std::string("unable to start: ") + std::strerror(spawned.error);
        logger_->error("Unable to start {}: {}", target.display_name(), std::strerror(spawned.error));
      }
    } catch(const std::system_error& e) {
      process.status = ProcessStatus::Failed;
      process.exit_code = -1;
      process.diagnostic = e.what();
      logger_->error("Unable to start {}: {}", target.display_name(), e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    processes_.push_back(std::move(process));
  }

  if(options_.startup_probe.count() > 0) {
    std::this_thread::sleep_for(options_.startup_probe);
  }
  reap();

  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& process : processes_) {
    if(process.status == ProcessStatus::Starting) {
      process.status = ProcessStatus::Running;
    }
  }
}

void ProcessSupervisor::reap() {
  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& process : processes_) {
    if(!process.alive() || process.pid <= 0) continue;

    int status = 0;
    pid_t r = ::waitpid(process.pid, &status, WNOHANG);
    if(r == 0) continue;
    if(r == -1) {
      if(errno == EINTR) continue;
      process.status = ProcessStatus::Exited;
      process.diagnostic = std::string("lost track of process: ") + std::strerror(errno);
      continue;
    }

    process.exit_code = decode_wait_status(status);
    if(stopping_) {
      process.status = ProcessStatus::Exited;
      process.diagnostic = "stopped";
    } else if(process.status == ProcessStatus::Starting && process.exit_code != 0) {
      process.status = ProcessStatus::Failed;
      process.diagnostic = "exited with code " + std::to_string(process.exit_code) + " during startup";
      logger_->error("{} failed to start (exit code {})", process.target.display_name(), process.exit_code);
    } else {
      process.status = ProcessStatus::Exited;
      process.diagnostic = "exited with code " + std::to_string(process.exit_code);
      logger_->warn("{} exited with code {}", process.target.display_name(), process.exit_code);
    }
  }
}

bool ProcessSupervisor::all_exited() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for(const auto& process : processes_) {
    if(process.alive()) return false;
  }
  return true;
}

void ProcessSupervisor::arm_signals() {
  signals_.async_wait([this](const std::error_code& ec, int signo) {
    if(ec) return;
    if(signo == SIGCHLD) {
      reap();
      if(all_exited()) {
        io_.stop();
        return;
      }
    } else {
      logger_->info("Received {}, stopping servers", ::strsignal(signo));
      interrupted_ = true;
      io_.stop();
      return;
    }
    arm_signals();
  });
}

bool ProcessSupervisor::wait() {
  io_.restart();
  arm_signals();
  // SIGCHLD for children that exited before the signal set was armed
  asio::post(io_, [this]() {
    reap();
    if(interrupted_ || all_exited()) io_.stop();
  });
  io_.run();

  std::error_code ec;
  signals_.cancel(ec);

  const bool interrupted = interrupted_.load();
  if(interrupted) shutdown();
  return interrupted;
}

void ProcessSupervisor::interrupt() {
  interrupted_ = true;
  asio::post(io_, [this]() { io_.stop(); });
}

void ProcessSupervisor::shutdown() {
  std::vector<pid_t> pids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    for(const auto& process : processes_) {
      if(process.alive() && process.pid > 0) pids.push_back(process.pid);
    }
  }
  if(pids.empty()) return;

  logger_->info("Stopping {} server(s)", pids.size());
  for(auto pid : pids) {
    signal_child(pid, SIGTERM);
  }

  const auto deadline = std::chrono::steady_clock::now() + options_.grace_period;
  for(;;) {
    reap();
    if(all_exited() || std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(SHUTDOWN_POLL);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for(auto& process : processes_) {
    if(!process.alive() || process.pid <= 0) continue;
    logger_->warn("{} did not stop within {} ms, killing it",
                  process.target.display_name(), options_.grace_period.count());
    signal_child(process.pid, SIGKILL);
    int status = 0;
    pid_t r = -1;
    do {
      r = ::waitpid(process.pid, &status, 0);
    } while(r == -1 && errno == EINTR);
    process.status = ProcessStatus::Exited;
    process.exit_code = r == process.pid ? decode_wait_status(status) : 128 + SIGKILL;
    process.diagnostic = "killed after grace period";
  }
}

std::vector<SupervisedProcess> ProcessSupervisor::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return processes_;
}

std::size_t ProcessSupervisor::running_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for(const auto& process : processes_) {
    if(process.status == ProcessStatus::Running) ++count;
  }
  return count;
}

std::size_t ProcessSupervisor::failed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for(const auto& process : processes_) {
    if(process.status == ProcessStatus::Failed) ++count;
  }
  return count;
}

void ProcessSupervisor::report() const {
  auto processes = snapshot();
  logger_->print("");
  logger_->print("{:<32} {:<9} {:<28} {}", "TARGET", "STATUS", "ADDRESS", "NOTE");
  for(const auto& process : processes) {
    logger_->print("{:<32} {:<9} {:<28} {}",
                   process.target.display_name(),
                   to_string(process.status),
                   process.target.url(),
                   process.diagnostic);
  }
}
