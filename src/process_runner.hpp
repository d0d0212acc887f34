#pragma once

#include <sys/types.h>

#include <stdexcept>
#include <string>
#include <vector>

struct CommandResult {
  int exit_code = 0;
  std::string output;
};

// A one-shot command could not be started or returned a failure the caller
// cannot work around.
class CommandError : public std::runtime_error {
public:
  CommandError(const std::string& message, int exit_code)
    : std::runtime_error(message), exit_code_(exit_code) {}

  int exit_code() const { return exit_code_; }

private:
  int exit_code_;
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  // Runs argv to completion and returns its exit status and stdout.
  // stderr stays attached to the terminal.
  virtual CommandResult capture(const std::vector<std::string>& argv) = 0;

  // Runs argv attached to the terminal. stdin_data, when not empty, is
  // written to the child's stdin which is then closed.
  virtual int run(const std::vector<std::string>& argv,
                  const std::string& stdin_data = std::string()) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
  CommandResult capture(const std::vector<std::string>& argv) override;
  int run(const std::vector<std::string>& argv,
          const std::string& stdin_data = std::string()) override;
};

struct SpawnResult {
  pid_t pid = -1;
  int error = 0;   // errno of the failed fork/exec, 0 on success

  bool ok() const { return pid > 0 && error == 0; }
};

// Starts argv without waiting for it. The child gets its own process group
// and inherits stdout/stderr. Exec failures are reported in the result and the
// failed child is already reaped.
SpawnResult spawn_process(const std::vector<std::string>& argv);

// Decodes a waitpid status into an exit code (128 + signal when killed).
int decode_wait_status(int status);

// Renders argv for logs, masking the value following --pass.
std::string format_command(const std::vector<std::string>& argv);
