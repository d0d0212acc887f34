#include "process_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace {

struct FileDescriptor {
  int fd = -1;

  FileDescriptor() = default;
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  ~FileDescriptor() { reset(); }

  void reset() {
    if(fd >= 0) ::close(fd);
    fd = -1;
  }
};

struct Pipe {
  FileDescriptor read_end;
  FileDescriptor write_end;

  Pipe() {
    int fds[2];
    if(::pipe2(fds, O_CLOEXEC) == -1) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    read_end.fd = fds[0];
    write_end.fd = fds[1];
  }
};

int wait_for(pid_t pid) {
  int status = 0;
  while(::waitpid(pid, &status, 0) == -1) {
    if(errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  return decode_wait_status(status);
}

// All pipes are O_CLOEXEC, so only the descriptors dup2'ed onto stdin/stdout
// survive into the new image. The status pipe reports an exec failure as the
// child's errno; EOF on it means the exec went through.
SpawnResult launch(const std::vector<std::string>& argv,
                   int child_stdin,
                   int child_stdout,
                   bool new_process_group) {
  if(argv.empty()) {
    throw std::invalid_argument("cannot launch an empty command");
  }
  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for(const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  Pipe status_pipe;
  const pid_t pid = ::fork();
  if(pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if(pid == 0) {
    if(new_process_group) ::setpgid(0, 0);
    // the parent ignores SIGPIPE and that disposition survives exec
    ::signal(SIGPIPE, SIG_DFL);
    if(child_stdin >= 0) ::dup2(child_stdin, STDIN_FILENO);
    if(child_stdout >= 0) ::dup2(child_stdout, STDOUT_FILENO);
    ::execvp(args[0], args.data());
    int err = errno;
    ssize_t written = ::write(status_pipe.write_end.fd, &err, sizeof(err));
    (void)written;
    ::_exit(127);
  }

  if(new_process_group) ::setpgid(pid, pid);
  status_pipe.write_end.reset();

  SpawnResult result;
  result.pid = pid;
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe.read_end.fd, &child_errno, sizeof(child_errno));
  } while(n == -1 && errno == EINTR);

  if(n == static_cast<ssize_t>(sizeof(child_errno))) {
    result.error = child_errno;
    wait_for(pid);
  }
  return result;
}

std::string spawn_error_message(const std::vector<std::string>& argv, int error) {
  return "Unable to start '" + argv.front() + "': " + std::strerror(error);
}

} // namespace

int decode_wait_status(int status) {
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

std::string format_command(const std::vector<std::string>& argv) {
  std::string out;
  bool mask_next = false;
  for(const auto& arg : argv) {
    if(!out.empty()) out += ' ';
    std::string shown = mask_next ? std::string("****") : arg;
    mask_next = (arg == "--pass");
    if(shown.find_first_of(" \t'\"") != std::string::npos) {
      out += "'" + shown + "'";
    } else {
      out += shown;
    }
  }
  return out;
}

CommandResult ProcessCommandRunner::capture(const std::vector<std::string>& argv) {
  Pipe out_pipe;
  auto spawned = launch(argv, -1, out_pipe.write_end.fd, false);
  out_pipe.write_end.reset();
  if(!spawned.ok()) {
    throw CommandError(spawn_error_message(argv, spawned.error), 127);
  }

  CommandResult result;
  char buf[4096];
  for(;;) {
    ssize_t n = ::read(out_pipe.read_end.fd, buf, sizeof(buf));
    if(n > 0) {
      result.output.append(buf, static_cast<std::size_t>(n));
    } else if(n == 0) {
      break;
    } else if(errno != EINTR) {
      break;
    }
  }
  result.exit_code = wait_for(spawned.pid);
  return result;
}

int ProcessCommandRunner::run(const std::vector<std::string>& argv,
                              const std::string& stdin_data) {
  if(stdin_data.empty()) {
    auto spawned = launch(argv, -1, -1, false);
    if(!spawned.ok()) {
      throw CommandError(spawn_error_message(argv, spawned.error), 127);
    }
    return wait_for(spawned.pid);
  }

  Pipe in_pipe;
  auto spawned = launch(argv, in_pipe.read_end.fd, -1, false);
  in_pipe.read_end.reset();
  if(!spawned.ok()) {
    throw CommandError(spawn_error_message(argv, spawned.error), 127);
  }

  const char* data = stdin_data.data();
  std::size_t remaining = stdin_data.size();
  while(remaining > 0) {
    ssize_t n = ::write(in_pipe.write_end.fd, data, remaining);
    if(n < 0) {
      if(errno == EINTR) continue;
      break; // child stopped reading; its exit status tells the rest
    }
    data += n;
    remaining -= static_cast<std::size_t>(n);
  }
  in_pipe.write_end.reset();
  return wait_for(spawned.pid);
}

SpawnResult spawn_process(const std::vector<std::string>& argv) {
  return launch(argv, -1, -1, true);
}
