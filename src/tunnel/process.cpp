#include "tunnels/tunnel/process.hpp"

#include "tunnels/common/fs.hpp"
#include "tunnels/process/procfs.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tunnels::tunnel {

namespace {

SignalResult send_signal(const pid_t pid, const int signo) {
  if (pid <= 0) {
    return SignalResult::NoSuchProcess;
  }
  if (::kill(pid, signo) == 0) {
    return SignalResult::Delivered;
  }
  return errno == EPERM ? SignalResult::AccessDenied : SignalResult::NoSuchProcess;
}

std::string describe_wait_status(const int status) {
  if (WIFEXITED(status)) {
    return "exited with status " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "killed by signal " + std::to_string(WTERMSIG(status));
  }
  return "terminated unexpectedly";
}

bool is_zombie(const pid_t pid) {
  const auto content = common::read_file("/proc/" + std::to_string(pid) + "/stat");
  if (!content.has_value()) {
    return true;
  }
  const auto stat = process::parse_stat(*content);
  return !stat.has_value() || stat->state == 'Z' || stat->state == 'X';
}

bool has_exited(const pid_t pid) {
  int status = 0;
  const pid_t done = waitpid(pid, &status, WNOHANG);
  if (done == pid) {
    return true;
  }
  if (done == 0) {
    return false;
  }
  // Not our child: fall back to the process table.
  if (::kill(pid, 0) != 0 && errno == ESRCH) {
    return true;
  }
  return is_zombie(pid);
}

[[noreturn]] void exec_child(const std::vector<std::string> &argv, const int error_fd) {
  setsid();
  const int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd >= 0) {
    dup2(null_fd, STDIN_FILENO);
    close(null_fd);
  }

  std::vector<char *> cargs;
  cargs.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    cargs.push_back(const_cast<char *>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  execvp(cargs[0], cargs.data());
  const int err = errno;
  const ssize_t written = write(error_fd, &err, sizeof(err));
  (void)written;
  _exit(127);
}

} // namespace

std::string_view signal_result_name(const SignalResult result) {
  switch (result) {
  case SignalResult::Delivered:
    return "delivered";
  case SignalResult::NoSuchProcess:
    return "no such process";
  case SignalResult::AccessDenied:
    return "access denied";
  }
  return "unknown";
}

PosixProcessControl::PosixProcessControl(const std::chrono::milliseconds poll_interval)
    : poll_interval_(poll_interval) {}

common::Result<pid_t> PosixProcessControl::spawn_detached(const std::vector<std::string> &argv,
                                                          const std::chrono::milliseconds grace) {
  if (argv.empty() || argv.front().empty()) {
    return common::Result<pid_t>::failure(common::ErrorKind::Spawn, "empty command");
  }

  int pipefd[2] = {-1, -1};
  if (pipe2(pipefd, O_CLOEXEC) != 0) {
    return common::Result<pid_t>::failure(common::ErrorKind::Spawn,
                                          std::string("failed to create pipe: ") +
                                              std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close(pipefd[0]);
    close(pipefd[1]);
    return common::Result<pid_t>::failure(common::ErrorKind::Spawn,
                                          std::string("failed to fork: ") + std::strerror(err));
  }
  if (pid == 0) {
    close(pipefd[0]);
    exec_child(argv, pipefd[1]);
  }

  close(pipefd[1]);
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(pipefd[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(pipefd[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    if (child_errno == ENOENT) {
      return common::Result<pid_t>::failure(common::ErrorKind::Spawn,
                                            "executable not found: " + argv.front());
    }
    return common::Result<pid_t>::failure(common::ErrorKind::Spawn,
                                          "failed to execute " + argv.front() + ": " +
                                              std::strerror(child_errno));
  }

  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (true) {
    int status = 0;
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return common::Result<pid_t>::success(pid);
      }
      return common::Result<pid_t>::failure(common::ErrorKind::Spawn,
                                            argv.front() + " " + describe_wait_status(status));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(poll_interval_);
  }
  return common::Result<pid_t>::success(pid);
}

SignalResult PosixProcessControl::terminate(const pid_t pid) { return send_signal(pid, SIGTERM); }

SignalResult PosixProcessControl::kill(const pid_t pid) { return send_signal(pid, SIGKILL); }

bool PosixProcessControl::wait_exit(const pid_t pid, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (has_exited(pid)) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(poll_interval_);
  }
}

} // namespace tunnels::tunnel
