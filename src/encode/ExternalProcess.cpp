// Repository: V3CDash
// Component: External Process Implementation
// Copyright (c) 2025 V3CDash Contributors

#include "v3cdash/encode/ExternalProcess.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

#include "v3cdash/util/Logger.hpp"

namespace v3cdash::encode {

using util::Logger;

std::string ProcessResult::Describe() const {
  std::ostringstream oss;
  switch (status) {
    case Status::kExited:
      oss << "exit code " << exit_code;
      break;
    case Status::kSignaled:
      oss << "killed by signal " << signal_number << " (" << strsignal(signal_number) << ")";
      break;
    case Status::kCancelled:
      oss << "cancelled";
      break;
    case Status::kSpawnFailed:
      oss << "spawn failed: " << error;
      break;
  }
  return oss.str();
}

namespace {

void FillFromWaitStatus(int wait_status, ProcessResult* result) {
  if (WIFEXITED(wait_status)) {
    result->status = ProcessResult::Status::kExited;
    result->exit_code = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    result->status = ProcessResult::Status::kSignaled;
    result->signal_number = WTERMSIG(wait_status);
  }
}

// Returns true once pid has been reaped.
bool WaitFor(pid_t pid, std::chrono::milliseconds timeout, std::chrono::milliseconds poll,
             int* wait_status) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    pid_t r = waitpid(pid, wait_status, WNOHANG);
    if (r == pid) return true;
    if (r < 0 && errno != EINTR) return true;  // already reaped elsewhere
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(poll);
  }
}

}  // namespace

ProcessResult ExternalProcess::Run(const ProcessSpec& spec, const std::atomic<bool>& cancel,
                                   std::chrono::milliseconds grace_period,
                                   std::chrono::milliseconds poll_interval) {
  ProcessResult result;
  if (spec.program.empty()) {
    result.error = "no program";
    return result;
  }
  if (cancel.load(std::memory_order_acquire)) {
    result.status = ProcessResult::Status::kCancelled;
    return result;
  }

  const std::string log_target = spec.log_path.empty() ? "/dev/null" : spec.log_path;
  int log_fd = open(log_target.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (log_fd < 0) {
    result.error = "cannot open log " + log_target + ": " + std::strerror(errno);
    return result;
  }

  // CLOEXEC pipe: EOF on read means exec succeeded; an int means it failed.
  int exec_pipe[2];
  if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
    result.error = std::string("pipe2: ") + std::strerror(errno);
    close(log_fd);
    return result;
  }

  // argv is built before fork; the child only calls async-signal-safe functions.
  std::vector<char*> argv;
  argv.reserve(spec.args.size() + 2);
  argv.push_back(const_cast<char*>(spec.program.c_str()));
  for (const auto& arg : spec.args) argv.push_back(const_cast<char*>(arg.c_str()));
  argv.push_back(nullptr);
  const char* working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

  pid_t pid = fork();
  if (pid < 0) {
    result.error = std::string("fork: ") + std::strerror(errno);
    close(exec_pipe[0]);
    close(exec_pipe[1]);
    close(log_fd);
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) dup2(null_fd, STDIN_FILENO);
    dup2(log_fd, STDOUT_FILENO);
    dup2(log_fd, STDERR_FILENO);
    int err = 0;
    if (working_dir != nullptr && chdir(working_dir) != 0) {
      err = errno;
    } else {
      execvp(argv[0], argv.data());
      err = errno;
    }
    ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // Parent. Also set the group here so a kill(-pid) cannot race the child.
  setpgid(pid, pid);
  close(exec_pipe[1]);
  close(log_fd);

  int child_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close(exec_pipe[0]);

  int wait_status = 0;
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    while (waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
    result.status = ProcessResult::Status::kSpawnFailed;
    result.error = "exec " + spec.program + ": " + std::strerror(child_errno);
    return result;
  }

  while (true) {
    pid_t r = waitpid(pid, &wait_status, WNOHANG);
    if (r == pid) {
      FillFromWaitStatus(wait_status, &result);
      return result;
    }
    if (r < 0 && errno != EINTR) {
      result.status = ProcessResult::Status::kSpawnFailed;
      result.error = std::string("waitpid: ") + std::strerror(errno);
      return result;
    }
    if (cancel.load(std::memory_order_acquire)) break;
    std::this_thread::sleep_for(poll_interval);
  }

  // Cancelled while running.
  {
    std::ostringstream oss;
    oss << "[ExternalProcess] CANCEL pid=" << pid << " program=" << spec.program
        << " signal=SIGTERM grace_ms=" << grace_period.count();
    Logger::Info(oss.str());
  }
  kill(-pid, SIGTERM);
  if (!WaitFor(pid, grace_period, poll_interval, &wait_status)) {
    std::ostringstream oss;
    oss << "[ExternalProcess] KILL pid=" << pid << " program=" << spec.program
        << " reason=grace_period_expired";
    Logger::Warn(oss.str());
    kill(-pid, SIGKILL);
    while (waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
  }
  result.status = ProcessResult::Status::kCancelled;
  return result;
}

}  // namespace v3cdash::encode
