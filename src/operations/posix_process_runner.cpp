#include "operations/posix_process_runner.hpp"

#include <array>
#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace garmin_coach::operations {

namespace {

std::string ErrnoMessage(int error_number) {
  return std::error_code(error_number, std::generic_category()).message();
}

class ScopedFd {
public:
  ScopedFd() = default;
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  ~ScopedFd() {
    Reset();
  }

  int Get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      (void)::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

struct Pipe {
  ScopedFd read_end;
  ScopedFd write_end;
};

bool OpenPipe(Pipe& pipe, std::string& error) {
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    error = "failed to create pipe: " + ErrnoMessage(errno);
    return false;
  }
  pipe.read_end.Reset(fds[0]);
  pipe.write_end.Reset(fds[1]);
  return true;
}

class ScopedFileActions {
public:
  ScopedFileActions() {
    initialized_ = ::posix_spawn_file_actions_init(&actions_) == 0;
  }
  ScopedFileActions(const ScopedFileActions&) = delete;
  ScopedFileActions& operator=(const ScopedFileActions&) = delete;

  ~ScopedFileActions() {
    if (initialized_) {
      (void)::posix_spawn_file_actions_destroy(&actions_);
    }
  }

  bool initialized() const {
    return initialized_;
  }

  posix_spawn_file_actions_t* get() {
    return &actions_;
  }

private:
  posix_spawn_file_actions_t actions_{};
  bool initialized_ = false;
};

// Reaps the child on every exit path. Wait() is the normal path; the
// destructor only fires when an earlier step bailed out.
class ScopedChild {
public:
  explicit ScopedChild(pid_t pid) : pid_(pid) {}
  ScopedChild(const ScopedChild&) = delete;
  ScopedChild& operator=(const ScopedChild&) = delete;

  ~ScopedChild() {
    if (!reaped_) {
      int raw_status = 0;
      (void)WaitRaw(raw_status);
    }
  }

  bool Wait(int& raw_status, std::string& error) {
    if (!WaitRaw(raw_status)) {
      error = "failed to wait for child process: " + ErrnoMessage(errno);
      return false;
    }
    return true;
  }

private:
  bool WaitRaw(int& raw_status) {
    while (true) {
      const pid_t result = ::waitpid(pid_, &raw_status, 0);
      if (result == pid_) {
        reaped_ = true;
        return true;
      }
      if (result == -1 && errno == EINTR) {
        continue;
      }
      reaped_ = true;
      return false;
    }
  }

  pid_t pid_ = -1;
  bool reaped_ = false;
};

// Reads both pipes until each reports EOF. Multiplexing keeps a chatty child
// from blocking on a full stderr pipe while we wait on stdout.
bool DrainPipes(int stdout_fd, int stderr_fd, std::string& stdout_text, std::string& stderr_text,
                std::string& error) {
  std::array<pollfd, 2> fds = {{{stdout_fd, POLLIN, 0}, {stderr_fd, POLLIN, 0}}};
  std::array<std::string*, 2> sinks = {&stdout_text, &stderr_text};
  std::array<char, 4096> buffer{};

  while (fds[0].fd >= 0 || fds[1].fd >= 0) {
    const int ready = ::poll(fds.data(), fds.size(), -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "failed to poll child output: " + ErrnoMessage(errno);
      return false;
    }

    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t count = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (count > 0) {
        sinks[i]->append(buffer.data(), static_cast<std::size_t>(count));
        continue;
      }
      if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
        continue;
      }
      if (count < 0) {
        error = "failed to read child output: " + ErrnoMessage(errno);
        return false;
      }
      // poll() skips negative descriptors; the ScopedFd still owns the close.
      fds[i].fd = -1;
    }
  }
  return true;
}

InvocationOutcome LaunchFailure(std::string cause) {
  InvocationOutcome outcome;
  outcome.status = InvocationStatus::kFailedToLaunch;
  outcome.launch_error = std::move(cause);
  return outcome;
}

} // namespace

void ClassifyChildExit(int raw_status, std::string_view capture_error,
                       InvocationOutcome& outcome) {
  outcome.term_signal.reset();
  outcome.exit_code = -1;
  if (WIFEXITED(raw_status)) {
    outcome.exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    outcome.term_signal = WTERMSIG(raw_status);
    outcome.exit_code = 128 + WTERMSIG(raw_status);
  }

  if (!capture_error.empty()) {
    if (!outcome.stderr_text.empty() && outcome.stderr_text.back() != '\n') {
      outcome.stderr_text.push_back('\n');
    }
    outcome.stderr_text += "garmin-coach: ";
    outcome.stderr_text += capture_error;
    outcome.stderr_text.push_back('\n');
    outcome.status = InvocationStatus::kFailedNonZero;
    return;
  }

  outcome.status = outcome.exit_code == 0 && !outcome.term_signal.has_value()
                       ? InvocationStatus::kSucceeded
                       : InvocationStatus::kFailedNonZero;
}

PosixProcessRunner::PosixProcessRunner(core::logging::Logger* logger) : logger_(logger) {}

InvocationOutcome PosixProcessRunner::Run(const InvocationTarget& target) {
  if (target.program.empty()) {
    return LaunchFailure("program name is empty");
  }

  std::string error;
  Pipe stdout_pipe;
  Pipe stderr_pipe;
  if (!OpenPipe(stdout_pipe, error) || !OpenPipe(stderr_pipe, error)) {
    return LaunchFailure(error);
  }

  ScopedFileActions actions;
  if (!actions.initialized() ||
      ::posix_spawn_file_actions_adddup2(actions.get(), stdout_pipe.write_end.Get(),
                                         STDOUT_FILENO) != 0 ||
      ::posix_spawn_file_actions_adddup2(actions.get(), stderr_pipe.write_end.Get(),
                                         STDERR_FILENO) != 0) {
    return LaunchFailure("failed to prepare child stdio redirection");
  }

  std::vector<char*> argv;
  argv.reserve(target.args.size() + 2U);
  argv.push_back(const_cast<char*>(target.program.c_str()));
  for (const auto& arg : target.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = -1;
  const int spawn_rc =
      ::posix_spawnp(&pid, target.program.c_str(), actions.get(), nullptr, argv.data(), environ);
  if (spawn_rc != 0) {
    const std::string cause = ErrnoMessage(spawn_rc);
    if (logger_ != nullptr) {
      logger_->Debug("spawn failed", {{"program", target.program},
                                      {"errno", std::to_string(spawn_rc)},
                                      {"cause", cause}});
    }
    return LaunchFailure(cause);
  }

  ScopedChild child(pid);
  if (logger_ != nullptr) {
    logger_->Debug("child spawned", {{"program", target.program},
                                     {"pid", std::to_string(pid)},
                                     {"argc", std::to_string(argv.size() - 1U)}});
  }

  // The child holds its own copies; keeping ours open would block EOF.
  stdout_pipe.write_end.Reset();
  stderr_pipe.write_end.Reset();

  InvocationOutcome outcome;
  std::string capture_error;
  if (!DrainPipes(stdout_pipe.read_end.Get(), stderr_pipe.read_end.Get(), outcome.stdout_text,
                  outcome.stderr_text, capture_error)) {
    if (logger_ != nullptr) {
      logger_->Error("child output capture incomplete",
                     {{"program", target.program}, {"error", capture_error}});
    }
  }
  // Closed before the wait so a child still writing gets SIGPIPE instead of
  // blocking on a full pipe.
  stdout_pipe.read_end.Reset();
  stderr_pipe.read_end.Reset();

  int raw_status = 0;
  if (!child.Wait(raw_status, error)) {
    if (logger_ != nullptr) {
      logger_->Error("child exit status unavailable",
                     {{"program", target.program}, {"error", error}});
    }
    outcome.status = InvocationStatus::kFailedNonZero;
    outcome.exit_code = -1;
    return outcome;
  }

  ClassifyChildExit(raw_status, capture_error, outcome);

  if (logger_ != nullptr) {
    logger_->Debug("child exited", {{"program", target.program},
                                    {"pid", std::to_string(pid)},
                                    {"exit_code", std::to_string(outcome.exit_code)},
                                    {"stdout_bytes", std::to_string(outcome.stdout_text.size())},
                                    {"stderr_bytes", std::to_string(outcome.stderr_text.size())}});
  }
  return outcome;
}

} // namespace garmin_coach::operations
