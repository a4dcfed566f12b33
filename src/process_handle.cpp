#include "process_handle.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    const std::string item(*entry);
    const size_t eq = item.find('=');
    const std::string key = item.substr(0, eq);
    if (overrides.count(key) == 0) {
      env.push_back(item);
    }
  }
  for (const auto& entry : overrides) {
    env.push_back(entry.first + "=" + entry.second);
  }
  return env;
}

std::vector<char*> ToCharArray(std::vector<std::string>& items) {
  std::vector<char*> out;
  out.reserve(items.size() + 1);
  for (std::string& item : items) {
    out.push_back(&item[0]);
  }
  out.push_back(nullptr);
  return out;
}
}  // namespace

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

ProcessHandle::~ProcessHandle() {
  if (pid_ > 0 && !reaped_) {
    Kill();
    WaitExit();
  }
  CloseOutput();
}

bool ProcessHandle::Spawn(const SpawnOptions& options, CaseError* error) {
  auto fail = [error](const std::string& message) {
    if (error) {
      *error = MakeError(ErrorKind::Launch, message);
    }
    return false;
  };
  if (pid_ > 0) {
    return fail("process already started");
  }
  if (options.argv.empty() || options.argv[0].empty()) {
    return fail("missing process args");
  }
  std::error_code ec;
  if (!options.working_dir.empty() && !std::filesystem::is_directory(options.working_dir, ec)) {
    return fail("working directory does not exist: " + options.working_dir.string());
  }

  int pipefd[2];
  if (pipe2(pipefd, O_CLOEXEC) != 0) {
    return fail(std::string("failed to open pipe: ") + std::strerror(errno));
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, pipefd[1], STDERR_FILENO);
  if (!options.working_dir.empty()) {
    posix_spawn_file_actions_addchdir_np(&actions, options.working_dir.c_str());
  }

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGPIPE);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                                      POSIX_SPAWN_SETSIGDEF);

  std::vector<std::string> args = options.argv;
  std::vector<char*> argv = ToCharArray(args);
  std::vector<std::string> env_items = BuildEnvironment(options.env);
  std::vector<char*> envp = ToCharArray(env_items);

  pid_t pid = 0;
  const int status = posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), envp.data());
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  close(pipefd[1]);

  if (status != 0) {
    close(pipefd[0]);
    return fail("failed to start " + options.argv[0] + ": " + std::strerror(status));
  }
  pid_ = pid;
  out_fd_ = pipefd[0];
  reaped_ = false;
  exit_code_ = -1;
  pending_.clear();
  return true;
}

ProcessHandle::ReadStatus ProcessHandle::ReadLines(std::chrono::milliseconds timeout,
                                                   const LineCallback& on_line) {
  if (out_fd_ < 0) {
    return ReadStatus::Eof;
  }
  pollfd pfd{};
  pfd.fd = out_fd_;
  pfd.events = POLLIN;
  const int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready < 0) {
    if (errno == EINTR) {
      return ReadStatus::Timeout;
    }
    return ReadStatus::Error;
  }
  if (ready == 0) {
    return ReadStatus::Timeout;
  }

  char buffer[4096];
  const ssize_t count = read(out_fd_, buffer, sizeof(buffer));
  if (count < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return ReadStatus::Timeout;
    }
    FlushPartial(on_line);
    CloseOutput();
    return ReadStatus::Error;
  }
  if (count == 0) {
    FlushPartial(on_line);
    CloseOutput();
    return ReadStatus::Eof;
  }

  pending_.append(buffer, static_cast<size_t>(count));
  size_t start = 0;
  size_t newline = 0;
  while ((newline = pending_.find('\n', start)) != std::string::npos) {
    std::string line = pending_.substr(start, newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (on_line) {
      on_line(line);
    }
    start = newline + 1;
  }
  pending_.erase(0, start);
  return ReadStatus::Data;
}

bool ProcessHandle::PollExit(int* exit_code) {
  if (pid_ <= 0) {
    return false;
  }
  if (!reaped_) {
    int status = 0;
    const pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
      reaped_ = true;
      exit_code_ = DecodeWaitStatus(status);
    } else if (result < 0 && errno == ECHILD) {
      reaped_ = true;
    }
  }
  if (reaped_ && exit_code) {
    *exit_code = exit_code_;
  }
  return reaped_;
}

int ProcessHandle::WaitExit() {
  if (pid_ <= 0) {
    return -1;
  }
  while (!reaped_) {
    int status = 0;
    const pid_t result = waitpid(pid_, &status, 0);
    if (result == pid_) {
      reaped_ = true;
      exit_code_ = DecodeWaitStatus(status);
    } else if (result < 0 && errno != EINTR) {
      reaped_ = true;
    }
  }
  return exit_code_;
}

void ProcessHandle::Terminate() {
  Signal(SIGTERM);
}

void ProcessHandle::Kill() {
  Signal(SIGKILL);
}

void ProcessHandle::Signal(int signo) {
  if (pid_ <= 0) {
    return;
  }
  // The group may outlive the leader when children keep running.
  if (kill(-pid_, signo) != 0 && !reaped_) {
    kill(pid_, signo);
  }
}

void ProcessHandle::CloseOutput() {
  if (out_fd_ >= 0) {
    close(out_fd_);
    out_fd_ = -1;
  }
}

void ProcessHandle::FlushPartial(const LineCallback& on_line) {
  if (pending_.empty()) {
    return;
  }
  std::string line;
  line.swap(pending_);
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (on_line) {
    on_line(line);
  }
}
