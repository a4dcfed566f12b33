#ifndef PROCESS_HANDLE_H
#define PROCESS_HANDLE_H

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "case_error.h"

struct SpawnOptions {
  std::vector<std::string> argv;  // argv[0] is resolved through PATH.
  std::filesystem::path working_dir;
  std::map<std::string, std::string> env;  // Overrides on top of the inherited environment.
};

/**
 * ProcessHandle - owns one child process and the read end of its output pipe.
 *
 * The child runs in its own process group with stdout and stderr merged into
 * one pipe, so output order is preserved exactly and signals reach every
 * process the child starts. Destroying a handle whose child has not been
 * reaped kills the group and reaps it.
 */
class ProcessHandle {
 public:
  using LineCallback = std::function<void(const std::string& line)>;

  enum class ReadStatus {
    Data,
    Timeout,
    Eof,
    Error,
  };

  ProcessHandle() = default;
  ~ProcessHandle();

  ProcessHandle(const ProcessHandle&) = delete;
  ProcessHandle& operator=(const ProcessHandle&) = delete;

  // Fails with Launch when the binary is missing or the spawn fails.
  bool Spawn(const SpawnOptions& options, CaseError* error);

  // Waits up to timeout for output and reports every complete line. At EOF a
  // trailing partial line is reported too.
  ReadStatus ReadLines(std::chrono::milliseconds timeout, const LineCallback& on_line);

  // Non-blocking reap. Returns true once the child has exited.
  bool PollExit(int* exit_code);
  // Blocking reap.
  int WaitExit();

  void Terminate();  // SIGTERM to the process group.
  void Kill();       // SIGKILL to the process group.

  pid_t Pid() const { return pid_; }
  bool Started() const { return pid_ > 0; }
  bool Exited() const { return reaped_; }
  int ExitCode() const { return exit_code_; }

 private:
  void Signal(int signo);
  void CloseOutput();
  void FlushPartial(const LineCallback& on_line);

  pid_t pid_ = -1;
  int out_fd_ = -1;
  bool reaped_ = false;
  int exit_code_ = -1;
  std::string pending_;
};

// Exit status as a shell reports it: the exit code, or 128 + signal number.
int DecodeWaitStatus(int status);

#endif  // PROCESS_HANDLE_H
