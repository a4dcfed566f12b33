#ifndef EXECUTION_CONTROLLER_H
#define EXECUTION_CONTROLLER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "case_error.h"
#include "job_types.h"

class CaseSession;
class EventDispatcher;
class JobRegistry;
class LogService;

enum class JobEventKind {
  StateChanged,
  Progress,
};

struct JobEvent {
  JobEventKind kind = JobEventKind::StateChanged;
  uint64_t job_id = 0;
  JobKind job_kind = JobKind::Other;
  std::string case_id;
  JobState state = JobState::Pending;
  ProgressEvent progress;  // Progress events only.
  std::optional<int> exit_code;
  CaseError error;
};

struct LaunchResult {
  bool ok = false;
  Job job;
  CaseError error;
};

/**
 * ExecutionController - runs external commands as cancellable jobs.
 *
 * Launch reserves the (case, kind) slot in the JobRegistry and returns at
 * once; a dedicated thread per job spawns each step, streams output lines as
 * progress events and reaps the process. Observers are called through the
 * EventDispatcher, in production order per job.
 *
 * Cancel asks the job thread to send SIGTERM to the process group, then
 * SIGKILL once the grace period expires. It never blocks the caller.
 */
class ExecutionController {
 public:
  using Observer = std::function<void(const JobEvent&)>;

  static constexpr std::chrono::milliseconds kDefaultCancelGrace{5000};

  ExecutionController(JobRegistry& registry, EventDispatcher& dispatcher, LogService* log,
                      std::chrono::milliseconds cancel_grace = kDefaultCancelGrace);
  ~ExecutionController();

  ExecutionController(const ExecutionController&) = delete;
  ExecutionController& operator=(const ExecutionController&) = delete;

  LaunchResult Launch(const CaseSession& session, JobKind kind, const CommandSpec& spec);
  LaunchResult Launch(const std::string& case_id, const std::filesystem::path& case_dir,
                      JobKind kind, const CommandSpec& spec);

  // No-op for unknown or finished jobs.
  void Cancel(uint64_t job_id);
  std::vector<uint64_t> CancelAllForCase(const std::string& case_id);

  // Blocks until the job thread finished. Returns the terminal snapshot, or
  // nothing on timeout or unknown id.
  std::optional<Job> WaitForJob(uint64_t job_id, std::chrono::milliseconds timeout);

  int Subscribe(uint64_t job_id, Observer observer);
  int SubscribeAll(Observer observer);
  void Unsubscribe(int token);

  // Cancels every job and joins every job thread. Launch fails afterwards.
  void Shutdown();

  std::chrono::milliseconds CancelGrace() const { return cancel_grace_; }

  struct Subscribers;

 private:
  struct Runtime {
    uint64_t job_id = 0;
    std::string case_id;
    JobKind kind = JobKind::Other;
    std::filesystem::path case_dir;
    CommandSpec spec;
    std::atomic<bool> cancel_requested{false};
    bool done = false;
    std::thread thread;
  };

  void RunJob(const std::shared_ptr<Runtime>& runtime);
  void RunSteps(const std::shared_ptr<Runtime>& runtime);
  void FinishJob(const std::shared_ptr<Runtime>& runtime, JobState state,
                 std::optional<int> exit_code, const CaseError& error);
  void PostEvent(const JobEvent& event);
  void ReapFinishedLocked();

  JobRegistry& registry_;
  EventDispatcher& dispatcher_;
  LogService* log_;
  std::chrono::milliseconds cancel_grace_;
  std::shared_ptr<Subscribers> subscribers_;

  std::mutex mutex_;
  std::condition_variable job_done_;
  std::map<uint64_t, std::shared_ptr<Runtime>> runtimes_;
  bool shut_down_ = false;
};

#endif  // EXECUTION_CONTROLLER_H
