#include "execution_controller.h"

#include <exception>
#include <fstream>
#include <set>
#include <system_error>
#include <utility>

#include "case_session.h"
#include "event_dispatcher.h"
#include "job_registry.h"
#include "log_service.h"
#include "process_handle.h"
#include "progress_parser.h"

struct ExecutionController::Subscribers {
  std::mutex mutex;
  int next_token = 1;
  std::map<int, std::pair<uint64_t, Observer>> by_token;  // job id 0 = every job.
};

namespace {
constexpr std::chrono::milliseconds kPollInterval{50};
// Output may stay open after the leader exits when a descendant holds the pipe.
constexpr std::chrono::milliseconds kDrainAfterExit{500};

void Dispatch(const std::shared_ptr<ExecutionController::Subscribers>& subscribers,
              const JobEvent& event) {
  std::vector<ExecutionController::Observer> targets;
  {
    std::lock_guard<std::mutex> lock(subscribers->mutex);
    for (const auto& entry : subscribers->by_token) {
      if (entry.second.first == 0 || entry.second.first == event.job_id) {
        targets.push_back(entry.second.second);
      }
    }
  }
  for (const auto& observer : targets) {
    if (observer) {
      observer(event);
    }
  }
}
}  // namespace

ExecutionController::ExecutionController(JobRegistry& registry, EventDispatcher& dispatcher,
                                         LogService* log, std::chrono::milliseconds cancel_grace)
    : registry_(registry),
      dispatcher_(dispatcher),
      log_(log),
      cancel_grace_(cancel_grace),
      subscribers_(std::make_shared<Subscribers>()) {}

ExecutionController::~ExecutionController() {
  Shutdown();
}

LaunchResult ExecutionController::Launch(const CaseSession& session, JobKind kind,
                                         const CommandSpec& spec) {
  return Launch(session.Id(), session.Path(), kind, spec);
}

LaunchResult ExecutionController::Launch(const std::string& case_id,
                                         const std::filesystem::path& case_dir, JobKind kind,
                                         const CommandSpec& spec) {
  LaunchResult result;
  if (spec.steps.empty()) {
    result.error = MakeError(ErrorKind::Launch, "command has no steps");
    return result;
  }
  for (const auto& step : spec.steps) {
    if (step.argv.empty()) {
      result.error = MakeError(ErrorKind::Launch, "command step has no arguments");
      return result;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_) {
    result.error = MakeError(ErrorKind::Launch, "execution controller is shut down");
    return result;
  }
  ReapFinishedLocked();

  const std::string label = spec.steps.front().label.empty() ? spec.steps.front().argv.front()
                                                             : spec.steps.front().label;
  if (!registry_.TryReserve(case_id, kind, label, static_cast<int>(spec.steps.size()),
                            &result.job, &result.error)) {
    if (log_) {
      log_->Warning("job", result.error.message);
    }
    return result;
  }

  auto runtime = std::make_shared<Runtime>();
  runtime->job_id = result.job.id;
  runtime->case_id = case_id;
  runtime->kind = kind;
  runtime->case_dir = case_dir;
  runtime->spec = spec;
  try {
    runtime->thread = std::thread(&ExecutionController::RunJob, this, runtime);
  } catch (const std::system_error& e) {
    result.error = MakeError(ErrorKind::Launch, std::string("failed to start job thread: ") +
                                                    e.what());
    registry_.Finish(result.job.id, JobState::Failed, std::nullopt, result.error, &result.job);
    return result;
  }
  runtimes_[result.job.id] = runtime;
  result.ok = true;
  if (log_) {
    log_->Info("job", "launched " + std::string(JobKindToken(kind)) + " job " +
                          std::to_string(result.job.id) + " for " + case_id + ": " + label);
  }
  return result;
}

void ExecutionController::Cancel(uint64_t job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runtimes_.find(job_id);
  if (it == runtimes_.end() || it->second->done) {
    return;
  }
  if (!it->second->cancel_requested.exchange(true) && log_) {
    log_->Info("job", "cancel requested for job " + std::to_string(job_id));
  }
}

std::vector<uint64_t> ExecutionController::CancelAllForCase(const std::string& case_id) {
  std::vector<uint64_t> ids = registry_.ActiveJobIdsForCase(case_id);
  for (uint64_t id : ids) {
    Cancel(id);
  }
  return ids;
}

std::optional<Job> ExecutionController::WaitForJob(uint64_t job_id,
                                                   std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto it = runtimes_.find(job_id);
  if (it != runtimes_.end()) {
    std::shared_ptr<Runtime> runtime = it->second;
    if (!job_done_.wait_for(lock, timeout, [&runtime] { return runtime->done; })) {
      return std::nullopt;
    }
  }
  lock.unlock();
  std::optional<Job> job = registry_.Find(job_id);
  if (job && !IsTerminal(job->state)) {
    return std::nullopt;
  }
  return job;
}

int ExecutionController::Subscribe(uint64_t job_id, Observer observer) {
  std::lock_guard<std::mutex> lock(subscribers_->mutex);
  const int token = subscribers_->next_token++;
  subscribers_->by_token[token] = std::make_pair(job_id, std::move(observer));
  return token;
}

int ExecutionController::SubscribeAll(Observer observer) {
  return Subscribe(0, std::move(observer));
}

void ExecutionController::Unsubscribe(int token) {
  std::lock_guard<std::mutex> lock(subscribers_->mutex);
  subscribers_->by_token.erase(token);
}

void ExecutionController::Shutdown() {
  std::map<uint64_t, std::shared_ptr<Runtime>> runtimes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_ = true;
    runtimes.swap(runtimes_);
  }
  for (auto& entry : runtimes) {
    entry.second->cancel_requested.store(true);
  }
  for (auto& entry : runtimes) {
    if (entry.second->thread.joinable()) {
      entry.second->thread.join();
    }
  }
}

void ExecutionController::RunJob(const std::shared_ptr<Runtime>& runtime) {
  try {
    RunSteps(runtime);
  } catch (const std::exception& e) {
    if (log_) {
      log_->Error("job", "job " + std::to_string(runtime->job_id) + " runner failed: " + e.what());
    }
    FinishJob(runtime, JobState::Failed, std::nullopt,
              MakeError(ErrorKind::ProcessFailure, std::string("job runner failed: ") + e.what()));
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    runtime->done = true;
  }
  job_done_.notify_all();
}

void ExecutionController::RunSteps(const std::shared_ptr<Runtime>& runtime) {
  const uint64_t id = runtime->job_id;
  const CommandSpec& spec = runtime->spec;
  bool running = false;

  // Each log file starts empty for a new run; steps sharing one append.
  std::set<std::string> truncated;
  for (const auto& step : spec.steps) {
    if (!step.log_name.empty() && truncated.insert(step.log_name).second) {
      std::ofstream(runtime->case_dir / step.log_name, std::ios::trunc);
    }
  }

  for (size_t index = 0; index < spec.steps.size(); ++index) {
    const CommandStep& step = spec.steps[index];
    if (runtime->cancel_requested.load()) {
      FinishJob(runtime, JobState::Cancelled, std::nullopt,
                MakeError(ErrorKind::Cancelled, "cancelled before step " + std::to_string(index)));
      return;
    }
    registry_.SetCurrentStep(id, static_cast<int>(index));

    SpawnOptions options;
    options.argv = step.argv;
    options.working_dir = step.working_subdir.empty() ? runtime->case_dir
                                                      : runtime->case_dir / step.working_subdir;
    options.env = spec.env;

    ProcessHandle process;
    CaseError spawn_error;
    if (!process.Spawn(options, &spawn_error)) {
      if (log_) {
        log_->Error("job", "job " + std::to_string(id) + ": " + spawn_error.message);
      }
      FinishJob(runtime, JobState::Failed, std::nullopt, spawn_error);
      return;
    }
    if (!running) {
      CaseError transition_error;
      if (!registry_.MarkRunning(id, &transition_error)) {
        FinishJob(runtime, JobState::Failed, std::nullopt, transition_error);
        return;
      }
      running = true;
      JobEvent event;
      event.kind = JobEventKind::StateChanged;
      event.job_id = id;
      event.job_kind = runtime->kind;
      event.case_id = runtime->case_id;
      event.state = JobState::Running;
      PostEvent(event);
    }
    if (log_) {
      log_->Info("job", "job " + std::to_string(id) + " step " + std::to_string(index + 1) + "/" +
                            std::to_string(spec.steps.size()) + " pid " +
                            std::to_string(process.Pid()) + ": " + step.label);
    }

    std::ofstream log_file;
    if (!step.log_name.empty()) {
      log_file.open(runtime->case_dir / step.log_name, std::ios::app);
      if (!log_file.is_open() && log_) {
        log_->Warning("job", "cannot open log file " + step.log_name);
      }
    }

    auto on_line = [&](const std::string& line) {
      ProgressEvent progress;
      progress.timestamp = std::chrono::system_clock::now();
      progress.step_index = static_cast<int>(index);
      progress.text = line;
      ParseProgressLine(&progress);
      if (log_file.is_open()) {
        log_file << line << '\n';
      }
      if (!registry_.AppendProgress(id, &progress)) {
        return;
      }
      JobEvent event;
      event.kind = JobEventKind::Progress;
      event.job_id = id;
      event.job_kind = runtime->kind;
      event.case_id = runtime->case_id;
      event.state = JobState::Running;
      event.progress = progress;
      PostEvent(event);
    };

    bool term_sent = false;
    bool kill_sent = false;
    bool cancelled = false;
    bool output_open = true;
    std::chrono::steady_clock::time_point kill_deadline;
    std::optional<std::chrono::steady_clock::time_point> exited_at;
    int exit_code = -1;

    while (true) {
      if (runtime->cancel_requested.load() && !process.Exited()) {
        if (!term_sent) {
          cancelled = true;
          term_sent = true;
          process.Terminate();
          kill_deadline = std::chrono::steady_clock::now() + cancel_grace_;
        } else if (!kill_sent && std::chrono::steady_clock::now() >= kill_deadline) {
          kill_sent = true;
          if (log_) {
            log_->Warning("job", "job " + std::to_string(id) +
                                     " ignored SIGTERM, sending SIGKILL");
          }
          process.Kill();
        }
      }

      if (output_open) {
        const ProcessHandle::ReadStatus status = process.ReadLines(kPollInterval, on_line);
        if (status == ProcessHandle::ReadStatus::Eof ||
            status == ProcessHandle::ReadStatus::Error) {
          output_open = false;
        }
      } else {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }

      if (!process.Exited() && process.PollExit(&exit_code)) {
        exited_at = std::chrono::steady_clock::now();
      }
      if (process.Exited()) {
        if (!output_open) {
          break;
        }
        if (exited_at && std::chrono::steady_clock::now() - *exited_at > kDrainAfterExit) {
          // A descendant still holds the pipe; take the whole group down.
          process.Kill();
          while (process.ReadLines(kPollInterval, on_line) == ProcessHandle::ReadStatus::Data) {
          }
          break;
        }
      }
    }
    exit_code = process.ExitCode();
    if (log_file.is_open()) {
      log_file.flush();
    }

    if (cancelled) {
      if (log_) {
        log_->Info("job", "job " + std::to_string(id) + " cancelled (exit " +
                              std::to_string(exit_code) + ")");
      }
      FinishJob(runtime, JobState::Cancelled, exit_code,
                MakeError(ErrorKind::Cancelled, "cancelled"));
      return;
    }
    if (exit_code != 0) {
      CaseError failure = MakeError(ErrorKind::ProcessFailure,
                                    "step " + std::to_string(index + 1) + " failed: " + step.label);
      failure.exit_code = exit_code;
      FinishJob(runtime, JobState::Failed, exit_code, failure);
      return;
    }
  }
  FinishJob(runtime, JobState::Succeeded, 0, CaseError());
}

void ExecutionController::FinishJob(const std::shared_ptr<Runtime>& runtime, JobState state,
                                    std::optional<int> exit_code, const CaseError& error) {
  Job finished;
  if (!registry_.Finish(runtime->job_id, state, exit_code, error, &finished)) {
    return;
  }
  if (log_) {
    std::string message = "job " + std::to_string(finished.id) + " " + JobStateToken(state);
    if (!error.ok()) {
      message += ": " + DescribeError(error);
    }
    if (state == JobState::Failed) {
      log_->Error("job", message);
    } else {
      log_->Info("job", message);
    }
  }
  JobEvent event;
  event.kind = JobEventKind::StateChanged;
  event.job_id = finished.id;
  event.job_kind = finished.kind;
  event.case_id = finished.case_id;
  event.state = state;
  event.exit_code = exit_code;
  event.error = error;
  PostEvent(event);
}

void ExecutionController::PostEvent(const JobEvent& event) {
  std::shared_ptr<Subscribers> subscribers = subscribers_;
  dispatcher_.Post([subscribers, event]() { Dispatch(subscribers, event); });
}

void ExecutionController::ReapFinishedLocked() {
  for (auto it = runtimes_.begin(); it != runtimes_.end();) {
    if (it->second->done) {
      if (it->second->thread.joinable()) {
        it->second->thread.join();
      }
      it = runtimes_.erase(it);
    } else {
      ++it;
    }
  }
}
