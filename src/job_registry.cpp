#include "job_registry.h"

#include <algorithm>
#include <chrono>
#include <cstddef>

JobRegistry::JobRegistry(size_t history_cap, size_t progress_cap)
    : history_cap_(std::max<size_t>(1, history_cap)),
      progress_cap_(std::max<size_t>(1, progress_cap)) {}

bool JobRegistry::TryReserve(const std::string& case_id, JobKind kind, const std::string& label,
                             int step_count, Job* reserved, CaseError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SlotKey key(case_id, kind);
  auto slot = slots_.find(key);
  if (slot != slots_.end()) {
    if (error) {
      *error = MakeError(ErrorKind::DuplicateJob,
                         std::string("a ") + JobKindToken(kind) + " job is already active for " +
                             case_id + " (job " + std::to_string(slot->second) + ")");
    }
    return false;
  }
  Job job;
  job.id = next_id_++;
  job.kind = kind;
  job.case_id = case_id;
  job.label = label;
  job.state = JobState::Pending;
  job.created_at = std::chrono::system_clock::now();
  job.step_count = step_count;
  slots_[key] = job.id;
  auto inserted = active_.emplace(job.id, std::move(job));
  if (reserved) {
    *reserved = inserted.first->second;
  }
  return true;
}

bool JobRegistry::MarkRunning(uint64_t id, CaseError* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end() || it->second.state != JobState::Pending) {
    if (error) {
      *error = MakeError(ErrorKind::Configuration,
                         "job " + std::to_string(id) + " is not pending");
    }
    return false;
  }
  it->second.state = JobState::Running;
  it->second.started_at = std::chrono::system_clock::now();
  return true;
}

bool JobRegistry::SetCurrentStep(uint64_t id, int step) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end()) {
    return false;
  }
  it->second.current_step = step;
  return true;
}

bool JobRegistry::AppendProgress(uint64_t id, ProgressEvent* event) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end() || !event) {
    return false;
  }
  Job& job = it->second;
  event->sequence = job.dropped_events + job.progress.size() + 1;
  job.progress.push_back(*event);
  while (job.progress.size() > progress_cap_) {
    job.progress.pop_front();
    ++job.dropped_events;
  }
  return true;
}

bool JobRegistry::Finish(uint64_t id, JobState state, std::optional<int> exit_code,
                         const CaseError& error, Job* finished) {
  if (!IsTerminal(state)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it == active_.end()) {
    return false;
  }
  Job job = std::move(it->second);
  active_.erase(it);
  slots_.erase(SlotKey(job.case_id, job.kind));

  job.state = state;
  job.exit_code = exit_code;
  job.error = error;
  job.ended_at = std::chrono::system_clock::now();
  if (finished) {
    *finished = job;
  }
  history_.push_back(std::move(job));
  TrimHistoryLocked();
  return true;
}

std::optional<Job> JobRegistry::Find(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = active_.find(id);
  if (it != active_.end()) {
    return it->second;
  }
  for (auto h = history_.rbegin(); h != history_.rend(); ++h) {
    if (h->id == id) {
      return *h;
    }
  }
  return std::nullopt;
}

std::optional<uint64_t> JobRegistry::ActiveJobId(const std::string& case_id, JobKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = slots_.find(SlotKey(case_id, kind));
  if (it == slots_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Job> JobRegistry::ActiveJobs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> jobs;
  jobs.reserve(active_.size());
  for (const auto& entry : active_) {
    jobs.push_back(entry.second);
  }
  return jobs;
}

std::vector<uint64_t> JobRegistry::ActiveJobIdsForCase(const std::string& case_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint64_t> ids;
  for (const auto& entry : active_) {
    if (entry.second.case_id == case_id) {
      ids.push_back(entry.first);
    }
  }
  return ids;
}

std::vector<Job> JobRegistry::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<Job>(history_.begin(), history_.end());
}

size_t JobRegistry::HistoryCap() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_cap_;
}

void JobRegistry::SetHistoryCap(size_t cap) {
  std::lock_guard<std::mutex> lock(mutex_);
  history_cap_ = std::max<size_t>(1, cap);
  TrimHistoryLocked();
}

void JobRegistry::TrimHistoryLocked() {
  while (history_.size() > history_cap_) {
    history_.pop_front();
  }
}
