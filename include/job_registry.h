#ifndef JOB_REGISTRY_H
#define JOB_REGISTRY_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "case_error.h"
#include "job_types.h"

/**
 * JobRegistry - bookkeeping for active and finished jobs.
 *
 * At most one non-terminal job exists per (case id, job kind); TryReserve is
 * the only way to create a job and performs the check and the insert under
 * one lock. Terminal jobs move to a bounded history, oldest evicted first.
 * All accessors return copies.
 */
class JobRegistry {
 public:
  static constexpr size_t kDefaultHistoryCap = 50;
  static constexpr size_t kDefaultProgressCap = 10000;

  explicit JobRegistry(size_t history_cap = kDefaultHistoryCap,
                       size_t progress_cap = kDefaultProgressCap);

  JobRegistry(const JobRegistry&) = delete;
  JobRegistry& operator=(const JobRegistry&) = delete;

  // Inserts a Pending job or fails with DuplicateJob.
  bool TryReserve(const std::string& case_id, JobKind kind, const std::string& label,
                  int step_count, Job* reserved, CaseError* error);

  // Pending -> Running.
  bool MarkRunning(uint64_t id, CaseError* error);
  bool SetCurrentStep(uint64_t id, int step);

  // Stamps the sequence number and stores the event. False for unknown or
  // finished jobs.
  bool AppendProgress(uint64_t id, ProgressEvent* event);

  // Non-terminal -> terminal. Moves the job to history.
  bool Finish(uint64_t id, JobState state, std::optional<int> exit_code, const CaseError& error,
              Job* finished);

  std::optional<Job> Find(uint64_t id) const;
  std::optional<uint64_t> ActiveJobId(const std::string& case_id, JobKind kind) const;
  std::vector<Job> ActiveJobs() const;
  std::vector<uint64_t> ActiveJobIdsForCase(const std::string& case_id) const;
  std::vector<Job> History() const;

  size_t HistoryCap() const;
  void SetHistoryCap(size_t cap);

 private:
  using SlotKey = std::pair<std::string, JobKind>;

  void TrimHistoryLocked();

  std::map<uint64_t, Job> active_;
  std::map<SlotKey, uint64_t> slots_;
  std::deque<Job> history_;
  size_t history_cap_;
  size_t progress_cap_;
  uint64_t next_id_ = 1;
  mutable std::mutex mutex_;
};

#endif  // JOB_REGISTRY_H
