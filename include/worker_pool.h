#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

class LogService;

// Fixed-size pool of background threads draining a task queue.
class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(int workers, LogService* log = nullptr);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  bool Start();
  // Finishes the task in progress on each worker, drops queued tasks, joins.
  void Stop();
  bool Submit(Task task);

  bool IsRunning() const { return running_.load(); }
  size_t QueueSize() const;
  int WorkerCount() const { return workers_; }

 private:
  void WorkerLoop(int worker_id);

  int workers_;
  LogService* log_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_{false};

  mutable std::mutex queue_mutex_;
  std::condition_variable task_available_;
  std::queue<Task> tasks_;
  std::vector<std::thread> threads_;
};

#endif  // WORKER_POOL_H
