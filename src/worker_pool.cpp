#include "worker_pool.h"

#include <algorithm>
#include <exception>

#include "log_service.h"

WorkerPool::WorkerPool(int workers, LogService* log)
    : workers_(std::max(1, workers)), log_(log) {}

WorkerPool::~WorkerPool() {
  Stop();
}

bool WorkerPool::Start() {
  if (running_.load()) {
    return false;
  }
  shutdown_.store(false);
  running_.store(true);
  try {
    threads_.reserve(static_cast<size_t>(workers_));
    for (int i = 0; i < workers_; ++i) {
      threads_.emplace_back(&WorkerPool::WorkerLoop, this, i);
    }
  } catch (const std::exception& e) {
    if (log_) {
      log_->Error("pool", std::string("failed to start worker threads: ") + e.what());
    }
    Stop();
    return false;
  }
  return true;
}

void WorkerPool::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    shutdown_.store(true);
  }
  task_available_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();

  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!tasks_.empty()) {
    tasks_.pop();
  }
}

bool WorkerPool::Submit(Task task) {
  if (!task) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_.load() || shutdown_.load()) {
      return false;
    }
    tasks_.push(std::move(task));
  }
  task_available_.notify_one();
  return true;
}

size_t WorkerPool::QueueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return tasks_.size();
}

void WorkerPool::WorkerLoop(int worker_id) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      task_available_.wait(lock, [this] { return !tasks_.empty() || shutdown_.load(); });
      if (shutdown_.load()) {
        break;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }

    try {
      task();
    } catch (const std::exception& e) {
      if (log_) {
        log_->Error("pool", "worker " + std::to_string(worker_id) + " task failed: " + e.what());
      }
    } catch (...) {
      if (log_) {
        log_->Error("pool", "worker " + std::to_string(worker_id) +
                                " task failed: non-standard exception");
      }
    }
  }
}
