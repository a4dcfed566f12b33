#include "event_dispatcher.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

#include "log_service.h"

EventDispatcher::EventDispatcher(LogService* log)
    : log_(log), owner_(std::this_thread::get_id()) {}

void EventDispatcher::Post(Callback callback) {
  if (!callback) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(callback));
  }
  ready_.notify_all();
}

size_t EventDispatcher::Drain() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (draining_ == std::this_thread::get_id()) {
      return 0;
    }
  }
  // Serializes delivery even if two threads pump by mistake.
  std::lock_guard<std::mutex> drain_lock(drain_mutex_);
  std::deque<Callback> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(queue_);
    draining_ = std::this_thread::get_id();
  }
  for (auto& callback : batch) {
    try {
      callback();
    } catch (const std::exception& e) {
      ReportFailure(std::string("event callback failed: ") + e.what());
    } catch (...) {
      ReportFailure("event callback failed: non-standard exception");
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    draining_ = std::thread::id();
  }
  return batch.size();
}

void EventDispatcher::ReportFailure(const std::string& message) const {
  if (log_) {
    log_->Error("dispatch", message);
  } else {
    std::cerr << "error: " << message << "\n";
  }
}

size_t EventDispatcher::WaitAndDrain(std::chrono::milliseconds timeout) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
  }
  return Drain();
}

bool EventDispatcher::PumpUntil(const std::function<bool()>& predicate,
                                std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  Drain();
  while (!predicate()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    WaitAndDrain(std::min(remaining, std::chrono::milliseconds(20)));
  }
  return true;
}

size_t EventDispatcher::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void EventDispatcher::BindToCurrentThread() {
  std::lock_guard<std::mutex> lock(mutex_);
  owner_ = std::this_thread::get_id();
}

bool EventDispatcher::IsInteractiveThread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return owner_ == std::this_thread::get_id();
}
