#ifndef EVENT_DISPATCHER_H
#define EVENT_DISPATCHER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

class LogService;

// FIFO hand-off from background threads to the interactive thread.
//
// Background workers Post() callbacks; the interactive thread calls Drain()
// once per frame (or WaitAndDrain() in headless loops). Callbacks run in
// posting order and never concurrently with each other. A callback that
// throws is logged and the rest of its batch still runs. Draining from inside
// a callback is not allowed; such a nested call runs nothing and returns 0.
class EventDispatcher {
 public:
  using Callback = std::function<void()>;

  explicit EventDispatcher(LogService* log = nullptr);
  EventDispatcher(const EventDispatcher&) = delete;
  EventDispatcher& operator=(const EventDispatcher&) = delete;

  void Post(Callback callback);

  // Runs every callback queued at call time. Returns the number executed.
  size_t Drain();

  // Blocks up to timeout for at least one callback, then drains.
  size_t WaitAndDrain(std::chrono::milliseconds timeout);

  // Drains repeatedly until predicate() holds or timeout expires.
  bool PumpUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout);

  size_t Pending() const;

  // The interactive thread is the one that constructed the dispatcher until
  // rebound (e.g. when the UI loop starts on another thread).
  void BindToCurrentThread();
  bool IsInteractiveThread() const;

 private:
  void ReportFailure(const std::string& message) const;

  std::deque<Callback> queue_;
  LogService* log_;
  std::thread::id owner_;
  std::thread::id draining_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::mutex drain_mutex_;
};

#endif  // EVENT_DISPATCHER_H
