#ifndef ASYNC_LOADER_H
#define ASYNC_LOADER_H

#include <any>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "case_error.h"
#include "worker_pool.h"

class EventDispatcher;
class LogService;

enum class LoadState {
  Pending,
  Running,
  Completed,
  Failed,
  Cancelled,
};

const char* LoadStateToken(LoadState state);

struct LoadOutcome {
  uint64_t request_id = 0;
  std::filesystem::path path;
  LoadState state = LoadState::Pending;
  std::any value;  // Set when Completed.
  CaseError error;  // Set when Failed.
  bool superseded = false;  // Cancelled by a newer load of the same path.

  // Null unless Completed with a value of type T.
  template <typename T>
  const T* Value() const {
    return std::any_cast<T>(&value);
  }
};

struct LoadRequestState;

// Caller-side reference to an in-flight load.
class LoadHandle {
 public:
  LoadHandle() = default;
  explicit LoadHandle(std::shared_ptr<LoadRequestState> state);

  uint64_t Id() const;
  LoadState State() const;
  // Cooperative. The outcome is still delivered, as Cancelled.
  void Cancel();
  bool Valid() const { return state_ != nullptr; }

 private:
  std::shared_ptr<LoadRequestState> state_;
};

/**
 * AsyncLoader - reads and decodes files on a worker pool.
 *
 * Every Load produces exactly one LoadOutcome, delivered to the observer
 * through the EventDispatcher (so on the interactive thread, in order).
 * A newer Load of the same path cancels the older one, whose outcome is
 * marked superseded. Cancellation is checked again at delivery time, so a
 * cancel that races with a finished decode still reports Cancelled. Loads
 * still queued when the loader is destroyed are dropped without an outcome.
 */
class AsyncLoader {
 public:
  // Returns false and fills error on malformed input. Exceptions are caught
  // and reported as decode failures.
  using Decoder = std::function<bool(const std::string& bytes, std::any* value, std::string* error)>;
  using Observer = std::function<void(const LoadOutcome&)>;

  AsyncLoader(EventDispatcher& dispatcher, int workers, LogService* log = nullptr);
  ~AsyncLoader();

  AsyncLoader(const AsyncLoader&) = delete;
  AsyncLoader& operator=(const AsyncLoader&) = delete;

  void SetObserver(Observer observer);

  LoadHandle Load(const std::filesystem::path& path, Decoder decoder);

  template <typename T>
  LoadHandle LoadAs(const std::filesystem::path& path,
                    std::function<bool(const std::string&, T*, std::string*)> decode) {
    return Load(path, [decode](const std::string& bytes, std::any* value, std::string* error) {
      T decoded{};
      if (!decode(bytes, &decoded, error)) {
        return false;
      }
      *value = std::move(decoded);
      return true;
    });
  }

  // Number of loads not yet delivered.
  size_t InFlight() const;

  struct Shared;

 private:
  EventDispatcher& dispatcher_;
  LogService* log_;
  std::shared_ptr<Shared> shared_;
  WorkerPool pool_;
};

#endif  // ASYNC_LOADER_H
