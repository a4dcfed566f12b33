#include "async_loader.h"

#include <exception>
#include <utility>

#include "event_dispatcher.h"
#include "file_utils.h"
#include "log_service.h"

struct LoadRequestState {
  uint64_t id = 0;
  std::filesystem::path path;
  std::atomic<LoadState> state{LoadState::Pending};
  std::atomic<bool> cancelled{false};
  std::atomic<bool> superseded{false};
};

struct AsyncLoader::Shared {
  std::mutex mutex;
  Observer observer;
  std::map<std::filesystem::path, std::shared_ptr<LoadRequestState>> latest;
  size_t in_flight = 0;
  uint64_t next_id = 1;
};

namespace {
void Deliver(const std::shared_ptr<AsyncLoader::Shared>& shared,
             const std::shared_ptr<LoadRequestState>& request, LoadOutcome outcome) {
  if (request->cancelled.load() && outcome.state != LoadState::Cancelled) {
    outcome.state = LoadState::Cancelled;
    outcome.value.reset();
    outcome.error = CaseError();
  }
  if (outcome.state == LoadState::Cancelled) {
    outcome.superseded = request->superseded.load();
  }
  request->state.store(outcome.state);

  AsyncLoader::Observer observer;
  {
    std::lock_guard<std::mutex> lock(shared->mutex);
    auto it = shared->latest.find(request->path);
    if (it != shared->latest.end() && it->second == request) {
      shared->latest.erase(it);
    }
    if (shared->in_flight > 0) {
      --shared->in_flight;
    }
    observer = shared->observer;
  }
  if (observer) {
    observer(outcome);
  }
}

LoadOutcome RunDecode(const LoadRequestState& request, const AsyncLoader::Decoder& decoder) {
  LoadOutcome outcome;
  outcome.request_id = request.id;
  outcome.path = request.path;
  if (request.cancelled.load()) {
    outcome.state = LoadState::Cancelled;
    return outcome;
  }

  std::string bytes;
  std::string message;
  if (!ReadFileToString(request.path, &bytes, &message)) {
    outcome.state = LoadState::Failed;
    outcome.error = MakeError(ErrorKind::IO, message);
    return outcome;
  }
  if (request.cancelled.load()) {
    outcome.state = LoadState::Cancelled;
    return outcome;
  }

  try {
    if (decoder(bytes, &outcome.value, &message)) {
      outcome.state = LoadState::Completed;
    } else {
      outcome.state = LoadState::Failed;
      outcome.value.reset();
      outcome.error = MakeError(ErrorKind::Decode,
                                message.empty() ? "decode failed: " + request.path.string() : message);
    }
  } catch (const std::exception& e) {
    outcome.state = LoadState::Failed;
    outcome.value.reset();
    outcome.error = MakeError(ErrorKind::Decode, std::string("decoder threw: ") + e.what());
  } catch (...) {
    outcome.state = LoadState::Failed;
    outcome.value.reset();
    outcome.error = MakeError(ErrorKind::Decode, "decoder threw");
  }
  return outcome;
}
}  // namespace

const char* LoadStateToken(LoadState state) {
  switch (state) {
    case LoadState::Pending:
      return "pending";
    case LoadState::Running:
      return "running";
    case LoadState::Completed:
      return "completed";
    case LoadState::Failed:
      return "failed";
    case LoadState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

LoadHandle::LoadHandle(std::shared_ptr<LoadRequestState> state) : state_(std::move(state)) {}

uint64_t LoadHandle::Id() const {
  return state_ ? state_->id : 0;
}

LoadState LoadHandle::State() const {
  return state_ ? state_->state.load() : LoadState::Cancelled;
}

void LoadHandle::Cancel() {
  if (state_) {
    state_->cancelled.store(true);
  }
}

AsyncLoader::AsyncLoader(EventDispatcher& dispatcher, int workers, LogService* log)
    : dispatcher_(dispatcher), log_(log), shared_(std::make_shared<Shared>()), pool_(workers, log) {
  if (!pool_.Start() && log_) {
    log_->Error("loader", "failed to start loader workers");
  }
}

AsyncLoader::~AsyncLoader() {
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    for (auto& entry : shared_->latest) {
      entry.second->cancelled.store(true);
    }
  }
  pool_.Stop();
}

void AsyncLoader::SetObserver(Observer observer) {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  shared_->observer = std::move(observer);
}

LoadHandle AsyncLoader::Load(const std::filesystem::path& path, Decoder decoder) {
  auto request = std::make_shared<LoadRequestState>();
  request->path = path;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    request->id = shared_->next_id++;
    auto it = shared_->latest.find(path);
    if (it != shared_->latest.end()) {
      it->second->superseded.store(true);
      it->second->cancelled.store(true);
      it->second = request;
    } else {
      shared_->latest.emplace(path, request);
    }
    ++shared_->in_flight;
  }

  std::shared_ptr<Shared> shared = shared_;
  EventDispatcher* dispatcher = &dispatcher_;
  const bool queued = pool_.Submit([shared, request, dispatcher, decoder = std::move(decoder)]() {
    request->state.store(LoadState::Running);
    LoadOutcome outcome = RunDecode(*request, decoder);
    dispatcher->Post([shared, request, outcome]() { Deliver(shared, request, outcome); });
  });
  if (!queued) {
    LoadOutcome outcome;
    outcome.request_id = request->id;
    outcome.path = path;
    outcome.state = LoadState::Failed;
    outcome.error = MakeError(ErrorKind::IO, "loader is not running");
    dispatcher_.Post([shared, request, outcome]() { Deliver(shared, request, outcome); });
  }
  if (log_) {
    log_->Info("loader", "load #" + std::to_string(request->id) + " " + path.string());
  }
  return LoadHandle(request);
}

size_t AsyncLoader::InFlight() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->in_flight;
}
