#include "service_registry.h"

#include <algorithm>

ServiceRegistry::~ServiceRegistry() {
  Reset();
}

void ServiceRegistry::Seal() {
  std::lock_guard<std::mutex> lock(mutex_);
  sealed_ = true;
}

bool ServiceRegistry::IsSealed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sealed_;
}

void ServiceRegistry::Reset() {
  std::vector<Entry> doomed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    doomed.reserve(services_.size());
    for (auto& entry : services_) {
      doomed.push_back(std::move(entry.second));
    }
    services_.clear();
    sealed_ = false;
  }
  std::sort(doomed.begin(), doomed.end(),
            [](const Entry& a, const Entry& b) { return a.sequence > b.sequence; });
  // Destructors run outside the lock, in reverse registration order.
  for (auto& entry : doomed) {
    entry.instance.reset();
  }
}

std::vector<std::string> ServiceRegistry::Keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(services_.size());
  for (const auto& entry : services_) {
    keys.push_back(entry.second.label);
  }
  return keys;
}

size_t ServiceRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return services_.size();
}
