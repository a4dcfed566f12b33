#ifndef SERVICE_REGISTRY_H
#define SERVICE_REGISTRY_H

#include <any>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#include "case_error.h"

/**
 * ServiceRegistry - explicit container of process-wide services.
 *
 * Services are keyed by C++ type plus an optional instance name and are
 * registered once during startup, leaf services first. The registry owns the
 * instances. It is passed to components explicitly; there is no global
 * accessor. After Seal() the registry is treated as read-only.
 *
 * Registration conflicts and lookups of missing keys throw
 * ConfigurationError: both are programming errors.
 */
class ServiceRegistry {
 public:
  struct RegisterOptions {
    std::string name;
    bool allow_replace = false;  // Test setup only.
  };

  ServiceRegistry() = default;
  // Destroys services in reverse registration order.
  ~ServiceRegistry();
  ServiceRegistry(const ServiceRegistry&) = delete;
  ServiceRegistry& operator=(const ServiceRegistry&) = delete;

  template <typename T>
  T& Register(std::shared_ptr<T> instance, const RegisterOptions& opts = {}) {
    if (!instance) {
      throw ConfigurationError("null instance registered for " + DescribeKey<T>(opts.name));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const StateKey key = MakeKey<T>(opts.name);
    auto it = services_.find(key);
    if (it != services_.end() && !opts.allow_replace) {
      throw ConfigurationError("service already registered: " + DescribeKey<T>(opts.name));
    }
    if (sealed_ && !opts.allow_replace) {
      throw ConfigurationError("registry is sealed, cannot register " +
                               DescribeKey<T>(opts.name));
    }
    T& ref = *instance;
    Entry entry{std::any(std::move(instance)), DescribeKey<T>(opts.name), next_sequence_++};
    if (it != services_.end()) {
      it->second = std::move(entry);
    } else {
      services_.emplace(key, std::move(entry));
    }
    return ref;
  }

  template <typename T, typename... Args>
  T& Emplace(Args&&... args) {
    return Register<T>(std::make_shared<T>(std::forward<Args>(args)...));
  }

  // Returns the instance or throws ConfigurationError naming the missing key.
  template <typename T>
  T& Resolve(const std::string& name = "") const {
    return *ResolveShared<T>(name);
  }

  template <typename T>
  std::shared_ptr<T> ResolveShared(const std::string& name = "") const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = services_.find(MakeKey<T>(name));
    if (it == services_.end()) {
      throw ConfigurationError("service not registered: " + DescribeKey<T>(name));
    }
    return std::any_cast<std::shared_ptr<T>>(it->second.instance);
  }

  template <typename T>
  bool Has(const std::string& name = "") const {
    std::lock_guard<std::mutex> lock(mutex_);
    return services_.find(MakeKey<T>(name)) != services_.end();
  }

  template <typename T>
  bool Unregister(const std::string& name = "") {
    std::lock_guard<std::mutex> lock(mutex_);
    return services_.erase(MakeKey<T>(name)) > 0;
  }

  // Disallow further registration (except allow_replace) once startup is done.
  void Seal();
  bool IsSealed() const;

  // Clears every registration, newest first, and unseals.
  void Reset();

  std::vector<std::string> Keys() const;
  size_t Size() const;

 private:
  using StateKey = std::pair<std::type_index, std::string>;

  struct Entry {
    std::any instance;
    std::string label;
    uint64_t sequence = 0;
  };

  template <typename T>
  static StateKey MakeKey(const std::string& name) {
    return std::make_pair(std::type_index(typeid(T)), name);
  }

  template <typename T>
  static std::string DescribeKey(const std::string& name) {
    std::string label = typeid(T).name();
    if (!name.empty()) {
      label += "#" + name;
    }
    return label;
  }

  std::map<StateKey, Entry> services_;
  bool sealed_ = false;
  uint64_t next_sequence_ = 0;
  mutable std::mutex mutex_;
};

#endif  // SERVICE_REGISTRY_H
