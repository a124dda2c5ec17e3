// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.


#pragma once

#include <concepts>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace fastpack::utils {

template <typename TMutex>
concept SharedMutex = requires(TMutex mutex) {
  mutex.lock();
  mutex.unlock();
  mutex.lock_shared();
  mutex.unlock_shared();
};

/// An object that is only reachable while its mutex is held. The extension
/// registry keeps its qualifier table in one:
///
///   objects_.Lock()->insert_or_assign(qualifier, handler);
///   objects_.WithReadLock([&](const auto &objects) { return objects.contains(qualifier); });
///
/// `ReadLock` and `WithReadLock` need a shared mutex and hold it in shared mode.
template <class T, class TMutex = std::mutex>
class Synchronized {
  // Pointer to the guarded object that owns the lock for its lifetime.
  template <class TObject, class TGuard>
  class Guarded {
   public:
    TObject *operator->() const { return object_; }
    TObject &operator*() const { return *object_; }

   private:
    friend class Synchronized;
    Guarded(TObject *object, TMutex &mutex) : object_(object), guard_(mutex) {}

    TObject *object_;
    TGuard guard_;
  };

 public:
  using LockedPtr = Guarded<T, std::unique_lock<TMutex>>;
  using ReadLockedPtr = Guarded<const T, std::shared_lock<TMutex>>;

  template <class... Args>
  explicit Synchronized(Args &&...args) : object_(std::forward<Args>(args)...) {}

  Synchronized(const Synchronized &) = delete;
  Synchronized(Synchronized &&) = delete;
  Synchronized &operator=(const Synchronized &) = delete;
  Synchronized &operator=(Synchronized &&) = delete;
  ~Synchronized() = default;

  LockedPtr Lock() { return LockedPtr(&object_, mutex_); }
  LockedPtr operator->() { return Lock(); }

  template <std::invocable<T &> TCallable>
  decltype(auto) WithLock(TCallable &&callable) {
    auto locked = Lock();
    return std::forward<TCallable>(callable)(*locked);
  }

  ReadLockedPtr ReadLock() const
  requires SharedMutex<TMutex>
  {
    return ReadLockedPtr(&object_, mutex_);
  }

  template <std::invocable<const T &> TCallable>
  decltype(auto) WithReadLock(TCallable &&callable) const
  requires SharedMutex<TMutex>
  {
    auto locked = ReadLock();
    return std::forward<TCallable>(callable)(*locked);
  }

 private:
  T object_;
  mutable TMutex mutex_;
};

}  // namespace fastpack::utils
