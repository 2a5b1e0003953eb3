#pragma once

// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace core {

class Mutex;

// ---------------------------------------------------------------------------
// Lock-order checking (debug builds only)
// ---------------------------------------------------------------------------

#ifndef NDEBUG

/// Reports a lock acquired out of construction order on stderr.
void potential_deadlock_detected(
    const std::string& held_name, uint64_t held_order,
    const std::string& requested_name, uint64_t requested_order);

void debug_lock_push(const void* id, const std::string& name, uint64_t order);
void debug_lock_pop(const void* id);

uint64_t next_mutex_order_id();

#endif  // !NDEBUG

// ---------------------------------------------------------------------------
// Mutex
// ---------------------------------------------------------------------------

/// std::mutex with a name and, in debug builds, an order ID.  A thread must
/// acquire Mutex/SharedMutex instances in increasing order ID (i.e. the
/// order they were constructed in); violations are reported.
class Mutex {
public:
    explicit Mutex(std::string_view name = "")
        : name_(name)
#ifndef NDEBUG
        , order_(next_mutex_order_id())
#endif
    {
    }

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock()
    {
#ifndef NDEBUG
        debug_lock_push(this, name_, order_);
#endif
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
#ifndef NDEBUG
        debug_lock_pop(this);
#endif
    }

    const std::string& name() const noexcept { return name_; }

private:
    std::mutex mutex_;
    std::string name_;
#ifndef NDEBUG
    uint64_t order_;
#endif
};

// ---------------------------------------------------------------------------
// SharedMutex
// ---------------------------------------------------------------------------

/// std::shared_mutex wrapper.  Only the exclusive path takes part in order
/// checking; readers never block each other.
class SharedMutex {
public:
    explicit SharedMutex(std::string_view name = "")
        : name_(name)
#ifndef NDEBUG
        , order_(next_mutex_order_id())
#endif
    {
    }

    SharedMutex(const SharedMutex&) = delete;
    SharedMutex& operator=(const SharedMutex&) = delete;

    void lock()
    {
#ifndef NDEBUG
        debug_lock_push(this, name_, order_);
#endif
        mutex_.lock();
    }

    void unlock()
    {
        mutex_.unlock();
#ifndef NDEBUG
        debug_lock_pop(this);
#endif
    }

    void lock_shared() { mutex_.lock_shared(); }
    void unlock_shared() { mutex_.unlock_shared(); }

    const std::string& name() const noexcept { return name_; }

private:
    std::shared_mutex mutex_;
    std::string name_;
#ifndef NDEBUG
    uint64_t order_;
#endif
};

// ---------------------------------------------------------------------------
// RAII guards
// ---------------------------------------------------------------------------

/// Exclusive guard for Mutex or SharedMutex.
template <typename M>
class UniqueLock {
public:
    explicit UniqueLock(M& mtx) : mutex_(mtx) { mutex_.lock(); }
    ~UniqueLock() { mutex_.unlock(); }

    UniqueLock(const UniqueLock&) = delete;
    UniqueLock& operator=(const UniqueLock&) = delete;

private:
    M& mutex_;
};

/// Reader guard for SharedMutex.
class SharedLock {
public:
    explicit SharedLock(SharedMutex& mtx) : mutex_(mtx) { mutex_.lock_shared(); }
    ~SharedLock() { mutex_.unlock_shared(); }

    SharedLock(const SharedLock&) = delete;
    SharedLock& operator=(const SharedLock&) = delete;

private:
    SharedMutex& mutex_;
};

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

#define CORE_SYNC_CAT_(a, b)  a##b
#define CORE_SYNC_CAT(a, b)   CORE_SYNC_CAT_(a, b)

/// Exclusive lock on @p cs for the rest of the enclosing block.
#define LOCK(cs) \
    core::UniqueLock CORE_SYNC_CAT(lock_, __LINE__)(cs)

/// Shared (reader) lock on @p cs for the rest of the enclosing block.
#define READ_LOCK(cs) \
    core::SharedLock CORE_SYNC_CAT(rlock_, __LINE__)(cs)

}  // namespace core
