// Copyright (c) 2024-2026 The PST Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/sync.h"

#ifndef NDEBUG

#include <atomic>
#include <cstdio>
#include <iterator>
#include <vector>

namespace core {

static std::atomic<uint64_t> g_next_order_id{1};

uint64_t next_mutex_order_id()
{
    return g_next_order_id.fetch_add(1, std::memory_order_relaxed);
}

namespace {

struct HeldLock {
    const void*        id;
    const std::string* name;
    uint64_t           order;
};

// Locks held by this thread, oldest first.
thread_local std::vector<HeldLock> held_locks;

}  // namespace

void potential_deadlock_detected(
    const std::string& held_name, uint64_t held_order,
    const std::string& requested_name, uint64_t requested_order)
{
    std::fprintf(stderr,
        "pst: lock order violation: holding '%s' (order %llu) while "
        "acquiring '%s' (order %llu)\n",
        held_name.c_str(),
        static_cast<unsigned long long>(held_order),
        requested_name.c_str(),
        static_cast<unsigned long long>(requested_order));
}

void debug_lock_push(const void* id, const std::string& name, uint64_t order)
{
    for (const auto& held : held_locks) {
        if (held.order >= order) {
            potential_deadlock_detected(*held.name, held.order, name, order);
            break;
        }
    }
    held_locks.push_back(HeldLock{id, &name, order});
}

void debug_lock_pop(const void* id)
{
    // Release order is not always LIFO; erase the newest match.
    for (auto it = held_locks.rbegin(); it != held_locks.rend(); ++it) {
        if (it->id == id) {
            held_locks.erase(std::next(it).base());
            return;
        }
    }
}

}  // namespace core

#endif  // !NDEBUG
