#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace core {

/// Returns current Unix timestamp in seconds since epoch.
int64_t get_time();

/// Returns current time in milliseconds since epoch.
int64_t get_time_millis();

/// Formats a Unix timestamp (seconds) as ISO 8601: "2026-02-03T00:00:00Z".
std::string format_iso8601(int64_t timestamp);

/// Parses an ISO 8601 string ("YYYY-MM-DDTHH:MM:SSZ") into a Unix timestamp.
/// Returns std::nullopt on failure.
std::optional<int64_t> parse_iso8601(std::string_view str);

// ---------------------------------------------------------------------------
// TimeSource - injectable "now" in unix seconds.
// ---------------------------------------------------------------------------

using TimeSource = std::function<int64_t()>;

/// A TimeSource bound to the wall clock.
TimeSource system_time_source();

// ---------------------------------------------------------------------------
// ManualClock - a clock owned by the caller, advanced explicitly.
// Used for deterministic tests of time windows. Thread-safe.
// ---------------------------------------------------------------------------

class ManualClock {
public:
    explicit ManualClock(int64_t start = 0) : now_(start) {}

    int64_t now() const { return now_.load(std::memory_order_acquire); }
    void set(int64_t t) { now_.store(t, std::memory_order_release); }
    void advance(int64_t seconds) {
        now_.fetch_add(seconds, std::memory_order_acq_rel);
    }

    /// A TimeSource reading this clock. The clock must outlive it.
    TimeSource source() const {
        return [this] { return now(); };
    }

private:
    std::atomic<int64_t> now_;
};

// ---------------------------------------------------------------------------
// StopWatch - a simple high-resolution timer.
// ---------------------------------------------------------------------------

class StopWatch {
public:
    StopWatch();

    int64_t elapsed_ms() const;
    void reset();

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace core
