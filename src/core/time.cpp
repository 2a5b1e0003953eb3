#include "core/time.h"

#include <array>
#include <charconv>
#include <cstring>
#include <ctime>

namespace core {

// ---------------------------------------------------------------------------
// Free functions - wall-clock time
// ---------------------------------------------------------------------------

int64_t get_time()
{
    using namespace std::chrono;
    return duration_cast<seconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

int64_t get_time_millis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// ---------------------------------------------------------------------------
// ISO 8601 formatting / parsing
// ---------------------------------------------------------------------------

std::string format_iso8601(int64_t timestamp)
{
    std::time_t tt = static_cast<std::time_t>(timestamp);
    std::tm utc{};

    gmtime_r(&tt, &utc);

    // "YYYY-MM-DDTHH:MM:SSZ" is exactly 20 characters + null.
    std::array<char, 32> buf{};
    std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf.data());
}

/// Helper: parse exactly `n` digits from `str` starting at `pos`.
/// Advances `pos` past the digits on success.
static bool parse_digits(std::string_view str, size_t& pos, int n, int& out)
{
    if (pos + static_cast<size_t>(n) > str.size()) {
        return false;
    }
    std::string_view segment = str.substr(pos, static_cast<size_t>(n));
    auto result = std::from_chars(segment.data(), segment.data() + n, out);
    if (result.ec != std::errc{} || result.ptr != segment.data() + n) {
        return false;
    }
    pos += static_cast<size_t>(n);
    return true;
}

/// Helper: expect a specific character at `pos` and advance past it.
static bool expect_char(std::string_view str, size_t& pos, char ch)
{
    if (pos >= str.size() || str[pos] != ch) {
        return false;
    }
    ++pos;
    return true;
}

std::optional<int64_t> parse_iso8601(std::string_view str)
{
    // Expected format: "YYYY-MM-DDTHH:MM:SSZ" (exactly 20 chars).
    if (str.size() != 20) {
        return std::nullopt;
    }

    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;

    if (!parse_digits(str, pos, 4, year))   return std::nullopt;
    if (!expect_char(str, pos, '-'))         return std::nullopt;
    if (!parse_digits(str, pos, 2, month))  return std::nullopt;
    if (!expect_char(str, pos, '-'))         return std::nullopt;
    if (!parse_digits(str, pos, 2, day))    return std::nullopt;
    if (!expect_char(str, pos, 'T'))         return std::nullopt;
    if (!parse_digits(str, pos, 2, hour))   return std::nullopt;
    if (!expect_char(str, pos, ':'))         return std::nullopt;
    if (!parse_digits(str, pos, 2, minute)) return std::nullopt;
    if (!expect_char(str, pos, ':'))         return std::nullopt;
    if (!parse_digits(str, pos, 2, second)) return std::nullopt;
    if (!expect_char(str, pos, 'Z'))         return std::nullopt;

    // Basic range validation.
    if (month < 1 || month > 12)   return std::nullopt;
    if (day < 1 || day > 31)       return std::nullopt;
    if (hour < 0 || hour > 23)     return std::nullopt;
    if (minute < 0 || minute > 59) return std::nullopt;
    if (second < 0 || second > 60) return std::nullopt; // allow leap second

    std::tm utc{};
    utc.tm_year  = year - 1900;
    utc.tm_mon   = month - 1;
    utc.tm_mday  = day;
    utc.tm_hour  = hour;
    utc.tm_min   = minute;
    utc.tm_sec   = second;
    utc.tm_isdst = 0;

    // timegm is POSIX, not standard C++.
    std::time_t tt = timegm(&utc);

    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return static_cast<int64_t>(tt);
}

// ---------------------------------------------------------------------------
// TimeSource
// ---------------------------------------------------------------------------

TimeSource system_time_source()
{
    return [] { return get_time(); };
}

// ---------------------------------------------------------------------------
// StopWatch
// ---------------------------------------------------------------------------

StopWatch::StopWatch()
    : start_(std::chrono::steady_clock::now())
{
}

int64_t StopWatch::elapsed_ms() const
{
    using namespace std::chrono;
    auto now = steady_clock::now();
    return duration_cast<milliseconds>(now - start_).count();
}

void StopWatch::reset()
{
    start_ = std::chrono::steady_clock::now();
}

} // namespace core
