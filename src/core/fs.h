#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace core::fs {

using path = std::filesystem::path;

/// Default data directory: $HOME/.pst, or /tmp/.pst without a home.
path get_default_data_dir();

/// Creates the directory (and parents) if it does not exist.
/// Returns true on success or if the directory already exists.
bool ensure_directory(const path& dir);

/// Resolves a path against the current working directory (best effort).
path absolute(const path& p);

/// Returns true if `p` refers to an existing regular file.
bool file_exists(const path& p);

/// Returns the size of the file in bytes, or std::nullopt on error.
std::optional<uint64_t> file_size(const path& p);

/// rename(2): atomic on the same filesystem, replaces `dst`.
bool rename_safe(const path& src, const path& dst);

/// Reads the entire contents of `p` into a string.
std::optional<std::string> read_file(const path& p);

/// Writes `content` to `p` atomically (write to temp, fsync, rename).
bool write_file(const path& p, std::string_view content);

// ---------------------------------------------------------------------------
// FileLock - advisory flock(2) on a lock file with RAII release.
// Guards a data directory against a second daemon instance.
// ---------------------------------------------------------------------------

class FileLock {
public:
    /// Does not acquire the lock; call try_lock().
    explicit FileLock(const path& p);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /// Non-blocking exclusive lock. False if another process holds it.
    bool try_lock();

    void unlock();

    [[nodiscard]] bool locked() const noexcept { return locked_; }

private:
    void close_fd() noexcept;

    path lock_path_;
    bool locked_{false};
    int fd_{-1};
};

} // namespace core::fs
