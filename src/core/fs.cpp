#include "core/fs.h"
#include "core/random.h"

#include <cstdlib>
#include <fstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace core::fs {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Sibling of `target` with a random ".tmp.<hex>" suffix.
static path temp_path_for(const path& target)
{
    static constexpr char HEX[] = "0123456789abcdef";
    uint64_t r = core::InsecureRandom().next();
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix.push_back(HEX[r & 0xF]);
        r >>= 4;
    }
    return target.parent_path() /
           (target.filename().string() + ".tmp." + suffix);
}

path get_default_data_dir()
{
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return path(home) / ".pst";
    }
    return path("/tmp/.pst");
}

// ---------------------------------------------------------------------------
// Directory / path utilities
// ---------------------------------------------------------------------------

bool ensure_directory(const path& dir)
{
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    return std::filesystem::create_directories(dir, ec) || !ec;
}

path absolute(const path& p)
{
    std::error_code ec;
    auto result = std::filesystem::absolute(p, ec);
    return ec ? p : result;
}

bool file_exists(const path& p)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

std::optional<uint64_t> file_size(const path& p)
{
    std::error_code ec;
    auto sz = std::filesystem::file_size(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(sz);
}

// ---------------------------------------------------------------------------
// Rename / read / write
// ---------------------------------------------------------------------------

bool rename_safe(const path& src, const path& dst)
{
    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    return !ec;
}

std::optional<std::string> read_file(const path& p)
{
    std::ifstream ifs(p, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        return std::nullopt;
    }

    auto size = ifs.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    ifs.seekg(0, std::ios::beg);

    std::string content(static_cast<size_t>(size), '\0');
    if (!ifs.read(content.data(), size)) {
        return std::nullopt;
    }
    return content;
}

bool write_file(const path& p, std::string_view content)
{
    if (p.has_parent_path() && !ensure_directory(p.parent_path())) {
        return false;
    }

    path tmp = temp_path_for(p);
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return false;
    }

    const char* ptr = content.data();
    size_t left = content.size();
    bool ok = true;
    while (left > 0) {
        ssize_t n = ::write(fd, ptr, left);
        if (n <= 0) {
            ok = false;
            break;
        }
        ptr += n;
        left -= static_cast<size_t>(n);
    }
    if (ok && ::fsync(fd) != 0) {
        ok = false;
    }
    ::close(fd);

    if (!ok || !rename_safe(tmp, p)) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::FileLock(const path& p)
    : lock_path_(p)
{
}

FileLock::~FileLock()
{
    unlock();
    close_fd();
}

FileLock::FileLock(FileLock&& other) noexcept
    : lock_path_(std::move(other.lock_path_))
    , locked_(other.locked_)
    , fd_(other.fd_)
{
    other.locked_ = false;
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept
{
    if (this != &other) {
        unlock();
        close_fd();
        lock_path_ = std::move(other.lock_path_);
        locked_ = other.locked_;
        fd_ = other.fd_;
        other.locked_ = false;
        other.fd_ = -1;
    }
    return *this;
}

bool FileLock::try_lock()
{
    if (locked_) {
        return true;
    }
    if (fd_ < 0) {
        fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            return false;
        }
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        return false;
    }
    locked_ = true;
    return true;
}

void FileLock::unlock()
{
    if (!locked_) {
        return;
    }
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
    }
    locked_ = false;
}

void FileLock::close_fd() noexcept
{
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace core::fs
