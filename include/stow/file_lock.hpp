#pragma once

#include <stow/result.hpp>
#include <filesystem>
#include <memory>

namespace stow {

// Exclusive advisory lock on a file (fcntl write lock). Held for the lifetime
// of the object; released on destruction. Threads of one process are
// serialized through an in-process gate per lock path, since fcntl locks
// are owned per process. A lock may be moved to, and released on, another
// thread.
class FileLock {
public:
    // Block until the lock is available.
    static Result<FileLock> acquire(const std::filesystem::path& path);

    // Fail with LockContention instead of waiting.
    static Result<FileLock> try_acquire(const std::filesystem::path& path);

    FileLock();
    ~FileLock();
    FileLock(FileLock&&) noexcept;
    FileLock& operator=(FileLock&&) noexcept;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool is_held() const;
    void release();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    static Result<FileLock> lock(const std::filesystem::path& path, bool wait);
};

} // namespace stow
