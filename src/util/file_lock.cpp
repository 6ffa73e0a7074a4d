#include <stow/file_lock.hpp>
#include <stow/log.hpp>

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stow {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

// Claim on a lock path inside this process. Unlike a std::mutex it may be
// given up by a thread other than the one that took it, so a FileLock can be
// moved across threads.
struct PathGate {
    bool held = false;
    std::condition_variable cv;
};

struct FileLock::Impl {
    int fd = -1;
    PathGate* gate = nullptr;   // owned by s_gates
    std::string path;

    static std::mutex s_map_mutex;
    static std::unordered_map<std::string, std::unique_ptr<PathGate>> s_gates;

    static PathGate& gate_for(const std::string& key) {
        std::lock_guard<std::mutex> guard(s_map_mutex);
        auto& slot = s_gates[key];
        if (!slot) slot = std::make_unique<PathGate>();
        return *slot;
    }

    static bool enter(PathGate& g, bool wait) {
        std::unique_lock<std::mutex> guard(s_map_mutex);
        if (!wait && g.held) return false;
        g.cv.wait(guard, [&g] { return !g.held; });
        g.held = true;
        return true;
    }

    static void leave(PathGate& g) {
        {
            std::lock_guard<std::mutex> guard(s_map_mutex);
            g.held = false;
        }
        g.cv.notify_one();
    }

    void unlock() {
        if (fd >= 0) {
            struct flock fl {};
            fl.l_type = F_UNLCK;
            fl.l_whence = SEEK_SET;
            ::fcntl(fd, F_SETLK, &fl);
            ::close(fd);
            fd = -1;
            log::debug("released lock %s", path.c_str());
        }
        if (gate) {
            leave(*gate);
            gate = nullptr;
        }
    }

    ~Impl() { unlock(); }
};

std::mutex FileLock::Impl::s_map_mutex;
std::unordered_map<std::string, std::unique_ptr<PathGate>> FileLock::Impl::s_gates;

// ---------------------------------------------------------------------------
// FileLock
// ---------------------------------------------------------------------------

FileLock::FileLock() = default;
FileLock::~FileLock() = default;
FileLock::FileLock(FileLock&&) noexcept = default;
FileLock& FileLock::operator=(FileLock&&) noexcept = default;

bool FileLock::is_held() const {
    return impl_ && impl_->fd >= 0;
}

void FileLock::release() {
    impl_.reset();
}

Result<FileLock> FileLock::acquire(const fs::path& path) {
    return lock(path, true);
}

Result<FileLock> FileLock::try_acquire(const fs::path& path) {
    return lock(path, false);
}

Result<FileLock> FileLock::lock(const fs::path& path, bool wait) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot create lock directory " + path.parent_path().string() + ": " + ec.message()};
    }

    fs::path key_path = fs::weakly_canonical(path, ec);
    std::string key = ec ? path.string() : key_path.string();

    PathGate& gate = Impl::gate_for(key);
    if (!Impl::enter(gate, wait)) {
        return StowError{StowError::LockContention,
            "workspace is locked by another operation: " + key,
            "wait for the other operation to finish"};
    }

    int fd = ::open(key.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd < 0) {
        std::string reason = std::strerror(errno);
        Impl::leave(gate);
        return StowError{StowError::IO, "cannot open lock file " + key + ": " + reason};
    }

    struct flock fl {};
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;

    int rc;
    do {
        rc = ::fcntl(fd, wait ? F_SETLKW : F_SETLK, &fl);
    } while (rc == -1 && errno == EINTR);

    if (rc == -1) {
        int err = errno;
        ::close(fd);
        Impl::leave(gate);
        if (err == EACCES || err == EAGAIN) {
            return StowError{StowError::LockContention,
                "workspace is locked by another process: " + key,
                "wait for the other stow process to finish"};
        }
        return StowError{StowError::IO,
            "cannot lock " + key + ": " + std::strerror(err)};
    }

    log::debug("acquired lock %s", key.c_str());

    FileLock out;
    out.impl_ = std::make_unique<Impl>();
    out.impl_->fd = fd;
    out.impl_->gate = &gate;
    out.impl_->path = key;
    return Result<FileLock>::ok(std::move(out));
}

} // namespace stow
