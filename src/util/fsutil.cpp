#include <stow/fsutil.hpp>
#include <stow/sha256.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stow::fsutil {

static const std::string HASH_PREFIX = "sha256:";

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string random_suffix() {
    static std::mt19937_64 gen(std::random_device{}() ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    static const char hex_chars[] = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 12; ++i) {
        suffix += hex_chars[gen() & 0x0f];
    }
    return suffix;
}

static bool fsync_directory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY);
    if (fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

static std::string to_generic(const fs::path& p) {
    return p.generic_string();
}

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

std::string canonical_string(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    if (ec) c = fs::absolute(p).lexically_normal();
    std::string s = c.generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return StowError{StowError::IO, "cannot read file: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Status write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return StowError{StowError::IO,
                "cannot create directory " + parent.string() + ": " + ec.message()};
        }
    }

    std::string temp_path = path.string() + ".tmp." + random_suffix();
    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return StowError{StowError::IO,
            "cannot create " + temp_path + ": " + std::strerror(errno)};
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::strerror(errno);
            ::close(fd);
            ::unlink(temp_path.c_str());
            return StowError{StowError::IO, "write failed for " + path.string() + ": " + reason};
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        ::unlink(temp_path.c_str());
        return StowError{StowError::IO, "fsync failed for " + path.string() + ": " + reason};
    }
    ::close(fd);

    if (::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        ::unlink(temp_path.c_str());
        return StowError{StowError::IO, "rename failed for " + path.string() + ": " + reason};
    }

    fsync_directory(parent.empty() ? fs::path(".") : parent);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Trees
// ---------------------------------------------------------------------------

Result<std::vector<std::string>> list_files(const fs::path& root,
                                            const std::set<std::string>& exclude) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return StowError{StowError::NotFound,
            "directory does not exist: " + root.string()};
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot list " + root.string() + ": " + ec.message()};
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return StowError{StowError::IO,
                "error iterating " + root.string() + ": " + ec.message()};
        }
        const auto& entry = *it;
        std::string rel = to_generic(fs::relative(entry.path(), root, ec));
        if (ec) continue;

        std::string first = rel.substr(0, rel.find('/'));
        if (entry.is_directory(ec)) {
            if (entry.path().filename() == ".git" || exclude.count(rel)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;
        if (exclude.count(rel) || exclude.count(first)) continue;
        files.push_back(rel);
    }

    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>>::ok(std::move(files));
}

Result<std::string> hash_tree(const fs::path& root, const std::set<std::string>& exclude) {
    auto files = list_files(root, exclude);
    if (files.is_err()) return std::move(files).error();
    return hash_files(root, files.value());
}

Result<std::string> hash_files(const fs::path& root,
                               const std::vector<std::string>& files,
                               const std::map<std::string, std::string>& overrides) {
    SHA256 hasher;
    const uint8_t nul = 0;
    for (const auto& rel : files) {
        hasher.update(rel);
        hasher.update(&nul, 1);
        auto over = overrides.find(rel);
        if (over != overrides.end()) {
            hasher.update(over->second);
        } else {
            auto content = read_file(root / rel);
            if (content.is_err()) return std::move(content).error();
            hasher.update(content.value());
        }
        hasher.update(&nul, 1);
    }
    return Result<std::string>::ok(with_hash_prefix(SHA256::bytes_to_hex(hasher.finalize())));
}

Status copy_tree(const fs::path& src, const fs::path& dst,
                 const std::set<std::string>& exclude) {
    auto files = list_files(src, exclude);
    if (files.is_err()) return std::move(files).error();

    std::error_code ec;
    fs::create_directories(dst, ec);
    for (const auto& rel : files.value()) {
        fs::path to = dst / rel;
        fs::create_directories(to.parent_path(), ec);
        if (ec) {
            return StowError{StowError::IO,
                "cannot create directory " + to.parent_path().string() + ": " + ec.message()};
        }
        fs::copy_file(src / rel, to, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return StowError{StowError::IO,
                "cannot copy " + (src / rel).string() + ": " + ec.message()};
        }
    }
    return ok_status();
}

void prune_empty_dirs(const fs::path& start, const fs::path& root,
                      const std::set<fs::path>& keep) {
    std::error_code ec;
    fs::path root_norm = root.lexically_normal();
    fs::path dir = start.lexically_normal();

    while (!dir.empty() && dir != root_norm && !keep.count(dir)) {
        // Refuse to walk outside root
        auto rel = dir.lexically_relative(root_norm);
        if (rel.empty() || *rel.begin() == "..") break;
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) break;
        fs::remove(dir, ec);
        if (ec) break;
        dir = dir.parent_path();
    }
}

Result<fs::path> make_temp_dir(const fs::path& parent, const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot create directory " + parent.string() + ": " + ec.message()};
    }
    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = parent / (prefix + random_suffix());
        if (fs::create_directory(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }
    }
    return StowError{StowError::IO,
        "cannot create a temporary directory under " + parent.string()};
}

std::string with_hash_prefix(const std::string& hex) {
    return HASH_PREFIX + hex;
}

bool is_hash_string(const std::string& s) {
    if (s.size() != HASH_PREFIX.size() + 64) return false;
    if (s.compare(0, HASH_PREFIX.size(), HASH_PREFIX) != 0) return false;
    return std::all_of(s.begin() + static_cast<long>(HASH_PREFIX.size()), s.end(),
        [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

} // namespace stow::fsutil
