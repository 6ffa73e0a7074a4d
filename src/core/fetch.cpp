#include <stow/fetch.hpp>
#include <stow/fsutil.hpp>
#include <stow/lockfile.hpp>
#include <stow/log.hpp>
#include <stow/sha256.hpp>

#include <cctype>

namespace fs = std::filesystem;

namespace stow {

std::string identity_slug(const std::string& identity) {
    std::string tail = identity;
    while (!tail.empty() && (tail.back() == '/' || tail.back() == '#' || tail.back() == '@')) {
        tail.pop_back();
    }
    auto slash = tail.find_last_of("/:+");
    if (slash != std::string::npos) tail = tail.substr(slash + 1);
    if (tail.size() > 4 && tail.compare(tail.size() - 4, 4, ".git") == 0) {
        tail.resize(tail.size() - 4);
    }

    std::string clean;
    for (char c : tail) {
        unsigned char uc = static_cast<unsigned char>(c);
        clean.push_back(std::isalnum(uc) || c == '-' || c == '_' || c == '.' ? c : '-');
    }
    if (clean.empty()) clean = "bundle";

    return clean + "-" + SHA256::hash_hex(identity).substr(0, 16);
}

// ---------------------------------------------------------------------------
// DirectoryFetcher
// ---------------------------------------------------------------------------

Result<std::string> DirectoryFetcher::resolve_revision(const BundleSource& source) {
    if (!source.is_directory()) {
        return StowError{StowError::InvalidArg,
            "directory fetcher given a remote source: " + source.display()};
    }
    std::error_code ec;
    if (!fs::is_directory(source.dir().path, ec)) {
        return StowError{StowError::SourceResolution,
            "bundle directory not found: " + source.dir().path};
    }
    auto hash = fsutil::hash_tree(source.dir().path, bundle_excludes());
    if (hash.is_err()) return std::move(hash).error();
    // Strip "sha256:"
    return Result<std::string>::ok(hash.value().substr(7));
}

Status DirectoryFetcher::materialize(const BundleSource& source,
                                     const std::string& revision,
                                     const fs::path& dest) {
    STOW_TRY(fsutil::copy_tree(source.dir().path, dest, bundle_excludes()));

    // The directory may have changed between hashing and copying
    auto copied = fsutil::hash_tree(dest);
    if (copied.is_err()) return std::move(copied).error();
    if (copied.value().substr(7) != revision) {
        return StowError{StowError::SourceResolution,
            "bundle directory changed while it was being read: " + source.dir().path,
            "retry the operation"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// GitFetcher
// ---------------------------------------------------------------------------

GitFetcher::GitFetcher(std::string work_root) : work_root_(std::move(work_root)) {}

std::string GitFetcher::bare_repo_path(const std::string& origin) const {
    return work_root_ + "/git/db/" + identity_slug("git+" + origin);
}

Result<std::string> GitFetcher::ensure_bare_repo(const std::string& origin, bool refresh) {
    std::string path = bare_repo_path(origin);
    std::error_code ec;

    if (fs::exists(path, ec)) {
        if (refresh) {
            log::debug("bare repo exists, fetching: %s", path.c_str());
            STOW_TRY(git_.fetch(path));
        }
        return Result<std::string>::ok(path);
    }

    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot create git cache directory: " + ec.message()};
    }

    log::info("cloning %s", origin.c_str());
    return git_.clone_bare(origin, path);
}

Result<std::string> GitFetcher::resolve_revision(const BundleSource& source) {
    if (!source.is_remote()) {
        return StowError{StowError::InvalidArg,
            "git fetcher given a directory source: " + source.display()};
    }
    const auto& r = source.remote();

    // A commit we already hold needs no network round trip
    if (is_commit_sha(r.ref)) {
        auto bare = ensure_bare_repo(r.origin, false);
        if (bare.is_err()) return std::move(bare).error();
        if (git_.has_commit(bare.value(), r.ref)) {
            return Result<std::string>::ok(r.ref);
        }
        STOW_TRY(git_.fetch(bare.value()));
        return git_.resolve_ref(bare.value(), r.ref);
    }

    auto bare = ensure_bare_repo(r.origin, true);
    if (bare.is_err()) return std::move(bare).error();
    return git_.resolve_ref(bare.value(), r.ref);
}

Status GitFetcher::materialize(const BundleSource& source,
                               const std::string& revision,
                               const fs::path& dest) {
    auto bare = ensure_bare_repo(source.remote().origin, false);
    if (bare.is_err()) return std::move(bare).error();
    if (!git_.has_commit(bare.value(), revision)) {
        STOW_TRY(git_.fetch(bare.value()));
    }

    // git clone refuses an existing directory, even an empty one
    std::error_code ec;
    fs::remove(dest, ec);
    return git_.export_tree(bare.value(), revision, dest.string());
}

// ---------------------------------------------------------------------------
// SourceFetcher
// ---------------------------------------------------------------------------

SourceFetcher::SourceFetcher(std::string work_root) : git_(std::move(work_root)) {}

Result<std::string> SourceFetcher::resolve_revision(const BundleSource& source) {
    if (source.is_directory()) return dir_.resolve_revision(source);
    return git_.resolve_revision(source);
}

Status SourceFetcher::materialize(const BundleSource& source,
                                  const std::string& revision,
                                  const fs::path& dest) {
    if (source.is_directory()) return dir_.materialize(source, revision, dest);
    return git_.materialize(source, revision, dest);
}

} // namespace stow
