#pragma once

#include <stow/result.hpp>
#include <stow/source.hpp>
#include <stow/git.hpp>
#include <filesystem>
#include <string>

namespace stow {

// Retrieves the file tree of a source at an exact revision. The cache calls
// resolve_revision() first and materialize() only on a miss.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Pin the source's ref to an exact revision.
    virtual Result<std::string> resolve_revision(const BundleSource& source) = 0;

    // Write the tree of `revision` into `dest`, an existing empty directory.
    virtual Status materialize(const BundleSource& source,
                               const std::string& revision,
                               const std::filesystem::path& dest) = 0;
};

// Local directories. The revision is the directory's content hash.
class DirectoryFetcher : public Fetcher {
public:
    Result<std::string> resolve_revision(const BundleSource& source) override;
    Status materialize(const BundleSource& source,
                       const std::string& revision,
                       const std::filesystem::path& dest) override;
};

// Git repositories through the git CLI. Keeps one bare clone per origin
// under <work_root>/git/db/.
class GitFetcher : public Fetcher {
public:
    explicit GitFetcher(std::string work_root);

    Result<std::string> resolve_revision(const BundleSource& source) override;
    Status materialize(const BundleSource& source,
                       const std::string& revision,
                       const std::filesystem::path& dest) override;

    std::string bare_repo_path(const std::string& origin) const;

    GitCli& git() { return git_; }

private:
    std::string work_root_;
    GitCli git_;

    Result<std::string> ensure_bare_repo(const std::string& origin, bool refresh);
};

// Dispatches on the source kind.
class SourceFetcher : public Fetcher {
public:
    explicit SourceFetcher(std::string work_root);

    Result<std::string> resolve_revision(const BundleSource& source) override;
    Status materialize(const BundleSource& source,
                       const std::string& revision,
                       const std::filesystem::path& dest) override;

    GitFetcher& git_fetcher() { return git_; }

private:
    DirectoryFetcher dir_;
    GitFetcher git_;
};

// Short filesystem-safe name for an identity: <tail>-<sha256[0:16]>
std::string identity_slug(const std::string& identity);

} // namespace stow
