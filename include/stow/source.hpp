#pragma once

#include <stow/result.hpp>
#include <optional>
#include <string>
#include <variant>

namespace stow {

// A bundle living in a directory on disk. `path` is absolute once resolved.
struct DirectorySource {
    std::string path;
};

// A bundle living in a remote git repository, optionally in a sub-path.
// `revision` is filled in once the ref has been resolved to a commit.
struct RemoteSource {
    std::string origin;
    std::string ref;
    std::string subpath;
    std::string revision;
};

class BundleSource {
public:
    BundleSource() = default;

    static BundleSource directory(std::string path);
    static BundleSource remote(std::string origin, std::string ref,
                               std::string subpath = "", std::string revision = "");

    bool is_directory() const { return std::holds_alternative<DirectorySource>(data_); }
    bool is_remote() const { return std::holds_alternative<RemoteSource>(data_); }

    const DirectorySource& dir() const { return std::get<DirectorySource>(data_); }
    const RemoteSource& remote() const { return std::get<RemoteSource>(data_); }
    RemoteSource& remote() { return std::get<RemoteSource>(data_); }

    // Identity of the bundle itself:
    //   dir+<path>
    //   git+<origin>#<subpath>@<ref>
    std::string identity() const;

    // Identity of what gets fetched and cached: the directory, or the
    // whole repository regardless of ref and sub-path.
    std::string fetch_identity() const;

    // The ref to ask the fetcher for (empty for directories)
    std::string ref() const;

    // Human-readable form for logs and listings
    std::string display() const;

    bool operator==(const BundleSource& other) const;
    bool operator!=(const BundleSource& other) const { return !(*this == other); }

private:
    std::variant<DirectorySource, RemoteSource> data_;
};

// A dependency as declared in a manifest. Exactly one of path/git is set.
struct Dependency {
    std::string name;

    std::optional<std::string> path;     // directory, relative to the declaring bundle
    std::optional<std::string> git;      // remote origin
    std::optional<std::string> ref;      // branch, tag or commit (git only)
    std::optional<std::string> subpath;  // bundle directory inside the repository

    Status validate() const;
};

// Parse a source given on the command line:
//   ./dir, ../dir, /abs/dir, ~/dir     directory
//   https://host/org/repo.git          remote
//   git@host:org/repo.git              remote (ssh)
//   file:///path/to/repo               remote (local git repository)
//   github:org/repo, org/repo          remote on github.com
// Remotes accept a "#<ref>" suffix, and "#<ref>:<subpath>" or "#:<subpath>"
// to select a bundle inside the repository.
Result<BundleSource> parse_source_spec(const std::string& spec);

} // namespace stow
