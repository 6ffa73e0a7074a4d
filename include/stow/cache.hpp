#pragma once

#include <stow/result.hpp>
#include <stow/fetch.hpp>
#include <stow/source.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stow {

struct CacheEntry {
    std::string identity;       // fetch identity, e.g. git+<origin>
    std::string revision;
    std::string path;           // snapshot directory
    std::string content_hash;   // sha256:<hex> of the whole snapshot
    int64_t created_at = 0;
};

struct CacheStats {
    int64_t entry_count = 0;
    int64_t source_count = 0;   // distinct identities
    int64_t total_bytes = 0;    // bytes of snapshot files on disk
};

struct Snapshot {
    std::string revision;
    std::filesystem::path root;
    bool hit = false;           // served without calling the fetcher
};

// Content-addressed store of immutable source snapshots, shared by every
// workspace on the machine.
//
// Layout:
//   <root>/bundles/<slug>/<revision>/   snapshot tree
//   <root>/catalog.db                   sqlite catalog of entries
//   <root>/tmp/                         in-progress population
class Cache {
public:
    Cache();
    ~Cache();
    Cache(Cache&&) noexcept;
    Cache& operator=(Cache&&) noexcept;

    Status open(const std::string& root);
    void close();
    bool is_open() const;
    const std::string& root() const;

    // Return the snapshot for the source's ref, fetching on a miss. When the
    // source already carries a pinned revision (a remote with `revision` set,
    // or a ref that is a full commit id) and that revision is cataloged, the
    // fetcher is not consulted at all. Such a hit is verified against the
    // hash recorded in the catalog; Integrity error when it has changed.
    Result<Snapshot> get_or_fetch(const BundleSource& source, Fetcher& fetcher);

    // Snapshot directory for (identity, revision) if cataloged and present.
    std::optional<std::filesystem::path> lookup(const std::string& identity,
                                                const std::string& revision);

    std::filesystem::path snapshot_path(const std::string& identity,
                                        const std::string& revision) const;

    // Recompute a snapshot's hash (optionally of a sub-path) and compare it
    // with `expected`. Integrity error on mismatch.
    Status verify(const std::string& identity, const std::string& revision,
                  const std::string& expected_hash, const std::string& subpath = "");

    // Maintenance
    Result<std::vector<CacheEntry>> list();
    Result<CacheStats> stats();
    // Drop catalog rows whose snapshot vanished and snapshot directories
    // the catalog does not know. Returns the number of items removed.
    Result<int64_t> prune();
    Status clean();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace stow
