#pragma once

#include <stow/result.hpp>
#include <stow/lockfile.hpp>
#include <stow/merge.hpp>
#include <stow/platform.hpp>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stow {

// Which bundle's copy of a universal path is installed for a platform.
struct IndexEntry {
    std::string path;           // universal path
    std::string platform;
    std::string bundle;
    std::string output;         // workspace-relative output path
    MergeStrategy strategy = MergeStrategy::Replace;
    std::string hash;           // sha256:<hex> of the bytes written

    bool operator==(const IndexEntry& other) const;
};

// Stow.index: at most one entry per (path, platform).
class WorkspaceIndex {
public:
    static constexpr int64_t FORMAT_VERSION = 1;

    static Result<WorkspaceIndex> parse(const std::string& toml_str);
    static Result<WorkspaceIndex> load(const std::string& path);

    // Entries sorted by (path, platform)
    std::string to_toml() const;
    Status save(const std::string& path) const;

    const IndexEntry* find(const std::string& path, const std::string& platform) const;

    // Every entry writing to `output` (several platforms may share one)
    std::vector<const IndexEntry*> find_output(const std::string& output) const;

    // The entry whose bundle provides `output`; nullptr when none does.
    const IndexEntry* find_provider(const std::string& output) const;

    std::vector<const IndexEntry*> entries_for(const std::string& bundle) const;

    void upsert(IndexEntry entry);
    bool remove(const std::string& path, const std::string& platform);

    std::set<std::string> platforms() const;
    std::set<std::string> outputs() const;

    const std::vector<IndexEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

private:
    std::vector<IndexEntry> entries_;
};

// One bundle file feeding an output
struct Contribution {
    std::string bundle;
    std::string path;           // universal path
};

struct PlannedOutput {
    std::string output;
    MergeStrategy strategy = MergeStrategy::Replace;
    // Lock order. Replace takes the last; merge strategies fold them all.
    std::vector<Contribution> contributors;
};

struct IndexPlan {
    WorkspaceIndex index;               // surviving owners, hashes not yet known
    std::vector<PlannedOutput> outputs; // sorted by output path

    const PlannedOutput* find_output(const std::string& output) const;
};

// Walk the lockfile in order through every platform's transforms. For each
// (path, platform) the last bundle providing it owns the entry.
IndexPlan compute_index_update(const LockFile& lock, const std::vector<Platform>& platforms);

// Where a locked bundle's files live on disk; nullopt when unavailable.
using BundleLocator = std::function<std::optional<std::filesystem::path>(const std::string& bundle)>;

struct ModifiedFile {
    std::string path;           // universal path
    std::string platform;
    std::string bundle;
    std::string output;
};

// Replace entries whose live output no longer hashes like the original
// universal file (falling back to the recorded hash). Missing outputs are
// not reported.
Result<std::vector<ModifiedFile>> detect_modified(const WorkspaceIndex& index,
                                                  const std::filesystem::path& workspace_root,
                                                  const BundleLocator& locate);

} // namespace stow
