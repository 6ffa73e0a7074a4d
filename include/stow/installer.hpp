#pragma once

#include <stow/result.hpp>
#include <stow/cache.hpp>
#include <stow/config.hpp>
#include <stow/discovery.hpp>
#include <stow/fetch.hpp>
#include <stow/index.hpp>
#include <stow/lockfile.hpp>
#include <stow/platform.hpp>
#include <stow/resolver.hpp>
#include <stow/transaction.hpp>
#include <stow/workspace.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stow {

struct InstallOptions {
    // Source to add to the manifest before installing (see parse_source_spec).
    // Empty: install what the manifest already declares.
    std::string source;
    // Bundles to take from the source by name; empty asks the selector.
    std::vector<std::string> bundles;
    Selector* selector = nullptr;           // nullptr: SelectAll

    // Platform ids or aliases. Empty: [install] platforms from config, else
    // the platforms detected in the workspace. Platforms already installed
    // are always kept.
    std::vector<std::string> platforms;

    bool frozen = false;                    // or [install] frozen
    bool update = false;                    // re-resolve remote refs
    bool dry_run = false;
    bool no_wait = false;                   // fail instead of waiting for the lock
};

struct UninstallOptions {
    std::vector<std::string> names;
    bool dry_run = false;
    bool no_wait = false;
};

enum class ActionKind { Write, Merge, Remove, Migrate };

const char* action_kind_name(ActionKind kind);

struct PlannedAction {
    ActionKind kind;
    std::string path;           // workspace-relative
    std::string detail;         // owning bundle, or merged bundles
};

struct InstallReport {
    std::vector<std::string> added;         // dependencies added to the manifest
    std::vector<std::string> removed;       // bundles dropped from the lockfile
    std::vector<std::string> bundles;       // lock order after the operation
    std::vector<std::string> platforms;
    std::vector<PlannedAction> actions;
    std::vector<ModifiedFile> migrated;
    bool dry_run = false;
};

struct BundleSummary {
    std::string name;
    std::string description;
    std::string version;
    std::string source;         // display form
    std::string hash;
    std::vector<std::string> dependencies;
    size_t file_count = 0;
    size_t installed_count = 0; // index entries the bundle owns
    bool is_workspace = false;
};

struct BundleDetails {
    BundleSummary summary;
    std::vector<std::string> files;
    std::vector<IndexEntry> installed;
    std::vector<std::string> dependents;    // locked bundles depending on it
};

// Drives install and uninstall over one workspace: resolution, lockfile,
// index reconciliation and file writes, all inside one transaction.
class Installer {
public:
    Installer(Workspace& workspace, Cache& cache, Fetcher& fetcher);

    // Errors: anything from resolution; FrozenMismatch; InvalidArg when no
    // platform is available; LockContention with no_wait.
    Result<InstallReport> install(const InstallOptions& options = {});

    // Remove direct dependencies and every bundle only they required.
    // Errors: NotFound for an unknown bundle, Dependency when another
    // remaining bundle still needs one of the names.
    Result<InstallReport> uninstall(const UninstallOptions& options);

    // Installed bundles in lock order
    Result<std::vector<BundleSummary>> list() const;

    Result<BundleDetails> show(const std::string& name) const;

private:
    Workspace& workspace_;
    Cache& cache_;
    Fetcher& fetcher_;

    Status add_source(const InstallOptions& options, Manifest& manifest,
                      std::vector<std::string>& added);

    // Root of a locked bundle's content at its locked revision
    std::optional<std::filesystem::path> locate_locked(const LockFile& lock,
                                                       const std::string& name);

    struct ReconcileInput {
        const LockFile* old_lock = nullptr;
        const WorkspaceIndex* old_index = nullptr;
        const LockFile* new_lock = nullptr;
        std::vector<Platform> platforms;        // for the new index
        std::vector<Platform> old_platforms;    // that built old_index
        BundleLocator old_locate;
        BundleLocator new_locate;
        std::set<std::filesystem::path> keep_dirs;
    };

    // Bring installed outputs from the old state to the new one. With a
    // null transaction nothing is touched and only the actions are reported.
    Result<WorkspaceIndex> reconcile(const ReconcileInput& in, Transaction* tx,
                                     std::vector<PlannedAction>& actions);

    Result<std::vector<Platform>> choose_platforms(const InstallOptions& options,
                                                   const Config& config,
                                                   const PlatformRegistry& registry,
                                                   const WorkspaceIndex& index) const;

    std::set<std::filesystem::path> keep_dirs(const PlatformRegistry& registry) const;
};

} // namespace stow
