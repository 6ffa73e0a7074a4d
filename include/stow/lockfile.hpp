#pragma once

#include <stow/result.hpp>
#include <stow/manifest.hpp>
#include <stow/source.hpp>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace stow {

struct ResolvedBundle;

struct LockedBundle {
    std::string name;
    std::string description;
    std::string version;
    // Directory paths are stored relative to the workspace root; remotes
    // carry their resolved revision.
    BundleSource source;
    std::string hash;                       // sha256:<hex> over the bundle's files
    std::vector<std::string> files;         // universal paths, sorted
    std::vector<std::string> dependencies;  // declared names, declaration order

    bool operator==(const LockedBundle& other) const;
    bool operator!=(const LockedBundle& other) const { return !(*this == other); }
};

// Stow.lock: the resolved bundles, dependencies first, the workspace's own
// bundle last.
struct LockFile {
    static constexpr int64_t FORMAT_VERSION = 1;

    int64_t version = FORMAT_VERSION;
    std::string name;                       // workspace bundle name
    std::vector<LockedBundle> bundles;

    static Result<LockFile> parse(const std::string& toml_str);
    static Result<LockFile> load(const std::string& path);

    // Deterministic rendering: identical input yields identical bytes
    std::string to_toml() const;
    Status save(const std::string& path) const;

    const LockedBundle* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    bool remove(const std::string& name);

    // Structural checks: non-empty unique names, hash format, every declared
    // dependency locked before its dependent.
    Status validate() const;

    bool operator==(const LockFile& other) const;
    bool operator!=(const LockFile& other) const { return !(*this == other); }
};

// Files never counted as part of a bundle's content
const std::set<std::string>& bundle_excludes();
// ...and additionally for the workspace bundle, which lives in .stow/
const std::set<std::string>& workspace_bundle_excludes();

// Build the lockfile for a resolution, in resolution order. Files of the
// workspace bundle named in `workspace_overrides` are hashed with the given
// content (a manifest about to be rewritten, for instance).
Result<LockFile> generate_lockfile(const std::vector<ResolvedBundle>& resolved,
                                   const std::filesystem::path& workspace_root,
                                   const std::map<std::string, std::string>& workspace_overrides = {});

// Strict comparison for frozen installs. FrozenMismatch naming the first
// difference.
Status validate_frozen(const LockFile& existing, const LockFile& fresh);

} // namespace stow
