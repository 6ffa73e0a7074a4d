#pragma once

#include <stow/result.hpp>
#include <stow/config.hpp>
#include <stow/file_lock.hpp>
#include <stow/index.hpp>
#include <stow/lockfile.hpp>
#include <stow/manifest.hpp>
#include <stow/platform.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace stow {

// The three persisted records of a workspace, loaded together and passed
// explicitly through an operation.
struct WorkspaceState {
    Manifest manifest;
    LockFile lock;
    bool has_lock = false;
    WorkspaceIndex index;
    bool has_index = false;
};

// A directory holding a .stow/ directory:
//   .stow/Stow.toml      manifest (direct dependencies)
//   .stow/Stow.lock      lockfile
//   .stow/Stow.index     workspace index
//   .stow/.lock          advisory lock file
//   .stow/config.toml    workspace configuration (optional)
//   .stow/platforms.toml workspace platform definitions (optional)
// Everything else under .stow/ is the workspace's own bundle.
class Workspace {
public:
    static constexpr const char* DIR_NAME = ".stow";

    // Walk up from start to the nearest directory containing .stow/
    static Result<Workspace> discover(const std::filesystem::path& start);

    // Open root, which must contain .stow/
    static Result<Workspace> open(const std::filesystem::path& root);

    // Create .stow/ and a manifest when missing, then open. The bundle is
    // named after the directory unless `name` is given.
    static Result<Workspace> init(const std::filesystem::path& root,
                                  const std::string& name = "");

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path dir() const { return root_ / DIR_NAME; }
    std::filesystem::path manifest_path() const { return dir() / "Stow.toml"; }
    std::filesystem::path lock_path() const { return dir() / "Stow.lock"; }
    std::filesystem::path index_path() const { return dir() / "Stow.index"; }
    std::filesystem::path lock_file_path() const { return dir() / ".lock"; }
    std::filesystem::path config_path() const { return dir() / "config.toml"; }
    std::filesystem::path platforms_path() const { return dir() / "platforms.toml"; }

    // Manifest, lockfile and index, in the order they are written
    std::vector<std::filesystem::path> record_paths() const;

    // [bundle].name, or the workspace directory's name
    std::string bundle_name(const Manifest& manifest) const;

    Result<WorkspaceState> load_state() const;

    // Global config overlaid with .stow/config.toml
    Result<Config> config() const;

    // Built-in platforms, then ~/.stow/platforms.toml, then the workspace's
    Result<PlatformRegistry> platforms() const;

    // Exclusive workspace lock. LockContention when !wait and it is held.
    Result<FileLock> lock(bool wait) const;

private:
    explicit Workspace(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path root_;
};

} // namespace stow
