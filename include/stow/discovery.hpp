#pragma once

#include <stow/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace stow {

// An installable bundle found inside a fetched source tree.
struct BundleCandidate {
    std::string name;
    std::string subpath;        // relative to the source root, "" for the root itself
    std::string description;
    size_t resource_count = 0;
};

// Top-level entries that mark a directory as holding bundle resources.
const std::vector<std::string>& resource_markers();

// True if dir has a Stow.toml or at least one resource marker.
bool is_bundle_dir(const std::filesystem::path& dir);

// Find bundles under root. Every directory with a Stow.toml is a candidate
// (nested bundles are not searched further). When none is found but root
// itself holds resources, root is the single candidate. Sorted by name.
Result<std::vector<BundleCandidate>> discover_bundles(const std::filesystem::path& root);

// Chooses which discovered candidates to install.
class Selector {
public:
    virtual ~Selector() = default;
    virtual Result<std::vector<BundleCandidate>> select(
        const std::vector<BundleCandidate>& candidates) = 0;
};

// Non-interactive default: take everything.
class SelectAll : public Selector {
public:
    Result<std::vector<BundleCandidate>> select(
        const std::vector<BundleCandidate>& candidates) override;
};

} // namespace stow
