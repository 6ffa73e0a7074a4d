#pragma once

#include <stow/result.hpp>
#include <stow/cache.hpp>
#include <stow/fetch.hpp>
#include <stow/graph.hpp>
#include <stow/manifest.hpp>
#include <stow/source.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace stow {

struct LockFile;

// One node of the resolved graph, pinned to an exact revision.
struct ResolvedBundle {
    std::string name;
    BundleSource source;                // remote sources carry their revision
    std::string revision;               // empty for the workspace bundle
    std::filesystem::path root;         // bundle directory on disk
    Manifest manifest;
    std::vector<std::string> dependencies;
    bool is_workspace = false;
};

struct ResolveOptions {
    // Revisions recorded here are reused for remotes with an unchanged
    // identity, unless `update` is set.
    const LockFile* locked = nullptr;
    bool update = false;
};

class Resolver {
public:
    Resolver(Cache& cache, Fetcher& fetcher, std::filesystem::path workspace_root);

    // Resolve the workspace manifest's dependencies recursively and return
    // them dependencies-first, in stable declaration order, followed by the
    // workspace's own bundle (rooted at workspace_bundle_dir).
    //
    // Errors: Cycle, NameConflict, SourceResolution, Manifest.
    Result<std::vector<ResolvedBundle>> resolve(const Manifest& workspace_manifest,
                                                const std::string& workspace_name,
                                                const std::filesystem::path& workspace_bundle_dir,
                                                const ResolveOptions& options = {});

    // Source for a dependency declared by `parent` (nullptr: the workspace).
    Result<BundleSource> source_for(const Dependency& dep, const BundleSource* parent) const;

private:
    Cache& cache_;
    Fetcher& fetcher_;
    std::filesystem::path workspace_root_;
    GraphMap<> graph_;
};

} // namespace stow
