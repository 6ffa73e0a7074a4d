#include <stow/resolver.hpp>
#include <stow/fsutil.hpp>
#include <stow/lockfile.hpp>
#include <stow/log.hpp>

#include <functional>
#include <unordered_map>

namespace fs = std::filesystem;

namespace stow {

Resolver::Resolver(Cache& cache, Fetcher& fetcher, fs::path workspace_root)
    : cache_(cache), fetcher_(fetcher), workspace_root_(std::move(workspace_root)) {}

// ---------------------------------------------------------------------------
// source_for()
// ---------------------------------------------------------------------------

Result<BundleSource> Resolver::source_for(const Dependency& dep,
                                          const BundleSource* parent) const {
    if (dep.git) {
        return Result<BundleSource>::ok(BundleSource::remote(
            *dep.git, dep.ref.value_or(""), dep.subpath.value_or("")));
    }
    if (!dep.path) {
        return StowError{StowError::Manifest,
            "dependency '" + dep.name + "' has no source"};
    }

    const std::string& p = *dep.path;
    if (!parent) {
        fs::path base = fs::path(p).is_absolute() ? fs::path(p) : workspace_root_ / p;
        return Result<BundleSource>::ok(BundleSource::directory(fsutil::canonical_string(base)));
    }

    if (parent->is_directory()) {
        fs::path base = fs::path(p).is_absolute() ? fs::path(p) : fs::path(parent->dir().path) / p;
        return Result<BundleSource>::ok(BundleSource::directory(fsutil::canonical_string(base)));
    }

    // A directory inside a remote bundle stays in the same repository
    const auto& r = parent->remote();
    if (fs::path(p).is_absolute()) {
        return StowError{StowError::SourceResolution,
            "dependency '" + dep.name + "' of a remote bundle uses an absolute path: " + p};
    }
    std::string joined = (fs::path(r.subpath) / p).lexically_normal().generic_string();
    while (!joined.empty() && joined.back() == '/') joined.pop_back();
    if (joined == ".") joined.clear();
    if (joined.compare(0, 2, "..") == 0) {
        return StowError{StowError::SourceResolution,
            "dependency '" + dep.name + "' points outside its repository: " + p};
    }
    return Result<BundleSource>::ok(
        BundleSource::remote(r.origin, r.ref, joined, r.revision));
}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<std::vector<ResolvedBundle>> Resolver::resolve(
    const Manifest& workspace_manifest,
    const std::string& workspace_name,
    const fs::path& workspace_bundle_dir,
    const ResolveOptions& options)
{
    graph_ = GraphMap<>();

    std::vector<ResolvedBundle> nodes;
    std::unordered_map<std::string, size_t> by_name;

    // Phase 1: discover every reachable bundle through the cache. A node is
    // registered before its children are visited, so cycles terminate here
    // and are reported by the ordering pass.
    std::function<Status(const Dependency&, const BundleSource*, const std::string&)> visit;
    visit = [&](const Dependency& dep, const BundleSource* parent,
                const std::string& declared_by) -> Status {
        if (dep.name == workspace_name) {
            return StowError{StowError::NameConflict,
                "dependency '" + dep.name + "' declared by " + declared_by +
                " has the same name as the workspace bundle",
                "rename the workspace bundle or the dependency"};
        }

        auto src = source_for(dep, parent);
        if (src.is_err()) return std::move(src).error();
        BundleSource source = std::move(src).value();

        auto existing = by_name.find(dep.name);
        if (existing != by_name.end()) {
            const auto& known = nodes[existing->second].source;
            if (known.identity() != source.identity()) {
                return StowError{StowError::NameConflict,
                    "bundle '" + dep.name + "' is declared with two different sources: " +
                    known.display() + " and " + source.display(),
                    "declared by " + declared_by};
            }
            return ok_status();
        }

        if (source.is_remote() && source.remote().revision.empty() &&
            options.locked && !options.update) {
            const LockedBundle* lb = options.locked->find(dep.name);
            if (lb && lb->source.is_remote() &&
                lb->source.identity() == source.identity() &&
                !lb->source.remote().revision.empty()) {
                source.remote().revision = lb->source.remote().revision;
                log::debug("using locked revision %s for '%s'",
                           source.remote().revision.substr(0, 12).c_str(), dep.name.c_str());
            }
        }

        auto snap = cache_.get_or_fetch(source, fetcher_);
        if (snap.is_err()) {
            auto err = std::move(snap).error();
            if (err.hint.empty()) err.hint = "required by " + declared_by;
            return err;
        }

        ResolvedBundle node;
        node.name = dep.name;
        node.revision = snap.value().revision;
        node.root = snap.value().root;
        if (source.is_remote()) {
            source.remote().revision = node.revision;
            if (!source.remote().subpath.empty()) node.root /= source.remote().subpath;
        }
        node.source = source;

        std::error_code ec;
        if (!fs::is_directory(node.root, ec)) {
            return StowError{StowError::SourceResolution,
                "bundle '" + dep.name + "' not found at " + source.display(),
                "required by " + declared_by};
        }

        fs::path manifest_path = node.root / "Stow.toml";
        if (fs::is_regular_file(manifest_path, ec)) {
            auto m = Manifest::load(manifest_path.string());
            if (m.is_err()) return std::move(m).error();
            node.manifest = std::move(m).value();
        }
        node.dependencies = node.manifest.dependency_names();

        log::debug("resolved '%s' -> %s @ %s", dep.name.c_str(),
                   source.display().c_str(), node.revision.substr(0, 12).c_str());

        by_name[dep.name] = nodes.size();
        graph_.add_node(dep.name);
        Manifest child_manifest = node.manifest;
        nodes.push_back(std::move(node));

        for (const auto& child : child_manifest.dependencies) {
            STOW_TRY(visit(child, &source, "'" + dep.name + "'"));
            graph_.add_edge(dep.name, child.name);
        }
        return ok_status();
    };

    for (const auto& dep : workspace_manifest.dependencies) {
        STOW_TRY(visit(dep, nullptr, "the workspace manifest"));
    }

    // Phase 2: dependencies-first order
    auto order = graph_.postorder(workspace_manifest.dependency_names());
    if (order.is_err()) return std::move(order).error();

    std::vector<ResolvedBundle> out;
    out.reserve(order.value().size() + 1);
    for (const auto& name : order.value()) {
        out.push_back(std::move(nodes[by_name.at(name)]));
    }

    ResolvedBundle ws;
    ws.name = workspace_name;
    ws.source = BundleSource::directory(".stow");
    ws.root = workspace_bundle_dir;
    ws.manifest = workspace_manifest;
    ws.dependencies = workspace_manifest.dependency_names();
    ws.is_workspace = true;
    out.push_back(std::move(ws));

    return Result<std::vector<ResolvedBundle>>::ok(std::move(out));
}

} // namespace stow
