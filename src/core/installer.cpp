#include <stow/installer.hpp>
#include <stow/fsutil.hpp>
#include <stow/log.hpp>
#include <stow/merge.hpp>
#include <stow/sha256.hpp>

#include <algorithm>
#include <unordered_map>

namespace fs = std::filesystem;

namespace stow {

const char* action_kind_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::Write:   return "write";
        case ActionKind::Merge:   return "merge";
        case ActionKind::Remove:  return "remove";
        case ActionKind::Migrate: return "migrate";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string content_hash(const std::string& bytes) {
    return fsutil::with_hash_prefix(SHA256::hash_hex(bytes));
}

static std::string join(const std::vector<std::string>& items, const char* sep = ", ") {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

static bool contains(const std::vector<std::string>& items, const std::string& s) {
    return std::find(items.begin(), items.end(), s) != items.end();
}

static Result<std::optional<std::string>> read_if_exists(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    auto content = fsutil::read_file(path);
    if (content.is_err()) return std::move(content).error();
    return Result<std::optional<std::string>>::ok(std::move(content).value());
}

static Result<std::string> read_contribution(const BundleLocator& locate, const Contribution& c) {
    auto root = locate(c.bundle);
    if (!root) {
        return StowError{StowError::NotFound,
            "content of bundle '" + c.bundle + "' is not available",
            "check that the bundle's source is still reachable"};
    }
    return fsutil::read_file(*root / c.path);
}

static std::string trim_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

static std::vector<Platform> known_platforms(const PlatformRegistry& registry,
                                             const std::set<std::string>& ids) {
    std::vector<Platform> out;
    for (const auto& id : ids) {
        const Platform* p = registry.find(id);
        if (!p) {
            log::warn("platform '%s' is no longer defined; its files will be removed", id.c_str());
            continue;
        }
        out.push_back(*p);
    }
    return out;
}

// Recompute the workspace bundle's lock entry for a manifest about to be
// written.
static Status refresh_workspace_entry(LockedBundle& entry, const fs::path& bundle_dir,
                                      const Manifest& manifest) {
    const std::map<std::string, std::string> overrides{{"Stow.toml", manifest.to_toml()}};
    auto files = fsutil::list_files(bundle_dir, workspace_bundle_excludes());
    if (files.is_err()) return std::move(files).error();
    entry.files = std::move(files).value();
    if (!std::binary_search(entry.files.begin(), entry.files.end(), std::string("Stow.toml"))) {
        entry.files.insert(std::upper_bound(entry.files.begin(), entry.files.end(),
                                            std::string("Stow.toml")), "Stow.toml");
    }
    auto hash = fsutil::hash_files(bundle_dir, entry.files, overrides);
    if (hash.is_err()) return std::move(hash).error();
    entry.hash = std::move(hash).value();
    entry.dependencies = manifest.dependency_names();
    entry.description = manifest.bundle.description;
    entry.version = manifest.bundle.version;
    return ok_status();
}

static BundleSummary summarize(const LockedBundle& b, const LockFile& lock,
                               const WorkspaceIndex& index) {
    BundleSummary s;
    s.name = b.name;
    s.description = b.description;
    s.version = b.version;
    s.source = b.source.display();
    s.hash = b.hash;
    s.dependencies = b.dependencies;
    s.file_count = b.files.size();
    s.installed_count = index.entries_for(b.name).size();
    s.is_workspace = b.name == lock.name;
    return s;
}

// ---------------------------------------------------------------------------
// Installer
// ---------------------------------------------------------------------------

Installer::Installer(Workspace& workspace, Cache& cache, Fetcher& fetcher)
    : workspace_(workspace), cache_(cache), fetcher_(fetcher) {}

std::set<fs::path> Installer::keep_dirs(const PlatformRegistry& registry) const {
    std::set<fs::path> keep{workspace_.root().lexically_normal(),
                            workspace_.dir().lexically_normal()};
    for (const auto& p : registry.all()) {
        if (p.directory.empty() || p.directory == ".") continue;
        keep.insert((workspace_.root() / p.directory).lexically_normal());
    }
    return keep;
}

Result<std::vector<Platform>> Installer::choose_platforms(const InstallOptions& options,
                                                          const Config& config,
                                                          const PlatformRegistry& registry,
                                                          const WorkspaceIndex& index) const {
    std::vector<Platform> chosen;
    if (!options.platforms.empty()) {
        auto sel = registry.select(options.platforms);
        if (sel.is_err()) return std::move(sel).error();
        chosen = std::move(sel).value();
    } else if (config.platforms && !config.platforms->empty()) {
        auto sel = registry.select(*config.platforms);
        if (sel.is_err()) return std::move(sel).error();
        chosen = std::move(sel).value();
    } else {
        chosen = registry.detect(workspace_.root());
    }

    for (auto& p : known_platforms(registry, index.platforms())) {
        bool present = std::any_of(chosen.begin(), chosen.end(),
            [&](const Platform& q) { return q.id == p.id; });
        if (!present) chosen.push_back(std::move(p));
    }
    return Result<std::vector<Platform>>::ok(std::move(chosen));
}

std::optional<fs::path> Installer::locate_locked(const LockFile& lock, const std::string& name) {
    const LockedBundle* b = lock.find(name);
    if (!b) return std::nullopt;
    if (name == lock.name) return workspace_.dir();

    if (b->source.is_directory()) {
        if (!fsutil::is_hash_string(b->hash)) return std::nullopt;
        fs::path dir = b->source.dir().path;
        if (dir.is_relative()) dir = workspace_.root() / dir;
        BundleSource source = BundleSource::directory(fsutil::canonical_string(dir));
        std::string revision = b->hash.substr(7);

        if (auto hit = cache_.lookup(source.fetch_identity(), revision)) return hit;
        auto snap = cache_.get_or_fetch(source, fetcher_);
        if (snap.is_ok() && snap.value().revision == revision) return snap.value().root;
        log::debug("locked content of '%s' is no longer available", name.c_str());
        return std::nullopt;
    }

    const auto& r = b->source.remote();
    std::optional<fs::path> root = cache_.lookup(b->source.fetch_identity(), r.revision);
    if (!root) {
        auto snap = cache_.get_or_fetch(b->source, fetcher_);
        if (snap.is_err()) {
            log::warn("cannot fetch locked revision of '%s': %s",
                      name.c_str(), snap.error().message.c_str());
            return std::nullopt;
        }
        root = snap.value().root;
    }
    if (!r.subpath.empty()) *root /= r.subpath;
    return root;
}

// ---------------------------------------------------------------------------
// Source addition
// ---------------------------------------------------------------------------

static BundleCandidate candidate_at(const fs::path& dir) {
    BundleCandidate c;
    c.name = dir.filename().string();
    std::error_code ec;
    if (fs::is_regular_file(dir / "Stow.toml", ec)) {
        auto m = Manifest::load((dir / "Stow.toml").string());
        if (m.is_ok() && !m.value().bundle.name.empty()) {
            c.name = m.value().bundle.name;
            c.description = m.value().bundle.description;
        }
    }
    return c;
}

Status Installer::add_source(const InstallOptions& options, Manifest& manifest,
                             std::vector<std::string>& added) {
    auto parsed = parse_source_spec(options.source);
    if (parsed.is_err()) return std::move(parsed).error();
    BundleSource source = std::move(parsed).value();

    std::error_code ec;
    fs::path search_root;
    std::string base_subpath;
    if (source.is_directory()) {
        fs::path dir = source.dir().path;
        if (dir.is_relative()) dir = fs::current_path(ec) / dir;
        source = BundleSource::directory(fsutil::canonical_string(dir));
        search_root = source.dir().path;
    } else {
        const RemoteSource& r = source.remote();
        base_subpath = r.subpath;
        auto snap = cache_.get_or_fetch(BundleSource::remote(r.origin, r.ref), fetcher_);
        if (snap.is_err()) return std::move(snap).error();
        search_root = snap.value().root;
        if (!base_subpath.empty()) search_root /= base_subpath;
    }
    if (!fs::is_directory(search_root, ec)) {
        return StowError{StowError::SourceResolution,
            "no bundle directory at " + source.display()};
    }

    std::vector<BundleCandidate> chosen;
    if (!base_subpath.empty()) {
        // An exact sub-path names the bundle directly
        if (!is_bundle_dir(search_root)) {
            return StowError{StowError::NotFound,
                "no bundle at '" + base_subpath + "' in " + source.display()};
        }
        chosen.push_back(candidate_at(search_root));
    } else {
        auto found = discover_bundles(search_root);
        if (found.is_err()) return std::move(found).error();
        const auto& candidates = found.value();
        if (candidates.empty()) {
            return StowError{StowError::NotFound,
                "no bundles found in " + source.display(),
                "a bundle is a directory with a Stow.toml or resource directories such as commands/"};
        }

        if (!options.bundles.empty()) {
            for (const auto& name : options.bundles) {
                auto it = std::find_if(candidates.begin(), candidates.end(),
                    [&](const BundleCandidate& c) { return c.name == name; });
                if (it == candidates.end()) {
                    std::vector<std::string> names;
                    for (const auto& c : candidates) names.push_back(c.name);
                    return StowError{StowError::NotFound,
                        "no bundle named '" + name + "' in " + source.display(),
                        "available: " + join(names)};
                }
                chosen.push_back(*it);
            }
        } else if (candidates.size() == 1) {
            chosen = candidates;
        } else {
            SelectAll all;
            Selector& selector = options.selector ? *options.selector : all;
            auto sel = selector.select(candidates);
            if (sel.is_err()) return std::move(sel).error();
            chosen = std::move(sel).value();
        }
    }
    if (chosen.empty()) {
        return StowError{StowError::InvalidArg, "no bundle selected from " + source.display()};
    }

    Resolver probe(cache_, fetcher_, workspace_.root());
    for (const auto& c : chosen) {
        Dependency dep;
        dep.name = c.name;
        if (source.is_directory()) {
            std::string abs = fsutil::canonical_string(fs::path(source.dir().path) / c.subpath);
            fs::path rel = fs::path(abs).lexically_relative(workspace_.root());
            dep.path = rel.empty() ? abs : rel.generic_string();
        } else {
            const RemoteSource& r = source.remote();
            dep.git = r.origin;
            if (!r.ref.empty()) dep.ref = r.ref;
            std::string sub = base_subpath;
            if (!c.subpath.empty()) sub = sub.empty() ? c.subpath : sub + "/" + c.subpath;
            if (!sub.empty()) dep.subpath = sub;
        }

        if (const Dependency* existing = manifest.find_dependency(dep.name)) {
            auto have = probe.source_for(*existing, nullptr);
            auto want = probe.source_for(dep, nullptr);
            if (have.is_err()) return std::move(have).error();
            if (want.is_err()) return std::move(want).error();
            if (have.value().identity() != want.value().identity()) {
                return StowError{StowError::NameConflict,
                    "bundle '" + dep.name + "' is already installed from " +
                    have.value().display(),
                    "uninstall it first, or rename one of the bundles"};
            }
        }

        if (manifest.add_dependency(dep)) {
            log::info("added '%s' from %s", dep.name.c_str(), source.display().c_str());
            added.push_back(dep.name);
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Reconciliation
// ---------------------------------------------------------------------------

Result<WorkspaceIndex> Installer::reconcile(const ReconcileInput& in, Transaction* tx,
                                           std::vector<PlannedAction>& actions) {
    const fs::path& root = workspace_.root();
    IndexPlan plan = compute_index_update(*in.new_lock, in.platforms);
    IndexPlan previous = compute_index_update(*in.old_lock, in.old_platforms);

    auto unchanged = [&](const std::string& bundle) {
        const LockedBundle* a = in.old_lock->find(bundle);
        const LockedBundle* b = in.new_lock->find(bundle);
        return a && b && a->hash == b->hash;
    };

    auto write = [&](ActionKind kind, const std::string& output, const std::string& content,
                     const std::string& detail) -> Status {
        actions.push_back(PlannedAction{kind, output, detail});
        log::debug("%s %s (%s)", action_kind_name(kind), output.c_str(), detail.c_str());
        if (tx) return tx->write_file(root / output, content);
        return ok_status();
    };

    auto remove = [&](const std::string& output, const std::string& detail) -> Status {
        actions.push_back(PlannedAction{ActionKind::Remove, output, detail});
        log::debug("remove %s", output.c_str());
        if (!tx) return ok_status();
        fs::path target = root / output;
        STOW_TRY(tx->remove_file(target));
        return tx->prune_empty_dirs(target.parent_path(), root, in.keep_dirs);
    };

    std::map<std::string, std::string> hashes;

    for (const auto& out : plan.outputs) {
        auto live = read_if_exists(root / out.output);
        if (live.is_err()) return std::move(live).error();

        if (out.strategy == MergeStrategy::Replace) {
            const Contribution& owner = out.contributors.back();
            auto content = read_contribution(in.new_locate, owner);
            if (content.is_err()) return std::move(content).error();
            if (live.value() != content.value()) {
                STOW_TRY(write(ActionKind::Write, out.output, content.value(), owner.bundle));
            }
            hashes[out.output] = content_hash(content.value());
            continue;
        }

        std::optional<std::string> merged = live.value();
        bool composite = out.strategy == MergeStrategy::Composite;

        // Take back contributions that are leaving or have changed
        const PlannedOutput* prev = previous.find_output(out.output);
        if (merged && prev) {
            for (const auto& oc : prev->contributors) {
                bool leaving;
                if (composite) {
                    leaving = std::none_of(out.contributors.begin(), out.contributors.end(),
                        [&](const Contribution& c) { return c.bundle == oc.bundle; });
                } else {
                    bool stays = std::any_of(out.contributors.begin(), out.contributors.end(),
                        [&](const Contribution& c) { return c.bundle == oc.bundle && c.path == oc.path; });
                    leaving = !stays || !unchanged(oc.bundle);
                }
                if (!leaving) continue;

                std::string old_content;
                if (!composite) {
                    auto src = read_contribution(in.old_locate, oc);
                    if (src.is_err()) {
                        log::warn("cannot take back %s of '%s' from %s: %s", oc.path.c_str(),
                                  oc.bundle.c_str(), out.output.c_str(), src.error().message.c_str());
                        continue;
                    }
                    old_content = std::move(src).value();
                }
                auto rest = merge::remove_contribution(out.strategy, *merged, old_content, oc.bundle);
                if (rest.is_err()) return std::move(rest).error();
                merged = std::move(rest).value();
            }
        }

        // Fold current contributions in lock order. A composite target gets
        // one block per bundle holding all of that bundle's files.
        std::vector<std::pair<std::string, std::string>> parts;
        for (const auto& c : out.contributors) {
            auto src = read_contribution(in.new_locate, c);
            if (src.is_err()) return std::move(src).error();
            if (composite) {
                auto it = std::find_if(parts.begin(), parts.end(),
                    [&](const std::pair<std::string, std::string>& p) { return p.first == c.bundle; });
                if (it != parts.end()) {
                    it->second = trim_newlines(it->second) + "\n\n" + src.value();
                    continue;
                }
            }
            parts.emplace_back(c.bundle, std::move(src).value());
        }

        std::vector<std::string> bundles;
        for (const auto& [bundle, text] : parts) {
            auto next = merge::apply(out.strategy, merged, text, bundle);
            if (next.is_err()) {
                auto err = std::move(next).error();
                err.hint = "while merging '" + bundle + "' into " + out.output;
                return err;
            }
            merged = std::move(next).value();
            if (!contains(bundles, bundle)) bundles.push_back(bundle);
        }

        std::string content = merged.value_or("");
        if (live.value() != content) {
            STOW_TRY(write(ActionKind::Merge, out.output, content, join(bundles)));
        }
        hashes[out.output] = content_hash(content);
    }

    // Outputs no surviving bundle provides
    for (const auto& output : in.old_index->outputs()) {
        if (plan.find_output(output)) continue;

        auto owners = in.old_index->find_output(output);
        MergeStrategy strategy = owners.front()->strategy;
        auto live = read_if_exists(root / output);
        if (live.is_err()) return std::move(live).error();
        if (!live.value()) continue;

        if (strategy == MergeStrategy::Replace) {
            STOW_TRY(remove(output, owners.front()->bundle));
            continue;
        }

        std::vector<Contribution> leaving;
        if (const PlannedOutput* prev = previous.find_output(output)) {
            leaving = prev->contributors;
        }
        for (const auto* e : owners) {
            bool known = std::any_of(leaving.begin(), leaving.end(),
                [&](const Contribution& c) { return c.bundle == e->bundle && c.path == e->path; });
            if (!known) leaving.push_back(Contribution{e->bundle, e->path});
        }

        std::string rest = *live.value();
        for (const auto& c : leaving) {
            std::string old_content;
            if (strategy != MergeStrategy::Composite) {
                auto src = read_contribution(in.old_locate, c);
                if (src.is_err()) {
                    log::warn("cannot take back %s of '%s' from %s: %s", c.path.c_str(),
                              c.bundle.c_str(), output.c_str(), src.error().message.c_str());
                    continue;
                }
                old_content = std::move(src).value();
            }
            auto next = merge::remove_contribution(strategy, rest, old_content, c.bundle);
            if (next.is_err()) return std::move(next).error();
            rest = std::move(next).value();
        }

        if (merge::is_empty_residual(strategy, rest)) {
            STOW_TRY(remove(output, owners.front()->bundle));
        } else if (rest != *live.value()) {
            STOW_TRY(write(ActionKind::Merge, output, rest, "residual"));
        }
    }

    WorkspaceIndex index;
    for (const auto& e : plan.index.entries()) {
        IndexEntry entry = e;
        entry.hash = hashes[e.output];
        index.upsert(std::move(entry));
    }
    return Result<WorkspaceIndex>::ok(std::move(index));
}

// ---------------------------------------------------------------------------
// install()
// ---------------------------------------------------------------------------

Result<InstallReport> Installer::install(const InstallOptions& options) {
    auto cfg = workspace_.config();
    if (cfg.is_err()) return std::move(cfg).error();
    const Config& config = cfg.value();
    bool frozen = options.frozen || config.frozen.value_or(false);

    FileLock guard;
    if (!options.dry_run) {
        auto lock = workspace_.lock(!options.no_wait && config.wait_for_lock());
        if (lock.is_err()) return std::move(lock).error();
        guard = std::move(lock).value();
    }

    auto loaded = workspace_.load_state();
    if (loaded.is_err()) return std::move(loaded).error();
    WorkspaceState state = std::move(loaded).value();

    auto reg = workspace_.platforms();
    if (reg.is_err()) return std::move(reg).error();
    const PlatformRegistry& registry = reg.value();

    InstallReport report;
    report.dry_run = options.dry_run;

    Manifest manifest = state.manifest;
    if (!options.source.empty()) {
        STOW_TRY(add_source(options, manifest, report.added));
    }

    auto chosen = choose_platforms(options, config, registry, state.index);
    if (chosen.is_err()) return std::move(chosen).error();
    if (chosen.value().empty()) {
        return StowError{StowError::InvalidArg, "no platform to install for",
            "create a platform directory such as .claude/, or name platforms explicitly"};
    }
    for (const auto& p : chosen.value()) report.platforms.push_back(p.id);

    // Resolution happens before anything is touched
    Resolver resolver(cache_, fetcher_, workspace_.root());
    ResolveOptions ropts;
    ropts.locked = state.has_lock ? &state.lock : nullptr;
    ropts.update = options.update;
    auto resolved = resolver.resolve(manifest, workspace_.bundle_name(manifest),
                                     workspace_.dir(), ropts);
    if (resolved.is_err()) return std::move(resolved).error();

    std::error_code ec;
    std::string manifest_text = manifest.to_toml();
    bool manifest_changed = !fs::exists(workspace_.manifest_path(), ec) ||
                            manifest_text != state.manifest.to_toml();
    std::map<std::string, std::string> overrides;
    if (manifest_changed) overrides["Stow.toml"] = manifest_text;

    auto fresh = generate_lockfile(resolved.value(), workspace_.root(), overrides);
    if (fresh.is_err()) return std::move(fresh).error();

    if (frozen) {
        if (!state.has_lock) {
            return StowError{StowError::FrozenMismatch, "no Stow.lock to install from",
                "run install without --frozen to create it"};
        }
        STOW_TRY(validate_frozen(state.lock, fresh.value()));
    }

    std::unordered_map<std::string, fs::path> roots;
    for (const auto& r : resolved.value()) roots[r.name] = r.root;

    ReconcileInput in;
    in.old_lock = &state.lock;
    in.old_index = &state.index;
    in.platforms = chosen.value();
    in.old_platforms = known_platforms(registry, state.index.platforms());
    in.old_locate = [this, &state](const std::string& bundle) {
        return locate_locked(state.lock, bundle);
    };
    in.new_locate = [&roots](const std::string& bundle) -> std::optional<fs::path> {
        auto it = roots.find(bundle);
        if (it == roots.end()) return std::nullopt;
        return it->second;
    };
    in.keep_dirs = keep_dirs(registry);

    // Local edits to installed files. The workspace bundle's own outputs are
    // compared with the recorded hash, its sources may have moved on since.
    std::vector<ModifiedFile> modified;
    if (state.has_index) {
        BundleLocator originals = [this, &state](const std::string& bundle) -> std::optional<fs::path> {
            if (bundle == state.lock.name) return std::nullopt;
            return locate_locked(state.lock, bundle);
        };
        auto found = detect_modified(state.index, workspace_.root(), originals);
        if (found.is_err()) return std::move(found).error();
        for (auto& m : found.value()) {
            bool seen = std::any_of(modified.begin(), modified.end(),
                [&](const ModifiedFile& x) { return x.path == m.path; });
            if (!seen) modified.push_back(std::move(m));
        }
    }
    if (frozen && !modified.empty()) {
        std::string names;
        for (const auto& m : modified) {
            if (!names.empty()) names += ", ";
            names += m.output;
        }
        return StowError{StowError::FrozenMismatch,
            "installed files were edited locally: " + names,
            "run install without --frozen to keep the edits in " +
                std::string(Workspace::DIR_NAME)};
    }
    report.migrated = modified;

    if (options.dry_run) {
        for (const auto& m : modified) {
            report.actions.push_back(PlannedAction{ActionKind::Migrate,
                std::string(Workspace::DIR_NAME) + "/" + m.path, m.bundle});
        }
        in.new_lock = &fresh.value();
        auto index = reconcile(in, nullptr, report.actions);
        if (index.is_err()) return std::move(index).error();
        for (const auto& b : fresh.value().bundles) report.bundles.push_back(b.name);
        return Result<InstallReport>::ok(std::move(report));
    }

    LockFile next_lock;
    auto status = Transaction::run(workspace_.record_paths(), [&](Transaction& tx) -> Status {
        for (const auto& m : modified) {
            auto live = fsutil::read_file(workspace_.root() / m.output);
            if (live.is_err()) return std::move(live).error();
            STOW_TRY(tx.write_file(workspace_.dir() / m.path, live.value()));
            report.actions.push_back(PlannedAction{ActionKind::Migrate,
                std::string(Workspace::DIR_NAME) + "/" + m.path, m.bundle});
            log::info("kept local edit of %s as %s/%s", m.output.c_str(),
                      Workspace::DIR_NAME, m.path.c_str());
        }

        if (modified.empty()) {
            next_lock = fresh.value();
        } else {
            auto regenerated = generate_lockfile(resolved.value(), workspace_.root(), overrides);
            if (regenerated.is_err()) return std::move(regenerated).error();
            next_lock = std::move(regenerated).value();
        }

        in.new_lock = &next_lock;
        auto index = reconcile(in, &tx, report.actions);
        if (index.is_err()) return std::move(index).error();

        // Records last
        if (manifest_changed) {
            STOW_TRY(tx.write_file(workspace_.manifest_path(), manifest_text));
        }
        if (!frozen) {
            STOW_TRY(tx.write_file(workspace_.lock_path(), next_lock.to_toml()));
        }
        STOW_TRY(tx.write_file(workspace_.index_path(), index.value().to_toml()));
        return ok_status();
    });
    if (status.is_err()) return std::move(status).error();

    for (const auto& b : next_lock.bundles) report.bundles.push_back(b.name);
    for (const auto& b : state.lock.bundles) {
        if (!next_lock.contains(b.name)) report.removed.push_back(b.name);
    }
    log::info("installed %zu bundle(s) for %s, %zu file change(s)",
              report.bundles.size(), join(report.platforms).c_str(), report.actions.size());
    return Result<InstallReport>::ok(std::move(report));
}

// ---------------------------------------------------------------------------
// uninstall()
// ---------------------------------------------------------------------------

Result<InstallReport> Installer::uninstall(const UninstallOptions& options) {
    if (options.names.empty()) {
        return StowError{StowError::InvalidArg, "no bundle named to uninstall"};
    }

    auto cfg = workspace_.config();
    if (cfg.is_err()) return std::move(cfg).error();

    FileLock guard;
    if (!options.dry_run) {
        auto lock = workspace_.lock(!options.no_wait && cfg.value().wait_for_lock());
        if (lock.is_err()) return std::move(lock).error();
        guard = std::move(lock).value();
    }

    auto loaded = workspace_.load_state();
    if (loaded.is_err()) return std::move(loaded).error();
    WorkspaceState state = std::move(loaded).value();
    if (!state.has_lock) {
        return StowError{StowError::NotFound, "nothing is installed in this workspace"};
    }
    const LockFile& old_lock = state.lock;

    for (const auto& name : options.names) {
        if (name == old_lock.name) {
            return StowError{StowError::InvalidArg,
                "cannot uninstall the workspace's own bundle '" + name + "'"};
        }
        if (!old_lock.contains(name)) {
            return StowError{StowError::NotFound, "bundle '" + name + "' is not installed"};
        }
    }

    // Everything still reachable from the remaining direct dependencies
    Manifest manifest = state.manifest;
    std::vector<std::string> pending;
    for (const auto& dep : manifest.dependency_names()) {
        if (!contains(options.names, dep)) pending.push_back(dep);
    }
    std::set<std::string> kept{old_lock.name};
    while (!pending.empty()) {
        std::string name = pending.back();
        pending.pop_back();
        if (!kept.insert(name).second) continue;
        if (const LockedBundle* b = old_lock.find(name)) {
            for (const auto& d : b->dependencies) pending.push_back(d);
        }
    }

    for (const auto& name : options.names) {
        if (!kept.count(name)) continue;
        std::vector<std::string> dependents;
        for (const auto& b : old_lock.bundles) {
            if (b.name == old_lock.name || !kept.count(b.name)) continue;
            if (contains(b.dependencies, name)) dependents.push_back(b.name);
        }
        return StowError{StowError::Dependency,
            "cannot uninstall '" + name + "': still required by " + join(dependents),
            "uninstall " + join(dependents, " and ") + " as well"};
    }

    for (const auto& name : options.names) manifest.remove_dependency(name);

    LockFile next_lock;
    next_lock.version = old_lock.version;
    next_lock.name = old_lock.name;
    for (const auto& b : old_lock.bundles) {
        if (kept.count(b.name)) next_lock.bundles.push_back(b);
    }
    std::string manifest_text = manifest.to_toml();
    for (auto& b : next_lock.bundles) {
        if (b.name == next_lock.name) {
            STOW_TRY(refresh_workspace_entry(b, workspace_.dir(), manifest));
        }
    }

    auto reg = workspace_.platforms();
    if (reg.is_err()) return std::move(reg).error();

    InstallReport report;
    report.dry_run = options.dry_run;
    for (const auto& b : old_lock.bundles) {
        if (!kept.count(b.name)) report.removed.push_back(b.name);
    }
    for (const auto& b : next_lock.bundles) report.bundles.push_back(b.name);

    ReconcileInput in;
    in.old_lock = &old_lock;
    in.old_index = &state.index;
    in.new_lock = &next_lock;
    in.platforms = known_platforms(reg.value(), state.index.platforms());
    in.old_platforms = in.platforms;
    for (const auto& p : in.platforms) report.platforms.push_back(p.id);
    in.old_locate = [this, &old_lock](const std::string& bundle) {
        return locate_locked(old_lock, bundle);
    };
    in.new_locate = in.old_locate;
    in.keep_dirs = keep_dirs(reg.value());

    if (options.dry_run) {
        auto index = reconcile(in, nullptr, report.actions);
        if (index.is_err()) return std::move(index).error();
        return Result<InstallReport>::ok(std::move(report));
    }

    auto status = Transaction::run(workspace_.record_paths(), [&](Transaction& tx) -> Status {
        auto index = reconcile(in, &tx, report.actions);
        if (index.is_err()) return std::move(index).error();

        STOW_TRY(tx.write_file(workspace_.manifest_path(), manifest_text));
        STOW_TRY(tx.write_file(workspace_.lock_path(), next_lock.to_toml()));
        STOW_TRY(tx.write_file(workspace_.index_path(), index.value().to_toml()));
        return ok_status();
    });
    if (status.is_err()) return std::move(status).error();

    log::info("uninstalled %s", join(report.removed).c_str());
    return Result<InstallReport>::ok(std::move(report));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<std::vector<BundleSummary>> Installer::list() const {
    auto loaded = workspace_.load_state();
    if (loaded.is_err()) return std::move(loaded).error();
    const WorkspaceState& state = loaded.value();

    std::vector<BundleSummary> out;
    for (const auto& b : state.lock.bundles) {
        out.push_back(summarize(b, state.lock, state.index));
    }
    return Result<std::vector<BundleSummary>>::ok(std::move(out));
}

Result<BundleDetails> Installer::show(const std::string& name) const {
    auto loaded = workspace_.load_state();
    if (loaded.is_err()) return std::move(loaded).error();
    const WorkspaceState& state = loaded.value();

    const LockedBundle* b = state.lock.find(name);
    if (!b) {
        return StowError{StowError::NotFound, "bundle '" + name + "' is not installed"};
    }

    BundleDetails d;
    d.summary = summarize(*b, state.lock, state.index);
    d.files = b->files;
    for (const auto* e : state.index.entries_for(name)) d.installed.push_back(*e);
    for (const auto& other : state.lock.bundles) {
        if (other.name != state.lock.name && contains(other.dependencies, name)) {
            d.dependents.push_back(other.name);
        }
    }
    return Result<BundleDetails>::ok(std::move(d));
}

} // namespace stow
