#include <stow/index.hpp>
#include <stow/fsutil.hpp>
#include <stow/log.hpp>
#include <stow/sha256.hpp>
#include <stow/transform.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace stow {

bool IndexEntry::operator==(const IndexEntry& other) const {
    return path == other.path && platform == other.platform &&
           bundle == other.bundle && output == other.output &&
           strategy == other.strategy && hash == other.hash;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

static StowError index_error(const std::string& msg) {
    return StowError{StowError::Parse, "index: " + msg,
        "delete Stow.index and run install to rebuild it"};
}

Result<WorkspaceIndex> WorkspaceIndex::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StowError{StowError::Parse,
            std::string("index TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    int64_t version = doc["version"].value_or(FORMAT_VERSION);
    if (version != FORMAT_VERSION) {
        return index_error("unsupported version " + std::to_string(version));
    }

    WorkspaceIndex idx;
    if (const toml::array* arr = doc["entries"].as_array()) {
        for (const auto& node : *arr) {
            const toml::table* t = node.as_table();
            if (!t) return index_error("every [[entries]] item must be a table");

            IndexEntry e;
            e.path = (*t)["path"].value_or(std::string());
            e.platform = (*t)["platform"].value_or(std::string());
            e.bundle = (*t)["bundle"].value_or(std::string());
            e.output = (*t)["output"].value_or(std::string());
            e.hash = (*t)["hash"].value_or(std::string());
            std::string strategy = (*t)["strategy"].value_or(std::string("replace"));
            if (!parse_merge_strategy(strategy, e.strategy)) {
                return index_error("unknown strategy '" + strategy + "' for " + e.path);
            }
            if (e.path.empty() || e.platform.empty() || e.output.empty()) {
                return index_error("entry is missing path, platform or output");
            }
            idx.upsert(std::move(e));
        }
    }
    return Result<WorkspaceIndex>::ok(std::move(idx));
}

Result<WorkspaceIndex> WorkspaceIndex::load(const std::string& path) {
    auto content = fsutil::read_file(path);
    if (content.is_err()) return std::move(content).error();
    return parse(content.value()).in_file(path);
}

std::string WorkspaceIndex::to_toml() const {
    std::vector<IndexEntry> sorted = entries_;
    std::sort(sorted.begin(), sorted.end(), [](const IndexEntry& a, const IndexEntry& b) {
        if (a.path != b.path) return a.path < b.path;
        return a.platform < b.platform;
    });

    toml::table doc;
    doc.insert("version", FORMAT_VERSION);
    toml::array arr;
    for (const auto& e : sorted) {
        toml::table t;
        t.insert("path", e.path);
        t.insert("platform", e.platform);
        t.insert("bundle", e.bundle);
        t.insert("output", e.output);
        t.insert("strategy", std::string(merge_strategy_name(e.strategy)));
        t.insert("hash", e.hash);
        arr.push_back(std::move(t));
    }
    doc.insert("entries", std::move(arr));

    std::ostringstream out;
    out << "# Generated by stow. Do not edit.\n" << doc << "\n";
    return out.str();
}

Status WorkspaceIndex::save(const std::string& path) const {
    return fsutil::write_file_atomic(path, to_toml());
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

const IndexEntry* WorkspaceIndex::find(const std::string& path, const std::string& platform) const {
    for (const auto& e : entries_) {
        if (e.path == path && e.platform == platform) return &e;
    }
    return nullptr;
}

std::vector<const IndexEntry*> WorkspaceIndex::find_output(const std::string& output) const {
    std::vector<const IndexEntry*> out;
    for (const auto& e : entries_) {
        if (e.output == output) out.push_back(&e);
    }
    return out;
}

const IndexEntry* WorkspaceIndex::find_provider(const std::string& output) const {
    const IndexEntry* last = nullptr;
    for (const auto& e : entries_) {
        if (e.output == output) last = &e;
    }
    return last;
}

std::vector<const IndexEntry*> WorkspaceIndex::entries_for(const std::string& bundle) const {
    std::vector<const IndexEntry*> out;
    for (const auto& e : entries_) {
        if (e.bundle == bundle) out.push_back(&e);
    }
    return out;
}

void WorkspaceIndex::upsert(IndexEntry entry) {
    for (auto& e : entries_) {
        if (e.path == entry.path && e.platform == entry.platform) {
            e = std::move(entry);
            return;
        }
    }
    entries_.push_back(std::move(entry));
}

bool WorkspaceIndex::remove(const std::string& path, const std::string& platform) {
    auto it = std::remove_if(entries_.begin(), entries_.end(), [&](const IndexEntry& e) {
        return e.path == path && e.platform == platform;
    });
    if (it == entries_.end()) return false;
    entries_.erase(it, entries_.end());
    return true;
}

std::set<std::string> WorkspaceIndex::platforms() const {
    std::set<std::string> out;
    for (const auto& e : entries_) out.insert(e.platform);
    return out;
}

std::set<std::string> WorkspaceIndex::outputs() const {
    std::set<std::string> out;
    for (const auto& e : entries_) out.insert(e.output);
    return out;
}

// ---------------------------------------------------------------------------
// Planning
// ---------------------------------------------------------------------------

const PlannedOutput* IndexPlan::find_output(const std::string& output) const {
    for (const auto& o : outputs) {
        if (o.output == output) return &o;
    }
    return nullptr;
}

IndexPlan compute_index_update(const LockFile& lock, const std::vector<Platform>& platforms) {
    IndexPlan plan;
    std::map<std::string, PlannedOutput> outputs;

    for (const auto& bundle : lock.bundles) {
        for (const auto& file : bundle.files) {
            for (auto& target : transform_all(file, platforms)) {
                IndexEntry e;
                e.path = file;
                e.platform = target.platform;
                e.bundle = bundle.name;
                e.output = target.output;
                e.strategy = target.strategy;
                plan.index.upsert(std::move(e));

                auto& out = outputs[target.output];
                out.output = target.output;
                out.strategy = target.strategy;
                auto& cs = out.contributors;
                cs.erase(std::remove_if(cs.begin(), cs.end(), [&](const Contribution& c) {
                    return c.bundle == bundle.name && c.path == file;
                }), cs.end());
                cs.push_back(Contribution{bundle.name, file});
            }
        }
    }

    for (auto& kv : outputs) plan.outputs.push_back(std::move(kv.second));
    return plan;
}

// ---------------------------------------------------------------------------
// Modified-file detection
// ---------------------------------------------------------------------------

Result<std::vector<ModifiedFile>> detect_modified(const WorkspaceIndex& index,
                                                  const fs::path& workspace_root,
                                                  const BundleLocator& locate) {
    std::vector<ModifiedFile> out;
    for (const auto& e : index.entries()) {
        if (e.strategy != MergeStrategy::Replace) continue;

        fs::path live = workspace_root / e.output;
        std::error_code ec;
        if (!fs::is_regular_file(live, ec)) continue;

        std::string live_hash = SHA256::hash_file(live.string());
        if (live_hash.empty()) {
            return StowError{StowError::IO, "cannot read installed file " + live.string()};
        }
        live_hash = fsutil::with_hash_prefix(live_hash);

        std::string original = e.hash;
        if (auto root = locate(e.bundle)) {
            fs::path src = *root / e.path;
            if (fs::is_regular_file(src, ec)) {
                std::string h = SHA256::hash_file(src.string());
                if (!h.empty()) original = fsutil::with_hash_prefix(h);
            }
        }

        if (original.empty() || live_hash == original) continue;

        log::debug("%s was modified since it was installed from '%s'",
                   e.output.c_str(), e.bundle.c_str());
        out.push_back(ModifiedFile{e.path, e.platform, e.bundle, e.output});
    }
    return Result<std::vector<ModifiedFile>>::ok(std::move(out));
}

} // namespace stow
