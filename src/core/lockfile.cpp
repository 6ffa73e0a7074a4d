#include <stow/lockfile.hpp>
#include <stow/fsutil.hpp>
#include <stow/resolver.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace stow {

const std::set<std::string>& bundle_excludes() {
    static const std::set<std::string> ex = {"Stow.lock", "Stow.index"};
    return ex;
}

const std::set<std::string>& workspace_bundle_excludes() {
    static const std::set<std::string> ex = {
        "Stow.lock", "Stow.index", ".lock", "config.toml", "platforms.toml",
    };
    return ex;
}

bool LockedBundle::operator==(const LockedBundle& other) const {
    return name == other.name &&
           description == other.description &&
           version == other.version &&
           source.identity() == other.source.identity() &&
           source.is_remote() == other.source.is_remote() &&
           (!source.is_remote() || source.remote().revision == other.source.remote().revision) &&
           hash == other.hash &&
           files == other.files &&
           dependencies == other.dependencies;
}

bool LockFile::operator==(const LockFile& other) const {
    return version == other.version && name == other.name && bundles == other.bundles;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static StowError lock_error(const std::string& msg) {
    return StowError{StowError::Parse, "lockfile: " + msg,
        "delete Stow.lock and run install to regenerate it"};
}

static Result<std::vector<std::string>> string_array(const toml::table& tbl,
                                                     const char* key,
                                                     const std::string& owner) {
    std::vector<std::string> out;
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));
    const toml::array* arr = node->as_array();
    if (!arr) return lock_error("'" + std::string(key) + "' of '" + owner + "' must be an array");
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) return lock_error("'" + std::string(key) + "' of '" + owner + "' must hold strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Result<BundleSource> parse_locked_source(const toml::table& tbl, const std::string& owner) {
    auto type = tbl["type"].value<std::string>();
    if (!type) return lock_error("source of '" + owner + "' has no type");

    if (*type == "dir") {
        auto path = tbl["path"].value<std::string>();
        if (!path) return lock_error("directory source of '" + owner + "' has no path");
        return Result<BundleSource>::ok(BundleSource::directory(*path));
    }
    if (*type == "git") {
        auto url = tbl["url"].value<std::string>();
        if (!url) return lock_error("git source of '" + owner + "' has no url");
        return Result<BundleSource>::ok(BundleSource::remote(
            *url,
            tbl["ref"].value_or(std::string()),
            tbl["subpath"].value_or(std::string()),
            tbl["revision"].value_or(std::string())));
    }
    return lock_error("source of '" + owner + "' has unknown type '" + *type + "'");
}

Result<LockFile> LockFile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StowError{StowError::Parse,
            std::string("lockfile TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    LockFile lock;
    lock.version = doc["version"].value_or(FORMAT_VERSION);
    if (lock.version != FORMAT_VERSION) {
        return StowError{StowError::Parse,
            "unsupported lockfile version " + std::to_string(lock.version),
            "this stow understands version " + std::to_string(FORMAT_VERSION)};
    }
    lock.name = doc["name"].value_or(std::string());

    if (auto arr = doc["bundles"].as_array()) {
        for (const auto& node : *arr) {
            const toml::table* tbl = node.as_table();
            if (!tbl) return lock_error("every [[bundles]] entry must be a table");

            LockedBundle b;
            b.name = (*tbl)["name"].value_or(std::string());
            b.description = (*tbl)["description"].value_or(std::string());
            b.version = (*tbl)["version"].value_or(std::string());
            b.hash = (*tbl)["hash"].value_or(std::string());

            const toml::table* src = (*tbl)["source"].as_table();
            if (!src) return lock_error("bundle '" + b.name + "' has no source");
            auto parsed = parse_locked_source(*src, b.name);
            if (parsed.is_err()) return std::move(parsed).error();
            b.source = std::move(parsed).value();

            auto files = string_array(*tbl, "files", b.name);
            if (files.is_err()) return std::move(files).error();
            b.files = std::move(files).value();

            auto deps = string_array(*tbl, "dependencies", b.name);
            if (deps.is_err()) return std::move(deps).error();
            b.dependencies = std::move(deps).value();

            lock.bundles.push_back(std::move(b));
        }
    } else if (doc.contains("bundles")) {
        return lock_error("'bundles' must be an array of tables");
    }

    return Result<LockFile>::ok(std::move(lock));
}

Result<LockFile> LockFile::load(const std::string& path) {
    auto content = fsutil::read_file(path);
    if (content.is_err()) return std::move(content).error();
    return parse(content.value()).in_file(path);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

static toml::array to_array(const std::vector<std::string>& v) {
    toml::array arr;
    for (const auto& s : v) arr.push_back(s);
    return arr;
}

std::string LockFile::to_toml() const {
    toml::table doc;
    doc.insert("version", version);
    doc.insert("name", name);

    toml::array arr;
    for (const auto& b : bundles) {
        toml::table t;
        t.insert("name", b.name);
        if (!b.description.empty()) t.insert("description", b.description);
        if (!b.version.empty()) t.insert("version", b.version);
        t.insert("hash", b.hash);
        t.insert("dependencies", to_array(b.dependencies));
        t.insert("files", to_array(b.files));

        toml::table src;
        if (b.source.is_directory()) {
            src.insert("type", "dir");
            src.insert("path", b.source.dir().path);
        } else {
            const auto& r = b.source.remote();
            src.insert("type", "git");
            src.insert("url", r.origin);
            if (!r.ref.empty()) src.insert("ref", r.ref);
            if (!r.subpath.empty()) src.insert("subpath", r.subpath);
            src.insert("revision", r.revision);
        }
        t.insert("source", std::move(src));
        arr.push_back(std::move(t));
    }
    doc.insert("bundles", std::move(arr));

    std::ostringstream out;
    out << "# Generated by stow. Do not edit.\n" << doc << "\n";
    return out.str();
}

Status LockFile::save(const std::string& path) const {
    return fsutil::write_file_atomic(path, to_toml());
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

const LockedBundle* LockFile::find(const std::string& bundle_name) const {
    for (const auto& b : bundles) {
        if (b.name == bundle_name) return &b;
    }
    return nullptr;
}

bool LockFile::contains(const std::string& bundle_name) const {
    return find(bundle_name) != nullptr;
}

bool LockFile::remove(const std::string& bundle_name) {
    auto it = std::remove_if(bundles.begin(), bundles.end(),
        [&](const LockedBundle& b) { return b.name == bundle_name; });
    if (it == bundles.end()) return false;
    bundles.erase(it, bundles.end());
    return true;
}

Status LockFile::validate() const {
    std::unordered_set<std::string> seen;
    for (const auto& b : bundles) {
        if (b.name.empty()) {
            return StowError{StowError::Parse, "lockfile has a bundle with an empty name"};
        }
        if (!seen.insert(b.name).second) {
            return StowError{StowError::Parse,
                "lockfile lists bundle '" + b.name + "' twice"};
        }
        if (!fsutil::is_hash_string(b.hash)) {
            return StowError{StowError::Parse,
                "lockfile hash of '" + b.name + "' is malformed: " + b.hash};
        }
        for (const auto& dep : b.dependencies) {
            if (!seen.count(dep)) {
                return StowError{StowError::Parse,
                    "lockfile lists '" + b.name + "' before its dependency '" + dep + "'"};
            }
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

Result<LockFile> generate_lockfile(const std::vector<ResolvedBundle>& resolved,
                                   const fs::path& workspace_root,
                                   const std::map<std::string, std::string>& workspace_overrides) {
    std::error_code ec;
    fs::path ws_root = fs::weakly_canonical(workspace_root, ec);
    if (ec) ws_root = fs::absolute(workspace_root);

    LockFile lock;
    for (const auto& r : resolved) {
        const auto& excludes = r.is_workspace ? workspace_bundle_excludes() : bundle_excludes();

        LockedBundle b;
        b.name = r.name;
        b.description = r.manifest.bundle.description;
        b.version = r.manifest.bundle.version;
        b.dependencies = r.dependencies;

        if (r.source.is_directory() && !r.is_workspace) {
            fs::path rel = fs::path(r.source.dir().path).lexically_relative(ws_root);
            std::string stored = rel.empty() ? r.source.dir().path : rel.generic_string();
            b.source = BundleSource::directory(stored);
        } else {
            b.source = r.source;
        }

        auto files = fsutil::list_files(r.root, excludes);
        if (files.is_err()) return std::move(files).error();
        b.files = std::move(files).value();

        const std::map<std::string, std::string> none;
        const auto& overrides = r.is_workspace ? workspace_overrides : none;
        for (const auto& [rel, content] : overrides) {
            if (!std::binary_search(b.files.begin(), b.files.end(), rel)) {
                b.files.insert(std::upper_bound(b.files.begin(), b.files.end(), rel), rel);
            }
        }

        auto hash = fsutil::hash_files(r.root, b.files, overrides);
        if (hash.is_err()) return std::move(hash).error();
        b.hash = std::move(hash).value();

        if (r.is_workspace) lock.name = r.name;
        lock.bundles.push_back(std::move(b));
    }
    return Result<LockFile>::ok(std::move(lock));
}

static StowError frozen_error(const std::string& msg) {
    return StowError{StowError::FrozenMismatch, msg,
        "run install without --frozen to update Stow.lock"};
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) out += ", ";
        out += v[i];
    }
    return "[" + out + "]";
}

Status validate_frozen(const LockFile& existing, const LockFile& fresh) {
    if (existing.name != fresh.name) {
        return frozen_error("workspace bundle renamed from '" + existing.name +
                            "' to '" + fresh.name + "'");
    }

    size_t n = std::min(existing.bundles.size(), fresh.bundles.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& a = existing.bundles[i];
        const auto& b = fresh.bundles[i];
        if (a.name != b.name) {
            return frozen_error("bundle order changed at position " + std::to_string(i) +
                                ": locked '" + a.name + "', resolved '" + b.name + "'");
        }
        if (a.source.identity() != b.source.identity()) {
            return frozen_error("source of '" + a.name + "' changed from " +
                                a.source.display() + " to " + b.source.display());
        }
        if (a.source.is_remote() && a.source.remote().revision != b.source.remote().revision) {
            return frozen_error("'" + a.name + "' moved from revision " +
                                a.source.remote().revision + " to " + b.source.remote().revision);
        }
        if (a.hash != b.hash) {
            return frozen_error("content of '" + a.name + "' changed (" +
                                a.hash + " -> " + b.hash + ")");
        }
        if (a.files != b.files) {
            return frozen_error("file list of '" + a.name + "' changed");
        }
        if (a.dependencies != b.dependencies) {
            return frozen_error("dependencies of '" + a.name + "' changed from " +
                                join(a.dependencies) + " to " + join(b.dependencies));
        }
        if (a.description != b.description || a.version != b.version) {
            return frozen_error("metadata of '" + a.name + "' changed");
        }
    }
    if (existing.bundles.size() > n) {
        return frozen_error("locked bundle '" + existing.bundles[n].name + "' is no longer resolved");
    }
    if (fresh.bundles.size() > n) {
        return frozen_error("bundle '" + fresh.bundles[n].name + "' is not in Stow.lock");
    }
    return ok_status();
}

} // namespace stow
