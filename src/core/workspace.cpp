#include <stow/workspace.hpp>
#include <stow/fsutil.hpp>
#include <stow/log.hpp>

namespace fs = std::filesystem;

namespace stow {

static fs::path canonical_or_absolute(const fs::path& p) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    if (ec) c = fs::absolute(p, ec);
    return c;
}

// ---------------------------------------------------------------------------
// Static factory methods
// ---------------------------------------------------------------------------

Result<Workspace> Workspace::open(const fs::path& root) {
    fs::path dir = canonical_or_absolute(root);
    std::error_code ec;
    if (!fs::is_directory(dir / DIR_NAME, ec)) {
        return StowError{StowError::NotFound,
            "not a stow workspace: " + dir.string(),
            "run install in the directory to create .stow/"};
    }
    return Result<Workspace>::ok(Workspace(dir));
}

Result<Workspace> Workspace::discover(const fs::path& start) {
    fs::path dir = canonical_or_absolute(start);
    std::error_code ec;
    while (true) {
        if (fs::is_directory(dir / DIR_NAME, ec)) {
            return Result<Workspace>::ok(Workspace(dir));
        }
        fs::path parent = dir.parent_path();
        if (parent == dir || parent.empty()) {
            return StowError{StowError::NotFound,
                "no stow workspace found from: " + start.string()};
        }
        dir = parent;
    }
}

Result<Workspace> Workspace::init(const fs::path& root, const std::string& name) {
    fs::path dir = canonical_or_absolute(root);
    Workspace ws(dir);

    std::error_code ec;
    fs::create_directories(ws.dir(), ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot create " + ws.dir().string() + ": " + ec.message()};
    }

    if (!fs::exists(ws.manifest_path(), ec)) {
        Manifest m;
        m.bundle.name = name.empty() ? dir.filename().string() : name;
        STOW_TRY(fsutil::write_file_atomic(ws.manifest_path(), m.to_toml()));
        log::info("initialized workspace '%s' in %s", m.bundle.name.c_str(), dir.c_str());
    }
    return Result<Workspace>::ok(std::move(ws));
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::vector<fs::path> Workspace::record_paths() const {
    return {manifest_path(), lock_path(), index_path()};
}

std::string Workspace::bundle_name(const Manifest& manifest) const {
    if (!manifest.bundle.name.empty()) return manifest.bundle.name;
    return root_.filename().string();
}

Result<WorkspaceState> Workspace::load_state() const {
    WorkspaceState state;
    std::error_code ec;

    if (fs::exists(manifest_path(), ec)) {
        auto m = Manifest::load(manifest_path().string());
        if (m.is_err()) return std::move(m).error();
        state.manifest = std::move(m).value();
    }
    if (state.manifest.bundle.name.empty()) {
        state.manifest.bundle.name = bundle_name(state.manifest);
    }

    if (fs::exists(lock_path(), ec)) {
        auto l = LockFile::load(lock_path().string());
        if (l.is_err()) return std::move(l).error();
        STOW_TRY(l.value().validate());
        state.lock = std::move(l).value();
        state.has_lock = true;
    }

    if (fs::exists(index_path(), ec)) {
        auto i = WorkspaceIndex::load(index_path().string());
        if (i.is_err()) return std::move(i).error();
        state.index = std::move(i).value();
        state.has_index = true;
    }

    return Result<WorkspaceState>::ok(std::move(state));
}

Result<Config> Workspace::config() const {
    std::optional<Config> global;
    std::optional<Config> local;
    std::error_code ec;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath, ec)) {
        auto g = Config::load(gpath);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }
    if (fs::exists(config_path(), ec)) {
        auto w = Config::load(config_path().string());
        if (w.is_err()) return std::move(w).error();
        local = std::move(w).value();
    }
    return Result<Config>::ok(Config::effective(global, local));
}

Result<PlatformRegistry> Workspace::platforms() const {
    PlatformRegistry reg = PlatformRegistry::builtin();
    std::string home = stow_home();
    if (!home.empty()) {
        STOW_TRY(reg.load(home + "/platforms.toml"));
    }
    STOW_TRY(reg.load(platforms_path().string()));
    return Result<PlatformRegistry>::ok(std::move(reg));
}

Result<FileLock> Workspace::lock(bool wait) const {
    if (wait) return FileLock::acquire(lock_file_path());
    return FileLock::try_acquire(lock_file_path());
}

} // namespace stow
