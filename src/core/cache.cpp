#include <stow/cache.hpp>
#include <stow/fsutil.hpp>
#include <stow/git.hpp>
#include <stow/log.hpp>
#include <sqlite3.h>

#include <chrono>
#include <set>

namespace fs = std::filesystem;

namespace stow {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct Cache::Impl {
    sqlite3* db = nullptr;
    std::string root;

    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_insert = nullptr;
    sqlite3_stmt* stmt_delete = nullptr;
    sqlite3_stmt* stmt_list = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_lookup);
        fin(stmt_insert);
        fin(stmt_delete);
        fin(stmt_list);
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return StowError(StowError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return StowError(StowError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status init_schema() {
        STOW_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS entries ("
            "  identity TEXT,"
            "  revision TEXT,"
            "  path TEXT,"
            "  content_hash TEXT,"
            "  created_at INTEGER,"
            "  PRIMARY KEY (identity, revision)"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return StowError(StowError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        bool stale = false;
        bool missing = true;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            missing = false;
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            stale = !ver || std::string(ver) != SCHEMA_VERSION;
        }
        sqlite3_finalize(stmt);

        if (stale) {
            // Snapshots stay on disk; prune() reclaims them
            STOW_TRY(exec("DELETE FROM entries;"));
        }
        if (stale || missing) {
            std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
                "VALUES ('version', '" + SCHEMA_VERSION + "');";
            STOW_TRY(exec(ver_sql.c_str()));
        }
        return ok_status();
    }

    Status insert(const CacheEntry& e) {
        STOW_TRY(prepare(
            "INSERT OR REPLACE INTO entries "
            "(identity, revision, path, content_hash, created_at) "
            "VALUES (?, ?, ?, ?, ?)",
            stmt_insert));

        sqlite3_reset(stmt_insert);
        sqlite3_bind_text(stmt_insert, 1, e.identity.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert, 2, e.revision.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert, 3, e.path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_insert, 4, e.content_hash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_insert, 5, e.created_at);

        int rc = sqlite3_step(stmt_insert);
        if (rc != SQLITE_DONE) {
            return StowError(StowError::IO,
                std::string("Failed to record cache entry: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Result<std::optional<CacheEntry>> find(const std::string& identity,
                                           const std::string& revision) {
        STOW_TRY(prepare(
            "SELECT identity, revision, path, content_hash, created_at "
            "FROM entries WHERE identity = ? AND revision = ?",
            stmt_lookup));

        sqlite3_reset(stmt_lookup);
        sqlite3_bind_text(stmt_lookup, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_lookup, 2, revision.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<CacheEntry> out;
        if (sqlite3_step(stmt_lookup) == SQLITE_ROW) {
            out = row_to_entry(stmt_lookup);
        }
        return Result<std::optional<CacheEntry>>::ok(std::move(out));
    }

    Status remove(const std::string& identity, const std::string& revision) {
        STOW_TRY(prepare(
            "DELETE FROM entries WHERE identity = ? AND revision = ?",
            stmt_delete));

        sqlite3_reset(stmt_delete);
        sqlite3_bind_text(stmt_delete, 1, identity.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt_delete, 2, revision.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(stmt_delete) != SQLITE_DONE) {
            return StowError(StowError::IO,
                std::string("Failed to delete cache entry: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    static CacheEntry row_to_entry(sqlite3_stmt* stmt) {
        auto text = [&](int col) {
            const unsigned char* t = sqlite3_column_text(stmt, col);
            return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
        };
        CacheEntry e;
        e.identity = text(0);
        e.revision = text(1);
        e.path = text(2);
        e.content_hash = text(3);
        e.created_at = sqlite3_column_int64(stmt, 4);
        return e;
    }
};

static int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ---------------------------------------------------------------------------
// Cache lifecycle
// ---------------------------------------------------------------------------

Cache::Cache() : impl_(std::make_unique<Impl>()) {}
Cache::~Cache() = default;
Cache::Cache(Cache&&) noexcept = default;
Cache& Cache::operator=(Cache&&) noexcept = default;

Status Cache::open(const std::string& root) {
    close();
    impl_->root = root;

    std::error_code ec;
    fs::create_directories(fs::path(root) / "bundles", ec);
    if (ec) {
        return StowError(StowError::IO,
            "Failed to create cache directory " + root + ": " + ec.message());
    }

    std::string db_path = root + "/catalog.db";
    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return StowError(StowError::IO, "Failed to open cache catalog: " + err_msg);
    }
    sqlite3_busy_timeout(impl_->db, 5000);

    auto setup = [&]() -> Status {
        STOW_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        STOW_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err()) {
        // Corrupt catalog: rebuild it. Snapshots are re-cataloged on demand.
        log::warn("cache catalog unusable (%s), recreating",
                  setup_result.error().message.c_str());
        close();
        impl_->root = root;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return StowError(StowError::IO, "Failed to recreate cache catalog");
        }
        STOW_TRY(setup());
    }

    return ok_status();
}

void Cache::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool Cache::is_open() const {
    return impl_->db != nullptr;
}

const std::string& Cache::root() const {
    return impl_->root;
}

fs::path Cache::snapshot_path(const std::string& identity,
                              const std::string& revision) const {
    return fs::path(impl_->root) / "bundles" / identity_slug(identity) / revision;
}

// ---------------------------------------------------------------------------
// Lookup and population
// ---------------------------------------------------------------------------

std::optional<fs::path> Cache::lookup(const std::string& identity,
                                      const std::string& revision) {
    if (!impl_->db || revision.empty()) return std::nullopt;

    auto row = impl_->find(identity, revision);
    if (row.is_err()) {
        log::warn("cache lookup failed: %s", row.error().message.c_str());
        return std::nullopt;
    }
    if (!row.value()) return std::nullopt;

    std::error_code ec;
    fs::path p = row.value()->path;
    if (!fs::is_directory(p, ec)) {
        log::debug("cache entry %s@%s lost its snapshot", identity.c_str(), revision.c_str());
        return std::nullopt;
    }
    return p;
}

Result<Snapshot> Cache::get_or_fetch(const BundleSource& source, Fetcher& fetcher) {
    if (!impl_->db) {
        return StowError{StowError::IO, "cache is not open"};
    }

    std::string identity = source.fetch_identity();

    std::string pinned;
    if (source.is_remote()) {
        if (!source.remote().revision.empty()) {
            pinned = source.remote().revision;
        } else if (is_commit_sha(source.remote().ref)) {
            pinned = source.remote().ref;
        }
    }

    if (!pinned.empty()) {
        if (auto hit = lookup(identity, pinned)) {
            log::debug("cache hit %s@%s", identity.c_str(), pinned.c_str());
            // A pinned snapshot must still hash as it did when it was stored
            auto row = impl_->find(identity, pinned);
            if (row.is_err()) return std::move(row).error();
            if (row.value() && !row.value()->content_hash.empty()) {
                STOW_TRY(verify(identity, pinned, row.value()->content_hash));
            }
            return Result<Snapshot>::ok(Snapshot{pinned, *hit, true});
        }
    }

    std::string revision = pinned;
    if (revision.empty()) {
        auto r = fetcher.resolve_revision(source);
        if (r.is_err()) return std::move(r).error();
        revision = std::move(r).value();

        if (auto hit = lookup(identity, revision)) {
            log::debug("cache hit %s@%s", identity.c_str(), revision.c_str());
            return Result<Snapshot>::ok(Snapshot{revision, *hit, false});
        }
    }

    log::debug("cache miss %s@%s", identity.c_str(), revision.c_str());

    auto scratch = fsutil::make_temp_dir(fs::path(impl_->root) / "tmp",
                                         identity_slug(identity) + "-");
    if (scratch.is_err()) return std::move(scratch).error();
    fs::path tmp = scratch.value();

    auto cleanup = [&]() {
        std::error_code ec;
        fs::remove_all(tmp, ec);
    };

    auto fetched = fetcher.materialize(source, revision, tmp);
    if (fetched.is_err()) {
        cleanup();
        return std::move(fetched).error();
    }

    auto hash = fsutil::hash_tree(tmp);
    if (hash.is_err()) {
        cleanup();
        return std::move(hash).error();
    }

    fs::path final_path = snapshot_path(identity, revision);
    std::error_code ec;
    fs::create_directories(final_path.parent_path(), ec);
    if (ec) {
        cleanup();
        return StowError{StowError::IO,
            "cannot create cache directory: " + ec.message()};
    }

    // Entries are immutable. If another process populated the same
    // revision meanwhile, its tree is identical and ours is discarded.
    fs::rename(tmp, final_path, ec);
    if (ec) {
        cleanup();
        std::error_code dir_ec;
        if (!fs::is_directory(final_path, dir_ec)) {
            return StowError{StowError::IO,
                "cannot move snapshot into cache: " + ec.message()};
        }
    }

    CacheEntry entry;
    entry.identity = identity;
    entry.revision = revision;
    entry.path = final_path.string();
    entry.content_hash = hash.value();
    entry.created_at = now_epoch();
    STOW_TRY(impl_->insert(entry));

    return Result<Snapshot>::ok(Snapshot{revision, final_path, false});
}

Status Cache::verify(const std::string& identity, const std::string& revision,
                     const std::string& expected_hash, const std::string& subpath) {
    auto p = lookup(identity, revision);
    if (!p) {
        return StowError{StowError::NotFound,
            "no cached snapshot for " + identity + "@" + revision};
    }
    fs::path root = subpath.empty() ? *p : *p / subpath;
    auto actual = fsutil::hash_tree(root);
    if (actual.is_err()) return std::move(actual).error();
    if (actual.value() != expected_hash) {
        return StowError{StowError::Integrity,
            "cached snapshot of " + identity + "@" + revision + " does not match its hash",
            "expected " + expected_hash + ", found " + actual.value() +
            "; run cache clean and reinstall"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

Result<std::vector<CacheEntry>> Cache::list() {
    if (!impl_->db) return StowError{StowError::IO, "cache is not open"};
    STOW_TRY(impl_->prepare(
        "SELECT identity, revision, path, content_hash, created_at "
        "FROM entries ORDER BY identity, created_at, revision",
        impl_->stmt_list));

    sqlite3_reset(impl_->stmt_list);
    std::vector<CacheEntry> out;
    while (sqlite3_step(impl_->stmt_list) == SQLITE_ROW) {
        out.push_back(Impl::row_to_entry(impl_->stmt_list));
    }
    return Result<std::vector<CacheEntry>>::ok(std::move(out));
}

Result<CacheStats> Cache::stats() {
    auto entries = list();
    if (entries.is_err()) return std::move(entries).error();

    CacheStats stats;
    std::set<std::string> identities;
    for (const auto& e : entries.value()) {
        ++stats.entry_count;
        identities.insert(e.identity);

        std::error_code ec;
        for (fs::recursive_directory_iterator it(e.path, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                auto size = it->file_size(ec);
                if (!ec) stats.total_bytes += static_cast<int64_t>(size);
            }
        }
    }
    stats.source_count = static_cast<int64_t>(identities.size());
    return Result<CacheStats>::ok(std::move(stats));
}

Result<int64_t> Cache::prune() {
    auto entries = list();
    if (entries.is_err()) return std::move(entries).error();

    int64_t removed = 0;
    std::set<std::string> known;
    std::error_code ec;

    for (const auto& e : entries.value()) {
        if (fs::is_directory(e.path, ec)) {
            known.insert(fs::path(e.path).lexically_normal().string());
            continue;
        }
        STOW_TRY(impl_->remove(e.identity, e.revision));
        ++removed;
    }

    fs::path bundles = fs::path(impl_->root) / "bundles";
    for (fs::directory_iterator slug_it(bundles, ec), end; !ec && slug_it != end; slug_it.increment(ec)) {
        if (!slug_it->is_directory(ec)) continue;
        std::vector<fs::path> orphans;
        for (fs::directory_iterator rev_it(slug_it->path(), ec); !ec && rev_it != end; rev_it.increment(ec)) {
            if (!known.count(rev_it->path().lexically_normal().string())) {
                orphans.push_back(rev_it->path());
            }
        }
        for (const auto& o : orphans) {
            fs::remove_all(o, ec);
            ++removed;
        }
        fsutil::prune_empty_dirs(slug_it->path(), bundles, {});
    }

    fs::remove_all(fs::path(impl_->root) / "tmp", ec);
    return Result<int64_t>::ok(removed);
}

Status Cache::clean() {
    if (!impl_->db) return StowError{StowError::IO, "cache is not open"};
    STOW_TRY(impl_->exec("DELETE FROM entries;"));

    std::error_code ec;
    fs::remove_all(fs::path(impl_->root) / "bundles", ec);
    if (ec) {
        return StowError{StowError::IO, "failed to clean cache: " + ec.message()};
    }
    fs::remove_all(fs::path(impl_->root) / "tmp", ec);
    fs::remove_all(fs::path(impl_->root) / "git", ec);
    fs::create_directories(fs::path(impl_->root) / "bundles", ec);
    return ok_status();
}

} // namespace stow
