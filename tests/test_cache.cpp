#include <catch2/catch.hpp>
#include <stow/cache.hpp>
#include <stow/fsutil.hpp>

#include "test_util.hpp"

namespace fs = std::filesystem;
using namespace stow;
using stow::test::TempDir;
using stow::test::write_file;
using stow::test::read_file;

// Serves fixed content for remote sources and counts calls.
class CountingFetcher : public Fetcher {
public:
    std::string revision = "1111111111111111111111111111111111111111";
    std::string content = "from remote";
    int resolves = 0;
    int materializes = 0;

    Result<std::string> resolve_revision(const BundleSource&) override {
        ++resolves;
        return Result<std::string>::ok(revision);
    }

    Status materialize(const BundleSource& source, const std::string& rev,
                       const fs::path& dest) override {
        ++materializes;
        write_file(dest / "rules/remote.md", content);
        if (!source.remote().subpath.empty()) {
            write_file(dest / source.remote().subpath / "AGENTS.md", rev);
        }
        return ok_status();
    }
};

// ===== Lifecycle =====

TEST_CASE("open creates the catalog and layout", "[cache]") {
    TempDir tmp("cache_open");
    Cache cache;
    REQUIRE_FALSE(cache.is_open());
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    REQUIRE(cache.is_open());
    REQUIRE(fs::exists(tmp / "c/catalog.db"));
    REQUIRE(fs::is_directory(tmp / "c/bundles"));
    cache.close();
    REQUIRE_FALSE(cache.is_open());
}

TEST_CASE("operations on a closed cache fail", "[cache]") {
    Cache cache;
    CountingFetcher f;
    REQUIRE(cache.get_or_fetch(BundleSource::remote("https://x/r.git", ""), f).is_err());
    REQUIRE(cache.list().is_err());
}

TEST_CASE("a corrupt catalog is recreated", "[cache]") {
    TempDir tmp("cache_corrupt");
    write_file(tmp / "c/catalog.db", "this is not a database file at all, not even close");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    REQUIRE(cache.list().value().empty());
}

// ===== get_or_fetch =====

TEST_CASE("directory sources miss then hit", "[cache]") {
    TempDir tmp("cache_dir");
    write_file(tmp / "src/rules/a.md", "rule a");
    write_file(tmp / "src/Stow.lock", "ignored");

    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    DirectoryFetcher fetcher;
    auto src = BundleSource::directory((tmp / "src").string());

    auto first = cache.get_or_fetch(src, fetcher);
    REQUIRE(first.is_ok());
    REQUIRE_FALSE(first.value().hit);
    REQUIRE(read_file(first.value().root / "rules/a.md") == "rule a");
    REQUIRE_FALSE(fs::exists(first.value().root / "Stow.lock"));
    REQUIRE(first.value().revision ==
            fsutil::hash_tree(tmp / "src", {"Stow.lock", "Stow.index"}).value().substr(7));

    auto second = cache.get_or_fetch(src, fetcher);
    REQUIRE(second.is_ok());
    REQUIRE(second.value().root == first.value().root);

    write_file(tmp / "src/rules/a.md", "rule a, edited");
    auto third = cache.get_or_fetch(src, fetcher);
    REQUIRE(third.is_ok());
    REQUIRE(third.value().revision != first.value().revision);
    REQUIRE(read_file(first.value().root / "rules/a.md") == "rule a");
    REQUIRE(cache.list().value().size() == 2);
}

TEST_CASE("a pinned revision already cached skips the fetcher", "[cache]") {
    TempDir tmp("cache_pinned");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;

    auto floating = BundleSource::remote("https://example.com/r.git", "main");
    auto a = cache.get_or_fetch(floating, f);
    REQUIRE(a.is_ok());
    REQUIRE(f.resolves == 1);
    REQUIRE(f.materializes == 1);

    auto pinned = BundleSource::remote("https://example.com/r.git", "main", "", f.revision);
    auto b = cache.get_or_fetch(pinned, f);
    REQUIRE(b.is_ok());
    REQUIRE(b.value().hit);
    REQUIRE(f.resolves == 1);
    REQUIRE(f.materializes == 1);

    auto by_sha = BundleSource::remote("https://example.com/r.git", f.revision, "other");
    auto c = cache.get_or_fetch(by_sha, f);
    REQUIRE(c.value().hit);
    REQUIRE(f.resolves == 1);
}

TEST_CASE("a tampered pinned snapshot is rejected", "[cache]") {
    TempDir tmp("cache_pinned_tamper");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;

    auto first = cache.get_or_fetch(BundleSource::remote("https://example.com/r.git", "main"), f);
    REQUIRE(first.is_ok());
    write_file(first.value().root / "rules/remote.md", "tampered");

    auto pinned = BundleSource::remote("https://example.com/r.git", "main", "", f.revision);
    auto r = cache.get_or_fetch(pinned, f);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::Integrity);
    REQUIRE(f.materializes == 1);
}

TEST_CASE("floating refs resolve every time but reuse the snapshot", "[cache]") {
    TempDir tmp("cache_float");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;
    auto src = BundleSource::remote("https://example.com/r.git", "main");

    REQUIRE(cache.get_or_fetch(src, f).is_ok());
    REQUIRE(cache.get_or_fetch(src, f).is_ok());
    REQUIRE(f.resolves == 2);
    REQUIRE(f.materializes == 1);
}

TEST_CASE("sources of one repository share snapshots", "[cache]") {
    TempDir tmp("cache_share");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;

    REQUIRE(cache.get_or_fetch(BundleSource::remote("https://example.com/r.git", "main", "a"), f).is_ok());
    REQUIRE(cache.get_or_fetch(BundleSource::remote("https://example.com/r.git", "main", "b"), f).is_ok());
    REQUIRE(f.materializes == 1);
    REQUIRE(cache.lookup("git+https://example.com/r.git", f.revision).has_value());
    REQUIRE_FALSE(cache.lookup("git+https://example.com/r.git", "").has_value());
}

TEST_CASE("a snapshot populated meanwhile by another process is kept", "[cache]") {
    TempDir tmp("cache_race");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;

    fs::path existing = cache.snapshot_path("git+https://example.com/r.git", f.revision);
    write_file(existing / "rules/remote.md", f.content);

    auto r = cache.get_or_fetch(BundleSource::remote("https://example.com/r.git", "main"), f);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().root == existing);
    REQUIRE(f.materializes == 1);
    REQUIRE(read_file(existing / "rules/remote.md") == f.content);
    REQUIRE(fs::is_empty(tmp / "c/tmp"));
    REQUIRE(cache.lookup("git+https://example.com/r.git", f.revision) == existing);
}

TEST_CASE("a failing fetch leaves nothing behind", "[cache]") {
    struct FailingFetcher : Fetcher {
        Result<std::string> resolve_revision(const BundleSource&) override {
            return Result<std::string>::ok("2222222222222222222222222222222222222222");
        }
        Status materialize(const BundleSource&, const std::string&, const fs::path& dest) override {
            write_file(dest / "partial", "x");
            return StowError{StowError::SourceResolution, "network down"};
        }
    };

    TempDir tmp("cache_fail");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    FailingFetcher f;
    auto r = cache.get_or_fetch(BundleSource::remote("https://example.com/r.git", "main"), f);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::SourceResolution);
    REQUIRE(cache.list().value().empty());
    REQUIRE(fs::is_empty(tmp / "c/tmp"));
}

// ===== verify =====

TEST_CASE("verify detects tampered snapshots", "[cache]") {
    TempDir tmp("cache_verify");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;
    auto snap = cache.get_or_fetch(BundleSource::remote("https://example.com/r.git", "main"), f);
    REQUIRE(snap.is_ok());

    std::string id = "git+https://example.com/r.git";
    auto expected = fsutil::hash_tree(snap.value().root).value();
    REQUIRE(cache.verify(id, f.revision, expected).is_ok());

    write_file(snap.value().root / "rules/remote.md", "tampered");
    auto bad = cache.verify(id, f.revision, expected);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == StowError::Integrity);

    REQUIRE(cache.verify(id, "unknown", expected).error().code == StowError::NotFound);
}

// ===== Maintenance =====

TEST_CASE("stats counts entries, sources and bytes", "[cache]") {
    TempDir tmp("cache_stats");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;
    REQUIRE(cache.get_or_fetch(BundleSource::remote("https://example.com/a.git", "main"), f).is_ok());
    f.revision = "3333333333333333333333333333333333333333";
    REQUIRE(cache.get_or_fetch(BundleSource::remote("https://example.com/a.git", "v2"), f).is_ok());
    REQUIRE(cache.get_or_fetch(BundleSource::remote("https://example.com/b.git", "main"), f).is_ok());

    auto s = cache.stats();
    REQUIRE(s.is_ok());
    REQUIRE(s.value().entry_count == 3);
    REQUIRE(s.value().source_count == 2);
    REQUIRE(s.value().total_bytes == 3 * static_cast<int64_t>(f.content.size()));
}

TEST_CASE("prune drops vanished snapshots and orphan directories", "[cache]") {
    TempDir tmp("cache_prune");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;
    auto a = cache.get_or_fetch(BundleSource::remote("https://example.com/a.git", "main"), f);
    auto b = cache.get_or_fetch(BundleSource::remote("https://example.com/b.git", "main"), f);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    fs::remove_all(a.value().root);
    fs::path orphan = b.value().root.parent_path() / "4444444444444444444444444444444444444444";
    write_file(orphan / "x", "x");

    auto removed = cache.prune();
    REQUIRE(removed.is_ok());
    REQUIRE(removed.value() == 2);
    REQUIRE(cache.list().value().size() == 1);
    REQUIRE_FALSE(fs::exists(orphan));
    REQUIRE(fs::exists(b.value().root));
}

TEST_CASE("clean empties the cache", "[cache]") {
    TempDir tmp("cache_clean");
    Cache cache;
    REQUIRE(cache.open((tmp / "c").string()).is_ok());
    CountingFetcher f;
    auto a = cache.get_or_fetch(BundleSource::remote("https://example.com/a.git", "main"), f);
    REQUIRE(a.is_ok());

    REQUIRE(cache.clean().is_ok());
    REQUIRE(cache.list().value().empty());
    REQUIRE_FALSE(fs::exists(a.value().root));
    REQUIRE(fs::is_directory(tmp / "c/bundles"));
}

TEST_CASE("identity slugs are readable and distinct", "[cache]") {
    auto a = identity_slug("git+https://github.com/acme/bundles.git");
    auto b = identity_slug("git+https://gitlab.com/acme/bundles.git");
    REQUIRE(a.rfind("bundles-", 0) == 0);
    REQUIRE(a != b);
    REQUIRE(a.size() == std::string("bundles-").size() + 16);
}
