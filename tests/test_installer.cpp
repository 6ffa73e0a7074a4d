#include <catch2/catch.hpp>
#include <stow/installer.hpp>
#include <stow/fsutil.hpp>
#include <stow/merge.hpp>
#include <stow/sha256.hpp>

#include "test_util.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <optional>
#include <thread>

namespace fs = std::filesystem;
using namespace stow;
using stow::test::TempDir;
using stow::test::HomeGuard;
using stow::test::write_file;
using stow::test::read_file;

namespace {

const char* BASE_MCP = R"({
  // base servers
  "mcpServers": { "base": { "command": "base-srv" } }
})";

// Bundles under tmp/bundles, a workspace at tmp/ws with a .claude directory
// so that claude is detected.
struct Fixture {
    TempDir tmp{"installer"};
    HomeGuard home{tmp / "home"};
    Cache cache;
    DirectoryFetcher fetcher;
    std::optional<Workspace> ws;
    std::unique_ptr<Installer> installer;

    Fixture() {
        write_file(tmp / "bundles/base/Stow.toml", "[bundle]\nname = \"base\"\n");
        write_file(tmp / "bundles/base/rules/style.md", "base style\n");
        write_file(tmp / "bundles/base/AGENTS.md", "Base agents.\n");
        write_file(tmp / "bundles/base/mcp.jsonc", BASE_MCP);

        write_file(tmp / "bundles/app/Stow.toml", "[bundle]\nname = \"app\"\n");
        write_file(tmp / "bundles/app/rules/style.md", "app style\n");
        write_file(tmp / "bundles/app/AGENTS.md", "App agents.\n");

        write_file(tmp / "bundles/tools/Stow.toml",
                   "[bundle]\nname = \"tools\"\n\n"
                   "[[dependencies]]\nname = \"base\"\npath = \"../base\"\n");
        write_file(tmp / "bundles/tools/commands/lint.md", "lint it\n");

        fs::create_directories(tmp / "ws/.claude");
        ws.emplace(Workspace::init(tmp / "ws", "ws").value());
        REQUIRE(cache.open((tmp / "cache").string()).is_ok());
        installer = std::make_unique<Installer>(*ws, cache, fetcher);
    }

    fs::path root() const { return ws->root(); }

    Result<InstallReport> add(const std::string& bundle, bool dry_run = false) {
        InstallOptions opts;
        opts.source = (tmp / "bundles" / bundle).string();
        opts.dry_run = dry_run;
        return installer->install(opts);
    }

    Result<InstallReport> reinstall() { return installer->install(); }

    Result<InstallReport> remove(std::vector<std::string> names) {
        UninstallOptions opts;
        opts.names = std::move(names);
        return installer->uninstall(opts);
    }

    WorkspaceIndex index() const {
        return WorkspaceIndex::load(ws->index_path().string()).value();
    }

    LockFile lock() const {
        return LockFile::load(ws->lock_path().string()).value();
    }
};

std::vector<std::string> names(const LockFile& lock) {
    std::vector<std::string> out;
    for (const auto& b : lock.bundles) out.push_back(b.name);
    return out;
}

bool has_action(const InstallReport& r, ActionKind kind, const std::string& path) {
    return std::any_of(r.actions.begin(), r.actions.end(), [&](const PlannedAction& a) {
        return a.kind == kind && a.path == path;
    });
}

// Directories through DirectoryFetcher; every remote serves one rules file.
class RemoteFetcher : public Fetcher {
public:
    DirectoryFetcher dir;
    std::string revision = "cccccccccccccccccccccccccccccccccccccccc";

    Result<std::string> resolve_revision(const BundleSource& s) override {
        if (s.is_directory()) return dir.resolve_revision(s);
        return Result<std::string>::ok(revision);
    }
    Status materialize(const BundleSource& s, const std::string& rev,
                       const fs::path& dest) override {
        if (s.is_directory()) return dir.materialize(s, rev, dest);
        write_file(dest / "rules/remote.md", "remote rules\n");
        return ok_status();
    }
};

merge::Json read_json(const fs::path& p) {
    return merge::parse_json(read_file(p), p.string()).value();
}

} // namespace

// ===== Install =====

TEST_CASE("install writes outputs, lockfile and index", "[installer]") {
    Fixture f;
    auto r = f.add("base");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().added == std::vector<std::string>{"base"});
    REQUIRE(r.value().bundles == std::vector<std::string>{"base", "ws"});
    REQUIRE(r.value().platforms == std::vector<std::string>{"claude"});

    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "base style\n");

    std::string claude_md = read_file(f.root() / "CLAUDE.md");
    REQUIRE(claude_md.find(merge::begin_marker("base")) != std::string::npos);
    REQUIRE(claude_md.find("Base agents.") != std::string::npos);

    auto mcp = read_json(f.root() / ".mcp.json");
    REQUIRE(mcp["mcpServers"]["base"]["command"] == "base-srv");

    auto manifest = Manifest::load(f.ws->manifest_path().string()).value();
    REQUIRE(manifest.find_dependency("base")->path == std::optional<std::string>("../bundles/base"));

    REQUIRE(names(f.lock()) == std::vector<std::string>{"base", "ws"});
    REQUIRE(f.lock().name == "ws");

    auto index = f.index();
    const IndexEntry* style = index.find("rules/style.md", "claude");
    REQUIRE(style != nullptr);
    REQUIRE(style->bundle == "base");
    REQUIRE(style->output == ".claude/rules/style.md");
    REQUIRE(style->hash == fsutil::with_hash_prefix(SHA256::hash_hex("base style\n")));
    REQUIRE(index.find("AGENTS.md", "claude")->strategy == MergeStrategy::Composite);
}

TEST_CASE("a second install changes nothing", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    std::string lock_before = read_file(f.ws->lock_path());
    std::string index_before = read_file(f.ws->index_path());
    std::string claude_before = read_file(f.root() / "CLAUDE.md");
    std::string mcp_before = read_file(f.root() / ".mcp.json");

    auto r = f.reinstall();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().actions.empty());
    REQUIRE(r.value().added.empty());
    REQUIRE(read_file(f.ws->lock_path()) == lock_before);
    REQUIRE(read_file(f.ws->index_path()) == index_before);
    REQUIRE(read_file(f.root() / "CLAUDE.md") == claude_before);
    REQUIRE(read_file(f.root() / ".mcp.json") == mcp_before);
}

TEST_CASE("install for explicit platforms", "[installer]") {
    Fixture f;
    InstallOptions opts;
    opts.source = (f.tmp / "bundles/base").string();
    opts.platforms = {"cursor-ai"};
    auto r = f.installer->install(opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().platforms == std::vector<std::string>{"cursor"});
    REQUIRE(read_file(f.root() / ".cursor/rules/style.mdc") == "base style\n");
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules/style.md"));

    // Platforms already installed stay installed
    auto again = f.reinstall();
    REQUIRE(again.is_ok());
    REQUIRE(std::find(again.value().platforms.begin(), again.value().platforms.end(),
                      "cursor") != again.value().platforms.end());
    REQUIRE(fs::exists(f.root() / ".cursor/rules/style.mdc"));
    REQUIRE(fs::exists(f.root() / ".claude/rules/style.md"));
}

TEST_CASE("install needs a platform", "[installer]") {
    Fixture f;
    fs::remove_all(f.root() / ".claude");
    auto r = f.add("base");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::InvalidArg);
    REQUIRE_FALSE(fs::exists(f.ws->lock_path()));

    InstallOptions opts;
    opts.platforms = {"emacs"};
    REQUIRE(f.installer->install(opts).error().code == StowError::NotFound);
}

TEST_CASE("bundles are picked from a multi-bundle source", "[installer]") {
    Fixture f;
    InstallOptions opts;
    opts.source = (f.tmp / "bundles").string();
    opts.bundles = {"app"};
    auto r = f.installer->install(opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().added == std::vector<std::string>{"app"});
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "app style\n");

    opts.bundles = {"ghost"};
    auto missing = f.installer->install(opts);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == StowError::NotFound);
    REQUIRE(missing.error().hint.find("tools") != std::string::npos);
}

TEST_CASE("a selector that picks nothing is rejected", "[installer]") {
    struct PickNone : Selector {
        Result<std::vector<BundleCandidate>> select(const std::vector<BundleCandidate>&) override {
            return Result<std::vector<BundleCandidate>>::ok({});
        }
    } none;

    Fixture f;
    InstallOptions opts;
    opts.source = (f.tmp / "bundles").string();
    opts.selector = &none;
    auto r = f.installer->install(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::InvalidArg);
}

TEST_CASE("nested dependencies are installed first", "[installer]") {
    Fixture f;
    auto r = f.add("tools");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().bundles == std::vector<std::string>{"base", "tools", "ws"});
    REQUIRE(read_file(f.root() / ".claude/commands/lint.md") == "lint it\n");
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "base style\n");
    REQUIRE(f.lock().find("tools")->dependencies == std::vector<std::string>{"base"});
}

TEST_CASE("a dependency cycle fails before anything is written", "[installer]") {
    Fixture f;
    write_file(f.tmp / "bundles/x/Stow.toml",
               "[bundle]\nname = \"x\"\n\n[[dependencies]]\nname = \"y\"\npath = \"../y\"\n");
    write_file(f.tmp / "bundles/x/rules/x.md", "x\n");
    write_file(f.tmp / "bundles/y/Stow.toml",
               "[bundle]\nname = \"y\"\n\n[[dependencies]]\nname = \"x\"\npath = \"../x\"\n");
    std::string manifest_before = read_file(f.ws->manifest_path());

    auto r = f.add("x");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::Cycle);
    REQUIRE(r.error().message.find("x → y → x") != std::string::npos);
    REQUIRE_FALSE(fs::exists(f.ws->lock_path()));
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules"));
    REQUIRE(read_file(f.ws->manifest_path()) == manifest_before);
}

TEST_CASE("a shared dependency stays until its last dependent goes", "[installer]") {
    Fixture f;
    write_file(f.tmp / "bundles/left/Stow.toml",
               "[bundle]\nname = \"left\"\n\n[[dependencies]]\nname = \"base\"\npath = \"../base\"\n");
    write_file(f.tmp / "bundles/left/rules/left.md", "left\n");
    write_file(f.tmp / "bundles/right/Stow.toml",
               "[bundle]\nname = \"right\"\n\n[[dependencies]]\nname = \"base\"\npath = \"../base\"\n");
    write_file(f.tmp / "bundles/right/rules/right.md", "right\n");

    REQUIRE(f.add("left").is_ok());
    REQUIRE(f.add("right").is_ok());
    REQUIRE(names(f.lock()) == std::vector<std::string>{"base", "left", "right", "ws"});

    auto first = f.remove({"left"});
    REQUIRE(first.is_ok());
    REQUIRE(first.value().removed == std::vector<std::string>{"left"});
    REQUIRE(fs::exists(f.root() / ".claude/rules/style.md"));
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules/left.md"));

    auto second = f.remove({"right"});
    REQUIRE(second.is_ok());
    REQUIRE(second.value().removed == std::vector<std::string>{"base", "right"});
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules"));
}

// ===== Ownership =====

TEST_CASE("the last bundle providing a path owns the output", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    REQUIRE(f.add("app").is_ok());

    REQUIRE(names(f.lock()) == std::vector<std::string>{"base", "app", "ws"});
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "app style\n");
    REQUIRE(f.index().find("rules/style.md", "claude")->bundle == "app");

    std::string claude_md = read_file(f.root() / "CLAUDE.md");
    size_t base_at = claude_md.find(merge::begin_marker("base"));
    size_t app_at = claude_md.find(merge::begin_marker("app"));
    REQUIRE(base_at != std::string::npos);
    REQUIRE(app_at != std::string::npos);
    REQUIRE(base_at < app_at);
}

TEST_CASE("uninstalling the owner hands the output back", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    REQUIRE(f.add("app").is_ok());

    auto r = f.remove({"app"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed == std::vector<std::string>{"app"});
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "base style\n");
    REQUIRE(f.index().find("rules/style.md", "claude")->bundle == "base");

    std::string claude_md = read_file(f.root() / "CLAUDE.md");
    REQUIRE_FALSE(merge::has_block(claude_md, "app"));
    REQUIRE(merge::has_block(claude_md, "base"));
    REQUIRE(Manifest::load(f.ws->manifest_path().string()).value().find_dependency("app") == nullptr);
}

// ===== Stale outputs =====

TEST_CASE("uninstall removes outputs and prunes empty directories", "[installer]") {
    Fixture f;
    write_file(f.tmp / "bundles/base/rules/team/extra.md", "extra\n");
    REQUIRE(f.add("base").is_ok());
    REQUIRE(fs::exists(f.root() / ".claude/rules/team/extra.md"));

    auto r = f.remove({"base"});
    REQUIRE(r.is_ok());
    REQUIRE(has_action(r.value(), ActionKind::Remove, ".claude/rules/team/extra.md"));
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules"));
    REQUIRE(fs::is_directory(f.root() / ".claude"));
    REQUIRE_FALSE(fs::exists(f.root() / "CLAUDE.md"));
    REQUIRE_FALSE(fs::exists(f.root() / ".mcp.json"));

    REQUIRE(names(f.lock()) == std::vector<std::string>{"ws"});
    REQUIRE(f.index().empty());
}

TEST_CASE("files dropped from a bundle are removed on reinstall", "[installer]") {
    Fixture f;
    write_file(f.tmp / "bundles/base/rules/team/extra.md", "extra\n");
    REQUIRE(f.add("base").is_ok());

    fs::remove(f.tmp / "bundles/base/rules/team/extra.md");
    fs::remove(f.tmp / "bundles/base/rules/team");
    write_file(f.tmp / "bundles/base/rules/style.md", "base style v2\n");

    auto r = f.reinstall();
    REQUIRE(r.is_ok());
    REQUIRE(has_action(r.value(), ActionKind::Remove, ".claude/rules/team/extra.md"));
    REQUIRE(has_action(r.value(), ActionKind::Write, ".claude/rules/style.md"));
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules/team"));
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "base style v2\n");
    REQUIRE(f.index().find("rules/team/extra.md", "claude") == nullptr);
}

// ===== Merges =====

TEST_CASE("deep merges keep the user's own keys", "[installer]") {
    Fixture f;
    write_file(f.root() / ".mcp.json",
               R"({"mcpServers": {"mine": {"command": "my-srv"}}})");
    REQUIRE(f.add("base").is_ok());

    auto merged = read_json(f.root() / ".mcp.json");
    REQUIRE(merged["mcpServers"]["mine"]["command"] == "my-srv");
    REQUIRE(merged["mcpServers"]["base"]["command"] == "base-srv");

    REQUIRE(f.remove({"base"}).is_ok());
    auto rest = read_json(f.root() / ".mcp.json");
    REQUIRE(rest["mcpServers"]["mine"]["command"] == "my-srv");
    REQUIRE_FALSE(rest["mcpServers"].contains("base"));
}

TEST_CASE("composite outputs keep text outside the managed blocks", "[installer]") {
    Fixture f;
    write_file(f.root() / "CLAUDE.md", "# My notes\n");
    REQUIRE(f.add("base").is_ok());
    std::string merged = read_file(f.root() / "CLAUDE.md");
    REQUIRE(merged.find("# My notes") != std::string::npos);
    REQUIRE(merge::has_block(merged, "base"));

    REQUIRE(f.remove({"base"}).is_ok());
    std::string rest = read_file(f.root() / "CLAUDE.md");
    REQUIRE(rest.find("# My notes") != std::string::npos);
    REQUIRE_FALSE(merge::has_block(rest, "base"));
}

// ===== Frozen installs =====

TEST_CASE("frozen install without a lockfile fails", "[installer]") {
    Fixture f;
    InstallOptions opts;
    opts.frozen = true;
    auto r = f.installer->install(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::FrozenMismatch);
}

TEST_CASE("frozen install refuses changed content", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    std::string lock_before = read_file(f.ws->lock_path());

    InstallOptions opts;
    opts.frozen = true;
    REQUIRE(f.installer->install(opts).is_ok());

    write_file(f.tmp / "bundles/base/rules/style.md", "base style v2\n");
    auto r = f.installer->install(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::FrozenMismatch);
    REQUIRE(r.error().message.find("base") != std::string::npos);
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "base style\n");
    REQUIRE(read_file(f.ws->lock_path()) == lock_before);
}

TEST_CASE("frozen install refuses a new source", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());

    InstallOptions opts;
    opts.source = (f.tmp / "bundles/app").string();
    opts.frozen = true;
    auto r = f.installer->install(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::FrozenMismatch);
    REQUIRE(Manifest::load(f.ws->manifest_path().string()).value().find_dependency("app") == nullptr);
}

TEST_CASE("frozen can come from the workspace config", "[installer]") {
    Fixture f;
    write_file(f.ws->config_path(), "[install]\nfrozen = true\n");
    auto r = f.add("base");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::FrozenMismatch);
}

TEST_CASE("frozen install refuses to overwrite a local edit", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    std::string lock_before = read_file(f.ws->lock_path());
    std::string index_before = read_file(f.ws->index_path());
    write_file(f.root() / ".claude/rules/style.md", "my style\n");

    InstallOptions opts;
    opts.frozen = true;
    auto r = f.installer->install(opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::FrozenMismatch);
    REQUIRE(r.error().message.find(".claude/rules/style.md") != std::string::npos);

    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "my style\n");
    REQUIRE_FALSE(fs::exists(f.ws->dir() / "rules/style.md"));
    REQUIRE(read_file(f.ws->lock_path()) == lock_before);
    REQUIRE(read_file(f.ws->index_path()) == index_before);
}

TEST_CASE("a locked remote whose cached snapshot changed fails integrity", "[installer]") {
    Fixture f;
    write_file(f.ws->manifest_path(),
               "[bundle]\nname = \"ws\"\n\n"
               "[[dependencies]]\nname = \"remote\"\n"
               "git = \"https://example.com/team/rules.git\"\nref = \"main\"\n");
    RemoteFetcher fetcher;
    Installer installer(*f.ws, f.cache, fetcher);

    REQUIRE(installer.install().is_ok());
    REQUIRE(read_file(f.root() / ".claude/rules/remote.md") == "remote rules\n");
    std::string lock_before = read_file(f.ws->lock_path());

    auto lock = f.lock();
    const LockedBundle* remote = lock.find("remote");
    REQUIRE(remote != nullptr);
    REQUIRE(remote->source.remote().revision == fetcher.revision);
    auto snapshot = f.cache.lookup(remote->source.fetch_identity(), fetcher.revision);
    REQUIRE(snapshot);
    write_file(*snapshot / "rules/remote.md", "tampered\n");

    auto r = installer.install();
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::Integrity);
    REQUIRE(read_file(f.root() / ".claude/rules/remote.md") == "remote rules\n");
    REQUIRE(read_file(f.ws->lock_path()) == lock_before);
}

// ===== Local edits =====

TEST_CASE("edited outputs move into the workspace bundle", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    write_file(f.root() / ".claude/rules/style.md", "my style\n");

    auto r = f.reinstall();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().migrated.size() == 1);
    REQUIRE(r.value().migrated[0].path == "rules/style.md");
    REQUIRE(r.value().migrated[0].bundle == "base");
    REQUIRE(has_action(r.value(), ActionKind::Migrate, ".stow/rules/style.md"));

    REQUIRE(read_file(f.ws->dir() / "rules/style.md") == "my style\n");
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "my style\n");
    REQUIRE(f.index().find("rules/style.md", "claude")->bundle == "ws");

    auto lock = f.lock();
    const auto& ws_files = lock.find("ws")->files;
    REQUIRE(std::find(ws_files.begin(), ws_files.end(), "rules/style.md") != ws_files.end());

    auto again = f.reinstall();
    REQUIRE(again.is_ok());
    REQUIRE(again.value().migrated.empty());
    REQUIRE(again.value().actions.empty());
}

TEST_CASE("unedited outputs are not migrated", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    write_file(f.tmp / "bundles/base/rules/style.md", "base style v2\n");

    auto r = f.reinstall();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().migrated.empty());
    REQUIRE_FALSE(fs::exists(f.ws->dir() / "rules/style.md"));
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "base style v2\n");
}

// ===== Failure handling =====

TEST_CASE("a failed install leaves the workspace untouched", "[installer]") {
    Fixture f;
    write_file(f.root() / ".mcp.json", "{ not json");
    std::string manifest_before = read_file(f.ws->manifest_path());

    auto r = f.add("base");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::Merge);

    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules"));
    REQUIRE(fs::is_directory(f.root() / ".claude"));
    REQUIRE_FALSE(fs::exists(f.ws->lock_path()));
    REQUIRE_FALSE(fs::exists(f.ws->index_path()));
    REQUIRE(read_file(f.ws->manifest_path()) == manifest_before);
    REQUIRE(read_file(f.root() / ".mcp.json") == "{ not json");
}

TEST_CASE("a failed reinstall restores the previous records", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    std::string lock_before = read_file(f.ws->lock_path());
    std::string index_before = read_file(f.ws->index_path());

    write_file(f.tmp / "bundles/base/rules/style.md", "base style v2\n");
    write_file(f.tmp / "bundles/base/mcp.jsonc", "{ broken");

    auto r = f.reinstall();
    REQUIRE(r.is_err());
    REQUIRE(read_file(f.root() / ".claude/rules/style.md") == "base style\n");
    REQUIRE(read_file(f.ws->lock_path()) == lock_before);
    REQUIRE(read_file(f.ws->index_path()) == index_before);
}

TEST_CASE("dry run reports without touching anything", "[installer]") {
    Fixture f;
    std::string manifest_before = read_file(f.ws->manifest_path());

    auto r = f.add("base", true);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().dry_run);
    REQUIRE(r.value().bundles == std::vector<std::string>{"base", "ws"});
    REQUIRE(has_action(r.value(), ActionKind::Write, ".claude/rules/style.md"));
    REQUIRE(has_action(r.value(), ActionKind::Merge, "CLAUDE.md"));

    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules"));
    REQUIRE_FALSE(fs::exists(f.root() / "CLAUDE.md"));
    REQUIRE_FALSE(fs::exists(f.ws->lock_path()));
    REQUIRE(read_file(f.ws->manifest_path()) == manifest_before);
}

TEST_CASE("a held workspace lock fails a no-wait install", "[installer]") {
    Fixture f;

    std::promise<bool> held;
    std::promise<void> release;
    auto released = release.get_future();
    std::thread holder([&] {
        auto lock = f.ws->lock(true);
        held.set_value(lock.is_ok());
        released.wait();
    });
    REQUIRE(held.get_future().get());

    InstallOptions opts;
    opts.source = (f.tmp / "bundles/base").string();
    opts.no_wait = true;
    auto r = f.installer->install(opts);

    // A dry run takes no lock
    opts.dry_run = true;
    auto preview = f.installer->install(opts);

    release.set_value();
    holder.join();

    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::LockContention);
    REQUIRE(preview.is_ok());
    REQUIRE_FALSE(fs::exists(f.ws->lock_path()));
}

// ===== Uninstall =====

TEST_CASE("uninstall argument errors", "[installer]") {
    Fixture f;
    REQUIRE(f.remove({"base"}).error().code == StowError::NotFound);

    REQUIRE(f.add("base").is_ok());
    REQUIRE(f.remove({}).error().code == StowError::InvalidArg);
    REQUIRE(f.remove({"ghost"}).error().code == StowError::NotFound);
    REQUIRE(f.remove({"ws"}).error().code == StowError::InvalidArg);
}

TEST_CASE("uninstall refuses a bundle others still need", "[installer]") {
    Fixture f;
    REQUIRE(f.add("tools").is_ok());

    auto r = f.remove({"base"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StowError::Dependency);
    REQUIRE(r.error().message.find("tools") != std::string::npos);
    REQUIRE(fs::exists(f.root() / ".claude/rules/style.md"));
}

TEST_CASE("uninstall takes orphaned dependencies with it", "[installer]") {
    Fixture f;
    REQUIRE(f.add("tools").is_ok());

    auto r = f.remove({"tools"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().removed == std::vector<std::string>{"base", "tools"});
    REQUIRE(r.value().bundles == std::vector<std::string>{"ws"});
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/commands"));
    REQUIRE_FALSE(fs::exists(f.root() / ".claude/rules"));

    auto lock = f.lock();
    REQUIRE(names(lock) == std::vector<std::string>{"ws"});
    REQUIRE(lock.find("ws")->dependencies.empty());
}

TEST_CASE("uninstall dry run keeps everything", "[installer]") {
    Fixture f;
    REQUIRE(f.add("base").is_ok());
    std::string lock_before = read_file(f.ws->lock_path());

    UninstallOptions opts;
    opts.names = {"base"};
    opts.dry_run = true;
    auto r = f.installer->uninstall(opts);
    REQUIRE(r.is_ok());
    REQUIRE(has_action(r.value(), ActionKind::Remove, ".claude/rules/style.md"));
    REQUIRE(fs::exists(f.root() / ".claude/rules/style.md"));
    REQUIRE(read_file(f.ws->lock_path()) == lock_before);
}

// ===== Queries =====

TEST_CASE("list and show describe installed bundles", "[installer]") {
    Fixture f;
    REQUIRE(f.installer->list().value().empty());
    REQUIRE(f.add("tools").is_ok());

    auto listed = f.installer->list();
    REQUIRE(listed.is_ok());
    REQUIRE(listed.value().size() == 3);
    const auto& base = listed.value()[0];
    REQUIRE(base.name == "base");
    REQUIRE(base.source == "../bundles/base");
    REQUIRE(base.file_count == 4);
    REQUIRE(base.installed_count == 3);
    REQUIRE_FALSE(base.is_workspace);
    REQUIRE(listed.value()[1].dependencies == std::vector<std::string>{"base"});
    REQUIRE(listed.value()[2].is_workspace);

    auto shown = f.installer->show("base");
    REQUIRE(shown.is_ok());
    REQUIRE(shown.value().dependents == std::vector<std::string>{"tools"});
    REQUIRE(shown.value().installed.size() == 3);
    REQUIRE(std::find(shown.value().files.begin(), shown.value().files.end(),
                      "rules/style.md") != shown.value().files.end());

    REQUIRE(f.installer->show("ghost").error().code == StowError::NotFound);
}
