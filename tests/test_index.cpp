#include <catch2/catch.hpp>
#include <stow/fsutil.hpp>
#include <stow/index.hpp>
#include <stow/sha256.hpp>

#include "test_util.hpp"

namespace fs = std::filesystem;
using namespace stow;
using stow::test::TempDir;
using stow::test::write_file;

static LockedBundle locked(const std::string& name, std::vector<std::string> files) {
    LockedBundle b;
    b.name = name;
    b.source = BundleSource::directory("../" + name);
    b.hash = "sha256:" + std::string(64, '0');
    b.files = std::move(files);
    return b;
}

static IndexEntry entry(const std::string& path, const std::string& platform,
                        const std::string& bundle, const std::string& output,
                        MergeStrategy s = MergeStrategy::Replace, const std::string& hash = "") {
    IndexEntry e;
    e.path = path;
    e.platform = platform;
    e.bundle = bundle;
    e.output = output;
    e.strategy = s;
    e.hash = hash;
    return e;
}

// ===== Persistence =====

TEST_CASE("index renders sorted by path then platform", "[index]") {
    WorkspaceIndex idx;
    idx.upsert(entry("rules/b.md", "claude", "x", ".claude/rules/b.md"));
    idx.upsert(entry("rules/a.md", "cursor", "x", ".cursor/rules/a.mdc"));
    idx.upsert(entry("rules/a.md", "claude", "x", ".claude/rules/a.md"));
    idx.upsert(entry("AGENTS.md", "claude", "x", "CLAUDE.md", MergeStrategy::Composite));

    std::string text = idx.to_toml();
    size_t agents = text.find("\"AGENTS.md\"");
    size_t a_claude = text.find(".claude/rules/a.md");
    size_t a_cursor = text.find(".cursor/rules/a.mdc");
    size_t b = text.find(".claude/rules/b.md");
    REQUIRE(agents < a_claude);
    REQUIRE(a_claude < a_cursor);
    REQUIRE(a_cursor < b);

    auto back = WorkspaceIndex::parse(text);
    REQUIRE(back.is_ok());
    REQUIRE(back.value().size() == 4);
    REQUIRE(back.value().find("AGENTS.md", "claude")->strategy == MergeStrategy::Composite);
    REQUIRE(back.value().to_toml() == text);
}

TEST_CASE("index parse errors", "[index]") {
    REQUIRE(WorkspaceIndex::parse("version = 9\n").error().code == StowError::Parse);
    REQUIRE(WorkspaceIndex::parse(
        "[[entries]]\npath = \"a\"\nplatform = \"p\"\noutput = \"o\"\nstrategy = \"zip\"\n").is_err());
    REQUIRE(WorkspaceIndex::parse("[[entries]]\npath = \"a\"\n").is_err());
    REQUIRE(WorkspaceIndex::parse("").value().empty());
}

TEST_CASE("index save and load", "[index]") {
    TempDir tmp("index_save");
    WorkspaceIndex idx;
    idx.upsert(entry("rules/a.md", "claude", "x", ".claude/rules/a.md"));
    REQUIRE(idx.save((tmp / "Stow.index").string()).is_ok());
    auto loaded = WorkspaceIndex::load((tmp / "Stow.index").string());
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().entries() == idx.entries());
}

// ===== Queries =====

TEST_CASE("one entry per path and platform", "[index]") {
    WorkspaceIndex idx;
    idx.upsert(entry("rules/a.md", "claude", "base", ".claude/rules/a.md"));
    idx.upsert(entry("rules/a.md", "claude", "app", ".claude/rules/a.md"));
    REQUIRE(idx.size() == 1);
    REQUIRE(idx.find("rules/a.md", "claude")->bundle == "app");

    REQUIRE(idx.remove("rules/a.md", "claude"));
    REQUIRE_FALSE(idx.remove("rules/a.md", "claude"));
    REQUIRE(idx.empty());
}

TEST_CASE("output and bundle queries", "[index]") {
    WorkspaceIndex idx;
    idx.upsert(entry("AGENTS.md", "cursor", "base", "AGENTS.md", MergeStrategy::Composite));
    idx.upsert(entry("AGENTS.md", "copilot", "app", "AGENTS.md", MergeStrategy::Composite));
    idx.upsert(entry("rules/a.md", "cursor", "base", ".cursor/rules/a.mdc"));

    REQUIRE(idx.find_output("AGENTS.md").size() == 2);
    REQUIRE(idx.find_provider("AGENTS.md")->bundle == "app");
    REQUIRE(idx.find_provider("nothing") == nullptr);
    REQUIRE(idx.entries_for("base").size() == 2);
    REQUIRE(idx.platforms() == std::set<std::string>{"copilot", "cursor"});
    REQUIRE(idx.outputs() == std::set<std::string>{".cursor/rules/a.mdc", "AGENTS.md"});
}

// ===== Planning =====

TEST_CASE("the last bundle providing a path owns it", "[index]") {
    LockFile lock;
    lock.bundles.push_back(locked("base", {"AGENTS.md", "rules/style.md"}));
    lock.bundles.push_back(locked("app", {"rules/style.md"}));

    auto reg = PlatformRegistry::builtin();
    auto plan = compute_index_update(lock, reg.select({"claude"}).value());

    REQUIRE(plan.index.size() == 2);
    REQUIRE(plan.index.find("rules/style.md", "claude")->bundle == "app");
    REQUIRE(plan.index.find("AGENTS.md", "claude")->bundle == "base");
    REQUIRE(plan.index.find("AGENTS.md", "claude")->hash.empty());

    const auto* style = plan.find_output(".claude/rules/style.md");
    REQUIRE(style != nullptr);
    REQUIRE(style->contributors.size() == 2);
    REQUIRE(style->contributors.back().bundle == "app");

    REQUIRE(plan.outputs.front().output < plan.outputs.back().output);
}

TEST_CASE("platforms sharing an output plan it once", "[index]") {
    LockFile lock;
    lock.bundles.push_back(locked("base", {"AGENTS.md"}));
    lock.bundles.push_back(locked("app", {"AGENTS.md"}));

    auto reg = PlatformRegistry::builtin();
    auto plan = compute_index_update(lock, reg.select({"cursor", "copilot"}).value());

    REQUIRE(plan.index.size() == 2);
    REQUIRE(plan.outputs.size() == 1);
    const auto& agents = plan.outputs[0];
    REQUIRE(agents.output == "AGENTS.md");
    REQUIRE(agents.strategy == MergeStrategy::Composite);
    REQUIRE(agents.contributors.size() == 2);
    REQUIRE(agents.contributors[0].bundle == "base");
    REQUIRE(agents.contributors[1].bundle == "app");
}

TEST_CASE("files no platform maps are not indexed", "[index]") {
    LockFile lock;
    lock.bundles.push_back(locked("base", {"README.md", "Stow.toml"}));
    auto plan = compute_index_update(lock, PlatformRegistry::builtin().all());
    REQUIRE(plan.index.empty());
    REQUIRE(plan.outputs.empty());
}

// ===== Modification detection =====

TEST_CASE("detect_modified compares live outputs with their sources", "[index]") {
    TempDir tmp("index_modified");
    fs::path ws = tmp / "ws";
    fs::path src = tmp / "src";
    write_file(src / "rules/a.md", "original a");
    write_file(src / "rules/b.md", "original b");
    write_file(ws / ".claude/rules/a.md", "original a");
    write_file(ws / ".claude/rules/b.md", "edited b");
    write_file(ws / "CLAUDE.md", "edited composite");

    WorkspaceIndex idx;
    idx.upsert(entry("rules/a.md", "claude", "base", ".claude/rules/a.md"));
    idx.upsert(entry("rules/b.md", "claude", "base", ".claude/rules/b.md"));
    idx.upsert(entry("rules/c.md", "claude", "base", ".claude/rules/c.md"));
    idx.upsert(entry("AGENTS.md", "claude", "base", "CLAUDE.md", MergeStrategy::Composite));

    auto r = detect_modified(idx, ws, [&](const std::string&) {
        return std::optional<fs::path>(src);
    });
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].output == ".claude/rules/b.md");
    REQUIRE(r.value()[0].bundle == "base");
}

TEST_CASE("detect_modified falls back to the recorded hash", "[index]") {
    TempDir tmp("index_recorded");
    write_file(tmp / ".claude/rules/a.md", "as installed");
    write_file(tmp / ".claude/rules/b.md", "changed");
    std::string installed = fsutil::with_hash_prefix(SHA256::hash_hex("as installed"));

    WorkspaceIndex idx;
    idx.upsert(entry("rules/a.md", "claude", "ws", ".claude/rules/a.md", MergeStrategy::Replace, installed));
    idx.upsert(entry("rules/b.md", "claude", "ws", ".claude/rules/b.md", MergeStrategy::Replace, installed));

    auto r = detect_modified(idx, tmp.path, [](const std::string&) {
        return std::optional<fs::path>();
    });
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].path == "rules/b.md");
}
