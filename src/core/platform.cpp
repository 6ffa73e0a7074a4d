#include <stow/platform.hpp>
#include <stow/fsutil.hpp>
#include <stow/glob.hpp>
#include <stow/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace stow {

// ---------------------------------------------------------------------------
// Built-in platform definitions
// ---------------------------------------------------------------------------

static const char* BUILTIN_PLATFORMS = R"TOML(
[[platforms]]
id = "claude"
name = "Claude Code"
directory = ".claude"
markers = [".claude"]

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".claude/commands/**/*.md"

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".claude/rules/**/*.md"

[[platforms.transforms]]
from = "agents/**/*.md"
to = ".claude/agents/**/*.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".claude/skills/{name}/**"

[[platforms.transforms]]
from = "mcp.jsonc"
to = ".mcp.json"
merge = "deep"

[[platforms.transforms]]
from = "AGENTS.md"
to = "CLAUDE.md"
merge = "composite"

[[platforms]]
id = "cursor"
name = "Cursor"
directory = ".cursor"
markers = [".cursor"]
aliases = ["cursor-ai"]

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".cursor/commands/**/*.md"

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".cursor/rules/**/*.mdc"
extension = "mdc"

[[platforms.transforms]]
from = "agents/**/*.md"
to = ".cursor/agents/**/*.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".cursor/skills/{name}/**"

[[platforms.transforms]]
from = "mcp.jsonc"
to = ".cursor/mcp.json"
merge = "deep"

[[platforms.transforms]]
from = "AGENTS.md"
to = "AGENTS.md"
merge = "composite"

[[platforms]]
id = "copilot"
name = "GitHub Copilot"
directory = ".github"
markers = [".github/copilot-instructions.md", ".github/instructions", ".github/prompts", ".github/skills"]
aliases = ["github-copilot"]

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".github/instructions/{name}.instructions.md"
extension = "instructions.md"

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".github/prompts/{name}.prompt.md"
extension = "prompt.md"

[[platforms.transforms]]
from = "agents/**/*.md"
to = ".github/agents/{name}/AGENTS.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".github/skills/{name}/**"

[[platforms.transforms]]
from = "mcp.jsonc"
to = ".github/mcp.json"
merge = "deep"

[[platforms.transforms]]
from = "AGENTS.md"
to = "AGENTS.md"
merge = "composite"

[[platforms]]
id = "windsurf"
name = "Windsurf"
directory = ".windsurf"
markers = [".windsurf"]

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".windsurf/rules/**/*.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".windsurf/skills/{name}/**"

[[platforms]]
id = "gemini"
name = "Gemini CLI"
directory = ".gemini"
markers = [".gemini"]

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".gemini/commands/**/*.md"

[[platforms.transforms]]
from = "agents/**/*.md"
to = ".gemini/agents/**/*.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".gemini/skills/{name}/**"

[[platforms.transforms]]
from = "mcp.jsonc"
to = ".gemini/settings.json"
merge = "deep"

[[platforms.transforms]]
from = "AGENTS.md"
to = "GEMINI.md"
merge = "composite"

[[platforms]]
id = "opencode"
name = "OpenCode"
directory = ".opencode"
markers = [".opencode"]

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".opencode/commands/**/*.md"

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".opencode/rules/**/*.md"

[[platforms.transforms]]
from = "agents/**/*.md"
to = ".opencode/agents/**/*.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".opencode/skills/{name}/**"

[[platforms.transforms]]
from = "mcp.jsonc"
to = ".opencode/opencode.json"
merge = "deep"

[[platforms.transforms]]
from = "AGENTS.md"
to = "AGENTS.md"
merge = "composite"

[[platforms]]
id = "antigravity"
name = "Google Antigravity"
directory = ".agent"
markers = [".agent"]

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".agent/rules/**/*.md"

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".agent/workflows/**/*.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".agent/skills/{name}/**"

[[platforms]]
id = "augment"
name = "Augment Code"
directory = ".augment"
markers = [".augment"]

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".augment/rules/**/*.md"

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".augment/commands/**/*.md"

[[platforms]]
id = "kiro"
name = "Kiro"
directory = ".kiro"
markers = [".kiro"]

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".kiro/steering/**/*.md"

[[platforms.transforms]]
from = "mcp.jsonc"
to = ".kiro/settings/mcp.json"
merge = "deep"

[[platforms]]
id = "junie"
name = "JetBrains Junie"
directory = ".junie"
markers = [".junie"]

[[platforms.transforms]]
from = "rules/**/*.md"
to = ".junie/guidelines.md"
merge = "composite"

[[platforms.transforms]]
from = "commands/**/*.md"
to = ".junie/commands/**/*.md"

[[platforms.transforms]]
from = "agents/**/*.md"
to = ".junie/agents/**/*.md"

[[platforms.transforms]]
from = "skills/{name}/**"
to = ".junie/skills/{name}/**"

[[platforms.transforms]]
from = "mcp.jsonc"
to = ".junie/mcp.json"
merge = "deep"

[[platforms.transforms]]
from = "AGENTS.md"
to = "AGENTS.md"
merge = "composite"
)TOML";

// ---------------------------------------------------------------------------
// Platform
// ---------------------------------------------------------------------------

bool Platform::detect(const fs::path& root) const {
    std::error_code ec;
    if (markers.empty()) {
        return !directory.empty() && fs::exists(root / directory, ec);
    }
    for (const auto& m : markers) {
        if (fs::exists(root / m, ec)) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static StowError platform_error(const std::string& msg) {
    return StowError{StowError::Config, "platforms: " + msg};
}

static bool escapes_workspace(const std::string& pattern) {
    if (pattern.empty() || pattern[0] == '/' || pattern[0] == '~') return true;
    for (const auto& seg : path_segments(normalize_path(pattern))) {
        if (seg == "..") return true;
    }
    return false;
}

static Result<std::vector<std::string>> strings(const toml::table& tbl, const char* key,
                                                const std::string& owner) {
    std::vector<std::string> out;
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));
    const toml::array* arr = node->as_array();
    if (!arr) return platform_error("'" + std::string(key) + "' of '" + owner + "' must be an array");
    for (const auto& e : *arr) {
        auto s = e.value<std::string>();
        if (!s) return platform_error("'" + std::string(key) + "' of '" + owner + "' must hold strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Result<TransformRule> parse_rule(const toml::table& tbl, const std::string& owner) {
    TransformRule r;
    auto from = tbl["from"].value<std::string>();
    auto to = tbl["to"].value<std::string>();
    if (!from || !to) {
        return platform_error("every transform of '" + owner + "' needs 'from' and 'to'");
    }
    r.from = normalize_path(*from);
    r.to = normalize_path(*to);
    if (escapes_workspace(r.to)) {
        return platform_error("transform target '" + r.to + "' of '" + owner +
                              "' leaves the workspace");
    }
    if (auto m = tbl["merge"].value<std::string>()) {
        if (!parse_merge_strategy(*m, r.merge)) {
            return platform_error("unknown merge strategy '" + *m + "' in '" + owner + "'");
        }
    }
    if (auto ext = tbl["extension"].value<std::string>()) {
        r.extension = *ext;
        while (!r.extension.empty() && r.extension[0] == '.') r.extension.erase(0, 1);
    }
    return Result<TransformRule>::ok(std::move(r));
}

Result<std::vector<Platform>> PlatformRegistry::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StowError{StowError::Parse,
            std::string("platforms TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    std::vector<Platform> out;
    const toml::array* arr = doc["platforms"].as_array();
    if (!arr) {
        if (doc.contains("platforms")) {
            return platform_error("'platforms' must be an array of tables");
        }
        return Result<std::vector<Platform>>::ok(std::move(out));
    }

    for (const auto& node : *arr) {
        const toml::table* tbl = node.as_table();
        if (!tbl) return platform_error("every [[platforms]] entry must be a table");

        Platform p;
        p.id = (*tbl)["id"].value_or(std::string());
        if (p.id.empty()) return platform_error("a platform has no id");
        p.name = (*tbl)["name"].value_or(p.id);
        p.directory = normalize_path((*tbl)["directory"].value_or(std::string()));
        if (!p.directory.empty() && escapes_workspace(p.directory)) {
            return platform_error("directory of '" + p.id + "' leaves the workspace");
        }

        auto markers = strings(*tbl, "markers", p.id);
        if (markers.is_err()) return std::move(markers).error();
        p.markers = std::move(markers).value();

        auto aliases = strings(*tbl, "aliases", p.id);
        if (aliases.is_err()) return std::move(aliases).error();
        p.aliases = std::move(aliases).value();

        if (const toml::array* rules = (*tbl)["transforms"].as_array()) {
            for (const auto& rn : *rules) {
                const toml::table* rt = rn.as_table();
                if (!rt) return platform_error("transforms of '" + p.id + "' must be tables");
                auto rule = parse_rule(*rt, p.id);
                if (rule.is_err()) return std::move(rule).error();
                p.transforms.push_back(std::move(rule).value());
            }
        }
        out.push_back(std::move(p));
    }
    return Result<std::vector<Platform>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

PlatformRegistry PlatformRegistry::builtin() {
    PlatformRegistry reg;
    auto parsed = parse(BUILTIN_PLATFORMS);
    if (parsed.is_err()) {
        // Only reachable if the embedded document is edited into an invalid state
        log::error("built-in platform definitions are invalid: %s",
                   parsed.error().message.c_str());
        return reg;
    }
    reg.platforms_ = std::move(parsed).value();
    return reg;
}

Status PlatformRegistry::load(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return ok_status();

    auto content = fsutil::read_file(path);
    if (content.is_err()) return std::move(content).error();

    auto parsed = parse(content.value()).in_file(path);
    if (parsed.is_err()) return std::move(parsed).error();
    log::debug("loaded %zu platform definition(s) from %s",
               parsed.value().size(), path.c_str());
    merge(std::move(parsed).value());
    return ok_status();
}

void PlatformRegistry::merge(std::vector<Platform> platforms) {
    for (auto& p : platforms) {
        auto it = std::find_if(platforms_.begin(), platforms_.end(),
            [&](const Platform& q) { return q.id == p.id; });
        if (it != platforms_.end()) {
            *it = std::move(p);
        } else {
            platforms_.push_back(std::move(p));
        }
    }
}

const Platform* PlatformRegistry::find(const std::string& id) const {
    for (const auto& p : platforms_) {
        if (p.id == id) return &p;
    }
    for (const auto& p : platforms_) {
        if (std::find(p.aliases.begin(), p.aliases.end(), id) != p.aliases.end()) return &p;
    }
    return nullptr;
}

std::vector<Platform> PlatformRegistry::detect(const fs::path& root) const {
    std::vector<Platform> out;
    for (const auto& p : platforms_) {
        if (p.detect(root)) out.push_back(p);
    }
    return out;
}

Result<std::vector<Platform>> PlatformRegistry::select(const std::vector<std::string>& ids) const {
    std::vector<Platform> out;
    for (const auto& id : ids) {
        const Platform* p = find(id);
        if (!p) {
            std::string known;
            for (const auto& q : platforms_) {
                if (!known.empty()) known += ", ";
                known += q.id;
            }
            return StowError{StowError::NotFound, "unknown platform '" + id + "'",
                "known platforms: " + known};
        }
        bool seen = std::any_of(out.begin(), out.end(),
            [&](const Platform& q) { return q.id == p->id; });
        if (!seen) out.push_back(*p);
    }
    return Result<std::vector<Platform>>::ok(std::move(out));
}

} // namespace stow
