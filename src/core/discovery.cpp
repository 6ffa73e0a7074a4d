#include <stow/discovery.hpp>
#include <stow/fsutil.hpp>
#include <stow/log.hpp>
#include <stow/manifest.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace stow {

const std::vector<std::string>& resource_markers() {
    static const std::vector<std::string> markers = {
        "commands", "rules", "agents", "skills", "prompts",
        "AGENTS.md", "mcp.jsonc", "mcp.json",
    };
    return markers;
}

bool is_bundle_dir(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return false;
    if (fs::is_regular_file(dir / "Stow.toml", ec)) return true;
    for (const auto& m : resource_markers()) {
        if (fs::exists(dir / m, ec)) return true;
    }
    return false;
}

static size_t count_resources(const fs::path& dir) {
    auto files = fsutil::list_files(dir, {"Stow.toml", "Stow.lock", "Stow.index"});
    if (files.is_err()) return 0;
    return files.value().size();
}

static Result<BundleCandidate> make_candidate(const fs::path& root, const fs::path& dir) {
    BundleCandidate c;
    std::error_code ec;
    fs::path rel = fs::relative(dir, root, ec);
    c.subpath = (ec || rel == ".") ? "" : rel.generic_string();
    c.name = dir.filename().string();
    if (c.name.empty() || c.name == ".") c.name = fs::absolute(dir).parent_path().filename().string();

    fs::path manifest_path = dir / "Stow.toml";
    if (fs::is_regular_file(manifest_path, ec)) {
        auto m = Manifest::load(manifest_path.string());
        if (m.is_err()) return std::move(m).error();
        if (!m.value().bundle.name.empty()) c.name = m.value().bundle.name;
        c.description = m.value().bundle.description;
    }
    c.resource_count = count_resources(dir);
    return Result<BundleCandidate>::ok(std::move(c));
}

Result<std::vector<BundleCandidate>> discover_bundles(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return StowError{StowError::NotFound,
            "source directory does not exist: " + root.string()};
    }

    std::vector<BundleCandidate> out;
    if (fs::is_regular_file(root / "Stow.toml", ec)) {
        auto c = make_candidate(root, root);
        if (c.is_err()) return std::move(c).error();
        out.push_back(std::move(c).value());
        return Result<std::vector<BundleCandidate>>::ok(std::move(out));
    }

    fs::recursive_directory_iterator it(root, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec)) continue;
        std::string fname = it->path().filename().string();
        if (!fname.empty() && fname[0] == '.') {
            it.disable_recursion_pending();
            continue;
        }
        if (fs::is_regular_file(it->path() / "Stow.toml", ec)) {
            auto c = make_candidate(root, it->path());
            if (c.is_err()) return std::move(c).error();
            log::debug("discovered bundle '%s' at %s",
                       c.value().name.c_str(), c.value().subpath.c_str());
            out.push_back(std::move(c).value());
            it.disable_recursion_pending();
        }
    }
    if (ec) {
        return StowError{StowError::IO,
            "cannot scan " + root.string() + ": " + ec.message()};
    }

    if (out.empty() && is_bundle_dir(root)) {
        auto c = make_candidate(root, root);
        if (c.is_err()) return std::move(c).error();
        out.push_back(std::move(c).value());
    }

    std::sort(out.begin(), out.end(),
        [](const BundleCandidate& a, const BundleCandidate& b) {
            if (a.name != b.name) return a.name < b.name;
            return a.subpath < b.subpath;
        });
    return Result<std::vector<BundleCandidate>>::ok(std::move(out));
}

Result<std::vector<BundleCandidate>> SelectAll::select(
    const std::vector<BundleCandidate>& candidates)
{
    return Result<std::vector<BundleCandidate>>::ok(candidates);
}

} // namespace stow
