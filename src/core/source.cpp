#include <stow/source.hpp>
#include <cstdlib>

namespace stow {

// ---------------------------------------------------------------------------
// BundleSource
// ---------------------------------------------------------------------------

BundleSource BundleSource::directory(std::string path) {
    BundleSource s;
    s.data_ = DirectorySource{std::move(path)};
    return s;
}

BundleSource BundleSource::remote(std::string origin, std::string ref,
                                  std::string subpath, std::string revision) {
    BundleSource s;
    s.data_ = RemoteSource{std::move(origin), std::move(ref),
                           std::move(subpath), std::move(revision)};
    return s;
}

std::string BundleSource::identity() const {
    if (is_directory()) {
        return "dir+" + dir().path;
    }
    const auto& r = remote();
    return "git+" + r.origin + "#" + r.subpath + "@" + r.ref;
}

std::string BundleSource::fetch_identity() const {
    if (is_directory()) {
        return "dir+" + dir().path;
    }
    return "git+" + remote().origin;
}

std::string BundleSource::ref() const {
    if (is_directory()) return "";
    return remote().ref;
}

std::string BundleSource::display() const {
    if (is_directory()) return dir().path;
    const auto& r = remote();
    std::string out = r.origin;
    if (!r.ref.empty() || !r.subpath.empty()) {
        out += "#" + r.ref;
        if (!r.subpath.empty()) out += ":" + r.subpath;
    }
    return out;
}

bool BundleSource::operator==(const BundleSource& other) const {
    return identity() == other.identity();
}

// ---------------------------------------------------------------------------
// Dependency
// ---------------------------------------------------------------------------

Status Dependency::validate() const {
    if (name.empty()) {
        return StowError{StowError::Manifest, "dependency has an empty name"};
    }

    int source_count = 0;
    if (path.has_value()) ++source_count;
    if (git.has_value()) ++source_count;

    if (source_count == 0) {
        return StowError{StowError::Manifest,
            "dependency '" + name + "' has no source",
            "specify one of: path, git"};
    }
    if (source_count > 1) {
        return StowError{StowError::Manifest,
            "dependency '" + name + "' has multiple sources",
            "path and git are mutually exclusive"};
    }

    if (path.has_value() && (ref.has_value() || subpath.has_value())) {
        return StowError{StowError::Manifest,
            "dependency '" + name + "': ref and subpath only apply to git sources"};
    }
    if (git.has_value() && git->empty()) {
        return StowError{StowError::Manifest,
            "dependency '" + name + "' has an empty git URL"};
    }

    return ok_status();
}

// ---------------------------------------------------------------------------
// Source spec parsing
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool looks_like_directory(const std::string& spec) {
    return spec == "." || spec == ".." || starts_with(spec, "./") ||
           starts_with(spec, "../") || starts_with(spec, "/") || starts_with(spec, "~");
}

static std::string expand_home(const std::string& spec) {
    if (!starts_with(spec, "~")) return spec;
    const char* home = std::getenv("HOME");
    if (!home) return spec;
    return std::string(home) + spec.substr(1);
}

Result<BundleSource> parse_source_spec(const std::string& spec) {
    if (spec.empty()) {
        return StowError{StowError::InvalidArg, "empty source"};
    }

    if (looks_like_directory(spec)) {
        return Result<BundleSource>::ok(BundleSource::directory(expand_home(spec)));
    }

    std::string main = spec;
    std::string ref;
    std::string subpath;

    auto hash = spec.find('#');
    if (hash != std::string::npos) {
        main = spec.substr(0, hash);
        std::string frag = spec.substr(hash + 1);
        auto colon = frag.find(':');
        if (colon != std::string::npos) {
            ref = frag.substr(0, colon);
            subpath = frag.substr(colon + 1);
        } else {
            ref = frag;
        }
    }

    while (!subpath.empty() && subpath.back() == '/') subpath.pop_back();
    while (!subpath.empty() && subpath.front() == '/') subpath.erase(0, 1);

    std::string origin;
    if (starts_with(main, "https://") || starts_with(main, "http://") ||
        starts_with(main, "ssh://") || starts_with(main, "git@") ||
        starts_with(main, "file://")) {
        origin = main;
    } else if (starts_with(main, "github:")) {
        origin = "https://github.com/" + main.substr(7) + ".git";
    } else {
        // owner/repo shorthand
        auto slash = main.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == main.size() ||
            main.find('/', slash + 1) != std::string::npos) {
            return StowError{StowError::InvalidArg,
                "unrecognized source: " + spec,
                "use a ./path, a git URL, or owner/repo"};
        }
        origin = "https://github.com/" + main + ".git";
    }

    if (origin.empty()) {
        return StowError{StowError::InvalidArg, "unrecognized source: " + spec};
    }

    return Result<BundleSource>::ok(BundleSource::remote(origin, ref, subpath));
}

} // namespace stow
