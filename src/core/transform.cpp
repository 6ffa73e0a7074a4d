#include <stow/transform.hpp>

namespace stow {

static std::string file_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::string stem(const std::string& name) {
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return name;
    return name.substr(0, dot);
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string render_target(const std::string& target,
                          const GlobCapture& capture,
                          const std::string& universal_path) {
    std::string path = normalize_path(universal_path);
    std::string fname = file_name(path);
    std::string fstem = stem(fname);
    std::string name = capture.has_name ? capture.name : fstem;

    auto segs = path_segments(normalize_path(target));
    std::vector<std::string> out;
    for (size_t i = 0; i < segs.size(); ++i) {
        std::string seg = segs[i];
        if (seg == "**") {
            if (i + 1 == segs.size()) {
                out.insert(out.end(), capture.tail.begin(), capture.tail.end());
            } else if (!capture.tail.empty()) {
                out.insert(out.end(), capture.tail.begin(), capture.tail.end() - 1);
            }
            continue;
        }

        replace_all(seg, "{name}", name);
        if (seg == "*") {
            seg = fname;
        } else if (seg.find('*') != std::string::npos) {
            auto star = seg.find('*');
            seg = seg.substr(0, star) + fstem + seg.substr(star + 1);
            replace_all(seg, "*", "");
        }
        out.push_back(seg);
    }

    std::string joined;
    for (const auto& s : out) {
        if (s.empty()) continue;
        if (!joined.empty()) joined += "/";
        joined += s;
    }
    return joined;
}

std::string apply_extension(const std::string& path, const std::string& ext) {
    if (ext.empty()) return path;
    std::string suffix = "." + ext;
    if (path.size() >= suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return path;
    }

    auto slash = path.find_last_of('/');
    size_t name_start = slash == std::string::npos ? 0 : slash + 1;
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || dot <= name_start) return path + suffix;
    return path.substr(0, dot) + suffix;
}

std::optional<TransformTarget> transform_path(const std::string& universal_path,
                                              const Platform& platform) {
    for (const auto& rule : platform.transforms) {
        auto cap = glob_capture(rule.from, universal_path);
        if (!cap) continue;

        std::string output = render_target(rule.to, *cap, universal_path);
        output = apply_extension(output, rule.extension);
        if (output.empty()) continue;
        return TransformTarget{platform.id, output, rule.merge};
    }
    return std::nullopt;
}

std::vector<TransformTarget> transform_all(const std::string& universal_path,
                                           const std::vector<Platform>& platforms) {
    std::vector<TransformTarget> out;
    for (const auto& p : platforms) {
        if (auto t = transform_path(universal_path, p)) {
            out.push_back(std::move(*t));
        }
    }
    return out;
}

} // namespace stow
