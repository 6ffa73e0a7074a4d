#include <stow/glob.hpp>

namespace stow {

static const std::string NAME_TOKEN = "{name}";

// ---- Helpers ----

std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    // Leading "./" carries no meaning in a relative resource path
    while (out.size() > 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    return out;
}

std::vector<std::string> path_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

bool is_wildcard_segment(const std::string& seg) {
    if (seg == "**") return true;
    for (char c : seg) {
        if (c == '*' || c == '?' || c == '[') return true;
    }
    return false;
}

// Match a single segment against a pattern segment (no '/' in either).
// Supports *, ?, [abc], [a-z], [!...].
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size() && si < str.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            pi++;
            bool negate = false;
            if (pi < pat.size() && pat[pi] == '!') {
                negate = true;
                pi++;
            }
            bool matched = false;
            char sc = str[si];
            while (pi < pat.size() && pat[pi] != ']') {
                char lo = pat[pi];
                if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                    char hi = pat[pi + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    pi += 3;
                } else {
                    if (sc == lo) matched = true;
                    pi++;
                }
            }
            if (pi < pat.size()) pi++;
            if (negate) matched = !matched;
            if (!matched) return false;
            si++;
            continue;
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size() && si == str.size();
}

// A segment of the form <pre>{name}<post>. The bound value is non-empty.
static bool match_name_segment(const std::string& pat, const std::string& str,
                               std::string* bound) {
    size_t at = pat.find(NAME_TOKEN);
    std::string pre = pat.substr(0, at);
    std::string post = pat.substr(at + NAME_TOKEN.size());

    for (size_t a = 0; a < str.size(); ++a) {
        if (!match_segment(pre, 0, str.substr(0, a), 0)) continue;
        // Shortest suffix first, so the name takes as much as it can
        for (size_t c = 0; a + c < str.size(); ++c) {
            size_t b_len = str.size() - a - c;
            if (match_segment(post, 0, str.substr(a + b_len), 0)) {
                if (bound) *bound = str.substr(a, b_len);
                return true;
            }
        }
    }
    return false;
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si,
                           std::string* bound) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            if (pi == pat_segs.size()) return true;
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k, bound)) return true;
            }
            return false;
        }

        if (ps.find(NAME_TOKEN) != std::string::npos) {
            if (!match_name_segment(ps, path_segs[si], bound)) return false;
        } else if (!match_segment(ps, 0, path_segs[si], 0)) {
            return false;
        }
        pi++;
        si++;
    }

    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path) {
    auto pat_segs = path_segments(normalize_path(pattern));
    auto path_segs = path_segments(normalize_path(path));
    return match_segments(pat_segs, 0, path_segs, 0, nullptr);
}

std::optional<GlobCapture> glob_capture(const std::string& pattern,
                                        const std::string& path) {
    auto pat_segs = path_segments(normalize_path(pattern));
    auto path_segs = path_segments(normalize_path(path));

    GlobCapture cap;
    if (!match_segments(pat_segs, 0, path_segs, 0, &cap.name)) {
        return std::nullopt;
    }
    cap.has_name = normalize_path(pattern).find(NAME_TOKEN) != std::string::npos;

    // Segments ahead of the first wildcard each consume exactly one path
    // segment, so the tail starts at the same index in the path.
    for (size_t i = 0; i < pat_segs.size(); ++i) {
        if (is_wildcard_segment(pat_segs[i])) {
            if (i < path_segs.size()) {
                cap.tail.assign(path_segs.begin() + static_cast<long>(i), path_segs.end());
            }
            break;
        }
    }
    return cap;
}

} // namespace stow
