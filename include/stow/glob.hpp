#pragma once

#include <optional>
#include <string>
#include <vector>

namespace stow {

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9],
//           {name} (one or more chars except /, bound by glob_capture)
bool glob_match(const std::string& pattern, const std::string& path);

struct GlobCapture {
    bool has_name = false;
    std::string name;
    // Path segments from the pattern's first wildcard segment onward.
    // Empty when the pattern is fully literal.
    std::vector<std::string> tail;
};

// Like glob_match, but also reports what {name} bound to and the wildcard
// tail of the path. At most one {name} per pattern is supported.
std::optional<GlobCapture> glob_capture(const std::string& pattern,
                                        const std::string& path);

// Forward slashes, no duplicate or trailing slashes.
std::string normalize_path(const std::string& p);

// Split a normalized path on '/'.
std::vector<std::string> path_segments(const std::string& p);

// True if the segment contains a wildcard (*, ?, [) or is "**".
bool is_wildcard_segment(const std::string& seg);

} // namespace stow
