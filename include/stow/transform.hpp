#pragma once

#include <stow/glob.hpp>
#include <stow/platform.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stow {

struct TransformTarget {
    std::string platform;
    std::string output;         // workspace-relative, forward slashes
    MergeStrategy strategy = MergeStrategy::Replace;
};

// Build the output path of a matched rule.
//   {name}              the captured name, or the file stem without capture
//   ** (last)           the whole wildcard tail of the source path
//   ** (followed)       the tail without its file name
//   segment with *      '*' replaced by the stem; '*' alone is the file name
std::string render_target(const std::string& target,
                          const GlobCapture& capture,
                          const std::string& universal_path);

// Replace the file name's last extension with `ext`, unless it already ends
// in ".ext".
std::string apply_extension(const std::string& path, const std::string& ext);

// First matching rule of the platform wins; nullopt when none matches.
std::optional<TransformTarget> transform_path(const std::string& universal_path,
                                              const Platform& platform);

// transform_path over each platform, in order
std::vector<TransformTarget> transform_all(const std::string& universal_path,
                                           const std::vector<Platform>& platforms);

} // namespace stow
