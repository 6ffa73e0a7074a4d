#pragma once

#include <stow/result.hpp>
#include <stow/merge.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace stow {

struct TransformRule {
    std::string from;                   // glob over universal paths
    std::string to;                     // output pattern, may use {name}
    MergeStrategy merge = MergeStrategy::Replace;
    std::string extension;              // output extension override, without '.'
};

// A target tool. Platforms are plain data: the built-in set is a TOML
// document parsed by the same loader as user platforms.toml files.
struct Platform {
    std::string id;
    std::string name;
    std::string directory;              // output root, relative to the workspace
    std::vector<std::string> markers;   // paths whose presence detects the platform
    std::vector<std::string> aliases;
    std::vector<TransformRule> transforms;

    // Any marker exists under root; without markers, the platform directory
    bool detect(const std::filesystem::path& root) const;
};

class PlatformRegistry {
public:
    // The platforms stow ships with
    static PlatformRegistry builtin();

    // Parse a platforms.toml document ([[platforms]] with nested
    // [[platforms.transforms]]).
    static Result<std::vector<Platform>> parse(const std::string& toml_str);

    // Merge a platforms.toml file on top of the registry; a missing file
    // is not an error.
    Status load(const std::string& path);

    // A platform with a known id replaces the whole entry, others append.
    void merge(std::vector<Platform> platforms);

    // Lookup by id or alias
    const Platform* find(const std::string& id) const;

    // Platforms present in the workspace, in registry order
    std::vector<Platform> detect(const std::filesystem::path& root) const;

    // Platforms named by id or alias, de-duplicated, in the given order.
    // NotFound for an unknown name.
    Result<std::vector<Platform>> select(const std::vector<std::string>& ids) const;

    const std::vector<Platform>& all() const { return platforms_; }

private:
    std::vector<Platform> platforms_;
};

} // namespace stow
