#pragma once

#include <stow/result.hpp>
#include <stow/source.hpp>
#include <string>
#include <vector>

namespace stow {

// [bundle] section
struct BundleInfo {
    std::string name;
    std::string description;
    std::string version;
    std::string author;
    std::string license;
    std::string homepage;
};

// Stow.toml: a bundle's metadata and its ordered direct dependencies.
// The workspace's own manifest lives at .stow/Stow.toml.
struct Manifest {
    BundleInfo bundle;
    std::vector<Dependency> dependencies;   // [[dependencies]], declaration order

    static Result<Manifest> parse(const std::string& toml_str);
    static Result<Manifest> load(const std::string& path);

    // Deterministic TOML rendering
    std::string to_toml() const;

    const Dependency* find_dependency(const std::string& name) const;

    // Replaces a dependency of the same name in place, or appends.
    // Returns true when the dependency was new.
    bool add_dependency(Dependency dep);

    bool remove_dependency(const std::string& name);

    std::vector<std::string> dependency_names() const;
};

} // namespace stow
