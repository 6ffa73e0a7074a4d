#include <stow/manifest.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace stow {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<Dependency> parse_dependency(size_t index, const toml::node& node) {
    if (!node.is_table()) {
        return StowError{StowError::Manifest,
            "dependencies[" + std::to_string(index) + "] must be a table"};
    }
    const auto& tbl = *node.as_table();

    Dependency dep;
    if (auto v = tbl["name"].value<std::string>()) dep.name = *v;
    if (auto v = tbl["path"].value<std::string>()) dep.path = *v;
    if (auto v = tbl["git"].value<std::string>()) dep.git = *v;
    if (auto v = tbl["ref"].value<std::string>()) dep.ref = *v;
    if (auto v = tbl["subpath"].value<std::string>()) dep.subpath = *v;

    if (dep.name.empty()) {
        return StowError{StowError::Manifest,
            "dependencies[" + std::to_string(index) + "] has no name"};
    }

    auto status = dep.validate();
    if (status.is_err()) return std::move(status).error();

    return Result<Dependency>::ok(std::move(dep));
}

// ---------------------------------------------------------------------------
// Manifest
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        const auto& src = e.source();
        return StowError{StowError::Parse,
            std::string("manifest TOML parse error: ") + std::string(e.description()),
            "", src.path ? *src.path : "", static_cast<int>(src.begin.line)};
    }

    Manifest m;

    if (auto b = doc["bundle"].as_table()) {
        const auto& tbl = *b;
        if (auto v = tbl["name"].value<std::string>()) m.bundle.name = *v;
        if (auto v = tbl["description"].value<std::string>()) m.bundle.description = *v;
        if (auto v = tbl["version"].value<std::string>()) m.bundle.version = *v;
        if (auto v = tbl["author"].value<std::string>()) m.bundle.author = *v;
        if (auto v = tbl["license"].value<std::string>()) m.bundle.license = *v;
        if (auto v = tbl["homepage"].value<std::string>()) m.bundle.homepage = *v;
    }

    if (auto deps = doc["dependencies"].as_array()) {
        size_t i = 0;
        for (const auto& node : *deps) {
            auto dep = parse_dependency(i++, node);
            if (dep.is_err()) return std::move(dep).error();
            if (m.find_dependency(dep.value().name)) {
                return StowError{StowError::Manifest,
                    "dependency '" + dep.value().name + "' is declared twice"};
            }
            m.dependencies.push_back(std::move(dep).value());
        }
    } else if (doc.contains("dependencies")) {
        return StowError{StowError::Manifest,
            "'dependencies' must be an array of tables",
            "declare each dependency in its own [[dependencies]] block"};
    }

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StowError{StowError::IO, "cannot open manifest: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Manifest::parse(ss.str()).in_file(path);
}

std::string Manifest::to_toml() const {
    toml::table doc;

    toml::table info;
    info.insert("name", bundle.name);
    if (!bundle.description.empty()) info.insert("description", bundle.description);
    if (!bundle.version.empty()) info.insert("version", bundle.version);
    if (!bundle.author.empty()) info.insert("author", bundle.author);
    if (!bundle.license.empty()) info.insert("license", bundle.license);
    if (!bundle.homepage.empty()) info.insert("homepage", bundle.homepage);
    doc.insert("bundle", std::move(info));

    if (!dependencies.empty()) {
        toml::array deps;
        for (const auto& d : dependencies) {
            toml::table t;
            t.insert("name", d.name);
            if (d.path) t.insert("path", *d.path);
            if (d.git) t.insert("git", *d.git);
            if (d.ref) t.insert("ref", *d.ref);
            if (d.subpath) t.insert("subpath", *d.subpath);
            deps.push_back(std::move(t));
        }
        doc.insert("dependencies", std::move(deps));
    }

    std::ostringstream out;
    out << doc << "\n";
    return out.str();
}

const Dependency* Manifest::find_dependency(const std::string& name) const {
    for (const auto& d : dependencies) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

bool Manifest::add_dependency(Dependency dep) {
    for (auto& d : dependencies) {
        if (d.name == dep.name) {
            d = std::move(dep);
            return false;
        }
    }
    dependencies.push_back(std::move(dep));
    return true;
}

bool Manifest::remove_dependency(const std::string& name) {
    auto it = std::remove_if(dependencies.begin(), dependencies.end(),
        [&](const Dependency& d) { return d.name == name; });
    if (it == dependencies.end()) return false;
    dependencies.erase(it, dependencies.end());
    return true;
}

std::vector<std::string> Manifest::dependency_names() const {
    std::vector<std::string> names;
    names.reserve(dependencies.size());
    for (const auto& d : dependencies) names.push_back(d.name);
    return names;
}

} // namespace stow
