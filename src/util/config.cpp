#include <stow/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace stow {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return StowError{StowError::Config,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;

    if (auto v = doc["cache_dir"].value<std::string>()) cfg.cache_dir = *v;
    if (auto v = doc["log_level"].value<std::string>()) cfg.log_level = *v;

    if (auto install = doc["install"].as_table()) {
        if (auto arr = (*install)["platforms"].as_array()) {
            std::vector<std::string> ids;
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return StowError{StowError::Config,
                        "install.platforms must be an array of strings"};
                }
                ids.push_back(*s);
            }
            cfg.platforms = std::move(ids);
        }
        if (auto v = (*install)["frozen"].value<bool>()) cfg.frozen = *v;
    }

    if (auto lock = doc["lock"].as_table()) {
        if (auto v = (*lock)["wait"].value<bool>()) cfg.lock_wait = *v;
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StowError{StowError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).in_file(path);
}

void Config::merge(const Config& other) {
    if (other.cache_dir) cache_dir = other.cache_dir;
    if (other.log_level) log_level = other.log_level;
    if (other.platforms) platforms = other.platforms;
    if (other.frozen) frozen = other.frozen;
    if (other.lock_wait) lock_wait = other.lock_wait;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& workspace) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (workspace.has_value()) result.merge(workspace.value());
    return result;
}

std::string Config::cache_root() const {
    if (const char* env = std::getenv("STOW_CACHE_DIR")) {
        if (*env) return env;
    }
    if (cache_dir) return *cache_dir;
    std::string home = stow_home();
    if (home.empty()) return "/tmp/stow-cache";
    return home + "/cache";
}

std::string stow_home() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.stow";
}

std::string global_config_path() {
    std::string home = stow_home();
    if (home.empty()) return "";
    return home + "/config.toml";
}

} // namespace stow
