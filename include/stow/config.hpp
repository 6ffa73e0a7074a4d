#pragma once

#include <stow/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stow {

// Layered configuration: global -> workspace. Later layers override earlier
// ones key by key; unset keys fall through.
struct Config {
    std::optional<std::string> cache_dir;
    std::optional<std::string> log_level;
    // [install]
    std::optional<std::vector<std::string>> platforms;
    std::optional<bool> frozen;
    // [lock]
    std::optional<bool> lock_wait;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& workspace);

    // STOW_CACHE_DIR, then cache_dir, then ~/.stow/cache
    std::string cache_root() const;
    bool wait_for_lock() const { return lock_wait.value_or(true); }
};

// ~/.stow, or empty when HOME is unset
std::string stow_home();

// ~/.stow/config.toml
std::string global_config_path();

} // namespace stow
