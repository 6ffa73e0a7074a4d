#include <stow/log.hpp>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include <unistd.h>

namespace stow::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

bool parse_level(const std::string& name, Level& out) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) {
            out = lvl;
            return true;
        }
    }
    if (lower == "warning") {
        out = Warn;
        return true;
    }
    return false;
}

void init_from_env() {
    const char* env = std::getenv("STOW_LOG");
    if (!env) return;
    Level lvl;
    if (parse_level(env, lvl)) {
        s_level = lvl;
    }
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

#define STOW_LOG_FN(fn, lvl)            \
    void fn(const char* fmt, ...) {     \
        va_list args;                   \
        va_start(args, fmt);            \
        log_message(lvl, fmt, args);    \
        va_end(args);                   \
    }

STOW_LOG_FN(trace, Trace)
STOW_LOG_FN(debug, Debug)
STOW_LOG_FN(info, Info)
STOW_LOG_FN(warn, Warn)
STOW_LOG_FN(error, Error)

#undef STOW_LOG_FN

} // namespace stow::log
