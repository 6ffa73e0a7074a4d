#include <stow/merge.hpp>
#include <stow/log.hpp>

#include <algorithm>
#include <cctype>

namespace stow {

const char* merge_strategy_name(MergeStrategy s) {
    switch (s) {
        case MergeStrategy::Replace:   return "replace";
        case MergeStrategy::Shallow:   return "shallow";
        case MergeStrategy::Deep:      return "deep";
        case MergeStrategy::Composite: return "composite";
    }
    return "replace";
}

bool parse_merge_strategy(const std::string& name, MergeStrategy& out) {
    std::string lower;
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "replace")   { out = MergeStrategy::Replace; return true; }
    if (lower == "shallow")   { out = MergeStrategy::Shallow; return true; }
    if (lower == "deep")      { out = MergeStrategy::Deep; return true; }
    if (lower == "composite") { out = MergeStrategy::Composite; return true; }
    return false;
}

namespace merge {

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

std::string strip_jsonc(const std::string& text) {
    // Pass 1: comments
    std::string nc;
    nc.reserve(text.size());
    bool in_str = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_str) {
            nc.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                nc.push_back(text[++i]);
            } else if (c == '"') {
                in_str = false;
            }
            continue;
        }
        if (c == '"') {
            in_str = true;
            nc.push_back(c);
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            while (i < text.size() && text[i] != '\n') ++i;
            if (i < text.size()) nc.push_back('\n');
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            i += 2;
            while (i + 1 < text.size() && !(text[i] == '*' && text[i + 1] == '/')) {
                if (text[i] == '\n') nc.push_back('\n');
                ++i;
            }
            ++i;
        } else {
            nc.push_back(c);
        }
    }

    // Pass 2: trailing commas
    std::string out;
    out.reserve(nc.size());
    in_str = false;
    for (size_t i = 0; i < nc.size(); ++i) {
        char c = nc[i];
        if (in_str) {
            out.push_back(c);
            if (c == '\\' && i + 1 < nc.size()) {
                out.push_back(nc[++i]);
            } else if (c == '"') {
                in_str = false;
            }
            continue;
        }
        if (c == '"') in_str = true;
        if (c == ',') {
            size_t j = i + 1;
            while (j < nc.size() && std::isspace(static_cast<unsigned char>(nc[j]))) ++j;
            if (j < nc.size() && (nc[j] == '}' || nc[j] == ']')) continue;
        }
        out.push_back(c);
    }
    return out;
}

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

Result<Json> parse_json(const std::string& text, const std::string& what) {
    if (is_blank(text)) return Result<Json>::ok(Json::object());
    try {
        return Result<Json>::ok(Json::parse(strip_jsonc(text)));
    } catch (const nlohmann::json::parse_error& e) {
        return StowError{StowError::Merge,
            "malformed JSON in " + what + ": " + e.what(),
            "fix or remove the file and run install again"};
    }
}

std::string dump_json(const Json& j) {
    return j.dump(2) + "\n";
}

static Json strip_nulls(const Json& v) {
    if (!v.is_object()) return v;
    Json out = Json::object();
    for (const auto& item : v.items()) {
        if (item.value().is_null()) continue;
        out[item.key()] = strip_nulls(item.value());
    }
    return out;
}

Json deep(const Json& base, const Json& incoming) {
    if (base.is_object() && incoming.is_object()) {
        Json out = base;
        for (const auto& item : incoming.items()) {
            const auto& key = item.key();
            const auto& val = item.value();
            if (val.is_null()) {
                out.erase(key);
            } else if (out.contains(key)) {
                out[key] = deep(out[key], val);
            } else {
                out[key] = strip_nulls(val);
            }
        }
        return out;
    }
    if (base.is_array() && incoming.is_array()) {
        Json out = base;
        for (const auto& elem : incoming) {
            if (std::find(out.begin(), out.end(), elem) == out.end()) {
                out.push_back(elem);
            }
        }
        return out;
    }
    return strip_nulls(incoming);
}

Result<Json> shallow(const Json& base, const Json& incoming) {
    if (!base.is_object() || !incoming.is_object()) {
        return StowError{StowError::Merge,
            "shallow merge requires JSON objects on both sides"};
    }
    Json out = base;
    for (const auto& item : incoming.items()) {
        out[item.key()] = item.value();
    }
    return Result<Json>::ok(std::move(out));
}

Json subtract(const Json& base, const Json& contribution, bool recursive) {
    if (base == contribution) return Json::object();
    if (!base.is_object() || !contribution.is_object()) return base;

    Json out = base;
    for (const auto& item : contribution.items()) {
        const auto& key = item.key();
        if (!out.contains(key)) continue;
        Json& current = out[key];
        const Json& contributed = item.value();

        if (current == contributed) {
            out.erase(key);
        } else if (recursive && current.is_object() && contributed.is_object()) {
            Json rest = subtract(current, contributed, true);
            if (rest.empty()) {
                out.erase(key);
            } else {
                current = std::move(rest);
            }
        } else if (recursive && current.is_array() && contributed.is_array()) {
            Json kept = Json::array();
            for (const auto& elem : current) {
                if (std::find(contributed.begin(), contributed.end(), elem) == contributed.end()) {
                    kept.push_back(elem);
                }
            }
            if (kept.empty()) {
                out.erase(key);
            } else {
                current = std::move(kept);
            }
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Composite text
// ---------------------------------------------------------------------------

std::string begin_marker(const std::string& bundle) {
    return "<!-- stow:begin " + bundle + " -->";
}

std::string end_marker(const std::string& bundle) {
    return "<!-- stow:end " + bundle + " -->";
}

// [begin, end) of the bundle's block including the end marker, or npos.
static std::pair<size_t, size_t> find_block(const std::string& text, const std::string& bundle) {
    std::string b = begin_marker(bundle);
    std::string e = end_marker(bundle);
    size_t start = text.find(b);
    if (start == std::string::npos) return {std::string::npos, std::string::npos};
    size_t stop = text.find(e, start + b.size());
    if (stop == std::string::npos) return {std::string::npos, std::string::npos};
    return {start, stop + e.size()};
}

static std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

bool has_block(const std::string& text, const std::string& bundle) {
    return find_block(text, bundle).first != std::string::npos;
}

std::string composite(const std::string& existing, const std::string& bundle,
                      const std::string& content) {
    std::string block = begin_marker(bundle) + "\n" +
                        trim_trailing_newlines(content) + "\n" +
                        end_marker(bundle);

    auto range = find_block(existing, bundle);
    if (range.first != std::string::npos) {
        return existing.substr(0, range.first) + block + existing.substr(range.second);
    }

    std::string head = trim_trailing_newlines(existing);
    if (is_blank(head)) return block + "\n";
    return head + "\n\n" + block + "\n";
}

std::string remove_block(const std::string& existing, const std::string& bundle) {
    auto range = find_block(existing, bundle);
    if (range.first == std::string::npos) return existing;

    size_t start = range.first;
    size_t stop = range.second;
    if (stop < existing.size() && existing[stop] == '\n') ++stop;
    // Drop the separating blank line
    if (start >= 2 && existing[start - 1] == '\n' && existing[start - 2] == '\n') --start;

    std::string out = existing.substr(0, start) + existing.substr(stop);
    if (is_blank(out)) return "";
    return out;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

Result<std::string> apply(MergeStrategy strategy,
                          const std::optional<std::string>& existing,
                          const std::string& incoming,
                          const std::string& bundle) {
    switch (strategy) {
        case MergeStrategy::Replace:
            return Result<std::string>::ok(incoming);

        case MergeStrategy::Composite:
            return Result<std::string>::ok(composite(existing.value_or(""), bundle, incoming));

        case MergeStrategy::Shallow:
        case MergeStrategy::Deep: {
            auto inc = parse_json(incoming, "content of '" + bundle + "'");
            if (inc.is_err()) return std::move(inc).error();

            Json base = Json::object();
            if (existing) {
                auto parsed = parse_json(*existing, "merge target");
                if (parsed.is_err()) return std::move(parsed).error();
                base = std::move(parsed).value();
            }

            // A top-level null contributes nothing
            if (inc.value().is_null()) {
                return Result<std::string>::ok(existing ? *existing : dump_json(base));
            }

            if (strategy == MergeStrategy::Deep) {
                return Result<std::string>::ok(dump_json(deep(base, inc.value())));
            }
            auto merged = shallow(base, inc.value());
            if (merged.is_err()) {
                auto err = std::move(merged).error();
                err.message += " (content of '" + bundle + "')";
                return err;
            }
            return Result<std::string>::ok(dump_json(merged.value()));
        }
    }
    return Result<std::string>::ok(incoming);
}

Result<std::string> remove_contribution(MergeStrategy strategy,
                                        const std::string& existing,
                                        const std::string& contribution,
                                        const std::string& bundle) {
    switch (strategy) {
        case MergeStrategy::Replace:
            return Result<std::string>::ok(std::string());

        case MergeStrategy::Composite:
            return Result<std::string>::ok(remove_block(existing, bundle));

        case MergeStrategy::Shallow:
        case MergeStrategy::Deep: {
            auto base = parse_json(existing, "merge target");
            if (base.is_err()) return std::move(base).error();
            auto contrib = parse_json(contribution, "content of '" + bundle + "'");
            if (contrib.is_err()) return std::move(contrib).error();
            if (contrib.value().is_null()) {
                return Result<std::string>::ok(existing);
            }
            bool deep_merge = strategy == MergeStrategy::Deep;
            Json rest = subtract(base.value(),
                                 deep_merge ? strip_nulls(contrib.value()) : contrib.value(),
                                 deep_merge);
            return Result<std::string>::ok(dump_json(rest));
        }
    }
    return Result<std::string>::ok(existing);
}

bool is_empty_residual(MergeStrategy strategy, const std::string& content) {
    if (is_blank(content)) return true;
    if (strategy == MergeStrategy::Shallow || strategy == MergeStrategy::Deep) {
        try {
            Json j = Json::parse(strip_jsonc(content));
            return j.is_null() || (j.is_object() && j.empty());
        } catch (const nlohmann::json::parse_error& e) {
            log::debug("merge target is not JSON (%s), keeping it", e.what());
            return false;
        }
    }
    return false;
}

} // namespace merge
} // namespace stow
