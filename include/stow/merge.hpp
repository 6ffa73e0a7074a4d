#pragma once

#include <stow/result.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace stow {

enum class MergeStrategy { Replace, Shallow, Deep, Composite };

const char* merge_strategy_name(MergeStrategy s);
bool parse_merge_strategy(const std::string& name, MergeStrategy& out);

namespace merge {

using Json = nlohmann::ordered_json;

// Remove // and /* */ comments and trailing commas outside of strings.
std::string strip_jsonc(const std::string& text);

// Parse JSON or JSONC. `what` names the content in error messages.
Result<Json> parse_json(const std::string& text, const std::string& what);

// Two-space indentation, trailing newline.
std::string dump_json(const Json& j);

// Recursive merge. Objects merge key-wise, arrays concatenate without
// structurally equal duplicates, anything else is replaced by incoming.
// An explicit null in incoming deletes the key.
Json deep(const Json& base, const Json& incoming);

// Top-level keys of incoming replace those of base, an explicit null included.
// Both sides must be objects.
Result<Json> shallow(const Json& base, const Json& incoming);

// Take a contribution back out: keys whose value still equals the
// contribution's are dropped, array elements it added are removed, keys
// the user has since changed are kept. `recursive` descends into objects.
Json subtract(const Json& base, const Json& contribution, bool recursive);

// Delimited block markers for composite text
std::string begin_marker(const std::string& bundle);
std::string end_marker(const std::string& bundle);

bool has_block(const std::string& text, const std::string& bundle);

// Replace the bundle's block in place, or append it after a blank line.
std::string composite(const std::string& existing, const std::string& bundle,
                      const std::string& content);

// Delete the bundle's block (and the blank line that separated it).
std::string remove_block(const std::string& existing, const std::string& bundle);

// Combine existing content (nullopt when the target does not exist) with a
// bundle's new content.
//
// Errors: Merge when either side of a Shallow/Deep merge is malformed.
Result<std::string> apply(MergeStrategy strategy,
                          const std::optional<std::string>& existing,
                          const std::string& incoming,
                          const std::string& bundle);

// Inverse of apply() for one bundle's contribution.
Result<std::string> remove_contribution(MergeStrategy strategy,
                                        const std::string& existing,
                                        const std::string& contribution,
                                        const std::string& bundle);

// True when nothing but whitespace, or an empty JSON object, remains.
bool is_empty_residual(MergeStrategy strategy, const std::string& content);

} // namespace merge
} // namespace stow
