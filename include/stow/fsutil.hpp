#pragma once

#include <stow/result.hpp>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace stow::fsutil {

// Absolute, symlink-resolved where the path exists, forward-slashed and
// without a trailing separator.
std::string canonical_string(const std::filesystem::path& p);

// Whole-file read (binary).
Result<std::string> read_file(const std::filesystem::path& path);

// Write through a sibling temporary file, fsync it, rename over `path` and
// fsync the parent directory. Parent directories are created as needed.
Status write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Regular files under `root`, relative, forward-slashed and sorted.
// Any path whose first segment or full relative path is in `exclude` is
// skipped, as is every ".git" directory.
Result<std::vector<std::string>> list_files(const std::filesystem::path& root,
                                            const std::set<std::string>& exclude = {});

// Content hash of a directory: SHA-256 over (relative path, NUL, bytes, NUL)
// for every listed file in order. Returns "sha256:<64 hex>".
Result<std::string> hash_tree(const std::filesystem::path& root,
                              const std::set<std::string>& exclude = {});

// hash_tree over an explicit sorted file list. Paths in `overrides` are
// hashed with the given content instead of what is on disk.
Result<std::string> hash_files(const std::filesystem::path& root,
                               const std::vector<std::string>& files,
                               const std::map<std::string, std::string>& overrides = {});

// Copy every listed file of src under dst, creating directories.
Status copy_tree(const std::filesystem::path& src,
                 const std::filesystem::path& dst,
                 const std::set<std::string>& exclude = {});

// Remove empty directories from `start` upward. Stops at the first
// non-empty directory, at any path in `keep`, and never leaves `root`.
void prune_empty_dirs(const std::filesystem::path& start,
                      const std::filesystem::path& root,
                      const std::set<std::filesystem::path>& keep);

// Fresh uniquely-named directory under parent.
Result<std::filesystem::path> make_temp_dir(const std::filesystem::path& parent,
                                            const std::string& prefix);

// "sha256:" prefix helpers
std::string with_hash_prefix(const std::string& hex);
bool is_hash_string(const std::string& s);

} // namespace stow::fsutil
