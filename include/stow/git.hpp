#pragma once

#include <stow/result.hpp>
#include <string>
#include <vector>

namespace stow {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// True for a full 40-character hex commit id.
bool is_commit_sha(const std::string& ref);

// Wrapper around git CLI operations
class GitCli {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // Clone as bare repo: `git clone --bare <url> <dest>`
    Result<std::string> clone_bare(const std::string& url, const std::string& dest);

    // Fetch all refs in a bare repo: `git -C <bare> fetch --all --tags`
    Status fetch(const std::string& bare_repo_path);

    // Resolve a ref (tag, branch, SHA, HEAD) to a full commit hash
    Result<std::string> resolve_ref(const std::string& bare_repo,
                                    const std::string& ref);

    // Check whether a commit is present in the repository
    bool has_commit(const std::string& repo, const std::string& commit);

    // Materialize the tree of `commit` at dest (no .git directory left behind)
    Status export_tree(const std::string& bare_repo,
                       const std::string& commit,
                       const std::string& dest);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }
    bool is_offline() const { return offline_; }

private:
    int timeout_seconds_ = 120;
    bool offline_ = false;
};

} // namespace stow
