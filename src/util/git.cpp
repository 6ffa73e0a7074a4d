#include <stow/git.hpp>
#include <stow/log.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stow {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return StowError{StowError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        return StowError{StowError::IO,
            std::string("pipe() failed: ") + std::strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return StowError{StowError::IO,
            std::string("fork() failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    char buf[4096];
    bool done = false;
    auto start = std::chrono::steady_clock::now();

    while (!done) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return StowError{StowError::IO,
                "command timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        ssize_t n;
        while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
            out_buf.append(buf, static_cast<size_t>(n));
        }
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            err_buf.append(buf, static_cast<size_t>(n));
        }

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
                out_buf.append(buf, static_cast<size_t>(n));
            }
            while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
                err_buf.append(buf, static_cast<size_t>(n));
            }

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return StowError{StowError::IO,
                std::string("waitpid failed: ") + std::strerror(errno)};
        }

        usleep(1000);
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
    return StowError{StowError::IO, "unexpected exit from run_command loop"};
}

bool is_commit_sha(const std::string& ref) {
    if (ref.size() != 40) return false;
    return std::all_of(ref.begin(), ref.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

static std::string trim_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<std::string> GitCli::check_version() {
    auto r = run_command({"git", "--version"}, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StowError{StowError::NotFound,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_newlines(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return StowError{StowError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (std::sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return StowError{StowError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return StowError{StowError::SourceResolution,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Result<std::string> GitCli::clone_bare(const std::string& url,
                                       const std::string& dest) {
    if (offline_) {
        return StowError{StowError::SourceResolution,
            "cannot clone " + url + " in offline mode"};
    }

    log::debug("git clone --bare %s %s", url.c_str(), dest.c_str());
    auto r = run_command({"git", "clone", "--bare", "--quiet", url, dest},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StowError{StowError::SourceResolution,
            "git clone --bare " + url + " failed: " + trim_newlines(cmd.stderr_str)};
    }

    return Result<std::string>::ok(dest);
}

Status GitCli::fetch(const std::string& bare_repo_path) {
    if (offline_) {
        return StowError{StowError::SourceResolution,
            "cannot fetch in offline mode"};
    }

    log::debug("git -C %s fetch --tags", bare_repo_path.c_str());
    auto r = run_command({"git", "-C", bare_repo_path, "fetch", "--quiet", "--tags",
                          "--force", "origin", "+refs/heads/*:refs/heads/*"},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StowError{StowError::SourceResolution,
            "git fetch failed: " + trim_newlines(cmd.stderr_str)};
    }

    return ok_status();
}

Result<std::string> GitCli::resolve_ref(const std::string& bare_repo,
                                        const std::string& ref) {
    std::string name = ref.empty() ? std::string("HEAD") : ref;
    auto r = run_command({"git", "-C", bare_repo, "rev-parse", "--verify", "--quiet",
                          name + "^{commit}"},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StowError{StowError::SourceResolution,
            "cannot resolve ref '" + name + "'",
            "check that the branch, tag or commit exists in the remote"};
    }

    return Result<std::string>::ok(trim_newlines(cmd.stdout_str));
}

bool GitCli::has_commit(const std::string& repo, const std::string& commit) {
    auto r = run_command({"git", "-C", repo, "cat-file", "-e", commit + "^{commit}"},
                         "", timeout_seconds_);
    return r.is_ok() && r.value().exit_code == 0;
}

Status GitCli::export_tree(const std::string& bare_repo,
                           const std::string& commit,
                           const std::string& dest) {
    log::debug("git clone --shared %s %s", bare_repo.c_str(), dest.c_str());
    auto r = run_command({"git", "clone", "--quiet", "--shared", "--no-checkout", bare_repo, dest},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();
    if (r.value().exit_code != 0) {
        return StowError{StowError::SourceResolution,
            "git clone --shared failed: " + trim_newlines(r.value().stderr_str)};
    }

    auto r2 = run_command({"git", "-C", dest, "checkout", "--quiet", "--detach", commit},
                          "", timeout_seconds_);
    if (r2.is_err()) return std::move(r2).error();
    if (r2.value().exit_code != 0) {
        return StowError{StowError::SourceResolution,
            "git checkout " + commit + " failed: " + trim_newlines(r2.value().stderr_str)};
    }

    std::error_code ec;
    fs::remove_all(fs::path(dest) / ".git", ec);
    if (ec) {
        return StowError{StowError::IO,
            "cannot remove " + dest + "/.git: " + ec.message()};
    }
    return ok_status();
}

} // namespace stow
