#include <pgbranch/git.hpp>
#include <pgbranch/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pgbranch {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return PgbranchError{PgbranchError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        return PgbranchError{PgbranchError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        return PgbranchError{PgbranchError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return PgbranchError{PgbranchError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }
        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(timeout_seconds);

    while (true) {
        drain(out_pipe[0], out_buf);
        drain(err_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(out_pipe[0], out_buf);
            drain(err_pipe[0], err_buf);
            close(out_pipe[0]);
            close(err_pipe[0]);
            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        }
        if (w < 0) {
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PgbranchError{PgbranchError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(out_pipe[0]);
            close(err_pipe[0]);
            return PgbranchError{PgbranchError::IO,
                args[0] + " timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        usleep(1000);
    }
}

static std::string chomp(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

GitCli::GitCli(fs::path repo_dir) : repo_dir_(std::move(repo_dir)) {}

Result<std::optional<std::string>> GitCli::current_branch() {
    // symbolic-ref also names an unborn branch; exit 1 means detached HEAD
    auto r = run_command({"git", "-C", repo_dir_.string(), "symbolic-ref", "--short", "-q", "HEAD"},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    const auto& cmd = r.value();
    if (cmd.exit_code == 0) {
        return Result<std::optional<std::string>>::ok(chomp(cmd.stdout_str));
    }
    if (cmd.exit_code == 1) {
        log::debug("HEAD is detached in %s", repo_dir_.string().c_str());
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return PgbranchError{PgbranchError::Git,
        "cannot read HEAD in " + repo_dir_.string() + ": " + chomp(cmd.stderr_str)};
}

Result<fs::path> GitCli::git_dir() {
    auto r = run_command({"git", "-C", repo_dir_.string(), "rev-parse", "--absolute-git-dir"},
                         "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    const auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return PgbranchError{PgbranchError::Git,
            "not a git repository: " + repo_dir_.string(),
            "run pgbranch inside a git checkout"};
    }
    return Result<fs::path>::ok(fs::path(chomp(cmd.stdout_str)));
}

static const char* const kHookNames[] = {"post-checkout", "post-merge"};

bool GitCli::is_pgbranch_hook(const fs::path& hook_path) {
    std::ifstream file(hook_path);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str().find(kHookMarker) != std::string::npos;
}

std::string GitCli::hook_script() {
    std::string s = "#!/bin/sh\n";
    s += kHookMarker;
    s += R"(
# Keeps the PostgreSQL branch database in sync with the checked-out git branch.

# post-checkout passes $3=0 for file checkouts; only branch checkouts matter
if [ "$#" -ge 3 ] && [ "$3" = "0" ]; then
    exit 0
fi

if command -v pgbranch >/dev/null 2>&1; then
    pgbranch git-hook
else
    echo "pgbranch not found in PATH, skipping database branch sync"
fi
)";
    return s;
}

Status GitCli::install_hooks() {
    auto dir = git_dir();
    if (dir.is_err()) return std::move(dir).error();
    fs::path hooks_dir = dir.value() / "hooks";

    std::error_code ec;
    fs::create_directories(hooks_dir, ec);
    if (ec) {
        return PgbranchError{PgbranchError::IO,
            "cannot create hooks directory " + hooks_dir.string() + ": " + ec.message()};
    }

    for (const char* name : kHookNames) {
        fs::path hook = hooks_dir / name;
        if (fs::exists(hook, ec) && !is_pgbranch_hook(hook)) {
            return PgbranchError{PgbranchError::Git,
                "refusing to overwrite existing " + std::string(name) + " hook",
                "move " + hook.string() + " aside and run install-hooks again"};
        }

        std::ofstream out(hook, std::ios::trunc);
        if (!out.is_open()) {
            return PgbranchError{PgbranchError::IO, "cannot write hook: " + hook.string()};
        }
        out << hook_script();
        out.close();
        if (!out) {
            return PgbranchError{PgbranchError::IO, "failed writing hook: " + hook.string()};
        }

        fs::permissions(hook,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace, ec);
        if (ec) {
            return PgbranchError{PgbranchError::IO,
                "cannot make hook executable " + hook.string() + ": " + ec.message()};
        }
        log::debug("installed %s", hook.string().c_str());
    }
    return ok_status();
}

Status GitCli::uninstall_hooks() {
    auto dir = git_dir();
    if (dir.is_err()) return std::move(dir).error();

    for (const char* name : kHookNames) {
        fs::path hook = dir.value() / "hooks" / name;
        std::error_code ec;
        if (!fs::exists(hook, ec)) continue;
        if (!is_pgbranch_hook(hook)) {
            log::info("leaving %s in place, it was not written by pgbranch", hook.string().c_str());
            continue;
        }
        fs::remove(hook, ec);
        if (ec) {
            return PgbranchError{PgbranchError::IO,
                "cannot remove hook " + hook.string() + ": " + ec.message()};
        }
        log::debug("removed %s", hook.string().c_str());
    }
    return ok_status();
}

Result<bool> GitCli::hooks_installed() {
    auto dir = git_dir();
    if (dir.is_err()) return std::move(dir).error();

    for (const char* name : kHookNames) {
        if (is_pgbranch_hook(dir.value() / "hooks" / name)) {
            return Result<bool>::ok(true);
        }
    }
    return Result<bool>::ok(false);
}

} // namespace pgbranch
