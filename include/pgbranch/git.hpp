#pragma once

#include <pgbranch/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pgbranch {

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
                                  int timeout_seconds = 30);

// What the config layer needs from git
class GitAccessor {
public:
    virtual ~GitAccessor() = default;

    // Short name of the checked-out branch; nullopt when HEAD is detached.
    // Errors when no repository can be read.
    virtual Result<std::optional<std::string>> current_branch() = 0;
};

// Marker line identifying hooks written by pgbranch
inline constexpr const char* kHookMarker = "# pgbranch auto-generated hook";

// GitAccessor backed by the git executable
class GitCli : public GitAccessor {
public:
    explicit GitCli(std::filesystem::path repo_dir);

    Result<std::optional<std::string>> current_branch() override;

    // Absolute path of the .git directory
    Result<std::filesystem::path> git_dir();

    // Write post-checkout and post-merge hooks that run `pgbranch git-hook`.
    // Existing hooks not written by pgbranch are left alone and reported.
    Status install_hooks();

    // Remove hooks carrying kHookMarker; other hooks are kept
    Status uninstall_hooks();

    Result<bool> hooks_installed();

    static bool is_pgbranch_hook(const std::filesystem::path& hook_path);
    static std::string hook_script();

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
    std::filesystem::path repo_dir_;
    int timeout_seconds_ = 30;
};

} // namespace pgbranch
