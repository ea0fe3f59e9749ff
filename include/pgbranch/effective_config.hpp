#pragma once

#include <pgbranch/config.hpp>
#include <pgbranch/env_overlay.hpp>
#include <pgbranch/git.hpp>
#include <pgbranch/local_overlay.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace pgbranch {

// The three configuration layers of one invocation.
// Precedence per field: environment > local overlay > base file > defaults.
// Immutable after construction; merged() recomputes on every call.
class EffectiveConfig {
public:
    EffectiveConfig(BaseConfig base, std::optional<LocalOverlay> local, EnvOverlay env);

    // Fully-resolved configuration
    BaseConfig merged() const;

    // env.disabled, else local.disabled, else false
    bool disabled() const { return disabled_; }
    // env only; there is no file equivalent
    bool skip_hooks() const { return skip_hooks_; }
    bool current_branch_disabled() const { return current_branch_disabled_; }

    // Union of the environment and local disabled_branches lists
    bool is_branch_disabled(const std::string& branch_name) const;

    // current_branch_disabled, else whether git's current branch is disabled.
    // No repository or detached HEAD reads as false.
    bool check_current_git_branch_disabled(GitAccessor& git) const;

    // Globally disabled or the current branch is disabled
    bool should_exit_early(GitAccessor& git) const;

    Status validate() const;

    const BaseConfig& base() const { return base_; }
    const std::optional<LocalOverlay>& local() const { return local_; }
    const EnvOverlay& env() const { return env_; }

private:
    BaseConfig base_;
    std::optional<LocalOverlay> local_;
    EnvOverlay env_;

    bool disabled_;
    bool skip_hooks_;
    bool current_branch_disabled_;
};

struct LoadedConfig {
    EffectiveConfig config;
    // Base config file that was found, if any
    std::optional<std::filesystem::path> config_path;

    // NotFound when no .pgbranch.yml was discovered
    Status require_config_file() const;
};

// Discover and load all three layers starting at start_dir
Result<LoadedConfig> load_effective_config(const std::filesystem::path& start_dir);
Result<LoadedConfig> load_effective_config(const std::filesystem::path& start_dir,
                                           const EnvLookup& env_lookup);

} // namespace pgbranch
