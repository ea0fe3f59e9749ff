#include <pgbranch/effective_config.hpp>
#include <pgbranch/branch_filter.hpp>
#include <pgbranch/log.hpp>

namespace pgbranch {

namespace fs = std::filesystem;

EffectiveConfig::EffectiveConfig(BaseConfig base, std::optional<LocalOverlay> local,
                                 EnvOverlay env)
    : base_(std::move(base)),
      local_(std::move(local)),
      env_(std::move(env)) {
    std::optional<bool> local_disabled = local_ ? local_->disabled : std::nullopt;
    disabled_ = env_.disabled.value_or(local_disabled.value_or(false));
    skip_hooks_ = env_.skip_hooks.value_or(false);
    current_branch_disabled_ = env_.current_branch_disabled.value_or(false);
}

BaseConfig EffectiveConfig::merged() const {
    BaseConfig cfg = base_;
    if (local_) local_->apply_to(cfg);
    env_.apply_to(cfg);
    return cfg;
}

bool EffectiveConfig::is_branch_disabled(const std::string& branch_name) const {
    if (env_.disabled_branches && any_pattern_matches(*env_.disabled_branches, branch_name)) {
        return true;
    }
    if (local_ && local_->disabled_branches &&
        any_pattern_matches(*local_->disabled_branches, branch_name)) {
        return true;
    }
    return false;
}

bool EffectiveConfig::check_current_git_branch_disabled(GitAccessor& git) const {
    if (current_branch_disabled_) return true;

    auto branch = git.current_branch();
    if (branch.is_err()) {
        log::debug("no current git branch: %s", branch.error().message.c_str());
        return false;
    }
    if (!branch.value()) return false;
    return is_branch_disabled(*branch.value());
}

bool EffectiveConfig::should_exit_early(GitAccessor& git) const {
    if (disabled_) return true;
    return check_current_git_branch_disabled(git);
}

Status EffectiveConfig::validate() const {
    return pgbranch::validate(merged());
}

Status LoadedConfig::require_config_file() const {
    if (config_path) return ok_status();
    return PgbranchError{PgbranchError::NotFound,
        "no configuration file found",
        "run 'pgbranch init' to create a .pgbranch.yml file first"};
}

Result<LoadedConfig> load_effective_config(const fs::path& start_dir,
                                           const EnvLookup& env_lookup) {
    auto found = find_config_file(start_dir);
    if (found.is_err()) return std::move(found).error();
    std::optional<fs::path> config_path = found.value();

    BaseConfig base = BaseConfig::defaults();
    if (config_path) {
        auto loaded = BaseConfig::load(*config_path);
        if (loaded.is_err()) return std::move(loaded).error();
        base = std::move(loaded).value();
    } else {
        log::info("no .pgbranch.yml found, using default configuration");
    }

    auto local = discover_local_overlay(config_path, start_dir);
    if (local.is_err()) return std::move(local).error();

    auto env = EnvOverlay::from_lookup(env_lookup);
    if (env.is_err()) return std::move(env).error();

    EffectiveConfig config(std::move(base), std::move(local).value(), std::move(env).value());

    // An overlay can break a base file that was valid on its own. The filter
    // regex is left to the classifier, which fails closed on it.
    auto valid = validate_database(config.merged());
    if (valid.is_err()) {
        PgbranchError err = std::move(valid).error();
        if (err.hint.empty()) {
            err.hint = "check .pgbranch.yml, .pgbranch.local.yml and PGBRANCH_* variables";
        }
        return err;
    }

    return Result<LoadedConfig>::ok(LoadedConfig{std::move(config), std::move(config_path)});
}

Result<LoadedConfig> load_effective_config(const fs::path& start_dir) {
    return load_effective_config(start_dir, process_env_lookup());
}

} // namespace pgbranch
