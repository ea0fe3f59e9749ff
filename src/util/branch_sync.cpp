#include <pgbranch/branch_sync.hpp>
#include <pgbranch/branch_filter.hpp>
#include <pgbranch/log.hpp>
#include <pgbranch/naming.hpp>

namespace pgbranch {

namespace fs = std::filesystem;

Status DryRunRunner::run(const PostCommand& cmd, const TemplateContext& ctx) {
    if (auto* simple = std::get_if<SimpleCommand>(&cmd)) {
        log::info("would run: %s", substitute_template(simple->command, ctx).c_str());
    } else if (auto* shell = std::get_if<ShellCommand>(&cmd)) {
        std::string dir = shell->working_dir ? substitute_template(*shell->working_dir, ctx) : ".";
        log::info("would run in %s: %s", dir.c_str(),
                  substitute_template(shell->command, ctx).c_str());
    } else if (auto* replace = std::get_if<ReplaceCommand>(&cmd)) {
        log::info("would replace /%s/ with '%s' in %s",
                  replace->pattern.c_str(),
                  substitute_template(replace->replacement, ctx).c_str(),
                  substitute_template(replace->file, ctx).c_str());
    }
    return ok_status();
}

const char* sync_outcome_name(SyncOutcome o) {
    switch (o) {
        case SyncOutcome::Disabled: return "disabled";
        case SyncOutcome::SwitchedToMain: return "switched-to-main";
        case SyncOutcome::Ignored: return "ignored";
        case SyncOutcome::NotCreated: return "not-created";
        case SyncOutcome::Switched: return "switched";
    }
    return "unknown";
}

BranchSync::BranchSync(const EffectiveConfig& config, fs::path config_path,
                       LocalStateStore& state, DatabaseAccessor& db,
                       PostCommandRunner* runner)
    : config_(config),
      merged_(config.merged()),
      config_path_(std::move(config_path)),
      state_(state),
      db_(db),
      runner_(runner) {}

Result<SyncOutcome> BranchSync::on_checkout(GitAccessor& git) {
    if (config_.skip_hooks()) {
        log::debug("%s is set, skipping hook", env::kSkipHooks);
        return Result<SyncOutcome>::ok(SyncOutcome::Disabled);
    }
    if (config_.should_exit_early(git)) {
        log::debug("pgbranch disabled, skipping hook");
        return Result<SyncOutcome>::ok(SyncOutcome::Disabled);
    }

    auto branch = git.current_branch();
    if (branch.is_err()) return std::move(branch).error();
    if (!branch.value()) {
        log::debug("detached HEAD, nothing to switch");
        return Result<SyncOutcome>::ok(SyncOutcome::Ignored);
    }
    return handle_git_branch(*branch.value());
}

Result<SyncOutcome> BranchSync::handle_git_branch(const std::string& git_branch) {
    log::info("git hook triggered for branch '%s'", git_branch.c_str());

    if (!should_switch_on_branch(git_branch, merged_)) {
        log::info("git branch '%s' filtered out by auto-switch settings", git_branch.c_str());
        return Result<SyncOutcome>::ok(SyncOutcome::Ignored);
    }

    if (git_branch == merged_.git.main_branch) {
        PGBRANCH_TRY(switch_to_main());
        return Result<SyncOutcome>::ok(SyncOutcome::SwitchedToMain);
    }

    if (!should_create_branch(git_branch, merged_)) {
        log::info("git branch '%s' is configured not to create a database branch",
                  git_branch.c_str());
        return Result<SyncOutcome>::ok(SyncOutcome::NotCreated);
    }

    PGBRANCH_TRY(switch_to(git_branch));
    return Result<SyncOutcome>::ok(SyncOutcome::Switched);
}

Status BranchSync::switch_to(const std::string& branch_name) {
    const std::string normalized = get_normalized_branch_name(branch_name);
    log::info("switching to database branch '%s'", normalized.c_str());

    PGBRANCH_TRY(state_.set_current_branch(config_path_, normalized));

    const std::string db_name = get_database_name(normalized, merged_);
    auto exists = db_.database_exists(db_name);
    if (exists.is_err()) {
        log::warn("could not check database '%s': %s", db_name.c_str(),
                  exists.error().message.c_str());
        log::warn("branch state updated, but the database was not verified");
    } else if (!exists.value()) {
        log::info("creating database '%s' from '%s'", db_name.c_str(),
                  merged_.database.template_database.c_str());
        auto created = db_.create_database(db_name, merged_.database.template_database);
        if (created.is_err()) {
            log::warn("failed to create database '%s': %s", db_name.c_str(),
                      created.error().message.c_str());
            log::warn("branch state updated, but the database operation failed");
        } else if (merged_.behavior.auto_cleanup) {
            auto cleaned = cleanup();
            if (cleaned.is_err()) {
                log::warn("automatic cleanup failed: %s", cleaned.error().message.c_str());
            }
        }
    }

    return run_post_commands(normalized);
}

Status BranchSync::switch_to_main() {
    log::info("switching to main database '%s'",
              merged_.database.template_database.c_str());
    PGBRANCH_TRY(state_.set_current_branch(config_path_, std::string(kMainBranchMarker)));
    return run_post_commands(kMainBranchMarker);
}

Status BranchSync::create_branch(const std::string& branch_name) {
    const std::string normalized = get_normalized_branch_name(branch_name);
    const std::string db_name = get_database_name(normalized, merged_);

    auto exists = db_.database_exists(db_name);
    if (exists.is_err()) return std::move(exists).error();
    if (exists.value()) {
        log::info("database '%s' already exists, skipping creation", db_name.c_str());
    } else {
        auto created = db_.create_database(db_name, merged_.database.template_database);
        if (created.is_err()) {
            PgbranchError err = std::move(created).error();
            err.message = "failed to create database branch '" + db_name + "': " + err.message;
            return err;
        }
        log::info("created database branch '%s'", db_name.c_str());
    }
    return run_post_commands(normalized);
}

Status BranchSync::delete_branch(const std::string& branch_name) {
    const std::string db_name = get_database_name(branch_name, merged_);
    if (db_name == merged_.database.template_database) {
        return PgbranchError{PgbranchError::InvalidArg,
            "refusing to drop template database '" + db_name + "'"};
    }

    auto exists = db_.database_exists(db_name);
    if (exists.is_err()) return std::move(exists).error();
    if (!exists.value()) {
        log::info("database '%s' does not exist, skipping deletion", db_name.c_str());
        return ok_status();
    }

    auto dropped = db_.drop_database(db_name);
    if (dropped.is_err()) {
        PgbranchError err = std::move(dropped).error();
        err.message = "failed to drop database branch '" + db_name + "': " + err.message;
        return err;
    }
    log::info("dropped database branch '%s'", db_name.c_str());
    return ok_status();
}

Result<std::vector<std::string>> BranchSync::cleanup(std::optional<size_t> max_branches) {
    const size_t keep = max_branches.value_or(
        merged_.behavior.max_branches.value_or(kDefaultMaxBranches));

    auto current = state_.get_current_branch(config_path_);
    if (current.is_err()) return std::move(current).error();

    const std::string current_db =
        current.value() ? get_database_name(*current.value(), merged_) : std::string();

    auto found = list_branch_databases_by_age(db_, merged_);
    if (found.is_err()) return std::move(found).error();
    const auto& databases = found.value();

    std::vector<std::string> dropped;
    if (databases.size() <= keep) {
        log::debug("%zu branch database(s), nothing to clean up", databases.size());
        return Result<std::vector<std::string>>::ok(std::move(dropped));
    }

    log::info("cleaning up old branches, keeping %zu most recent", keep);
    const size_t excess = databases.size() - keep;
    for (size_t i = 0; i < excess; ++i) {
        const auto& entry = databases[i];
        if (entry.db_name == current_db) {
            log::info("keeping '%s', it is the current branch", entry.db_name.c_str());
            continue;
        }
        auto status = db_.drop_database(entry.db_name);
        if (status.is_err()) {
            PgbranchError err = std::move(status).error();
            err.message = "failed to drop database branch '" + entry.db_name + "': " + err.message;
            return err;
        }
        log::info("dropped database branch '%s'", entry.db_name.c_str());
        dropped.push_back(entry.branch);
    }
    return Result<std::vector<std::string>>::ok(std::move(dropped));
}

Status BranchSync::run_post_commands(const std::string& branch_name) {
    if (merged_.post_commands.empty()) return ok_status();
    if (!runner_) {
        log::debug("no post command runner, skipping %zu command(s)",
                   merged_.post_commands.size());
        return ok_status();
    }

    TemplateContext ctx = TemplateContext::for_branch(merged_, branch_name);
    size_t index = 0;
    for (const auto& cmd : merged_.post_commands) {
        ++index;
        std::string name = post_command_name(cmd);
        log::debug("post command %zu/%zu: %s", index, merged_.post_commands.size(),
                   name.c_str());

        auto status = runner_->run(cmd, ctx);
        if (status.is_ok()) continue;

        if (post_command_continues_on_error(cmd)) {
            log::warn("post command '%s' failed, continuing: %s", name.c_str(),
                      status.error().message.c_str());
            continue;
        }
        PgbranchError err = std::move(status).error();
        if (err.hint.empty()) {
            err.hint = "set continue_on_error: true on the command to keep going after failures";
        }
        return err;
    }
    return ok_status();
}

Result<std::string> BranchSync::current_branch_or_default(GitAccessor& git) const {
    auto stored = state_.get_current_branch(config_path_);
    if (stored.is_err()) return std::move(stored).error();
    if (stored.value()) return Result<std::string>::ok(*stored.value());

    auto branch = git.current_branch();
    if (branch.is_err() || !branch.value()) {
        log::debug("no git branch available, defaulting to main database");
        return Result<std::string>::ok(kMainBranchMarker);
    }

    const std::string& git_branch = *branch.value();
    if (git_branch == merged_.git.main_branch) {
        return Result<std::string>::ok(kMainBranchMarker);
    }
    if (should_create_branch(git_branch, merged_)) {
        return Result<std::string>::ok(get_normalized_branch_name(git_branch));
    }
    log::debug("git branch '%s' does not match the create filters, defaulting to main",
               git_branch.c_str());
    return Result<std::string>::ok(kMainBranchMarker);
}

} // namespace pgbranch
