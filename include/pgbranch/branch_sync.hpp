#pragma once

#include <pgbranch/config.hpp>
#include <pgbranch/database.hpp>
#include <pgbranch/effective_config.hpp>
#include <pgbranch/git.hpp>
#include <pgbranch/local_state.hpp>
#include <pgbranch/post_command.hpp>
#include <pgbranch/template.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pgbranch {

// Executes one post command with placeholders resolved against ctx
class PostCommandRunner {
public:
    virtual ~PostCommandRunner() = default;
    virtual Status run(const PostCommand& cmd, const TemplateContext& ctx) = 0;
};

// Logs the substituted command instead of running it
class DryRunRunner : public PostCommandRunner {
public:
    Status run(const PostCommand& cmd, const TemplateContext& ctx) override;
};

enum class SyncOutcome {
    Disabled,        // PGBRANCH_DISABLED / disabled branch, nothing done
    SwitchedToMain,  // main git branch, template database selected
    Ignored,         // auto-switch off or branch filtered out
    NotCreated,      // switch allowed but creation filtered out
    Switched         // branch database selected (and created if missing)
};

const char* sync_outcome_name(SyncOutcome o);

// Branch databases kept by cleanup() when behavior.max_branches is unset
constexpr size_t kDefaultMaxBranches = 10;

// Keeps the active database branch of one checkout in step with git.
//
// The local state record is written before the database is touched so the
// recorded intent survives a database failure. Database errors during a
// switch are logged and do not fail it; state write errors do.
class BranchSync {
public:
    BranchSync(const EffectiveConfig& config,
               std::filesystem::path config_path,
               LocalStateStore& state,
               DatabaseAccessor& db,
               PostCommandRunner* runner = nullptr);

    // Entry point for the post-checkout/post-merge hook
    Result<SyncOutcome> on_checkout(GitAccessor& git);

    // Decide and act for a git branch name. Global disable is not checked.
    Result<SyncOutcome> handle_git_branch(const std::string& git_branch);

    // Make branch_name the active database branch
    Status switch_to(const std::string& branch_name);

    // Make the template database active
    Status switch_to_main();

    // Stored record, else a default derived from git
    Result<std::string> current_branch_or_default(GitAccessor& git) const;

    // Create the database for branch_name from the template if it is missing,
    // then run post commands. Local state is not touched.
    Status create_branch(const std::string& branch_name);

    // Drop the database for branch_name; a missing database is not an error.
    // The template database is never dropped.
    Status delete_branch(const std::string& branch_name);

    // Drop all but the newest max_branches branch databases (default:
    // behavior.max_branches, else kDefaultMaxBranches). Age is the
    // list_databases() order. The branch recorded as current is always kept.
    // Returns the branches that were dropped.
    Result<std::vector<std::string>> cleanup(std::optional<size_t> max_branches = std::nullopt);

    // Run every configured post command for branch_name (may be "_main")
    Status run_post_commands(const std::string& branch_name);

    const BaseConfig& config() const { return merged_; }

private:
    const EffectiveConfig& config_;
    BaseConfig merged_;
    std::filesystem::path config_path_;
    LocalStateStore& state_;
    DatabaseAccessor& db_;
    PostCommandRunner* runner_;
};

} // namespace pgbranch
