// demo_hook.cpp
//
// Dry run of the git hook: reads the current branch of a checkout, decides
// what pgbranch would do and records it in a scratch state file. No database
// is contacted and no post command is executed.
//
//     ./demo_hook [repo_dir] [--install | --uninstall]
//
// The state file lives next to the binary (demo_state.toml) so the real
// ~/.config/pgbranch/local_state.toml is never touched.

#include <pgbranch/branch_sync.hpp>
#include <pgbranch/database.hpp>
#include <pgbranch/log.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pgbranch;

// Pretends every CREATE DATABASE succeeds; remembers creation order
class DryRunDatabase : public DatabaseAccessor {
public:
    Result<bool> database_exists(const std::string& name) override {
        return Result<bool>::ok(find(name) != created_.end());
    }

    Status create_database(const std::string& name, const std::string& tmpl) override {
        log::info("would run: %s", create_database_sql(name, tmpl).c_str());
        created_.push_back(name);
        return ok_status();
    }

    Status drop_database(const std::string& name) override {
        log::info("would run: %s", drop_database_sql(name).c_str());
        auto it = find(name);
        if (it != created_.end()) created_.erase(it);
        return ok_status();
    }

    Result<std::vector<std::string>> list_databases() override {
        return Result<std::vector<std::string>>::ok(created_);
    }

private:
    std::vector<std::string>::iterator find(const std::string& name) {
        return std::find(created_.begin(), created_.end(), name);
    }

    std::vector<std::string> created_;
};

static int fail(const PgbranchError& e) {
    std::cerr << e.format() << "\n";
    return 1;
}

int main(int argc, char** argv) {
    log::init_from_env();

    fs::path repo = fs::current_path();
    std::string action;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--install" || arg == "--uninstall") {
            action = arg;
        } else {
            repo = arg;
        }
    }

    GitCli git(repo);
    if (action == "--install") {
        auto s = git.install_hooks();
        if (s.is_err()) return fail(s.error());
        std::cout << "hooks installed\n";
        return 0;
    }
    if (action == "--uninstall") {
        auto s = git.uninstall_hooks();
        if (s.is_err()) return fail(s.error());
        std::cout << "hooks removed\n";
        return 0;
    }

    auto loaded = load_effective_config(repo);
    if (loaded.is_err()) return fail(loaded.error());
    auto need = loaded.value().require_config_file();
    if (need.is_err()) return fail(need.error());

    LocalStateStore state(fs::absolute("demo_state.toml"));
    DryRunDatabase db;
    DryRunRunner runner;
    BranchSync sync(loaded.value().config, *loaded.value().config_path, state, db, &runner);

    auto outcome = sync.on_checkout(git);
    if (outcome.is_err()) return fail(outcome.error());
    std::cout << "outcome: " << sync_outcome_name(outcome.value()) << "\n";

    auto current = sync.current_branch_or_default(git);
    if (current.is_err()) return fail(current.error());
    std::cout << "active database branch: " << current.value() << "\n";
    return 0;
}
