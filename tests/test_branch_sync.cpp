#include <catch2/catch.hpp>
#include <pgbranch/branch_sync.hpp>
#include "fakes.hpp"
#include "temp_dir.hpp"

using namespace pgbranch;

static EnvOverlay no_env() {
    return EnvOverlay::from_lookup([](const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    }).value();
}

static EnvOverlay env_with(const std::string& name, const std::string& value) {
    return EnvOverlay::from_lookup([name, value](const std::string& n) -> std::optional<std::string> {
        if (n == name) return value;
        return std::nullopt;
    }).value();
}

static BaseConfig sync_config() {
    auto cfg = BaseConfig::defaults();
    cfg.database.database_prefix = "app";
    cfg.database.template_database = "app_dev";
    cfg.git.main_branch = "main";
    cfg.git.exclude_branches = {"main", "staging"};
    return cfg;
}

// Everything a BranchSync needs, wired to fakes
struct SyncFixture {
    TempDir td;
    fs::path config_path;
    LocalStateStore state;
    FakeDatabase db;
    RecordingRunner runner;
    EffectiveConfig config;

    explicit SyncFixture(BaseConfig base = sync_config(), EnvOverlay env = no_env())
        : config_path(td.path / ".pgbranch.yml"),
          state(td.path / "state" / "local_state.toml"),
          config(std::move(base), std::nullopt, std::move(env)) {}

    BranchSync make() { return BranchSync(config, config_path, state, db, &runner); }

    std::optional<std::string> recorded() {
        return state.get_current_branch(config_path).value();
    }
};

// ===== handle_git_branch =====

TEST_CASE("feature branch creates its database and records it", "[branch_sync]") {
    SyncFixture f;
    auto sync = f.make();

    auto r = sync.handle_git_branch("Feature/Login");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == SyncOutcome::Switched);
    REQUIRE(f.recorded() == std::optional<std::string>("feature_login"));
    REQUIRE(f.db.created.size() == 1);
    REQUIRE(f.db.created[0] == std::make_pair(std::string("app_feature_login"),
                                              std::string("app_dev")));
}

TEST_CASE("existing database is not created again", "[branch_sync]") {
    SyncFixture f;
    f.db.add({"app_feature_login"});
    auto sync = f.make();

    REQUIRE(sync.handle_git_branch("feature/login").value() == SyncOutcome::Switched);
    REQUIRE(f.db.created.empty());
    REQUIRE(f.recorded() == std::optional<std::string>("feature_login"));
}

TEST_CASE("main branch switches to the template database", "[branch_sync]") {
    auto cfg = sync_config();
    cfg.git.branch_filter_regex = "^feature/";
    SyncFixture f(cfg);
    auto sync = f.make();

    REQUIRE(sync.handle_git_branch("main").value() == SyncOutcome::SwitchedToMain);
    REQUIRE(f.recorded() == std::optional<std::string>("_main"));
    REQUIRE(f.db.created.empty());
}

TEST_CASE("filtered branch is ignored and state is untouched", "[branch_sync]") {
    auto cfg = sync_config();
    cfg.git.branch_filter_regex = "^feature/";
    SyncFixture f(cfg);
    auto sync = f.make();

    REQUIRE(sync.handle_git_branch("chore/deps").value() == SyncOutcome::Ignored);
    REQUIRE(sync.handle_git_branch("staging").value() == SyncOutcome::Ignored);
    REQUIRE_FALSE(f.recorded().has_value());
}

TEST_CASE("auto_switch off ignores every branch", "[branch_sync]") {
    SyncFixture f(sync_config(), env_with("PGBRANCH_AUTO_SWITCH", "false"));
    auto sync = f.make();
    REQUIRE(sync.handle_git_branch("main").value() == SyncOutcome::Ignored);
    REQUIRE(sync.handle_git_branch("feature/x").value() == SyncOutcome::Ignored);
}

TEST_CASE("auto_create off switches without creating", "[branch_sync]") {
    SyncFixture f(sync_config(), env_with("PGBRANCH_AUTO_CREATE", "no"));
    auto sync = f.make();

    REQUIRE(sync.handle_git_branch("feature/x").value() == SyncOutcome::NotCreated);
    REQUIRE(f.db.created.empty());
    REQUIRE_FALSE(f.recorded().has_value());
}

// ===== Failure handling =====

TEST_CASE("database failure keeps the recorded branch", "[branch_sync]") {
    SyncFixture f;
    f.db.fail_create = true;
    auto sync = f.make();

    auto r = sync.handle_git_branch("feature/x");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == SyncOutcome::Switched);
    REQUIRE(f.recorded() == std::optional<std::string>("feature_x"));
}

TEST_CASE("unreachable database keeps the recorded branch", "[branch_sync]") {
    SyncFixture f;
    f.db.fail_exists = true;
    auto sync = f.make();

    REQUIRE(sync.switch_to("feature/x").is_ok());
    REQUIRE(f.db.created.empty());
    REQUIRE(f.recorded() == std::optional<std::string>("feature_x"));
}

TEST_CASE("state write failure is fatal and skips the database", "[branch_sync]") {
    SyncFixture f;
    f.td.write_file("state", "not a directory");
    auto sync = f.make();

    auto s = sync.switch_to("feature/x");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == PgbranchError::IO);
    REQUIRE(f.db.created.empty());
    REQUIRE(f.runner.ran.empty());
}

// ===== Post commands =====

TEST_CASE("post commands run with the branch context", "[branch_sync]") {
    auto cfg = sync_config();
    cfg.post_commands = {SimpleCommand{"make migrate"}, SimpleCommand{"make seed"}};
    SyncFixture f(cfg);
    auto sync = f.make();

    REQUIRE(sync.switch_to("feature/x").is_ok());
    REQUIRE(f.runner.ran == std::vector<std::string>{"make migrate", "make seed"});
    REQUIRE(f.runner.db_names == std::vector<std::string>{"app_feature_x", "app_feature_x"});

    f.runner.db_names.clear();
    REQUIRE(sync.switch_to_main().is_ok());
    REQUIRE(f.runner.db_names == std::vector<std::string>{"app_dev", "app_dev"});
}

TEST_CASE("failing post command stops the sequence", "[branch_sync]") {
    auto cfg = sync_config();
    cfg.post_commands = {SimpleCommand{"first"}, SimpleCommand{"broken"}, SimpleCommand{"last"}};
    SyncFixture f(cfg);
    f.runner.fail_on = {"broken"};
    auto sync = f.make();

    auto s = sync.switch_to("feature/x");
    REQUIRE(s.is_err());
    REQUIRE(s.error().message.find("broken") != std::string::npos);
    REQUIRE_FALSE(s.error().hint.empty());
    REQUIRE(f.runner.ran == std::vector<std::string>{"first", "broken"});
    // The switch itself already happened
    REQUIRE(f.recorded() == std::optional<std::string>("feature_x"));
}

TEST_CASE("continue_on_error lets the sequence go on", "[branch_sync]") {
    auto cfg = sync_config();
    ShellCommand flaky;
    flaky.name = "flaky";
    flaky.command = "./flaky.sh";
    flaky.continue_on_error = true;
    cfg.post_commands = {flaky, SimpleCommand{"last"}};
    SyncFixture f(cfg);
    f.runner.fail_on = {"flaky"};
    auto sync = f.make();

    REQUIRE(sync.switch_to("feature/x").is_ok());
    REQUIRE(f.runner.ran == std::vector<std::string>{"flaky", "last"});
}

TEST_CASE("without a runner post commands are skipped", "[branch_sync]") {
    auto cfg = sync_config();
    cfg.post_commands = {SimpleCommand{"make migrate"}};
    SyncFixture f(cfg);
    BranchSync sync(f.config, f.config_path, f.state, f.db);
    REQUIRE(sync.switch_to("feature/x").is_ok());
}

TEST_CASE("dry run runner accepts every command shape", "[branch_sync]") {
    DryRunRunner runner;
    auto ctx = TemplateContext::for_branch(sync_config(), "feature/x");
    ReplaceCommand rep;
    rep.file = ".env";
    rep.pattern = "DB=.*";
    rep.replacement = "DB={db_name}";
    ShellCommand shell;
    shell.command = "echo {db_name}";

    REQUIRE(runner.run(SimpleCommand{"echo {branch_name}"}, ctx).is_ok());
    REQUIRE(runner.run(shell, ctx).is_ok());
    REQUIRE(runner.run(rep, ctx).is_ok());
}

// ===== on_checkout =====

TEST_CASE("on_checkout reads the branch from git", "[branch_sync]") {
    SyncFixture f;
    auto sync = f.make();
    FakeGit git("feature/from-git");

    REQUIRE(sync.on_checkout(git).value() == SyncOutcome::Switched);
    REQUIRE(f.recorded() == std::optional<std::string>("feature_from_git"));
}

TEST_CASE("on_checkout exits early when disabled", "[branch_sync]") {
    SyncFixture f(sync_config(), env_with("PGBRANCH_DISABLED", "true"));
    auto sync = f.make();
    FakeGit git("feature/x");

    REQUIRE(sync.on_checkout(git).value() == SyncOutcome::Disabled);
    REQUIRE_FALSE(f.recorded().has_value());
}

TEST_CASE("on_checkout exits early on a disabled branch", "[branch_sync]") {
    SyncFixture f(sync_config(), env_with("PGBRANCH_DISABLED_BRANCHES", "experiment/*"));
    auto sync = f.make();
    FakeGit git("experiment/a");

    REQUIRE(sync.on_checkout(git).value() == SyncOutcome::Disabled);
    REQUIRE(f.db.created.empty());
}

TEST_CASE("on_checkout honours PGBRANCH_SKIP_HOOKS", "[branch_sync]") {
    SyncFixture f(sync_config(), env_with("PGBRANCH_SKIP_HOOKS", "1"));
    auto sync = f.make();
    FakeGit git("feature/x");

    REQUIRE(sync.on_checkout(git).value() == SyncOutcome::Disabled);
    REQUIRE(git.calls == 0);
}

TEST_CASE("on_checkout ignores a detached HEAD", "[branch_sync]") {
    SyncFixture f;
    auto sync = f.make();
    FakeGit detached;
    REQUIRE(sync.on_checkout(detached).value() == SyncOutcome::Ignored);
}

TEST_CASE("on_checkout propagates git errors", "[branch_sync]") {
    SyncFixture f;
    auto sync = f.make();
    FakeGit broken;
    broken.fail = true;
    auto r = sync.on_checkout(broken);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PgbranchError::Git);
}

// ===== current_branch_or_default =====

TEST_CASE("stored record wins over git", "[branch_sync]") {
    SyncFixture f;
    REQUIRE(f.state.set_current_branch(f.config_path, std::string("stored")).is_ok());
    auto sync = f.make();
    FakeGit git("feature/other");
    REQUIRE(sync.current_branch_or_default(git).value() == "stored");
}

TEST_CASE("default follows git when nothing is stored", "[branch_sync]") {
    auto cfg = sync_config();
    cfg.git.branch_filter_regex = "^feature/";
    SyncFixture f(cfg);
    auto sync = f.make();

    FakeGit on_main("main");
    FakeGit on_feature("feature/Login");
    FakeGit on_chore("chore/x");
    FakeGit broken;
    broken.fail = true;

    REQUIRE(sync.current_branch_or_default(on_main).value() == "_main");
    REQUIRE(sync.current_branch_or_default(on_feature).value() == "feature_login");
    REQUIRE(sync.current_branch_or_default(on_chore).value() == "_main");
    REQUIRE(sync.current_branch_or_default(broken).value() == "_main");
}

TEST_CASE("sync_outcome_name covers every outcome", "[branch_sync]") {
    REQUIRE(std::string(sync_outcome_name(SyncOutcome::Disabled)) == "disabled");
    REQUIRE(std::string(sync_outcome_name(SyncOutcome::SwitchedToMain)) == "switched-to-main");
    REQUIRE(std::string(sync_outcome_name(SyncOutcome::Ignored)) == "ignored");
    REQUIRE(std::string(sync_outcome_name(SyncOutcome::NotCreated)) == "not-created");
    REQUIRE(std::string(sync_outcome_name(SyncOutcome::Switched)) == "switched");
}

// ===== create_branch / delete_branch =====

TEST_CASE("create_branch creates from the template and runs post commands", "[branch_sync][lifecycle]") {
    auto cfg = sync_config();
    cfg.post_commands = {SimpleCommand{"make migrate"}};
    SyncFixture f(cfg);
    auto sync = f.make();

    REQUIRE(sync.create_branch("Feature/Cart").is_ok());
    REQUIRE(f.db.created.size() == 1);
    REQUIRE(f.db.created[0] == std::make_pair(std::string("app_feature_cart"),
                                              std::string("app_dev")));
    REQUIRE(f.runner.db_names == std::vector<std::string>{"app_feature_cart"});
    REQUIRE_FALSE(f.recorded().has_value());
}

TEST_CASE("create_branch skips an existing database", "[branch_sync][lifecycle]") {
    SyncFixture f;
    f.db.add({"app_feature_cart"});
    auto sync = f.make();

    REQUIRE(sync.create_branch("feature/cart").is_ok());
    REQUIRE(f.db.created.empty());
}

TEST_CASE("create_branch reports database failures", "[branch_sync][lifecycle]") {
    auto cfg = sync_config();
    cfg.post_commands = {SimpleCommand{"make migrate"}};
    SyncFixture f(cfg);
    f.db.fail_create = true;
    auto sync = f.make();

    auto s = sync.create_branch("feature/cart");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == PgbranchError::Database);
    REQUIRE(s.error().message.find("app_feature_cart") != std::string::npos);
    REQUIRE(f.runner.ran.empty());
}

TEST_CASE("delete_branch drops the branch database", "[branch_sync][lifecycle]") {
    SyncFixture f;
    f.db.add({"app_feature_cart"});
    auto sync = f.make();

    REQUIRE(sync.delete_branch("feature/cart").is_ok());
    REQUIRE(f.db.dropped == std::vector<std::string>{"app_feature_cart"});
    REQUIRE_FALSE(f.db.has("app_feature_cart"));

    // Already gone
    REQUIRE(sync.delete_branch("feature/cart").is_ok());
    REQUIRE(f.db.dropped.size() == 1);
}

TEST_CASE("delete_branch never drops the template database", "[branch_sync][lifecycle]") {
    SyncFixture f;
    f.db.add({"app_dev"});
    auto sync = f.make();

    for (const char* name : {"main", "_main", "staging"}) {
        auto s = sync.delete_branch(name);
        REQUIRE(s.is_err());
        REQUIRE(s.error().code == PgbranchError::InvalidArg);
    }
    REQUIRE(f.db.dropped.empty());
}

TEST_CASE("delete_branch reports drop failures", "[branch_sync][lifecycle]") {
    SyncFixture f;
    f.db.add({"app_feature_cart"});
    f.db.fail_drop = true;
    auto sync = f.make();

    auto s = sync.delete_branch("feature/cart");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == PgbranchError::Database);
}

// ===== cleanup =====

TEST_CASE("cleanup keeps the newest branch databases", "[branch_sync][cleanup]") {
    SyncFixture f;
    f.db.add({"app_dev", "app_one", "other_db", "app_two", "app_three", "app_four"});
    auto sync = f.make();

    auto r = sync.cleanup(2);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"one", "two"});
    REQUIRE(f.db.dropped == std::vector<std::string>{"app_one", "app_two"});
    REQUIRE(f.db.has("app_dev"));
    REQUIRE(f.db.has("other_db"));
    REQUIRE(f.db.has("app_four"));
}

TEST_CASE("cleanup falls back to max_branches then the default", "[branch_sync][cleanup]") {
    auto cfg = sync_config();
    cfg.behavior.max_branches = 1;
    SyncFixture f(cfg);
    f.db.add({"app_a", "app_b", "app_c"});
    REQUIRE(f.make().cleanup().value() == std::vector<std::string>{"a", "b"});

    auto unset = sync_config();
    unset.behavior.max_branches.reset();
    SyncFixture g(unset);
    for (int i = 0; i < 12; ++i) g.db.add({"app_b" + std::to_string(i)});
    REQUIRE(g.make().cleanup().value() == std::vector<std::string>{"b0", "b1"});
}

TEST_CASE("cleanup keeps the current branch", "[branch_sync][cleanup]") {
    SyncFixture f;
    f.db.add({"app_old", "app_mid", "app_new"});
    REQUIRE(f.state.set_current_branch(f.config_path, std::string("old")).is_ok());
    auto sync = f.make();

    REQUIRE(sync.cleanup(1).value() == std::vector<std::string>{"mid"});
    REQUIRE(f.db.has("app_old"));
    REQUIRE(f.db.has("app_new"));
}

TEST_CASE("cleanup with nothing to drop", "[branch_sync][cleanup]") {
    SyncFixture f;
    f.db.add({"app_a"});
    auto r = f.make().cleanup(5);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
    REQUIRE(f.db.dropped.empty());
}

TEST_CASE("auto_cleanup trims after a new database is created", "[branch_sync][cleanup]") {
    auto cfg = sync_config();
    cfg.behavior.auto_cleanup = true;
    cfg.behavior.max_branches = 2;
    SyncFixture f(cfg);
    f.db.add({"app_a", "app_b"});
    auto sync = f.make();

    REQUIRE(sync.handle_git_branch("feature/c").value() == SyncOutcome::Switched);
    REQUIRE(f.db.dropped == std::vector<std::string>{"app_a"});
    REQUIRE(f.db.has("app_feature_c"));
}
