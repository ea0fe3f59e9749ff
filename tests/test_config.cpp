#include <catch2/catch.hpp>
#include <pgbranch/config.hpp>
#include "temp_dir.hpp"

using namespace pgbranch;

// ===== Defaults =====

TEST_CASE("defaults are fully populated", "[config]") {
    auto cfg = BaseConfig::defaults();
    REQUIRE(cfg.database.host == "localhost");
    REQUIRE(cfg.database.port == 5432);
    REQUIRE(cfg.database.user == "postgres");
    REQUIRE_FALSE(cfg.database.password.has_value());
    REQUIRE(cfg.database.template_database == "template0");
    REQUIRE(cfg.database.database_prefix == "pgbranch");
    REQUIRE(cfg.database.auth.methods.size() == 4);
    REQUIRE(cfg.database.auth.methods.front() == AuthMethod::Environment);
    REQUIRE(cfg.git.main_branch == "main");
    REQUIRE(cfg.git.auto_create_on_branch);
    REQUIRE(cfg.git.auto_switch_on_branch);
    REQUIRE(cfg.git.exclude_branches == std::vector<std::string>{"main", "master"});
    REQUIRE(cfg.behavior.max_branches == std::optional<size_t>(10));
    REQUIRE(cfg.behavior.naming_strategy == NamingStrategy::Prefix);
    REQUIRE(cfg.post_commands.empty());
    REQUIRE(validate(cfg).is_ok());
}

// ===== Parsing =====

TEST_CASE("parse empty document yields defaults", "[config]") {
    auto r = BaseConfig::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().database.host == "localhost");
    REQUIRE(r.value().git.main_branch == "main");
}

TEST_CASE("parse full document", "[config]") {
    auto r = BaseConfig::parse(R"(
database:
  host: db.internal
  port: 6543
  user: app
  password: secret
  template_database: app_dev
  database_prefix: app
  auth:
    methods: [pgpass, system]
    pgpass_file: /home/me/.pgpass
    prompt_for_password: true
git:
  auto_create_on_branch: false
  auto_switch_on_branch: true
  main_branch: trunk
  branch_filter_regex: "^feature/"
  exclude_branches: [trunk, release]
behavior:
  auto_cleanup: true
  max_branches: 3
  naming_strategy: suffix
post_commands:
  - make migrate
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.database.host == "db.internal");
    REQUIRE(cfg.database.port == 6543);
    REQUIRE(cfg.database.user == "app");
    REQUIRE(cfg.database.password == std::optional<std::string>("secret"));
    REQUIRE(cfg.database.template_database == "app_dev");
    REQUIRE(cfg.database.database_prefix == "app");
    REQUIRE(cfg.database.auth.methods ==
            std::vector<AuthMethod>{AuthMethod::Pgpass, AuthMethod::System});
    REQUIRE(cfg.database.auth.pgpass_file == std::optional<std::string>("/home/me/.pgpass"));
    REQUIRE(cfg.database.auth.prompt_for_password);
    REQUIRE_FALSE(cfg.git.auto_create_on_branch);
    REQUIRE(cfg.git.main_branch == "trunk");
    REQUIRE(cfg.git.branch_filter_regex == std::optional<std::string>("^feature/"));
    REQUIRE(cfg.git.exclude_branches == std::vector<std::string>{"trunk", "release"});
    REQUIRE(cfg.behavior.auto_cleanup);
    REQUIRE(cfg.behavior.max_branches == std::optional<size_t>(3));
    REQUIRE(cfg.behavior.naming_strategy == NamingStrategy::Suffix);
    REQUIRE(cfg.post_commands.size() == 1);
}

TEST_CASE("parse partial document keeps defaults for missing keys", "[config]") {
    auto r = BaseConfig::parse(R"(
database:
  database_prefix: shop
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().database.database_prefix == "shop");
    REQUIRE(r.value().database.host == "localhost");
    REQUIRE(r.value().database.port == 5432);
    REQUIRE(r.value().git.exclude_branches.size() == 2);
}

TEST_CASE("parse ignores legacy current_branch key", "[config]") {
    auto r = BaseConfig::parse(R"(
current_branch: feature_login
database:
  host: legacy-host
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().database.host == "legacy-host");
}

TEST_CASE("explicit null max_branches removes the limit", "[config]") {
    auto r = BaseConfig::parse("behavior:\n  max_branches: ~\n");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().behavior.max_branches.has_value());
}

TEST_CASE("parse malformed YAML reports Parse with file", "[config]") {
    auto r = BaseConfig::parse("database: [unclosed", "/repo/.pgbranch.yml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PgbranchError::Parse);
    REQUIRE(r.error().file == "/repo/.pgbranch.yml");
}

TEST_CASE("parse rejects non-mapping document", "[config]") {
    auto r = BaseConfig::parse("- just\n- a list\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PgbranchError::Parse);
}

TEST_CASE("parse rejects non-mapping section", "[config]") {
    auto r = BaseConfig::parse("git: yes-please\n", "cfg.yml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("'git' must be a mapping") != std::string::npos);
    REQUIRE(r.error().line == 1);
}

TEST_CASE("parse rejects wrongly typed port", "[config]") {
    auto r = BaseConfig::parse("database:\n  port: fivefour\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PgbranchError::Parse);
}

TEST_CASE("parse rejects out of range port", "[config]") {
    auto r = BaseConfig::parse("database:\n  port: 70000\n", "cfg.yml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("out of range") != std::string::npos);
    REQUIRE(r.error().line == 2);
}

TEST_CASE("parse rejects unknown naming strategy", "[config]") {
    auto r = BaseConfig::parse("behavior:\n  naming_strategy: backwards\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("backwards") != std::string::npos);
    REQUIRE(r.error().hint.find("prefix, suffix, replace") != std::string::npos);
}

TEST_CASE("parse rejects unknown auth method", "[config]") {
    auto r = BaseConfig::parse("database:\n  auth:\n    methods: [password, kerberos]\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("kerberos") != std::string::npos);
}

TEST_CASE("post command errors carry the config file", "[config]") {
    auto r = BaseConfig::parse("post_commands:\n  - action: replace\n    file: .env\n",
                               "/repo/.pgbranch.yml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == "/repo/.pgbranch.yml");
    REQUIRE(r.error().message.find("post_commands[0]") != std::string::npos);
}

TEST_CASE("enum names round trip through their parsers", "[config]") {
    for (auto s : {NamingStrategy::Prefix, NamingStrategy::Suffix, NamingStrategy::Replace}) {
        REQUIRE(parse_naming_strategy(naming_strategy_name(s)).value() == s);
    }
    for (auto m : {AuthMethod::Password, AuthMethod::Pgpass, AuthMethod::Environment,
                   AuthMethod::Service, AuthMethod::Prompt, AuthMethod::System}) {
        REQUIRE(parse_auth_method(auth_method_name(m)).value() == m);
    }
    REQUIRE(parse_auth_method("Password").is_err());
}

// ===== Serialization =====

TEST_CASE("to_yaml output parses back to the same config", "[config]") {
    auto cfg = BaseConfig::defaults();
    cfg.database.host = "db.example.com";
    cfg.database.password = "p@ss";
    cfg.git.branch_filter_regex = "^(feature|fix)/";
    cfg.behavior.max_branches.reset();
    cfg.behavior.naming_strategy = NamingStrategy::Replace;
    cfg.post_commands.push_back(SimpleCommand{"echo {db_name}"});
    ReplaceCommand rep;
    rep.file = ".env";
    rep.pattern = "DATABASE_URL=.*";
    rep.replacement = "DATABASE_URL=postgres://{db_host}/{db_name}";
    cfg.post_commands.push_back(rep);

    auto back = BaseConfig::parse(cfg.to_yaml());
    REQUIRE(back.is_ok());
    const auto& b = back.value();
    REQUIRE(b.database.host == "db.example.com");
    REQUIRE(b.database.password == std::optional<std::string>("p@ss"));
    REQUIRE(b.git.branch_filter_regex == cfg.git.branch_filter_regex);
    REQUIRE_FALSE(b.git.auto_create_branch_filter.has_value());
    REQUIRE_FALSE(b.behavior.max_branches.has_value());
    REQUIRE(b.behavior.naming_strategy == NamingStrategy::Replace);
    REQUIRE(b.database.auth.methods == cfg.database.auth.methods);
    REQUIRE(b.post_commands.size() == 2);
    REQUIRE(std::get<ReplaceCommand>(b.post_commands[1]).replacement == rep.replacement);
}

TEST_CASE("save then load", "[config]") {
    TempDir td;
    auto cfg = BaseConfig::defaults();
    cfg.database.database_prefix = "saved";

    auto path = td.path / ".pgbranch.yml";
    REQUIRE(cfg.save(path).is_ok());

    auto loaded = BaseConfig::load(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().database.database_prefix == "saved");
}

TEST_CASE("load missing file is an IO error", "[config]") {
    TempDir td;
    auto r = BaseConfig::load(td.path / "nope.yml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PgbranchError::IO);
}

// ===== Discovery =====

TEST_CASE("find_config_file in the start directory", "[config][discovery]") {
    TempDir td;
    td.write_file(".pgbranch.yml", "");
    auto r = find_config_file(td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::optional<fs::path>(td.path / ".pgbranch.yml"));
}

TEST_CASE("find_config_file walks up to an ancestor", "[config][discovery]") {
    TempDir td;
    td.write_file(".pgbranch.yaml", "");
    fs::create_directories(td.path / "src" / "deep" / "er");

    auto r = find_config_file(td.path / "src" / "deep" / "er");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::optional<fs::path>(td.path / ".pgbranch.yaml"));
}

TEST_CASE("find_config_file prefers .yml over .yaml", "[config][discovery]") {
    TempDir td;
    td.write_file(".pgbranch.yaml", "");
    td.write_file(".pgbranch.yml", "");
    auto r = find_config_file(td.path);
    REQUIRE(r.value() == std::optional<fs::path>(td.path / ".pgbranch.yml"));
}

TEST_CASE("find_config_file takes the nearest file", "[config][discovery]") {
    TempDir td;
    td.write_file(".pgbranch.yml", "");
    td.write_file("service/.pgbranch.yml", "");
    auto r = find_config_file(td.path / "service");
    REQUIRE(r.value() == std::optional<fs::path>(td.path / "service" / ".pgbranch.yml"));
}

TEST_CASE("find_config_file ignores directories with the config name", "[config][discovery]") {
    TempDir td;
    fs::create_directories(td.path / "a" / ".pgbranch.yml");
    td.write_file(".pgbranch.yml", "");
    auto r = find_config_file(td.path / "a");
    REQUIRE(r.value() == std::optional<fs::path>(td.path / ".pgbranch.yml"));
}

TEST_CASE("find_config_file without any file is not an error", "[config][discovery]") {
    TempDir td;
    fs::create_directories(td.path / "empty");
    auto r = find_config_file(td.path / "empty");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_value());
}

// ===== Validation =====

TEST_CASE("validate rejects empty required fields", "[config][validate]") {
    auto cfg = BaseConfig::defaults();

    SECTION("host") { cfg.database.host.clear(); }
    SECTION("user") { cfg.database.user.clear(); }
    SECTION("template database") { cfg.database.template_database.clear(); }
    SECTION("prefix") { cfg.database.database_prefix.clear(); }
    SECTION("port") { cfg.database.port = 0; }

    auto s = validate(cfg);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == PgbranchError::Config);
}

TEST_CASE("validate rejects a prefix that is not an identifier", "[config][validate]") {
    auto cfg = BaseConfig::defaults();
    cfg.database.database_prefix = "My-App";
    auto s = validate(cfg);
    REQUIRE(s.is_err());
    REQUIRE(s.error().message.find("My-App") != std::string::npos);

    cfg.database.database_prefix = "9lives";
    REQUIRE(validate(cfg).is_err());

    cfg.database.database_prefix = "_app$1";
    REQUIRE(validate(cfg).is_ok());
}

TEST_CASE("validate rejects an uncompilable filter regex", "[config][validate]") {
    auto cfg = BaseConfig::defaults();
    cfg.git.branch_filter_regex = "feature/(";
    auto s = validate(cfg);
    REQUIRE(s.is_err());
    REQUIRE(s.error().message.find("branch_filter_regex") != std::string::npos);
}

TEST_CASE("validate_database ignores the filter regex", "[config][validate]") {
    auto cfg = BaseConfig::defaults();
    cfg.git.branch_filter_regex = "feature/(";
    REQUIRE(validate_database(cfg).is_ok());

    cfg.database.database_prefix = "My-App";
    REQUIRE(validate_database(cfg).is_err());
}
