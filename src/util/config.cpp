#include <pgbranch/config.hpp>
#include <pgbranch/log.hpp>
#include "yaml_fields.hpp"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <regex>
#include <sstream>

namespace pgbranch {

namespace fs = std::filesystem;
using detail::has_value;

const char* const kConfigFileNames[2] = {".pgbranch.yml", ".pgbranch.yaml"};
const char* const kLocalConfigFileName = ".pgbranch.local.yml";

// ---------------------------------------------------------------------------
// Enumerations
// ---------------------------------------------------------------------------

const char* naming_strategy_name(NamingStrategy s) {
    switch (s) {
        case NamingStrategy::Prefix:  return "prefix";
        case NamingStrategy::Suffix:  return "suffix";
        case NamingStrategy::Replace: return "replace";
    }
    return "prefix";
}

Result<NamingStrategy> parse_naming_strategy(const std::string& s) {
    for (auto v : {NamingStrategy::Prefix, NamingStrategy::Suffix, NamingStrategy::Replace}) {
        if (s == naming_strategy_name(v)) return Result<NamingStrategy>::ok(v);
    }
    return PgbranchError{PgbranchError::Parse,
        "unknown naming_strategy '" + s + "'",
        "expected one of: prefix, suffix, replace"};
}

const char* auth_method_name(AuthMethod m) {
    switch (m) {
        case AuthMethod::Password:    return "password";
        case AuthMethod::Pgpass:      return "pgpass";
        case AuthMethod::Environment: return "environment";
        case AuthMethod::Service:     return "service";
        case AuthMethod::Prompt:      return "prompt";
        case AuthMethod::System:      return "system";
    }
    return "password";
}

Result<AuthMethod> parse_auth_method(const std::string& s) {
    for (auto m : {AuthMethod::Password, AuthMethod::Pgpass, AuthMethod::Environment,
                   AuthMethod::Service, AuthMethod::Prompt, AuthMethod::System}) {
        if (s == auth_method_name(m)) return Result<AuthMethod>::ok(m);
    }
    return PgbranchError{PgbranchError::Parse,
        "unknown auth method '" + s + "'",
        "expected one of: password, pgpass, environment, service, prompt, system"};
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------

BaseConfig BaseConfig::defaults() {
    BaseConfig cfg;
    cfg.database.host = "localhost";
    cfg.database.port = 5432;
    cfg.database.user = "postgres";
    cfg.database.template_database = "template0";
    cfg.database.database_prefix = "pgbranch";
    cfg.database.auth.methods = {AuthMethod::Environment, AuthMethod::Pgpass,
                                 AuthMethod::Password, AuthMethod::Prompt};
    cfg.database.auth.prompt_for_password = false;

    cfg.git.auto_create_on_branch = true;
    cfg.git.auto_switch_on_branch = true;
    cfg.git.main_branch = "main";
    cfg.git.exclude_branches = {"main", "master"};

    cfg.behavior.auto_cleanup = false;
    cfg.behavior.max_branches = 10;
    cfg.behavior.naming_strategy = NamingStrategy::Prefix;
    return cfg;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static Status parse_database(const YAML::Node& node, DatabaseConfig& db,
                             const std::string& file) {
    detail::read_field(node, "host", db.host);
    auto port = detail::read_port(node, "port", file);
    if (port.is_err()) return std::move(port).error();
    if (port.value()) db.port = *port.value();
    detail::read_field(node, "user", db.user);
    detail::read_optional(node, "password", db.password);
    detail::read_field(node, "template_database", db.template_database);
    detail::read_field(node, "database_prefix", db.database_prefix);

    auto auth = detail::read_section(node, "auth", file);
    if (auth.is_err()) return std::move(auth).error();
    const YAML::Node& a = auth.value();
    if (has_value(a)) {
        auto methods = detail::read_auth_methods(a, "methods", file);
        if (methods.is_err()) return std::move(methods).error();
        if (methods.value()) db.auth.methods = std::move(*methods.value());
        detail::read_optional(a, "pgpass_file", db.auth.pgpass_file);
        detail::read_optional(a, "service_name", db.auth.service_name);
        detail::read_field(a, "prompt_for_password", db.auth.prompt_for_password);
    }
    return ok_status();
}

static Status parse_git(const YAML::Node& node, GitConfig& git, const std::string& file) {
    detail::read_field(node, "auto_create_on_branch", git.auto_create_on_branch);
    detail::read_field(node, "auto_switch_on_branch", git.auto_switch_on_branch);
    detail::read_field(node, "main_branch", git.main_branch);
    detail::read_optional(node, "auto_create_branch_filter", git.auto_create_branch_filter);
    detail::read_optional(node, "branch_filter_regex", git.branch_filter_regex);

    auto excludes = detail::read_string_list(node, "exclude_branches", file);
    if (excludes.is_err()) return std::move(excludes).error();
    if (excludes.value()) git.exclude_branches = std::move(*excludes.value());
    return ok_status();
}

static Status parse_behavior(const YAML::Node& node, BehaviorConfig& behavior,
                             const std::string& file) {
    detail::read_field(node, "auto_cleanup", behavior.auto_cleanup);

    // An explicit null turns the limit off
    const YAML::Node max = node["max_branches"];
    if (max && max.IsNull()) {
        behavior.max_branches.reset();
    } else {
        auto count = detail::read_count(node, "max_branches", file);
        if (count.is_err()) return std::move(count).error();
        if (count.value()) behavior.max_branches = *count.value();
    }

    auto strategy = detail::read_naming_strategy(node, "naming_strategy", file);
    if (strategy.is_err()) return std::move(strategy).error();
    if (strategy.value()) behavior.naming_strategy = *strategy.value();
    return ok_status();
}

static Status parse_document(const YAML::Node& root, BaseConfig& cfg, const std::string& file) {
    auto db = detail::read_section(root, "database", file);
    if (db.is_err()) return std::move(db).error();
    if (has_value(db.value())) PGBRANCH_TRY(parse_database(db.value(), cfg.database, file));

    auto git = detail::read_section(root, "git", file);
    if (git.is_err()) return std::move(git).error();
    if (has_value(git.value())) PGBRANCH_TRY(parse_git(git.value(), cfg.git, file));

    auto behavior = detail::read_section(root, "behavior", file);
    if (behavior.is_err()) return std::move(behavior).error();
    if (has_value(behavior.value())) {
        PGBRANCH_TRY(parse_behavior(behavior.value(), cfg.behavior, file));
    }

    auto cmds = parse_post_commands(root["post_commands"]);
    if (cmds.is_err()) {
        auto e = std::move(cmds).error();
        e.file = file;
        return e;
    }
    cfg.post_commands = std::move(cmds).value();

    // Deprecated: the active branch is kept in the local state file now
    if (root["current_branch"]) {
        log::debug("ignoring deprecated 'current_branch' key in %s",
                   file.empty() ? "<config>" : file.c_str());
    }
    return ok_status();
}

Result<BaseConfig> BaseConfig::parse(const std::string& yaml_str,
                                     const std::string& source_path) {
    BaseConfig cfg = BaseConfig::defaults();

    try {
        YAML::Node root = YAML::Load(yaml_str);
        if (!has_value(root)) {
            // Empty document: all defaults
            return Result<BaseConfig>::ok(std::move(cfg));
        }
        if (!root.IsMap()) {
            return PgbranchError{PgbranchError::Parse,
                "config YAML must be a mapping at the top level",
                "", source_path, detail::yaml_line(root)};
        }
        PGBRANCH_TRY(parse_document(root, cfg, source_path));
    } catch (const YAML::Exception& e) {
        return PgbranchError{PgbranchError::Parse,
            std::string("config YAML parse error: ") + e.msg,
            "", source_path, e.mark.line >= 0 ? e.mark.line + 1 : 0};
    }

    return Result<BaseConfig>::ok(std::move(cfg));
}

Result<BaseConfig> BaseConfig::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PgbranchError{PgbranchError::IO,
            "cannot open config file: " + path.string(), "", path.string(), 0};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return BaseConfig::parse(ss.str(), path.string());
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

static YAML::Node optional_node(const std::optional<std::string>& v) {
    return v ? YAML::Node(*v) : YAML::Node(YAML::NodeType::Null);
}

std::string BaseConfig::to_yaml() const {
    YAML::Node root;

    YAML::Node db;
    db["host"] = database.host;
    db["port"] = database.port;
    db["user"] = database.user;
    db["password"] = optional_node(database.password);
    db["template_database"] = database.template_database;
    db["database_prefix"] = database.database_prefix;
    YAML::Node auth;
    YAML::Node methods(YAML::NodeType::Sequence);
    for (auto m : database.auth.methods) methods.push_back(auth_method_name(m));
    auth["methods"] = methods;
    auth["pgpass_file"] = optional_node(database.auth.pgpass_file);
    auth["service_name"] = optional_node(database.auth.service_name);
    auth["prompt_for_password"] = database.auth.prompt_for_password;
    db["auth"] = auth;
    root["database"] = db;

    YAML::Node g;
    g["auto_create_on_branch"] = git.auto_create_on_branch;
    g["auto_switch_on_branch"] = git.auto_switch_on_branch;
    g["main_branch"] = git.main_branch;
    g["auto_create_branch_filter"] = optional_node(git.auto_create_branch_filter);
    g["branch_filter_regex"] = optional_node(git.branch_filter_regex);
    YAML::Node excludes(YAML::NodeType::Sequence);
    for (const auto& b : git.exclude_branches) excludes.push_back(b);
    g["exclude_branches"] = excludes;
    root["git"] = g;

    YAML::Node b;
    b["auto_cleanup"] = behavior.auto_cleanup;
    if (behavior.max_branches) {
        b["max_branches"] = static_cast<unsigned long long>(*behavior.max_branches);
    } else {
        b["max_branches"] = YAML::Node(YAML::NodeType::Null);
    }
    b["naming_strategy"] = naming_strategy_name(behavior.naming_strategy);
    root["behavior"] = b;

    YAML::Node cmds(YAML::NodeType::Sequence);
    for (const auto& c : post_commands) cmds.push_back(post_command_to_yaml(c));
    root["post_commands"] = cmds;

    YAML::Emitter out;
    out << root;
    return std::string(out.c_str()) + "\n";
}

Status BaseConfig::save(const fs::path& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return PgbranchError{PgbranchError::IO,
            "cannot write config file: " + path.string()};
    }
    file << to_yaml();
    file.flush();
    if (!file) {
        return PgbranchError{PgbranchError::IO,
            "failed writing config file: " + path.string()};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

Result<std::optional<fs::path>> find_config_file(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return PgbranchError{PgbranchError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        for (const char* name : kConfigFileNames) {
            fs::path candidate = dir / name;
            if (fs::is_regular_file(candidate, ec)) {
                return Result<std::optional<fs::path>>::ok(candidate);
            }
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            // Reached filesystem root
            return Result<std::optional<fs::path>>::ok(std::nullopt);
        }
        dir = parent;
    }
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

static bool is_identifier_fragment(const std::string& s) {
    if (s.empty()) return false;
    char first = s[0];
    if (!((first >= 'a' && first <= 'z') || first == '_')) return false;
    for (char c : s) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '$';
        if (!ok) return false;
    }
    return true;
}

Status validate_database(const BaseConfig& cfg) {
    const auto& db = cfg.database;
    if (db.host.empty()) {
        return PgbranchError{PgbranchError::Config, "database host cannot be empty"};
    }
    if (db.port == 0) {
        return PgbranchError{PgbranchError::Config, "database port must be greater than 0"};
    }
    if (db.user.empty()) {
        return PgbranchError{PgbranchError::Config, "database user cannot be empty"};
    }
    if (db.template_database.empty()) {
        return PgbranchError{PgbranchError::Config, "template database cannot be empty"};
    }
    if (db.database_prefix.empty()) {
        return PgbranchError{PgbranchError::Config, "database prefix cannot be empty"};
    }
    if (!is_identifier_fragment(db.database_prefix)) {
        return PgbranchError{PgbranchError::Config,
            "database prefix '" + db.database_prefix + "' is not a valid identifier",
            "use lowercase letters, digits, '_' or '$', starting with a letter or '_'"};
    }
    return ok_status();
}

Status validate(const BaseConfig& cfg) {
    PGBRANCH_TRY(validate_database(cfg));
    if (cfg.git.branch_filter_regex) {
        try {
            std::regex re(*cfg.git.branch_filter_regex);
        } catch (const std::regex_error& e) {
            return PgbranchError{PgbranchError::Config,
                "invalid branch_filter_regex '" + *cfg.git.branch_filter_regex + "': " + e.what()};
        }
    }
    return ok_status();
}

} // namespace pgbranch
