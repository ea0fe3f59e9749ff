#pragma once

#include <pgbranch/result.hpp>
#include <pgbranch/post_command.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pgbranch {

enum class NamingStrategy { Prefix, Suffix, Replace };

// Order in AuthConfig::methods is the order passwords are looked up in
enum class AuthMethod { Password, Pgpass, Environment, Service, Prompt, System };

const char* naming_strategy_name(NamingStrategy s);
Result<NamingStrategy> parse_naming_strategy(const std::string& s);

const char* auth_method_name(AuthMethod m);
Result<AuthMethod> parse_auth_method(const std::string& s);

struct AuthConfig {
    std::vector<AuthMethod> methods;
    std::optional<std::string> pgpass_file;
    std::optional<std::string> service_name;
    bool prompt_for_password = false;
};

struct DatabaseConfig {
    std::string host;
    uint16_t port = 0;
    std::string user;
    std::optional<std::string> password;
    std::string template_database;
    std::string database_prefix;
    AuthConfig auth;
};

struct GitConfig {
    bool auto_create_on_branch = true;
    bool auto_switch_on_branch = true;
    std::string main_branch;
    std::optional<std::string> auto_create_branch_filter;
    std::optional<std::string> branch_filter_regex;
    std::vector<std::string> exclude_branches;
};

struct BehaviorConfig {
    bool auto_cleanup = false;
    std::optional<size_t> max_branches;
    NamingStrategy naming_strategy = NamingStrategy::Prefix;
};

// Contents of .pgbranch.yml. Keys missing from the file keep their defaults.
struct BaseConfig {
    DatabaseConfig database;
    GitConfig git;
    BehaviorConfig behavior;
    std::vector<PostCommand> post_commands;

    // Built-in defaults used when no file exists
    static BaseConfig defaults();

    // Parse YAML text. `source_path` is attached to errors.
    static Result<BaseConfig> parse(const std::string& yaml_str,
                                    const std::string& source_path = "");

    static Result<BaseConfig> load(const std::filesystem::path& path);

    std::string to_yaml() const;
    Status save(const std::filesystem::path& path) const;
};

extern const char* const kConfigFileNames[2];
extern const char* const kLocalConfigFileName;

// Walk from start_dir to the filesystem root looking for .pgbranch.yml or
// .pgbranch.yaml (in that order per directory). "Not found" is an empty
// optional, not an error.
Result<std::optional<std::filesystem::path>> find_config_file(
    const std::filesystem::path& start_dir);

// Connection and naming fields: non-empty host, user, template database and
// prefix, non-zero port, prefix usable as an identifier fragment
Status validate_database(const BaseConfig& cfg);

// validate_database plus a compilable branch_filter_regex
Status validate(const BaseConfig& cfg);

} // namespace pgbranch
