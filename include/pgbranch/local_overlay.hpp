#pragma once

#include <pgbranch/config.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pgbranch {

struct LocalAuthOverlay {
    std::optional<std::vector<AuthMethod>> methods;
    std::optional<std::string> pgpass_file;
    std::optional<std::string> service_name;
    std::optional<bool> prompt_for_password;
};

struct LocalDatabaseOverlay {
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> template_database;
    std::optional<std::string> database_prefix;
    LocalAuthOverlay auth;
};

struct LocalGitOverlay {
    std::optional<bool> auto_create_on_branch;
    std::optional<bool> auto_switch_on_branch;
    std::optional<std::string> main_branch;
    std::optional<std::string> auto_create_branch_filter;
    std::optional<std::string> branch_filter_regex;
    std::optional<std::vector<std::string>> exclude_branches;
};

struct LocalBehaviorOverlay {
    std::optional<bool> auto_cleanup;
    std::optional<size_t> max_branches;
    std::optional<NamingStrategy> naming_strategy;
};

// Developer-specific overrides from .pgbranch.local.yml (kept out of git).
// Every field is optional; unset fields leave the base value alone.
struct LocalOverlay {
    LocalDatabaseOverlay database;
    LocalGitOverlay git;
    LocalBehaviorOverlay behavior;
    // Replaces the base list wholesale when present
    std::optional<std::vector<PostCommand>> post_commands;

    std::optional<bool> disabled;
    // Exact names or '*' patterns
    std::optional<std::vector<std::string>> disabled_branches;

    static Result<LocalOverlay> parse(const std::string& yaml_str,
                                      const std::string& source_path = "");
    static Result<LocalOverlay> load(const std::filesystem::path& path);

    // Apply every set leaf on top of cfg
    void apply_to(BaseConfig& cfg) const;

    // Names of the overridden leaves, e.g. "database.host"
    std::vector<std::string> overridden_fields() const;

    // Warn about active overrides via pgbranch::log::warn
    void warn_active() const;
};

// Where the local overlay lives: next to the base config if one was found,
// else in cwd.
std::filesystem::path local_overlay_path(
    const std::optional<std::filesystem::path>& base_config_path,
    const std::filesystem::path& cwd);

// Load the local overlay if the file exists. Absence is an empty optional.
Result<std::optional<LocalOverlay>> discover_local_overlay(
    const std::optional<std::filesystem::path>& base_config_path,
    const std::filesystem::path& cwd);

} // namespace pgbranch
