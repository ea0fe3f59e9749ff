#pragma once

#include <pgbranch/config.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pgbranch {

// Returns the value of an environment variable, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Lookup backed by std::getenv
EnvLookup process_env_lookup();

// Recognized variables
namespace env {
inline constexpr const char* kDisabled = "PGBRANCH_DISABLED";
inline constexpr const char* kSkipHooks = "PGBRANCH_SKIP_HOOKS";
inline constexpr const char* kAutoCreate = "PGBRANCH_AUTO_CREATE";
inline constexpr const char* kAutoSwitch = "PGBRANCH_AUTO_SWITCH";
inline constexpr const char* kCurrentBranchDisabled = "PGBRANCH_CURRENT_BRANCH_DISABLED";
inline constexpr const char* kBranchFilterRegex = "PGBRANCH_BRANCH_FILTER_REGEX";
inline constexpr const char* kDatabaseHost = "PGBRANCH_DATABASE_HOST";
inline constexpr const char* kDatabasePort = "PGBRANCH_DATABASE_PORT";
inline constexpr const char* kDatabaseUser = "PGBRANCH_DATABASE_USER";
inline constexpr const char* kDatabasePassword = "PGBRANCH_DATABASE_PASSWORD";
inline constexpr const char* kDatabasePrefix = "PGBRANCH_DATABASE_PREFIX";
inline constexpr const char* kDisabledBranches = "PGBRANCH_DISABLED_BRANCHES";
} // namespace env

// Values read from PGBRANCH_* environment variables. Highest precedence layer.
struct EnvOverlay {
    std::optional<bool> disabled;
    std::optional<bool> skip_hooks;
    std::optional<bool> auto_create;
    std::optional<bool> auto_switch;
    std::optional<bool> current_branch_disabled;
    std::optional<std::string> branch_filter_regex;
    std::optional<std::string> database_host;
    std::optional<uint16_t> database_port;
    std::optional<std::string> database_user;
    std::optional<std::string> database_password;
    std::optional<std::string> database_prefix;
    std::optional<std::vector<std::string>> disabled_branches;

    // Read from the process environment
    static Result<EnvOverlay> from_env();

    // Read through an arbitrary lookup (tests pass a map)
    static Result<EnvOverlay> from_lookup(const EnvLookup& lookup);

    // Apply the database and git overrides on top of cfg
    void apply_to(BaseConfig& cfg) const;
};

// true|1|yes|on and false|0|no|off, case-insensitive. Anything else is an
// Env error naming the variable and the value.
Result<bool> parse_env_bool(const std::string& var, const std::string& value);

// Split on ',' and trim each entry; empty entries are dropped
std::vector<std::string> split_pattern_list(const std::string& value);

} // namespace pgbranch
