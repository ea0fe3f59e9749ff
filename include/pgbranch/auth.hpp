#pragma once

#include <pgbranch/config.hpp>
#include <pgbranch/env_overlay.hpp>
#include <pgbranch/result.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace pgbranch {

// Asks the user for a password; nullopt when none could be read
using PasswordPrompt = std::function<std::optional<std::string>(const std::string& message)>;

// Where resolve_password() looks. Every source is replaceable for tests.
struct PasswordSources {
    EnvLookup env;
    // Directory holding .pgpass and .pg_service.conf
    std::filesystem::path home_dir;
    // Unset means the Prompt method never yields a password
    PasswordPrompt prompt;

    // Process environment and $HOME, no prompt
    static PasswordSources system();
};

// Walk cfg.auth.methods in order and return the first password found.
// nullopt means connect without one (System method, or nothing matched).
// Unreadable pgpass/service files and a Service method without
// auth.service_name are errors.
Result<std::optional<std::string>> resolve_password(const DatabaseConfig& cfg,
                                                    const PasswordSources& sources);

// First matching host:port:database:user:password line. `*` matches any
// value, database is matched against "postgres". Lines starting with '#'
// are comments; "\:" and "\\" escape inside fields. A missing file is nullopt.
Result<std::optional<std::string>> read_pgpass_password(const std::filesystem::path& file,
                                                        const std::string& host,
                                                        uint16_t port,
                                                        const std::string& user);

// `password=` key of the [service] section of a pg_service.conf file
Result<std::optional<std::string>> read_service_password(const std::filesystem::path& file,
                                                         const std::string& service);

} // namespace pgbranch
