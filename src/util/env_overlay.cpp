#include <pgbranch/env_overlay.hpp>
#include <pgbranch/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace pgbranch {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Result<bool> parse_env_bool(const std::string& var, const std::string& value) {
    const std::string v = to_lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return Result<bool>::ok(true);
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return Result<bool>::ok(false);
    }
    return PgbranchError{PgbranchError::Env,
        "invalid boolean value '" + value + "' for " + var,
        "use one of: true, false, 1, 0, yes, no, on, off"};
}

std::vector<std::string> split_pattern_list(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string entry = trim(value.substr(start, comma - start));
        if (!entry.empty()) out.push_back(std::move(entry));
        start = comma + 1;
    }
    return out;
}

// Lenient: anything that is not a valid port reads as unset
static std::optional<uint16_t> parse_port(const std::string& value) {
    const std::string v = trim(value);
    if (v.empty() || v.size() > 5) return std::nullopt;
    if (!std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    unsigned long port = std::stoul(v);
    if (port > 65535) return std::nullopt;
    return static_cast<uint16_t>(port);
}

static Status read_bool(const EnvLookup& lookup, const char* var, std::optional<bool>& out) {
    auto raw = lookup(var);
    if (!raw) return ok_status();
    auto b = parse_env_bool(var, *raw);
    if (b.is_err()) return std::move(b).error();
    out = b.value();
    return ok_status();
}

Result<EnvOverlay> EnvOverlay::from_lookup(const EnvLookup& lookup) {
    EnvOverlay eo;

    PGBRANCH_TRY(read_bool(lookup, env::kDisabled, eo.disabled));
    PGBRANCH_TRY(read_bool(lookup, env::kSkipHooks, eo.skip_hooks));
    PGBRANCH_TRY(read_bool(lookup, env::kAutoCreate, eo.auto_create));
    PGBRANCH_TRY(read_bool(lookup, env::kAutoSwitch, eo.auto_switch));
    PGBRANCH_TRY(read_bool(lookup, env::kCurrentBranchDisabled, eo.current_branch_disabled));

    eo.branch_filter_regex = lookup(env::kBranchFilterRegex);
    eo.database_host = lookup(env::kDatabaseHost);
    eo.database_user = lookup(env::kDatabaseUser);
    eo.database_password = lookup(env::kDatabasePassword);
    eo.database_prefix = lookup(env::kDatabasePrefix);

    if (auto port = lookup(env::kDatabasePort)) {
        eo.database_port = parse_port(*port);
        if (!eo.database_port) {
            log::debug("ignoring non-numeric %s='%s'", env::kDatabasePort, port->c_str());
        }
    }

    if (auto list = lookup(env::kDisabledBranches)) {
        eo.disabled_branches = split_pattern_list(*list);
    }

    return Result<EnvOverlay>::ok(std::move(eo));
}

EnvLookup process_env_lookup() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

Result<EnvOverlay> EnvOverlay::from_env() {
    return from_lookup(process_env_lookup());
}

void EnvOverlay::apply_to(BaseConfig& cfg) const {
    if (database_host) cfg.database.host = *database_host;
    if (database_port) cfg.database.port = *database_port;
    if (database_user) cfg.database.user = *database_user;
    if (database_password) cfg.database.password = database_password;
    if (database_prefix) cfg.database.database_prefix = *database_prefix;

    if (auto_create) cfg.git.auto_create_on_branch = *auto_create;
    if (auto_switch) cfg.git.auto_switch_on_branch = *auto_switch;
    if (branch_filter_regex) cfg.git.branch_filter_regex = branch_filter_regex;
}

} // namespace pgbranch
