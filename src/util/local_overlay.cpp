#include <pgbranch/local_overlay.hpp>
#include <pgbranch/log.hpp>
#include "yaml_fields.hpp"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace pgbranch {

namespace fs = std::filesystem;
using detail::has_value;

// ---------------------------------------------------------------------------
// LocalOverlay::parse
// ---------------------------------------------------------------------------

static Status parse_database(const YAML::Node& node, LocalDatabaseOverlay& db,
                             const std::string& file) {
    detail::read_optional(node, "host", db.host);
    auto port = detail::read_port(node, "port", file);
    if (port.is_err()) return std::move(port).error();
    db.port = port.value();
    detail::read_optional(node, "user", db.user);
    detail::read_optional(node, "password", db.password);
    detail::read_optional(node, "template_database", db.template_database);
    detail::read_optional(node, "database_prefix", db.database_prefix);

    auto auth = detail::read_section(node, "auth", file);
    if (auth.is_err()) return std::move(auth).error();
    const YAML::Node& a = auth.value();
    if (has_value(a)) {
        auto methods = detail::read_auth_methods(a, "methods", file);
        if (methods.is_err()) return std::move(methods).error();
        db.auth.methods = std::move(methods).value();
        detail::read_optional(a, "pgpass_file", db.auth.pgpass_file);
        detail::read_optional(a, "service_name", db.auth.service_name);
        detail::read_optional(a, "prompt_for_password", db.auth.prompt_for_password);
    }
    return ok_status();
}

static Status parse_git(const YAML::Node& node, LocalGitOverlay& git, const std::string& file) {
    detail::read_optional(node, "auto_create_on_branch", git.auto_create_on_branch);
    detail::read_optional(node, "auto_switch_on_branch", git.auto_switch_on_branch);
    detail::read_optional(node, "main_branch", git.main_branch);
    detail::read_optional(node, "auto_create_branch_filter", git.auto_create_branch_filter);
    detail::read_optional(node, "branch_filter_regex", git.branch_filter_regex);

    auto excludes = detail::read_string_list(node, "exclude_branches", file);
    if (excludes.is_err()) return std::move(excludes).error();
    git.exclude_branches = std::move(excludes).value();
    return ok_status();
}

static Status parse_behavior(const YAML::Node& node, LocalBehaviorOverlay& behavior,
                             const std::string& file) {
    detail::read_optional(node, "auto_cleanup", behavior.auto_cleanup);

    auto count = detail::read_count(node, "max_branches", file);
    if (count.is_err()) return std::move(count).error();
    behavior.max_branches = count.value();

    auto strategy = detail::read_naming_strategy(node, "naming_strategy", file);
    if (strategy.is_err()) return std::move(strategy).error();
    behavior.naming_strategy = strategy.value();
    return ok_status();
}

static Status parse_document(const YAML::Node& root, LocalOverlay& lo, const std::string& file) {
    auto db = detail::read_section(root, "database", file);
    if (db.is_err()) return std::move(db).error();
    if (has_value(db.value())) PGBRANCH_TRY(parse_database(db.value(), lo.database, file));

    auto git = detail::read_section(root, "git", file);
    if (git.is_err()) return std::move(git).error();
    if (has_value(git.value())) PGBRANCH_TRY(parse_git(git.value(), lo.git, file));

    auto behavior = detail::read_section(root, "behavior", file);
    if (behavior.is_err()) return std::move(behavior).error();
    if (has_value(behavior.value())) {
        PGBRANCH_TRY(parse_behavior(behavior.value(), lo.behavior, file));
    }

    if (has_value(root["post_commands"])) {
        auto cmds = parse_post_commands(root["post_commands"]);
        if (cmds.is_err()) {
            auto e = std::move(cmds).error();
            e.file = file;
            return e;
        }
        lo.post_commands = std::move(cmds).value();
    }

    detail::read_optional(root, "disabled", lo.disabled);
    auto disabled_branches = detail::read_string_list(root, "disabled_branches", file);
    if (disabled_branches.is_err()) return std::move(disabled_branches).error();
    lo.disabled_branches = std::move(disabled_branches).value();
    return ok_status();
}

Result<LocalOverlay> LocalOverlay::parse(const std::string& yaml_str,
                                         const std::string& source_path) {
    LocalOverlay lo;

    try {
        YAML::Node root = YAML::Load(yaml_str);
        if (!has_value(root)) {
            // Empty file overrides nothing
            return Result<LocalOverlay>::ok(std::move(lo));
        }
        if (!root.IsMap()) {
            return PgbranchError{PgbranchError::Parse,
                "local config YAML must be a mapping at the top level",
                "", source_path, detail::yaml_line(root)};
        }
        PGBRANCH_TRY(parse_document(root, lo, source_path));
    } catch (const YAML::Exception& e) {
        return PgbranchError{PgbranchError::Parse,
            std::string("local config YAML parse error: ") + e.msg,
            "", source_path, e.mark.line >= 0 ? e.mark.line + 1 : 0};
    }

    return Result<LocalOverlay>::ok(std::move(lo));
}

Result<LocalOverlay> LocalOverlay::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PgbranchError{PgbranchError::IO,
            "cannot open local config file: " + path.string(), "", path.string(), 0};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return LocalOverlay::parse(ss.str(), path.string());
}

// ---------------------------------------------------------------------------
// Merge
// ---------------------------------------------------------------------------

template<typename T>
static void override_with(T& target, const std::optional<T>& value) {
    if (value) target = *value;
}

void LocalOverlay::apply_to(BaseConfig& cfg) const {
    auto& db = cfg.database;
    override_with(db.host, database.host);
    override_with(db.port, database.port);
    override_with(db.user, database.user);
    if (database.password) db.password = database.password;
    override_with(db.template_database, database.template_database);
    override_with(db.database_prefix, database.database_prefix);
    override_with(db.auth.methods, database.auth.methods);
    if (database.auth.pgpass_file) db.auth.pgpass_file = database.auth.pgpass_file;
    if (database.auth.service_name) db.auth.service_name = database.auth.service_name;
    override_with(db.auth.prompt_for_password, database.auth.prompt_for_password);

    override_with(cfg.git.auto_create_on_branch, git.auto_create_on_branch);
    override_with(cfg.git.auto_switch_on_branch, git.auto_switch_on_branch);
    override_with(cfg.git.main_branch, git.main_branch);
    if (git.auto_create_branch_filter) {
        cfg.git.auto_create_branch_filter = git.auto_create_branch_filter;
    }
    if (git.branch_filter_regex) cfg.git.branch_filter_regex = git.branch_filter_regex;
    override_with(cfg.git.exclude_branches, git.exclude_branches);

    override_with(cfg.behavior.auto_cleanup, behavior.auto_cleanup);
    if (behavior.max_branches) cfg.behavior.max_branches = behavior.max_branches;
    override_with(cfg.behavior.naming_strategy, behavior.naming_strategy);

    override_with(cfg.post_commands, post_commands);
}

// ---------------------------------------------------------------------------
// Reporting
// ---------------------------------------------------------------------------

std::vector<std::string> LocalOverlay::overridden_fields() const {
    std::vector<std::string> out;
    auto note = [&out](bool set, const char* name) {
        if (set) out.emplace_back(name);
    };

    note(database.host.has_value(), "database.host");
    note(database.port.has_value(), "database.port");
    note(database.user.has_value(), "database.user");
    note(database.password.has_value(), "database.password");
    note(database.template_database.has_value(), "database.template_database");
    note(database.database_prefix.has_value(), "database.database_prefix");
    note(database.auth.methods.has_value(), "database.auth.methods");
    note(database.auth.pgpass_file.has_value(), "database.auth.pgpass_file");
    note(database.auth.service_name.has_value(), "database.auth.service_name");
    note(database.auth.prompt_for_password.has_value(), "database.auth.prompt_for_password");
    note(git.auto_create_on_branch.has_value(), "git.auto_create_on_branch");
    note(git.auto_switch_on_branch.has_value(), "git.auto_switch_on_branch");
    note(git.main_branch.has_value(), "git.main_branch");
    note(git.auto_create_branch_filter.has_value(), "git.auto_create_branch_filter");
    note(git.branch_filter_regex.has_value(), "git.branch_filter_regex");
    note(git.exclude_branches.has_value(), "git.exclude_branches");
    note(behavior.auto_cleanup.has_value(), "behavior.auto_cleanup");
    note(behavior.max_branches.has_value(), "behavior.max_branches");
    note(behavior.naming_strategy.has_value(), "behavior.naming_strategy");
    note(post_commands.has_value(), "post_commands");
    note(disabled.has_value(), "disabled");
    note(disabled_branches.has_value(), "disabled_branches");
    return out;
}

void LocalOverlay::warn_active() const {
    for (const auto& field : overridden_fields()) {
        log::warn("local override active: %s (from %s)", field.c_str(), kLocalConfigFileName);
    }
    if (disabled.value_or(false)) {
        log::warn("pgbranch is disabled by %s", kLocalConfigFileName);
    }
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

fs::path local_overlay_path(const std::optional<fs::path>& base_config_path,
                            const fs::path& cwd) {
    fs::path dir = cwd;
    if (base_config_path && base_config_path->has_parent_path()) {
        dir = base_config_path->parent_path();
    }
    return dir / kLocalConfigFileName;
}

Result<std::optional<LocalOverlay>> discover_local_overlay(
    const std::optional<fs::path>& base_config_path, const fs::path& cwd) {
    fs::path local_file = local_overlay_path(base_config_path, cwd);
    std::error_code ec;
    if (!fs::exists(local_file, ec)) {
        // No local file: nothing to override (not an error)
        return Result<std::optional<LocalOverlay>>::ok(std::nullopt);
    }

    log::debug("loading local overrides from %s", local_file.string().c_str());
    auto lo = LocalOverlay::load(local_file);
    if (lo.is_err()) return std::move(lo).error();
    return Result<std::optional<LocalOverlay>>::ok(std::move(lo).value());
}

} // namespace pgbranch
