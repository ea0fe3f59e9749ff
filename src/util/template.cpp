#include <pgbranch/template.hpp>
#include <pgbranch/naming.hpp>

namespace pgbranch {

TemplateContext TemplateContext::for_branch(const BaseConfig& cfg,
                                            const std::string& branch_name) {
    TemplateContext ctx;
    ctx.branch_name = branch_name;
    ctx.db_name = get_database_name(branch_name, cfg);
    ctx.db_host = cfg.database.host;
    ctx.db_port = cfg.database.port;
    ctx.db_user = cfg.database.user;
    ctx.db_password = cfg.database.password;
    ctx.template_db = cfg.database.template_database;
    ctx.prefix = cfg.database.database_prefix;
    return ctx;
}

// Value for a placeholder name, nullopt when it should stay as written
static std::optional<std::string> lookup(const std::string& name, const TemplateContext& ctx) {
    if (name == "branch_name") return ctx.branch_name;
    if (name == "db_name") return ctx.db_name;
    if (name == "db_host") return ctx.db_host;
    if (name == "db_port") return std::to_string(ctx.db_port);
    if (name == "db_user") return ctx.db_user;
    if (name == "db_password") return ctx.db_password;
    if (name == "template_db") return ctx.template_db;
    if (name == "prefix") return ctx.prefix;
    return std::nullopt;
}

std::string substitute_template(const std::string& tmpl, const TemplateContext& ctx) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        if (tmpl[i] != '{') {
            out.push_back(tmpl[i++]);
            continue;
        }

        size_t close = tmpl.find('}', i + 1);
        if (close == std::string::npos) {
            // Unclosed brace: copy the rest verbatim
            out.append(tmpl, i, std::string::npos);
            break;
        }

        std::string name = tmpl.substr(i + 1, close - i - 1);
        if (auto value = lookup(name, ctx)) {
            out += *value;
            i = close + 1;
        } else {
            // Not one of ours (could be shell "${VAR}" or JSON); keep the '{'
            out.push_back('{');
            ++i;
        }
    }

    return out;
}

std::vector<std::pair<std::string, std::string>> template_variables(const TemplateContext& ctx) {
    return {
        {"{branch_name}", ctx.branch_name},
        {"{db_name}", ctx.db_name},
        {"{db_host}", ctx.db_host},
        {"{db_port}", std::to_string(ctx.db_port)},
        {"{db_user}", ctx.db_user},
        {"{db_password}", ctx.db_password ? "********" : "(not set)"},
        {"{template_db}", ctx.template_db},
        {"{prefix}", ctx.prefix},
    };
}

} // namespace pgbranch
