#pragma once

#include <pgbranch/config.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pgbranch {

// Values available to post commands as {placeholders}
struct TemplateContext {
    std::string branch_name;
    std::string db_name;
    std::string db_host;
    uint16_t db_port = 0;
    std::string db_user;
    std::optional<std::string> db_password;
    std::string template_db;
    std::string prefix;

    static TemplateContext for_branch(const BaseConfig& cfg, const std::string& branch_name);
};

// Replace {branch_name}, {db_name}, {db_host}, {db_port}, {db_user},
// {db_password}, {template_db} and {prefix}. Unknown placeholders, and
// {db_password} when no password is known, are left as written.
std::string substitute_template(const std::string& tmpl, const TemplateContext& ctx);

// (placeholder, value) pairs for display; the password is masked
std::vector<std::pair<std::string, std::string>> template_variables(const TemplateContext& ctx);

} // namespace pgbranch
