#include <pgbranch/database.hpp>
#include <pgbranch/naming.hpp>
#include <algorithm>

namespace pgbranch {

std::string quote_identifier(const std::string& name) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    for (char c : name) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string create_database_sql(const std::string& name, const std::string& template_database) {
    return "CREATE DATABASE " + quote_identifier(name) +
           " WITH TEMPLATE " + quote_identifier(template_database);
}

std::string drop_database_sql(const std::string& name) {
    return "DROP DATABASE " + quote_identifier(name);
}

static bool is_system_database(const std::string& name) {
    return name == "postgres" || name == "template0" || name == "template1";
}

Result<std::vector<BranchDatabase>> list_branch_databases_by_age(DatabaseAccessor& db,
                                                                 const BaseConfig& cfg) {
    auto all = db.list_databases();
    if (all.is_err()) return std::move(all).error();

    std::vector<BranchDatabase> out;
    for (const auto& name : all.value()) {
        if (name == cfg.database.template_database || is_system_database(name)) continue;
        if (auto branch = extract_branch_name(name, cfg)) {
            out.push_back(BranchDatabase{name, *branch});
        }
    }
    return Result<std::vector<BranchDatabase>>::ok(std::move(out));
}

Result<std::vector<std::string>> list_branch_databases(DatabaseAccessor& db,
                                                       const BaseConfig& cfg) {
    auto found = list_branch_databases_by_age(db, cfg);
    if (found.is_err()) return std::move(found).error();

    std::vector<std::string> branches;
    for (const auto& entry : found.value()) branches.push_back(entry.branch);
    std::sort(branches.begin(), branches.end());
    return Result<std::vector<std::string>>::ok(std::move(branches));
}

} // namespace pgbranch
