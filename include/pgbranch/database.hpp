#pragma once

#include <pgbranch/config.hpp>
#include <pgbranch/result.hpp>
#include <string>
#include <vector>

namespace pgbranch {

// What branch synchronisation needs from a PostgreSQL server.
// Names are the identifiers produced by get_database_name(); implementations
// quote them with quote_identifier(). list_databases() returns databases in
// creation order, oldest first (`SELECT datname FROM pg_database ORDER BY oid`).
class DatabaseAccessor {
public:
    virtual ~DatabaseAccessor() = default;

    virtual Result<bool> database_exists(const std::string& name) = 0;
    virtual Status create_database(const std::string& name,
                                   const std::string& template_database) = 0;
    virtual Status drop_database(const std::string& name) = 0;
    virtual Result<std::vector<std::string>> list_databases() = 0;
};

// "name" with embedded double quotes doubled
std::string quote_identifier(const std::string& name);

std::string create_database_sql(const std::string& name, const std::string& template_database);
std::string drop_database_sql(const std::string& name);

struct BranchDatabase {
    std::string db_name;
    std::string branch;  // as recovered by extract_branch_name()
};

// Databases on the server that belong to cfg, in list_databases() order.
// The template database and PostgreSQL's own databases are never listed.
Result<std::vector<BranchDatabase>> list_branch_databases_by_age(DatabaseAccessor& db,
                                                                 const BaseConfig& cfg);

// Branch part of every database that belongs to cfg, sorted
Result<std::vector<std::string>> list_branch_databases(DatabaseAccessor& db,
                                                       const BaseConfig& cfg);

} // namespace pgbranch
