#pragma once

#include <pgbranch/branch_sync.hpp>
#include <pgbranch/database.hpp>
#include <pgbranch/git.hpp>
#include <algorithm>
#include <initializer_list>
#include <set>
#include <string>
#include <utility>
#include <vector>

// GitAccessor with a scripted answer
struct FakeGit : pgbranch::GitAccessor {
    std::optional<std::string> branch;
    bool fail = false;
    int calls = 0;

    FakeGit() = default;
    explicit FakeGit(std::string b) : branch(std::move(b)) {}

    pgbranch::Result<std::optional<std::string>> current_branch() override {
        ++calls;
        if (fail) {
            return pgbranch::PgbranchError{pgbranch::PgbranchError::Git, "not a git repository"};
        }
        return pgbranch::Result<std::optional<std::string>>::ok(branch);
    }
};

// In-memory server listing databases in creation order; each operation can
// be made to fail
struct FakeDatabase : pgbranch::DatabaseAccessor {
    std::vector<std::string> databases{"postgres", "template0", "template1"};
    std::vector<std::pair<std::string, std::string>> created;  // (name, template)
    std::vector<std::string> dropped;
    bool fail_exists = false;
    bool fail_create = false;
    bool fail_drop = false;

    void add(std::initializer_list<std::string> names) {
        databases.insert(databases.end(), names.begin(), names.end());
    }

    bool has(const std::string& name) const {
        return std::find(databases.begin(), databases.end(), name) != databases.end();
    }

    pgbranch::Result<bool> database_exists(const std::string& name) override {
        if (fail_exists) {
            return pgbranch::PgbranchError{pgbranch::PgbranchError::Database, "connection refused"};
        }
        return pgbranch::Result<bool>::ok(has(name));
    }

    pgbranch::Status create_database(const std::string& name,
                                     const std::string& template_database) override {
        if (fail_create) {
            return pgbranch::PgbranchError{pgbranch::PgbranchError::Database,
                                           "permission denied to create database"};
        }
        created.emplace_back(name, template_database);
        databases.push_back(name);
        return pgbranch::ok_status();
    }

    pgbranch::Status drop_database(const std::string& name) override {
        if (fail_drop) {
            return pgbranch::PgbranchError{pgbranch::PgbranchError::Database,
                                           "database \"" + name + "\" is being accessed by other users"};
        }
        auto it = std::find(databases.begin(), databases.end(), name);
        if (it == databases.end()) {
            return pgbranch::PgbranchError{pgbranch::PgbranchError::Database,
                                           "database \"" + name + "\" does not exist"};
        }
        databases.erase(it);
        dropped.push_back(name);
        return pgbranch::ok_status();
    }

    pgbranch::Result<std::vector<std::string>> list_databases() override {
        return pgbranch::Result<std::vector<std::string>>::ok(databases);
    }
};

// Records what it was asked to run; commands named in fail_on fail
struct RecordingRunner : pgbranch::PostCommandRunner {
    std::vector<std::string> ran;
    std::vector<std::string> db_names;
    std::set<std::string> fail_on;

    pgbranch::Status run(const pgbranch::PostCommand& cmd,
                         const pgbranch::TemplateContext& ctx) override {
        std::string name = pgbranch::post_command_name(cmd);
        ran.push_back(name);
        db_names.push_back(ctx.db_name);
        if (fail_on.count(name)) {
            return pgbranch::PgbranchError{pgbranch::PgbranchError::IO,
                                           "command '" + name + "' exited with status 1"};
        }
        return pgbranch::ok_status();
    }
};
