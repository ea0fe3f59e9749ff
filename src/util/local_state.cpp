#include <pgbranch/local_state.hpp>
#include <pgbranch/log.hpp>
#include <toml++/toml.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>

namespace pgbranch {

namespace fs = std::filesystem;

LocalStateStore::LocalStateStore(fs::path state_file)
    : state_file_(std::move(state_file)) {}

fs::path LocalStateStore::default_state_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return fs::path(xdg) / "pgbranch" / "local_state.toml";
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        log::warn("neither XDG_CONFIG_HOME nor HOME is set, keeping branch state under /tmp");
        home = "/tmp";
    }
    return fs::path(home) / ".config" / "pgbranch" / "local_state.toml";
}

std::string state_key(const fs::path& config_path) {
    std::error_code ec;
    fs::path abs = fs::absolute(config_path, ec);
    if (ec) abs = config_path;
    return abs.lexically_normal().string();
}

static std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

// Read the whole state file; a missing file is an empty table
static Result<toml::table> read_state(const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Result<toml::table>::ok(toml::table{});
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return PgbranchError{PgbranchError::IO,
            "cannot open local state file: " + file.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    try {
        return Result<toml::table>::ok(toml::parse(ss.str(), file.string()));
    } catch (const toml::parse_error& e) {
        return PgbranchError{PgbranchError::State,
            std::string("local state file is corrupt: ") + std::string(e.description()),
            "delete it to start over; it only records the active branch per checkout",
            file.string(), static_cast<int>(e.source().begin.line)};
    }
}

Result<std::optional<std::string>> LocalStateStore::get_current_branch(
    const fs::path& config_path) const {
    auto doc = read_state(state_file_);
    if (doc.is_err()) return std::move(doc).error();

    const std::string key = state_key(config_path);
    const toml::table* configs = doc.value()["configs"].as_table();
    if (!configs) return Result<std::optional<std::string>>::ok(std::nullopt);

    const toml::table* entry = (*configs)[key].as_table();
    if (!entry) return Result<std::optional<std::string>>::ok(std::nullopt);

    auto branch = (*entry)["current_branch"].value<std::string>();
    if (!branch || branch->empty()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    return Result<std::optional<std::string>>::ok(std::string(*branch));
}

Status LocalStateStore::set_current_branch(const fs::path& config_path,
                                           const std::optional<std::string>& branch) {
    auto doc = read_state(state_file_);
    if (doc.is_err()) return std::move(doc).error();
    toml::table& root = doc.value();

    if (!root["configs"].as_table()) {
        root.insert_or_assign("configs", toml::table{});
    }
    toml::table& configs = *root["configs"].as_table();

    toml::table entry;
    if (branch && !branch->empty()) entry.insert("current_branch", *branch);
    entry.insert("updated_at", utc_timestamp());
    configs.insert_or_assign(state_key(config_path), std::move(entry));

    std::error_code ec;
    fs::create_directories(state_file_.parent_path(), ec);
    if (ec) {
        return PgbranchError{PgbranchError::IO,
            "cannot create state directory " + state_file_.parent_path().string() +
            ": " + ec.message()};
    }

    // Write beside the target and rename so a crash never leaves half a file
    fs::path tmp = state_file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return PgbranchError{PgbranchError::IO,
                "cannot write local state file: " + tmp.string()};
        }
        out << root << "\n";
        out.close();
        if (!out) {
            return PgbranchError{PgbranchError::IO,
                "failed writing local state file: " + tmp.string()};
        }
    }
    fs::rename(tmp, state_file_, ec);
    if (ec) {
        return PgbranchError{PgbranchError::IO,
            "cannot replace local state file " + state_file_.string() + ": " + ec.message()};
    }

    log::debug("recorded branch '%s' for %s",
               branch ? branch->c_str() : "", state_key(config_path).c_str());
    return ok_status();
}

Result<std::vector<LocalStateEntry>> LocalStateStore::entries() const {
    auto doc = read_state(state_file_);
    if (doc.is_err()) return std::move(doc).error();

    std::vector<LocalStateEntry> out;
    const toml::table* configs = doc.value()["configs"].as_table();
    if (!configs) return Result<std::vector<LocalStateEntry>>::ok(std::move(out));

    for (auto&& [key, node] : *configs) {
        const toml::table* tbl = node.as_table();
        if (!tbl) continue;
        LocalStateEntry e;
        e.config_path = std::string(key.str());
        if (auto b = (*tbl)["current_branch"].value<std::string>(); b && !b->empty()) {
            e.current_branch = *b;
        }
        e.updated_at = (*tbl)["updated_at"].value_or(std::string{});
        out.push_back(std::move(e));
    }
    return Result<std::vector<LocalStateEntry>>::ok(std::move(out));
}

} // namespace pgbranch
