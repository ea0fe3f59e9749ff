#include <pgbranch/auth.hpp>
#include <pgbranch/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <vector>

namespace pgbranch {

namespace fs = std::filesystem;

PasswordSources PasswordSources::system() {
    PasswordSources s;
    s.env = process_env_lookup();
    const char* home = std::getenv("HOME");
    s.home_dir = home ? fs::path(home) : fs::path(".");
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Split a pgpass line on unescaped ':'
static std::vector<std::string> split_pgpass_line(const std::string& line) {
    std::vector<std::string> fields(1);
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            fields.back().push_back(line[++i]);
        } else if (c == ':') {
            fields.emplace_back();
        } else {
            fields.back().push_back(c);
        }
    }
    return fields;
}

static bool pgpass_field_matches(const std::string& field, const std::string& value) {
    return field == "*" || field == value;
}

Result<std::optional<std::string>> read_pgpass_password(const fs::path& file,
                                                        const std::string& host,
                                                        uint16_t port,
                                                        const std::string& user) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    std::ifstream in(file);
    if (!in.is_open()) {
        return PgbranchError{PgbranchError::IO, "cannot read pgpass file: " + file.string()};
    }

    const std::string port_str = std::to_string(port);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty() || line[0] == '#') continue;

        auto f = split_pgpass_line(line);
        if (f.size() != 5) continue;

        if (pgpass_field_matches(f[0], host) && pgpass_field_matches(f[1], port_str) &&
            pgpass_field_matches(f[2], "postgres") && pgpass_field_matches(f[3], user)) {
            return Result<std::optional<std::string>>::ok(f[4]);
        }
    }
    return Result<std::optional<std::string>>::ok(std::nullopt);
}

Result<std::optional<std::string>> read_service_password(const fs::path& file,
                                                         const std::string& service) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }
    std::ifstream in(file);
    if (!in.is_open()) {
        return PgbranchError{PgbranchError::IO, "cannot read service file: " + file.string()};
    }

    bool in_section = false;
    std::string raw;
    while (std::getline(in, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[' && line.back() == ']') {
            in_section = line.substr(1, line.size() - 2) == service;
            continue;
        }
        if (!in_section) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        if (trim(line.substr(0, eq)) == "password") {
            return Result<std::optional<std::string>>::ok(trim(line.substr(eq + 1)));
        }
    }
    return Result<std::optional<std::string>>::ok(std::nullopt);
}

Result<std::optional<std::string>> resolve_password(const DatabaseConfig& cfg,
                                                    const PasswordSources& sources) {
    using R = Result<std::optional<std::string>>;

    for (AuthMethod method : cfg.auth.methods) {
        switch (method) {
            case AuthMethod::Password:
                if (cfg.password) {
                    log::debug("using password from config");
                    return R::ok(cfg.password);
                }
                break;

            case AuthMethod::Environment: {
                if (!sources.env) break;
                if (auto pw = sources.env("PGPASSWORD")) {
                    log::debug("using password from PGPASSWORD");
                    return R::ok(pw);
                }
                std::string host_var = "PGPASSWORD_" + to_upper(cfg.host);
                if (auto pw = sources.env(host_var)) {
                    log::debug("using password from %s", host_var.c_str());
                    return R::ok(pw);
                }
                break;
            }

            case AuthMethod::Pgpass: {
                fs::path file = cfg.auth.pgpass_file ? fs::path(*cfg.auth.pgpass_file)
                                                     : sources.home_dir / ".pgpass";
                auto pw = read_pgpass_password(file, cfg.host, cfg.port, cfg.user);
                if (pw.is_err()) return std::move(pw).error();
                if (pw.value()) {
                    log::debug("using password from %s", file.string().c_str());
                    return pw;
                }
                break;
            }

            case AuthMethod::Service: {
                if (!cfg.auth.service_name) {
                    return PgbranchError{PgbranchError::Config,
                        "auth method 'service' needs database.auth.service_name"};
                }
                fs::path file = sources.home_dir / ".pg_service.conf";
                auto pw = read_service_password(file, *cfg.auth.service_name);
                if (pw.is_err()) return std::move(pw).error();
                if (pw.value()) {
                    log::debug("using password from service '%s'",
                               cfg.auth.service_name->c_str());
                    return pw;
                }
                break;
            }

            case AuthMethod::Prompt: {
                if (!cfg.auth.prompt_for_password || !sources.prompt) break;
                auto pw = sources.prompt("Password for PostgreSQL user '" + cfg.user + "': ");
                if (pw) return R::ok(pw);
                log::warn("could not read password from prompt");
                break;
            }

            case AuthMethod::System:
                // peer/trust/ident authentication, no password sent
                log::debug("using system authentication");
                return R::ok(std::nullopt);
        }
    }

    log::debug("no password found by any auth method");
    return R::ok(std::nullopt);
}

} // namespace pgbranch
