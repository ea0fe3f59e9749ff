#include <pgbranch/naming.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace pgbranch {

static bool is_identifier_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '$';
}

std::string sanitize_branch_name(const std::string& branch_name) {
    std::string mapped;
    mapped.reserve(branch_name.size() + 1);
    for (char raw : branch_name) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        mapped.push_back(is_identifier_char(c) ? c : '_');
    }

    // Identifiers start with a letter or '_'
    if (!mapped.empty() && (std::isdigit(static_cast<unsigned char>(mapped[0])) ||
                            mapped[0] == '$')) {
        mapped.insert(mapped.begin(), '_');
    }

    std::string out;
    out.reserve(mapped.size());
    for (char c : mapped) {
        if (c == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(c);
    }

    if (!out.empty() && out.back() == '_') out.pop_back();

    if (out.empty()) out = "branch";
    return out;
}

std::string get_normalized_branch_name(const std::string& branch_name) {
    return sanitize_branch_name(branch_name);
}

uint16_t name_hash16(const std::string& name) {
    uint64_t hash = 14695981039346656037ull; // FNV-1a offset basis
    for (unsigned char c : name) {
        hash ^= static_cast<uint64_t>(c);
        hash *= 1099511628211ull; // FNV prime
    }
    // Fold to 16 bits so every input byte influences the suffix
    hash ^= hash >> 32;
    hash ^= hash >> 16;
    return static_cast<uint16_t>(hash & 0xFFFF);
}

static std::string fit_identifier(const std::string& name) {
    if (name.size() <= kMaxIdentifierLength) return name;

    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "_%04x", static_cast<unsigned>(name_hash16(name)));
    const size_t keep = kMaxIdentifierLength - 5;
    return name.substr(0, keep) + suffix;
}

static bool is_excluded(const std::string& branch_name, const BaseConfig& cfg) {
    const auto& ex = cfg.git.exclude_branches;
    return std::find(ex.begin(), ex.end(), branch_name) != ex.end();
}

std::string get_database_name(const std::string& branch_name, const BaseConfig& cfg) {
    if (branch_name == kMainBranchMarker || is_excluded(branch_name, cfg)) {
        return cfg.database.template_database;
    }

    const std::string sanitized = sanitize_branch_name(branch_name);
    const std::string& prefix = cfg.database.database_prefix;

    std::string combined;
    switch (cfg.behavior.naming_strategy) {
        case NamingStrategy::Prefix:
            combined = prefix + "_" + sanitized;
            break;
        case NamingStrategy::Suffix:
            combined = sanitized + "_" + prefix;
            break;
        case NamingStrategy::Replace:
            combined = sanitized;
            break;
    }
    return fit_identifier(combined);
}

std::optional<std::string> extract_branch_name(const std::string& db_name,
                                               const BaseConfig& cfg) {
    const std::string& prefix = cfg.database.database_prefix;
    switch (cfg.behavior.naming_strategy) {
        case NamingStrategy::Prefix: {
            const std::string head = prefix + "_";
            if (db_name.size() > head.size() && db_name.compare(0, head.size(), head) == 0) {
                return db_name.substr(head.size());
            }
            return std::nullopt;
        }
        case NamingStrategy::Suffix: {
            const std::string tail = "_" + prefix;
            if (db_name.size() > tail.size() &&
                db_name.compare(db_name.size() - tail.size(), tail.size(), tail) == 0) {
                return db_name.substr(0, db_name.size() - tail.size());
            }
            return std::nullopt;
        }
        case NamingStrategy::Replace:
            return db_name;
    }
    return std::nullopt;
}

} // namespace pgbranch
