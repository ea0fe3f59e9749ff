#include <pgbranch/branch_filter.hpp>
#include <pgbranch/log.hpp>
#include <algorithm>
#include <regex>

namespace pgbranch {

// ---- Helpers ----

static std::string glob_to_regex(const std::string& pattern) {
    std::string out;
    out.reserve(pattern.size() + 8);
    for (char c : pattern) {
        if (c == '*') {
            out += ".*";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

static bool is_excluded(const std::string& branch_name, const BaseConfig& cfg) {
    const auto& ex = cfg.git.exclude_branches;
    return std::find(ex.begin(), ex.end(), branch_name) != ex.end();
}

// Shared tail of the create/switch decisions
static bool passes_filters(const std::string& branch_name, const BaseConfig& cfg) {
    if (is_excluded(branch_name, cfg)) return false;
    if (cfg.git.branch_filter_regex) {
        return branch_filter_matches(*cfg.git.branch_filter_regex, branch_name);
    }
    return true;
}

// ---- Public API ----

bool branch_pattern_matches(const std::string& pattern, const std::string& branch_name) {
    if (pattern.find('*') == std::string::npos) {
        return pattern == branch_name;
    }

    try {
        std::regex re(glob_to_regex(pattern));
        return std::regex_search(branch_name, re);
    } catch (const std::regex_error& e) {
        log::warn("invalid disabled-branch pattern '%s': %s", pattern.c_str(), e.what());
        return false;
    }
}

bool any_pattern_matches(const std::vector<std::string>& patterns,
                         const std::string& branch_name) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string& p) { return branch_pattern_matches(p, branch_name); });
}

bool branch_filter_matches(const std::string& regex, const std::string& branch_name) {
    try {
        std::regex re(regex);
        return std::regex_search(branch_name, re);
    } catch (const std::regex_error& e) {
        log::warn("invalid branch filter regex '%s': %s", regex.c_str(), e.what());
        return false;
    }
}

bool should_create_branch(const std::string& branch_name, const BaseConfig& cfg) {
    if (!cfg.git.auto_create_on_branch) return false;
    return passes_filters(branch_name, cfg);
}

bool should_switch_on_branch(const std::string& branch_name, const BaseConfig& cfg) {
    if (!cfg.git.auto_switch_on_branch) return false;
    if (branch_name == cfg.git.main_branch) return true;
    return passes_filters(branch_name, cfg);
}

} // namespace pgbranch
