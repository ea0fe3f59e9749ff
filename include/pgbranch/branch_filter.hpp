#pragma once

#include <pgbranch/config.hpp>
#include <string>
#include <vector>

namespace pgbranch {

// Match a disable pattern against a branch name.
// Patterns containing '*' are turned into a regex by replacing every '*'
// with ".*" (nothing else is escaped) and searched for anywhere in the name.
// Other patterns require exact equality. A pattern that does not compile
// never matches.
bool branch_pattern_matches(const std::string& pattern, const std::string& branch_name);

// True if any pattern in the list matches
bool any_pattern_matches(const std::vector<std::string>& patterns,
                         const std::string& branch_name);

// Search `regex` in branch_name. The dialect is ECMAScript (std::regex
// default), so inline flags such as `(?i)` do not compile. An invalid regex
// is logged and treated as no match.
bool branch_filter_matches(const std::string& regex, const std::string& branch_name);

// Should a git checkout of this branch create a database branch?
bool should_create_branch(const std::string& branch_name, const BaseConfig& cfg);

// Should a git checkout of this branch switch databases? The main branch
// always passes once auto-switch is on.
bool should_switch_on_branch(const std::string& branch_name, const BaseConfig& cfg);

} // namespace pgbranch
