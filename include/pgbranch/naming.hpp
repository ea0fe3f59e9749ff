#pragma once

#include <pgbranch/config.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace pgbranch {

// PostgreSQL truncates identifiers longer than this (NAMEDATALEN - 1)
inline constexpr size_t kMaxIdentifierLength = 63;

// Logical branch meaning "no feature branch, use the template database"
inline constexpr const char* kMainBranchMarker = "_main";

// Lowercase, map everything outside [a-z0-9_$] to '_', prefix '_' when the
// result would start with a digit or '$', collapse runs of '_', drop a
// trailing '_'. Empty results become "branch". Idempotent.
std::string sanitize_branch_name(const std::string& branch_name);

// Same as sanitize_branch_name; the name under which a branch is tracked
std::string get_normalized_branch_name(const std::string& branch_name);

// 16-bit hash used to disambiguate truncated names
uint16_t name_hash16(const std::string& name);

// Database name for a git branch under cfg. "_main" and excluded branches map
// to the template database verbatim; everything else is sanitized, combined
// with the prefix per naming strategy, and kept within 63 bytes.
std::string get_database_name(const std::string& branch_name, const BaseConfig& cfg);

// Inverse of the prefix/suffix combination: the sanitized branch part of a
// database created under cfg, or nullopt if db_name does not carry the prefix.
// Under the replace strategy every name is returned unchanged.
std::optional<std::string> extract_branch_name(const std::string& db_name,
                                               const BaseConfig& cfg);

} // namespace pgbranch
