#pragma once

#include <pgbranch/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pgbranch {

struct LocalStateEntry {
    std::string config_path;                    // absolute path of .pgbranch.yml
    std::optional<std::string> current_branch;  // "_main" = template database
    std::string updated_at;                     // UTC, ISO-8601
};

// Per-checkout "active branch" records, kept outside the repository so the
// versioned config never changes when switching. One record per config path.
//
// File layout (TOML):
//   [configs."/home/me/app/.pgbranch.yml"]
//   current_branch = "feature_login"
//   updated_at = "2026-01-02T03:04:05Z"
//
// No locking: the last writer wins.
class LocalStateStore {
public:
    explicit LocalStateStore(std::filesystem::path state_file);

    // $XDG_CONFIG_HOME/pgbranch/local_state.toml, else
    // $HOME/.config/pgbranch/local_state.toml
    static std::filesystem::path default_state_path();

    // nullopt when there is no record or the record holds no branch
    Result<std::optional<std::string>> get_current_branch(
        const std::filesystem::path& config_path) const;

    // Create or replace the record for config_path. Other records are kept.
    Status set_current_branch(const std::filesystem::path& config_path,
                              const std::optional<std::string>& branch);

    Result<std::vector<LocalStateEntry>> entries() const;

    const std::filesystem::path& path() const { return state_file_; }

private:
    std::filesystem::path state_file_;
};

// Key under which a config path is stored: absolute and lexically normal
std::string state_key(const std::filesystem::path& config_path);

} // namespace pgbranch
