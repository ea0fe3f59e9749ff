#pragma once

#include <pgbranch/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace YAML {
class Node;
}

namespace pgbranch {

// `- "make migrate"`
struct SimpleCommand {
    std::string command;
};

// `- { command: ..., name: ..., working_dir: ..., environment: {...} }`
struct ShellCommand {
    std::optional<std::string> name;
    std::string command;
    std::optional<std::string> working_dir;
    std::optional<bool> continue_on_error;
    std::optional<std::string> condition;
    std::map<std::string, std::string> environment;
};

// `- { action: replace, file: ..., pattern: ..., replacement: ... }`
struct ReplaceCommand {
    std::optional<std::string> name;
    std::string file;
    std::string pattern;
    std::string replacement;
    std::optional<bool> create_if_missing;
    std::optional<bool> continue_on_error;
    std::optional<std::string> condition;
};

// The variant is chosen by the shape of the YAML node, there is no tag:
// scalar -> Simple, map without `action` -> Shell, map with `action` -> Replace.
using PostCommand = std::variant<SimpleCommand, ShellCommand, ReplaceCommand>;

// Parse one entry of a `post_commands` list. `index` is only used for messages.
Result<PostCommand> parse_post_command(const YAML::Node& node, size_t index);

// Parse a whole `post_commands` sequence. A null node yields an empty list.
Result<std::vector<PostCommand>> parse_post_commands(const YAML::Node& node);

// Build the YAML form of a command (same shape it was parsed from)
YAML::Node post_command_to_yaml(const PostCommand& cmd);

// Display name: explicit name, else the command line, else "replace in <file>"
std::string post_command_name(const PostCommand& cmd);

// Whether a failure of this command should let the remaining ones run
bool post_command_continues_on_error(const PostCommand& cmd);

} // namespace pgbranch
