#include <pgbranch/post_command.hpp>
#include <yaml-cpp/yaml.h>

namespace pgbranch {

namespace {

std::string entry_label(size_t index) {
    return "post_commands[" + std::to_string(index) + "]";
}

int node_line(const YAML::Node& node) {
    return node.Mark().line >= 0 ? node.Mark().line + 1 : 0;
}

// Required string field of a command map
Result<std::string> required_string(const YAML::Node& map, const char* key, size_t index) {
    const YAML::Node v = map[key];
    if (!v || v.IsNull()) {
        return PgbranchError{PgbranchError::Parse,
            entry_label(index) + ": missing required field '" + key + "'",
            "", "", node_line(map)};
    }
    if (!v.IsScalar()) {
        return PgbranchError{PgbranchError::Parse,
            entry_label(index) + ": field '" + key + "' must be a string",
            "", "", node_line(v)};
    }
    return Result<std::string>::ok(v.as<std::string>());
}

template<typename T>
void optional_field(const YAML::Node& map, const char* key, std::optional<T>& out) {
    const YAML::Node v = map[key];
    if (v && !v.IsNull()) out = v.as<T>();
}

Result<PostCommand> parse_shell(const YAML::Node& node, size_t index) {
    ShellCommand cmd;
    auto command = required_string(node, "command", index);
    if (command.is_err()) return std::move(command).error();
    cmd.command = std::move(command).value();

    optional_field(node, "name", cmd.name);
    optional_field(node, "working_dir", cmd.working_dir);
    optional_field(node, "continue_on_error", cmd.continue_on_error);
    optional_field(node, "condition", cmd.condition);

    const YAML::Node env = node["environment"];
    if (env && !env.IsNull()) {
        if (!env.IsMap()) {
            return PgbranchError{PgbranchError::Parse,
                entry_label(index) + ": 'environment' must be a mapping of names to values",
                "", "", node_line(env)};
        }
        for (auto it = env.begin(); it != env.end(); ++it) {
            cmd.environment[it->first.as<std::string>()] = it->second.as<std::string>();
        }
    }
    return Result<PostCommand>::ok(PostCommand{std::move(cmd)});
}

Result<PostCommand> parse_replace(const YAML::Node& node, size_t index) {
    const std::string action = node["action"].as<std::string>();
    if (action != "replace") {
        return PgbranchError{PgbranchError::Parse,
            entry_label(index) + ": unknown action '" + action + "'",
            "the only supported action is 'replace'", "", node_line(node)};
    }

    ReplaceCommand cmd;
    auto file = required_string(node, "file", index);
    if (file.is_err()) return std::move(file).error();
    auto pattern = required_string(node, "pattern", index);
    if (pattern.is_err()) return std::move(pattern).error();
    auto replacement = required_string(node, "replacement", index);
    if (replacement.is_err()) return std::move(replacement).error();

    cmd.file = std::move(file).value();
    cmd.pattern = std::move(pattern).value();
    cmd.replacement = std::move(replacement).value();
    optional_field(node, "name", cmd.name);
    optional_field(node, "create_if_missing", cmd.create_if_missing);
    optional_field(node, "continue_on_error", cmd.continue_on_error);
    optional_field(node, "condition", cmd.condition);
    return Result<PostCommand>::ok(PostCommand{std::move(cmd)});
}

} // namespace

Result<PostCommand> parse_post_command(const YAML::Node& node, size_t index) {
    if (node.IsScalar()) {
        return Result<PostCommand>::ok(PostCommand{SimpleCommand{node.as<std::string>()}});
    }

    if (!node.IsMap()) {
        return PgbranchError{PgbranchError::Parse,
            entry_label(index) + ": expected a command string or a mapping",
            "", "", node_line(node)};
    }

    const bool has_action = static_cast<bool>(node["action"]);
    const bool has_command = static_cast<bool>(node["command"]);

    if (has_action && has_command) {
        return PgbranchError{PgbranchError::Parse,
            entry_label(index) + ": ambiguous entry has both 'action' and 'command'",
            "use 'command' for shell commands or 'action: replace' for file edits",
            "", node_line(node)};
    }

    if (has_action) return parse_replace(node, index);
    return parse_shell(node, index);
}

Result<std::vector<PostCommand>> parse_post_commands(const YAML::Node& node) {
    std::vector<PostCommand> cmds;
    if (!node || node.IsNull()) {
        return Result<std::vector<PostCommand>>::ok(std::move(cmds));
    }
    if (!node.IsSequence()) {
        return PgbranchError{PgbranchError::Parse,
            "'post_commands' must be a list", "", "", node_line(node)};
    }

    for (size_t i = 0; i < node.size(); ++i) {
        auto cmd = parse_post_command(node[i], i);
        if (cmd.is_err()) return std::move(cmd).error();
        cmds.push_back(std::move(cmd).value());
    }
    return Result<std::vector<PostCommand>>::ok(std::move(cmds));
}

YAML::Node post_command_to_yaml(const PostCommand& cmd) {
    if (const auto* simple = std::get_if<SimpleCommand>(&cmd)) {
        return YAML::Node(simple->command);
    }

    YAML::Node out(YAML::NodeType::Map);
    if (const auto* shell = std::get_if<ShellCommand>(&cmd)) {
        if (shell->name) out["name"] = *shell->name;
        out["command"] = shell->command;
        if (shell->working_dir) out["working_dir"] = *shell->working_dir;
        if (shell->continue_on_error) out["continue_on_error"] = *shell->continue_on_error;
        if (shell->condition) out["condition"] = *shell->condition;
        if (!shell->environment.empty()) {
            for (const auto& [k, v] : shell->environment) {
                out["environment"][k] = v;
            }
        }
        return out;
    }

    const auto& replace = std::get<ReplaceCommand>(cmd);
    out["action"] = "replace";
    if (replace.name) out["name"] = *replace.name;
    out["file"] = replace.file;
    out["pattern"] = replace.pattern;
    out["replacement"] = replace.replacement;
    if (replace.create_if_missing) out["create_if_missing"] = *replace.create_if_missing;
    if (replace.continue_on_error) out["continue_on_error"] = *replace.continue_on_error;
    if (replace.condition) out["condition"] = *replace.condition;
    return out;
}

std::string post_command_name(const PostCommand& cmd) {
    if (const auto* simple = std::get_if<SimpleCommand>(&cmd)) {
        return simple->command;
    }
    if (const auto* shell = std::get_if<ShellCommand>(&cmd)) {
        return shell->name ? *shell->name : shell->command;
    }
    const auto& replace = std::get<ReplaceCommand>(cmd);
    return replace.name ? *replace.name : "replace in " + replace.file;
}

bool post_command_continues_on_error(const PostCommand& cmd) {
    if (const auto* shell = std::get_if<ShellCommand>(&cmd)) {
        return shell->continue_on_error.value_or(false);
    }
    if (const auto* replace = std::get_if<ReplaceCommand>(&cmd)) {
        return replace->continue_on_error.value_or(false);
    }
    return false;
}

} // namespace pgbranch
