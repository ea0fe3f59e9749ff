#pragma once

// Field readers shared by the base config and local overlay parsers.
// Readers that can fail on content return Result; plain type mismatches
// surface as YAML::Exception and are converted by the caller.

#include <pgbranch/config.hpp>
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>
#include <vector>

namespace pgbranch::detail {

inline int yaml_line(const YAML::Node& node) {
    return node.Mark().line >= 0 ? node.Mark().line + 1 : 0;
}

inline bool has_value(const YAML::Node& node) {
    return node && !node.IsNull();
}

inline PgbranchError field_error(const std::string& msg, const std::string& file,
                                 const YAML::Node& node, std::string hint = "") {
    return PgbranchError{PgbranchError::Parse, msg, std::move(hint), file, yaml_line(node)};
}

template<typename T>
void read_field(const YAML::Node& map, const char* key, T& out) {
    const YAML::Node v = map[key];
    if (has_value(v)) out = v.as<T>();
}

template<typename T>
void read_optional(const YAML::Node& map, const char* key, std::optional<T>& out) {
    const YAML::Node v = map[key];
    if (has_value(v)) out = v.as<T>();
}

// A nested mapping such as `database:`; undefined when absent
inline Result<YAML::Node> read_section(const YAML::Node& root, const char* key,
                                       const std::string& file) {
    const YAML::Node v = root[key];
    if (has_value(v) && !v.IsMap()) {
        return field_error(std::string("'") + key + "' must be a mapping", file, v);
    }
    return Result<YAML::Node>::ok(v);
}

inline Result<std::optional<uint16_t>> read_port(const YAML::Node& map, const char* key,
                                                 const std::string& file) {
    const YAML::Node v = map[key];
    if (!has_value(v)) return Result<std::optional<uint16_t>>::ok(std::nullopt);

    long long port = v.as<long long>();
    if (port < 1 || port > 65535) {
        return field_error("port " + std::to_string(port) + " is out of range",
                           file, v, "use a TCP port between 1 and 65535");
    }
    return Result<std::optional<uint16_t>>::ok(static_cast<uint16_t>(port));
}

inline Result<std::optional<size_t>> read_count(const YAML::Node& map, const char* key,
                                                const std::string& file) {
    const YAML::Node v = map[key];
    if (!has_value(v)) return Result<std::optional<size_t>>::ok(std::nullopt);

    long long n = v.as<long long>();
    if (n < 0) {
        return field_error(std::string("'") + key + "' cannot be negative", file, v);
    }
    return Result<std::optional<size_t>>::ok(static_cast<size_t>(n));
}

inline Result<std::optional<std::vector<std::string>>> read_string_list(
    const YAML::Node& map, const char* key, const std::string& file) {
    using Ret = Result<std::optional<std::vector<std::string>>>;
    const YAML::Node v = map[key];
    if (!has_value(v)) return Ret::ok(std::nullopt);
    if (!v.IsSequence()) {
        return field_error(std::string("'") + key + "' must be a list of strings", file, v);
    }
    std::vector<std::string> out;
    for (const auto& item : v) {
        out.push_back(item.as<std::string>());
    }
    return Ret::ok(std::move(out));
}

inline Result<std::optional<NamingStrategy>> read_naming_strategy(
    const YAML::Node& map, const char* key, const std::string& file) {
    using Ret = Result<std::optional<NamingStrategy>>;
    const YAML::Node v = map[key];
    if (!has_value(v)) return Ret::ok(std::nullopt);

    auto s = parse_naming_strategy(v.as<std::string>());
    if (s.is_err()) {
        auto e = std::move(s).error();
        return field_error(e.message, file, v, e.hint);
    }
    return Ret::ok(s.value());
}

inline Result<std::optional<std::vector<AuthMethod>>> read_auth_methods(
    const YAML::Node& map, const char* key, const std::string& file) {
    using Ret = Result<std::optional<std::vector<AuthMethod>>>;
    auto names = read_string_list(map, key, file);
    if (names.is_err()) return std::move(names).error();
    if (!names.value()) return Ret::ok(std::nullopt);

    std::vector<AuthMethod> methods;
    for (const auto& name : *names.value()) {
        auto m = parse_auth_method(name);
        if (m.is_err()) {
            auto e = std::move(m).error();
            return field_error(e.message, file, map[key], e.hint);
        }
        methods.push_back(m.value());
    }
    return Ret::ok(std::move(methods));
}

} // namespace pgbranch::detail
