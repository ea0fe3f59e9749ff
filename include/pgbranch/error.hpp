#pragma once

#include <string>

namespace pgbranch {

struct PgbranchError {
    enum Code {
        IO,
        Parse,
        Config,
        Env,
        Git,
        Database,
        NotFound,
        InvalidArg,
        State
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PgbranchError() = default;
    PgbranchError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PgbranchError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PgbranchError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pgbranch
