#include <pgbranch/error.hpp>

namespace pgbranch {

const char* PgbranchError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Env:        return "Env";
        case Git:        return "Git";
        case Database:   return "Database";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
        case State:      return "State";
    }
    return "Unknown";
}

std::string PgbranchError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace pgbranch
