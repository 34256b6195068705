#include <revise/error.hpp>

namespace revise {

const char* ReviseError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case InvalidVersion:      return "InvalidVersion";
        case IncompatibleVersion: return "IncompatibleVersion";
        case Migration:           return "Migration";
        case Rollback:            return "Rollback";
        case Config:              return "Config";
        case NotFound:            return "NotFound";
        case InvalidArg:          return "InvalidArg";
        case Validation:          return "Validation";
    }
    return "Unknown";
}

std::string ReviseError::format() const {
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

} // namespace revise
