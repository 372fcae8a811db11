#include <aarc/error.hpp>

namespace aarc {

const char* AarcError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Archive:    return "Archive";
        case NotFound:   return "NotFound";
        case Cancelled:  return "Cancelled";
        case Execution:  return "Execution";
        case Network:    return "Network";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string AarcError::format() const {
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

} // namespace aarc
