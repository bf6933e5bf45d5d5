#include <muster/error.hpp>

namespace muster {

const char* MusterError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case Duplicate:  return "Duplicate";
        case Dependency: return "Dependency";
        case Cycle:      return "Cycle";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string MusterError::format() const {
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

    for (const auto& n : notes) {
        result += "\n  = note: ";
        result += n;
    }

    return result;
}

} // namespace muster
