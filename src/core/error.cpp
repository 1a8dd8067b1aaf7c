#include <sortid/error.hpp>

namespace sortid {

const char* SortidError::code_name(Code c) {
    switch (c) {
        case Range:             return "Range";
        case InvalidLength:     return "InvalidLength";
        case InvalidCharacter:  return "InvalidCharacter";
        case Overflow:          return "Overflow";
        case Clock:             return "Clock";
        case MonotonicOverflow: return "MonotonicOverflow";
        case Parse:             return "Parse";
        case Config:            return "Config";
        case IO:                return "IO";
        case NotFound:          return "NotFound";
        case InvalidArg:        return "InvalidArg";
    }
    return "Unknown";
}

bool SortidError::is_decode_error() const {
    return code == InvalidLength || code == InvalidCharacter || code == Overflow;
}

std::string SortidError::format() const {
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

} // namespace sortid
