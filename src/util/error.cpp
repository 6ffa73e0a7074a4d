#include <stow/error.hpp>

namespace stow {

const char* StowError::code_name(Code c) {
    switch (c) {
        case IO:               return "IO";
        case Parse:            return "Parse";
        case Config:           return "Config";
        case Manifest:         return "Manifest";
        case NotFound:         return "NotFound";
        case InvalidArg:       return "InvalidArg";
        case Dependency:       return "Dependency";
        case SourceResolution: return "SourceResolution";
        case Cycle:            return "Cycle";
        case NameConflict:     return "NameConflict";
        case FrozenMismatch:   return "FrozenMismatch";
        case Integrity:        return "Integrity";
        case Merge:            return "Merge";
        case LockContention:   return "LockContention";
    }
    return "Unknown";
}

int StowError::exit_code() const {
    switch (code) {
        case InvalidArg:       return 2;
        case Config:           return 3;
        case Parse:            return 4;
        case Manifest:         return 5;
        case NotFound:         return 6;
        case Dependency:       return 7;
        case SourceResolution: return 10;
        case Cycle:            return 11;
        case NameConflict:     return 12;
        case FrozenMismatch:   return 13;
        case Integrity:        return 14;
        case Merge:            return 15;
        case IO:               return 16;
        case LockContention:   return 17;
    }
    return 1;
}

std::string StowError::format() const {
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

} // namespace stow
