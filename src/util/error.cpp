#include <penv/error.hpp>

namespace penv {

const char* PenvError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case Version:             return "Version";
        case Config:              return "Config";
        case Checksum:            return "ChecksumMismatch";
        case Network:             return "FetchFailed";
        case NotFound:            return "NotFound";
        case NoReleases:          return "NoReleases";
        case DuplicateAlias:      return "DuplicateAlias";
        case UnknownAlias:        return "UnknownAlias";
        case VersionNotInstalled: return "VersionNotInstalled";
        case ActivationFailed:    return "ActivationFailed";
        case InitFailed:          return "InitFailed";
        case InUse:               return "InUse";
        case Lock:                return "Lock";
        case InvalidArg:          return "InvalidArg";
    }
    return "Unknown";
}

PenvError PenvError::context(const std::string& what) const {
    PenvError e = *this;
    e.message = what + ": " + message;
    return e;
}

std::string PenvError::format() const {
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

} // namespace penv
