#include <ghostcomment/error.hpp>

namespace ghostcomment {

const char* GcError::code_name(Code c) {
    switch (c) {
        case Config:    return "CONFIG_ERROR";
        case File:      return "FILE_ERROR";
        case Git:       return "GIT_ERROR";
        case Auth:      return "AUTH_ERROR";
        case Network:   return "NETWORK_ERROR";
        case Api:       return "API_ERROR";
        case RateLimit: return "RATE_LIMIT_ERROR";
    }
    return "UNKNOWN_ERROR";
}

std::string GcError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!cause.empty()) {
        result += "\n  caused by: ";
        result += cause;
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

} // namespace ghostcomment
