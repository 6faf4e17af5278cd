#pragma once

#include <string>

namespace ghostcomment {

struct GcError {
    enum Code {
        Config,
        File,
        Git,
        Auth,
        Network,
        Api,
        RateLimit
    };

    Code code;
    std::string message;
    std::string hint;
    std::string cause;    // underlying OS or library diagnostic
    std::string file;
    int line = 0;

    GcError() = default;
    GcError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    GcError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    GcError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Attach the underlying diagnostic and return *this for chaining
    GcError& caused_by(std::string why) {
        cause = std::move(why);
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ghostcomment
