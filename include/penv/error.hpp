#pragma once

#include <string>

namespace penv {

struct PenvError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        Checksum,
        Network,
        NotFound,
        NoReleases,
        DuplicateAlias,
        UnknownAlias,
        VersionNotInstalled,
        ActivationFailed,
        InitFailed,
        InUse,
        Lock,
        InvalidArg
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PenvError() = default;
    PenvError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PenvError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PenvError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Same error with extra context prepended to the message
    PenvError context(const std::string& what) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace penv
