#pragma once

#include <string>

namespace stow {

struct StowError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        NotFound,
        InvalidArg,
        Dependency,
        SourceResolution,
        Cycle,
        NameConflict,
        FrozenMismatch,
        Integrity,
        Merge,
        LockContention
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    StowError() = default;
    StowError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    StowError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    StowError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Process exit status for this error; distinct and non-zero per code.
    int exit_code() const;
};

} // namespace stow
