#pragma once

#include <string>

namespace revise {

struct ReviseError {
    enum Code {
        IO,
        Parse,
        InvalidVersion,
        IncompatibleVersion,
        Migration,
        Rollback,
        Config,
        NotFound,
        InvalidArg,
        Validation
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ReviseError() = default;
    ReviseError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ReviseError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ReviseError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace revise
