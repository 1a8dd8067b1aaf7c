#pragma once

#include <string>

namespace sortid {

struct SortidError {
    enum Code {
        Range,
        InvalidLength,
        InvalidCharacter,
        Overflow,
        Clock,
        MonotonicOverflow,
        Parse,
        Config,
        IO,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SortidError() = default;
    SortidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SortidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SortidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // True for the three failures a malformed text identifier can produce
    bool is_decode_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sortid
