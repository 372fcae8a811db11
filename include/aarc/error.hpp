#pragma once

#include <string>

namespace aarc {

struct AarcError {
    enum Code {
        IO,
        Parse,
        Config,
        Archive,
        NotFound,
        Cancelled,
        Execution,
        Network,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    AarcError() = default;
    AarcError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    AarcError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    AarcError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace aarc
