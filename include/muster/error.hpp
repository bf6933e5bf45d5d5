#pragma once

#include <string>
#include <vector>

namespace muster {

struct MusterError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        Duplicate,
        Dependency,
        Cycle,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    std::vector<std::string> notes;

    MusterError() = default;
    MusterError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    MusterError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    MusterError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    MusterError& note(std::string n) {
        notes.push_back(std::move(n));
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace muster
