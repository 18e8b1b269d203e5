#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace ulidkit {

struct UlidError {
    enum Code {
        InvalidLength,
        InvalidChar,
        DataTypeOverflow,
        Config,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    // Only meaningful for InvalidChar
    char character = '\0';
    std::size_t position = 0;

    UlidError() = default;
    UlidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UlidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    static UlidError invalid_length(std::size_t got, std::size_t expected);
    static UlidError invalid_char(char c, std::size_t pos);
    static UlidError overflow();

    bool is_decoding_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ulidkit
