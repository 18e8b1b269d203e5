#include <ulidkit/error.hpp>
#include <cstdio>

namespace ulidkit {

const char* UlidError::code_name(Code c) {
    switch (c) {
        case InvalidLength:    return "InvalidLength";
        case InvalidChar:      return "InvalidChar";
        case DataTypeOverflow: return "DataTypeOverflow";
        case Config:           return "Config";
        case IO:               return "IO";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

UlidError UlidError::invalid_length(std::size_t got, std::size_t expected) {
    return UlidError(InvalidLength, "invalid length",
        "expected " + std::to_string(expected) + " characters, got " +
        std::to_string(got));
}

UlidError UlidError::invalid_char(char c, std::size_t pos) {
    std::string msg = "invalid character ";
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc >= 0x20 && uc < 0x7F) {
        msg += '\'';
        msg += c;
        msg += '\'';
    } else {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "0x%02X", uc);
        msg += buf;
    }
    msg += " at position " + std::to_string(pos);

    UlidError e(InvalidChar, std::move(msg),
        "Crockford Base32 digits are 0-9 and A-Z without U");
    e.character = c;
    e.position = pos;
    return e;
}

UlidError UlidError::overflow() {
    return UlidError(DataTypeOverflow, "data type overflow",
        "the encoded value does not fit the target width");
}

bool UlidError::is_decoding_error() const {
    return code == InvalidLength || code == InvalidChar || code == DataTypeOverflow;
}

std::string UlidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace ulidkit
