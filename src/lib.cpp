#include "lib.hpp"
#include <cctype>
#include <sstream>
#include <vector>

namespace ulid {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Range:
            return "range";
        case ErrorKind::Length:
            return "length";
        case ErrorKind::InvalidChar:
            return "invalid_char";
        case ErrorKind::Exhausted:
            return "exhausted";
        case ErrorKind::Type:
            return "type";
    }
    return "unknown";
}

// Two passes: size with a null buffer first, then write.
std::string vformat(const char* fmt, va_list args) {
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    return std::string(buffer.data(), required_size);
}

std::string format(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::string out = vformat(fmt, args);
    va_end(args);
    return out;
}

Failure make_failure(ErrorKind kind, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    Failure f;
    f.kind = kind;
    f.message = vformat(fmt, args);
    va_end(args);
    return f;
}

Failure invalid_char(std::size_t position, char c, const char* what) {
    Failure f;
    f.kind = ErrorKind::InvalidChar;
    f.position = position;
    f.character = c;
    if (std::isprint(static_cast<unsigned char>(c))) {
        f.message = format("%s: invalid character '%c' at position %zu", what, c, position);
    } else {
        f.message = format("%s: invalid character 0x%02X at position %zu", what,
            static_cast<unsigned>(static_cast<unsigned char>(c)), position);
    }
    return f;
}

// Throws std::runtime_error prefixed with the call site.
void error(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);
    std::string text = vformat(msg.c_str(), args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << text;
    throw std::runtime_error(ss.str());
}

} // namespace ulid
