#pragma once
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

namespace ulid {

enum class ErrorKind { Range,
    Length,
    InvalidChar,
    Exhausted,
    Type };

const char* error_kind_name(ErrorKind kind);

// What went wrong with an input. position is the offending index for
// InvalidChar and the observed length for Length.
struct Failure {
    ErrorKind kind { ErrorKind::Range };
    std::string message;
    std::size_t position { 0 };
    char character { '\0' };
};

class UlidError : public std::runtime_error {
public:
    explicit UlidError(Failure failure)
        : std::runtime_error(failure.message)
        , failure_(std::move(failure)) { }

    ErrorKind kind() const { return failure_.kind; }
    const Failure& failure() const { return failure_; }

private:
    Failure failure_;
};

template <class T>
struct Result {
    bool ok { false };
    T value {};
    Failure error {};

    explicit operator bool() const { return ok; }

    // Unwrap or throw the carried failure.
    const T& get() const {
        if (!ok) throw UlidError(error);
        return value;
    }
};

template <class T>
Result<T> success(T value) {
    return { true, std::move(value), {} };
}

template <class T>
Result<T> failure(Failure f) {
    return { false, T {}, std::move(f) };
}

std::string vformat(const char* fmt, va_list args);
std::string format(const char* fmt, ...);

Failure make_failure(ErrorKind kind, const char* fmt, ...);
Failure invalid_char(std::size_t position, char c, const char* what);

[[noreturn]] void error(const std::string& msg, const char* file, int line, ...);

} // namespace ulid

// A helper macro to automatically pass __FILE__ and __LINE__
#define ULID_THROW(msg, ...) ::ulid::error(msg, __FILE__, __LINE__, ##__VA_ARGS__)
