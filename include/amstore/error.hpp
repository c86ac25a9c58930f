/// @file error.hpp
/// @brief Error taxonomy and the exception that carries it.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace amstore {

/// Categories of failure reported by the engine.
enum class ErrorKind : std::uint8_t {
    parse_error,     ///< Malformed path string or JSON input.
    not_found,       ///< Path absent on read, or no document at the key.
    type_mismatch,   ///< Node variant disagrees with the operation.
    range_error,     ///< List index or splice bounds out of range.
    decode_error,    ///< Corrupt or truncated snapshot/change bytes.
    invalid_diff,    ///< Malformed unified diff, or one that does not match.
    invalid_change,  ///< A decodable change that cannot be accepted.
};

constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::parse_error:    return "parse_error";
        case ErrorKind::not_found:      return "not_found";
        case ErrorKind::type_mismatch:  return "type_mismatch";
        case ErrorKind::range_error:    return "range_error";
        case ErrorKind::decode_error:   return "decode_error";
        case ErrorKind::invalid_diff:   return "invalid_diff";
        case ErrorKind::invalid_change: return "invalid_change";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Thrown by every public operation that fails.
///
/// what() renders as "<kind>: <message>".
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace amstore
