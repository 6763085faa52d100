#pragma once

#include <string>
#include <string_view>

namespace folio {

/**
 * Fatal failure categories. Stored in Error::code so callers can branch
 * without parsing messages.
 */
enum class ErrorCode : int {
    None = 0,
    NotADirectory,
    MissingManifest,
    XmlParsingFailed,
    EncodingError,
    FileReadFailed,
    FileWriteFailed,
    NoDocuments,
    PdfGenerationFailed,
    Cancelled,
    InvalidDestination,
};

/**
 * Error type for Result - a message and an optional code.
 */
struct Error {
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

[[nodiscard]] inline Error make_error(ErrorCode code, std::string detail) {
    return Error{std::move(detail), static_cast<int>(code)};
}

[[nodiscard]] inline ErrorCode error_code_of(const Error& error) noexcept {
    return static_cast<ErrorCode>(error.code);
}

/**
 * "XmlParsingFailed: unexpected end of document"
 */
[[nodiscard]] std::string describe(const Error& error);

} // namespace folio
