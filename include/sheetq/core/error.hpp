#pragma once

#include <cstdint>
#include <string>

namespace sheetq {

/// Failure categories of a preview call.
enum class ErrorKind : std::uint8_t {
    /// Client-caused: the request must be corrected.
    Validation,
    /// Collaborator-caused: backing row data could not be loaded.
    SourceUnavailable,
};

/// Error returned by a failed preview (and by request decoding).
struct PreviewError {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto validation_error(std::string message) -> PreviewError;
[[nodiscard]] auto source_unavailable(std::string message) -> PreviewError;

[[nodiscard]] auto to_string(ErrorKind kind) -> const char*;

}  // namespace sheetq
