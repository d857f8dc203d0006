#include <sheetq/core/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace sheetq {

auto PreviewError::format() const -> std::string {
    switch (kind) {
        case ErrorKind::Validation:
            return fmt::format("validation error: {}", message);
        case ErrorKind::SourceUnavailable:
            return fmt::format("source unavailable: {}", message);
    }
    return message;
}

auto validation_error(std::string message) -> PreviewError {
    return PreviewError{.kind = ErrorKind::Validation, .message = std::move(message)};
}

auto source_unavailable(std::string message) -> PreviewError {
    return PreviewError{.kind = ErrorKind::SourceUnavailable, .message = std::move(message)};
}

auto to_string(ErrorKind kind) -> const char* {
    switch (kind) {
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::SourceUnavailable:
            return "source_unavailable";
    }
    return "unknown";
}

}  // namespace sheetq
