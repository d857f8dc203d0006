#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace sheetq::cli {

enum class OutputFormat : std::uint8_t {
    Json,
    Table,
};

[[nodiscard]] auto parse_output_format(std::string_view text) -> std::optional<OutputFormat>;

/// Process exit codes of the preview tool.
enum ExitCode : int {
    kExitOk = 0,
    /// Unreadable request or manifest, or a malformed manifest.
    kExitIo = 1,
    kExitValidation = 2,
    kExitSourceUnavailable = 3,
};

/// Configuration for one preview run.
struct PreviewConfig {
    bool verbose = false;
    /// Manifest describing the sheet catalog and its CSV files.
    std::string catalog_path;
    /// Request JSON file; "-" reads the request from `in`.
    std::string request_path;
    OutputFormat format = OutputFormat::Json;
    bool infer_numbers = false;
    /// Null spec for CSV cells, e.g. "<empty>,NA".
    std::string null_spec;
};

/// Route spdlog's default logger to stderr so diagnostics never mix with the
/// preview written to stdout, and set the level from `verbose`.
void configure_logging(bool verbose);

/// Load the manifest and request, run the preview and write the result (or
/// the error) to `out`. Diagnostics that are not part of the output go to
/// `err`. Returns an ExitCode.
[[nodiscard]] auto run(const PreviewConfig& config, std::istream& in, std::ostream& out,
                       std::ostream& err) -> int;

}  // namespace sheetq::cli
