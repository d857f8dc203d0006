#include <sheetq/cli/preview.hpp>

#include <sheetq/codec/json.hpp>
#include <sheetq/query/print.hpp>
#include <sheetq/query/service.hpp>
#include <sheetq/source/manifest.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <utility>

namespace sheetq::cli {

namespace {

auto read_request(const std::string& path, std::istream& in) -> std::optional<std::string> {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>{in}, {});
    }
    std::ifstream input{path};
    if (!input) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>{input}, {});
}

auto exit_code(ErrorKind kind) -> int {
    return kind == ErrorKind::SourceUnavailable ? kExitSourceUnavailable : kExitValidation;
}

auto report(const PreviewError& error, OutputFormat format, std::ostream& out) -> int {
    if (format == OutputFormat::Json) {
        out << codec::serialize_error(error).dump(2) << "\n";
    } else {
        out << "error: " << error.format() << "\n";
    }
    return exit_code(error.kind);
}

}  // namespace

void configure_logging(bool verbose) {
    auto logger = spdlog::get("sheetq");
    if (!logger) {
        logger = spdlog::stderr_color_mt("sheetq");
    }
    spdlog::set_default_logger(std::move(logger));
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

auto parse_output_format(std::string_view text) -> std::optional<OutputFormat> {
    if (text == "json") {
        return OutputFormat::Json;
    }
    if (text == "table") {
        return OutputFormat::Table;
    }
    return std::nullopt;
}

auto run(const PreviewConfig& config, std::istream& in, std::ostream& out, std::ostream& err)
    -> int {
    if (config.catalog_path.empty()) {
        err << "error: no catalog manifest given (--catalog or SHEETQ_CATALOG)\n";
        return kExitIo;
    }

    source::CsvOptions options;
    options.infer_numbers = config.infer_numbers;
    source::apply_null_spec(options, config.null_spec);

    auto manifest = source::load_manifest(config.catalog_path, std::move(options));
    if (!manifest) {
        err << "error: " << manifest.error() << "\n";
        return kExitIo;
    }

    auto text = read_request(config.request_path, in);
    if (!text) {
        err << fmt::format("error: failed to open request: {}\n", config.request_path);
        return kExitIo;
    }

    auto request = codec::parse_request_text(*text);
    if (!request) {
        return report(request.error(), config.format, out);
    }
    spdlog::debug("request: {} sheets, {} projections, {} filters", request->sheets.size(),
                  request->projections.size(), request->filters.size());

    query::QueryBuilderService service{manifest->catalog, manifest->rows};
    auto result = service.preview(*request);
    if (!result) {
        return report(result.error(), config.format, out);
    }

    if (config.format == OutputFormat::Json) {
        out << codec::serialize_result(*result).dump(2) << "\n";
    } else {
        query::print(*result, out);
    }
    return kExitOk;
}

}  // namespace sheetq::cli
