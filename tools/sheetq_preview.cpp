#include <sheetq/cli/preview.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"sheetq: cross-sheet query preview"};

    sheetq::cli::PreviewConfig config;
    std::string format = "json";
    app.add_flag("-v,--verbose", config.verbose, "Enable verbose output");
    app.add_option("--catalog", config.catalog_path,
                   "Sheet catalog manifest (JSON). "
                   "Defaults to SHEETQ_CATALOG environment variable.");
    app.add_option("--request", config.request_path, "Preview request JSON file, '-' for stdin")
        ->required();
    app.add_option("--format", format, "Output format")
        ->check(CLI::IsMember({"json", "table"}));
    app.add_flag("--infer-numbers", config.infer_numbers,
                 "Decode numeric-looking CSV cells as numbers");
    app.add_option("--nulls", config.null_spec,
                   "Comma-separated CSV null tokens; <empty> matches empty cells");

    CLI11_PARSE(app, argc, argv);

    sheetq::cli::configure_logging(config.verbose);

    if (config.catalog_path.empty()) {
        const char* env = std::getenv("SHEETQ_CATALOG");
        if (env != nullptr) {
            config.catalog_path = env;
        }
    }
    if (auto parsed = sheetq::cli::parse_output_format(format)) {
        config.format = *parsed;
    }

    return sheetq::cli::run(config, std::cin, std::cout, std::cerr);
}
