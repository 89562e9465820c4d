/**
 * @file main.cpp
 * @brief apidrift CLI entry point
 *
 * Commands:
 *   diff      - Compare the schemas of two OpenAPI documents
 *   version   - Show version information
 */

#include "apidrift/common.hpp"
#include "apidrift/config.hpp"
#include "apidrift/matcher.hpp"
#include "apidrift/openapi.hpp"
#include "apidrift/report.hpp"
#include "apidrift/rules.hpp"
#include "apidrift/schema_validate.hpp"
#include "apidrift/version.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitFailOnThreshold = 2;

void print_version()
{
    std::println("apidrift {} ({})", apidrift::kVersion, apidrift::kBuildId);
    std::println("  report: {}", apidrift::kReportSchemaVersion);
    std::println("  config: {}", apidrift::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(apidrift - OpenAPI schema drift detector

Usage: apidrift <command> [options]

Commands:
  diff        Compare the component schemas of two OpenAPI documents
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version           Show version information

Run 'apidrift <command> --help' for command-specific options.
)");
}

void print_diff_help()
{
    std::print(R"(Usage: apidrift diff [options]

Compare the component schemas of two OpenAPI documents (JSON or YAML)

Options:
  --base FILE               Base (old) document (required)
  --current FILE            Current (new) document (required)
  --output FILE, -o         Write the report to FILE instead of stdout
  --format text|json        Report format (default: text)
  --min-severity LEVEL      Drop schemas below LEVEL (breaking, warning, change)
  --changed-only            Drop schemas without differences
  --fail-on LEVEL           Exit with code 2 when a schema reaches LEVEL
  --config FILE             Diff configuration file (config.v1)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose, -v             Print progress lines
  --help, -h                Show this help

Exit codes:
  0  success
  1  usage, I/O or parse error
  2  --fail-on threshold met
)");
}

struct DiffOptions
{
    std::string base;
    std::string current;
    std::optional<std::string> output;
    std::optional<std::string> format;
    std::optional<std::string> min_severity;
    std::optional<std::string> fail_on;
    std::optional<std::string> config;
    std::string schema_dir;
    bool changed_only;
    bool verbose;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> apidrift::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            apidrift::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto value_option_target(std::string_view arg, DiffOptions& options)
    -> std::optional<std::string>*
{
    if (arg == "--output" || arg == "-o") {
        return &options.output;
    }
    if (arg == "--format") {
        return &options.format;
    }
    if (arg == "--min-severity") {
        return &options.min_severity;
    }
    if (arg == "--fail-on") {
        return &options.fail_on;
    }
    if (arg == "--config") {
        return &options.config;
    }
    return nullptr;
}

[[nodiscard]] apidrift::Result<DiffOptions> parse_diff_args(std::span<char*> args)
{
    DiffOptions options{.base = std::string{},
                        .current = std::string{},
                        .output = std::nullopt,
                        .format = std::nullopt,
                        .min_severity = std::nullopt,
                        .fail_on = std::nullopt,
                        .config = std::nullopt,
                        .schema_dir = "schemas",
                        .changed_only = false,
                        .verbose = false,
                        .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--changed-only") {
            options.changed_only = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }
        if (arg == "--base" || arg == "--current" || arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--base") {
                options.base = *value;
            } else if (arg == "--current") {
                options.current = *value;
            } else {
                options.schema_dir = *value;
            }
            skip_next = true;
            continue;
        }
        if (auto* target = value_option_target(arg, options)) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            *target = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            apidrift::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

/// Config file first (if any), then command line overrides.
[[nodiscard]] apidrift::Result<apidrift::config::DiffConfig>
resolve_config(const DiffOptions& options)
{
    apidrift::config::DiffConfig config;
    if (options.config) {
        auto loaded = apidrift::config::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = *loaded;
    }
    if (options.format) {
        auto format = apidrift::config::parse_output_format(*options.format);
        if (!format) {
            return std::unexpected(format.error());
        }
        config.format = *format;
    }
    if (options.min_severity) {
        auto severity = apidrift::rules::parse_severity(*options.min_severity);
        if (!severity) {
            return std::unexpected(severity.error());
        }
        config.min_severity = *severity;
    }
    if (options.fail_on) {
        auto severity = apidrift::rules::parse_severity(*options.fail_on);
        if (!severity) {
            return std::unexpected(severity.error());
        }
        config.fail_on = *severity;
    }
    if (options.changed_only) {
        config.include_unchanged = false;
    }
    return config;
}

[[nodiscard]] apidrift::Result<apidrift::schema::SchemaTable>
load_table(std::string_view label, const std::string& path, bool verbose)
{
    auto table = apidrift::openapi::load_schema_table(path);
    if (!table) {
        return std::unexpected(table.error());
    }
    if (verbose) {
        std::println("[diff] Loaded {} schemas from {} document {}", table->size(), label, path);
    }
    return table;
}

[[nodiscard]] apidrift::VoidResult
emit_json_report(const DiffOptions& options,
                 const apidrift::config::DiffConfig& config,
                 const apidrift::schema::SchemaTable& current,
                 std::span<const apidrift::matcher::MatchResult> results)
{
    const auto overview = apidrift::report::build_schema_overview(current, results);
    const auto payload = apidrift::report::build_report_json(results, overview);
    if (config.validate_output) {
        const auto schema_path =
            apidrift::common::schema_file(options.schema_dir, apidrift::kReportSchemaVersion);
        if (auto validation = apidrift::common::validate_json(payload, schema_path);
            !validation) {
            return std::unexpected(validation.error());
        }
    }
    if (options.output) {
        return apidrift::report::write_json_file(*options.output, payload);
    }
    std::println("{}", payload.dump(2));
    return {};
}

[[nodiscard]] apidrift::VoidResult
emit_text_report(const DiffOptions& options,
                 std::span<const apidrift::matcher::MatchResult> results)
{
    const auto lines = apidrift::report::render_text(results);
    if (options.output) {
        return apidrift::report::write_text_file(*options.output, lines);
    }
    for (const auto& line : lines) {
        std::println("{}", line);
    }
    return {};
}

[[nodiscard]] int run_diff(const DiffOptions& options)
{
    auto config = resolve_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }

    auto base = load_table("base", options.base, options.verbose);
    if (!base) {
        std::println(stderr, "Error: diff failed: {}", base.error().message);
        return 1;
    }
    auto current = load_table("current", options.current, options.verbose);
    if (!current) {
        std::println(stderr, "Error: diff failed: {}", current.error().message);
        return 1;
    }

    const apidrift::matcher::SchemaMatcher matcher(*base, *current);
    const auto results = apidrift::report::assemble(matcher.match());
    const auto filtered =
        apidrift::report::filter_results(results, config->min_severity, config->include_unchanged);

    auto written = config->format == apidrift::config::OutputFormat::kJson
                       ? emit_json_report(options, *config, *current, filtered)
                       : emit_text_report(options, filtered);
    if (!written) {
        std::println(stderr, "Error: failed to write report: {}", written.error().message);
        return 1;
    }

    const auto highest = apidrift::report::highest_severity(results);
    if (options.verbose) {
        const auto summary = apidrift::report::summarize(results);
        std::println("[diff] Compared {} schemas", summary.total_schemas);
        std::println("  changed: {}", summary.changed_schemas);
        std::println("  highest: {}",
                     highest ? apidrift::rules::to_string(*highest) : std::string_view{"none"});
        if (options.output) {
            std::println("  output: {}", *options.output);
        }
    }

    if (config->fail_on && highest && *highest >= *config->fail_on) {
        if (options.verbose) {
            std::println("[diff] Threshold {} reached",
                         apidrift::rules::to_string(*config->fail_on));
        }
        return kExitFailOnThreshold;
    }
    return 0;
}

int cmd_diff(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_diff_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_diff_help();
        return 0;
    }
    if (options->base.empty() || options->current.empty()) {
        std::println(stderr, "Error: --base and --current are required");
        print_diff_help();
        return 1;
    }
    return run_diff(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "version") {
            print_version();
            return 0;
        }
        if (cmd == "diff") {
            return cmd_diff(argc - 2, argv + 2);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
