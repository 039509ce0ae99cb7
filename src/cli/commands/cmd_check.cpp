#include "cmd_check.hpp"

#include "../diagnostic.hpp"
#include "../utils.hpp"
#include "log/log.hpp"
#include "metadata/json_loader.hpp"
#include "schema/analyzer.hpp"
#include "schema/config.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace argschema::cli {

namespace {

/// Flags given on the command line; unset fields keep the file's value.
struct CheckOptions {
    std::vector<std::string> files;
    std::optional<std::string> config_path;
    std::optional<std::string> annotation_namespace;
    std::optional<unsigned> jobs;
    std::optional<schema::OutputFormat> format;
    bool strict_groups = false;
    bool warnings_as_errors = false;
    bool no_color = false;
};

auto parse_jobs(std::string_view text) -> std::optional<unsigned> {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void print_check_help() {
    std::cerr << "Usage: argschema check <file.json>... [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=<path>       Configuration file (default: ./argschema.toml)\n";
    std::cerr << "  --namespace=<name>    Attribute namespace to recognize\n";
    std::cerr << "  --strict-groups       Report undeclared argument groups\n";
    std::cerr << "  --jobs=<n>, -j<n>     Worker threads (0 = one per core)\n";
    std::cerr << "  --format=text|json    Diagnostic output format\n";
    std::cerr << "  --Werror              Treat warnings as errors\n";
    std::cerr << "  --no-color            Disable colored output\n";
}

/// Returns false and prints the problem on a bad argument.
auto parse_check_args(int argc, char* argv[], CheckOptions& options) -> bool {
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--config=")) {
            options.config_path = arg.substr(9);
        } else if (arg.starts_with("--namespace=")) {
            options.annotation_namespace = arg.substr(12);
        } else if (arg == "--strict-groups") {
            options.strict_groups = true;
        } else if (arg.starts_with("--jobs=") || arg.starts_with("-j")) {
            auto value = arg.starts_with("-j") ? arg.substr(2) : arg.substr(7);
            auto jobs = parse_jobs(value);
            if (!jobs) {
                std::cerr << "error: invalid job count '" << value << "'\n";
                return false;
            }
            options.jobs = *jobs;
        } else if (arg.starts_with("--format=")) {
            auto value = arg.substr(9);
            if (value == "text") {
                options.format = schema::OutputFormat::Text;
            } else if (value == "json") {
                options.format = schema::OutputFormat::JSON;
            } else {
                std::cerr << "error: unknown format '" << value << "'\n";
                std::cerr << "  valid formats: text, json\n";
                return false;
            }
        } else if (arg == "--Werror" || arg == "-Werror") {
            options.warnings_as_errors = true;
        } else if (arg == "--no-color") {
            options.no_color = true;
        } else if (is_log_option(arg)) {
            // Handled by log::parse_log_options.
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return false;
        } else {
            options.files.push_back(arg);
        }
    }
    return true;
}

auto resolve_config(const CheckOptions& options) -> std::optional<schema::ToolConfig> {
    schema::ToolConfig config;
    if (options.config_path) {
        if (!fs::exists(*options.config_path)) {
            ARGSCHEMA_LOG_ERROR("cli", "Configuration file not found: " << *options.config_path);
            return std::nullopt;
        }
        config = schema::load_config(*options.config_path);
    } else {
        config = schema::load_config(fs::current_path() / schema::CONFIG_FILE_NAME);
    }

    if (options.annotation_namespace) {
        config.analyzer.annotation_namespace = *options.annotation_namespace;
    }
    if (options.strict_groups) {
        config.analyzer.strict_groups = true;
    }
    if (options.jobs) {
        config.analyzer.jobs = *options.jobs;
    }
    if (options.format) {
        config.format = *options.format;
    }
    if (options.warnings_as_errors) {
        config.warnings_as_errors = true;
    }
    if (options.no_color) {
        config.colors = false;
    }
    return config;
}

} // namespace

int run_check(int argc, char* argv[]) {
    CheckOptions options;
    if (!parse_check_args(argc, argv, options)) {
        return 1;
    }
    if (options.files.empty()) {
        print_check_help();
        return 1;
    }

    auto resolved = resolve_config(options);
    if (!resolved) {
        return 1;
    }
    const auto& config = *resolved;

    const bool json_output = config.format == schema::OutputFormat::JSON;
    DiagnosticEmitter emitter(json_output ? std::cout : std::cerr);
    emitter.set_format(config.format);
    emitter.set_color_enabled(config.colors && !json_output && terminal_supports_colors());
    emitter.set_warnings_as_errors(config.warnings_as_errors);
    emitter.set_read_sources(!json_output);

    schema::AnalysisSummary summary;
    size_t failed_files = 0;

    for (const auto& file : options.files) {
        ARGSCHEMA_LOG_INFO("cli", "Checking " << file);

        auto loaded = metadata::load_metadata_file(file);
        if (is_err(loaded)) {
            ARGSCHEMA_LOG_ERROR("cli", unwrap_err(loaded));
            ++failed_files;
            continue;
        }

        const auto& store = unwrap(loaded);
        schema::SchemaAnalyzer analyzer(store, emitter, config.analyzer);
        summary.merge(analyzer.analyze_all());
    }

    emitter.emit_summary(summary, options.files.size(), failed_files);

    return (emitter.error_count() > 0 || failed_files > 0) ? 1 : 0;
}

} // namespace argschema::cli
