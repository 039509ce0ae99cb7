#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace argschema::cli {

void print_usage() {
    std::cout << "argschema " << VERSION << "\n\n";
    std::cout << "Usage: argschema <command> [options] [files]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check     Check the argument schema of every type in metadata files\n";
    std::cout << "  rules     List the rules, or explain one: argschema rules ARG006\n\n";
    std::cout << "Check options:\n";
    std::cout << "  --config=<path>       Configuration file (default: ./argschema.toml)\n";
    std::cout << "  --namespace=<name>    Attribute namespace to recognize (default: CommandLine)\n";
    std::cout << "  --strict-groups       Report groups the action enumeration does not declare\n";
    std::cout << "  --jobs=<n>, -j<n>     Analyze types on n threads (0 = one per core)\n";
    std::cout << "  --format=text|json    Diagnostic output format\n";
    std::cout << "  --Werror              Treat warnings as errors\n";
    std::cout << "  --no-color            Disable colored output\n\n";
    std::cout << "Logging:\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. \"schema=debug,*=warn\"\n";
    std::cout << "  --log-file=<path>     Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>    text or json\n";
    std::cout << "  -v, -vv, -vvv         Increase verbosity\n";
    std::cout << "  -q                    Only log errors\n\n";
    std::cout << "General:\n";
    std::cout << "  --help, -h            Show this help\n";
    std::cout << "  --version, -V         Show version\n";
}

void print_version() {
    std::cout << "argschema " << VERSION << "\n";
}

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || arg == "-v" || arg == "-vv" || arg == "-vvv";
}

} // namespace argschema::cli
