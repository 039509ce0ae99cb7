//! # CLI Command Dispatcher
//!
//! Main entry point for the argschema CLI. Sets up logging, then routes to
//! the command handler.
//!
//! ```text
//! argschema_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   └─ rules [CODE]   → run_rules() / run_explain()
//! ```

#include "commands/cmd_check.hpp"
#include "commands/cmd_rules.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>

using namespace argschema::cli;

/// Return codes: 0 success, 1 schema errors, load failures or bad usage.
int argschema_main(int argc, char* argv[]) {
    argschema::log::Logger::init(argschema::log::parse_log_options(argc, argv));

    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    if (command == "check") {
        return run_check(argc, argv);
    }

    if (command == "rules") {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (!arg.empty() && arg[0] != '-') {
                return run_explain(arg);
            }
        }
        return run_rules();
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'argschema --help' for usage.\n";
    return 1;
}
