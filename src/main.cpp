//! # argschema Entry Point
//!
//! Delegates to the CLI driver (`cli/dispatcher.cpp`).
//!
//! ```bash
//! argschema check options.json      # Check every type in a metadata file
//! argschema rules                   # List the rules
//! argschema rules ARG006            # Explain one rule
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return argschema_main(argc, argv);
}
