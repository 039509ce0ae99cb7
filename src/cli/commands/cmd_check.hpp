//! # Check Command Interface
//!
//! Loads metadata files and reports argument schema diagnostics.
//!
//! ## Usage
//!
//! ```bash
//! argschema check options.json
//! argschema check a.json b.json --format=json --jobs=4
//! argschema check options.json --strict-groups --Werror
//! ```
//!
//! Settings come from `argschema.toml` (or `--config=`), then from flags.

#pragma once

namespace argschema::cli {

/// Returns 0 when no error was reported and every file loaded, 1 otherwise.
int run_check(int argc, char* argv[]);

} // namespace argschema::cli
