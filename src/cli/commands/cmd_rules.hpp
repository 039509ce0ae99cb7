//! # Rules Command Interface
//!
//! | Command                  | Output                              |
//! |--------------------------|-------------------------------------|
//! | `argschema rules`        | Table of every rule                 |
//! | `argschema rules ARG006` | Detailed explanation of one rule    |

#pragma once

#include <string>

namespace argschema::cli {

/// Lists all rules. Returns 0.
int run_rules();

/// Explains one rule, by code or name. Returns 1 if the rule is unknown.
int run_explain(const std::string& code);

} // namespace argschema::cli
