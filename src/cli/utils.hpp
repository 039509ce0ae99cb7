//! # CLI Utilities
//!
//! Usage text and small helpers shared by the commands.

#pragma once

#include <string>
#include <string_view>

namespace argschema::cli {

void print_usage();
void print_version();

/// True for flags consumed by `log::parse_log_options`.
bool is_log_option(std::string_view arg);

} // namespace argschema::cli
