//! # JSON Metadata Loader
//!
//! Builds a `MetadataStore` from a JSON description of types. This is how the
//! `argschema` CLI receives symbol metadata exported by a front end.
//!
//! ## Format
//!
//! ```json
//! {
//!   "types": [
//!     { "name": "Mode", "kind": "enum", "constants": ["Start", "Stop"] },
//!     { "name": "Options", "file": "Options.cs", "line": 3,
//!       "members": [
//!         { "name": "Action", "type": "Mode", "line": 5, "column": 9,
//!           "attributes": [ { "namespace": "CommandLine", "name": "ActionArgument" } ] },
//!         { "name": "Path", "type": "string", "line": 8,
//!           "attributes": [
//!             { "namespace": "CommandLine", "name": "RequiredArgument",
//!               "args": [0, "path", "The input path"] } ] }
//!       ] }
//!   ]
//! }
//! ```
//!
//! Defaults: type `kind` is `class`, member `kind` is `property`, a member's
//! `file` is its type's `file`, missing `line`/`column` are 0.

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"
#include "metadata/symbol.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace argschema::metadata {

/// Converts an already parsed document. `source_name` prefixes error messages.
[[nodiscard]] auto load_metadata(const json::JsonValue& document, std::string_view source_name)
    -> Result<MetadataStore, std::string>;

/// Parses and converts JSON text.
[[nodiscard]] auto load_metadata_from_string(std::string_view text, std::string_view source_name)
    -> Result<MetadataStore, std::string>;

/// Reads, parses and converts a file.
[[nodiscard]] auto load_metadata_file(const std::filesystem::path& path)
    -> Result<MetadataStore, std::string>;

} // namespace argschema::metadata
