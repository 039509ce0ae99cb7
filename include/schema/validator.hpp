//! # Group Validator
//!
//! Checks each group of a `GroupMap` on its own:
//!
//! - no two arguments share a name (ignoring case) → ARG006
//! - no two required arguments share a position → ARG007
//!
//! Arguments are visited in stored order, so the diagnostic always lands on
//! the later of the two clashing members.

#pragma once

#include "schema/argument.hpp"
#include "schema/reporter.hpp"

#include <string_view>
#include <vector>

namespace argschema::schema {

class GroupValidator {
public:
    explicit GroupValidator(DiagnosticReporter& reporter);

    /// Validates every group, in iteration order.
    void validate(const GroupMap& groups);

    void validate_group(std::string_view group_name, const std::vector<Argument>& arguments);

private:
    DiagnosticReporter& reporter_;
};

} // namespace argschema::schema
