//! # Schema Diagnostics
//!
//! Rule taxonomy, diagnostic records and the sink interface the analyzer
//! reports through.
//!
//! ## Rules
//!
//! | Code   | Rule                                                 | Payload  |
//! |--------|------------------------------------------------------|----------|
//! | ARG001 | DuplicateActionArgument                              | -        |
//! | ARG002 | ActionWithoutArgumentsInGroup                        | -        |
//! | ARG003 | ConflictingPropertyDeclaration                       | -        |
//! | ARG004 | CannotSpecifyAGroupForANonProperty                   | -        |
//! | ARG005 | CommonArgumentAttributeUsedWhenActionArgumentNotEnum | -        |
//! | ARG006 | DuplicateArgumentName                                | name     |
//! | ARG007 | DuplicatePositionalArgumentPosition                  | position |
//! | ARG008 | UndeclaredArgumentGroup (strict groups only)         | group    |
//!
//! Diagnostics are delivered to the sink as soon as they are found. Within one
//! type the order follows member declaration order; across types no order is
//! guaranteed when analysis runs in parallel.

#pragma once

#include "common.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace argschema::schema {

// ============================================================================
// Rules
// ============================================================================

enum class RuleId : uint8_t {
    DuplicateActionArgument,
    ActionWithoutArgumentsInGroup,
    ConflictingPropertyDeclaration,
    CannotSpecifyAGroupForANonProperty,
    CommonArgumentAttributeUsedWhenActionArgumentNotEnum,
    DuplicateArgumentName,
    DuplicatePositionalArgumentPosition,
    UndeclaredArgumentGroup,
};

constexpr size_t RULE_COUNT = 8;

enum class Severity { Error, Warning, Info };

/// Static description of a rule.
struct RuleDescriptor {
    RuleId id;
    const char* code;     ///< Stable code, e.g. "ARG006"
    const char* name;     ///< Rule name, e.g. "DuplicateArgumentName"
    const char* title;    ///< One-line summary
    const char* message;  ///< Message format; `{0}` is replaced by the payload
    Severity default_severity;
};

/// Descriptor table, indexed by `RuleId`.
[[nodiscard]] auto all_rules() -> const std::array<RuleDescriptor, RULE_COUNT>&;

[[nodiscard]] auto rule_descriptor(RuleId id) -> const RuleDescriptor&;

/// Finds a rule by code ("ARG003") or name ("ConflictingPropertyDeclaration"),
/// ignoring case.
[[nodiscard]] auto find_rule(std::string_view code_or_name) -> std::optional<RuleId>;

[[nodiscard]] auto severity_name(Severity severity) -> const char*;

// ============================================================================
// Diagnostic
// ============================================================================

/// Optional value attached to a diagnostic: a name or a position.
using DiagnosticPayload = std::variant<std::monostate, std::string, int64_t>;

struct Diagnostic {
    RuleId rule;
    Severity severity;
    SourceLocation location;

    /// Analyzed type and triggering member.
    std::string type_name;
    std::string member_name;

    DiagnosticPayload payload;

    /// Rule message with the payload substituted.
    std::string message;

    [[nodiscard]] auto code() const -> const char* {
        return rule_descriptor(rule).code;
    }

    [[nodiscard]] auto payload_string() const -> std::optional<std::string> {
        if (auto* s = std::get_if<std::string>(&payload)) {
            return *s;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto payload_int() const -> std::optional<int64_t> {
        if (auto* i = std::get_if<int64_t>(&payload)) {
            return *i;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto operator==(const Diagnostic& other) const -> bool = default;
};

/// Substitutes `{0}` in a rule's message format.
[[nodiscard]] auto format_message(const RuleDescriptor& rule, const DiagnosticPayload& payload)
    -> std::string;

// ============================================================================
// Sinks
// ============================================================================

/// Receives diagnostics from the analyzer.
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void report(const Diagnostic& diagnostic) = 0;
};

/// Stores every diagnostic in arrival order.
class CollectingSink : public DiagnosticSink {
public:
    void report(const Diagnostic& diagnostic) override {
        diagnostics_.push_back(diagnostic);
    }

    [[nodiscard]] auto diagnostics() const -> const std::vector<Diagnostic>& {
        return diagnostics_;
    }

    /// Number of diagnostics for one rule.
    [[nodiscard]] auto count(RuleId rule) const -> size_t;

    void clear() {
        diagnostics_.clear();
    }

private:
    std::vector<Diagnostic> diagnostics_;
};

/// Serializes `report` calls into another sink.
class SynchronizedSink : public DiagnosticSink {
public:
    explicit SynchronizedSink(DiagnosticSink& inner) : inner_(inner) {}

    void report(const Diagnostic& diagnostic) override {
        std::lock_guard<std::mutex> lock(mutex_);
        inner_.report(diagnostic);
    }

private:
    DiagnosticSink& inner_;
    std::mutex mutex_;
};

} // namespace argschema::schema
