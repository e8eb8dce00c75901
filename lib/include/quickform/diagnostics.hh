//
// Diagnostics for schema parsing and validation
//
// Every problem found in a schema is reported as a diagnostic carrying a code,
// a message naming the offending model/field/relation and the location inside
// the document. Diagnostics are collected, never thrown one by one.
//

#pragma once

#include <quickform/ir.hh>
#include <optional>
#include <string>
#include <vector>

namespace quickform {

/// Severity level for diagnostic messages.
/// Errors block generation; warnings are reported and generation proceeds.
enum class diagnostic_level {
    error,      ///< Must fix - blocks generation
    warning,    ///< Should fix - generated project may be incomplete
    note        ///< Additional context
};

/// Diagnostic codes for documentation and selective disabling.
///
/// Code format:
/// - E000 structural decode failure
/// - E001-E019 semantic errors
/// - W001-W009 warnings
namespace diag_codes {
    constexpr const char* E_STRUCTURE = "E000";             ///< Malformed document

    constexpr const char* E_MODEL_WITHOUT_FIELDS = "E001";
    constexpr const char* E_DUPLICATE_FIELD = "E002";
    constexpr const char* E_EMPTY_ENUM = "E003";
    constexpr const char* E_UNRESOLVED_TARGET = "E004";     ///< Relation or reference target missing
    constexpr const char* E_UNKNOWN_HOOK_EVENT = "E005";
    constexpr const char* E_INVALID_CONFIG = "E006";        ///< Selector outside its enumeration
    constexpr const char* E_UNKNOWN_FIELD_TYPE = "E007";
    constexpr const char* E_DUPLICATE_MODEL = "E008";
    constexpr const char* E_DUPLICATE_METHOD = "E009";
    constexpr const char* E_INVALID_RELATION = "E010";      ///< Bad cardinality or ownership
    constexpr const char* E_UNKNOWN_BACKEND = "E011";       ///< Storage annotation for unknown backend
    constexpr const char* E_UNKNOWN_FEATURE = "E012";
    constexpr const char* E_INVALID_DEFAULT = "E013";       ///< Enum default not among values
    constexpr const char* E_AUTH_DISABLED = "E014";         ///< Model wants auth, config.auth is none
    constexpr const char* E_INVALID_MODEL_NAME = "E015";    ///< Name yields no usable file name

    constexpr const char* W_AUTH_WITHOUT_PASSWORD = "W001";
    constexpr const char* W_SEARCH_WITHOUT_TEXT = "W002";
}

/// A single diagnostic message.
///
/// Example output:
///   models.Order.relations[0]: error: relation 'Order' -> 'Shipment': target model not found [E004]
struct diagnostic {
    diagnostic_level level;
    std::string code;
    std::string message;
    ir::source_location location;

    /// Suggested fix (e.g., "did you mean 'Shipping'?")
    std::optional<std::string> suggestion;

    /// Format as "location: level: message [code]" plus an optional suggestion line
    [[nodiscard]] std::string format() const;
};

bool has_errors(const std::vector<diagnostic>& diagnostics);
size_t error_count(const std::vector<diagnostic>& diagnostics);
size_t warning_count(const std::vector<diagnostic>& diagnostics);

} // namespace quickform
