//
// Schema validation
//
// Checks an unvalidated ir::schema against the semantic rules and produces a
// validated copy. Every violation is reported; validation never stops at the
// first problem.
//
// VALIDATION PHASES:
//   1. Config        - Resolve auth/storage/email selectors (E006)
//   2. Models        - Model names, fields, methods, features (E001 E002 E007
//                      E003 E013 E011 E015 E008 E009 E012)
//   3. References    - Relation and reference targets, cardinality (E004 E010)
//   4. Hooks         - Lifecycle event vocabulary (E005)
//   5. Feature rules - Cross checks between features and config (E014 W001 W002)
//
// USAGE EXAMPLE:
//   schema::SchemaParser parser;
//   ir::schema parsed = parser.build_from_file("shop.yaml");
//
//   validation::validation_options opts;
//   opts.warnings_as_errors = true;
//
//   auto result = validation::validate(parsed, opts);
//   if (result.has_errors()) {
//       for (const auto& d : result.diagnostics) {
//           std::cerr << d.format() << "\n";
//       }
//       return 1;
//   }
//
//   const ir::schema& schema = result.validated.value();
//

#pragma once

#include <quickform/diagnostics.hh>
#include <quickform/errors.hh>
#include <quickform/ir.hh>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace quickform::validation {

/// Options controlling which diagnostics are reported and how.
struct validation_options {
    /// Promote warnings to errors
    bool warnings_as_errors = false;

    /// Drop all warnings from the result
    bool suppress_warnings = false;

    /// Warning codes to drop ("W001")
    std::set<std::string> disabled_warnings;
};

struct validation_result {
    /// Validated schema (only present if no errors).
    std::optional<ir::schema> validated;

    /// All diagnostics in phase order, then declaration order.
    std::vector<diagnostic> diagnostics;

    [[nodiscard]] bool has_errors() const { return quickform::has_errors(diagnostics); }
    [[nodiscard]] size_t error_count() const { return quickform::error_count(diagnostics); }
    [[nodiscard]] size_t warning_count() const { return quickform::warning_count(diagnostics); }
};

/// Run all validation phases over `input`. `input` is not modified.
validation_result validate(const ir::schema& input, const validation_options& opts = {});

/**
 * Parse and validate a schema file in one step.
 *
 * @param schema_path Schema document
 * @param config_path Optional config document overriding the `config:` section
 * @param warnings    Receives the warnings of a successful validation
 * @throws schema_error with every diagnostic when parsing or validation fails
 */
ir::schema load_schema(const std::filesystem::path& schema_path,
                       const std::optional<std::filesystem::path>& config_path = std::nullopt,
                       const validation_options& opts = {},
                       std::vector<diagnostic>* warnings = nullptr);

// ============================================================================
// Validation Phases
// ============================================================================

namespace phases {

/// Phase 1: resolve config selectors into their closed enumerations.
void resolve_config(ir::schema& schema, std::vector<diagnostic>& diagnostics);

/// Phase 2: per-model structure.
///
/// Checks:
/// - Model names unique after case normalization
/// - At least one field, field names unique, method names unique
/// - Field types known; enums have values and a valid default
/// - Storage annotations name known backends
/// - Feature names known (sets model::features)
void check_models(ir::schema& schema, std::vector<diagnostic>& diagnostics);

/// Phase 3: cross-model references.
void check_references(ir::schema& schema, std::vector<diagnostic>& diagnostics);

/// Phase 4: hook events.
void check_hooks(const ir::schema& schema, std::vector<diagnostic>& diagnostics);

/// Phase 5: feature flags against config and field set.
void check_feature_rules(const ir::schema& schema, std::vector<diagnostic>& diagnostics);

} // namespace phases

/// "did you mean 'x'?" for the closest candidate within a small edit distance
std::optional<std::string> suggest(const std::string& word,
                                   const std::vector<std::string>& candidates);

} // namespace quickform::validation
