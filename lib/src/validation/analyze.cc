//
// Main validation pipeline
//

#include <quickform/validation.hh>
#include <quickform/schema_parser.hh>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace quickform::validation {

namespace {
    std::vector<diagnostic> filter(std::vector<diagnostic> diagnostics,
                                   const validation_options& opts) {
        std::vector<diagnostic> filtered;
        for (auto& diag : diagnostics) {
            if (diag.level == diagnostic_level::warning) {
                if (opts.suppress_warnings || opts.disabled_warnings.contains(diag.code)) {
                    continue;
                }
                if (opts.warnings_as_errors) {
                    diag.level = diagnostic_level::error;
                }
            }
            filtered.push_back(std::move(diag));
        }
        return filtered;
    }

    size_t edit_distance(const std::string& a, const std::string& b) {
        std::vector<size_t> row(b.size() + 1);
        for (size_t j = 0; j <= b.size(); ++j) {
            row[j] = j;
        }
        for (size_t i = 1; i <= a.size(); ++i) {
            size_t diagonal = row[0];
            row[0] = i;
            for (size_t j = 1; j <= b.size(); ++j) {
                size_t above = row[j];
                size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
                row[j] = std::min({row[j] + 1, row[j - 1] + 1, diagonal + cost});
                diagonal = above;
            }
        }
        return row[b.size()];
    }
}

std::optional<std::string> suggest(const std::string& word,
                                   const std::vector<std::string>& candidates) {
    const std::string* best = nullptr;
    size_t best_distance = 3;  // accept up to two edits

    for (const auto& candidate : candidates) {
        size_t distance = edit_distance(word, candidate);
        if (distance < best_distance) {
            best_distance = distance;
            best = &candidate;
        }
    }

    if (!best) {
        return std::nullopt;
    }
    return "did you mean '" + *best + "'?";
}

validation_result validate(const ir::schema& input, const validation_options& opts) {
    validation_result result;
    std::vector<diagnostic> diagnostics;

    // Phases annotate a private copy; the caller's IR is never touched
    ir::schema working = input;

    // Phase 1: Config selectors
    phases::resolve_config(working, diagnostics);

    // Phase 2: Models, fields, methods, features
    phases::check_models(working, diagnostics);

    // Phase 3: References
    phases::check_references(working, diagnostics);

    // Phase 4: Hook events
    phases::check_hooks(working, diagnostics);

    // Phase 5: Feature rules
    phases::check_feature_rules(working, diagnostics);

    result.diagnostics = filter(std::move(diagnostics), opts);

    // Only set validated if no errors
    if (!result.has_errors()) {
        result.validated = std::move(working);
    }

    return result;
}

ir::schema load_schema(const std::filesystem::path& schema_path,
                       const std::optional<std::filesystem::path>& config_path,
                       const validation_options& opts,
                       std::vector<diagnostic>* warnings) {
    schema::SchemaParser parser;
    ir::schema parsed = parser.build_from_file(schema_path);

    if (config_path) {
        std::ifstream file(*config_path);
        if (!file.is_open()) {
            throw schema_error("cannot open config file", config_path->string());
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        parser.apply_config(parsed, buffer.str());
    }

    auto result = validate(parsed, opts);
    if (result.has_errors()) {
        throw schema_error(std::move(result.diagnostics));
    }

    if (warnings) {
        *warnings = std::move(result.diagnostics);
    }
    return std::move(*result.validated);
}

} // namespace quickform::validation
