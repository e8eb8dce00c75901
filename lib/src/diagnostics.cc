//
// Diagnostic formatting and error messages
//

#include <quickform/diagnostics.hh>
#include <quickform/errors.hh>
#include <algorithm>
#include <sstream>

namespace quickform {

// ============================================================================
// Diagnostic Formatting
// ============================================================================

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: location: level: message [code]
    oss << location.format() << ": ";

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
        case diagnostic_level::note:
            oss << "note: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    if (suggestion) {
        oss << "\n  suggestion: " << suggestion.value();
    }

    return oss.str();
}

bool has_errors(const std::vector<diagnostic>& diagnostics) {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

size_t error_count(const std::vector<diagnostic>& diagnostics) {
    return std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

size_t warning_count(const std::vector<diagnostic>& diagnostics) {
    return std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; });
}

// ============================================================================
// Error Messages
// ============================================================================

std::string schema_error::build_message(const std::vector<diagnostic>& diagnostics) {
    if (diagnostics.size() == 1) {
        return diagnostics[0].format();
    }

    std::ostringstream oss;
    oss << "schema has " << error_count(diagnostics) << " error(s):";
    for (const auto& diag : diagnostics) {
        oss << "\n  " << diag.format();
    }
    return oss.str();
}

template_error template_error::unresolved(const std::string& template_id,
                                          const std::vector<std::string>& searched) {
    std::ostringstream oss;
    oss << "not found. Searched in:";
    for (const auto& location : searched) {
        oss << "\n  - " << location;
    }

    template_error err(template_id, oss.str());
    err.searched_ = searched;
    return err;
}

template_error template_error::undefined_path(const std::string& template_id,
                                              const std::string& path,
                                              size_t line) {
    template_error err(template_id,
        "line " + std::to_string(line) + ": undefined context path '" + path + "'");
    err.path_ = path;
    return err;
}

template_error template_error::syntax(const std::string& template_id,
                                      const std::string& detail,
                                      size_t line) {
    return template_error(template_id, "line " + std::to_string(line) + ": " + detail);
}

} // namespace quickform
