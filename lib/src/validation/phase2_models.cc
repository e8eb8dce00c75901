//
// Phase 2: Model structure
//

#include <quickform/validation.hh>
#include <quickform/string_utils.hh>
#include <algorithm>
#include <map>
#include <set>

namespace quickform::validation::phases {

namespace {
    const std::vector<std::string>& feature_names() {
        static const std::vector<std::string> names = {"auth", "audit", "search"};
        return names;
    }

    bool is_ascii_letter(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    void check_field(ir::field& f, const std::string& model_name,
                     std::vector<diagnostic>& diagnostics) {
        auto type = ir::parse_field_type(f.type_name);
        if (!type) {
            diagnostics.push_back(diagnostic{
                diagnostic_level::error,
                diag_codes::E_UNKNOWN_FIELD_TYPE,
                "field '" + model_name + "." + f.name + "' has unknown type '" + f.type_name + "'",
                f.source,
                suggest(to_lower(f.type_name), ir::field_type_names())
            });
            return;
        }
        f.type = *type;

        if (f.type == ir::field_type::enumeration) {
            if (f.values.empty()) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_EMPTY_ENUM,
                    "enum field '" + model_name + "." + f.name + "' declares no values",
                    f.source,
                    "add 'values: [ ... ]'"
                });
            } else if (f.default_value &&
                       std::find(f.values.begin(), f.values.end(), *f.default_value) == f.values.end()) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_INVALID_DEFAULT,
                    "default '" + *f.default_value + "' of enum field '" + model_name + "." +
                        f.name + "' is not one of: " + join(f.values, ", "),
                    f.source,
                    std::nullopt
                });
            }
        }

        for (const auto& [backend, options] : f.storage) {
            if (!ir::parse_storage_backend(backend)) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_UNKNOWN_BACKEND,
                    "field '" + model_name + "." + f.name +
                        "' has storage options for unknown backend '" + backend + "'",
                    {f.source.path + ".storage." + backend},
                    suggest(to_lower(backend), ir::storage_backend_names())
                });
            }
        }
    }
}

void check_models(ir::schema& schema, std::vector<diagnostic>& diagnostics) {
    // Normalized name -> first declaration
    std::map<std::string, std::string> seen_models;

    for (auto& m : schema.models) {
        std::string normalized = ir::normalize_model_name(m.name);
        if (normalized.empty() || !is_ascii_letter(normalized.front())) {
            diagnostics.push_back(diagnostic{
                diagnostic_level::error,
                diag_codes::E_INVALID_MODEL_NAME,
                "model name '" + m.name + "' does not yield a file name starting with a letter" +
                    (normalized.empty() ? std::string() : " (got '" + normalized + "')"),
                m.source,
                "start the name with an ASCII letter"
            });
        } else if (auto [it, inserted] = seen_models.emplace(normalized, m.name); !inserted) {
            diagnostics.push_back(diagnostic{
                diagnostic_level::error,
                diag_codes::E_DUPLICATE_MODEL,
                "model '" + m.name + "' collides with model '" + it->second +
                    "' (both normalize to '" + normalized + "')",
                m.source,
                std::nullopt
            });
        }

        if (m.fields.empty()) {
            diagnostics.push_back(diagnostic{
                diagnostic_level::error,
                diag_codes::E_MODEL_WITHOUT_FIELDS,
                "model '" + m.name + "' declares no fields",
                m.source,
                std::nullopt
            });
        }

        std::set<std::string> field_names;
        for (auto& f : m.fields) {
            if (!field_names.insert(f.name).second) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_DUPLICATE_FIELD,
                    "duplicate field '" + f.name + "' in model '" + m.name + "'",
                    f.source,
                    std::nullopt
                });
            }
            check_field(f, m.name, diagnostics);
        }

        std::set<std::string> method_names;
        for (const auto& method : m.methods) {
            if (!method_names.insert(method.name).second) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_DUPLICATE_METHOD,
                    "duplicate method '" + method.name + "' in model '" + m.name + "'",
                    method.source,
                    std::nullopt
                });
            }
        }

        m.features = {};
        for (const auto& feature : m.feature_names) {
            if (feature == "auth") {
                m.features.auth = true;
            } else if (feature == "audit") {
                m.features.audit = true;
            } else if (feature == "search") {
                m.features.search = true;
            } else {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_UNKNOWN_FEATURE,
                    "model '" + m.name + "' enables unknown feature '" + feature + "'",
                    {m.source.path + ".features"},
                    suggest(to_lower(feature), feature_names())
                });
            }
        }
    }
}

} // namespace quickform::validation::phases
