//
// Phase 5: Feature rules
//

#include <quickform/validation.hh>
#include <algorithm>

namespace quickform::validation::phases {

void check_feature_rules(const ir::schema& schema, std::vector<diagnostic>& diagnostics) {
    // An unresolved selector was already reported in phase 1
    bool auth_disabled = schema.config.auth == ir::auth_mode::none &&
                         ir::parse_auth_mode(schema.config.auth_name).has_value();

    for (const auto& m : schema.models) {
        if (m.features.auth) {
            if (auth_disabled) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_AUTH_DISABLED,
                    "model '" + m.name + "' enables 'auth' but config.auth is 'none'",
                    {m.source.path + ".features"},
                    "set config.auth to jwt or session"
                });
            }

            if (!m.find_field("password")) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::warning,
                    diag_codes::W_AUTH_WITHOUT_PASSWORD,
                    "auth model '" + m.name + "' has no 'password' field; credential hashing is skipped",
                    m.source,
                    std::nullopt
                });
            }
        }

        if (m.features.search) {
            bool has_text = std::any_of(m.fields.begin(), m.fields.end(),
                [](const ir::field& f) { return f.type == ir::field_type::string; });
            if (!has_text) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::warning,
                    diag_codes::W_SEARCH_WITHOUT_TEXT,
                    "search model '" + m.name + "' has no string field to index",
                    m.source,
                    std::nullopt
                });
            }
        }
    }
}

} // namespace quickform::validation::phases
