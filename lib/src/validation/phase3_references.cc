//
// Phase 3: Cross-model references
//
// A dangling relation is rejected here so that rendering never sees one.
//

#include <quickform/validation.hh>
#include <quickform/string_utils.hh>

namespace quickform::validation::phases {

namespace {
    std::vector<std::string> model_names(const ir::schema& schema) {
        std::vector<std::string> names;
        for (const auto& m : schema.models) {
            names.push_back(m.name);
        }
        return names;
    }
}

void check_references(ir::schema& schema, std::vector<diagnostic>& diagnostics) {
    const auto candidates = model_names(schema);

    for (auto& m : schema.models) {
        for (const auto& f : m.fields) {
            if (f.type != ir::field_type::reference || !ir::parse_field_type(f.type_name)) {
                continue;
            }

            if (f.target.empty()) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_UNRESOLVED_TARGET,
                    "reference field '" + m.name + "." + f.name + "' has no target model",
                    f.source,
                    "add 'target: <Model>'"
                });
            } else if (!schema.find_model(f.target)) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_UNRESOLVED_TARGET,
                    "reference field '" + m.name + "." + f.name + "' -> '" + f.target +
                        "': target model not found",
                    f.source,
                    suggest(f.target, candidates)
                });
            }
        }

        for (auto& r : m.relations) {
            if (!schema.find_model(r.target)) {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_UNRESOLVED_TARGET,
                    "relation '" + m.name + "' -> '" + r.target + "': target model not found",
                    r.source,
                    suggest(r.target, candidates)
                });
            }

            if (auto kind = ir::parse_cardinality(r.cardinality_name)) {
                r.kind = *kind;
            } else {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_INVALID_RELATION,
                    "relation '" + m.name + "' -> '" + r.target + "' has invalid cardinality '" +
                        r.cardinality_name + "' (expected one or many)",
                    r.source,
                    std::nullopt
                });
            }

            if (auto owner = ir::parse_ownership(r.ownership_name)) {
                r.owner = *owner;
            } else {
                diagnostics.push_back(diagnostic{
                    diagnostic_level::error,
                    diag_codes::E_INVALID_RELATION,
                    "relation '" + m.name + "' -> '" + r.target + "' has invalid ownership '" +
                        r.ownership_name + "' (expected owning or owned)",
                    r.source,
                    std::nullopt
                });
            }

            if (r.name.empty()) {
                r.name = r.kind == ir::cardinality::many ? pluralize(to_camel_case(r.target))
                                                         : to_camel_case(r.target);
            }
        }
    }
}

} // namespace quickform::validation::phases
