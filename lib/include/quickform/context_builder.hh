//
// Render contexts
//
// Turns the validated IR into the value trees templates are rendered against.
// Every key a built-in template may reference is always present (empty string,
// false or an empty list when the schema does not set it), because referencing
// a missing key is a render error.
//
// MODEL CONTEXT:
//   name class_name file_name var_name plural route table_name description
//   fields[]    name type ts_type mongoose_type sequelize_type openapi_type
//               openapi_format required unique has_default default_literal
//               is_enum is_reference is_string is_date is_password values
//               values_literal target target_class target_file storage_options[]
//               sample description
//   methods[]   name params[] signature args returns description body
//   hooks[]     event phase action sequelize_hook mongoose_hook description body
//               synthesized
//   relations[] name target target_class target_file target_var cardinality many
//               ownership owning
//   features    auth audit search
//   has_password hashes_password login_field search_fields[] required_fields[]
//   config project
//
// PROJECT CONTEXT:
//   project   name package_name description port
//   config    auth storage email auth_enabled email_enabled sql dialect cors
//   models[]  (model contexts)  auth_models[]  search_models[]  has_auth_models
//   generator name version
//

#pragma once

#include <quickform/ir.hh>
#include <quickform/value.hh>
#include <string>
#include <vector>

namespace quickform::generator {

/// Config section as seen by templates
value build_config_context(const ir::config& config);

/// Project settings as seen by templates
value build_project_settings_context(const ir::config& config);

/**
 * Context for one model.
 *
 * @param schema      Validated schema (for relation targets and config)
 * @param model       The model to describe
 * @param synthesized Hooks produced by feature partials, appended after the
 *                    model's declared hooks
 */
value build_model_context(const ir::schema& schema,
                          const ir::model& model,
                          const std::vector<ir::hook>& synthesized = {});

/// Context for project-level templates; `models` are the final model contexts
/// in declaration order.
value build_project_context(const ir::schema& schema, const std::vector<value>& models);

/// TypeScript literal for a default or sample value of the given type
std::string typescript_literal(ir::field_type type, const std::string& text);

} // namespace quickform::generator
