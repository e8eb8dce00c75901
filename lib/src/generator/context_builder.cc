#include <quickform/context_builder.hh>
#include <quickform/string_utils.hh>
#include <quickform/version.hh>
#include <algorithm>

namespace quickform::generator {

namespace {
    value string_list(const std::vector<std::string>& items) {
        value::list_type list;
        for (const auto& item : items) {
            list.emplace_back(item);
        }
        return value::make_list(std::move(list));
    }

    std::string single_quoted(const std::string& text) {
        std::string out = "'";
        for (char c : text) {
            if (c == '\\' || c == '\'') {
                out += '\\';
            }
            out += c;
        }
        out += "'";
        return out;
    }

    std::string option(const ir::storage_options& options, const std::string& name) {
        for (const auto& [key, val] : options) {
            if (key == name) {
                return val;
            }
        }
        return {};
    }

    const ir::storage_options* backend_options(const ir::field& f, const ir::config& config) {
        auto it = f.storage.find(ir::to_string(config.storage));
        return it != f.storage.end() ? &it->second : nullptr;
    }

    std::string ts_type(const ir::field& f) {
        switch (f.type) {
            case ir::field_type::string:
            case ir::field_type::reference:
                return "string";
            case ir::field_type::number:
            case ir::field_type::decimal:
                return "number";
            case ir::field_type::boolean:
                return "boolean";
            case ir::field_type::date:
                return "Date";
            case ir::field_type::enumeration: {
                std::vector<std::string> quoted;
                for (const auto& v : f.values) {
                    quoted.push_back(single_quoted(v));
                }
                return join(quoted, " | ");
            }
        }
        return "unknown";
    }

    std::string mongoose_type(const ir::field& f) {
        switch (f.type) {
            case ir::field_type::string:
            case ir::field_type::enumeration:
                return "String";
            case ir::field_type::number:
                return "Number";
            case ir::field_type::boolean:
                return "Boolean";
            case ir::field_type::decimal:
                return "mongoose.Schema.Types.Decimal128";
            case ir::field_type::date:
                return "Date";
            case ir::field_type::reference:
                return "mongoose.Schema.Types.ObjectId";
        }
        return "mongoose.Schema.Types.Mixed";
    }

    std::string sequelize_type(const ir::field& f, const ir::config& config) {
        const ir::storage_options* options = backend_options(f, config);

        switch (f.type) {
            case ir::field_type::string: {
                std::string length = options ? option(*options, "length") : "";
                return length.empty() ? "DataTypes.STRING" : "DataTypes.STRING(" + length + ")";
            }
            case ir::field_type::number:
                return "DataTypes.DOUBLE";
            case ir::field_type::boolean:
                return "DataTypes.BOOLEAN";
            case ir::field_type::decimal: {
                std::string precision = options ? option(*options, "precision") : "";
                std::string scale = options ? option(*options, "scale") : "";
                if (precision.empty()) {
                    return "DataTypes.DECIMAL";
                }
                return "DataTypes.DECIMAL(" + precision + ", " + (scale.empty() ? "0" : scale) + ")";
            }
            case ir::field_type::date:
                return "DataTypes.DATE";
            case ir::field_type::reference:
                return "DataTypes.UUID";
            case ir::field_type::enumeration: {
                std::vector<std::string> quoted;
                for (const auto& v : f.values) {
                    quoted.push_back(single_quoted(v));
                }
                return "DataTypes.ENUM(" + join(quoted, ", ") + ")";
            }
        }
        return "DataTypes.JSON";
    }

    std::pair<std::string, std::string> openapi_type(const ir::field& f, const ir::config& config) {
        switch (f.type) {
            case ir::field_type::string:
            case ir::field_type::enumeration:
                return {"string", ""};
            case ir::field_type::number:
                return {"number", ""};
            case ir::field_type::decimal:
                return {"number", "double"};
            case ir::field_type::boolean:
                return {"boolean", ""};
            case ir::field_type::date:
                return {"string", "date-time"};
            case ir::field_type::reference:
                return {"string", config.storage == ir::storage_backend::mongodb ? "objectid" : "uuid"};
        }
        return {"string", ""};
    }

    std::string sample_text(const ir::field& f) {
        switch (f.type) {
            case ir::field_type::string:
                if (to_lower(f.name).find("email") != std::string::npos) {
                    return "user@example.com";
                }
                if (to_lower(f.name).find("password") != std::string::npos) {
                    return "S3cret-passw0rd";
                }
                return "sample " + f.name;
            case ir::field_type::number:
                return "1";
            case ir::field_type::decimal:
                return "9.99";
            case ir::field_type::boolean:
                return "true";
            case ir::field_type::date:
                return "2024-01-01T00:00:00.000Z";
            case ir::field_type::reference:
                return "000000000000000000000001";
            case ir::field_type::enumeration:
                return f.values.empty() ? "" : f.values.front();
        }
        return {};
    }

    std::string sequelize_hook(const std::string& event) {
        static const std::vector<std::pair<std::string, std::string>> names = {
            {"pre-save", "beforeSave"},       {"post-save", "afterSave"},
            {"pre-validate", "beforeValidate"}, {"post-validate", "afterValidate"},
            {"pre-remove", "beforeDestroy"},  {"post-remove", "afterDestroy"},
            {"pre-update", "beforeUpdate"},   {"post-update", "afterUpdate"},
            {"pre-find", "beforeFind"},       {"post-find", "afterFind"},
            {"pre-init", "beforeCreate"},     {"post-init", "afterCreate"},
        };
        for (const auto& [name, hook] : names) {
            if (name == event) {
                return hook;
            }
        }
        return event;
    }

    std::string mongoose_hook(const std::string& action) {
        if (action == "remove") return "deleteOne";
        if (action == "update") return "updateOne";
        return action;
    }

    // Field used to look an account up at login
    std::string login_field(const ir::model& model) {
        for (const char* preferred : {"email", "username"}) {
            if (model.find_field(preferred)) {
                return preferred;
            }
        }
        for (const auto& f : model.fields) {
            if (f.type == ir::field_type::string && f.unique && f.name != "password") {
                return f.name;
            }
        }
        for (const auto& f : model.fields) {
            if (f.type == ir::field_type::string && f.name != "password") {
                return f.name;
            }
        }
        return "id";
    }

    value field_context(const ir::field& f, const ir::config& config) {
        auto [api_type, api_format] = openapi_type(f, config);

        std::vector<std::string> quoted_values;
        for (const auto& v : f.values) {
            quoted_values.push_back(single_quoted(v));
        }

        value::list_type options;
        if (const auto* backend = backend_options(f, config)) {
            for (const auto& [key, val] : *backend) {
                options.push_back(value::make_map({{"name", key}, {"value", val}}));
            }
        }

        return value::make_map({
            {"name", f.name},
            {"description", f.description},
            {"type", std::string(ir::to_string(f.type))},
            {"ts_type", ts_type(f)},
            {"mongoose_type", mongoose_type(f)},
            {"sequelize_type", sequelize_type(f, config)},
            {"openapi_type", api_type},
            {"openapi_format", api_format},
            {"required", f.required},
            {"unique", f.unique},
            {"has_default", f.default_value.has_value()},
            {"default_literal", f.default_value ? typescript_literal(f.type, *f.default_value) : ""},
            {"is_enum", f.type == ir::field_type::enumeration},
            {"is_reference", f.type == ir::field_type::reference},
            {"is_string", f.type == ir::field_type::string},
            {"is_date", f.type == ir::field_type::date},
            {"is_password", f.name == "password"},
            {"values", string_list(f.values)},
            {"values_literal", join(quoted_values, ", ")},
            {"target", f.target},
            {"target_class", f.target.empty() ? "" : to_pascal_case(f.target)},
            {"target_file", f.target.empty() ? "" : ir::normalize_model_name(f.target)},
            {"storage_options", value::make_list(std::move(options))},
            {"sample", typescript_literal(f.type, sample_text(f))},
        });
    }

    value method_context(const ir::method& m) {
        value::list_type params;
        std::vector<std::string> signature;
        std::vector<std::string> args;
        for (const auto& p : m.params) {
            params.push_back(value::make_map({{"name", p.name}, {"type", p.type}}));
            signature.push_back(p.name + ": " + p.type);
            args.push_back(p.name);
        }

        return value::make_map({
            {"name", m.name},
            {"params", value::make_list(std::move(params))},
            {"signature", join(signature, ", ")},
            {"args", join(args, ", ")},
            {"returns", m.return_type.empty() ? "void" : m.return_type},
            {"description", m.description},
            {"body", m.body},
        });
    }

    value hook_context(const ir::hook& h, bool synthesized) {
        size_t dash = h.event.find('-');
        std::string phase = dash == std::string::npos ? h.event : h.event.substr(0, dash);
        std::string action = dash == std::string::npos ? "" : h.event.substr(dash + 1);

        return value::make_map({
            {"event", h.event},
            {"phase", phase},
            {"action", action},
            {"sequelize_hook", sequelize_hook(h.event)},
            {"mongoose_hook", mongoose_hook(action)},
            {"description", h.description},
            {"body", h.body},
            {"synthesized", synthesized},
        });
    }

    value relation_context(const ir::relation& r) {
        return value::make_map({
            {"name", r.name},
            {"target", r.target},
            {"target_class", to_pascal_case(r.target)},
            {"target_file", ir::normalize_model_name(r.target)},
            {"target_var", to_camel_case(r.target)},
            {"cardinality", std::string(ir::to_string(r.kind))},
            {"many", r.kind == ir::cardinality::many},
            {"ownership", std::string(ir::to_string(r.owner))},
            {"owning", r.owner == ir::ownership::owning},
        });
    }
}

std::string typescript_literal(ir::field_type type, const std::string& text) {
    switch (type) {
        case ir::field_type::number:
        case ir::field_type::decimal:
        case ir::field_type::boolean:
            return text;
        default:
            return single_quoted(text);
    }
}

value build_config_context(const ir::config& config) {
    bool sql = config.storage != ir::storage_backend::mongodb;

    return value::make_map({
        {"auth", std::string(ir::to_string(config.auth))},
        {"storage", std::string(ir::to_string(config.storage))},
        {"email", std::string(ir::to_string(config.email))},
        {"auth_enabled", config.auth != ir::auth_mode::none},
        {"email_enabled", config.email != ir::email_service::none},
        {"sql", sql},
        {"dialect", sql ? std::string(ir::to_string(config.storage)) : std::string()},
        {"cors", value::make_map({
            {"enabled", config.cors.enabled},
            {"origins", string_list(config.cors.origins)},
        })},
    });
}

value build_project_settings_context(const ir::config& config) {
    return value::make_map({
        {"name", config.project.name},
        {"package_name", to_kebab_case(config.project.name)},
        {"description", config.project.description},
        {"port", config.project.port},
    });
}

value build_model_context(const ir::schema& schema,
                          const ir::model& model,
                          const std::vector<ir::hook>& synthesized) {
    const ir::config& config = schema.config;

    value::list_type fields;
    std::vector<std::string> search_fields;
    std::vector<std::string> required_fields;
    for (const auto& f : model.fields) {
        fields.push_back(field_context(f, config));
        if (f.type == ir::field_type::string && f.name != "password") {
            search_fields.push_back(f.name);
        }
        if (f.required) {
            required_fields.push_back(f.name);
        }
    }

    value::list_type methods;
    for (const auto& m : model.methods) {
        methods.push_back(method_context(m));
    }

    value::list_type hooks;
    for (const auto& h : model.hooks) {
        hooks.push_back(hook_context(h, false));
    }
    for (const auto& h : synthesized) {
        hooks.push_back(hook_context(h, true));
    }

    value::list_type relations;
    for (const auto& r : model.relations) {
        relations.push_back(relation_context(r));
    }

    std::string var_name = to_camel_case(model.name);

    return value::make_map({
        {"name", model.name},
        {"class_name", to_pascal_case(model.name)},
        {"file_name", ir::normalize_model_name(model.name)},
        {"var_name", var_name},
        {"plural", pluralize(var_name)},
        {"route", pluralize(ir::normalize_model_name(model.name))},
        {"table_name", pluralize(to_snake_case(model.name))},
        {"description", model.description},
        {"fields", value::make_list(std::move(fields))},
        {"methods", value::make_list(std::move(methods))},
        {"hooks", value::make_list(std::move(hooks))},
        {"relations", value::make_list(std::move(relations))},
        {"features", value::make_map({
            {"auth", model.features.auth},
            {"audit", model.features.audit},
            {"search", model.features.search},
        })},
        {"has_password", model.find_field("password") != nullptr},
        {"hashes_password", model.features.auth && model.find_field("password") != nullptr},
        {"login_field", login_field(model)},
        {"search_fields", string_list(search_fields)},
        {"required_fields", string_list(required_fields)},
        {"config", build_config_context(config)},
        {"project", build_project_settings_context(config)},
    });
}

value build_project_context(const ir::schema& schema, const std::vector<value>& models) {
    value::list_type all_models(models.begin(), models.end());
    value::list_type auth_models;
    value::list_type search_models;

    for (size_t i = 0; i < schema.models.size() && i < models.size(); ++i) {
        if (schema.models[i].features.auth) {
            auth_models.push_back(models[i]);
        }
        if (schema.models[i].features.search) {
            search_models.push_back(models[i]);
        }
    }

    bool has_auth_models = !auth_models.empty();

    return value::make_map({
        {"project", build_project_settings_context(schema.config)},
        {"config", build_config_context(schema.config)},
        {"models", value::make_list(std::move(all_models))},
        {"auth_models", value::make_list(std::move(auth_models))},
        {"search_models", value::make_list(std::move(search_models))},
        {"has_auth_models", has_auth_models},
        {"generator", value::make_map({
            {"name", generator_name},
            {"version", generator_version},
        })},
    });
}

} // namespace quickform::generator
