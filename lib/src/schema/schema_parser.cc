#include <quickform/schema_parser.hh>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace quickform::schema {

namespace {

std::string key_of(const yaml_node::const_iterator& it) {
    return it.key().is_string() ? it.key().get_value<std::string>() : scalar_to_string(it.key());
}

std::string child(const std::string& where, const std::string& name) {
    return where.empty() ? name : where + "." + name;
}

std::string item(const std::string& where, size_t index) {
    return where + "[" + std::to_string(index) + "]";
}

} // anonymous namespace

SchemaParser::SchemaParser() = default;

SchemaParser::~SchemaParser() = default;

ir::schema SchemaParser::build_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw schema_error("cannot open schema file", path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return build_from_yaml(deserialize(buffer.str(), path.string()));
}

ir::schema SchemaParser::build_from_string(const std::string& schema_text,
                                           const std::string& config_text) {
    ir::schema result = build_from_yaml(deserialize(schema_text, "<schema>"));
    if (!config_text.empty()) {
        apply_config(result, config_text);
    }
    return result;
}

void SchemaParser::apply_config(ir::schema& target, const std::string& config_text) {
    yaml_node root = deserialize(config_text, "<config>");

    // Accept both a bare config mapping and a document with a `config:` key
    if (root.is_mapping() && root.contains("config")) {
        parse_config(root["config"], target.config, "config");
    } else {
        parse_config(root, target.config, "config");
    }
}

yaml_node SchemaParser::deserialize(const std::string& text, const std::string& what) {
    try {
        return yaml_node::deserialize(text);
    } catch (const fkyaml::exception& e) {
        throw schema_error("invalid YAML: " + std::string(e.what()), what);
    }
}

ir::schema SchemaParser::build_from_yaml(const yaml_node& root) {
    if (!root.is_mapping()) {
        malformed("", "schema document must be a mapping with a 'models' section");
    }
    require_known_keys(root, "", {"config", "models"});

    ir::schema result;
    result.config.source = {"config"};

    if (root.contains("config")) {
        parse_config(root["config"], result.config, "config");
    }

    if (!root.contains("models")) {
        malformed("", "missing required 'models' section");
    }
    parse_models(root["models"], result);

    return result;
}

// ============================================================================
// Config
// ============================================================================

void SchemaParser::parse_config(const yaml_node& node, ir::config& cfg, const std::string& where) {
    if (node.is_null()) {
        return;  // `config:` with no body keeps the defaults
    }
    require_mapping(node, where);
    require_known_keys(node, where, {"auth", "storage", "email", "cors", "project"});

    if (node.contains("auth")) {
        cfg.auth_name = require_string(node["auth"], child(where, "auth"));
    }
    if (node.contains("storage")) {
        cfg.storage_name = require_string(node["storage"], child(where, "storage"));
    }
    if (node.contains("email")) {
        cfg.email_name = require_string(node["email"], child(where, "email"));
    }

    if (node.contains("cors")) {
        const auto& cors = node["cors"];
        std::string cors_where = child(where, "cors");
        if (cors.is_boolean()) {
            cfg.cors.enabled = cors.get_value<bool>();
        } else {
            require_mapping(cors, cors_where);
            require_known_keys(cors, cors_where, {"enabled", "origins"});
            if (cors.contains("enabled")) {
                cfg.cors.enabled = require_bool(cors["enabled"], child(cors_where, "enabled"));
            }
            if (cors.contains("origins")) {
                cfg.cors.origins = require_string_list(cors["origins"], child(cors_where, "origins"));
            }
        }
    }

    if (node.contains("project")) {
        const auto& project = node["project"];
        std::string project_where = child(where, "project");
        require_mapping(project, project_where);
        require_known_keys(project, project_where, {"name", "description", "port"});

        if (project.contains("name")) {
            cfg.project.name = require_string(project["name"], child(project_where, "name"));
        }
        if (project.contains("description")) {
            cfg.project.description =
                require_string(project["description"], child(project_where, "description"));
        }
        if (project.contains("port")) {
            const auto& port = project["port"];
            if (!port.is_integer()) {
                malformed(child(project_where, "port"), "port must be an integer");
            }
            auto value = port.get_value<std::int64_t>();
            if (value <= 0 || value > 65535) {
                malformed(child(project_where, "port"),
                          "port " + std::to_string(value) + " is out of range 1-65535");
            }
            cfg.project.port = static_cast<int>(value);
        }
    }
}

// ============================================================================
// Models
// ============================================================================

void SchemaParser::parse_models(const yaml_node& models, ir::schema& target) {
    if (!models.is_mapping()) {
        malformed("models", "'models' must be a mapping of model name to definition");
    }

    // Iteration follows declaration order (ordered mapping)
    for (auto it = models.begin(); it != models.end(); ++it) {
        std::string name = key_of(it);
        target.models.push_back(build_model(name, *it));
    }
}

ir::model SchemaParser::build_model(const std::string& name, const yaml_node& node) {
    std::string where = child("models", name);

    ir::model result;
    result.name = name;
    result.source = {where};

    if (node.is_null()) {
        return result;  // no fields; reported by validation
    }
    require_mapping(node, where);
    require_known_keys(node, where,
                       {"description", "features", "fields", "methods", "hooks", "relations"});

    if (node.contains("description")) {
        result.description = require_string(node["description"], child(where, "description"));
    }

    if (node.contains("features")) {
        parse_features(node["features"], result, child(where, "features"));
    }

    if (node.contains("fields")) {
        parse_fields(node["fields"], result, child(where, "fields"));
    }

    if (node.contains("methods")) {
        const auto& methods = node["methods"];
        std::string methods_where = child(where, "methods");
        if (!methods.is_sequence()) {
            malformed(methods_where, "'methods' must be a sequence");
        }
        for (size_t i = 0; i < methods.size(); ++i) {
            result.methods.push_back(build_method(methods[i], item(methods_where, i)));
        }
    }

    if (node.contains("hooks")) {
        const auto& hooks = node["hooks"];
        std::string hooks_where = child(where, "hooks");
        if (!hooks.is_sequence()) {
            malformed(hooks_where, "'hooks' must be a sequence");
        }
        for (size_t i = 0; i < hooks.size(); ++i) {
            result.hooks.push_back(build_hook(hooks[i], item(hooks_where, i)));
        }
    }

    if (node.contains("relations")) {
        const auto& relations = node["relations"];
        std::string relations_where = child(where, "relations");
        if (!relations.is_sequence()) {
            malformed(relations_where, "'relations' must be a sequence");
        }
        for (size_t i = 0; i < relations.size(); ++i) {
            result.relations.push_back(
                build_relation(name, relations[i], item(relations_where, i)));
        }
    }

    return result;
}

void SchemaParser::parse_features(const yaml_node& node, ir::model& target, const std::string& where) {
    if (node.is_sequence()) {
        target.feature_names = require_string_list(node, where);
        return;
    }

    // Mapping form: { auth: true, search: false }
    if (node.is_mapping()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string feature = key_of(it);
            if (require_bool(*it, child(where, feature))) {
                target.feature_names.push_back(feature);
            }
        }
        return;
    }

    malformed(where, "'features' must be a sequence of names or a mapping of name to boolean");
}

// ============================================================================
// Fields
// ============================================================================

void SchemaParser::parse_fields(const yaml_node& fields, ir::model& target, const std::string& where) {
    if (fields.is_null()) {
        return;
    }

    if (fields.is_mapping()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            std::string name = key_of(it);
            target.fields.push_back(build_field(name, *it, child(where, name)));
        }
        return;
    }

    // Sequence form: [ { name: email, type: string }, ... ]
    if (fields.is_sequence()) {
        for (size_t i = 0; i < fields.size(); ++i) {
            const auto& entry = fields[i];
            std::string entry_where = item(where, i);
            require_mapping(entry, entry_where);
            if (!entry.contains("name")) {
                malformed(entry_where, "field entry requires a 'name'");
            }
            std::string name = require_string(entry["name"], child(entry_where, "name"));
            target.fields.push_back(build_field(name, entry, entry_where));
        }
        return;
    }

    malformed(where, "'fields' must be a mapping or a sequence of field entries");
}

ir::field SchemaParser::build_field(const std::string& name, const yaml_node& node,
                                    const std::string& where) {
    ir::field result;
    result.name = name;
    result.source = {where};

    // Scalar shorthand: `password: string`
    if (node.is_string()) {
        result.type_name = node.get_value<std::string>();
        return result;
    }

    require_mapping(node, where);
    require_known_keys(node, where, {"name", "type", "values", "target", "storage",
                                     "required", "unique", "default", "description"});

    if (!node.contains("type")) {
        malformed(where, "field '" + name + "' has no 'type'");
    }
    result.type_name = require_string(node["type"], child(where, "type"));

    if (node.contains("values")) {
        const auto& values = node["values"];
        if (!values.is_sequence()) {
            malformed(child(where, "values"), "'values' must be a sequence");
        }
        for (size_t i = 0; i < values.size(); ++i) {
            if (!values[i].is_scalar()) {
                malformed(item(child(where, "values"), i), "enum value must be a scalar");
            }
            result.values.push_back(scalar_to_string(values[i]));
        }
    }

    if (node.contains("target")) {
        result.target = require_string(node["target"], child(where, "target"));
    }

    if (node.contains("storage")) {
        const auto& storage = node["storage"];
        std::string storage_where = child(where, "storage");
        require_mapping(storage, storage_where);

        for (auto it = storage.begin(); it != storage.end(); ++it) {
            std::string backend = key_of(it);
            std::string backend_where = child(storage_where, backend);
            const auto& options = *it;
            require_mapping(options, backend_where);

            ir::storage_options parsed;
            for (auto opt = options.begin(); opt != options.end(); ++opt) {
                std::string option = key_of(opt);
                if (!(*opt).is_scalar()) {
                    malformed(child(backend_where, option), "storage option must be a scalar literal");
                }
                parsed.emplace_back(option, scalar_to_string(*opt));
            }
            result.storage[backend] = std::move(parsed);
        }
    }

    if (node.contains("required")) {
        result.required = require_bool(node["required"], child(where, "required"));
    }
    if (node.contains("unique")) {
        result.unique = require_bool(node["unique"], child(where, "unique"));
    }

    if (node.contains("default")) {
        const auto& value = node["default"];
        if (!value.is_scalar()) {
            malformed(child(where, "default"), "default must be a scalar literal");
        }
        if (!value.is_null()) {
            result.default_value = scalar_to_string(value);
        }
    }

    if (node.contains("description")) {
        result.description = require_string(node["description"], child(where, "description"));
    }

    return result;
}

// ============================================================================
// Methods, Hooks, Relations
// ============================================================================

ir::method SchemaParser::build_method(const yaml_node& node, const std::string& where) {
    require_mapping(node, where);
    require_known_keys(node, where, {"name", "params", "returns", "description", "body"});

    if (!node.contains("name")) {
        malformed(where, "method requires a 'name'");
    }

    ir::method result;
    result.name = require_string(node["name"], child(where, "name"));
    result.source = {where};

    if (node.contains("params")) {
        const auto& params = node["params"];
        std::string params_where = child(where, "params");
        if (!params.is_sequence()) {
            malformed(params_where, "'params' must be a sequence");
        }
        for (size_t i = 0; i < params.size(); ++i) {
            const auto& param = params[i];
            std::string param_where = item(params_where, i);
            require_mapping(param, param_where);
            require_known_keys(param, param_where, {"name", "type"});
            if (!param.contains("name") || !param.contains("type")) {
                malformed(param_where, "parameter requires 'name' and 'type'");
            }
            result.params.push_back({
                require_string(param["name"], child(param_where, "name")),
                require_string(param["type"], child(param_where, "type"))
            });
        }
    }

    if (node.contains("returns")) {
        result.return_type = require_string(node["returns"], child(where, "returns"));
    }
    if (node.contains("description")) {
        result.description = require_string(node["description"], child(where, "description"));
    }
    if (node.contains("body")) {
        result.body = require_string(node["body"], child(where, "body"));
    }

    return result;
}

ir::hook SchemaParser::build_hook(const yaml_node& node, const std::string& where) {
    require_mapping(node, where);
    require_known_keys(node, where, {"event", "description", "body"});

    if (!node.contains("event")) {
        malformed(where, "hook requires an 'event'");
    }

    ir::hook result;
    result.event = require_string(node["event"], child(where, "event"));
    result.source = {where};

    if (node.contains("description")) {
        result.description = require_string(node["description"], child(where, "description"));
    }
    if (node.contains("body")) {
        result.body = require_string(node["body"], child(where, "body"));
    }

    return result;
}

ir::relation SchemaParser::build_relation(const std::string& source, const yaml_node& node,
                                          const std::string& where) {
    require_mapping(node, where);
    require_known_keys(node, where, {"target", "cardinality", "ownership", "name"});

    if (!node.contains("target")) {
        malformed(where, "relation requires a 'target'");
    }

    ir::relation result;
    result.source_model = source;
    result.target = require_string(node["target"], child(where, "target"));
    result.cardinality_name = "one";
    result.ownership_name = "owning";
    result.source = {where};

    if (node.contains("cardinality")) {
        result.cardinality_name = require_string(node["cardinality"], child(where, "cardinality"));
    }
    if (node.contains("ownership")) {
        result.ownership_name = require_string(node["ownership"], child(where, "ownership"));
    }
    if (node.contains("name")) {
        result.name = require_string(node["name"], child(where, "name"));
    }

    return result;
}

// ============================================================================
// Helpers
// ============================================================================

void SchemaParser::malformed(const std::string& where, const std::string& message) {
    throw schema_error(message, where);
}

std::string SchemaParser::require_string(const yaml_node& node, const std::string& where) {
    if (node.is_string()) {
        return node.get_value<std::string>();
    }
    // Plain scalars such as `port: 3000` under a string key are still accepted
    if (node.is_scalar() && !node.is_null()) {
        return scalar_to_string(node);
    }
    malformed(where, "expected a string");
}

bool SchemaParser::require_bool(const yaml_node& node, const std::string& where) {
    if (!node.is_boolean()) {
        malformed(where, "expected true or false");
    }
    return node.get_value<bool>();
}

std::vector<std::string> SchemaParser::require_string_list(const yaml_node& node,
                                                           const std::string& where) {
    if (!node.is_sequence()) {
        malformed(where, "expected a sequence of strings");
    }

    std::vector<std::string> result;
    for (size_t i = 0; i < node.size(); ++i) {
        result.push_back(require_string(node[i], item(where, i)));
    }
    return result;
}

void SchemaParser::require_mapping(const yaml_node& node, const std::string& where) {
    if (!node.is_mapping()) {
        malformed(where, "expected a mapping");
    }
}

void SchemaParser::require_known_keys(const yaml_node& node, const std::string& where,
                                      std::initializer_list<const char*> allowed) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = key_of(it);
        bool known = std::any_of(allowed.begin(), allowed.end(),
            [&key](const char* name) { return key == name; });
        if (!known) {
            malformed(child(where, key), "unknown key '" + key + "'");
        }
    }
}

} // namespace quickform::schema
