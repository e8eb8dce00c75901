#pragma once

#include <quickform/errors.hh>
#include <quickform/ir.hh>
#include <quickform/yaml.hh>
#include <filesystem>
#include <string>

namespace quickform::schema {

/**
 * Decodes a YAML schema document into the (not yet validated) IR.
 *
 * This is the structural step only: it checks that the document has the
 * expected shape (mappings where mappings are expected, a type for every field,
 * a name for every method...) and copies values into ir::schema. Any structural
 * problem throws a schema_error with exactly one E000 diagnostic; no semantic
 * rule is checked here (see validation::validate).
 *
 * Example usage:
 *   SchemaParser parser;
 *   ir::schema parsed = parser.build_from_file("shop.yaml");
 *
 *   auto result = validation::validate(parsed);
 *   if (has_errors(result.diagnostics)) { ... }
 */
class SchemaParser {
public:
    SchemaParser();
    ~SchemaParser();

    /**
     * Build IR from a schema file.
     *
     * @param path Path to the YAML (or JSON) schema
     * @return Unvalidated schema
     * @throws schema_error for unreadable files and malformed documents
     */
    ir::schema build_from_file(const std::filesystem::path& path);

    /**
     * Build IR from schema text.
     *
     * @param schema_text Schema document
     * @param config_text Optional separate config document; its keys override the
     *                    schema's `config:` section
     */
    ir::schema build_from_string(const std::string& schema_text,
                                 const std::string& config_text = {});

    /// Build IR from an already parsed document (for testing)
    ir::schema build_from_yaml(const yaml_node& root);

    /// Apply a config document on top of an already parsed schema
    void apply_config(ir::schema& target, const std::string& config_text);

private:
    // Parse config section -> ir::config (only keys present are changed)
    void parse_config(const yaml_node& node, ir::config& cfg, const std::string& where);

    // Parse models section -> ir::model list in declaration order
    void parse_models(const yaml_node& models, ir::schema& target);

    ir::model build_model(const std::string& name, const yaml_node& node);

    void parse_fields(const yaml_node& fields, ir::model& target, const std::string& where);

    ir::field build_field(const std::string& name, const yaml_node& node,
                          const std::string& where);

    ir::method build_method(const yaml_node& node, const std::string& where);

    ir::hook build_hook(const yaml_node& node, const std::string& where);

    ir::relation build_relation(const std::string& source, const yaml_node& node,
                                const std::string& where);

    void parse_features(const yaml_node& node, ir::model& target, const std::string& where);

    // Throw the single structural diagnostic
    [[noreturn]] void malformed(const std::string& where, const std::string& message);

    // Typed accessors that report a structural error on a kind mismatch
    std::string require_string(const yaml_node& node, const std::string& where);
    bool require_bool(const yaml_node& node, const std::string& where);
    std::vector<std::string> require_string_list(const yaml_node& node, const std::string& where);
    void require_mapping(const yaml_node& node, const std::string& where);
    void require_known_keys(const yaml_node& node, const std::string& where,
                            std::initializer_list<const char*> allowed);

    static yaml_node deserialize(const std::string& text, const std::string& what);
};

} // namespace quickform::schema
