//
// Intermediate Representation (IR) for quickform schemas
//
// Language-agnostic, in-memory form of a schema document. The parser builds it,
// the validator checks it and produces a validated copy, and the generator only
// ever reads it.
//

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quickform::ir {

// ============================================================================
// Source Location Tracking
// ============================================================================

/// Logical location of a schema element, used to name offenders in diagnostics.
/// YAML positions are not tracked; the location is a path through the document
/// such as "models.User.fields.email".
struct source_location {
    std::string path;

    [[nodiscard]] std::string format() const {
        return path.empty() ? "<schema>" : path;
    }
};

// ============================================================================
// Closed Configuration Enumerations
// ============================================================================

enum class auth_mode {
    none,
    jwt,
    session
};

enum class storage_backend {
    mongodb,
    postgres,
    sqlite
};

enum class email_service {
    none,
    resend,
    sendgrid,
    mailgun
};

/// Parse helpers return std::nullopt for spellings outside the enumeration.
std::optional<auth_mode> parse_auth_mode(const std::string& text);
std::optional<storage_backend> parse_storage_backend(const std::string& text);
std::optional<email_service> parse_email_service(const std::string& text);

const char* to_string(auth_mode mode);
const char* to_string(storage_backend backend);
const char* to_string(email_service service);

/// All spellings of an enumeration, in declaration order (for diagnostics).
std::vector<std::string> auth_mode_names();
std::vector<std::string> storage_backend_names();
std::vector<std::string> email_service_names();

// ============================================================================
// Fields
// ============================================================================

enum class field_type {
    string,
    number,
    boolean,
    enumeration,
    decimal,
    date,
    reference
};

std::optional<field_type> parse_field_type(const std::string& text);
const char* to_string(field_type type);
std::vector<std::string> field_type_names();

/// Options for one storage backend, in declaration order ("precision" -> "12").
using storage_options = std::vector<std::pair<std::string, std::string>>;

struct field {
    std::string name;

    /// Spelling from the document; resolved into `type` by the validator.
    std::string type_name;
    field_type type = field_type::string;

    /// Declared values of an enum field
    std::vector<std::string> values;

    /// Target model name of a reference field
    std::string target;

    /// Backend name -> options ("postgres" -> {{"precision", "12"}})
    std::map<std::string, storage_options> storage;

    bool required = false;
    bool unique = false;
    std::optional<std::string> default_value;

    std::string description;
    source_location source;
};

// ============================================================================
// Methods and Hooks
// ============================================================================

struct parameter {
    std::string name;
    std::string type;
};

/// A model method. The body is opaque text and is never interpreted.
struct method {
    std::string name;
    std::vector<parameter> params;
    std::string return_type;
    std::string description;
    std::string body;
    source_location source;
};

/// A lifecycle hook ("pre-save", "post-remove", ...). Same opacity rule as method.
struct hook {
    std::string event;
    std::string description;
    std::string body;
    source_location source;
};

/// Lifecycle vocabulary accepted for hook events.
const std::vector<std::string>& hook_events();
bool is_hook_event(const std::string& event);

// ============================================================================
// Relations
// ============================================================================

enum class cardinality {
    one,
    many
};

enum class ownership {
    owning,
    owned
};

struct relation {
    std::string source_model;
    std::string target;

    /// Spellings from the document; resolved by the validator
    std::string cardinality_name;
    std::string ownership_name;
    ir::cardinality kind = cardinality::one;
    ir::ownership owner = ownership::owning;

    /// Name of the generated property; empty means derived from the target
    std::string name;

    source_location source;
};

std::optional<cardinality> parse_cardinality(const std::string& text);
std::optional<ownership> parse_ownership(const std::string& text);
const char* to_string(cardinality value);
const char* to_string(ownership value);

// ============================================================================
// Models
// ============================================================================

struct model_features {
    bool auth = false;
    bool audit = false;
    bool search = false;
};

struct model {
    std::string name;
    std::string description;

    std::vector<field> fields;
    std::vector<method> methods;
    std::vector<hook> hooks;
    std::vector<relation> relations;

    model_features features;

    /// Feature names as written; unknown names are reported by the validator
    std::vector<std::string> feature_names;

    source_location source;

    [[nodiscard]] const field* find_field(const std::string& field_name) const;
};

// ============================================================================
// Config
// ============================================================================

struct cors_policy {
    bool enabled = false;
    std::vector<std::string> origins;
};

struct project_settings {
    std::string name = "app";
    std::string description;
    int port = 3000;
};

struct config {
    /// Selector spellings from the document; resolved by the validator
    std::string auth_name = "jwt";
    std::string storage_name = "mongodb";
    std::string email_name = "none";

    auth_mode auth = auth_mode::jwt;
    storage_backend storage = storage_backend::mongodb;
    email_service email = email_service::none;

    cors_policy cors;
    project_settings project;

    source_location source;
};

// ============================================================================
// Schema
// ============================================================================

/// Root aggregate: models in declaration order plus the global config.
struct schema {
    std::vector<model> models;
    ir::config config;

    [[nodiscard]] const model* find_model(const std::string& name) const;
};

/// Case-normalized model name used for artifact paths and uniqueness checks
/// ("OrderItem" -> "order-item").
std::string normalize_model_name(const std::string& name);

} // namespace quickform::ir
