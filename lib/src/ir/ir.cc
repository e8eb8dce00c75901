//
// IR enumeration helpers and lookups
//

#include <quickform/ir.hh>
#include <quickform/string_utils.hh>
#include <algorithm>

namespace quickform::ir {

namespace {
    template<typename Enum, size_t N>
    std::optional<Enum> lookup(const std::string& text,
                               const std::pair<const char*, Enum> (&table)[N]) {
        std::string key = to_lower(trim(text));
        for (const auto& [name, value] : table) {
            if (key == name) {
                return value;
            }
        }
        return std::nullopt;
    }

    template<typename Enum, size_t N>
    const char* name_of(Enum value, const std::pair<const char*, Enum> (&table)[N]) {
        for (const auto& [name, entry] : table) {
            if (entry == value) {
                return name;
            }
        }
        return "?";
    }

    template<typename Enum, size_t N>
    std::vector<std::string> names(const std::pair<const char*, Enum> (&table)[N]) {
        std::vector<std::string> result;
        for (const auto& [name, _] : table) {
            result.emplace_back(name);
        }
        return result;
    }

    constexpr std::pair<const char*, auth_mode> auth_modes[] = {
        {"none", auth_mode::none},
        {"jwt", auth_mode::jwt},
        {"session", auth_mode::session},
    };

    constexpr std::pair<const char*, storage_backend> storage_backends[] = {
        {"mongodb", storage_backend::mongodb},
        {"postgres", storage_backend::postgres},
        {"sqlite", storage_backend::sqlite},
    };

    constexpr std::pair<const char*, email_service> email_services[] = {
        {"none", email_service::none},
        {"resend", email_service::resend},
        {"sendgrid", email_service::sendgrid},
        {"mailgun", email_service::mailgun},
    };

    constexpr std::pair<const char*, field_type> field_types[] = {
        {"string", field_type::string},
        {"number", field_type::number},
        {"boolean", field_type::boolean},
        {"enum", field_type::enumeration},
        {"decimal", field_type::decimal},
        {"date", field_type::date},
        {"reference", field_type::reference},
    };

    constexpr std::pair<const char*, cardinality> cardinalities[] = {
        {"one", cardinality::one},
        {"many", cardinality::many},
    };

    constexpr std::pair<const char*, ownership> ownerships[] = {
        {"owning", ownership::owning},
        {"owned", ownership::owned},
    };
}

std::optional<auth_mode> parse_auth_mode(const std::string& text) {
    return lookup(text, auth_modes);
}

std::optional<storage_backend> parse_storage_backend(const std::string& text) {
    return lookup(text, storage_backends);
}

std::optional<email_service> parse_email_service(const std::string& text) {
    return lookup(text, email_services);
}

const char* to_string(auth_mode mode) { return name_of(mode, auth_modes); }
const char* to_string(storage_backend backend) { return name_of(backend, storage_backends); }
const char* to_string(email_service service) { return name_of(service, email_services); }

std::vector<std::string> auth_mode_names() { return names(auth_modes); }
std::vector<std::string> storage_backend_names() { return names(storage_backends); }
std::vector<std::string> email_service_names() { return names(email_services); }

std::optional<field_type> parse_field_type(const std::string& text) {
    return lookup(text, field_types);
}

const char* to_string(field_type type) { return name_of(type, field_types); }
std::vector<std::string> field_type_names() { return names(field_types); }

std::optional<cardinality> parse_cardinality(const std::string& text) {
    return lookup(text, cardinalities);
}

std::optional<ownership> parse_ownership(const std::string& text) {
    return lookup(text, ownerships);
}

const char* to_string(cardinality value) { return name_of(value, cardinalities); }
const char* to_string(ownership value) { return name_of(value, ownerships); }

const std::vector<std::string>& hook_events() {
    static const std::vector<std::string> events = [] {
        std::vector<std::string> result;
        for (const char* phase : {"pre", "post"}) {
            for (const char* action : {"save", "validate", "remove", "update", "find", "init"}) {
                result.push_back(std::string(phase) + "-" + action);
            }
        }
        return result;
    }();
    return events;
}

bool is_hook_event(const std::string& event) {
    const auto& events = hook_events();
    return std::find(events.begin(), events.end(), event) != events.end();
}

const field* model::find_field(const std::string& field_name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
        [&](const field& f) { return f.name == field_name; });
    return it != fields.end() ? &*it : nullptr;
}

const model* schema::find_model(const std::string& name) const {
    auto it = std::find_if(models.begin(), models.end(),
        [&](const model& m) { return m.name == name; });
    return it != models.end() ? &*it : nullptr;
}

std::string normalize_model_name(const std::string& name) {
    return to_kebab_case(name);
}

} // namespace quickform::ir
