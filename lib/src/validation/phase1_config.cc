//
// Phase 1: Config selector resolution
//

#include <quickform/validation.hh>
#include <quickform/string_utils.hh>

namespace quickform::validation::phases {

namespace {
    template<typename Enum>
    void resolve(const std::string& selector,
                 const std::string& spelling,
                 std::optional<Enum> parsed,
                 const std::vector<std::string>& allowed,
                 Enum& target,
                 const ir::config& cfg,
                 std::vector<diagnostic>& diagnostics) {
        if (parsed) {
            target = *parsed;
            return;
        }

        diagnostics.push_back(diagnostic{
            diagnostic_level::error,
            diag_codes::E_INVALID_CONFIG,
            "config." + selector + " '" + spelling + "' is not one of: " + join(allowed, ", "),
            {cfg.source.path.empty() ? "config." + selector : cfg.source.path + "." + selector},
            suggest(to_lower(spelling), allowed)
        });
    }
}

void resolve_config(ir::schema& schema, std::vector<diagnostic>& diagnostics) {
    auto& cfg = schema.config;

    resolve("auth", cfg.auth_name, ir::parse_auth_mode(cfg.auth_name),
            ir::auth_mode_names(), cfg.auth, cfg, diagnostics);

    resolve("storage", cfg.storage_name, ir::parse_storage_backend(cfg.storage_name),
            ir::storage_backend_names(), cfg.storage, cfg, diagnostics);

    resolve("email", cfg.email_name, ir::parse_email_service(cfg.email_name),
            ir::email_service_names(), cfg.email, cfg, diagnostics);
}

} // namespace quickform::validation::phases
