//
// Phase 4: Hook events
//

#include <quickform/validation.hh>

namespace quickform::validation::phases {

void check_hooks(const ir::schema& schema, std::vector<diagnostic>& diagnostics) {
    for (const auto& m : schema.models) {
        for (const auto& h : m.hooks) {
            if (ir::is_hook_event(h.event)) {
                continue;
            }
            diagnostics.push_back(diagnostic{
                diagnostic_level::error,
                diag_codes::E_UNKNOWN_HOOK_EVENT,
                "hook on model '" + m.name + "' uses unknown event '" + h.event + "'",
                h.source,
                suggest(h.event, ir::hook_events())
            });
        }
    }
}

} // namespace quickform::validation::phases
