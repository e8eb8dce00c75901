#include <quickform/hook_registry.hh>

namespace quickform::generator {

const char* to_string(extension_point point) {
    switch (point) {
        case extension_point::before_model: return "before-model";
        case extension_point::after_model: return "after-model";
        case extension_point::before_project: return "before-project";
        case extension_point::after_project: return "after-project";
    }
    return "?";
}

void HookRegistry::add(extension_point point, std::string name, hook_fn fn, int priority) {
    chains_[index_of(point)].add(std::move(name), priority, std::move(fn));
}

void HookRegistry::run(hook_context& ctx) const {
    const auto& chain = chains_[index_of(ctx.point())];

    for (const auto& link : chain.links()) {
        try {
            link.item(ctx);
        } catch (const extension_error&) {
            throw;
        } catch (const std::exception& e) {
            throw extension_error(link.name, to_string(ctx.point()), e.what());
        }
    }
}

size_t HookRegistry::count(extension_point point) const {
    return chains_[index_of(point)].size();
}

std::vector<std::string> HookRegistry::names(extension_point point) const {
    return chains_[index_of(point)].names();
}

} // namespace quickform::generator
