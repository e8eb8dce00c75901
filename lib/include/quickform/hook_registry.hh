#pragma once

#include <quickform/artifact.hh>
#include <quickform/errors.hh>
#include <quickform/extension_chain.hh>
#include <quickform/ir.hh>
#include <quickform/value.hh>
#include <array>
#include <functional>
#include <string>
#include <vector>

namespace quickform::generator {

// ============================================================================
// Extension Points
// ============================================================================

enum class extension_point {
    before_model,
    after_model,
    before_project,
    after_project
};

/// "before-model", "after-model", ...
const char* to_string(extension_point point);

// ============================================================================
// Hook Context
// ============================================================================

/// Append-only collection of artifacts contributed by hooks.
class ArtifactSink {
public:
    void add(artifact a) { artifacts_.push_back(std::move(a)); }

    [[nodiscard]] const std::vector<artifact>& artifacts() const { return artifacts_; }

private:
    std::vector<artifact> artifacts_;
};

/**
 * What a hook sees at an extension point.
 *
 * Hooks may read the schema, the model (model points only) and the render
 * context, add new context keys, and emit extra artifacts. They cannot
 * overwrite existing context keys or touch artifacts produced by templates.
 *
 * Keys added at before-model reach that model's templates; keys added at
 * after-model reach the project templates through `models`.
 */
class hook_context {
public:
    hook_context(extension_point point,
                 const ir::schema& schema,
                 const ir::model* model,
                 value context,
                 ArtifactSink& sink)
        : point_(point), schema_(schema), model_(model),
          context_(std::move(context)), sink_(sink) {}

    [[nodiscard]] extension_point point() const { return point_; }
    [[nodiscard]] const ir::schema& schema() const { return schema_; }

    /// nullptr at project-level extension points
    [[nodiscard]] const ir::model* model() const { return model_; }

    [[nodiscard]] const value& context() const { return context_; }

    /// Add a new top-level context key. Throws std::invalid_argument if the
    /// key already exists.
    void add_context(const std::string& key, value v) {
        context_ = context_.with(key, std::move(v));
    }

    void emit(artifact a) { sink_.add(std::move(a)); }

private:
    extension_point point_;
    const ir::schema& schema_;
    const ir::model* model_;
    value context_;
    ArtifactSink& sink_;
};

// ============================================================================
// Hook Registry
// ============================================================================

/**
 * Named callbacks per extension point.
 *
 * Lower priority values run first; hooks with equal priority run in
 * registration order.
 *
 * **Usage Example:**
 * \code
 *   HookRegistry hooks;
 *   hooks.add(extension_point::after_project, "licence", [](hook_context& ctx) {
 *       ctx.emit(artifact("LICENSE", "MIT\n", "hook:licence"));
 *   });
 * \endcode
 */
class HookRegistry {
public:
    using hook_fn = std::function<void(hook_context&)>;

    void add(extension_point point, std::string name, hook_fn fn, int priority = 0);

    /**
     * Run every hook registered for `ctx.point()` in order.
     *
     * @throws extension_error naming the first hook that threw
     */
    void run(hook_context& ctx) const;

    [[nodiscard]] size_t count(extension_point point) const;
    [[nodiscard]] std::vector<std::string> names(extension_point point) const;

private:
    std::array<ExtensionChain<hook_fn>, 4> chains_;

    static size_t index_of(extension_point point) { return static_cast<size_t>(point); }
};

} // namespace quickform::generator
