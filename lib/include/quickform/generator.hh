//
// Generation orchestrator
//
// Drives one generation run over a validated schema:
//
//   for each model (calling thread):  build context, synthesize feature hooks,
//                                     run before-model hooks
//   worker pool:                      render every planned model artifact
//   after the pool drains:            after-model hooks, in model order
//   project:                          before-project hooks, project artifacts,
//                                     after-project hooks
//
// Failures never stop the run; each one is recorded and the result is not ok().
// Artifacts come back sorted by output path, so identical inputs always produce
// identical results regardless of thread scheduling.
//

#pragma once

#include <quickform/artifact.hh>
#include <quickform/hook_registry.hh>
#include <quickform/ir.hh>
#include <quickform/renderer.hh>
#include <quickform/template_resolver.hh>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quickform::generator {

struct generator_options {
    /// Worker threads for model rendering; 0 = hardware concurrency
    size_t jobs = 0;

    /// Directory of `<identifier>.tmpl` overrides
    std::optional<std::filesystem::path> template_dir;
};

enum class failure_kind {
    render,     ///< template resolution or rendering failed
    extension   ///< a registered hook threw
};

struct generation_failure {
    failure_kind kind;
    std::string template_id;    ///< Template identifier, or hook name
    std::string model;          ///< Empty for project-level failures
    std::string message;

    [[nodiscard]] std::string format() const;
};

struct generation_result {
    std::vector<artifact> artifacts;
    std::vector<generation_failure> failures;

    [[nodiscard]] bool ok() const { return failures.empty(); }
};

/// One template to render and the (templated) output path it renders to.
struct planned_artifact {
    std::string template_id;
    std::string path_template;
};

/// Templates rendered for one model, chosen from its features and the config
std::vector<planned_artifact> plan_model_artifacts(const ir::model& model, const ir::config& config);

/// Project-level templates, chosen from the config and the model set
std::vector<planned_artifact> plan_project_artifacts(const ir::schema& schema);

/// Every template identifier a schema could need (for listings and checks)
std::vector<std::string> known_template_ids();

class Generator {
public:
    explicit Generator(generator_options opts = {});

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * Render all artifacts for a validated schema.
     *
     * Never throws for template or hook failures; those are reported in
     * generation_result::failures.
     */
    generation_result generate(const ir::schema& schema) const;

    [[nodiscard]] HookRegistry& hooks() { return hooks_; }
    [[nodiscard]] const HookRegistry& hooks() const { return hooks_; }

    [[nodiscard]] templates::TemplateResolver& resolver() { return *resolver_; }
    [[nodiscard]] const templates::TemplateResolver& resolver() const { return *resolver_; }

    [[nodiscard]] const generator_options& options() const { return opts_; }

private:
    generator_options opts_;
    std::unique_ptr<templates::TemplateResolver> resolver_;
    templates::Renderer renderer_;
    HookRegistry hooks_;

    [[nodiscard]] size_t worker_count(size_t jobs) const;
};

} // namespace quickform::generator
