#include <quickform/generator.hh>
#include <quickform/context_builder.hh>
#include <algorithm>
#include <atomic>
#include <thread>

namespace quickform::generator {

// ============================================================================
// Planning
// ============================================================================

std::vector<planned_artifact> plan_model_artifacts(const ir::model& model, const ir::config& config) {
    std::vector<planned_artifact> plan;

    switch (config.storage) {
        case ir::storage_backend::mongodb:
            plan.push_back({"model.mongoose", "src/models/{{file_name}}.model.ts"});
            break;
        case ir::storage_backend::postgres:
        case ir::storage_backend::sqlite:
            plan.push_back({"model.sequelize", "src/models/{{file_name}}.model.ts"});
            break;
    }

    plan.push_back({"handler", "src/handlers/{{file_name}}.handler.ts"});
    plan.push_back({"test", "tests/{{file_name}}.test.ts"});

    if (model.features.search) {
        plan.push_back({"search-index", "src/search/{{file_name}}.search.ts"});
    }

    return plan;
}

std::vector<planned_artifact> plan_project_artifacts(const ir::schema& schema) {
    std::vector<planned_artifact> plan = {
        {"app", "src/app.ts"},
        {"server", "src/server.ts"},
        {"routes", "src/routes.ts"},
        {"config", "src/config.ts"},
        {"database", "src/database.ts"},
        {"package", "package.json"},
        {"tsconfig", "tsconfig.json"},
        {"env", ".env.example"},
        {"openapi", "docs/openapi.yaml"},
        {"readme", "README.md"},
    };

    bool any_auth_model = std::any_of(schema.models.begin(), schema.models.end(),
        [](const ir::model& m) { return m.features.auth; });

    switch (schema.config.auth) {
        case ir::auth_mode::none:
            break;
        case ir::auth_mode::jwt:
        case ir::auth_mode::session:
            if (any_auth_model) {
                plan.push_back({"auth-middleware", "src/middleware/auth.ts"});
            }
            break;
    }

    switch (schema.config.email) {
        case ir::email_service::none:
            break;
        case ir::email_service::resend:
        case ir::email_service::sendgrid:
        case ir::email_service::mailgun:
            plan.push_back({"mailer", "src/services/mailer.ts"});
            break;
    }

    return plan;
}

std::vector<std::string> known_template_ids() {
    return {
        "app", "audit-hook", "auth-middleware", "config", "credential-hook", "database",
        "env", "handler", "mailer", "model.mongoose", "model.sequelize", "openapi",
        "package", "readme", "routes", "search-index", "server", "test", "tsconfig",
    };
}

std::string generation_failure::format() const {
    std::string where = kind == failure_kind::extension ? "hook '" : "template '";
    where += template_id + "'";
    if (!model.empty()) {
        where += " for model '" + model + "'";
    }
    return where + ": " + message;
}

// ============================================================================
// Generator
// ============================================================================

namespace {
    struct model_job {
        bool ready = false;
        value context;
        std::vector<planned_artifact> plan;
    };

    struct model_slot {
        std::vector<artifact> artifacts;
        std::vector<generation_failure> failures;
    };

    generation_failure render_failure(const std::string& id, const std::string& model, const std::exception& e) {
        return generation_failure{failure_kind::render, id, model, e.what()};
    }

    generation_failure hook_failure(const extension_error& e, const std::string& model) {
        return generation_failure{failure_kind::extension, e.hook_name(), model, e.what()};
    }
}

Generator::Generator(generator_options opts)
    : opts_(std::move(opts)),
      resolver_(std::make_unique<templates::TemplateResolver>(opts_.template_dir)),
      renderer_([this](const std::string& id) -> const std::string& { return resolver_->resolve(id); }) {}

size_t Generator::worker_count(size_t jobs) const {
    size_t workers = opts_.jobs;
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
        if (workers == 0) {
            workers = 4;
        }
    }
    return std::max<size_t>(1, std::min(workers, jobs));
}

generation_result Generator::generate(const ir::schema& schema) const {
    generation_result result;
    ArtifactSink sink;

    const size_t count = schema.models.size();
    std::vector<model_job> jobs(count);
    std::vector<model_slot> slots(count);

    auto render_artifact = [this](const planned_artifact& planned, const value& context) {
        std::string path = renderer_.render(planned.template_id + ":path", planned.path_template, context);
        std::string content = renderer_.render(planned.template_id,
                                               resolver_->resolve(planned.template_id), context);
        return artifact(std::move(path), std::move(content), planned.template_id);
    };

    // Contexts and before-model hooks run on the calling thread, in model order
    for (size_t i = 0; i < count; ++i) {
        const ir::model& model = schema.models[i];
        model_job& job = jobs[i];
        job.context = build_model_context(schema, model);

        std::vector<ir::hook> synthesized;
        std::string current_partial;
        try {
            if (model.features.auth && model.find_field("password")) {
                current_partial = "credential-hook";
                synthesized.push_back(ir::hook{
                    "pre-save",
                    "Hash the password before it is stored",
                    renderer_.render(current_partial, resolver_->resolve(current_partial), job.context),
                    model.source
                });
            }
            if (model.features.audit) {
                current_partial = "audit-hook";
                synthesized.push_back(ir::hook{
                    "post-save",
                    "Record an audit entry after every save",
                    renderer_.render(current_partial, resolver_->resolve(current_partial), job.context),
                    model.source
                });
            }
        } catch (const template_error& e) {
            slots[i].failures.push_back(render_failure(e.template_id(), model.name, e));
            continue;
        }

        if (!synthesized.empty()) {
            job.context = build_model_context(schema, model, synthesized);
        }

        hook_context ctx(extension_point::before_model, schema, &model, job.context, sink);
        try {
            hooks_.run(ctx);
        } catch (const extension_error& e) {
            slots[i].failures.push_back(hook_failure(e, model.name));
            continue;
        }

        job.context = ctx.context();
        job.plan = plan_model_artifacts(model, schema.config);
        job.ready = true;
    }

    // Worker pool: each worker takes the next model index and fills its slot
    std::atomic<size_t> next_index{0};
    auto worker = [&]() {
        while (true) {
            size_t i = next_index.fetch_add(1);
            if (i >= count) {
                break;
            }
            if (!jobs[i].ready) {
                continue;
            }

            for (const auto& planned : jobs[i].plan) {
                try {
                    slots[i].artifacts.push_back(render_artifact(planned, jobs[i].context));
                } catch (const template_error& e) {
                    slots[i].failures.push_back(render_failure(e.template_id(), schema.models[i].name, e));
                } catch (const std::exception& e) {
                    slots[i].failures.push_back(render_failure(planned.template_id, schema.models[i].name, e));
                }
            }
        }
    };

    size_t workers = worker_count(count);
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t t = 0; t < workers; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    // After-model hooks once every model is rendered, in declaration order.
    // Context they add is visible to the project templates.
    std::vector<value> model_contexts;
    for (size_t i = 0; i < count; ++i) {
        const ir::model& model = schema.models[i];
        value model_context = jobs[i].context;

        if (jobs[i].ready) {
            hook_context ctx(extension_point::after_model, schema, &model, jobs[i].context, sink);
            try {
                hooks_.run(ctx);
                model_context = ctx.context();
            } catch (const extension_error& e) {
                slots[i].failures.push_back(hook_failure(e, model.name));
            }
        }
        model_contexts.push_back(std::move(model_context));

        for (auto& a : slots[i].artifacts) {
            result.artifacts.push_back(std::move(a));
        }
        for (auto& f : slots[i].failures) {
            result.failures.push_back(std::move(f));
        }
    }

    // Project-level artifacts see the whole schema
    value project_context = build_project_context(schema, model_contexts);
    {
        hook_context ctx(extension_point::before_project, schema, nullptr, project_context, sink);
        try {
            hooks_.run(ctx);
            project_context = ctx.context();
        } catch (const extension_error& e) {
            result.failures.push_back(hook_failure(e, ""));
        }
    }

    for (const auto& planned : plan_project_artifacts(schema)) {
        try {
            result.artifacts.push_back(render_artifact(planned, project_context));
        } catch (const template_error& e) {
            result.failures.push_back(render_failure(e.template_id(), "", e));
        } catch (const std::exception& e) {
            result.failures.push_back(render_failure(planned.template_id, "", e));
        }
    }

    {
        hook_context ctx(extension_point::after_project, schema, nullptr, project_context, sink);
        try {
            hooks_.run(ctx);
        } catch (const extension_error& e) {
            result.failures.push_back(hook_failure(e, ""));
        }
    }

    for (const auto& a : sink.artifacts()) {
        result.artifacts.push_back(a);
    }

    std::stable_sort(result.artifacts.begin(), result.artifacts.end(),
        [](const artifact& a, const artifact& b) { return a.path() < b.path(); });

    return result;
}

} // namespace quickform::generator
