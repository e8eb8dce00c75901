#include "driver.hh"
#include <quickform/errors.hh>
#include <quickform/output_manager.hh>
#include <quickform/validation.hh>
#include <filesystem>
#include <iostream>

namespace quickform::driver {

namespace {
    generator::generator_options make_generator_options(const GeneratorOptions& options) {
        generator::generator_options opts;
        opts.jobs = options.jobs;
        opts.template_dir = options.template_dir;
        return opts;
    }
}

Driver::Driver(const GeneratorOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
    , generator_(make_generator_options(options))
{
}

int Driver::run() {
    switch (options_.mode) {
        case RunMode::Help:
            print_help("qf");
            return exit_success;
        case RunMode::Version:
            print_version();
            return exit_success;
        case RunMode::ListTemplates:
            warn_missing_template_dir();
            print_templates(options_.template_dir);
            return exit_success;
        case RunMode::Generate:
        case RunMode::Check:
        case RunMode::PrintOutputs:
            break;
    }

    try {
        // Stage 1: Parse and validate
        auto schema = load_schema();
        if (!schema) {
            return exit_schema_failure;
        }

        if (options_.mode == RunMode::Check) {
            logger_.success("Schema is valid: " + std::to_string(schema->models.size()) + " model(s)");
            return exit_success;
        }

        // Stage 2: Render
        auto result = generate(*schema);
        if (!result) {
            return exit_failure;
        }

        if (options_.mode == RunMode::PrintOutputs) {
            return print_outputs(*result);
        }

        // Stage 3: Commit
        write_output(*result);
        return exit_success;

    } catch (const io_error& e) {
        logger_.error(std::string("Output error: ") + e.what());
        logger_.error("Nothing was written to " + options_.output_dir.string());
        return exit_failure;
    } catch (const template_error& e) {
        logger_.error(std::string("Template error: ") + e.what());
        return exit_failure;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return exit_failure;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

std::optional<ir::schema> Driver::load_schema() {
    logger_.verbose("Loading: " + options_.schema_file.string());
    if (options_.config_file) {
        logger_.verbose("Config: " + options_.config_file->string());
    }

    validation::validation_options opts;
    opts.warnings_as_errors = options_.warnings_as_errors;
    opts.suppress_warnings = options_.suppress_all_warnings;
    opts.disabled_warnings = options_.disabled_warnings;

    std::vector<diagnostic> warnings;
    try {
        ir::schema schema = validation::load_schema(options_.schema_file, options_.config_file,
                                                    opts, &warnings);
        print_diagnostics(warnings);
        return schema;
    } catch (const schema_error& e) {
        print_diagnostics(e.diagnostics());
        return std::nullopt;
    }
}

std::optional<generator::generation_result> Driver::generate(const ir::schema& schema) {
    logger_.verbose("Generating " + std::to_string(schema.models.size()) + " model(s)...");
    warn_missing_template_dir();
    for (const auto& source : generator_.resolver().source_names()) {
        logger_.debug("template source: " + source);
    }

    auto result = generator_.generate(schema);

    if (!result.ok()) {
        for (const auto& failure : result.failures) {
            logger_.report(failure);
        }
        logger_.error("Generation failed with " + std::to_string(result.failures.size()) +
                      " error(s); nothing was written");
        return std::nullopt;
    }

    logger_.verbose("Rendered " + std::to_string(result.artifacts.size()) + " file(s)");
    return result;
}

void Driver::write_output(const generator::generation_result& result) {
    output::commit_options opts;
    opts.policy = options_.on_conflict;

    output::OutputManager out(options_.output_dir, opts);
    auto report = out.commit(result);

    for (const auto& entry : report.entries) {
        logger_.bullet(output::to_string(entry.action) + ": " + entry.path, LogLevel::Verbose);
    }

    logger_.success("Wrote " + std::to_string(report.changed()) + " file(s) to " +
                    options_.output_dir.string() + " (" +
                    std::to_string(report.count(output::commit_action::unchanged)) + " unchanged, " +
                    std::to_string(report.count(output::commit_action::skip)) + " skipped)");
}

// ============================================================================
// Utility Methods
// ============================================================================

void Driver::print_diagnostics(const std::vector<diagnostic>& diagnostics) {
    for (const auto& diag : diagnostics) {
        logger_.report(diag);
    }
    logger_.summary(diagnostics);
}

void Driver::warn_missing_template_dir() {
    if (options_.template_dir && !std::filesystem::is_directory(*options_.template_dir)) {
        logger_.warning("template directory '" + options_.template_dir->string() +
                        "' does not exist; using built-in templates only");
    }
}

int Driver::print_outputs(const generator::generation_result& result) {
    for (const auto& a : result.artifacts) {
        if (options_.output_dir.empty()) {
            std::cout << a.path() << "\n";
        } else {
            std::cout << (options_.output_dir / a.path()).generic_string() << "\n";
        }
    }
    return exit_success;
}

} // namespace quickform::driver
