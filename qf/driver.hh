#pragma once

#include "generator_options.hh"
#include "logger.hh"
#include <quickform/diagnostics.hh>
#include <quickform/generator.hh>
#include <quickform/ir.hh>
#include <optional>
#include <vector>

namespace quickform::driver {

/// Process exit codes of `qf`
enum ExitCode : int {
    exit_success = 0,
    exit_schema_failure = 1,    // schema parse or validation failure
    exit_failure = 2            // generation, template, hook or I/O failure; bad usage
};

/// Main generator driver
class Driver {
public:
    explicit Driver(const GeneratorOptions& options, Logger& logger);

    /// Run the pipeline selected by the options
    /// Returns one of ExitCode
    int run();

    /// Hooks registered here run during generation
    [[nodiscard]] generator::Generator& generator() { return generator_; }

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Stage 1: parse and validate; nullopt when the schema is rejected
    std::optional<ir::schema> load_schema();

    /// Stage 2: render every artifact; nullopt when any render or hook failed
    std::optional<generator::generation_result> generate(const ir::schema& schema);

    /// Stage 3: commit to the output directory
    void write_output(const generator::generation_result& result);

    // ========================================================================
    // Utility Methods
    // ========================================================================

    void print_diagnostics(const std::vector<diagnostic>& diagnostics);

    /// Warn when -T names a directory that does not exist
    void warn_missing_template_dir();

    int print_outputs(const generator::generation_result& result);

    // ========================================================================
    // State
    // ========================================================================

    const GeneratorOptions& options_;
    Logger& logger_;
    generator::Generator generator_;
};

} // namespace quickform::driver
