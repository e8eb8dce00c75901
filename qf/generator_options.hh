#pragma once

#include "logger.hh"
#include <quickform/output_manager.hh>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace quickform::driver {

/// What a `qf` invocation does
enum class RunMode {
    Generate,       // Validate, render and commit (default)
    Check,          // Validate only
    PrintOutputs,   // Print the paths that would be written and exit
    ListTemplates,  // Print template identifiers and exit
    Help,
    Version
};

/// Generator options (driver configuration only)
struct GeneratorOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::filesystem::path schema_file;
    std::optional<std::filesystem::path> config_file;   // --config
    std::filesystem::path output_dir;                   // -o
    std::optional<std::filesystem::path> template_dir;  // -T

    // ========================================================================
    // Generation
    // ========================================================================

    output::conflict_policy on_conflict = output::conflict_policy::overwrite;
    size_t jobs = 0;                                    // -j, 0 = hardware concurrency

    // ========================================================================
    // Validation Options
    // ========================================================================

    bool warnings_as_errors = false;                    // -Werror
    bool suppress_all_warnings = false;                 // -w
    std::set<std::string> disabled_warnings;            // -Wno-W001

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                               // -v, --verbose
    bool debug = false;                                 // --debug
    bool quiet = false;                                 // -q, --quiet
    ColorMode color = ColorMode::Auto;                  // --no-color

    RunMode mode = RunMode::Generate;
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
GeneratorOptions parse_command_line(int argc, const char* const* argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print template identifiers; marks those overridden in `template_dir`
void print_templates(const std::optional<std::filesystem::path>& template_dir);

} // namespace quickform::driver
