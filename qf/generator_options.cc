#include "generator_options.hh"
#include <quickform/builtin_templates.hh>
#include <quickform/version.hh>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace quickform::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Value of "-o dir", "-odir", "--output dir" or "--output=dir"
static std::string take_value(int argc, const char* const* argv, int& i,
                              const char* short_name, const char* long_name) {
    const char* arg = argv[i];
    std::string value;
    bool attached = false;

    if (long_name && starts_with(arg, long_name)) {
        const char* rest = arg + std::strlen(long_name);
        if (*rest == '=') {
            value = rest + 1;
            attached = true;
        }
    } else if (short_name) {
        value = get_option_value(arg, short_name);
        attached = !value.empty();
    }

    if (!attached) {
        if (i + 1 >= argc) {
            throw std::runtime_error(std::string("Option ") + (long_name ? long_name : short_name) +
                                     " requires argument");
        }
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + (long_name ? long_name : short_name) +
                                 " requires argument");
    }
    return value;
}

static bool is_option(const char* arg, const char* short_name, const char* long_name) {
    if (short_name && starts_with(arg, short_name) && !starts_with(arg, "--")) {
        return true;
    }
    if (long_name) {
        size_t n = std::strlen(long_name);
        return std::strncmp(arg, long_name, n) == 0 && (arg[n] == '\0' || arg[n] == '=');
    }
    return false;
}

static size_t parse_jobs(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid job count: " + text);
    }
    try {
        return static_cast<size_t>(std::stoul(text));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid job count: " + text);
    }
}

// ============================================================================
// Main Parser
// ============================================================================

GeneratorOptions parse_command_line(int argc, const char* const* argv) {
    GeneratorOptions opts;
    bool have_output = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help and info
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            opts.mode = RunMode::Help;
            return opts;
        }

        if (std::strcmp(arg, "--version") == 0) {
            opts.mode = RunMode::Version;
            return opts;
        }

        if (std::strcmp(arg, "--list-templates") == 0) {
            opts.mode = RunMode::ListTemplates;
            continue;
        }

        // Modes
        if (std::strcmp(arg, "--check") == 0) {
            opts.mode = RunMode::Check;
            continue;
        }

        if (std::strcmp(arg, "--print-outputs") == 0) {
            opts.mode = RunMode::PrintOutputs;
            continue;
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            opts.verbose = true;
            opts.debug = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (std::strcmp(arg, "--no-color") == 0) {
            opts.color = ColorMode::Never;
            continue;
        }

        // Warning options
        if (std::strcmp(arg, "-Werror") == 0 || std::strcmp(arg, "--warnings-as-errors") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }

        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        if (starts_with(arg, "-Wno-")) {
            std::string warning = get_option_value(arg, "-Wno-");
            if (warning.empty()) {
                throw std::runtime_error("Option -Wno- requires a warning code");
            }
            opts.disabled_warnings.insert(warning);
            continue;
        }

        // Conflict policy
        if (is_option(arg, nullptr, "--on-conflict")) {
            std::string value = take_value(argc, argv, i, nullptr, "--on-conflict");
            auto policy = output::parse_conflict_policy(value);
            if (!policy) {
                throw std::runtime_error("Invalid conflict policy: " + value +
                                         "\nValid choices: overwrite, skip, merge");
            }
            opts.on_conflict = *policy;
            continue;
        }

        // Config document
        if (is_option(arg, nullptr, "--config")) {
            opts.config_file = take_value(argc, argv, i, nullptr, "--config");
            continue;
        }

        // Output directory
        if (is_option(arg, "-o", "--output")) {
            opts.output_dir = take_value(argc, argv, i, "-o", starts_with(arg, "--") ? "--output" : nullptr);
            have_output = true;
            continue;
        }

        // Template overrides
        if (is_option(arg, "-T", "--templates")) {
            opts.template_dir = take_value(argc, argv, i, "-T", starts_with(arg, "--") ? "--templates" : nullptr);
            continue;
        }

        // Worker threads
        if (is_option(arg, "-j", "--jobs")) {
            opts.jobs = parse_jobs(take_value(argc, argv, i, "-j", starts_with(arg, "--") ? "--jobs" : nullptr));
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Schema file
        if (!opts.schema_file.empty()) {
            throw std::runtime_error(std::string("Only one schema file may be given (extra: ") + arg + ")");
        }
        opts.schema_file = arg;
    }

    // Validation
    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (opts.mode == RunMode::ListTemplates) {
        return opts;
    }

    if (opts.schema_file.empty()) {
        throw std::runtime_error("No schema file specified");
    }

    if (opts.mode == RunMode::Generate && !have_output) {
        throw std::runtime_error("No output directory specified (use -o <dir>)");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <schema.yaml> -o <output-dir>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-templates        List template identifiers\n";
    std::cout << "\n";

    std::cout << "Input:\n";
    std::cout << "  --config <file>         Config document overriding the schema's config section\n";
    std::cout << "  -T, --templates <dir>   Template override directory (<dir>/<id>.tmpl)\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o, --output <dir>      Output directory (required)\n";
    std::cout << "  --on-conflict=<policy>  overwrite | skip | merge (default: overwrite)\n";
    std::cout << "  -j <N>                  Worker threads (default: 0 = hardware concurrency)\n";
    std::cout << "  --check                 Validate the schema only, write nothing\n";
    std::cout << "  --print-outputs         Print the files that would be written, write nothing\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  --debug                 Debug output (implies --verbose)\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --no-color              Disable colored output\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat all warnings as errors\n";
    std::cout << "  -Wno-<code>             Disable specific warning\n";
    std::cout << "\n";

    std::cout << "Exit codes:\n";
    std::cout << "  0  success\n";
    std::cout << "  1  schema parse or validation failure\n";
    std::cout << "  2  generation, template, hook or I/O failure, or invalid usage\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " shop.yaml -o build/shop\n";
    std::cout << "  " << program_name << " -T templates --on-conflict=merge shop.yaml -o build/shop\n";
    std::cout << "  " << program_name << " --check -Werror shop.yaml\n";
}

void print_version() {
    std::cout << generator_name << " v" << generator_version << "\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_templates(const std::optional<std::filesystem::path>& template_dir) {
    std::cout << "Built-in templates:\n\n";

    for (const auto& id : templates::list_builtin_templates()) {
        std::cout << "  " << id;
        if (template_dir) {
            std::error_code ec;
            if (std::filesystem::exists(*template_dir / (id + ".tmpl"), ec)) {
                std::cout << " (overridden)";
            }
        }
        std::cout << "\n";
    }
}

} // namespace quickform::driver
