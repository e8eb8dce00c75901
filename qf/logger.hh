#pragma once

#include <quickform/diagnostics.hh>
#include <quickform/generator.hh>
#include <iostream>
#include <string>
#include <vector>

namespace quickform::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + verbose messages
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * CLI logger with color support (termcolor).
 *
 * Errors, warnings and schema diagnostics go to the error stream; everything
 * else goes to the output stream. Both default to the process streams and can
 * be replaced to capture output.
 *
 * Diagnostics are printed as
 *   models.Order.relations[0]: error: relation 'Order' -> 'Shipment': target model not found [E004]
 *     suggestion: did you mean 'Shipping'?
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto,
                    std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    void bullet(const std::string& message, LogLevel min_level = LogLevel::Normal);

    /// One schema diagnostic; notes are informational and go to the output stream
    void report(const diagnostic& diag);

    /// One template or hook that failed during generation
    void report(const generator::generation_failure& failure);

    /// "N error(s), M warning(s)" for a batch; prints nothing for an empty batch
    void summary(const std::vector<diagnostic>& diagnostics);

private:
    LogLevel level_;
    std::ostream& out_;
    std::ostream& err_;

    bool should_log(LogLevel required_level) const;
    static void label(std::ostream& os, diagnostic_level level);
};

} // namespace quickform::driver
