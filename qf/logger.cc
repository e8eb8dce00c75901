#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace quickform::driver {

Logger::Logger(LogLevel level, ColorMode color, std::ostream& out, std::ostream& err)
    : level_(level)
    , out_(out)
    , err_(err)
{
    switch (color) {
        case ColorMode::Always:
            out_ << termcolor::colorize;
            err_ << termcolor::colorize;
            break;
        case ColorMode::Never:
            out_ << termcolor::nocolorize;
            err_ << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            // termcolor detects a TTY on its own
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::label(std::ostream& os, diagnostic_level level) {
    switch (level) {
        case diagnostic_level::error:
            os << termcolor::bold << termcolor::red << "error: " << termcolor::reset;
            break;
        case diagnostic_level::warning:
            os << termcolor::bold << termcolor::yellow << "warning: " << termcolor::reset;
            break;
        case diagnostic_level::note:
            os << termcolor::bold << termcolor::cyan << "note: " << termcolor::reset;
            break;
    }
}

// ============================================================================
// Plain messages
// ============================================================================

void Logger::error(const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    label(err_, diagnostic_level::error);
    err_ << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    label(err_, diagnostic_level::warning);
    err_ << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    out_ << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    out_ << termcolor::bold << termcolor::green
         << "✓ " << termcolor::reset
         << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    out_ << termcolor::cyan << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    out_ << termcolor::magenta << "[debug] " << termcolor::reset << message << "\n";
}

void Logger::bullet(const std::string& message, LogLevel min_level) {
    if (!should_log(min_level)) return;

    out_ << "  • " << message << "\n";
}

// ============================================================================
// Diagnostics and failures
// ============================================================================

void Logger::report(const diagnostic& diag) {
    LogLevel required = diag.level == diagnostic_level::error ? LogLevel::Quiet : LogLevel::Normal;
    if (!should_log(required)) return;

    std::ostream& os = diag.level == diagnostic_level::note ? out_ : err_;
    os << termcolor::bold << diag.location.format() << ":" << termcolor::reset << " ";
    label(os, diag.level);
    os << diag.message;
    if (!diag.code.empty()) {
        os << " [" << diag.code << "]";
    }
    os << "\n";

    if (diag.suggestion) {
        os << "  " << termcolor::green << "suggestion: " << termcolor::reset
           << *diag.suggestion << "\n";
    }
}

void Logger::report(const generator::generation_failure& failure) {
    if (!should_log(LogLevel::Quiet)) return;

    label(err_, diagnostic_level::error);
    err_ << (failure.kind == generator::failure_kind::extension ? "hook '" : "template '")
         << termcolor::bold << failure.template_id << termcolor::reset << "'";
    if (!failure.model.empty()) {
        err_ << " for model '" << termcolor::bold << failure.model << termcolor::reset << "'";
    }
    err_ << ": " << failure.message << "\n";
}

void Logger::summary(const std::vector<diagnostic>& diagnostics) {
    size_t errors = error_count(diagnostics);
    size_t warnings = warning_count(diagnostics);

    if (errors > 0 && should_log(LogLevel::Quiet)) {
        err_ << termcolor::bold << errors << " error(s)";
        if (warnings > 0) {
            err_ << ", " << warnings << " warning(s)";
        }
        err_ << termcolor::reset << "\n";
    } else if (warnings > 0 && should_log(LogLevel::Normal)) {
        err_ << termcolor::bold << warnings << " warning(s)" << termcolor::reset << "\n";
    }
}

} // namespace quickform::driver
