//
// Error taxonomy
//
//   schema_error     - structural decode failure or aggregated validation failures
//   template_error   - unresolvable identifier, bad syntax, undefined context path
//   io_error         - staging or write failure in the output phase
//   extension_error  - a registered hook failed
//

#pragma once

#include <quickform/diagnostics.hh>
#include <stdexcept>
#include <string>
#include <vector>

namespace quickform {

class error : public std::runtime_error {
public:
    explicit error(const std::string& msg)
        : std::runtime_error(msg) {}
};

class schema_error : public error {
public:
    explicit schema_error(std::vector<diagnostic> diagnostics)
        : error(build_message(diagnostics)),
          diagnostics_(std::move(diagnostics)) {}

    /// Single structural failure (malformed document)
    schema_error(const std::string& message, const std::string& location)
        : schema_error(std::vector<diagnostic>{
              diagnostic{diagnostic_level::error, diag_codes::E_STRUCTURE,
                         message, {location}, std::nullopt}}) {}

    [[nodiscard]] const std::vector<diagnostic>& diagnostics() const { return diagnostics_; }

    [[nodiscard]] bool is_structural() const {
        return diagnostics_.size() == 1 && diagnostics_[0].code == diag_codes::E_STRUCTURE;
    }

private:
    std::vector<diagnostic> diagnostics_;

    static std::string build_message(const std::vector<diagnostic>& diagnostics);
};

class template_error : public error {
public:
    template_error(const std::string& template_id, const std::string& detail)
        : error("template '" + template_id + "': " + detail),
          template_id_(template_id) {}

    /// No source in the chain provides the identifier
    static template_error unresolved(const std::string& template_id,
                                     const std::vector<std::string>& searched);

    /// A context path referenced by the template does not exist
    static template_error undefined_path(const std::string& template_id,
                                         const std::string& path,
                                         size_t line);

    /// Malformed template text
    static template_error syntax(const std::string& template_id,
                                 const std::string& detail,
                                 size_t line);

    [[nodiscard]] const std::string& template_id() const { return template_id_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::vector<std::string>& searched() const { return searched_; }

private:
    std::string template_id_;
    std::string path_;
    std::vector<std::string> searched_;
};

class io_error : public error {
public:
    io_error(const std::string& path, const std::string& detail)
        : error(path + ": " + detail),
          path_(path) {}

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    std::string path_;
};

class extension_error : public error {
public:
    extension_error(const std::string& hook_name,
                    const std::string& point,
                    const std::string& detail)
        : error("hook '" + hook_name + "' at " + point + ": " + detail),
          hook_name_(hook_name),
          point_(point) {}

    [[nodiscard]] const std::string& hook_name() const { return hook_name_; }
    [[nodiscard]] const std::string& point() const { return point_; }

private:
    std::string hook_name_;
    std::string point_;
};

} // namespace quickform
