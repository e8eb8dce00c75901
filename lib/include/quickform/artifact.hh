#pragma once

#include <string>
#include <utility>

namespace quickform {

/// One generated output file: output-relative path, content and the template
/// (or hook) that produced it. Immutable once created.
class artifact {
public:
    artifact(std::string path, std::string content, std::string template_id)
        : path_(std::move(path)),
          content_(std::move(content)),
          template_id_(std::move(template_id)) {}

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::string& content() const { return content_; }
    [[nodiscard]] const std::string& template_id() const { return template_id_; }

    bool operator==(const artifact& other) const = default;

private:
    std::string path_;
    std::string content_;
    std::string template_id_;
};

} // namespace quickform
