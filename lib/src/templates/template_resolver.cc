#include <quickform/template_resolver.hh>
#include <quickform/builtin_templates.hh>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <sstream>

namespace quickform::templates {

// ============================================================================
// Sources
// ============================================================================

OverrideDirectorySource::OverrideDirectorySource(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::optional<std::string> OverrideDirectorySource::load(const std::string& id) const {
    std::filesystem::path file = directory_ / (id + ".tmpl");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw template_error(id, "cannot read override " + file.string());
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string OverrideDirectorySource::describe(const std::string& id) const {
    return (directory_ / (id + ".tmpl")).string();
}

std::optional<std::string> BuiltinTemplateSource::load(const std::string& id) const {
    const auto& builtins = builtin_templates();
    auto it = builtins.find(id);
    if (it == builtins.end()) {
        return std::nullopt;
    }
    return std::string(it->second);
}

std::string BuiltinTemplateSource::describe(const std::string& id) const {
    return "<builtin>/" + id;
}

MemoryTemplateSource::MemoryTemplateSource(std::string name)
    : name_(std::move(name)) {}

void MemoryTemplateSource::add(const std::string& id, std::string text) {
    templates_[id] = std::move(text);
}

std::optional<std::string> MemoryTemplateSource::load(const std::string& id) const {
    auto it = templates_.find(id);
    if (it == templates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string MemoryTemplateSource::describe(const std::string& id) const {
    return "<" + name_ + ">/" + id;
}

// ============================================================================
// Resolver
// ============================================================================

TemplateResolver::TemplateResolver()
    : TemplateResolver(std::nullopt) {}

TemplateResolver::TemplateResolver(const std::optional<std::filesystem::path>& override_directory) {
    if (override_directory) {
        sources_.add("overrides", override_priority,
                     std::make_unique<OverrideDirectorySource>(*override_directory));
    }
    sources_.add("builtin", builtin_priority, std::make_unique<BuiltinTemplateSource>());
}

void TemplateResolver::add_source(std::string name, int priority,
                                  std::unique_ptr<TemplateSource> source) {
    sources_.add(std::move(name), priority, std::move(source));
}

bool TemplateResolver::is_valid_identifier(const std::string& id) {
    if (id.empty() || id.front() == '.' || id.find("..") != std::string::npos) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-' || c == '_';
    });
}

const std::string& TemplateResolver::resolve(const std::string& id) const {
    {
        std::shared_lock lock(cache_mutex_);
        auto it = cache_.find(id);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    if (!is_valid_identifier(id)) {
        throw template_error(id, "invalid template identifier");
    }

    std::unique_lock lock(cache_mutex_);

    // Another thread may have loaded it while we waited for the lock
    auto it = cache_.find(id);
    if (it != cache_.end()) {
        return it->second;
    }

    auto text = sources_.first_of([&](const std::unique_ptr<TemplateSource>& source) {
        return source->load(id);
    });
    if (!text) {
        throw template_error::unresolved(id, searched_locations(id));
    }

    return cache_.emplace(id, std::move(*text)).first->second;
}

bool TemplateResolver::has(const std::string& id) const {
    {
        std::shared_lock lock(cache_mutex_);
        if (cache_.contains(id)) {
            return true;
        }
    }

    if (!is_valid_identifier(id)) {
        return false;
    }

    for (const auto& link : sources_.links()) {
        try {
            if (link.item->load(id)) {
                return true;
            }
        } catch (const template_error&) {
            // present but unreadable; resolve() reports it
            return true;
        }
    }
    return false;
}

std::vector<std::string> TemplateResolver::searched_locations(const std::string& id) const {
    std::vector<std::string> locations;
    for (const auto& link : sources_.links()) {
        locations.push_back(link.item->describe(id));
    }
    return locations;
}

size_t TemplateResolver::cached_count() const {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

} // namespace quickform::templates
