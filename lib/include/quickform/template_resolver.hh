#pragma once

#include <quickform/errors.hh>
#include <quickform/extension_chain.hh>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace quickform::templates {

// ============================================================================
// Template Sources
// ============================================================================

/// One place templates can come from.
class TemplateSource {
public:
    virtual ~TemplateSource() = default;

    /// Template text, or std::nullopt when this source does not provide `id`
    [[nodiscard]] virtual std::optional<std::string> load(const std::string& id) const = 0;

    /// Human readable location searched for `id` (for error messages)
    [[nodiscard]] virtual std::string describe(const std::string& id) const = 0;
};

/// `<dir>/<id>.tmpl` on disk
class OverrideDirectorySource : public TemplateSource {
public:
    explicit OverrideDirectorySource(std::filesystem::path directory);

    [[nodiscard]] std::optional<std::string> load(const std::string& id) const override;
    [[nodiscard]] std::string describe(const std::string& id) const override;

    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

/// Templates compiled into the library (see builtin_templates.hh)
class BuiltinTemplateSource : public TemplateSource {
public:
    [[nodiscard]] std::optional<std::string> load(const std::string& id) const override;
    [[nodiscard]] std::string describe(const std::string& id) const override;
};

/// Templates registered in memory; used by embedders and tests
class MemoryTemplateSource : public TemplateSource {
public:
    explicit MemoryTemplateSource(std::string name = "memory");

    void add(const std::string& id, std::string text);

    [[nodiscard]] std::optional<std::string> load(const std::string& id) const override;
    [[nodiscard]] std::string describe(const std::string& id) const override;

private:
    std::string name_;
    std::map<std::string, std::string> templates_;
};

// ============================================================================
// Template Resolver
// ============================================================================

/**
 * Resolves logical template identifiers ("model.mongoose", "handler", "app")
 * to template text through a prioritized chain of sources.
 *
 * The default chain is the override directory (if any) followed by the
 * built-in set, so a file `<dir>/handler.tmpl` replaces the built-in handler.
 *
 * The first successful load of an identifier is cached; every later call,
 * from any thread, returns the same text. The returned reference stays valid
 * for the lifetime of the resolver.
 *
 * **Usage Example:**
 * \code
 *   TemplateResolver resolver("./my-templates");
 *   const std::string& text = resolver.resolve("model.mongoose");
 * \endcode
 *
 * **Thread Safety:** resolve() may be called concurrently. add_source() must
 * not be called once rendering has started.
 */
class TemplateResolver {
public:
    static constexpr int override_priority = 0;
    static constexpr int builtin_priority = 100;

    /// Built-in templates only
    TemplateResolver();

    /// Override directory first, then built-ins
    explicit TemplateResolver(const std::optional<std::filesystem::path>& override_directory);

    TemplateResolver(const TemplateResolver&) = delete;
    TemplateResolver& operator=(const TemplateResolver&) = delete;

    /// Register another source; lower priority values are searched first
    void add_source(std::string name, int priority, std::unique_ptr<TemplateSource> source);

    /**
     * Resolve an identifier.
     *
     * @throws template_error naming the identifier and every location searched
     */
    const std::string& resolve(const std::string& id) const;

    /// True if some source provides `id` (does not throw)
    [[nodiscard]] bool has(const std::string& id) const;

    /// Locations that are searched for `id`, in search order
    [[nodiscard]] std::vector<std::string> searched_locations(const std::string& id) const;

    /// Names of the registered sources in search order
    [[nodiscard]] std::vector<std::string> source_names() const { return sources_.names(); }

    [[nodiscard]] size_t cached_count() const;

    /// Identifiers may only contain letters, digits, '.', '-' and '_'
    static bool is_valid_identifier(const std::string& id);

private:
    ExtensionChain<std::unique_ptr<TemplateSource>> sources_;

    mutable std::shared_mutex cache_mutex_;
    mutable std::map<std::string, std::string> cache_;
};

} // namespace quickform::templates
