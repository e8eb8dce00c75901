//
// Template rendering engine
//
// TEMPLATE LANGUAGE:
//   {{ a.b.c }}                      substitute a scalar from the context
//   {{ name | pascal | plural }}      filters, applied left to right
//   {{ fields | join:", " }}         join a list of scalars
//   {{ hook.body | indent:4 }}       indent every non-empty line
//   {{#if path}}...{{else}}...{{/if}}
//   {{#if config.storage == "mongodb"}}...{{/if}}      (also !=)
//   {{#unless path}}...{{/unless}}
//   {{#each fields}}{{name}}{{#unless @last}}, {{/unless}}{{/each}}
//   {{> partial-identifier}}
//   {{! comment }}
//
// Filters: upper lower pascal camel snake kebab plural join indent
//
// A block tag (#if, else, /each, comment, partial...) that is alone on its line
// removes the whole line from the output, so templates can be laid out on
// separate lines without leaving blank lines behind.
//
// Inside {{#each}}, `this` is the current item and names are looked up on the
// item first, then in the enclosing scopes. @index, @first, @last (and @key when
// iterating a map) describe the innermost loop.
//
// Every failure is a template_error: an undefined path, a list rendered without
// join, an unknown filter, an indent wider than max_indent, unbalanced blocks,
// partials nested deeper than max_partial_depth. Nothing is ever substituted silently.
//

#pragma once

#include <quickform/errors.hh>
#include <quickform/value.hh>
#include <functional>
#include <string>

namespace quickform::templates {

class Renderer {
public:
    /// Returns the source of a partial; throws template_error if unknown.
    using partial_loader = std::function<const std::string&(const std::string&)>;

    static constexpr size_t max_partial_depth = 16;
    static constexpr size_t max_indent = 256;

    explicit Renderer(partial_loader loader = {});

    /**
     * Render template source against a context.
     *
     * @param template_id Identifier used in error messages
     * @param source      Template text
     * @param context     Root scope (a map)
     * @return Rendered text
     * @throws template_error
     */
    [[nodiscard]] std::string render(const std::string& template_id,
                                     const std::string& source,
                                     const value& context) const;

    /// Parse only; throws template_error on malformed template text.
    void check_syntax(const std::string& template_id, const std::string& source) const;

private:
    partial_loader loader_;
};

} // namespace quickform::templates
