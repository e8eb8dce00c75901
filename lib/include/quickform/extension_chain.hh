#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace quickform {

// ============================================================================
// Extension Chain
// ============================================================================

/**
 * Ordered list of named extensions, walked from the lowest priority value to
 * the highest. Extensions registered with the same priority keep registration
 * order.
 *
 * Two lookups are built on it:
 * - the template resolver walks its sources and stops at the first one that
 *   provides the identifier (override directory before built-ins)
 * - the hook registry visits every hook registered for an extension point
 *
 * **Usage Example:**
 * \code
 *   ExtensionChain<std::unique_ptr<TemplateSource>> sources;
 *   sources.add("overrides", 0, std::make_unique<OverrideDirectorySource>(dir));
 *   sources.add("builtin", 100, std::make_unique<BuiltinTemplateSource>());
 *
 *   auto text = sources.first_of([&](const auto& source) { return source->load(id); });
 * \endcode
 *
 * **Thread Safety:** not synchronized. Chains are filled before use and only
 * read afterwards.
 */
template<typename T>
class ExtensionChain {
public:
    struct link {
        std::string name;
        int priority;
        T item;
    };

    void add(std::string name, int priority, T item) {
        auto pos = std::upper_bound(links_.begin(), links_.end(), priority,
            [](int p, const link& l) { return p < l.priority; });
        links_.insert(pos, link{std::move(name), priority, std::move(item)});
    }

    /// Walk the chain and return the first engaged optional produced by `fn`
    template<typename Fn>
    auto first_of(Fn&& fn) const -> std::invoke_result_t<Fn&, const T&> {
        for (const auto& l : links_) {
            if (auto found = fn(l.item)) {
                return found;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(links_.size());
        for (const auto& l : links_) {
            result.push_back(l.name);
        }
        return result;
    }

    [[nodiscard]] const std::vector<link>& links() const { return links_; }
    [[nodiscard]] size_t size() const { return links_.size(); }
    [[nodiscard]] bool empty() const { return links_.empty(); }

private:
    std::vector<link> links_;
};

} // namespace quickform
