//
// Context values
//
// The read-only value tree a template is rendered against. Lists and maps are
// shared immutable storage, so copying a value (and handing the same context to
// several worker threads) never copies the tree. Map entries keep insertion order.
//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace quickform {

class value {
public:
    using list_type = std::vector<value>;
    using entry = std::pair<std::string, value>;
    using map_type = std::vector<entry>;

    enum class kind {
        null,
        boolean,
        integer,
        string,
        list,
        map
    };

    value() = default;
    value(bool b) : data_(b) {}
    value(int n) : data_(static_cast<std::int64_t>(n)) {}
    value(std::int64_t n) : data_(n) {}
    value(std::string s) : data_(std::move(s)) {}
    value(const char* s) : data_(std::string(s)) {}

    static value make_list(list_type items);
    static value make_map(map_type entries);

    [[nodiscard]] kind type() const;

    [[nodiscard]] bool is_null() const { return type() == kind::null; }
    [[nodiscard]] bool is_scalar() const { return type() != kind::list && type() != kind::map; }
    [[nodiscard]] bool is_list() const { return type() == kind::list; }
    [[nodiscard]] bool is_map() const { return type() == kind::map; }

    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_int() const;
    [[nodiscard]] const std::string& as_string() const;

    /// Empty for non-list values
    [[nodiscard]] const list_type& as_list() const;

    /// Empty for non-map values
    [[nodiscard]] const map_type& as_map() const;

    /// Member lookup on a map; nullptr when absent or not a map
    [[nodiscard]] const value* find(const std::string& key) const;

    /// false, null, "", [] and {} are false; everything else is true
    [[nodiscard]] bool truthy() const;

    /// Text of a scalar ("" for null, "true"/"false", decimal integers).
    /// Lists and maps have no text form; callers check is_scalar() first.
    [[nodiscard]] std::string text() const;

    /// Copy of this map with one more entry. Throws std::invalid_argument when the
    /// key already exists or this is not a map.
    [[nodiscard]] value with(const std::string& key, value v) const;

    bool operator==(const value& other) const;

private:
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 std::string,
                 std::shared_ptr<const list_type>,
                 std::shared_ptr<const map_type>> data_;
};

} // namespace quickform
