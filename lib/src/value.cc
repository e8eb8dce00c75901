#include <quickform/value.hh>
#include <algorithm>
#include <stdexcept>

namespace quickform {

namespace {
    const value::list_type empty_list;
    const value::map_type empty_map;
    const std::string empty_string;
}

value value::make_list(list_type items) {
    value v;
    v.data_ = std::make_shared<const list_type>(std::move(items));
    return v;
}

value value::make_map(map_type entries) {
    value v;
    v.data_ = std::make_shared<const map_type>(std::move(entries));
    return v;
}

value::kind value::type() const {
    switch (data_.index()) {
        case 1: return kind::boolean;
        case 2: return kind::integer;
        case 3: return kind::string;
        case 4: return kind::list;
        case 5: return kind::map;
        default: return kind::null;
    }
}

bool value::as_bool() const {
    if (auto* b = std::get_if<bool>(&data_)) {
        return *b;
    }
    return truthy();
}

std::int64_t value::as_int() const {
    if (auto* n = std::get_if<std::int64_t>(&data_)) {
        return *n;
    }
    return 0;
}

const std::string& value::as_string() const {
    if (auto* s = std::get_if<std::string>(&data_)) {
        return *s;
    }
    return empty_string;
}

const value::list_type& value::as_list() const {
    if (auto* l = std::get_if<std::shared_ptr<const list_type>>(&data_)) {
        return **l;
    }
    return empty_list;
}

const value::map_type& value::as_map() const {
    if (auto* m = std::get_if<std::shared_ptr<const map_type>>(&data_)) {
        return **m;
    }
    return empty_map;
}

const value* value::find(const std::string& key) const {
    const auto& entries = as_map();
    auto it = std::find_if(entries.begin(), entries.end(),
        [&](const entry& e) { return e.first == key; });
    return it != entries.end() ? &it->second : nullptr;
}

bool value::truthy() const {
    switch (type()) {
        case kind::null: return false;
        case kind::boolean: return std::get<bool>(data_);
        case kind::integer: return true;
        case kind::string: return !as_string().empty();
        case kind::list: return !as_list().empty();
        case kind::map: return !as_map().empty();
    }
    return false;
}

std::string value::text() const {
    switch (type()) {
        case kind::boolean: return std::get<bool>(data_) ? "true" : "false";
        case kind::integer: return std::to_string(std::get<std::int64_t>(data_));
        case kind::string: return as_string();
        default: return {};
    }
}

value value::with(const std::string& key, value v) const {
    if (!is_map()) {
        throw std::invalid_argument("cannot add key '" + key + "' to a non-map value");
    }
    if (find(key)) {
        throw std::invalid_argument("context key '" + key + "' already exists");
    }

    map_type entries = as_map();
    entries.emplace_back(key, std::move(v));
    return make_map(std::move(entries));
}

bool value::operator==(const value& other) const {
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case kind::null: return true;
        case kind::boolean: return as_bool() == other.as_bool();
        case kind::integer: return as_int() == other.as_int();
        case kind::string: return as_string() == other.as_string();
        case kind::list: return as_list() == other.as_list();
        case kind::map: return as_map() == other.as_map();
    }
    return false;
}

} // namespace quickform
