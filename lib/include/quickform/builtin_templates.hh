#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace quickform::templates {

/// Built-in template set (Express + TypeScript project), keyed by identifier.
const std::map<std::string, std::string_view>& builtin_templates();

/// Identifiers of the built-in set, sorted
std::vector<std::string> list_builtin_templates();

} // namespace quickform::templates
