#pragma once

#include <fkYAML/node.hpp>

#include <string>

namespace quickform {

/// YAML node that keeps mapping keys in document order. Field, model and config
/// order in the schema is significant (it is the iteration order seen by templates).
using yaml_node = fkyaml::basic_node<std::vector, fkyaml::ordered_map>;

/// Textual form of a scalar node: strings verbatim, booleans as true/false,
/// numbers in their shortest decimal form, null as "null".
std::string scalar_to_string(const yaml_node& node);

} // namespace quickform
