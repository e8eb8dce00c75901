#include <quickform/yaml.hh>
#include <cstdint>
#include <sstream>

namespace quickform {

std::string scalar_to_string(const yaml_node& node) {
    if (node.is_string()) {
        return node.get_value<std::string>();
    }
    if (node.is_boolean()) {
        return node.get_value<bool>() ? "true" : "false";
    }
    if (node.is_integer()) {
        return std::to_string(node.get_value<std::int64_t>());
    }
    if (node.is_float_number()) {
        std::ostringstream oss;
        oss << node.get_value<double>();
        return oss.str();
    }
    return "null";
}

} // namespace quickform
