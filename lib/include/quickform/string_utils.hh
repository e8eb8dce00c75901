//
// String utilities shared by the parser, the context builder and the renderer
//
// Case transformations split identifiers into words at separators ('_', '-',
// ' ', '.') and at case boundaries ("orderItem", "HTTPServer"), then reassemble
// them in the requested style.
//

#pragma once

#include <string>
#include <vector>

namespace quickform {

/// Split an identifier into words: "OrderItem_id" -> {"Order", "Item", "id"}
std::vector<std::string> split_words(const std::string& text);

std::string to_upper(const std::string& text);
std::string to_lower(const std::string& text);

/// "order item" -> "OrderItem"
std::string to_pascal_case(const std::string& text);

/// "order item" -> "orderItem"
std::string to_camel_case(const std::string& text);

/// "OrderItem" -> "order_item"
std::string to_snake_case(const std::string& text);

/// "OrderItem" -> "order-item"
std::string to_kebab_case(const std::string& text);

/// Naive English plural of the last word: "category" -> "categories"
std::string pluralize(const std::string& text);

/// Prefix every non-empty line with `columns` spaces. Trailing newline is dropped
/// so the result can be spliced in the middle of a template line.
std::string indent_lines(const std::string& text, size_t columns);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

std::string trim(const std::string& text);

} // namespace quickform
