#ifndef TEXT_HPP
#define TEXT_HPP

#include <string>
#include <string_view>

namespace text {

bool starts_with(std::string_view str, std::string_view prefix);
bool ends_with(std::string_view str, std::string_view suffix);

std::string to_lower(std::string_view str);

// Extension after the final '.' of the last path segment, without the dot.
// Empty when there is none.
std::string extension_of(std::string_view target);

// Checks well-formed UTF-8: no overlongs, no surrogates, nothing above
// U+10FFFF.
bool is_valid_utf8(std::string_view str);

// Removes a leading UTF-8 byte order mark, if any.
void strip_utf8_bom(std::string &str);

// Escapes '&', '<', '>' and '"' for HTML text and attribute values.
std::string escape_html(std::string_view str);

} // namespace text

#endif
