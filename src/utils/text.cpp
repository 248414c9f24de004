#include "text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace text {

bool starts_with(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view str, std::string_view suffix) {
  if (suffix.length() > str.length())
    return false;
  return str.compare(str.length() - suffix.length(), suffix.length(),
                     suffix) == 0;
}

std::string to_lower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::string extension_of(std::string_view target) {
  size_t slash = target.find_last_of('/');
  std::string_view name =
      slash == std::string_view::npos ? target : target.substr(slash + 1);
  size_t dot = name.find_last_of('.');
  if (dot == std::string_view::npos || dot == 0) {
    return {};
  }
  return std::string(name.substr(dot + 1));
}

bool is_valid_utf8(std::string_view str) {
  size_t i = 0;
  const size_t n = str.size();
  while (i < n) {
    auto c = static_cast<unsigned char>(str[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + len > n)
      return false;

    for (size_t k = 1; k < len; ++k) {
      auto cc = static_cast<unsigned char>(str[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000)) {
      return false;
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }

    i += len;
  }
  return true;
}

void strip_utf8_bom(std::string &str) {
  if (starts_with(str, "\xEF\xBB\xBF")) {
    str.erase(0, 3);
  }
}

std::string escape_html(std::string_view str) {
  std::string out;
  out.reserve(str.size());
  for (char c : str) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

} // namespace text
