#ifndef FRONTMATTER_H
#define FRONTMATTER_H

#include <map>
#include <optional>
#include <string>
#include <utility>

// Flat string-to-string metadata taken from the YAML block at the top of a
// Markdown document.
class FrontMatter {
public:
  std::map<std::string, std::string> data;

  // Splits a leading "---" delimited YAML block off `content`. Returns the
  // parsed block and the remaining text, or nullopt and `content` unchanged
  // when the text does not start with a complete block. Throws
  // MetadataParseError when the block is not a flat map of strings.
  static std::pair<std::optional<FrontMatter>, std::string>
  split(const std::string &content);

  std::string get(const std::string &key,
                  const std::string &default_val = "") const;
  bool has(const std::string &key) const;
  bool empty() const { return data.empty(); }
  size_t size() const { return data.size(); }
};

#endif
