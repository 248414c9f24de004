#include "frontmatter.hpp"
#include "errors.hpp"
#include "utils/text.hpp"
#include "yaml-cpp/yaml.h"

#include <regex>
#include <set>

// Plain scalars the YAML core schema resolves to null, bool, int or float.
static bool resolves_to_non_string(const std::string &scalar) {
  static const std::regex core_schema(
      R"(~|null|Null|NULL|true|True|TRUE|false|False|FALSE)"
      R"(|[-+]?[0-9]+|0o[0-7]+|0x[0-9a-fA-F]+)"
      R"(|[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?)"
      R"(|[-+]?(\.inf|\.Inf|\.INF)|\.nan|\.NaN|\.NAN)");
  return scalar.empty() || std::regex_match(scalar, core_schema);
}

static bool is_string_scalar(const YAML::Node &node) {
  if (!node.IsScalar()) {
    return false;
  }
  const std::string &tag = node.Tag();
  if (tag == "!" || tag == "tag:yaml.org,2002:str") {
    return true;
  }
  if (tag == "?") {
    return !resolves_to_non_string(node.Scalar());
  }
  return false;
}

static const char *describe(const YAML::Node &node) {
  switch (node.Type()) {
  case YAML::NodeType::Sequence:
    return "a list";
  case YAML::NodeType::Map:
    return "a map";
  case YAML::NodeType::Null:
    return "null";
  default:
    return "not a string";
  }
}

static FrontMatter parse_block(const std::string &yaml_str) {
  FrontMatter fm;

  YAML::Node node;
  try {
    node = YAML::Load(yaml_str);
  } catch (const YAML::Exception &e) {
    throw MetadataParseError("YAML parsing error: " + std::string(e.what()));
  }

  if (node.IsNull()) {
    return fm;
  }
  if (!node.IsMap()) {
    throw MetadataParseError("front matter must be a map of strings, got " +
                             std::string(describe(node)));
  }

  std::set<std::string> seen;
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (!is_string_scalar(it->first)) {
      throw MetadataParseError("front matter keys must be strings");
    }
    std::string key = it->first.Scalar();

    if (!seen.insert(key).second) {
      throw MetadataParseError("duplicate front matter key '" + key + "'");
    }

    if (!is_string_scalar(it->second)) {
      throw MetadataParseError("value of '" + key + "' is " +
                               describe(it->second) +
                               "; only string values are supported");
    }
    fm.data[key] = it->second.Scalar();
  }

  return fm;
}

std::pair<std::optional<FrontMatter>, std::string>
FrontMatter::split(const std::string &content) {
  std::string separator;
  for (const char *sep : {"---\n", "---\r\n"}) {
    if (text::starts_with(content, sep)) {
      separator = sep;
    }
  }

  if (separator.empty()) {
    return {std::nullopt, content};
  }

  const std::string newline = separator.substr(3);
  const size_t yaml_start = separator.size();

  size_t yaml_end;
  if (content.compare(yaml_start, separator.size(), separator) == 0) {
    yaml_end = yaml_start;
  } else {
    size_t pos = content.find(newline + separator, yaml_start);
    if (pos == std::string::npos) {
      return {std::nullopt, content};
    }
    yaml_end = pos + newline.size();
  }

  std::string yaml_str = content.substr(yaml_start, yaml_end - yaml_start);
  std::string markdown = content.substr(yaml_end + separator.size());

  return {parse_block(yaml_str), markdown};
}

std::string FrontMatter::get(const std::string &key,
                             const std::string &default_val) const {
  auto it = data.find(key);
  return (it != data.end()) ? it->second : default_val;
}

bool FrontMatter::has(const std::string &key) const {
  return data.find(key) != data.end();
}
