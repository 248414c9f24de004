#include "errors.hpp"

static std::string format_error(ScribeError::Kind kind,
                                const std::string &message,
                                const fs::path &path) {
  std::string text = ScribeError::kind_name(kind);
  if (!path.empty()) {
    text += " (" + path.string() + ")";
  }
  return text + ": " + message;
}

ScribeError::ScribeError(Kind kind, const std::string &message,
                         const fs::path &path)
    : std::runtime_error(message), kind_(kind), message_(message), path_(path),
      what_(format_error(kind, message, path)) {}

void ScribeError::attach_path(const fs::path &path) {
  if (!path_.empty()) {
    return;
  }
  path_ = path;
  what_ = format_error(kind_, message_, path_);
}

const char *ScribeError::kind_name(Kind kind) {
  switch (kind) {
  case Kind::MetadataParse:
    return "MetadataParseError";
  case Kind::DocumentRead:
    return "DocumentReadError";
  case Kind::Markdown:
    return "MarkdownError";
  case Kind::TemplateRender:
    return "TemplateRenderError";
  case Kind::Packaging:
    return "PackagingError";
  case Kind::Path:
    return "PathError";
  case Kind::Output:
    return "OutputError";
  case Kind::Config:
    return "ConfigError";
  }
  return "ScribeError";
}
