#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

// Base of every failure a scribe run can report. Carries the offending
// source path (may be empty) so main can name the failing document.
class ScribeError : public std::runtime_error {
public:
  enum class Kind {
    MetadataParse,
    DocumentRead,
    Markdown,
    TemplateRender,
    Packaging,
    Path,
    Output,
    Config
  };

  ScribeError(Kind kind, const std::string &message, const fs::path &path = {});

  Kind kind() const { return kind_; }
  const std::string &message() const { return message_; }
  const fs::path &path() const { return path_; }

  // Records the document being processed when the error was raised without
  // one. An existing path is kept.
  void attach_path(const fs::path &path);

  const char *what() const noexcept override { return what_.c_str(); }

  static const char *kind_name(Kind kind);

private:
  Kind kind_;
  std::string message_;
  fs::path path_;
  std::string what_;
};

class MetadataParseError : public ScribeError {
public:
  explicit MetadataParseError(const std::string &message,
                              const fs::path &path = {})
      : ScribeError(Kind::MetadataParse, message, path) {}
};

class DocumentReadError : public ScribeError {
public:
  explicit DocumentReadError(const std::string &message,
                             const fs::path &path = {})
      : ScribeError(Kind::DocumentRead, message, path) {}
};

class MarkdownError : public ScribeError {
public:
  explicit MarkdownError(const std::string &message, const fs::path &path = {})
      : ScribeError(Kind::Markdown, message, path) {}
};

class TemplateRenderError : public ScribeError {
public:
  explicit TemplateRenderError(const std::string &message,
                               const fs::path &path = {})
      : ScribeError(Kind::TemplateRender, message, path) {}
};

class PackagingError : public ScribeError {
public:
  explicit PackagingError(const std::string &message,
                          const fs::path &path = {})
      : ScribeError(Kind::Packaging, message, path) {}
};

class PathError : public ScribeError {
public:
  explicit PathError(const std::string &message, const fs::path &path = {})
      : ScribeError(Kind::Path, message, path) {}
};

class OutputError : public ScribeError {
public:
  explicit OutputError(const std::string &message, const fs::path &path = {})
      : ScribeError(Kind::Output, message, path) {}
};

class ConfigError : public ScribeError {
public:
  explicit ConfigError(const std::string &message, const fs::path &path = {})
      : ScribeError(Kind::Config, message, path) {}
};

#endif
