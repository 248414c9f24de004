#ifndef DOCUMENT_HPP
#define DOCUMENT_HPP

#include "frontmatter.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace fs = std::filesystem;

struct MarkdownInfo {
  std::optional<FrontMatter> front_matter;
  std::string text;
};

// Copied through byte for byte; never read at scan time.
struct OpaqueInfo {};

using DocumentInfo = std::variant<MarkdownInfo, OpaqueInfo>;

class Document {
public:
  Document(fs::path source_path, DocumentInfo info);

  // Classifies `source_path` by extension. Markdown files are read and their
  // front matter split off; anything else is left on disk.
  static Document load(const fs::path &source_path);

  static bool is_markdown_path(const fs::path &path);

  const fs::path &source_path() const { return source_path_; }
  const DocumentInfo &info() const { return info_; }
  bool is_markdown() const;

  // Both throw PathError when the path has no usable (UTF-8) name.
  std::string file_stem() const;
  std::string file_name() const;

  // nullopt instead of throwing.
  std::optional<std::string> try_file_stem() const;

  // Path of this document relative to `root`. Throws PathError when the
  // document does not live under `root`.
  fs::path relative_to(const fs::path &root) const;

private:
  fs::path source_path_;
  DocumentInfo info_;
};

#endif
