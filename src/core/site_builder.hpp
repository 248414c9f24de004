#ifndef SITE_BUILDER_HPP
#define SITE_BUILDER_HPP

#include "document.hpp"
#include "template_binder.hpp"
#include "template_engine.hpp"
#include "workspace.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Mirrors the input tree into the output directory: Markdown becomes HTML
// through the "default" template, everything else is copied byte for byte.
class SiteBuilder {
private:
  const Workspace &workspace;
  TemplateBinder binder;

  void write_file(const fs::path &path, const std::string &content);
  void copy_file(const fs::path &from, const fs::path &to);

  void print_build_summary(
      size_t count,
      const std::chrono::high_resolution_clock::time_point &start);

public:
  SiteBuilder(const Workspace &workspace, TemplateEngine &engine);

  // Output location of `doc`: its path relative to the input root, re-rooted
  // under the output root, with ".html" as extension for Markdown.
  fs::path output_path(const Document &doc) const;

  std::string render_markdown(const MarkdownInfo &markdown,
                              const fs::path &source = {});

  // Converts or copies one document. The parent directory must exist.
  void build_document(const Document &doc);

  // Clears the output directory, then builds every document in order. The
  // first failure aborts the run. Returns the number of documents.
  size_t export_static_site(const std::vector<Document> &documents);

  const std::vector<std::string> &warnings() const {
    return binder.warnings();
  }
};

#endif
