#ifndef EPUB_BUILDER_HPP
#define EPUB_BUILDER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class ReferenceType { Cover, TitlePage, Text };

struct EpubContent {
  std::string path; // relative to OEBPS/
  std::string data;
  std::string title; // empty: not listed in the table of contents
  ReferenceType reftype = ReferenceType::Text;
};

struct EpubCover {
  std::string path;
  std::string data;
  std::string mime_type;
};

// Collects metadata and ordered content parts, then writes an EPUB 2
// package. Parts keep the order they were added in.
class EpubBuilder {
public:
  void set_title(const std::string &title) { title_ = title; }
  void set_author(const std::string &author) { author_ = author; }
  void set_language(const std::string &language) { language_ = language; }

  // Throws PackagingError when a cover was already added.
  void add_cover_image(const std::string &path, std::string data,
                       const std::string &mime_type);

  // Throws PackagingError on an empty or already used path.
  void add_content(EpubContent content);

  const std::vector<EpubContent> &contents() const { return contents_; }
  const std::optional<EpubCover> &cover() const { return cover_; }

  // Stable for a given title and author.
  std::string identifier() const;

  std::string container_xml() const;
  std::string content_opf() const;
  std::string toc_ncx() const;
  std::string cover_xhtml() const;

  // Writes the package to `out_file`, replacing it. Throws PackagingError.
  void generate(const fs::path &out_file) const;

private:
  bool path_taken(const std::string &path) const;

  std::string title_ = "Untitled";
  std::string author_;
  std::string language_ = "en";
  std::optional<EpubCover> cover_;
  std::vector<EpubContent> contents_;
};

#endif
