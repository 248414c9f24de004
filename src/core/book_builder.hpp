#ifndef BOOK_BUILDER_HPP
#define BOOK_BUILDER_HPP

#include "document.hpp"
#include "epub_builder.hpp"
#include "workspace.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

struct BookMetadata {
  std::string title;
  std::string author;
  std::string language = "en";
};

// Place of a document in the book, decided by its file stem.
struct BookRole {
  enum class Kind { Cover, TitlePage, Chapter };

  Kind kind = Kind::Chapter;
  unsigned chapter = 0; // 1-based, only for chapters

  bool operator==(const BookRole &other) const {
    return kind == other.kind && chapter == other.chapter;
  }
};

class BookBuilder {
private:
  const Workspace &workspace;
  BookMetadata metadata;

  static std::string read_bytes(const fs::path &path);

  void print_build_summary(
      size_t count, const fs::path &book_file,
      const std::chrono::high_resolution_clock::time_point &start);

public:
  BookBuilder(const Workspace &workspace, BookMetadata metadata);

  // "cover"/"_cover" and "title"/"_title" are reserved stems; everything
  // else is a chapter, numbered in scan order starting at 1.
  static BookRole::Kind classify(const Document &doc);
  static std::vector<BookRole> assign_roles(const std::vector<Document> &docs);

  // Name of the package part holding `doc`: "<stem>.xhtml", or
  // "chapterN.xhtml" when the stem is unusable.
  static std::string part_name(const Document &doc, const BookRole &role);

  // Archive name and MIME type of a cover image. A name whose extension is
  // not valid UTF-8 becomes "<stem>.png" with type image/png.
  static std::pair<std::string, std::string> cover_name(const Document &doc);

  // Adds every document, in order, to a fresh package. Nothing is written.
  EpubBuilder assemble(const std::vector<Document> &documents) const;

  // Prepares the output directory, assembles the package and writes it to
  // `book_file`. Returns the number of documents.
  size_t make_book(const std::vector<Document> &documents,
                   const fs::path &book_file);
};

#endif
