#include "book_builder.hpp"
#include "errors.hpp"
#include "utils/console.hpp"
#include "utils/mime.hpp"
#include "utils/text.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <termcolor/termcolor.hpp>

BookBuilder::BookBuilder(const Workspace &workspace, BookMetadata metadata)
    : workspace(workspace), metadata(std::move(metadata)) {}

std::string BookBuilder::read_bytes(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw DocumentReadError("cannot open file", path);
  }
  std::string data((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw DocumentReadError("read failed", path);
  }
  return data;
}

BookRole::Kind BookBuilder::classify(const Document &doc) {
  std::optional<std::string> stem = doc.try_file_stem();
  if (!stem) {
    return BookRole::Kind::Chapter;
  }
  if (*stem == "cover" || *stem == "_cover") {
    return BookRole::Kind::Cover;
  }
  if (*stem == "title" || *stem == "_title") {
    return BookRole::Kind::TitlePage;
  }
  return BookRole::Kind::Chapter;
}

std::vector<BookRole>
BookBuilder::assign_roles(const std::vector<Document> &docs) {
  std::vector<BookRole> roles;
  roles.reserve(docs.size());
  unsigned chapter = 0;
  for (const auto &doc : docs) {
    BookRole role;
    role.kind = classify(doc);
    if (role.kind == BookRole::Kind::Chapter) {
      role.chapter = ++chapter;
    }
    roles.push_back(role);
  }
  return roles;
}

std::string BookBuilder::part_name(const Document &doc, const BookRole &role) {
  if (std::optional<std::string> stem = doc.try_file_stem()) {
    return *stem + ".xhtml";
  }
  return "chapter" + std::to_string(role.chapter) + ".xhtml";
}

std::pair<std::string, std::string>
BookBuilder::cover_name(const Document &doc) {
  std::string name = doc.source_path().filename().string();
  if (text::is_valid_utf8(name)) {
    return {name, mime::image_type(text::extension_of(name))};
  }
  // Only the extension can be unreadable here, the stem matched "cover".
  return {doc.file_stem() + ".png", "image/png"};
}

EpubBuilder BookBuilder::assemble(const std::vector<Document> &documents) const {
  EpubBuilder epub;
  epub.set_title(metadata.title);
  epub.set_author(metadata.author);
  epub.set_language(metadata.language);

  std::vector<BookRole> roles = assign_roles(documents);
  for (size_t i = 0; i < documents.size(); ++i) {
    const Document &doc = documents[i];
    const BookRole &role = roles[i];

    try {
      std::string data = read_bytes(doc.source_path());
      switch (role.kind) {
      case BookRole::Kind::Cover: {
        auto [name, mime_type] = cover_name(doc);
        epub.add_cover_image(name, std::move(data), mime_type);
        console::step("cover", doc.source_path().string());
        break;
      }
      case BookRole::Kind::TitlePage:
        epub.add_content(EpubContent{part_name(doc, role), std::move(data), "",
                                     ReferenceType::TitlePage});
        console::step("title", doc.source_path().string());
        break;
      case BookRole::Kind::Chapter: {
        std::string title = "Chapter " + std::to_string(role.chapter);
        epub.add_content(EpubContent{part_name(doc, role), std::move(data),
                                     title, ReferenceType::Text});
        console::step("chapter", doc.source_path().string() + " (" + title +
                                     ")");
        break;
      }
      }
    } catch (ScribeError &e) {
      e.attach_path(doc.source_path());
      throw;
    }
  }
  return epub;
}

size_t BookBuilder::make_book(const std::vector<Document> &documents,
                              const fs::path &book_file) {
  auto start = std::chrono::high_resolution_clock::now();

  console::banner("Building book");

  if (documents.empty()) {
    console::warn("please add files to source directory: " +
                  workspace.input_dir().string());
  }

  workspace.prepare_output();

  console::section("Packaging " + std::to_string(documents.size()) +
                   " documents");

  EpubBuilder epub = assemble(documents);
  Workspace::create_parent_dirs(book_file);
  epub.generate(book_file);

  print_build_summary(documents.size(), book_file, start);
  return documents.size();
}

void BookBuilder::print_build_summary(
    size_t count, const fs::path &book_file,
    const std::chrono::high_resolution_clock::time_point &start) {
  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  std::cout << "\n"
            << termcolor::bright_green << "✓ " << termcolor::reset
            << "Packaged " << termcolor::bright_white << count
            << termcolor::reset << " documents into "
            << termcolor::bright_white << book_file.string()
            << termcolor::reset << termcolor::bright_blue << " in "
            << duration.count() << "ms" << termcolor::reset << "\n";
}
