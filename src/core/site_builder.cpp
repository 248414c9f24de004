#include "site_builder.hpp"
#include "errors.hpp"
#include "markdown.hpp"
#include "utils/console.hpp"

#include <fstream>
#include <iostream>
#include <map>
#include <termcolor/termcolor.hpp>
#include <type_traits>
#include <variant>

SiteBuilder::SiteBuilder(const Workspace &workspace, TemplateEngine &engine)
    : workspace(workspace), binder(engine) {}

void SiteBuilder::write_file(const fs::path &path, const std::string &content) {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw OutputError("cannot write file " + path.string());
  }
  file << content;
  if (!file) {
    throw OutputError("write failed for " + path.string());
  }
}

void SiteBuilder::copy_file(const fs::path &from, const fs::path &to) {
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw OutputError("cannot copy to " + to.string() + ": " + ec.message());
  }
}

fs::path SiteBuilder::output_path(const Document &doc) const {
  fs::path out = workspace.output_dir() / doc.relative_to(workspace.input_dir());
  if (doc.is_markdown()) {
    out.replace_extension(".html");
  }
  return out;
}

std::string SiteBuilder::render_markdown(const MarkdownInfo &markdown,
                                         const fs::path &source) {
  std::string html = MarkdownProcessor::to_html(markdown.text);
  return binder.bind(html, markdown.front_matter, source);
}

void SiteBuilder::build_document(const Document &doc) {
  fs::path out = output_path(doc);

  std::visit(
      [&](const auto &info) {
        using T = std::decay_t<decltype(info)>;
        if constexpr (std::is_same_v<T, OpaqueInfo>) {
          copy_file(doc.source_path(), out);
          console::step("copy", doc.source_path().string() + " -> " +
                                    out.string());
        } else if constexpr (std::is_same_v<T, MarkdownInfo>) {
          write_file(out, render_markdown(info, doc.source_path()));
          console::step("convert", doc.source_path().string() + " -> " +
                                       out.string());
        } else {
          static_assert(std::is_same_v<T, void>, "unhandled document kind");
        }
      },
      doc.info());
}

size_t SiteBuilder::export_static_site(const std::vector<Document> &documents) {
  auto start = std::chrono::high_resolution_clock::now();

  console::banner("Building website");

  if (documents.empty()) {
    console::warn("please add files to source directory: " +
                  workspace.input_dir().string());
  }

  workspace.prepare_output();

  console::section("Converting " + std::to_string(documents.size()) +
                   " documents");

  std::map<fs::path, fs::path> written;
  for (const auto &doc : documents) {
    try {
      fs::path out = output_path(doc);
      auto [previous, inserted] = written.emplace(out, doc.source_path());
      if (!inserted) {
        throw OutputError("output " + out.string() + " already written from " +
                          previous->second.string());
      }
      Workspace::create_parent_dirs(out);
      build_document(doc);
    } catch (ScribeError &e) {
      e.attach_path(doc.source_path());
      throw;
    } catch (const fs::filesystem_error &e) {
      throw OutputError(e.what(), doc.source_path());
    }
  }

  print_build_summary(documents.size(), start);
  return documents.size();
}

void SiteBuilder::print_build_summary(
    size_t count, const std::chrono::high_resolution_clock::time_point &start) {
  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  std::cout << "\n"
            << termcolor::bright_green << "✓ " << termcolor::reset
            << "Generated " << termcolor::bright_white << count
            << termcolor::reset << " documents into "
            << termcolor::bright_white << workspace.output_dir().string()
            << termcolor::reset;
  if (!binder.warnings().empty()) {
    std::cout << termcolor::yellow << " (" << binder.warnings().size()
              << " warnings)" << termcolor::reset;
  }
  std::cout << termcolor::bright_blue << " in " << duration.count() << "ms"
            << termcolor::reset << "\n";
}
