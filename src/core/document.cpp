#include "document.hpp"
#include "errors.hpp"
#include "utils/text.hpp"

#include <fstream>
#include <sstream>

static std::string read_text(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw DocumentReadError("cannot open file", path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw DocumentReadError("read failed", path);
  }

  std::string content = buffer.str();
  if (!text::is_valid_utf8(content)) {
    throw DocumentReadError("file is not valid UTF-8", path);
  }
  text::strip_utf8_bom(content);
  return content;
}

Document::Document(fs::path source_path, DocumentInfo info)
    : source_path_(std::move(source_path)), info_(std::move(info)) {}

Document Document::load(const fs::path &source_path) {
  if (!is_markdown_path(source_path)) {
    return Document(source_path, OpaqueInfo{});
  }

  std::string markdown = read_text(source_path);
  try {
    auto [front_matter, body] = FrontMatter::split(markdown);
    return Document(source_path, MarkdownInfo{std::move(front_matter),
                                              std::move(body)});
  } catch (MetadataParseError &e) {
    e.attach_path(source_path);
    throw;
  }
}

bool Document::is_markdown_path(const fs::path &path) {
  std::string ext = path.extension().string();
  return ext == ".md" || ext == ".markdown";
}

bool Document::is_markdown() const {
  return std::holds_alternative<MarkdownInfo>(info_);
}

std::optional<std::string> Document::try_file_stem() const {
  std::string stem = source_path_.stem().string();
  if (stem.empty() || !text::is_valid_utf8(stem)) {
    return std::nullopt;
  }
  return stem;
}

std::string Document::file_stem() const {
  std::optional<std::string> stem = try_file_stem();
  if (!stem) {
    throw PathError("no usable file stem (empty or not valid UTF-8)",
                    source_path_);
  }
  return *stem;
}

std::string Document::file_name() const {
  std::string name = source_path_.filename().string();
  if (name.empty()) {
    throw PathError("unexpected empty file name", source_path_);
  }
  if (!text::is_valid_utf8(name)) {
    throw PathError("file name is not valid UTF-8", source_path_);
  }
  return name;
}

fs::path Document::relative_to(const fs::path &root) const {
  fs::path source = source_path_;
  fs::path base = root;
  if (source.is_absolute() != base.is_absolute()) {
    source = fs::absolute(source);
    base = fs::absolute(base);
  }

  fs::path relative =
      source.lexically_normal().lexically_relative(base.lexically_normal());
  if (relative.empty() || relative == "." || *relative.begin() == "..") {
    throw PathError("not under root " + root.string(), source_path_);
  }
  return relative;
}
