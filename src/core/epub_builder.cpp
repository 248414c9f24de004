#include "epub_builder.hpp"
#include "errors.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <memory>
#include <utility>
#include <tinyxml2.h>
#include <zip.h>

namespace {

const char mimetype_text[] = "application/epub+zip";
const char xhtml_media_type[] = "application/xhtml+xml";
const char cover_page_path[] = "cover.xhtml";

// 2000-01-01T00:00:00Z, stamped on every entry.
const time_t fixed_mtime = 946684800;

const char *guide_type(ReferenceType type) {
  switch (type) {
  case ReferenceType::Cover:
    return "cover";
  case ReferenceType::TitlePage:
    return "title-page";
  case ReferenceType::Text:
    return "text";
  }
  return "text";
}

std::string part_id(size_t index) { return "part" + std::to_string(index + 1); }

std::string print(tinyxml2::XMLDocument &doc) {
  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return printer.CStr();
}

void add_doctype(tinyxml2::XMLDocument &doc, const char *doctype) {
  doc.InsertFirstChild(doc.NewDeclaration(nullptr));
  if (doctype) {
    doc.InsertEndChild(doc.NewUnknown(doctype));
  }
}

tinyxml2::XMLElement *add_element(tinyxml2::XMLDocument &doc,
                                  tinyxml2::XMLNode *parent, const char *name,
                                  const std::string &text = {}) {
  tinyxml2::XMLElement *element = doc.NewElement(name);
  if (!text.empty()) {
    element->SetText(text.c_str());
  }
  parent->InsertEndChild(element);
  return element;
}

std::string zip_message(zip_t *archive) {
  return zip_error_strerror(zip_get_error(archive));
}

using ZipArchive = std::unique_ptr<zip_t, decltype(&zip_discard)>;

// Adds `data` under `name`. The buffer must stay alive until the archive is
// closed.
void add_entry(zip_t *archive, const std::string &name, const std::string &data,
               bool compress, const fs::path &out_file) {
  zip_source_t *source =
      zip_source_buffer(archive, data.data(), data.size(), 0);
  if (!source) {
    throw PackagingError("cannot buffer " + name + ": " + zip_message(archive),
                         out_file);
  }
  zip_int64_t index = zip_file_add(archive, name.c_str(), source,
                                   ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
  if (index < 0) {
    zip_source_free(source);
    throw PackagingError("cannot add " + name + ": " + zip_message(archive),
                         out_file);
  }
  auto entry = static_cast<zip_uint64_t>(index);
  if (zip_set_file_compression(archive, entry,
                               compress ? ZIP_CM_DEFLATE : ZIP_CM_STORE,
                               0) != 0 ||
      zip_file_set_mtime(archive, entry, fixed_mtime, 0) != 0) {
    throw PackagingError("cannot configure " + name + ": " +
                             zip_message(archive),
                         out_file);
  }
}

} // namespace

bool EpubBuilder::path_taken(const std::string &path) const {
  if (path == cover_page_path || path == "content.opf" || path == "toc.ncx") {
    return true;
  }
  if (cover_ && cover_->path == path) {
    return true;
  }
  for (const auto &content : contents_) {
    if (content.path == path) {
      return true;
    }
  }
  return false;
}

void EpubBuilder::add_cover_image(const std::string &path, std::string data,
                                  const std::string &mime_type) {
  if (cover_) {
    throw PackagingError("a cover image was already added (" + cover_->path +
                         "), cannot add " + path);
  }
  if (path.empty()) {
    throw PackagingError("cover image needs a file name");
  }
  if (path_taken(path)) {
    throw PackagingError("duplicate package path: " + path);
  }
  cover_ = EpubCover{path, std::move(data), mime_type};
}

void EpubBuilder::add_content(EpubContent content) {
  if (content.path.empty()) {
    throw PackagingError("content part needs a file name");
  }
  if (path_taken(content.path)) {
    throw PackagingError("duplicate package path: " + content.path);
  }
  contents_.push_back(std::move(content));
}

std::string EpubBuilder::identifier() const {
  // FNV-1a, 64 bit
  uint64_t hash = 14695981039346656037ull;
  auto feed = [&hash](const std::string &s) {
    for (unsigned char c : s) {
      hash ^= c;
      hash *= 1099511628211ull;
    }
  };
  feed(title_);
  feed(std::string(1, '\0'));
  feed(author_);

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(hash));
  return std::string("urn:scribe:") + buf;
}

std::string EpubBuilder::container_xml() const {
  tinyxml2::XMLDocument doc;
  add_doctype(doc, nullptr);

  auto container = add_element(doc, &doc, "container");
  container->SetAttribute("version", "1.0");
  container->SetAttribute("xmlns",
                          "urn:oasis:names:tc:opendocument:xmlns:container");
  auto rootfiles = add_element(doc, container, "rootfiles");
  auto rootfile = add_element(doc, rootfiles, "rootfile");
  rootfile->SetAttribute("full-path", "OEBPS/content.opf");
  rootfile->SetAttribute("media-type", "application/oebps-package+xml");

  return print(doc);
}

std::string EpubBuilder::content_opf() const {
  tinyxml2::XMLDocument opf;
  add_doctype(opf, nullptr);

  auto package = add_element(opf, &opf, "package");
  package->SetAttribute("version", "2.0");
  package->SetAttribute("xmlns", "http://www.idpf.org/2007/opf");
  package->SetAttribute("unique-identifier", "BookId");

  auto metadata = add_element(opf, package, "metadata");
  metadata->SetAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
  metadata->SetAttribute("xmlns:opf", "http://www.idpf.org/2007/opf");
  add_element(opf, metadata, "dc:title", title_);
  add_element(opf, metadata, "dc:language", language_);
  auto id = add_element(opf, metadata, "dc:identifier", identifier());
  id->SetAttribute("id", "BookId");
  if (!author_.empty()) {
    auto creator = add_element(opf, metadata, "dc:creator", author_);
    creator->SetAttribute("opf:role", "aut");
  }
  if (cover_) {
    auto meta = add_element(opf, metadata, "meta");
    meta->SetAttribute("name", "cover");
    meta->SetAttribute("content", "cover-image");
  }

  auto manifest = add_element(opf, package, "manifest");
  auto item = add_element(opf, manifest, "item");
  item->SetAttribute("id", "ncx");
  item->SetAttribute("href", "toc.ncx");
  item->SetAttribute("media-type", "application/x-dtbncx+xml");
  if (cover_) {
    item = add_element(opf, manifest, "item");
    item->SetAttribute("id", "cover-image");
    item->SetAttribute("href", cover_->path.c_str());
    item->SetAttribute("media-type", cover_->mime_type.c_str());
    item = add_element(opf, manifest, "item");
    item->SetAttribute("id", "cover");
    item->SetAttribute("href", cover_page_path);
    item->SetAttribute("media-type", xhtml_media_type);
  }
  for (size_t i = 0; i < contents_.size(); ++i) {
    item = add_element(opf, manifest, "item");
    item->SetAttribute("id", part_id(i).c_str());
    item->SetAttribute("href", contents_[i].path.c_str());
    item->SetAttribute("media-type", xhtml_media_type);
  }

  auto spine = add_element(opf, package, "spine");
  spine->SetAttribute("toc", "ncx");
  if (cover_) {
    add_element(opf, spine, "itemref")->SetAttribute("idref", "cover");
  }
  for (size_t i = 0; i < contents_.size(); ++i) {
    add_element(opf, spine, "itemref")->SetAttribute("idref",
                                                     part_id(i).c_str());
  }

  auto guide = add_element(opf, package, "guide");
  if (cover_) {
    auto ref = add_element(opf, guide, "reference");
    ref->SetAttribute("type", guide_type(ReferenceType::Cover));
    ref->SetAttribute("title", "Cover");
    ref->SetAttribute("href", cover_page_path);
  }
  for (const auto &content : contents_) {
    auto ref = add_element(opf, guide, "reference");
    ref->SetAttribute("type", guide_type(content.reftype));
    ref->SetAttribute("title",
                      content.title.empty() ? content.path.c_str()
                                            : content.title.c_str());
    ref->SetAttribute("href", content.path.c_str());
  }

  return print(opf);
}

std::string EpubBuilder::toc_ncx() const {
  tinyxml2::XMLDocument ncx;
  add_doctype(ncx, R"(DOCTYPE ncx PUBLIC "-//NISO//DTD ncx 2005-1//EN" "http://www.daisy.org/z3986/2005/ncx-2005-1.dtd")");

  auto root = add_element(ncx, &ncx, "ncx");
  root->SetAttribute("version", "2005-1");
  root->SetAttribute("xml:lang", language_.c_str());
  root->SetAttribute("xmlns", "http://www.daisy.org/z3986/2005/ncx/");

  auto head = add_element(ncx, root, "head");
  const std::pair<const char *, std::string> metas[] = {
      {"dtb:uid", identifier()},
      {"dtb:depth", "1"},
      {"dtb:totalPageCount", "0"},
      {"dtb:maxPageNumber", "0"}};
  for (const auto &[name, value] : metas) {
    auto meta = add_element(ncx, head, "meta");
    meta->SetAttribute("name", name);
    meta->SetAttribute("content", value.c_str());
  }

  add_element(ncx, add_element(ncx, root, "docTitle"), "text", title_);
  if (!author_.empty()) {
    add_element(ncx, add_element(ncx, root, "docAuthor"), "text", author_);
  }

  // Only titled parts are navigable.
  auto navmap = add_element(ncx, root, "navMap");
  int order = 1;
  for (size_t i = 0; i < contents_.size(); ++i) {
    const EpubContent &content = contents_[i];
    if (content.title.empty()) {
      continue;
    }
    auto point = add_element(ncx, navmap, "navPoint");
    point->SetAttribute("id", ("nav-" + part_id(i)).c_str());
    point->SetAttribute("playOrder", order++);
    add_element(ncx, add_element(ncx, point, "navLabel"), "text",
                content.title);
    add_element(ncx, point, "content")
        ->SetAttribute("src", content.path.c_str());
  }

  return print(ncx);
}

std::string EpubBuilder::cover_xhtml() const {
  tinyxml2::XMLDocument doc;
  add_doctype(doc, R"(DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.1//EN" "http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd")");

  auto html = add_element(doc, &doc, "html");
  html->SetAttribute("xmlns", "http://www.w3.org/1999/xhtml");
  html->SetAttribute("xml:lang", language_.c_str());
  auto head = add_element(doc, html, "head");
  add_element(doc, head, "title", "Cover");
  auto body = add_element(doc, html, "body");
  auto div = add_element(doc, body, "div");
  div->SetAttribute("style", "text-align: center;");
  auto img = add_element(doc, div, "img");
  img->SetAttribute("src", cover_ ? cover_->path.c_str() : "");
  img->SetAttribute("alt", title_.c_str());

  return print(doc);
}

void EpubBuilder::generate(const fs::path &out_file) const {
  int error_code = 0;
  zip_t *raw = zip_open(out_file.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE,
                        &error_code);
  if (!raw) {
    zip_error_t error;
    zip_error_init_with_code(&error, error_code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    throw PackagingError("cannot create archive: " + message, out_file);
  }
  ZipArchive archive(raw, &zip_discard);

  // Buffers handed to libzip are only read at close time.
  const std::string mimetype = mimetype_text;
  const std::string container = container_xml();
  const std::string opf = content_opf();
  const std::string ncx = toc_ncx();
  const std::string cover_page = cover_ ? cover_xhtml() : std::string();

  add_entry(raw, "mimetype", mimetype, false, out_file);
  add_entry(raw, "META-INF/container.xml", container, true, out_file);
  add_entry(raw, "OEBPS/content.opf", opf, true, out_file);
  add_entry(raw, "OEBPS/toc.ncx", ncx, true, out_file);
  if (cover_) {
    add_entry(raw, "OEBPS/" + cover_->path, cover_->data, false, out_file);
    add_entry(raw, std::string("OEBPS/") + cover_page_path, cover_page, true,
              out_file);
  }
  for (const auto &content : contents_) {
    add_entry(raw, "OEBPS/" + content.path, content.data, true, out_file);
  }

  if (zip_close(raw) != 0) {
    // The archive stays open on failure; the unique_ptr discards it.
    throw PackagingError("cannot write archive: " + zip_message(raw),
                         out_file);
  }
  archive.release();
}
