#include "markdown.hpp"
#include "errors.hpp"
#include "link_rewriter.hpp"
#include "markdown_event.hpp"
#include "utils/text.hpp"

#include <cmark-gfm-core-extensions.h>
#include <cstdlib>

MarkdownDocument::MarkdownDocument(const std::string &markdown) {
  if (!text::is_valid_utf8(markdown)) {
    throw MarkdownError("input is not valid UTF-8");
  }

  cmark_gfm_core_extensions_ensure_registered();

  parser_.reset(cmark_parser_new(CMARK_OPT_DEFAULT));
  if (!parser_) {
    throw MarkdownError("cannot create markdown parser");
  }

  // Strikethroughs are not part of CommonMark, so enable them explicitly.
  cmark_syntax_extension *ext = cmark_find_syntax_extension("strikethrough");
  if (!ext) {
    throw MarkdownError("cannot find Markdown extension 'strikethrough'");
  }
  if (!cmark_parser_attach_syntax_extension(parser_.get(), ext)) {
    throw MarkdownError("failed to enable Markdown extension 'strikethrough'");
  }

  cmark_parser_feed(parser_.get(), markdown.data(), markdown.size());
  root_.reset(cmark_parser_finish(parser_.get()));
  if (!root_) {
    throw MarkdownError("markdown parser failed");
  }

  // Entities and backslash escapes split text runs; a link label is read
  // from a single text node.
  cmark_consolidate_text_nodes(root_.get());
}

std::string MarkdownDocument::render_html() const {
  char *html = cmark_render_html(root_.get(), CMARK_OPT_UNSAFE,
                                 cmark_parser_get_syntax_extensions(
                                     parser_.get()));
  if (!html) {
    throw MarkdownError("markdown rendering failed");
  }
  std::string out(html);
  free(html);
  return out;
}

std::string MarkdownProcessor::to_html(const std::string &markdown) {
  MarkdownDocument document(markdown);

  NodeEventStream events(document.root());
  LinkRewriter rewriter(events);
  while (rewriter.next()) {
  }

  return document.render_html();
}
