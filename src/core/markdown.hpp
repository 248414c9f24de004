#ifndef MARKDOWN_HPP
#define MARKDOWN_HPP

#include <cmark-gfm.h>
#include <memory>
#include <string>

// A parsed Markdown body: CommonMark with the strikethrough extension.
class MarkdownDocument {
public:
  // Throws MarkdownError on invalid UTF-8 or a parser failure.
  explicit MarkdownDocument(const std::string &markdown);

  cmark_node *root() const { return root_.get(); }

  // Raw HTML, including nodes inserted while rewriting, is kept as is.
  std::string render_html() const;

private:
  struct ParserDeleter {
    void operator()(cmark_parser *parser) const { cmark_parser_free(parser); }
  };
  struct NodeDeleter {
    void operator()(cmark_node *node) const { cmark_node_free(node); }
  };

  std::unique_ptr<cmark_parser, ParserDeleter> parser_;
  std::unique_ptr<cmark_node, NodeDeleter> root_;
};

class MarkdownProcessor {
public:
  // parse -> LinkRewriter -> cmark HTML renderer.
  static std::string to_html(const std::string &markdown);
};

#endif
