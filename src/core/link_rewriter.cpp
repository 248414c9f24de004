#include "link_rewriter.hpp"
#include "errors.hpp"
#include "utils/mime.hpp"
#include "utils/text.hpp"

#include <algorithm>

static std::string node_url(cmark_node *link) {
  const char *url = cmark_node_get_url(link);
  return url ? url : "";
}

static void insert_before(cmark_node *node, cmark_node *sibling) {
  if (!cmark_node_insert_before(node, sibling)) {
    throw MarkdownError("cannot rewrite audio link");
  }
}

std::string LinkRewriter::rewrite_markdown_target(const std::string &url) {
  static const std::string md_suffix = ".md";
  if (!text::ends_with(url, md_suffix)) {
    return url;
  }
  return url.substr(0, url.size() - md_suffix.size()) + ".html";
}

// cmark hands out link targets and labels already unescaped, so only the
// characters that matter inside HTML are escaped here.
std::string LinkRewriter::audio_player(const std::string &url,
                                       const std::string &title,
                                       const std::string &label) {
  std::string mime_type =
      mime::audio_type(text::extension_of(url)).value_or("audio/mpeg");
  std::string src = text::escape_html(url);

  std::string fallback = "<a href=\"" + src + "\" title=\"" +
                         text::escape_html(title) +
                         "\" class=\"audio\"><span class=\"fa-solid fa-play\">" +
                         text::escape_html(label) + "</span></a>";

  return "<audio controls><source src=\"" + src + "\" type=\"" + mime_type +
         "\">Your browser does not support the audio element. " + fallback +
         "</audio>";
}

std::optional<MarkdownEvent> LinkRewriter::next() {
  while (true) {
    std::optional<MarkdownEvent> event = source_.next();
    if (!event) {
      return std::nullopt;
    }

    if (state_ != State::Idle) {
      return inspect(*event);
    }

    // End of an audio link whose content was kept after the player.
    if (link_ && event->type == CMARK_EVENT_EXIT && event->node == link_) {
      unwrap_link();
      continue;
    }

    if (event->is_enter(CMARK_NODE_LINK)) {
      return enter_link(*event);
    }
    return event;
  }
}

MarkdownEvent LinkRewriter::enter_link(const MarkdownEvent &event) {
  std::string url = node_url(event.node);
  if (text::ends_with(url, ".md")) {
    cmark_node_set_url(event.node, rewrite_markdown_target(url).c_str());
  } else if (mime::is_audio_target(url)) {
    state_ = State::InLink;
    link_ = event.node;
    label_ = nullptr;
    lookahead_ = 0;
  }
  return event;
}

std::optional<MarkdownEvent>
LinkRewriter::inspect(const MarkdownEvent &event) {
  ++lookahead_;
  lookahead_used_ = std::max(lookahead_used_, lookahead_);

  if (event.type == CMARK_EVENT_EXIT && event.node == link_) {
    cmark_node *player = place_player();
    unwrap_link();
    return MarkdownEvent{CMARK_EVENT_ENTER, player};
  }

  if (state_ == State::InLink && event.is_enter(CMARK_NODE_TEXT)) {
    label_ = event.node;
    state_ = State::AwaitingClose;
    return event;
  }

  // Richer link content: the player goes in front of it now and the link
  // itself is unwrapped when it ends.
  place_player();
  return event;
}

cmark_node *LinkRewriter::place_player() {
  std::string label = placeholder_label;
  if (label_) {
    const char *literal = cmark_node_get_literal(label_);
    if (literal && *literal) {
      label = literal;
    }
  }
  const char *title = cmark_node_get_title(link_);

  cmark_node *player = cmark_node_new(CMARK_NODE_HTML_INLINE);
  cmark_node_set_literal(
      player, audio_player(node_url(link_), title ? title : "", label).c_str());
  if (!cmark_node_insert_before(link_, player)) {
    cmark_node_free(player);
    throw MarkdownError("cannot place audio player");
  }

  state_ = State::Idle;
  return player;
}

void LinkRewriter::unwrap_link() {
  cmark_node *child = cmark_node_first_child(link_);
  while (child) {
    cmark_node *next = cmark_node_next(child);
    if (child != label_) {
      insert_before(link_, child);
    }
    child = next;
  }

  // Frees the label with it.
  cmark_node_free(link_);
  link_ = nullptr;
  label_ = nullptr;
}
