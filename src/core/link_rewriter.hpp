#ifndef LINK_REWRITER_HPP
#define LINK_REWRITER_HPP

#include "markdown_event.hpp"

#include <cstddef>
#include <optional>
#include <string>

// Rewrites links in the tree behind an event stream, one event per pull:
//  - targets ending in ".md" point at the ".html" file the site build
//    produces from them;
//  - links to audio files become an inline <audio> player that replaces the
//    whole link span.
//
// Entering an audio link moves the machine Idle -> InLink; a text node as
// its first child moves it to AwaitingClose. The link's end, or any other
// event once the lookahead is spent, puts the player in place and returns it
// to Idle. No more than two events past the link start are inspected; link
// content beyond that is kept after the player.
class LinkRewriter : public EventStream {
public:
  enum class State { Idle, InLink, AwaitingClose };

  static constexpr const char *placeholder_label = "#";
  static constexpr size_t max_audio_lookahead = 2;

  explicit LinkRewriter(EventStream &source) : source_(source) {}

  // The next event after rewriting. Leaving an audio link yields the player
  // node instead.
  std::optional<MarkdownEvent> next() override;

  State state() const { return state_; }

  // Largest number of events inspected past a single audio link start.
  size_t lookahead_used() const { return lookahead_used_; }

  static std::string rewrite_markdown_target(const std::string &url);
  static std::string audio_player(const std::string &url,
                                  const std::string &title,
                                  const std::string &label);

private:
  MarkdownEvent enter_link(const MarkdownEvent &event);
  std::optional<MarkdownEvent> inspect(const MarkdownEvent &event);
  cmark_node *place_player();
  void unwrap_link();

  EventStream &source_;
  State state_ = State::Idle;
  cmark_node *link_ = nullptr;  // audio link being replaced
  cmark_node *label_ = nullptr; // its text child, if any
  size_t lookahead_ = 0;
  size_t lookahead_used_ = 0;
};

#endif
