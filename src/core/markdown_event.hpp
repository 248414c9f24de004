#ifndef MARKDOWN_EVENT_HPP
#define MARKDOWN_EVENT_HPP

#include <cmark-gfm.h>
#include <cstddef>
#include <optional>

// One step of a walk over a parsed Markdown tree: entering or leaving a
// node. Leaf nodes (text, code, raw HTML, breaks) are only entered.
struct MarkdownEvent {
  cmark_event_type type = CMARK_EVENT_NONE;
  cmark_node *node = nullptr;

  cmark_node_type node_type() const { return cmark_node_get_type(node); }

  bool is_enter(cmark_node_type t) const {
    return type == CMARK_EVENT_ENTER && node_type() == t;
  }
  bool is_exit(cmark_node_type t) const {
    return type == CMARK_EVENT_EXIT && node_type() == t;
  }
};

// Pull-based, forward-only source of events.
class EventStream {
public:
  virtual ~EventStream() = default;
  virtual std::optional<MarkdownEvent> next() = 0;
};

// Walks a node tree in document order with cmark_iter. The step after the
// last event is already decided, so that event's node may be replaced or
// freed once it has been left (or entered, for a leaf), and nodes may be
// inserted before it at any time.
class NodeEventStream : public EventStream {
public:
  explicit NodeEventStream(cmark_node *root) : iter_(cmark_iter_new(root)) {}
  ~NodeEventStream() override { cmark_iter_free(iter_); }

  NodeEventStream(const NodeEventStream &) = delete;
  NodeEventStream &operator=(const NodeEventStream &) = delete;

  std::optional<MarkdownEvent> next() override {
    cmark_event_type type = cmark_iter_next(iter_);
    if (type == CMARK_EVENT_DONE) {
      return std::nullopt;
    }
    ++pulled_;
    return MarkdownEvent{type, cmark_iter_get_node(iter_)};
  }

  size_t pulled() const { return pulled_; }

private:
  cmark_iter *iter_;
  size_t pulled_ = 0;
};

#endif
