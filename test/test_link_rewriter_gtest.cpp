#include <gtest/gtest.h>
#include "../src/core/link_rewriter.hpp"
#include "../src/core/markdown.hpp"

#include <string>

namespace {

void drain(EventStream &stream) {
    while (stream.next()) {
    }
}

// Rewrites every link in `markdown` and renders the result.
std::string rewrite(const std::string &markdown, size_t *lookahead = nullptr) {
    MarkdownDocument document(markdown);
    NodeEventStream events(document.root());
    LinkRewriter rewriter(events);
    drain(rewriter);
    if (lookahead) {
        *lookahead = rewriter.lookahead_used();
    }
    return document.render_html();
}

std::string player(const std::string &url, const std::string &type,
                   const std::string &title, const std::string &label) {
    return "<audio controls><source src=\"" + url + "\" type=\"" + type +
           "\">Your browser does not support the audio element. <a href=\"" + url +
           "\" title=\"" + title + "\" class=\"audio\"><span class=\"fa-solid fa-play\">" +
           label + "</span></a></audio>";
}

} // namespace

TEST(LinkRewriterTest, MarkdownTargetsBecomeHtml) {
    EXPECT_EQ(LinkRewriter::rewrite_markdown_target("next.md"), "next.html");
    EXPECT_EQ(LinkRewriter::rewrite_markdown_target("dir/a.b.md"), "dir/a.b.html");
    EXPECT_EQ(LinkRewriter::rewrite_markdown_target("page.md#frag"), "page.md#frag");
    EXPECT_EQ(LinkRewriter::rewrite_markdown_target("page.MD"), "page.MD");
    EXPECT_EQ(LinkRewriter::rewrite_markdown_target("https://x.org/"), "https://x.org/");
}

TEST(LinkRewriterTest, RewritesLinkTargetInPlace) {
    MarkdownDocument document("[next](chapter2.md \"Next\")\n");
    NodeEventStream events(document.root());
    LinkRewriter rewriter(events);

    std::optional<MarkdownEvent> event;
    while ((event = rewriter.next()) && !event->is_enter(CMARK_NODE_LINK)) {
    }
    ASSERT_TRUE(event.has_value());
    EXPECT_STREQ(cmark_node_get_url(event->node), "chapter2.html");
    EXPECT_STREQ(cmark_node_get_title(event->node), "Next");
    EXPECT_EQ(rewriter.state(), LinkRewriter::State::Idle);

    drain(rewriter);
    EXPECT_EQ(document.render_html(),
              "<p><a href=\"chapter2.html\" title=\"Next\">next</a></p>\n");
}

TEST(LinkRewriterTest, OtherLinksPassThrough) {
    size_t lookahead = 0;
    EXPECT_EQ(rewrite("[site](https://example.com/)\n", &lookahead),
              "<p><a href=\"https://example.com/\">site</a></p>\n");
    EXPECT_EQ(lookahead, 0u);
}

TEST(LinkRewriterTest, AudioLinkStatesAcrossPulls) {
    MarkdownDocument document("[Listen](media/song.mp3 \"Song\")\n");
    NodeEventStream events(document.root());
    LinkRewriter rewriter(events);

    ASSERT_TRUE(rewriter.next()->is_enter(CMARK_NODE_DOCUMENT));
    ASSERT_TRUE(rewriter.next()->is_enter(CMARK_NODE_PARAGRAPH));
    EXPECT_EQ(rewriter.state(), LinkRewriter::State::Idle);

    std::optional<MarkdownEvent> link = rewriter.next();
    ASSERT_TRUE(link && link->is_enter(CMARK_NODE_LINK));
    EXPECT_EQ(rewriter.state(), LinkRewriter::State::InLink);

    std::optional<MarkdownEvent> label = rewriter.next();
    ASSERT_TRUE(label && label->is_enter(CMARK_NODE_TEXT));
    EXPECT_EQ(rewriter.state(), LinkRewriter::State::AwaitingClose);

    std::optional<MarkdownEvent> replaced = rewriter.next();
    ASSERT_TRUE(replaced && replaced->is_enter(CMARK_NODE_HTML_INLINE));
    EXPECT_EQ(rewriter.state(), LinkRewriter::State::Idle);
    EXPECT_EQ(cmark_node_get_literal(replaced->node),
              player("media/song.mp3", "audio/mpeg", "Song", "Listen"));

    ASSERT_TRUE(rewriter.next()->is_exit(CMARK_NODE_PARAGRAPH));
    ASSERT_TRUE(rewriter.next()->is_exit(CMARK_NODE_DOCUMENT));
    EXPECT_FALSE(rewriter.next().has_value());

    EXPECT_EQ(events.pulled(), 7u);
    EXPECT_EQ(rewriter.lookahead_used(), LinkRewriter::max_audio_lookahead);
    EXPECT_EQ(document.render_html(),
              "<p>" + player("media/song.mp3", "audio/mpeg", "Song", "Listen") + "</p>\n");
}

TEST(LinkRewriterTest, AudioLinkWithoutTextUsesPlaceholder) {
    size_t lookahead = 0;
    EXPECT_EQ(rewrite("[](clip.OGG)\n", &lookahead),
              "<p>" + player("clip.OGG", "audio/ogg", "", "#") + "</p>\n");
    EXPECT_EQ(lookahead, 1u);
}

TEST(LinkRewriterTest, EntityInLabelStaysInOnePiece) {
    EXPECT_EQ(rewrite("[Caf&eacute; song](a.mp3)\n"),
              "<p>" + player("a.mp3", "audio/mpeg", "", "Caf\xC3\xA9 song") + "</p>\n");
}

TEST(LinkRewriterTest, RichAudioLinkContentFollowsPlayer) {
    size_t lookahead = 0;
    EXPECT_EQ(rewrite("[*loud*](a.mp3) after\n", &lookahead),
              "<p>" + player("a.mp3", "audio/mpeg", "", "#") + "<em>loud</em> after</p>\n");
    EXPECT_LE(lookahead, LinkRewriter::max_audio_lookahead);
}

TEST(LinkRewriterTest, TextThenMoreContentKeepsLabel) {
    size_t lookahead = 0;
    EXPECT_EQ(rewrite("[Play **now**](b.mp3)\n", &lookahead),
              "<p>" + player("b.mp3", "audio/mpeg", "", "Play ") +
                  "<strong>now</strong></p>\n");
    EXPECT_EQ(lookahead, 2u);
}

TEST(LinkRewriterTest, ConsecutiveAudioLinks) {
    EXPECT_EQ(rewrite("[1](one.mp3)[2](two.flac)\n"),
              "<p>" + player("one.mp3", "audio/mpeg", "", "1") +
                  player("two.flac", "audio/flac", "", "2") + "</p>\n");
}

TEST(LinkRewriterTest, PlayerEscapesAttributes) {
    std::string html = LinkRewriter::audio_player("a&b.mp3", "say \"hi\"", "<x>");
    EXPECT_NE(html.find("src=\"a&amp;b.mp3\""), std::string::npos);
    EXPECT_NE(html.find("title=\"say &quot;hi&quot;\""), std::string::npos);
    EXPECT_NE(html.find(">&lt;x&gt;</span>"), std::string::npos);
}
