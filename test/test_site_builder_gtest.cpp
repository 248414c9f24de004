#include <gtest/gtest.h>
#include "../src/core/document_scanner.hpp"
#include "../src/core/errors.hpp"
#include "../src/core/site_builder.hpp"
#include "../src/core/template_engine.hpp"
#include "../src/core/workspace.hpp"
#include "../src/utils/console.hpp"
#include "test_helpers.hpp"

#include <map>

namespace {

// Relative path -> content of every regular file under `root`.
std::map<std::string, std::string> snapshot(const fs::path &root) {
    std::map<std::string, std::string> files;
    for (const auto &entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files[fs::relative(entry.path(), root).generic_string()] =
                read_file(entry.path());
        }
    }
    return files;
}

} // namespace

class SiteBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        console::set_quiet(true);
        console::reset_warnings();
        write_file(tmp / "templates" / "default.tmpl",
                   "<title>{% if exists(\"title\") %}{{ title }}{% endif %}</title>\n{{ body }}");
        write_file(tmp / "templates" / "style.css", "p {}");
    }

    Workspace workspace() const {
        return Workspace(tmp / "markdown", tmp / "_website", tmp / "templates", "tmpl");
    }

    size_t build() {
        Workspace ws = workspace();
        TemplateEngine engine;
        engine.load_directory(ws.templates_dir(), ws.template_ext());
        SiteBuilder builder(ws, engine);
        return builder.export_static_site(scan_documents(ws.input_dir()));
    }

    TempDir tmp;
};

TEST_F(SiteBuilderTest, MirrorsInputTree) {
    write_file(tmp / "markdown" / "index.md", "---\ntitle: Home\n---\n[Next](sub/page.md)\n");
    write_file(tmp / "markdown" / "sub" / "page.markdown", "Page *one*\n");
    write_file(tmp / "markdown" / "media" / "song.mp3", std::string("ID3\0\x01", 5));
    write_file(tmp / "markdown" / ".draft.md", "secret\n");

    EXPECT_EQ(build(), 3u);

    auto files = snapshot(tmp / "_website");
    ASSERT_EQ(files.size(), 4u);
    EXPECT_EQ(files["index.html"],
              "<title>Home</title>\n<p><a href=\"sub/page.html\">Next</a></p>\n");
    EXPECT_EQ(files["sub/page.html"], "<title></title>\n<p>Page <em>one</em></p>\n");
    EXPECT_EQ(files["media/song.mp3"], std::string("ID3\0\x01", 5));
    EXPECT_EQ(files["style.css"], "p {}");
}

TEST_F(SiteBuilderTest, RebuildIsIdempotent) {
    write_file(tmp / "markdown" / "a.md", "# A\n");
    write_file(tmp / "markdown" / "b.txt", "plain");

    build();
    auto first = snapshot(tmp / "_website");
    build();
    EXPECT_EQ(snapshot(tmp / "_website"), first);
}

TEST_F(SiteBuilderTest, StaleOutputIsRemoved) {
    write_file(tmp / "markdown" / "a.md", "A\n");
    write_file(tmp / "_website" / "old.html", "stale");

    build();
    EXPECT_FALSE(fs::exists(tmp / "_website" / "old.html"));
    EXPECT_TRUE(fs::exists(tmp / "_website" / "a.html"));
}

TEST_F(SiteBuilderTest, EmptyInputWarns) {
    fs::create_directories(tmp / "markdown");
    EXPECT_EQ(build(), 0u);
    EXPECT_EQ(console::warning_count(), 1u);
    EXPECT_TRUE(fs::exists(tmp / "_website" / "style.css"));
}

TEST_F(SiteBuilderTest, OutputPathMapping) {
    Workspace ws = workspace();
    TemplateEngine engine;
    SiteBuilder builder(ws, engine);

    Document md(tmp / "markdown" / "x" / "y.md", MarkdownInfo{});
    Document bin(tmp / "markdown" / "x" / "y.png", OpaqueInfo{});
    EXPECT_EQ(builder.output_path(md), tmp / "_website" / "x" / "y.html");
    EXPECT_EQ(builder.output_path(bin), tmp / "_website" / "x" / "y.png");

    Document outside(tmp / "elsewhere.md", MarkdownInfo{});
    EXPECT_THROW(builder.output_path(outside), PathError);
}

TEST_F(SiteBuilderTest, TemplateFailureAbortsWithPath) {
    write_file(tmp / "templates" / "default.tmpl", "{{ title }}");
    write_file(tmp / "markdown" / "untitled.md", "no title\n");

    try {
        build();
        FAIL() << "expected TemplateRenderError";
    } catch (const TemplateRenderError &e) {
        EXPECT_EQ(e.path(), tmp / "markdown" / "untitled.md");
    }
}

TEST_F(SiteBuilderTest, RefusesOutputContainingInput) {
    Workspace ws(tmp / "site" / "markdown", tmp / "site", tmp / "templates", "tmpl");
    write_file(tmp / "site" / "markdown" / "a.md", "A\n");
    EXPECT_THROW(ws.prepare_output(), OutputError);
    EXPECT_TRUE(fs::exists(tmp / "site" / "markdown" / "a.md"));
}

TEST_F(SiteBuilderTest, DefaultTemplatesAreInflated) {
    Workspace ws(tmp / "markdown", tmp / "_website", tmp / "fresh", "tmpl");
    EXPECT_TRUE(ws.ensure_templates());
    EXPECT_TRUE(fs::exists(tmp / "fresh" / "default.tmpl"));
    EXPECT_TRUE(fs::exists(tmp / "fresh" / "style.css"));
    EXPECT_FALSE(ws.ensure_templates());
}

TEST_F(SiteBuilderTest, TwoSourcesForOneOutputFail) {
    write_file(tmp / "markdown" / "a.md", "first\n");
    write_file(tmp / "markdown" / "a.markdown", "second\n");

    try {
        build();
        FAIL() << "expected OutputError";
    } catch (const OutputError &e) {
        EXPECT_EQ(e.path(), tmp / "markdown" / "a.markdown");
        EXPECT_NE(e.message().find("a.md"), std::string::npos);
    }
}

TEST_F(SiteBuilderTest, OpaqueFileCollidingWithPageFails) {
    write_file(tmp / "markdown" / "a.html", "<p>raw</p>");
    write_file(tmp / "markdown" / "a.md", "page\n");

    EXPECT_THROW(build(), OutputError);
}
