#include <gtest/gtest.h>
#include "../src/core/errors.hpp"
#include "../src/core/frontmatter.hpp"

TEST(FrontMatterTest, SplitsBlockFromBody) {
    auto [fm, body] = FrontMatter::split("---\ntitle: Hello\nlang: en\n---\n# Heading\n");
    ASSERT_TRUE(fm.has_value());
    EXPECT_EQ(fm->size(), 2u);
    EXPECT_EQ(fm->get("title"), "Hello");
    EXPECT_EQ(fm->get("lang"), "en");
    EXPECT_EQ(body, "# Heading\n");
}

TEST(FrontMatterTest, ReassemblesToOriginalInput) {
    const std::string block = "title: Hello, world\nauthor: \"Me\"\n";
    const std::string rest = "\nBody text\n---\nmore\n";
    const std::string input = "---\n" + block + "---\n" + rest;

    auto [fm, body] = FrontMatter::split(input);
    ASSERT_TRUE(fm.has_value());
    EXPECT_EQ(body, rest);
    EXPECT_EQ("---\n" + block + "---\n" + body, input);
}

TEST(FrontMatterTest, NoDelimiterLeavesContentUntouched) {
    const std::string input = "# Just markdown\n\n---\nnot: metadata\n---\n";
    auto [fm, body] = FrontMatter::split(input);
    EXPECT_FALSE(fm.has_value());
    EXPECT_EQ(body, input);
}

TEST(FrontMatterTest, UnclosedBlockIsNotMetadata) {
    const std::string input = "---\ntitle: Hello\n\nBody\n";
    auto [fm, body] = FrontMatter::split(input);
    EXPECT_FALSE(fm.has_value());
    EXPECT_EQ(body, input);
}

TEST(FrontMatterTest, ClosingDelimiterMustBeWholeLine) {
    const std::string input = "---\ntitle: Hello\n----\nBody\n";
    auto [fm, body] = FrontMatter::split(input);
    EXPECT_FALSE(fm.has_value());
    EXPECT_EQ(body, input);
}

TEST(FrontMatterTest, EmptyBlock) {
    auto [fm, body] = FrontMatter::split("---\n---\nBody\n");
    ASSERT_TRUE(fm.has_value());
    EXPECT_TRUE(fm->empty());
    EXPECT_EQ(body, "Body\n");
}

TEST(FrontMatterTest, WindowsLineEndings) {
    auto [fm, body] = FrontMatter::split("---\r\ntitle: Hello\r\n---\r\nBody\r\n");
    ASSERT_TRUE(fm.has_value());
    EXPECT_EQ(fm->get("title"), "Hello");
    EXPECT_EQ(body, "Body\r\n");
}

TEST(FrontMatterTest, QuotedScalarsStayStrings) {
    auto [fm, body] = FrontMatter::split("---\nyear: \"2021\"\ndraft: 'true'\n---\n");
    ASSERT_TRUE(fm.has_value());
    EXPECT_EQ(fm->get("year"), "2021");
    EXPECT_EQ(fm->get("draft"), "true");
    EXPECT_EQ(body, "");
}

TEST(FrontMatterTest, RejectsNonStringValues) {
    EXPECT_THROW(FrontMatter::split("---\nyear: 2021\n---\n"), MetadataParseError);
    EXPECT_THROW(FrontMatter::split("---\ndraft: true\n---\n"), MetadataParseError);
    EXPECT_THROW(FrontMatter::split("---\ntags: [a, b]\n---\n"), MetadataParseError);
    EXPECT_THROW(FrontMatter::split("---\nnested:\n  a: b\n---\n"), MetadataParseError);
    EXPECT_THROW(FrontMatter::split("---\nempty:\n---\n"), MetadataParseError);
}

TEST(FrontMatterTest, RejectsNonMapBlock) {
    EXPECT_THROW(FrontMatter::split("---\n- a\n- b\n---\n"), MetadataParseError);
    EXPECT_THROW(FrontMatter::split("---\njust text\n---\n"), MetadataParseError);
}

TEST(FrontMatterTest, RejectsMalformedYaml) {
    EXPECT_THROW(FrontMatter::split("---\ntitle: [unclosed\n---\n"), MetadataParseError);
}

TEST(FrontMatterTest, RejectsDuplicateKeys) {
    EXPECT_THROW(FrontMatter::split("---\ntitle: a\ntitle: b\n---\n"), MetadataParseError);
}

TEST(FrontMatterTest, GetFallsBackToDefault) {
    auto [fm, body] = FrontMatter::split("---\ntitle: x\n---\n");
    ASSERT_TRUE(fm.has_value());
    EXPECT_TRUE(fm->has("title"));
    EXPECT_FALSE(fm->has("author"));
    EXPECT_EQ(fm->get("author", "anon"), "anon");
}
