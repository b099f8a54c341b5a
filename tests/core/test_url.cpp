// test_url.cpp — тесты Url

#include <gtest/gtest.h>
#include "thinkara/Errors.h"
#include "thinkara/Url.h"

using namespace Thinkara;

TEST(UrlTest, AcceptsHttpAndHttps) {
    EXPECT_TRUE(Url::isValidHttpUrl("https://example.com/article"));
    EXPECT_TRUE(Url::isValidHttpUrl("http://example.com"));
    EXPECT_TRUE(Url::isValidHttpUrl("HTTPS://Example.COM/path?q=1"));
}

TEST(UrlTest, RejectsOtherSchemesAndGarbage) {
    EXPECT_FALSE(Url::isValidHttpUrl(""));
    EXPECT_FALSE(Url::isValidHttpUrl("ftp://example.com/file"));
    EXPECT_FALSE(Url::isValidHttpUrl("javascript:alert(1)"));
    EXPECT_FALSE(Url::isValidHttpUrl("file:///etc/passwd"));
    EXPECT_FALSE(Url::isValidHttpUrl("not a url"));
}

TEST(UrlTest, Hostname) {
    EXPECT_EQ(Url::hostname("https://example.com/article"), "example.com");
    EXPECT_EQ(Url::hostname("https://News.Example.ORG:8080/a"), "news.example.org");
    EXPECT_FALSE(Url::hostname("::::").has_value());
}

TEST(UrlTest, NormalizeLowercasesHost) {
    EXPECT_EQ(Url::normalize("https://EXAMPLE.com/Path"), "https://example.com/Path");
}

TEST(UrlTest, NormalizeRejectsInvalidUrl) {
    try {
        Url::normalize("ftp://example.com");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid URL provided");
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
    }
}

TEST(UrlTest, ResolveRelativeReferences) {
    const std::string base = "https://example.com/a/b/page.html";

    EXPECT_EQ(Url::resolve(base, "../img.png"), "https://example.com/a/img.png");
    EXPECT_EQ(Url::resolve(base, "/root.css"), "https://example.com/root.css");
    EXPECT_EQ(Url::resolve(base, "next.html"), "https://example.com/a/b/next.html");
    EXPECT_EQ(Url::resolve(base, "https://other.org/x"), "https://other.org/x");
}

TEST(UrlTest, ResolveKeepsFragmentsAndDataUrls) {
    const std::string base = "https://example.com/a/";

    EXPECT_EQ(Url::resolve(base, "#section"), "#section");
    EXPECT_EQ(Url::resolve(base, "data:image/png;base64,AAAA"), "data:image/png;base64,AAAA");
    EXPECT_EQ(Url::resolve(base, "mailto:me@example.com"), "mailto:me@example.com");
    EXPECT_FALSE(Url::resolve(base, "   ").has_value());
}

TEST(UrlTest, EncodeComponent) {
    EXPECT_EQ(Url::encodeComponent("https://example.com/a?b=c"),
              "https%3A%2F%2Fexample.com%2Fa%3Fb%3Dc");
    EXPECT_EQ(Url::encodeComponent("plain-text_1.0~"), "plain-text_1.0~");
}
