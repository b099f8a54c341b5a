// test_config.cpp — тесты PipelineConfig

#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "thinkara/Config.h"
#include "thinkara/Errors.h"

#include <nlohmann/json.hpp>

#include <fstream>

using namespace Thinkara;
using json = nlohmann::json;

TEST(ConfigTest, Defaults) {
    PipelineConfig config;

    EXPECT_EQ(config.fetch.timeoutMs, 10000);
    ASSERT_EQ(config.fetch.proxies.size(), 3u);
    EXPECT_EQ(config.fetch.proxies[0].prefix, "https://corsproxy.io/?");
    EXPECT_EQ(config.article.wordsPerMinute, 200);
    EXPECT_EQ(config.article.excerptLength, 280u);
    EXPECT_EQ(config.article.contentFormat, ContentFormat::Html);
    EXPECT_EQ(config.pdf.ocrLanguage, "eng");
    EXPECT_EQ(config.epub.wordsPerMinute, 250);
}

TEST(ConfigTest, PartialJsonKeepsDefaults) {
    auto config = PipelineConfig::fromJsonString(R"({"fetch": {"timeoutMs": 2500}})");

    EXPECT_EQ(config.fetch.timeoutMs, 2500);
    EXPECT_EQ(config.fetch.proxies.size(), 3u);
    EXPECT_EQ(config.article.wordsPerMinute, 200);
}

TEST(ConfigTest, ProxiesAreReplaced) {
    auto config = PipelineConfig::fromJsonString(R"({
        "fetch": {"proxies": [
            {"label": "mine", "prefix": "https://proxy.local/?u="},
            {"prefix": "https://other.local/"}
        ]}
    })");

    ASSERT_EQ(config.fetch.proxies.size(), 2u);
    EXPECT_EQ(config.fetch.proxies[0].label, "mine");
    EXPECT_EQ(config.fetch.proxies[1].label, "https://other.local/");
}

TEST(ConfigTest, EmptyProxyListMeansDirectOnly) {
    auto config = PipelineConfig::fromJsonString(R"({"fetch": {"proxies": []}})");
    EXPECT_TRUE(config.fetch.proxies.empty());
}

TEST(ConfigTest, MarkdownFormat) {
    auto config = PipelineConfig::fromJsonString(R"({"article": {"contentFormat": "markdown"}})");
    EXPECT_EQ(config.article.contentFormat, ContentFormat::Markdown);
}

TEST(ConfigTest, InvalidValuesRaiseValidationError) {
    EXPECT_THROW(PipelineConfig::fromJsonString("{not json"), ValidationError);
    EXPECT_THROW(PipelineConfig::fromJsonString("[1, 2]"), ValidationError);
    EXPECT_THROW(PipelineConfig::fromJsonString(R"({"fetch": {"timeoutMs": "fast"}})"),
                 ValidationError);
    EXPECT_THROW(PipelineConfig::fromJsonString(R"({"fetch": {"timeoutMs": 0}})"),
                 ValidationError);
    EXPECT_THROW(PipelineConfig::fromJsonString(R"({"fetch": 5})"), ValidationError);
    EXPECT_THROW(PipelineConfig::fromJsonString(R"({"fetch": {"proxies": {}}})"), ValidationError);
    EXPECT_THROW(PipelineConfig::fromJsonString(R"({"pdf": {"ocrScale": -1}})"), ValidationError);
}

TEST(ConfigTest, UnknownKeysIgnored) {
    auto config = PipelineConfig::fromJsonString(R"({"telemetry": true, "pdf": {"extra": 1}})");
    EXPECT_EQ(config.pdf.minTextChars, 10u);
}

TEST(ConfigTest, LoadFromFile) {
    TestHelpers::TempDir dir;
    std::string path = dir.file("config.json");
    {
        std::ofstream out(path);
        out << R"({"pdf": {"maxPages": 3, "ocrLanguage": "rus"}})";
    }

    auto config = PipelineConfig::loadFromFile(path);
    EXPECT_EQ(config.pdf.maxPages, 3);
    EXPECT_EQ(config.pdf.ocrLanguage, "rus");

    EXPECT_THROW(PipelineConfig::loadFromFile(dir.file("missing.json")), ValidationError);
}

TEST(ConfigTest, ToJsonReadsBack) {
    PipelineConfig original;
    original.fetch.timeoutMs = 1234;
    original.article.contentFormat = ContentFormat::Markdown;
    original.fetch.proxies = {{"solo", "https://solo.local/?"}};

    json j = original.toJson();
    EXPECT_EQ(j["article"]["contentFormat"], "markdown");

    auto parsed = PipelineConfig::fromJson(j);
    EXPECT_EQ(parsed.fetch.timeoutMs, 1234);
    EXPECT_EQ(parsed.article.contentFormat, ContentFormat::Markdown);
    ASSERT_EQ(parsed.fetch.proxies.size(), 1u);
    EXPECT_EQ(parsed.fetch.proxies[0].label, "solo");
}
