#include "thinkara/ContentPipeline.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Thinkara {

namespace {

template<typename T>
json optionalToJson(const std::optional<T>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

} // namespace

json articleToJson(const ExtractedArticle& article) {
    json j;
    j["title"] = article.title;
    j["content"] = article.content;
    j["excerpt"] = article.excerpt;
    // null для отсутствующих полей, не пустые строки
    j["author"] = optionalToJson(article.author);
    j["siteName"] = optionalToJson(article.siteName);
    j["language"] = optionalToJson(article.language);
    j["publishedDate"] = optionalToJson(article.publishedDate);
    j["estimatedReadTime"] = article.estimatedReadTime;
    j["pageCount"] = optionalToJson(article.pageCount);
    j["cover"] = optionalToJson(article.cover);
    j["url"] = optionalToJson(article.url);
    j["sourceType"] = sourceTypeToString(article.sourceType);
    return j;
}

json epubMetadataToJson(const EpubMetadata& metadata) {
    return {
        {"title", metadata.title},
        {"author", metadata.author},
        {"publisher", optionalToJson(metadata.publisher)},
        {"description", optionalToJson(metadata.description)},
        {"language", optionalToJson(metadata.language)},
        {"publishedDate", optionalToJson(metadata.publishedDate)},
        {"cover", optionalToJson(metadata.cover)},
        {"coverSource", coverSourceToString(metadata.coverSource)}
    };
}

} // namespace Thinkara
