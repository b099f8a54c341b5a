#include "thinkara/ArticleExtractor.h"
#include "thinkara/Errors.h"
#include "thinkara/TextUtils.h"
#include "thinkara/Url.h"

#include <spdlog/spdlog.h>

namespace Thinkara {

ArticleExtractor::ArticleExtractor(ArticleConfig config)
    : m_config(std::move(config))
    , m_readability(m_config.minParagraphChars)
{}

ExtractedArticle ArticleExtractor::extractArticle(const std::string& html,
                                                  const std::string& originUrl) const {
    // URL проверяется до любой работы с DOM
    if (!Url::isValidHttpUrl(originUrl)) {
        throw ValidationError("Invalid URL provided");
    }
    const std::string url = Url::normalize(originUrl);

    std::optional<ReadabilityArticle> parsed;
    try {
        parsed = m_readability.parse(html, url);
    } catch (const std::exception& e) {
        spdlog::warn("ArticleExtractor: readability failed for {}: {}", url, e.what());
        throw ReadabilityError(std::string("failed: ") + e.what());
    }

    if (!parsed) {
        throw ReadabilityError("returned null");
    }

    ExtractedArticle article;
    article.sourceType = SourceType::Web;
    article.url = url;
    article.title = parsed->title;

    std::string sanitized = m_sanitizer.sanitize(parsed->content);
    article.content = m_config.contentFormat == ContentFormat::Markdown
        ? MarkdownConverter::toMarkdown(sanitized)
        : sanitized;

    if (parsed->excerpt && !TextUtils::trim(*parsed->excerpt).empty()) {
        article.excerpt = TextUtils::trim(*parsed->excerpt);
    } else {
        article.excerpt = TextUtils::makeExcerpt(parsed->textContent, m_config.excerptLength);
    }

    if (parsed->siteName && !parsed->siteName->empty()) {
        article.siteName = parsed->siteName;
    } else {
        article.siteName = Url::hostname(url);
    }

    article.author = parsed->byline;
    article.language = parsed->language;
    article.publishedDate = parsed->publishedTime;

    size_t words = TextUtils::countWords(parsed->textContent);
    article.estimatedReadTime = TextUtils::estimateReadTime(words, m_config.wordsPerMinute);

    spdlog::debug("ArticleExtractor: '{}' from {} ({} words)", article.title, url, words);
    return article;
}

} // namespace Thinkara
