#include "thinkara/ContentPipeline.h"
#include "thinkara/Errors.h"
#include "thinkara/TextUtils.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace Thinkara {

namespace {

constexpr const char* UNTITLED = "Untitled";

/// "Книга.v2.pdf" -> "Книга.v2"
std::optional<std::string> titleFromFileName(const std::optional<std::string>& fileName) {
    if (!fileName) {
        return std::nullopt;
    }
    std::string name = *fileName;
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    auto dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) {
        name.resize(dot);
    }
    name = TextUtils::trim(name);
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

const ByteBuffer& requireBytes(const SourceRequest& request, const char* kind) {
    if (request.hasUrl()) {
        throw ValidationError(std::string(kind) + " source requires file bytes");
    }
    if (request.bytes().empty()) {
        throw ValidationError(std::string(kind) + " source is empty");
    }
    return request.bytes();
}

} // namespace

// ═══════════════════════════════════════════════════════════
// WebArticleSource
// ═══════════════════════════════════════════════════════════

WebArticleSource::WebArticleSource(std::shared_ptr<HtmlFetcher> fetcher, ArticleExtractor extractor)
    : m_fetcher(std::move(fetcher))
    , m_extractor(std::move(extractor))
{}

ExtractedArticle WebArticleSource::extract(const SourceRequest& request,
                                           const CancellationToken* cancel) {
    if (request.hasUrl()) {
        const std::string& url = request.url();
        // Сначала загрузка целиком, экстрактор вызывается только при успехе
        std::string html = m_fetcher->fetchHtml(url, cancel);
        return m_extractor.extractArticle(html, url);
    }

    // Байты = уже загруженный HTML
    if (!request.originalUrl) {
        throw ValidationError("HTML content requires the page URL");
    }
    const ByteBuffer& bytes = request.bytes();
    std::string html(bytes.begin(), bytes.end());
    return m_extractor.extractArticle(html, *request.originalUrl);
}

// ═══════════════════════════════════════════════════════════
// PdfSource
// ═══════════════════════════════════════════════════════════

PdfSource::PdfSource(std::shared_ptr<PdfExtractor> extractor, ArticleConfig articleConfig)
    : m_extractor(std::move(extractor))
    , m_articleConfig(std::move(articleConfig))
{}

ExtractedArticle PdfSource::extract(const SourceRequest& request, const CancellationToken*) {
    const ByteBuffer& bytes = requireBytes(request, "PDF");

    PdfDocumentText document = m_extractor->extractDocument(bytes);

    ExtractedArticle article;
    article.sourceType = SourceType::Pdf;
    article.title = document.title ? *document.title
                                   : titleFromFileName(request.fileName).value_or("");
    article.author = document.author;
    article.content = document.text;
    article.excerpt = TextUtils::makeExcerpt(document.text, m_articleConfig.excerptLength);
    article.pageCount = document.pageCount;
    article.url = request.originalUrl;

    size_t words = TextUtils::countWords(document.text);
    if (words > 0) {
        article.estimatedReadTime = TextUtils::estimateReadTime(words, m_articleConfig.wordsPerMinute);
    } else {
        // Текст не восстановлен, ~2 минуты на страницу
        article.estimatedReadTime = std::max(1, document.pageCount * 2);
    }
    return article;
}

// ═══════════════════════════════════════════════════════════
// EpubSource
// ═══════════════════════════════════════════════════════════

EpubSource::EpubSource(std::shared_ptr<EpubExtractor> extractor, ArticleConfig articleConfig)
    : m_extractor(std::move(extractor))
    , m_articleConfig(std::move(articleConfig))
{}

ExtractedArticle EpubSource::extract(const SourceRequest& request, const CancellationToken*) {
    const ByteBuffer& bytes = requireBytes(request, "EPUB");

    if (!EpubExtractor::validateEpubStructure(bytes)) {
        throw EpubStructuralError("Invalid EPUB: missing mimetype or META-INF/container.xml");
    }

    EpubMetadata metadata = m_extractor->extractEpubMetadata(bytes);
    std::string text = m_extractor->extractText(bytes);

    ExtractedArticle article;
    article.sourceType = SourceType::Epub;
    article.title = metadata.title;
    article.author = metadata.author;
    article.language = metadata.language;
    article.publishedDate = metadata.publishedDate;
    article.cover = metadata.cover;
    article.content = text;
    article.url = request.originalUrl;

    if (metadata.description && !metadata.description->empty()) {
        article.excerpt = TextUtils::makeExcerpt(*metadata.description, m_articleConfig.excerptLength);
    } else {
        article.excerpt = TextUtils::makeExcerpt(text, m_articleConfig.excerptLength);
    }

    size_t words = TextUtils::countWords(text);
    article.estimatedReadTime = words > 0
        ? TextUtils::estimateReadTime(words, m_extractor->config().wordsPerMinute)
        : m_extractor->estimateReadTimeFromSize(bytes.size());
    return article;
}

// ═══════════════════════════════════════════════════════════
// ContentPipeline
// ═══════════════════════════════════════════════════════════

ContentPipeline::ContentPipeline() = default;
ContentPipeline::~ContentPipeline() = default;

void ContentPipeline::registerExtractor(std::shared_ptr<IContentExtractor> extractor) {
    if (!extractor) {
        spdlog::warn("ContentPipeline: attempted to register null extractor");
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    // Проверяем, не зарегистрирован ли уже такой экстрактор
    for (const auto& existing : m_extractors) {
        if (existing->name() == extractor->name()) {
            spdlog::warn("ContentPipeline: extractor '{}' already registered", extractor->name());
            return;
        }
    }

    m_extractors.push_back(std::move(extractor));
    spdlog::debug("ContentPipeline: registered extractor '{}'", m_extractors.back()->name());
}

bool ContentPipeline::canProcess(SourceType type) const {
    return findExtractor(type) != nullptr;
}

std::string ContentPipeline::getExtractorName(SourceType type) const {
    auto extractor = findExtractor(type);
    return extractor ? extractor->name() : "";
}

ExtractedArticle ContentPipeline::process(const SourceRequest& request,
                                          const CancellationToken* cancel) {
    auto extractor = findExtractor(request.sourceType);
    if (!extractor) {
        throw ValidationError(std::string("No extractor for source type '") +
                              sourceTypeToString(request.sourceType) + "'");
    }

    spdlog::info("ContentPipeline: processing {} source via '{}'",
                 sourceTypeToString(request.sourceType), extractor->name());

    ExtractedArticle article;
    try {
        article = extractor->extract(request, cancel);
    } catch (const PipelineException& e) {
        spdlog::warn("ContentPipeline: {} error: {}", errorKindToString(e.kind()), e.what());
        throw;
    }

    article.sourceType = request.sourceType;
    if (TextUtils::trim(article.title).empty()) {
        article.title = UNTITLED;
    }
    article.estimatedReadTime = std::max(1, article.estimatedReadTime);
    if (!article.url && request.originalUrl) {
        article.url = request.originalUrl;
    }

    spdlog::debug("ContentPipeline: '{}' ready ({} min)", article.title, article.estimatedReadTime);
    return article;
}

std::shared_ptr<IContentExtractor> ContentPipeline::findExtractor(SourceType type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& extractor : m_extractors) {
        if (extractor->canHandle(type)) {
            return extractor;
        }
    }
    return nullptr;
}

std::unique_ptr<ContentPipeline> ContentPipeline::createDefault(const PipelineConfig& config) {
    auto pipeline = std::make_unique<ContentPipeline>();

    pipeline->registerExtractor(std::make_shared<WebArticleSource>(
        std::make_shared<HtmlFetcher>(config.fetch), ArticleExtractor(config.article)));
    pipeline->registerExtractor(std::make_shared<PdfSource>(
        std::make_shared<PdfExtractor>(config.pdf), config.article));
    pipeline->registerExtractor(std::make_shared<EpubSource>(
        std::make_shared<EpubExtractor>(config.epub), config.article));

    spdlog::info("ContentPipeline: default pipeline with {} extractors",
                 pipeline->m_extractors.size());
    return pipeline;
}

} // namespace Thinkara
