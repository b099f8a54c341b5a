// ContentPipeline.h — Фасад конвейера извлечения
// Выбирает экстрактор по типу источника и возвращает каноническую запись

#pragma once

#include "export.h"
#include "ArticleExtractor.h"
#include "Config.h"
#include "EpubExtractor.h"
#include "HtmlFetcher.h"
#include "Models.h"
#include "PdfExtractor.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace Thinkara {

// ═══════════════════════════════════════════════════════════
// Интерфейс экстрактора источника
// ═══════════════════════════════════════════════════════════

class TK_API IContentExtractor {
public:
    virtual ~IContentExtractor() = default;

    /// Имя экстрактора (для логирования)
    virtual std::string name() const = 0;

    virtual bool canHandle(SourceType type) const = 0;

    /// Извлечь статью
    /// @throws PipelineException наследники
    virtual ExtractedArticle extract(const SourceRequest& request,
                                     const CancellationToken* cancel) = 0;
};

// ═══════════════════════════════════════════════════════════
// Экстракторы по типам
// ═══════════════════════════════════════════════════════════

/// URL -> HtmlFetcher -> ArticleExtractor
class TK_API WebArticleSource : public IContentExtractor {
public:
    WebArticleSource(std::shared_ptr<HtmlFetcher> fetcher, ArticleExtractor extractor);

    std::string name() const override { return "web"; }
    bool canHandle(SourceType type) const override { return type == SourceType::Web; }
    ExtractedArticle extract(const SourceRequest& request, const CancellationToken* cancel) override;

private:
    std::shared_ptr<HtmlFetcher> m_fetcher;
    ArticleExtractor m_extractor;
};

class TK_API PdfSource : public IContentExtractor {
public:
    PdfSource(std::shared_ptr<PdfExtractor> extractor, ArticleConfig articleConfig = {});

    std::string name() const override { return "pdf"; }
    bool canHandle(SourceType type) const override { return type == SourceType::Pdf; }
    ExtractedArticle extract(const SourceRequest& request, const CancellationToken* cancel) override;

private:
    std::shared_ptr<PdfExtractor> m_extractor;
    ArticleConfig m_articleConfig;
};

class TK_API EpubSource : public IContentExtractor {
public:
    EpubSource(std::shared_ptr<EpubExtractor> extractor, ArticleConfig articleConfig = {});

    std::string name() const override { return "epub"; }
    bool canHandle(SourceType type) const override { return type == SourceType::Epub; }
    ExtractedArticle extract(const SourceRequest& request, const CancellationToken* cancel) override;

private:
    std::shared_ptr<EpubExtractor> m_extractor;
    ArticleConfig m_articleConfig;
};

// ═══════════════════════════════════════════════════════════
// ContentPipeline
// ═══════════════════════════════════════════════════════════

class TK_API ContentPipeline {
public:
    ContentPipeline();
    ~ContentPipeline();

    /// Зарегистрировать экстрактор (повтор имени игнорируется)
    void registerExtractor(std::shared_ptr<IContentExtractor> extractor);

    bool canProcess(SourceType type) const;

    std::string getExtractorName(SourceType type) const;

    /// Обработать запрос
    /// @throws ValidationError нет экстрактора или неверный запрос
    /// @throws PipelineException ошибка выбранного экстрактора
    ExtractedArticle process(const SourceRequest& request,
                             const CancellationToken* cancel = nullptr);

    /// Реестр с web/pdf/epub на настройках config
    static std::unique_ptr<ContentPipeline> createDefault(const PipelineConfig& config = {});

private:
    std::shared_ptr<IContentExtractor> findExtractor(SourceType type) const;

    std::vector<std::shared_ptr<IContentExtractor>> m_extractors;
    mutable std::mutex m_mutex;
};

// ═══════════════════════════════════════════════════════════
// JSON-контракт записи
// ═══════════════════════════════════════════════════════════

/// camelCase ключи, отсутствующие поля = null
TK_API nlohmann::json articleToJson(const ExtractedArticle& article);

TK_API nlohmann::json epubMetadataToJson(const EpubMetadata& metadata);

} // namespace Thinkara
