// ArticleExtractor.h — Извлечение статьи из HTML
// Readability-эвристика, санитизация по allow-list, конвертация в Markdown

#pragma once

#include "export.h"
#include "Config.h"
#include "Models.h"
#include <optional>
#include <set>
#include <string>

namespace Thinkara {

// ═══════════════════════════════════════════════════════════
// Результат эвристики
// ═══════════════════════════════════════════════════════════

struct ReadabilityArticle {
    std::string title;
    std::string content;        // HTML выбранного узла, ссылки абсолютные
    std::string textContent;    // Текст выбранного узла
    std::optional<std::string> byline;
    std::optional<std::string> excerpt;
    std::optional<std::string> siteName;
    std::optional<std::string> language;
    std::optional<std::string> publishedTime;
};

// ═══════════════════════════════════════════════════════════
// Readability
// ═══════════════════════════════════════════════════════════

/// Оценка поддеревьев DOM: абзацы дают очки родителю и деду,
/// итог штрафуется плотностью ссылок
class TK_API Readability {
public:
    explicit Readability(size_t minParagraphChars = 25);

    /// Разобрать документ
    /// @param html Исходный HTML
    /// @param documentUrl База для относительных ссылок
    /// @return nullopt если статья не найдена
    /// @throws std::runtime_error если парсер не вернул дерево
    std::optional<ReadabilityArticle> parse(const std::string& html,
                                            const std::string& documentUrl) const;

private:
    size_t m_minParagraphChars;
};

// ═══════════════════════════════════════════════════════════
// HtmlSanitizer
// ═══════════════════════════════════════════════════════════

class TK_API HtmlSanitizer {
public:
    /// Allow-list по умолчанию (теги и атрибуты статьи)
    HtmlSanitizer();

    HtmlSanitizer(std::set<std::string> allowedTags, std::set<std::string> allowedAttributes);

    /// Оставить только разрешённые теги и атрибуты.
    /// Запрещённые теги разворачиваются (дети остаются),
    /// script/style и подобные удаляются вместе с содержимым
    std::string sanitize(const std::string& html) const;

    const std::set<std::string>& allowedTags() const { return m_allowedTags; }
    const std::set<std::string>& allowedAttributes() const { return m_allowedAttributes; }

    static const std::set<std::string>& defaultAllowedTags();
    static const std::set<std::string>& defaultAllowedAttributes();

private:
    std::set<std::string> m_allowedTags;
    std::set<std::string> m_allowedAttributes;
};

// ═══════════════════════════════════════════════════════════
// MarkdownConverter
// ═══════════════════════════════════════════════════════════

class TK_API MarkdownConverter {
public:
    /// HTML -> Markdown (html2md)
    static std::string toMarkdown(const std::string& html);
};

// ═══════════════════════════════════════════════════════════
// ArticleExtractor
// ═══════════════════════════════════════════════════════════

class TK_API ArticleExtractor {
public:
    explicit ArticleExtractor(ArticleConfig config = {});

    /// Построить каноническую запись из HTML
    /// @throws ValidationError originUrl не абсолютный http/https
    /// @throws ReadabilityError эвристика вернула null или упала
    ExtractedArticle extractArticle(const std::string& html, const std::string& originUrl) const;

    const ArticleConfig& config() const { return m_config; }

private:
    ArticleConfig m_config;
    Readability m_readability;
    HtmlSanitizer m_sanitizer;
};

} // namespace Thinkara
