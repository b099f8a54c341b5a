#pragma once

#include "Types.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Thinkara {

using ByteBuffer = std::vector<uint8_t>;

// ═══════════════════════════════════════════════════════════
// Запрос на извлечение
// ═══════════════════════════════════════════════════════════

/// Вход конвейера. URL для web, байты для pdf/epub
/// @note Неизменяем после создания
struct SourceRequest {
    SourceType sourceType = SourceType::Web;
    std::variant<std::string, ByteBuffer> origin;
    std::optional<std::string> originalUrl;   // Откуда получен файл / HTML
    std::optional<std::string> fileName;      // Подсказка для заголовка pdf/epub

    static SourceRequest fromUrl(std::string url) {
        SourceRequest r;
        r.sourceType = SourceType::Web;
        r.origin = std::move(url);
        return r;
    }

    static SourceRequest fromBytes(SourceType type, ByteBuffer bytes,
                                   std::optional<std::string> fileName = std::nullopt) {
        SourceRequest r;
        r.sourceType = type;
        r.origin = std::move(bytes);
        r.fileName = std::move(fileName);
        return r;
    }

    bool hasUrl() const { return std::holds_alternative<std::string>(origin); }
    const std::string& url() const { return std::get<std::string>(origin); }
    const ByteBuffer& bytes() const { return std::get<ByteBuffer>(origin); }
};

// ═══════════════════════════════════════════════════════════
// Каноническая запись статьи
// ═══════════════════════════════════════════════════════════

struct ExtractedArticle {
    std::string title;
    std::string content;        // HTML (web) или plain text (pdf/epub)
    std::string excerpt;
    std::optional<std::string> author;
    std::optional<std::string> siteName;
    std::optional<std::string> language;
    std::optional<std::string> publishedDate;
    int estimatedReadTime = 1;  // Минуты, всегда >= 1
    std::optional<int> pageCount;       // Только pdf
    std::optional<std::string> cover;   // Только epub, data URL
    std::optional<std::string> url;     // Нормализованный URL источника
    SourceType sourceType = SourceType::Web;
};

// ═══════════════════════════════════════════════════════════
// Попытка загрузки HTML
// ═══════════════════════════════════════════════════════════

struct AttemptSuccess {
    std::string html;
    long statusCode = 200;
};

struct AttemptFailure {
    std::string cause;
    long statusCode = 0;        // 0 если ответа не было
    bool timedOut = false;
    bool cancelled = false;
};

using AttemptOutcome = std::variant<AttemptSuccess, AttemptFailure>;

struct FetchAttempt {
    std::string strategyLabel;
    std::chrono::system_clock::time_point startedAt;
    int64_t timedOutAfterMs = 0;
    AttemptOutcome outcome;

    bool succeeded() const { return std::holds_alternative<AttemptSuccess>(outcome); }
};

/// Результат загрузки вместе с историей попыток
struct FetchReport {
    std::string html;
    std::vector<FetchAttempt> attempts;

    /// Метка стратегии, давшей успех
    std::string succeededWith() const {
        return attempts.empty() ? "" : attempts.back().strategyLabel;
    }
};

// ═══════════════════════════════════════════════════════════
// Отмена загрузки
// ═══════════════════════════════════════════════════════════

/// Флаг отмены, разделяемый между UI и сетевым слоем
class CancellationToken {
public:
    void cancel() noexcept { m_cancelled.store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_cancelled{false};
};

// ═══════════════════════════════════════════════════════════
// PDF
// ═══════════════════════════════════════════════════════════

struct PageResult {
    int pageNumber = 0;     // С единицы
    PageTextMethod method = PageTextMethod::TextLayer;
    std::string text;
};

struct PdfDocumentText {
    std::string text;       // Страницы через '\n', trimmed
    int pageCount = 0;
    std::optional<std::string> title;
    std::optional<std::string> author;
    std::vector<PageResult> pages;
};

// ═══════════════════════════════════════════════════════════
// EPUB
// ═══════════════════════════════════════════════════════════

struct EpubMetadata {
    std::string title = "Unknown Title";
    std::string author = "Unknown Author";
    std::optional<std::string> publisher;
    std::optional<std::string> description;
    std::optional<std::string> language;
    std::optional<std::string> publishedDate;
    std::optional<std::string> cover;   // data:<mime>;base64,...
    CoverSource coverSource = CoverSource::Absent;
};

} // namespace Thinkara
