#pragma once

#include <cstdint>
#include <string>

namespace Thinkara {

// ═══════════════════════════════════════════════════════════
// Тип источника контента
// ═══════════════════════════════════════════════════════════

enum class SourceType : int32_t {
    Web = 0,
    Pdf = 1,
    Epub = 2
};

const char* sourceTypeToString(SourceType type);

// ═══════════════════════════════════════════════════════════
// Формат хранения тела web-статьи
// ═══════════════════════════════════════════════════════════

enum class ContentFormat : int32_t {
    Html = 0,       // Санитизированный HTML
    Markdown = 1    // Markdown из санитизированного HTML
};

const char* contentFormatToString(ContentFormat format);
ContentFormat contentFormatFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Причина неудачи загрузки HTML
// ═══════════════════════════════════════════════════════════

enum class FetchFailure : int32_t {
    AllAttemptsFailed = 0,  // Прямой запрос и все прокси вернули ошибку
    TimedOut = 1,           // Последняя попытка упала по таймауту
    Cancelled = 2           // Отменено вызывающей стороной
};

const char* fetchFailureToString(FetchFailure failure);

// ═══════════════════════════════════════════════════════════
// Способ получения текста страницы PDF
// ═══════════════════════════════════════════════════════════

enum class PageTextMethod : int32_t {
    TextLayer = 0,  // Встроенный текстовый слой
    Ocr = 1,        // Распознавание растра
    Failed = 2      // Ошибка, страница пустая
};

const char* pageTextMethodToString(PageTextMethod method);

// ═══════════════════════════════════════════════════════════
// Откуда взята обложка EPUB
// ═══════════════════════════════════════════════════════════

enum class CoverSource : int32_t {
    Primary = 0,    // Через пакетный ридер
    Fallback = 1,   // Ручной разбор container.xml / OPF
    Absent = 2      // Обложка не найдена
};

const char* coverSourceToString(CoverSource source);

} // namespace Thinkara
