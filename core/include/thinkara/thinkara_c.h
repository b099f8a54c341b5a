// thinkara_c.h — C API для FFI
// Результаты возвращаются JSON-строками, освобождать через tk_free_string

#ifndef THINKARA_C_H
#define THINKARA_C_H

#include "export.h"
#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct TKPipeline_* TKPipeline;

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

typedef enum {
    TK_OK = 0,
    TK_ERROR_INVALID_ARGUMENT = 1,      // Неверный URL, схема, конфиг, пустой буфер
    TK_ERROR_FETCH = 2,                 // Все попытки загрузки неудачны или таймаут
    TK_ERROR_READABILITY = 3,           // Статья не найдена в HTML
    TK_ERROR_PDF_PARSE = 4,             // PDF не открывается
    TK_ERROR_EPUB_STRUCTURE = 5,        // Нет mimetype или container.xml
    TK_ERROR_EPUB_EXTRACTION = 6,       // Метаданные EPUB недоступны
    TK_ERROR_OCR = 7,
    TK_ERROR_INTERNAL = 99
} TKError;

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

/// Возвращает версию библиотеки
TK_API const char* tk_version(void);

/// Возвращает текстовое описание ошибки
TK_API const char* tk_error_message(TKError error);

/// Получить последнюю ошибку (thread-local)
TK_API TKError tk_last_error(void);

/// Получить сообщение последней ошибки (thread-local)
TK_API const char* tk_last_error_message(void);

/// Очистить состояние ошибки
TK_API void tk_clear_error(void);

/// Освобождает строку, выделенную библиотекой
TK_API void tk_free_string(char* str);

// ═══════════════════════════════════════════════════════════
// Pipeline
// ═══════════════════════════════════════════════════════════

/// Создать конвейер
/// @param config_json JSON настроек или NULL для значений по умолчанию
TK_API TKPipeline tk_pipeline_create(const char* config_json, TKError* out_error);

TK_API void tk_pipeline_destroy(TKPipeline pipeline);

/// Загрузить страницу и извлечь статью
/// @return JSON записи статьи или NULL (см. tk_last_error)
TK_API char* tk_process_url(TKPipeline pipeline, const char* url);

/// Извлечь текст PDF
/// @param file_name Подсказка для заголовка, может быть NULL
TK_API char* tk_process_pdf(TKPipeline pipeline, const uint8_t* data, size_t size,
                            const char* file_name);

/// Извлечь метаданные и текст EPUB
TK_API char* tk_process_epub(TKPipeline pipeline, const uint8_t* data, size_t size,
                             const char* file_name);

/// Только метаданные EPUB (с обложкой)
TK_API char* tk_epub_metadata(const uint8_t* data, size_t size);

/// Проверка структуры EPUB, ошибку не устанавливает
TK_API bool tk_validate_epub(const uint8_t* data, size_t size);

#ifdef __cplusplus
}
#endif

#endif // THINKARA_C_H
