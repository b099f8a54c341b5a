// Errors.h — Типизированные ошибки конвейера извлечения

#pragma once

#include "export.h"
#include "Models.h"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Thinkara {

/// Категория ошибки (для C API и UI)
enum class ErrorKind : int32_t {
    Validation = 0,
    Fetch = 1,
    Readability = 2,
    PdfParse = 3,
    EpubStructure = 4,
    EpubExtraction = 5,
    Ocr = 6
};

const char* errorKindToString(ErrorKind kind);

/// Базовое исключение конвейера
class TK_API PipelineException : public std::runtime_error {
public:
    PipelineException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

/// Некорректный ввод (URL, схема, конфиг), обнаружен до любого I/O
class TK_API ValidationError : public PipelineException {
public:
    explicit ValidationError(const std::string& message)
        : PipelineException(ErrorKind::Validation, message) {}
};

/// Все попытки загрузки исчерпаны, таймаут или отмена
class TK_API FetchError : public PipelineException {
public:
    FetchError(FetchFailure failure, const std::string& message,
               std::vector<FetchAttempt> attempts = {})
        : PipelineException(ErrorKind::Fetch, message)
        , m_failure(failure)
        , m_attempts(std::move(attempts)) {}

    FetchFailure failure() const noexcept { return m_failure; }

    /// Попытки в порядке выполнения
    const std::vector<FetchAttempt>& attempts() const noexcept { return m_attempts; }

private:
    FetchFailure m_failure;
    std::vector<FetchAttempt> m_attempts;
};

/// Эвристика не нашла статью или упала внутри
class TK_API ReadabilityError : public PipelineException {
public:
    explicit ReadabilityError(const std::string& message)
        : PipelineException(ErrorKind::Readability, "Readability " + message) {}
};

/// PDF-контейнер не открывается
class TK_API PdfParseError : public PipelineException {
public:
    explicit PdfParseError(const std::string& message)
        : PipelineException(ErrorKind::PdfParse, message) {}
};

/// В EPUB нет обязательных записей
class TK_API EpubStructuralError : public PipelineException {
public:
    explicit EpubStructuralError(const std::string& message)
        : PipelineException(ErrorKind::EpubStructure, message) {}
};

/// Метаданные EPUB получить невозможно
class TK_API EpubExtractionError : public PipelineException {
public:
    explicit EpubExtractionError(const std::string& message)
        : PipelineException(ErrorKind::EpubExtraction, message) {}
};

/// Сбой OCR на одной странице
/// @note Не выходит за границу обработки страницы PDF
class TK_API OcrError : public PipelineException {
public:
    explicit OcrError(const std::string& message)
        : PipelineException(ErrorKind::Ocr, message) {}
};

} // namespace Thinkara
