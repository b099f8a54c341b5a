// Config.h — Настройки конвейера извлечения
// Загружаются из JSON, отсутствующие ключи получают значения по умолчанию

#pragma once

#include "export.h"
#include "Types.h"
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace Thinkara {

/// Шаблон прокси: итоговый URL = prefix + urlencode(target)
struct ProxyEndpoint {
    std::string label;
    std::string prefix;
};

struct FetchConfig {
    int64_t timeoutMs = 10000;
    std::string userAgent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/121.0.6167.160 Safari/537.36";
    std::string accept =
        "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8";
    std::vector<ProxyEndpoint> proxies = {
        {"corsproxy.io", "https://corsproxy.io/?"},
        {"codetabs", "https://api.codetabs.com/v1/proxy?quest="},
        {"allorigins", "https://api.allorigins.win/raw?url="},
    };
    bool followRedirects = true;
    size_t maxBodyBytes = 20 * 1024 * 1024;  // 20MB
};

struct ArticleConfig {
    int wordsPerMinute = 200;
    size_t excerptLength = 280;
    ContentFormat contentFormat = ContentFormat::Html;
    size_t minParagraphChars = 25;
};

struct PdfConfig {
    size_t minTextChars = 10;   // Меньше = страница считается сканом
    double ocrScale = 2.0;      // Масштаб растра для OCR
    std::string ocrLanguage = "eng";
    std::string tessdataPath;   // Пусто = путь tesseract по умолчанию
    int maxPages = 0;           // 0 = без ограничения
};

struct EpubConfig {
    int wordsPerMinute = 250;   // Для оценки по размеру архива
};

struct TK_API PipelineConfig {
    FetchConfig fetch;
    ArticleConfig article;
    PdfConfig pdf;
    EpubConfig epub;

    /// Разобрать JSON-объект, неизвестные ключи игнорируются
    /// @throws ValidationError при неверном типе значения
    static PipelineConfig fromJson(const nlohmann::json& j);

    /// Разобрать JSON-строку
    static PipelineConfig fromJsonString(const std::string& text);

    /// Загрузить из файла
    /// @throws ValidationError если файл не читается или не JSON
    static PipelineConfig loadFromFile(const std::string& path);

    nlohmann::json toJson() const;
};

} // namespace Thinkara
