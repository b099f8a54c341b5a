// TextUtils.h — Общие текстовые операции конвейера

#pragma once

#include "export.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Thinkara {
namespace TextUtils {

/// Убрать пробельные символы по краям
TK_API std::string trim(const std::string& text);

/// Схлопнуть любые последовательности пробелов/переносов в один пробел, trim
TK_API std::string collapseWhitespace(const std::string& text);

/// Длина текста без пробельных символов (в байтах UTF-8)
TK_API size_t nonWhitespaceLength(const std::string& text);

/// Количество слов (токенов между пробелами)
TK_API size_t countWords(const std::string& text);

/// Время чтения в минутах: ceil(words / wpm), минимум 1
TK_API int estimateReadTime(size_t wordCount, int wordsPerMinute);

/// Отрывок: первые maxLength символов (UTF-8) по границе слова + "..."
/// @note Пустой текст даёт пустой отрывок
TK_API std::string makeExcerpt(const std::string& text, size_t maxLength);

/// Base64 (через OpenSSL EVP)
TK_API std::string base64Encode(const uint8_t* data, size_t size);

/// data:<mime>;base64,<payload>
TK_API std::string toDataUrl(const std::string& mimeType, const std::string& data);

/// Нижний регистр ASCII
TK_API std::string toLower(std::string text);

} // namespace TextUtils
} // namespace Thinkara
