#include "thinkara/TextUtils.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Thinkara {
namespace TextUtils {

namespace {

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Байт продолжения UTF-8 (10xxxxxx)
inline bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    if (first == text.end()) {
        return "";
    }
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return std::string(first, last);
}

std::string collapseWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    bool lastWasSpace = true; // Начинаем с true чтобы убрать ведущие пробелы
    for (char c : text) {
        if (isSpace(c)) {
            if (!lastWasSpace) {
                result += ' ';
                lastWasSpace = true;
            }
        } else {
            result += c;
            lastWasSpace = false;
        }
    }

    if (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

size_t nonWhitespaceLength(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(),
                                             [](char c) { return !isSpace(c); }));
}

size_t countWords(const std::string& text) {
    size_t words = 0;
    bool inWord = false;
    for (char c : text) {
        if (isSpace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

int estimateReadTime(size_t wordCount, int wordsPerMinute) {
    if (wordsPerMinute <= 0) {
        wordsPerMinute = 200;
    }
    auto minutes = static_cast<int>(
        std::ceil(static_cast<double>(wordCount) / static_cast<double>(wordsPerMinute)));
    return std::max(1, minutes);
}

std::string makeExcerpt(const std::string& text, size_t maxLength) {
    std::string clean = collapseWhitespace(text);
    if (clean.empty()) {
        return "";
    }

    // Находим байтовую позицию maxLength-го символа
    size_t chars = 0;
    size_t cut = clean.size();
    for (size_t i = 0; i < clean.size(); ++i) {
        if (isContinuationByte(clean[i])) {
            continue;
        }
        if (chars == maxLength) {
            cut = i;
            break;
        }
        ++chars;
    }

    std::string head = clean.substr(0, cut);
    if (cut < clean.size() && clean[cut] != ' ') {
        // Обрезаем по последней границе слова, если она есть
        auto space = head.rfind(' ');
        if (space != std::string::npos && space > 0) {
            head.resize(space);
        }
    }

    return trim(head) + "...";
}

std::string base64Encode(const uint8_t* data, size_t size) {
    if (size == 0) {
        return "";
    }

    std::string encoded;
    encoded.resize(4 * ((size + 2) / 3) + 1);

    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                  data, static_cast<int>(size));
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

std::string toDataUrl(const std::string& mimeType, const std::string& data) {
    return "data:" + mimeType + ";base64," +
           base64Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace TextUtils
} // namespace Thinkara
