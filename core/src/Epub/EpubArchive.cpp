#include "thinkara/EpubExtractor.h"
#include "thinkara/Errors.h"

#include <spdlog/spdlog.h>

#include <zip.h>

#include <sstream>

namespace Thinkara {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// href в OPF является URL, пробелы и не-ASCII могут быть закодированы
std::string percentDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += value[i];
    }
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// EpubArchive
// ═══════════════════════════════════════════════════════════

EpubArchive::EpubArchive(const ByteBuffer& bytes)
    : m_data(bytes)
{
    if (m_data.empty()) {
        throw EpubExtractionError("Empty archive");
    }

    zip_error_t error;
    zip_error_init(&error);

    zip_source_t* source = zip_source_buffer_create(m_data.data(), m_data.size(), 0, &error);
    if (!source) {
        std::string message = zip_error_strerror(&error);
        zip_error_fini(&error);
        throw EpubExtractionError("Cannot create archive source: " + message);
    }

    m_archive = zip_open_from_source(source, ZIP_RDONLY, &error);
    if (!m_archive) {
        // При неудаче источник остаётся за нами
        zip_source_free(source);
        std::string message = zip_error_strerror(&error);
        zip_error_fini(&error);
        throw EpubExtractionError("Not a ZIP archive: " + message);
    }

    zip_error_fini(&error);
}

EpubArchive::~EpubArchive() {
    if (m_archive) {
        zip_discard(m_archive);
    }
}

bool EpubArchive::hasEntry(const std::string& name) const {
    return zip_name_locate(m_archive, name.c_str(), 0) >= 0;
}

std::optional<std::string> EpubArchive::readEntry(const std::string& name) const {
    // Находим файл в архиве
    zip_int64_t index = zip_name_locate(m_archive, name.c_str(), 0);
    if (index < 0) {
        return std::nullopt;
    }

    zip_stat_t stat;
    zip_stat_init(&stat);
    if (zip_stat_index(m_archive, static_cast<zip_uint64_t>(index), 0, &stat) != 0) {
        spdlog::warn("EpubArchive: failed to stat '{}'", name);
        return std::nullopt;
    }

    zip_file_t* file = zip_fopen_index(m_archive, static_cast<zip_uint64_t>(index), 0);
    if (!file) {
        spdlog::warn("EpubArchive: failed to open '{}'", name);
        return std::nullopt;
    }

    // RAII для файла
    struct FileGuard {
        zip_file_t* file;
        ~FileGuard() { if (file) zip_fclose(file); }
    } fileGuard{file};

    std::string content;
    content.resize(stat.size);

    zip_int64_t bytesRead = zip_fread(file, content.data(), stat.size);
    if (bytesRead < 0 || static_cast<zip_uint64_t>(bytesRead) != stat.size) {
        spdlog::warn("EpubArchive: failed to read '{}'", name);
        return std::nullopt;
    }

    return content;
}

std::string EpubArchive::resolvePath(const std::string& baseFile, const std::string& href) {
    std::string ref = href;
    auto hash = ref.find('#');
    if (hash != std::string::npos) {
        ref.resize(hash);
    }
    ref = percentDecode(ref);

    std::string combined;
    if (!ref.empty() && ref[0] == '/') {
        combined = ref.substr(1);
    } else {
        auto slash = baseFile.rfind('/');
        combined = (slash == std::string::npos ? "" : baseFile.substr(0, slash + 1)) + ref;
    }

    // Схлопываем "." и ".."
    std::vector<std::string> segments;
    std::stringstream stream(combined);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string result;
    for (const auto& s : segments) {
        if (!result.empty()) {
            result += '/';
        }
        result += s;
    }
    return result;
}

} // namespace Thinkara
