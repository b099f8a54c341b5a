#include "thinkara/EpubExtractor.h"
#include "thinkara/Errors.h"
#include "thinkara/TextUtils.h"
#include "EpubXml.h"
#include "../Article/HtmlDom.h"

#include <spdlog/spdlog.h>

#include <pugixml.hpp>

#include <algorithm>
#include <cmath>

namespace Thinkara {

namespace {

constexpr const char* EPUB_MIMETYPE = "application/epub+zip";
constexpr const char* CONTAINER_PATH = "META-INF/container.xml";

/// destroy() ридера при любом выходе из области
struct ReaderGuard {
    IEpubPackageReader* reader;
    ~ReaderGuard() {
        if (!reader) return;
        try {
            reader->destroy();
        } catch (const std::exception& e) {
            spdlog::warn("EpubExtractor: reader teardown failed: {}", e.what());
        }
    }
};

/// Без media-type считаем обложку JPEG
std::string coverDataUrl(const std::string& mediaType, const std::string& data) {
    return TextUtils::toDataUrl(mediaType.empty() ? "image/jpeg" : mediaType, data);
}

std::string valueOrDefault(const std::optional<std::string>& value, const char* fallback) {
    if (value && !TextUtils::trim(*value).empty()) {
        return *value;
    }
    return fallback;
}

} // namespace

EpubExtractor::EpubExtractor(EpubConfig config, ReaderFactory factory)
    : m_config(std::move(config))
    , m_factory(std::move(factory))
{
    if (!m_factory) {
        m_factory = [](const ByteBuffer& bytes) -> std::unique_ptr<IEpubPackageReader> {
            return std::make_unique<EpubPackageReader>(bytes);
        };
    }
}

// ═══════════════════════════════════════════════════════════
// Проверка структуры
// ═══════════════════════════════════════════════════════════

bool EpubExtractor::validateEpubStructure(const ByteBuffer& epubBytes) {
    try {
        EpubArchive archive(epubBytes);

        auto mimetype = archive.readEntry("mimetype");
        if (!mimetype || *mimetype != EPUB_MIMETYPE) {
            spdlog::debug("EpubExtractor: mimetype entry missing or wrong");
            return false;
        }
        if (!archive.hasEntry(CONTAINER_PATH)) {
            spdlog::debug("EpubExtractor: {} missing", CONTAINER_PATH);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("EpubExtractor: structure check failed: {}", e.what());
        return false;
    }
}

// ═══════════════════════════════════════════════════════════
// Метаданные
// ═══════════════════════════════════════════════════════════

std::unique_ptr<IEpubPackageReader> EpubExtractor::openReader(const ByteBuffer& epubBytes) const {
    std::unique_ptr<IEpubPackageReader> reader;
    try {
        reader = m_factory(epubBytes);
    } catch (const std::exception& e) {
        spdlog::error("EpubExtractor: cannot open package: {}", e.what());
        throw EpubExtractionError(std::string("EPUB Parsing Failed: ") + e.what());
    }
    if (!reader) {
        throw EpubExtractionError("EPUB Parsing Failed: no package reader");
    }
    return reader;
}

EpubMetadata EpubExtractor::extractEpubMetadata(const ByteBuffer& epubBytes) const {
    std::unique_ptr<IEpubPackageReader> reader = openReader(epubBytes);
    ReaderGuard guard{reader.get()};

    EpubMetadata result;
    try {
        EpubPackageInfo info = reader->metadata();
        result.title = valueOrDefault(info.title, "Unknown Title");
        result.author = valueOrDefault(info.creator, "Unknown Author");
        result.publisher = info.publisher;
        result.description = info.description;
        result.language = info.language;
        result.publishedDate = info.publishedDate ? info.publishedDate : info.modifiedDate;
    } catch (const std::exception& e) {
        spdlog::error("EpubExtractor: metadata unavailable: {}", e.what());
        throw EpubExtractionError(std::string("EPUB Parsing Failed: ") + e.what());
    }

    // Обложка: пакет -> ручной разбор -> отсутствует
    try {
        if (auto resource = reader->coverResource(); resource && !resource->data.empty()) {
            result.cover = coverDataUrl(resource->mediaType, resource->data);
            result.coverSource = CoverSource::Primary;
        }
    } catch (const std::exception& e) {
        spdlog::debug("EpubExtractor: primary cover lookup failed: {}", e.what());
    }

    if (!result.cover) {
        try {
            EpubArchive archive(epubBytes);
            result.cover = locateCoverManually(archive);
            if (result.cover) {
                result.coverSource = CoverSource::Fallback;
            }
        } catch (const std::exception& e) {
            spdlog::debug("EpubExtractor: fallback cover lookup failed: {}", e.what());
        }
    }

    spdlog::debug("EpubExtractor: '{}' cover {}", result.title, coverSourceToString(result.coverSource));
    return result;
}

std::optional<std::string> EpubExtractor::locateCoverManually(const EpubArchive& archive) {
    auto container = archive.readEntry(CONTAINER_PATH);
    if (!container) {
        return std::nullopt;
    }
    auto packagePath = EpubXml::packagePath(*container);
    if (!packagePath) {
        return std::nullopt;
    }
    auto opf = archive.readEntry(*packagePath);
    if (!opf) {
        return std::nullopt;
    }

    pugi::xml_document doc;
    if (!doc.load_buffer(opf->data(), opf->size())) {
        return std::nullopt;
    }
    pugi::xml_node package = EpubXml::descendant(doc, "package");
    pugi::xml_node metadata = EpubXml::child(package, "metadata");
    pugi::xml_node manifest = EpubXml::child(package, "manifest");

    // <meta name="cover" content="<id>">
    std::string coverId;
    EpubXml::forEachChild(metadata, "meta", [&](const pugi::xml_node& node) {
        if (coverId.empty() && std::string(node.attribute("name").as_string()) == "cover") {
            coverId = TextUtils::trim(node.attribute("content").as_string());
        }
    });
    if (coverId.empty()) {
        return std::nullopt;
    }

    std::string href;
    std::string mediaType;
    EpubXml::forEachChild(manifest, "item", [&](const pugi::xml_node& node) {
        if (href.empty() && coverId == node.attribute("id").as_string()) {
            href = node.attribute("href").as_string();
            mediaType = node.attribute("media-type").as_string();
        }
    });
    if (href.empty()) {
        return std::nullopt;
    }

    std::string path = EpubArchive::resolvePath(*packagePath, href);
    auto data = archive.readEntry(path);
    if (!data || data->empty()) {
        return std::nullopt;
    }
    return coverDataUrl(mediaType, *data);
}

// ═══════════════════════════════════════════════════════════
// Текст книги
// ═══════════════════════════════════════════════════════════

std::string EpubExtractor::extractText(const ByteBuffer& epubBytes) const {
    std::unique_ptr<IEpubPackageReader> reader = openReader(epubBytes);
    ReaderGuard guard{reader.get()};

    std::string text;
    size_t documents = 0;
    for (const auto& path : reader->spineDocuments()) {
        auto xhtml = reader->readEntry(path);
        if (!xhtml) {
            spdlog::warn("EpubExtractor: spine document '{}' missing", path);
            continue;
        }
        try {
            Html::Document doc(*xhtml);
            std::string chapter = Html::textContent(doc.body());
            if (chapter.empty()) {
                continue;
            }
            if (!text.empty()) {
                text += "\n\n";
            }
            text += chapter;
            ++documents;
        } catch (const std::exception& e) {
            spdlog::warn("EpubExtractor: cannot parse '{}': {}", path, e.what());
        }
    }

    spdlog::debug("EpubExtractor: text from {} spine document(s)", documents);
    return text;
}

int EpubExtractor::estimateReadTimeFromSize(size_t fileSize) const {
    // ~2000 символов на КБ архива, 5 символов на слово
    double characters = (static_cast<double>(fileSize) / 1024.0) * 2000.0;
    double words = characters / 5.0;
    int wpm = m_config.wordsPerMinute > 0 ? m_config.wordsPerMinute : 250;
    int minutes = static_cast<int>(std::lround(words / wpm));
    return std::max(1, minutes);
}

} // namespace Thinkara
