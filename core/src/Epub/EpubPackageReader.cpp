#include "thinkara/EpubExtractor.h"
#include "thinkara/Errors.h"
#include "thinkara/TextUtils.h"
#include "EpubXml.h"

#include <spdlog/spdlog.h>

#include <pugixml.hpp>

#include <algorithm>
#include <sstream>

namespace Thinkara {

namespace {

bool hasProperty(const std::string& properties, const std::string& value) {
    std::istringstream stream(properties);
    std::string token;
    while (stream >> token) {
        if (token == value) {
            return true;
        }
    }
    return false;
}

bool isImageType(const std::string& mediaType) {
    return mediaType.rfind("image/", 0) == 0;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// EpubPackageReader
// ═══════════════════════════════════════════════════════════

EpubPackageReader::EpubPackageReader(const ByteBuffer& bytes)
    : m_archive(std::make_unique<EpubArchive>(bytes))
{
    load();
}

EpubPackageReader::~EpubPackageReader() = default;

EpubArchive& EpubPackageReader::archive() {
    if (!m_archive) {
        throw EpubExtractionError("EPUB reader already destroyed");
    }
    return *m_archive;
}

void EpubPackageReader::load() {
    auto container = archive().readEntry("META-INF/container.xml");
    if (!container) {
        throw EpubExtractionError("Missing META-INF/container.xml");
    }

    auto packagePath = EpubXml::packagePath(*container);
    if (!packagePath) {
        throw EpubExtractionError("No rootfile in container.xml");
    }
    m_packagePath = *packagePath;

    auto opf = archive().readEntry(m_packagePath);
    if (!opf) {
        throw EpubExtractionError("Package document not found: " + m_packagePath);
    }

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(opf->data(), opf->size());
    if (!result) {
        throw EpubExtractionError(std::string("Invalid package document: ") + result.description());
    }

    pugi::xml_node package = EpubXml::descendant(doc, "package");
    if (!package) {
        throw EpubExtractionError("Package document has no <package> element");
    }

    // ─── metadata ───
    pugi::xml_node metadata = EpubXml::child(package, "metadata");
    auto firstText = [&](const char* name) -> std::optional<std::string> {
        std::optional<std::string> value;
        EpubXml::forEachChild(metadata, name, [&](const pugi::xml_node& node) {
            if (!value) value = EpubXml::text(node);
        });
        return value;
    };

    m_info.title = firstText("title");
    m_info.creator = firstText("creator");
    m_info.publisher = firstText("publisher");
    m_info.description = firstText("description");
    m_info.language = firstText("language");

    // dc:date: в EPUB2 событие в opf:event, в EPUB3 дата публикации без атрибутов
    EpubXml::forEachChild(metadata, "date", [&](const pugi::xml_node& node) {
        auto value = EpubXml::text(node);
        if (!value) return;
        std::string event = TextUtils::toLower(node.attribute("opf:event").as_string());
        if (event == "modification") {
            if (!m_info.modifiedDate) m_info.modifiedDate = value;
        } else if (!m_info.publishedDate) {
            m_info.publishedDate = value;
        }
    });
    EpubXml::forEachChild(metadata, "meta", [&](const pugi::xml_node& node) {
        if (std::string(node.attribute("property").as_string()) == "dcterms:modified" &&
            !m_info.modifiedDate) {
            m_info.modifiedDate = EpubXml::text(node);
        }
        if (!m_metaCoverId && TextUtils::toLower(node.attribute("name").as_string()) == "cover") {
            std::string id = node.attribute("content").as_string();
            if (!id.empty()) {
                m_metaCoverId = id;
            }
        }
    });

    // ─── manifest ───
    pugi::xml_node manifest = EpubXml::child(package, "manifest");
    EpubXml::forEachChild(manifest, "item", [&](const pugi::xml_node& node) {
        ManifestItem item;
        item.id = node.attribute("id").as_string();
        item.href = EpubArchive::resolvePath(m_packagePath, node.attribute("href").as_string());
        item.mediaType = node.attribute("media-type").as_string();
        item.properties = node.attribute("properties").as_string();
        if (!item.id.empty() && !item.href.empty()) {
            m_manifest.push_back(std::move(item));
        }
    });

    // ─── spine ───
    pugi::xml_node spine = EpubXml::child(package, "spine");
    EpubXml::forEachChild(spine, "itemref", [&](const pugi::xml_node& node) {
        std::string idref = node.attribute("idref").as_string();
        auto it = std::find_if(m_manifest.begin(), m_manifest.end(),
                               [&](const ManifestItem& m) { return m.id == idref; });
        if (it != m_manifest.end()) {
            m_spine.push_back(it->href);
        }
    });

    // ─── guide (EPUB2) ───
    pugi::xml_node guide = EpubXml::child(package, "guide");
    EpubXml::forEachChild(guide, "reference", [&](const pugi::xml_node& node) {
        std::string type = TextUtils::toLower(node.attribute("type").as_string());
        if (!m_guideCoverHref && type == "cover") {
            std::string href = node.attribute("href").as_string();
            if (!href.empty()) {
                m_guideCoverHref = EpubArchive::resolvePath(m_packagePath, href);
            }
        }
    });

    spdlog::debug("EpubPackageReader: '{}' with {} manifest items, {} spine documents",
                  m_packagePath, m_manifest.size(), m_spine.size());
}

EpubPackageInfo EpubPackageReader::metadata() {
    archive();
    return m_info;
}

std::optional<EpubResource> EpubPackageReader::coverResource() {
    EpubArchive& zip = archive();

    const ManifestItem* cover = nullptr;

    // EPUB3: properties="cover-image"
    for (const auto& item : m_manifest) {
        if (hasProperty(item.properties, "cover-image")) {
            cover = &item;
            break;
        }
    }

    // EPUB2: <meta name="cover" content="<id>">
    if (!cover && m_metaCoverId) {
        for (const auto& item : m_manifest) {
            if (item.id == *m_metaCoverId) {
                cover = &item;
                break;
            }
        }
    }

    // EPUB2: guide type="cover", если ссылка ведёт прямо на изображение
    if (!cover && m_guideCoverHref) {
        for (const auto& item : m_manifest) {
            if (item.href == *m_guideCoverHref && isImageType(item.mediaType)) {
                cover = &item;
                break;
            }
        }
    }

    if (!cover) {
        return std::nullopt;
    }

    auto data = zip.readEntry(cover->href);
    if (!data) {
        throw EpubExtractionError("Cover resource declared but missing: " + cover->href);
    }
    return EpubResource{cover->href, cover->mediaType, std::move(*data)};
}

std::vector<std::string> EpubPackageReader::spineDocuments() {
    archive();
    return m_spine;
}

std::optional<std::string> EpubPackageReader::readEntry(const std::string& path) {
    return archive().readEntry(path);
}

void EpubPackageReader::destroy() {
    m_archive.reset();
}

} // namespace Thinkara
