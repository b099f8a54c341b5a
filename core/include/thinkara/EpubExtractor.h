// EpubExtractor.h — Метаданные, обложка и текст EPUB
// Первичный путь через пакетный ридер, запасной через ручной разбор container.xml / OPF

#pragma once

#include "export.h"
#include "Config.h"
#include "Models.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

typedef struct zip zip_t;

namespace Thinkara {

// ═══════════════════════════════════════════════════════════
// EpubArchive — ZIP в памяти (libzip)
// ═══════════════════════════════════════════════════════════

class TK_API EpubArchive {
public:
    /// Открыть архив из буфера (буфер копируется)
    /// @throws EpubExtractionError если это не ZIP
    explicit EpubArchive(const ByteBuffer& bytes);
    ~EpubArchive();

    EpubArchive(const EpubArchive&) = delete;
    EpubArchive& operator=(const EpubArchive&) = delete;

    bool hasEntry(const std::string& name) const;

    /// Содержимое записи, nullopt если записи нет или чтение не удалось
    std::optional<std::string> readEntry(const std::string& name) const;

    /// Разрешить href относительно файла baseFile внутри архива
    /// ("OEBPS/content.opf" + "../images/c.jpg" -> "images/c.jpg")
    static std::string resolvePath(const std::string& baseFile, const std::string& href);

private:
    ByteBuffer m_data;
    zip_t* m_archive = nullptr;
};

// ═══════════════════════════════════════════════════════════
// Пакетный ридер
// ═══════════════════════════════════════════════════════════

struct EpubResource {
    std::string path;       // Путь внутри архива
    std::string mediaType;
    std::string data;
};

/// Метаданные OPF как есть, без подстановки значений по умолчанию
struct EpubPackageInfo {
    std::optional<std::string> title;
    std::optional<std::string> creator;
    std::optional<std::string> publisher;
    std::optional<std::string> description;
    std::optional<std::string> language;
    std::optional<std::string> publishedDate;
    std::optional<std::string> modifiedDate;
};

class TK_API IEpubPackageReader {
public:
    virtual ~IEpubPackageReader() = default;

    /// @throws EpubExtractionError если пакет не разобран
    virtual EpubPackageInfo metadata() = 0;

    /// Обложка по данным пакета, nullopt если не объявлена
    virtual std::optional<EpubResource> coverResource() = 0;

    /// Пути XHTML-документов spine по порядку
    virtual std::vector<std::string> spineDocuments() = 0;

    virtual std::optional<std::string> readEntry(const std::string& path) = 0;

    /// Освободить архив. Повторный вызов безопасен
    virtual void destroy() = 0;
};

/// Ридер по container.xml -> OPF (manifest/spine/guide, properties="cover-image")
class TK_API EpubPackageReader : public IEpubPackageReader {
public:
    /// @throws EpubExtractionError архив не открывается или нет OPF
    explicit EpubPackageReader(const ByteBuffer& bytes);
    ~EpubPackageReader() override;

    EpubPackageInfo metadata() override;
    std::optional<EpubResource> coverResource() override;
    std::vector<std::string> spineDocuments() override;
    std::optional<std::string> readEntry(const std::string& path) override;
    void destroy() override;

    const std::string& packagePath() const { return m_packagePath; }

private:
    struct ManifestItem {
        std::string id;
        std::string href;       // Уже разрешён относительно OPF
        std::string mediaType;
        std::string properties;
    };

    void load();
    EpubArchive& archive();

    std::unique_ptr<EpubArchive> m_archive;
    std::string m_packagePath;
    EpubPackageInfo m_info;
    std::vector<ManifestItem> m_manifest;
    std::vector<std::string> m_spine;
    std::optional<std::string> m_metaCoverId;
    std::optional<std::string> m_guideCoverHref;
};

// ═══════════════════════════════════════════════════════════
// EpubExtractor
// ═══════════════════════════════════════════════════════════

class TK_API EpubExtractor {
public:
    using ReaderFactory = std::function<std::unique_ptr<IEpubPackageReader>(const ByteBuffer&)>;

    /// @param factory nullptr = EpubPackageReader
    explicit EpubExtractor(EpubConfig config = {}, ReaderFactory factory = nullptr);

    /// mimetype == "application/epub+zip" и есть META-INF/container.xml
    /// @note Никогда не бросает
    static bool validateEpubStructure(const ByteBuffer& epubBytes);

    /// Метаданные и обложка. Неудача обложки не фатальна
    /// @throws EpubExtractionError метаданные получить невозможно
    EpubMetadata extractEpubMetadata(const ByteBuffer& epubBytes) const;

    /// Текст документов spine
    /// @throws EpubExtractionError архив не открывается
    std::string extractText(const ByteBuffer& epubBytes) const;

    /// Запасной путь: container.xml -> OPF -> <meta name="cover"> -> manifest href
    /// @return data URL или nullopt
    static std::optional<std::string> locateCoverManually(const EpubArchive& archive);

    /// Оценка времени чтения по размеру архива
    int estimateReadTimeFromSize(size_t fileSize) const;

    const EpubConfig& config() const { return m_config; }

private:
    std::unique_ptr<IEpubPackageReader> openReader(const ByteBuffer& epubBytes) const;

    EpubConfig m_config;
    ReaderFactory m_factory;
};

} // namespace Thinkara
