// TestHelpers.h — Общие фикстуры тестов: PDF/EPUB в памяти, фейковые HTTP и OCR

#pragma once

#include "thinkara/EpubExtractor.h"
#include "thinkara/Errors.h"
#include "thinkara/HtmlFetcher.h"
#include "thinkara/PdfExtractor.h"

#include <unistd.h>
#include <zip.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Thinkara {
namespace TestHelpers {

namespace fs = std::filesystem;

/// Уникальный суффикс в пределах процесса и между процессами (ctest -j)
inline std::string uniqueSuffix() {
    static std::atomic<unsigned> counter{0};
    return std::to_string(::getpid()) + "_" + std::to_string(++counter) + "_" +
           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
}

// ═══════════════════════════════════════════════════════════
// Временная директория
// ═══════════════════════════════════════════════════════════

class TempDir {
public:
    TempDir() {
        m_path = fs::temp_directory_path() / ("thinkara_test_" + uniqueSuffix());
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    const fs::path& path() const { return m_path; }

    std::string file(const std::string& name) const { return (m_path / name).string(); }

private:
    fs::path m_path;
};

inline ByteBuffer readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return ByteBuffer(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline ByteBuffer toBytes(const std::string& text) {
    return ByteBuffer(text.begin(), text.end());
}

// ═══════════════════════════════════════════════════════════
// Минимальный PDF
// ═══════════════════════════════════════════════════════════

/// PDF со стандартным шрифтом Helvetica. Пустая строка = страница без текста
inline ByteBuffer buildPdf(const std::vector<std::string>& pageTexts,
                           const std::string& title = "") {
    std::vector<std::string> objects;
    const size_t pageCount = pageTexts.size();

    std::string kids;
    for (size_t i = 0; i < pageCount; ++i) {
        kids += std::to_string(4 + 2 * i) + " 0 R ";
    }

    objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
    objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " +
                      std::to_string(pageCount) + " >>");
    objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

    for (size_t i = 0; i < pageCount; ++i) {
        objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
                          "/Resources << /Font << /F1 3 0 R >> >> /Contents " +
                          std::to_string(5 + 2 * i) + " 0 R >>");

        std::string stream;
        if (!pageTexts[i].empty()) {
            stream = "BT /F1 12 Tf 72 720 Td (" + pageTexts[i] + ") Tj ET";
        }
        objects.push_back("<< /Length " + std::to_string(stream.size()) + " >>\nstream\n" +
                          stream + "\nendstream");
    }

    size_t infoId = 0;
    if (!title.empty()) {
        objects.push_back("<< /Title (" + title + ") /Author (Test Author) >>");
        infoId = objects.size();
    }

    std::string pdf = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (size_t i = 0; i < objects.size(); ++i) {
        offsets.push_back(pdf.size());
        pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
    }

    size_t xrefOffset = pdf.size();
    pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
    pdf += "0000000000 65535 f \n";
    for (size_t offset : offsets) {
        char line[32];
        std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offset);
        pdf += line;
    }

    pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R";
    if (infoId > 0) {
        pdf += " /Info " + std::to_string(infoId) + " 0 R";
    }
    pdf += " >>\nstartxref\n" + std::to_string(xrefOffset) + "\n%%EOF\n";

    return toBytes(pdf);
}

// ═══════════════════════════════════════════════════════════
// EPUB (ZIP через libzip)
// ═══════════════════════════════════════════════════════════

struct ZipEntry {
    std::string name;
    std::string data;
    bool stored = false;    // Без сжатия (для mimetype)
};

/// Записать ZIP во временный файл и вернуть его байты
inline ByteBuffer buildZip(const TempDir& dir, const std::vector<ZipEntry>& entries) {
    std::string path = dir.file("archive_" + uniqueSuffix() + ".zip");

    int err = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!archive) {
        throw std::runtime_error("zip_open failed: " + std::to_string(err));
    }

    // Данные должны жить до zip_close
    for (const auto& entry : entries) {
        zip_source_t* source = zip_source_buffer(archive, entry.data.data(), entry.data.size(), 0);
        if (!source) {
            zip_discard(archive);
            throw std::runtime_error("zip_source_buffer failed");
        }
        zip_int64_t index = zip_file_add(archive, entry.name.c_str(), source, ZIP_FL_OVERWRITE);
        if (index < 0) {
            zip_source_free(source);
            zip_discard(archive);
            throw std::runtime_error("zip_file_add failed for " + entry.name);
        }
        if (entry.stored) {
            zip_set_file_compression(archive, static_cast<zip_uint64_t>(index), ZIP_CM_STORE, 0);
        }
    }

    if (zip_close(archive) != 0) {
        zip_discard(archive);
        throw std::runtime_error("zip_close failed");
    }
    return readFile(path);
}

inline const char* containerXml() {
    return R"(<?xml version="1.0"?>
<container version="1.0" xmlns="urn:oasis:names:tc:opendocument:xmlns:container">
  <rootfiles>
    <rootfile full-path="OEBPS/content.opf" media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>)";
}

/// Варианты объявления обложки в OPF
enum class CoverDeclaration {
    None,
    ManifestProperty,   // EPUB3 properties="cover-image"
    MetaName            // EPUB2 <meta name="cover">
};

struct EpubFixture {
    std::string title = "The Test Book";
    std::string creator = "Jane Writer";
    std::string language = "en";
    std::string date = "2021-05-01";
    std::string chapterText = "It was a bright cold day in April.";
    CoverDeclaration cover = CoverDeclaration::ManifestProperty;
    std::string coverBytes = "\xFF\xD8\xFF\xE0 fake jpeg";
    bool includeMimetype = true;
    std::string mimetype = "application/epub+zip";
    bool includeContainer = true;
};

inline std::string buildOpf(const EpubFixture& f) {
    std::string metadata;
    if (!f.title.empty()) metadata += "    <dc:title>" + f.title + "</dc:title>\n";
    if (!f.creator.empty()) metadata += "    <dc:creator>" + f.creator + "</dc:creator>\n";
    if (!f.language.empty()) metadata += "    <dc:language>" + f.language + "</dc:language>\n";
    if (!f.date.empty()) metadata += "    <dc:date>" + f.date + "</dc:date>\n";
    if (f.cover == CoverDeclaration::MetaName) {
        metadata += "    <meta name=\"cover\" content=\"cover-img\"/>\n";
    }

    std::string coverItem;
    if (f.cover == CoverDeclaration::ManifestProperty) {
        coverItem = "    <item id=\"cover-img\" href=\"images/cover.jpg\" media-type=\"image/jpeg\" "
                    "properties=\"cover-image\"/>\n";
    } else if (f.cover == CoverDeclaration::MetaName) {
        coverItem = "    <item id=\"cover-img\" href=\"images/cover.jpg\" media-type=\"image/jpeg\"/>\n";
    }

    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\" unique-identifier=\"id\">\n"
           "  <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">\n" + metadata +
           "  </metadata>\n"
           "  <manifest>\n"
           "    <item id=\"ch1\" href=\"text/chapter1.xhtml\" media-type=\"application/xhtml+xml\"/>\n" +
           coverItem +
           "  </manifest>\n"
           "  <spine>\n"
           "    <itemref idref=\"ch1\"/>\n"
           "  </spine>\n"
           "</package>\n";
}

inline ByteBuffer buildEpub(const TempDir& dir, const EpubFixture& f = {}) {
    std::vector<ZipEntry> entries;
    if (f.includeMimetype) {
        entries.push_back({"mimetype", f.mimetype, true});
    }
    if (f.includeContainer) {
        entries.push_back({"META-INF/container.xml", containerXml()});
    }
    entries.push_back({"OEBPS/content.opf", buildOpf(f)});
    entries.push_back({"OEBPS/text/chapter1.xhtml",
                       "<?xml version=\"1.0\"?><html xmlns=\"http://www.w3.org/1999/xhtml\">"
                       "<head><title>Chapter 1</title></head><body><h1>Chapter 1</h1><p>" +
                       f.chapterText + "</p></body></html>"});
    if (f.cover != CoverDeclaration::None) {
        entries.push_back({"OEBPS/images/cover.jpg", f.coverBytes});
    }
    return buildZip(dir, entries);
}

// ═══════════════════════════════════════════════════════════
// Фейковый HTTP транспорт
// ═══════════════════════════════════════════════════════════

inline HttpResponse okResponse(const std::string& body) {
    HttpResponse r;
    r.statusCode = 200;
    r.body = body;
    return r;
}

inline HttpResponse statusResponse(long status) {
    HttpResponse r;
    r.statusCode = status;
    r.error = "HTTP " + std::to_string(status);
    return r;
}

inline HttpResponse transportFailure(TransportError type, const std::string& message) {
    HttpResponse r;
    r.errorType = type;
    r.error = message;
    return r;
}

class FakeTransport : public IHttpTransport {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    explicit FakeTransport(Handler handler) : m_handler(std::move(handler)) {}

    HttpResponse get(const HttpRequest& request, const CancellationToken*) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.push_back(request);
        return m_handler(request);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_requests;
    }

private:
    Handler m_handler;
    mutable std::mutex m_mutex;
    std::vector<HttpRequest> m_requests;
};

// ═══════════════════════════════════════════════════════════
// Фейковый OCR
// ═══════════════════════════════════════════════════════════

struct OcrStats {
    std::atomic<int> opened{0};
    std::atomic<int> closed{0};
    std::atomic<int> recognized{0};
    std::atomic<int> lastDpi{0};
};

class FakeOcrEngine : public IOcrEngine {
public:
    /// @param result Текст распознавания; failOnCall = номер вызова (с 1), который бросает
    FakeOcrEngine(std::string result = "Recognized scan text", int failOnCall = 0)
        : m_result(std::move(result)), m_failOnCall(failOnCall) {}

    std::string name() const override { return "fake"; }

    std::unique_ptr<IOcrSession> openSession() override {
        m_stats->opened++;
        return std::make_unique<Session>(this);
    }

    const OcrStats& stats() const { return *m_stats; }

private:
    class Session : public IOcrSession {
    public:
        explicit Session(FakeOcrEngine* engine) : m_engine(engine) {}
        ~Session() override { m_engine->m_stats->closed++; }

        std::string recognize(const RasterImage& image) override {
            m_engine->m_stats->lastDpi = image.dpi;
            int call = ++m_engine->m_stats->recognized;
            if (call == m_engine->m_failOnCall) {
                throw OcrError("simulated recognition failure");
            }
            return m_engine->m_result;
        }

    private:
        FakeOcrEngine* m_engine;
    };

    std::string m_result;
    int m_failOnCall;
    std::unique_ptr<OcrStats> m_stats = std::make_unique<OcrStats>();
};

} // namespace TestHelpers
} // namespace Thinkara
