// PdfExtractor.h — Текст из PDF с OCR для страниц-сканов
// Poppler для текстового слоя и растеризации, Tesseract для распознавания

#pragma once

#include "export.h"
#include "Config.h"
#include "Models.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
}

namespace Thinkara {

// ═══════════════════════════════════════════════════════════
// Фрагменты текстового слоя
// ═══════════════════════════════════════════════════════════

struct TextFragment {
    std::string text;
    double x = 0.0;
    double y = 0.0;
};

/// Восстановить порядок чтения: строки по y (фрагменты ближе tolerance
/// считаются одной строкой), внутри строки по x
TK_API std::vector<TextFragment> orderFragments(std::vector<TextFragment> fragments,
                                                double lineTolerance = 1.0);

/// Склеить упорядоченные фрагменты в одну строку
TK_API std::string joinFragments(const std::vector<TextFragment>& ordered);

// ═══════════════════════════════════════════════════════════
// OCR
// ═══════════════════════════════════════════════════════════

/// Растр страницы в памяти
struct RasterImage {
    int width = 0;
    int height = 0;
    int bytesPerPixel = 1;
    int bytesPerLine = 0;
    int dpi = 72;
    std::vector<uint8_t> pixels;

    bool isValid() const { return width > 0 && height > 0 && !pixels.empty(); }
};

/// Сессия распознавания. Ресурсы освобождаются в деструкторе
class TK_API IOcrSession {
public:
    virtual ~IOcrSession() = default;

    /// @throws OcrError
    virtual std::string recognize(const RasterImage& image) = 0;
};

/// Фабрика сессий. На каждую страницу открывается новая сессия
class TK_API IOcrEngine {
public:
    virtual ~IOcrEngine() = default;

    virtual std::string name() const = 0;

    /// @throws OcrError если движок не инициализируется
    virtual std::unique_ptr<IOcrSession> openSession() = 0;
};

class TK_API TesseractOcrEngine : public IOcrEngine {
public:
    /// @param dataPath Пусто = путь tessdata по умолчанию
    TesseractOcrEngine(std::string language = "eng", std::string dataPath = "");

    std::string name() const override { return "tesseract"; }
    std::unique_ptr<IOcrSession> openSession() override;

private:
    std::string m_language;
    std::string m_dataPath;
};

// ═══════════════════════════════════════════════════════════
// PdfExtractor
// ═══════════════════════════════════════════════════════════

class TK_API PdfExtractor {
public:
    /// @param ocr nullptr = Tesseract с языком из config
    explicit PdfExtractor(PdfConfig config = {}, std::shared_ptr<IOcrEngine> ocr = nullptr);
    ~PdfExtractor();

    /// Текст всех страниц через '\n'
    /// @throws PdfParseError документ не открывается
    std::string extractPdfText(const ByteBuffer& pdfBytes);

    /// Текст, метаданные и отчёт по страницам
    /// @note Ошибки отдельных страниц не бросаются, страница становится пустой
    /// @throws PdfParseError документ не открывается
    PdfDocumentText extractDocument(const ByteBuffer& pdfBytes);

    const PdfConfig& config() const { return m_config; }

private:
    /// Текстовый слой или OCR для одной страницы, ошибки перехватываются здесь
    PageResult processPage(poppler::document& document, int pageIndex);

    PdfConfig m_config;
    std::shared_ptr<IOcrEngine> m_ocr;
};

} // namespace Thinkara
