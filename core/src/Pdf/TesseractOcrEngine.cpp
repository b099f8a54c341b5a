#include "thinkara/PdfExtractor.h"
#include "thinkara/Errors.h"

#include <spdlog/spdlog.h>

#include <tesseract/baseapi.h>

namespace Thinkara {

namespace {

/// Один экземпляр TessBaseAPI на сессию, End() в деструкторе
class TesseractSession : public IOcrSession {
public:
    TesseractSession(const std::string& language, const std::string& dataPath)
        : m_api(std::make_unique<tesseract::TessBaseAPI>())
    {
        const char* path = dataPath.empty() ? nullptr : dataPath.c_str();
        if (m_api->Init(path, language.c_str()) != 0) {
            throw OcrError("Tesseract init failed for language '" + language + "'");
        }
    }

    ~TesseractSession() override {
        m_api->End();
    }

    TesseractSession(const TesseractSession&) = delete;
    TesseractSession& operator=(const TesseractSession&) = delete;

    std::string recognize(const RasterImage& image) override {
        if (!image.isValid()) {
            throw OcrError("Empty raster");
        }

        m_api->SetImage(image.pixels.data(), image.width, image.height,
                        image.bytesPerPixel, image.bytesPerLine);
        m_api->SetSourceResolution(image.dpi);

        std::unique_ptr<char[]> text(m_api->GetUTF8Text());
        if (!text) {
            throw OcrError("Tesseract returned no text");
        }
        return std::string(text.get());
    }

private:
    std::unique_ptr<tesseract::TessBaseAPI> m_api;
};

} // namespace

TesseractOcrEngine::TesseractOcrEngine(std::string language, std::string dataPath)
    : m_language(std::move(language))
    , m_dataPath(std::move(dataPath))
{}

std::unique_ptr<IOcrSession> TesseractOcrEngine::openSession() {
    spdlog::debug("TesseractOcrEngine: opening session ({})", m_language);
    return std::make_unique<TesseractSession>(m_language, m_dataPath);
}

} // namespace Thinkara
