#include "thinkara/PdfExtractor.h"
#include "thinkara/Errors.h"
#include "thinkara/TextUtils.h"

#include <spdlog/spdlog.h>

// Poppler headers
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-global.h>
#include <poppler/cpp/poppler-image.h>
#include <poppler/cpp/poppler-page.h>
#include <poppler/cpp/poppler-page-renderer.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Thinkara {

namespace {

std::string toStdString(const poppler::ustring& text) {
    poppler::byte_array bytes = text.to_utf8();
    return std::string(bytes.begin(), bytes.end());
}

std::optional<std::string> nonEmpty(const std::string& value) {
    std::string clean = TextUtils::collapseWhitespace(value);
    if (clean.empty()) {
        return std::nullopt;
    }
    return clean;
}

/// Растеризовать страницу в оттенках серого
RasterImage renderPage(const poppler::page& page, double scale) {
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_gray8);

    const double dpi = 72.0 * scale;
    poppler::image image = renderer.render_page(&page, dpi, dpi);
    if (!image.is_valid()) {
        throw OcrError("Page rendering failed");
    }

    RasterImage raster;
    raster.width = image.width();
    raster.height = image.height();
    raster.bytesPerPixel = 1;
    raster.bytesPerLine = image.bytes_per_row();
    raster.dpi = static_cast<int>(std::lround(dpi));

    const char* data = image.const_data();
    size_t size = static_cast<size_t>(raster.bytesPerLine) * static_cast<size_t>(raster.height);
    raster.pixels.assign(reinterpret_cast<const uint8_t*>(data),
                         reinterpret_cast<const uint8_t*>(data) + size);
    return raster;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Порядок чтения
// ═══════════════════════════════════════════════════════════

std::vector<TextFragment> orderFragments(std::vector<TextFragment> fragments, double lineTolerance) {
    std::stable_sort(fragments.begin(), fragments.end(),
                     [](const TextFragment& a, const TextFragment& b) { return a.y < b.y; });

    // Группируем в строки относительно первого фрагмента строки
    std::vector<std::vector<TextFragment>> lines;
    for (auto& fragment : fragments) {
        if (lines.empty() || std::abs(fragment.y - lines.back().front().y) > lineTolerance) {
            lines.emplace_back();
        }
        lines.back().push_back(std::move(fragment));
    }

    std::vector<TextFragment> ordered;
    ordered.reserve(fragments.size());
    for (auto& line : lines) {
        std::stable_sort(line.begin(), line.end(),
                         [](const TextFragment& a, const TextFragment& b) { return a.x < b.x; });
        for (auto& fragment : line) {
            ordered.push_back(std::move(fragment));
        }
    }
    return ordered;
}

std::string joinFragments(const std::vector<TextFragment>& ordered) {
    std::string text;
    for (const auto& fragment : ordered) {
        if (fragment.text.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += fragment.text;
    }
    return TextUtils::collapseWhitespace(text);
}

// ═══════════════════════════════════════════════════════════
// PdfExtractor
// ═══════════════════════════════════════════════════════════

PdfExtractor::PdfExtractor(PdfConfig config, std::shared_ptr<IOcrEngine> ocr)
    : m_config(std::move(config))
    , m_ocr(ocr ? std::move(ocr)
                : std::make_shared<TesseractOcrEngine>(m_config.ocrLanguage, m_config.tessdataPath))
{}

PdfExtractor::~PdfExtractor() = default;

std::string PdfExtractor::extractPdfText(const ByteBuffer& pdfBytes) {
    return extractDocument(pdfBytes).text;
}

PdfDocumentText PdfExtractor::extractDocument(const ByteBuffer& pdfBytes) {
    if (pdfBytes.empty()) {
        throw PdfParseError("Empty PDF data");
    }
    if (pdfBytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw PdfParseError("PDF data too large");
    }

    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(
        reinterpret_cast<const char*>(pdfBytes.data()), static_cast<int>(pdfBytes.size())));

    if (!doc) {
        spdlog::warn("PdfExtractor: failed to load PDF ({} bytes)", pdfBytes.size());
        throw PdfParseError("Failed to load PDF document");
    }

    // Проверяем на защиту паролем
    if (doc->is_locked()) {
        throw PdfParseError("PDF is password protected");
    }

    PdfDocumentText result;
    result.pageCount = doc->pages();
    result.title = nonEmpty(toStdString(doc->get_title()));
    result.author = nonEmpty(toStdString(doc->get_author()));

    int pageLimit = result.pageCount;
    if (m_config.maxPages > 0) {
        pageLimit = std::min(pageLimit, m_config.maxPages);
    }

    // Страницы строго по порядку, по одной
    std::string joined;
    for (int i = 0; i < pageLimit; ++i) {
        PageResult page = processPage(*doc, i);
        if (i > 0) {
            joined += '\n';
        }
        joined += page.text;
        result.pages.push_back(std::move(page));
    }

    result.text = TextUtils::trim(joined);

    size_t ocrPages = std::count_if(result.pages.begin(), result.pages.end(),
        [](const PageResult& p) { return p.method == PageTextMethod::Ocr; });
    size_t failedPages = std::count_if(result.pages.begin(), result.pages.end(),
        [](const PageResult& p) { return p.method == PageTextMethod::Failed; });
    spdlog::info("PdfExtractor: {} pages processed ({} via OCR, {} failed)",
                 pageLimit, ocrPages, failedPages);

    return result;
}

PageResult PdfExtractor::processPage(poppler::document& document, int pageIndex) {
    PageResult result;
    result.pageNumber = pageIndex + 1;

    try {
        std::unique_ptr<poppler::page> page(document.create_page(pageIndex));
        if (!page) {
            throw PdfParseError("Cannot open page");
        }

        std::vector<TextFragment> fragments;
        for (const auto& box : page->text_list()) {
            poppler::rectf bbox = box.bbox();
            fragments.push_back({toStdString(box.text()), bbox.x(), bbox.y()});
        }
        std::string text = joinFragments(orderFragments(std::move(fragments)));

        if (TextUtils::nonWhitespaceLength(text) >= m_config.minTextChars) {
            result.method = PageTextMethod::TextLayer;
            result.text = std::move(text);
        } else {
            // Текстового слоя мало, считаем страницу сканом
            spdlog::debug("PdfExtractor: page {} has no usable text layer, running {} OCR",
                          result.pageNumber, m_ocr->name());

            RasterImage raster = renderPage(*page, m_config.ocrScale);

            // Сессия живёт только в пределах страницы
            std::unique_ptr<IOcrSession> session = m_ocr->openSession();
            std::string recognized = session->recognize(raster);

            result.method = PageTextMethod::Ocr;
            result.text = TextUtils::collapseWhitespace(recognized);
        }
    } catch (const std::exception& e) {
        spdlog::warn("PdfExtractor: page {} failed: {}", result.pageNumber, e.what());
        result.method = PageTextMethod::Failed;
        result.text.clear();
    }

    spdlog::debug("PdfExtractor: page {} -> {} ({} chars)", result.pageNumber,
                  pageTextMethodToString(result.method), result.text.size());
    return result;
}

} // namespace Thinkara
