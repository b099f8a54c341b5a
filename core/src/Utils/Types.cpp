#include "thinkara/Types.h"
#include "thinkara/Errors.h"
#include <algorithm>
#include <cctype>

namespace Thinkara {

namespace {

std::string lowered(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// SourceType
// ═══════════════════════════════════════════════════════════

const char* sourceTypeToString(SourceType type) {
    switch (type) {
        case SourceType::Web:  return "web";
        case SourceType::Pdf:  return "pdf";
        case SourceType::Epub: return "epub";
        default:               return "web";
    }
}

// ═══════════════════════════════════════════════════════════
// ContentFormat
// ═══════════════════════════════════════════════════════════

const char* contentFormatToString(ContentFormat format) {
    switch (format) {
        case ContentFormat::Html:     return "html";
        case ContentFormat::Markdown: return "markdown";
        default:                      return "html";
    }
}

ContentFormat contentFormatFromString(const std::string& str) {
    std::string lower = lowered(str);
    if (lower == "markdown" || lower == "md") return ContentFormat::Markdown;
    return ContentFormat::Html;
}

// ═══════════════════════════════════════════════════════════
// Прочие перечисления
// ═══════════════════════════════════════════════════════════

const char* fetchFailureToString(FetchFailure failure) {
    switch (failure) {
        case FetchFailure::AllAttemptsFailed: return "all_attempts_failed";
        case FetchFailure::TimedOut:          return "timed_out";
        case FetchFailure::Cancelled:         return "cancelled";
        default:                              return "all_attempts_failed";
    }
}

const char* pageTextMethodToString(PageTextMethod method) {
    switch (method) {
        case PageTextMethod::TextLayer: return "text_layer";
        case PageTextMethod::Ocr:       return "ocr";
        case PageTextMethod::Failed:    return "failed";
        default:                        return "failed";
    }
}

const char* coverSourceToString(CoverSource source) {
    switch (source) {
        case CoverSource::Primary:  return "primary";
        case CoverSource::Fallback: return "fallback";
        case CoverSource::Absent:   return "absent";
        default:                    return "absent";
    }
}

const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:     return "validation";
        case ErrorKind::Fetch:          return "fetch";
        case ErrorKind::Readability:    return "readability";
        case ErrorKind::PdfParse:       return "pdf_parse";
        case ErrorKind::EpubStructure:  return "epub_structure";
        case ErrorKind::EpubExtraction: return "epub_extraction";
        case ErrorKind::Ocr:            return "ocr";
        default:                        return "unknown";
    }
}

} // namespace Thinkara
