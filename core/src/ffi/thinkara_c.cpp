// thinkara_c.cpp — реализация C API для FFI

#include "ffi_internal.h"
#include "thinkara/thinkara_c.h"
#include "thinkara/core.h"
#include "thinkara/Config.h"
#include "thinkara/ContentPipeline.h"
#include "thinkara/EpubExtractor.h"
#include "thinkara/Errors.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>

using json = nlohmann::json;
using namespace Thinkara;

// ═══════════════════════════════════════════════════════════
// Thread-local error state for proper C API error handling
// ═══════════════════════════════════════════════════════════

thread_local TKError g_lastError = TK_OK;
thread_local std::string g_lastErrorMessage;

void setLastError(TKError error, const std::string& message) {
    g_lastError = error;
    g_lastErrorMessage = message;
    if (error != TK_OK) {
        spdlog::error("FFI error (code {}): {}", static_cast<int>(error), message);
    }
}

// ═══════════════════════════════════════════════════════════
// Хелперы
// ═══════════════════════════════════════════════════════════

char* alloc_string(const std::string& str) {
    return tk_strdup(str.c_str());
}

namespace {

TKError toErrorCode(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:     return TK_ERROR_INVALID_ARGUMENT;
        case ErrorKind::Fetch:          return TK_ERROR_FETCH;
        case ErrorKind::Readability:    return TK_ERROR_READABILITY;
        case ErrorKind::PdfParse:       return TK_ERROR_PDF_PARSE;
        case ErrorKind::EpubStructure:  return TK_ERROR_EPUB_STRUCTURE;
        case ErrorKind::EpubExtraction: return TK_ERROR_EPUB_EXTRACTION;
        case ErrorKind::Ocr:            return TK_ERROR_OCR;
    }
    return TK_ERROR_INTERNAL;
}

/// Выполнить body, исключения превратить в код ошибки
template<typename Body>
char* guardedJson(Body&& body) {
    try {
        json result = body();
        clearLastError();
        return alloc_string(result.dump());
    } catch (const PipelineException& e) {
        setLastError(toErrorCode(e.kind()), e.what());
        return nullptr;
    } catch (const std::exception& e) {
        setLastError(TK_ERROR_INTERNAL, e.what());
        return nullptr;
    }
}

ContentPipeline* pipelineFrom(TKPipeline handle) {
    auto* holder = reinterpret_cast<PipelineHolder*>(handle);
    return holder ? holder->pipeline.get() : nullptr;
}

char* processBytes(TKPipeline handle, SourceType type, const uint8_t* data, size_t size,
                   const char* fileName) {
    ContentPipeline* pipeline = pipelineFrom(handle);
    if (!pipeline) {
        setLastError(TK_ERROR_INVALID_ARGUMENT, "Null pipeline handle");
        return nullptr;
    }
    if (!data || size == 0) {
        setLastError(TK_ERROR_INVALID_ARGUMENT, "Empty input buffer");
        return nullptr;
    }

    return guardedJson([&] {
        std::optional<std::string> name;
        if (fileName) name = fileName;
        auto request = SourceRequest::fromBytes(type, ByteBuffer(data, data + size), std::move(name));
        return articleToJson(pipeline->process(request));
    });
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

const char* tk_version(void) {
    return Thinkara::VERSION;
}

const char* tk_error_message(TKError error) {
    switch (error) {
        case TK_OK: return "Success";
        case TK_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case TK_ERROR_FETCH: return "All direct and proxy fetch attempts failed or timed out";
        case TK_ERROR_READABILITY: return "Could not extract article content";
        case TK_ERROR_PDF_PARSE: return "PDF could not be opened";
        case TK_ERROR_EPUB_STRUCTURE: return "Invalid EPUB structure";
        case TK_ERROR_EPUB_EXTRACTION: return "EPUB parsing failed";
        case TK_ERROR_OCR: return "Text recognition failed";
        case TK_ERROR_INTERNAL:
        default: return "Internal error";
    }
}

TKError tk_last_error(void) {
    return g_lastError;
}

const char* tk_last_error_message(void) {
    return g_lastErrorMessage.c_str();
}

void tk_clear_error(void) {
    g_lastError = TK_OK;
    g_lastErrorMessage.clear();
}

void tk_free_string(char* str) {
    std::free(str);
}

// ═══════════════════════════════════════════════════════════
// Pipeline
// ═══════════════════════════════════════════════════════════

TKPipeline tk_pipeline_create(const char* config_json, TKError* out_error) {
    try {
        PipelineConfig config;
        if (config_json && std::strlen(config_json) > 0) {
            config = PipelineConfig::fromJsonString(config_json);
        }

        auto* holder = new PipelineHolder{ContentPipeline::createDefault(config)};
        setLastError(TK_OK);
        if (out_error) *out_error = TK_OK;
        return reinterpret_cast<TKPipeline>(holder);
    } catch (const PipelineException& e) {
        TKError code = toErrorCode(e.kind());
        setLastError(code, e.what());
        if (out_error) *out_error = code;
        return nullptr;
    } catch (const std::exception& e) {
        setLastError(TK_ERROR_INTERNAL, e.what());
        if (out_error) *out_error = TK_ERROR_INTERNAL;
        return nullptr;
    }
}

void tk_pipeline_destroy(TKPipeline pipeline) {
    delete reinterpret_cast<PipelineHolder*>(pipeline);
}

char* tk_process_url(TKPipeline handle, const char* url) {
    ContentPipeline* pipeline = pipelineFrom(handle);
    if (!pipeline) {
        setLastError(TK_ERROR_INVALID_ARGUMENT, "Null pipeline handle");
        return nullptr;
    }
    if (!url) {
        setLastError(TK_ERROR_INVALID_ARGUMENT, "Null URL");
        return nullptr;
    }

    return guardedJson([&] {
        return articleToJson(pipeline->process(SourceRequest::fromUrl(url)));
    });
}

char* tk_process_pdf(TKPipeline pipeline, const uint8_t* data, size_t size, const char* file_name) {
    return processBytes(pipeline, SourceType::Pdf, data, size, file_name);
}

char* tk_process_epub(TKPipeline pipeline, const uint8_t* data, size_t size, const char* file_name) {
    return processBytes(pipeline, SourceType::Epub, data, size, file_name);
}

char* tk_epub_metadata(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        setLastError(TK_ERROR_INVALID_ARGUMENT, "Empty input buffer");
        return nullptr;
    }

    return guardedJson([&] {
        EpubExtractor extractor;
        return epubMetadataToJson(extractor.extractEpubMetadata(ByteBuffer(data, data + size)));
    });
}

bool tk_validate_epub(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return false;
    }
    return EpubExtractor::validateEpubStructure(ByteBuffer(data, data + size));
}
