#include "thinkara/HtmlFetcher.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

namespace Thinkara {

namespace {

/// curl_global_init один раз на процесс
void ensureCurlGlobalInit() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept {
        if (curl) curl_easy_cleanup(curl);
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept {
        curl_slist_free_all(list);
    }
};

/// Контекст одного запроса для callback-ов
struct RequestContext {
    std::string* body = nullptr;
    size_t maxBodyBytes = 0;
    bool tooLarge = false;
    const CancellationToken* cancel = nullptr;
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<RequestContext*>(userp);
    if (!ctx || !ctx->body) return 0;

    size_t total = size * nmemb;
    if (ctx->maxBodyBytes > 0 && ctx->body->size() + total > ctx->maxBodyBytes) {
        ctx->tooLarge = true;
        return 0;   // Прерывает передачу с CURLE_WRITE_ERROR
    }
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

/// Ненулевой возврат прерывает передачу (CURLE_ABORTED_BY_CALLBACK)
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<RequestContext*>(clientp);
    if (ctx && ctx->cancel && ctx->cancel->isCancelled()) {
        return 1;
    }
    return 0;
}

TransportError mapCurlCode(CURLcode code) {
    switch (code) {
        case CURLE_OK:                  return TransportError::None;
        case CURLE_OPERATION_TIMEDOUT:  return TransportError::Timeout;
        case CURLE_ABORTED_BY_CALLBACK: return TransportError::Cancelled;
        default:                        return TransportError::Network;
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════
// CurlHttpTransport
// ═══════════════════════════════════════════════════════════

CurlHttpTransport::CurlHttpTransport() {
    ensureCurlGlobalInit();
}

HttpResponse CurlHttpTransport::get(const HttpRequest& request, const CancellationToken* cancel) {
    HttpResponse response;

    if (cancel && cancel->isCancelled()) {
        response.errorType = TransportError::Cancelled;
        response.error = "Request cancelled";
        return response;
    }

    // Handle на запрос: вызовы из разных потоков не разделяют состояние
    std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
    CURL* curl = handle.get();
    if (!curl) {
        response.errorType = TransportError::Network;
        response.error = "Failed to initialize CURL handle";
        return response;
    }

    std::string body;
    RequestContext ctx;
    ctx.body = &body;
    ctx.maxBodyBytes = request.maxBodyBytes;
    ctx.cancel = cancel;

    curl_slist* raw = nullptr;
    for (const auto& h : request.headers) {
        raw = curl_slist_append(raw, h.c_str());
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> headerList(raw);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    if (!request.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());
    }
    if (raw) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, raw);
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);

    if (ctx.tooLarge) {
        response.errorType = TransportError::TooLarge;
        response.error = "Response exceeds " + std::to_string(request.maxBodyBytes) + " bytes";
        return response;
    }

    if (res != CURLE_OK) {
        response.errorType = mapCurlCode(res);
        response.error = curl_easy_strerror(res);
        spdlog::debug("CurlHttpTransport: GET {} failed: {}", request.url, response.error);
        return response;
    }

    response.body = std::move(body);
    if (!response.isSuccess()) {
        response.error = "HTTP " + std::to_string(response.statusCode);
    }
    return response;
}

} // namespace Thinkara
