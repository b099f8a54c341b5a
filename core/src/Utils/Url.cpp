#include "thinkara/Url.h"
#include "thinkara/Errors.h"
#include "thinkara/TextUtils.h"

#include <curl/curl.h>

#include <memory>

namespace Thinkara {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* url) const noexcept {
        if (url) curl_url_cleanup(url);
    }
};

struct CurlStringDeleter {
    void operator()(char* str) const noexcept {
        if (str) curl_free(str);
    }
};

using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;
using CurlString = std::unique_ptr<char, CurlStringDeleter>;

CurlUrlPtr parse(const std::string& url, unsigned int flags = 0) {
    CurlUrlPtr handle(curl_url());
    if (!handle) {
        return nullptr;
    }
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), flags) != CURLUE_OK) {
        return nullptr;
    }
    return handle;
}

std::optional<std::string> getPart(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || !raw) {
        return std::nullopt;
    }
    CurlString guard(raw);
    return std::string(raw);
}

} // namespace

bool Url::isValidHttpUrl(const std::string& url) {
    if (url.empty()) {
        return false;
    }
    auto handle = parse(url);
    if (!handle) {
        return false;
    }
    auto scheme = getPart(handle.get(), CURLUPART_SCHEME);
    auto host = getPart(handle.get(), CURLUPART_HOST);
    if (!scheme || !host || host->empty()) {
        return false;
    }
    std::string lower = TextUtils::toLower(*scheme);
    return lower == "http" || lower == "https";
}

std::string Url::normalize(const std::string& url) {
    if (!isValidHttpUrl(url)) {
        throw ValidationError("Invalid URL provided");
    }
    auto handle = parse(url);
    auto host = getPart(handle.get(), CURLUPART_HOST);
    if (host) {
        curl_url_set(handle.get(), CURLUPART_HOST, TextUtils::toLower(*host).c_str(), 0);
    }
    auto full = getPart(handle.get(), CURLUPART_URL);
    return full ? *full : url;
}

std::optional<std::string> Url::hostname(const std::string& url) {
    auto handle = parse(url);
    if (!handle) {
        return std::nullopt;
    }
    auto host = getPart(handle.get(), CURLUPART_HOST);
    if (!host || host->empty()) {
        return std::nullopt;
    }
    return TextUtils::toLower(*host);
}

std::optional<std::string> Url::resolve(const std::string& base, const std::string& reference) {
    std::string ref = TextUtils::trim(reference);
    if (ref.empty()) {
        return std::nullopt;
    }
    // Якоря и data:/mailto: оставляем как есть
    if (ref[0] == '#') {
        return ref;
    }
    std::string lower = TextUtils::toLower(ref);
    if (lower.rfind("data:", 0) == 0 || lower.rfind("mailto:", 0) == 0 ||
        lower.rfind("tel:", 0) == 0) {
        return ref;
    }

    auto handle = parse(base);
    if (!handle) {
        return std::nullopt;
    }
    // При установленном URL относительная ссылка разрешается относительно него
    if (curl_url_set(handle.get(), CURLUPART_URL, ref.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        return std::nullopt;
    }
    return getPart(handle.get(), CURLUPART_URL);
}

std::string Url::encodeComponent(const std::string& value) {
    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl) curl_easy_cleanup(curl);
        }
    };
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return value;
    }
    CurlString escaped(curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size())));
    return escaped ? std::string(escaped.get()) : value;
}

} // namespace Thinkara
