// HtmlFetcher.h — Загрузка HTML с цепочкой прокси
// Прямой запрос, затем прокси по порядку, каждая попытка ограничена таймаутом

#pragma once

#include "export.h"
#include "Config.h"
#include "Models.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Thinkara {

// ═══════════════════════════════════════════════════════════
// HTTP транспорт
// ═══════════════════════════════════════════════════════════

enum class TransportError : int32_t {
    None = 0,
    Network = 1,
    Timeout = 2,
    Cancelled = 3,
    TooLarge = 4
};

struct HttpResponse {
    long statusCode = 0;
    std::string body;
    std::string error;
    TransportError errorType = TransportError::None;

    bool isSuccess() const {
        return errorType == TransportError::None && statusCode >= 200 && statusCode < 300;
    }
};

struct HttpRequest {
    std::string url;
    std::chrono::milliseconds timeout{10000};
    std::vector<std::string> headers;   // "Name: value"
    std::string userAgent;
    bool followRedirects = true;
    size_t maxBodyBytes = 0;            // 0 = без ограничения
};

/// Интерфейс HTTP GET (подменяется в тестах)
class TK_API IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /// Выполнить GET. Сетевые сбои возвращаются в HttpResponse, не исключением
    /// @param cancel Может быть nullptr
    virtual HttpResponse get(const HttpRequest& request, const CancellationToken* cancel) = 0;
};

/// Транспорт на libcurl (easy interface, свой handle на каждый запрос)
/// Потокобезопасен: параллельные get() не ждут друг друга
class TK_API CurlHttpTransport : public IHttpTransport {
public:
    CurlHttpTransport();

    HttpResponse get(const HttpRequest& request, const CancellationToken* cancel) override;
};

// ═══════════════════════════════════════════════════════════
// Стратегии загрузки
// ═══════════════════════════════════════════════════════════

/// Одна стратегия: метка + построение URL запроса из целевого URL
struct FetchStrategy {
    std::string label;
    std::function<std::string(const std::string& target)> buildRequestUrl;
    bool requireNonEmptyBody = false;

    static FetchStrategy direct();
    static FetchStrategy proxy(const ProxyEndpoint& endpoint);
};

// ═══════════════════════════════════════════════════════════
// HtmlFetcher
// ═══════════════════════════════════════════════════════════

class TK_API HtmlFetcher {
public:
    /// Стратегии: direct + config.proxies по порядку
    HtmlFetcher(FetchConfig config, std::shared_ptr<IHttpTransport> transport = nullptr);

    /// Явный список стратегий
    HtmlFetcher(FetchConfig config, std::vector<FetchStrategy> strategies,
                std::shared_ptr<IHttpTransport> transport);

    ~HtmlFetcher();

    /// Получить HTML страницы
    /// @throws ValidationError URL не http/https (до любого запроса)
    /// @throws FetchError все попытки неудачны, таймаут или отмена
    std::string fetchHtml(const std::string& url, const CancellationToken* cancel = nullptr);

    /// То же, плюс история попыток
    FetchReport fetch(const std::string& url, const CancellationToken* cancel = nullptr);

    const std::vector<FetchStrategy>& strategies() const { return m_strategies; }

private:
    /// Одна попытка, без исключений
    FetchAttempt runAttempt(const FetchStrategy& strategy, const std::string& target,
                            const CancellationToken* cancel);

    FetchConfig m_config;
    std::vector<FetchStrategy> m_strategies;
    std::shared_ptr<IHttpTransport> m_transport;
};

} // namespace Thinkara
