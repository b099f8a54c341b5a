#include "thinkara/HtmlFetcher.h"
#include "thinkara/Errors.h"
#include "thinkara/Url.h"

#include <spdlog/spdlog.h>

namespace Thinkara {

// ═══════════════════════════════════════════════════════════
// FetchStrategy
// ═══════════════════════════════════════════════════════════

FetchStrategy FetchStrategy::direct() {
    FetchStrategy s;
    s.label = "direct";
    s.buildRequestUrl = [](const std::string& target) { return target; };
    return s;
}

FetchStrategy FetchStrategy::proxy(const ProxyEndpoint& endpoint) {
    FetchStrategy s;
    s.label = endpoint.label.empty() ? endpoint.prefix : endpoint.label;
    s.buildRequestUrl = [prefix = endpoint.prefix](const std::string& target) {
        return prefix + Url::encodeComponent(target);
    };
    // Прокси иногда отвечают 200 с пустым телом
    s.requireNonEmptyBody = true;
    return s;
}

// ═══════════════════════════════════════════════════════════
// HtmlFetcher
// ═══════════════════════════════════════════════════════════

HtmlFetcher::HtmlFetcher(FetchConfig config, std::shared_ptr<IHttpTransport> transport)
    : m_config(std::move(config))
    , m_transport(transport ? std::move(transport) : std::make_shared<CurlHttpTransport>())
{
    m_strategies.push_back(FetchStrategy::direct());
    for (const auto& endpoint : m_config.proxies) {
        m_strategies.push_back(FetchStrategy::proxy(endpoint));
    }
}

HtmlFetcher::HtmlFetcher(FetchConfig config, std::vector<FetchStrategy> strategies,
                         std::shared_ptr<IHttpTransport> transport)
    : m_config(std::move(config))
    , m_strategies(std::move(strategies))
    , m_transport(transport ? std::move(transport) : std::make_shared<CurlHttpTransport>())
{}

HtmlFetcher::~HtmlFetcher() = default;

std::string HtmlFetcher::fetchHtml(const std::string& url, const CancellationToken* cancel) {
    return fetch(url, cancel).html;
}

FetchReport HtmlFetcher::fetch(const std::string& url, const CancellationToken* cancel) {
    if (!Url::isValidHttpUrl(url)) {
        throw ValidationError("Invalid URL provided");
    }
    const std::string target = Url::normalize(url);

    if (m_strategies.empty()) {
        throw FetchError(FetchFailure::AllAttemptsFailed, "No fetch strategies configured");
    }

    FetchReport report;

    // Строго последовательно: первый успех прекращает перебор
    for (const auto& strategy : m_strategies) {
        if (cancel && cancel->isCancelled()) {
            throw FetchError(FetchFailure::Cancelled, "Fetch cancelled", std::move(report.attempts));
        }

        report.attempts.push_back(runAttempt(strategy, target, cancel));
        const FetchAttempt& attempt = report.attempts.back();

        if (const auto* success = std::get_if<AttemptSuccess>(&attempt.outcome)) {
            spdlog::info("HtmlFetcher: fetched {} via {} ({} bytes)",
                         target, strategy.label, success->html.size());
            report.html = success->html;
            return report;
        }

        const auto& failure = std::get<AttemptFailure>(attempt.outcome);
        if (failure.cancelled) {
            throw FetchError(FetchFailure::Cancelled, "Fetch cancelled", std::move(report.attempts));
        }
        spdlog::warn("HtmlFetcher: {} failed for {}: {}", strategy.label, target, failure.cause);
    }

    const auto& last = std::get<AttemptFailure>(report.attempts.back().outcome);
    const FetchFailure reason = last.timedOut ? FetchFailure::TimedOut : FetchFailure::AllAttemptsFailed;
    spdlog::error("HtmlFetcher: giving up on {} after {} attempts ({})",
                  target, report.attempts.size(), fetchFailureToString(reason));

    if (reason == FetchFailure::TimedOut) {
        throw FetchError(FetchFailure::TimedOut,
                         "All direct and proxy fetch attempts failed; last attempt (" +
                             report.attempts.back().strategyLabel + ") timed out after " +
                             std::to_string(m_config.timeoutMs) + " ms",
                         std::move(report.attempts));
    }
    throw FetchError(FetchFailure::AllAttemptsFailed,
                     "All direct and proxy fetch attempts failed or timed out",
                     std::move(report.attempts));
}

FetchAttempt HtmlFetcher::runAttempt(const FetchStrategy& strategy, const std::string& target,
                                     const CancellationToken* cancel) {
    FetchAttempt attempt;
    attempt.strategyLabel = strategy.label;
    attempt.startedAt = std::chrono::system_clock::now();
    attempt.timedOutAfterMs = m_config.timeoutMs;

    HttpRequest request;
    request.timeout = std::chrono::milliseconds(m_config.timeoutMs);
    request.userAgent = m_config.userAgent;
    request.followRedirects = m_config.followRedirects;
    request.maxBodyBytes = m_config.maxBodyBytes;
    request.headers.push_back("Accept: " + m_config.accept);
    request.headers.push_back("Cache-Control: no-cache");

    try {
        request.url = strategy.buildRequestUrl(target);
    } catch (const std::exception& e) {
        attempt.outcome = AttemptFailure{std::string("Cannot build request URL: ") + e.what()};
        return attempt;
    }

    spdlog::debug("HtmlFetcher: trying {} -> {}", strategy.label, request.url);
    HttpResponse response = m_transport->get(request, cancel);

    if (response.isSuccess()) {
        if (strategy.requireNonEmptyBody && response.body.empty()) {
            attempt.outcome = AttemptFailure{"Empty response body", response.statusCode};
            return attempt;
        }
        attempt.outcome = AttemptSuccess{std::move(response.body), response.statusCode};
        return attempt;
    }

    AttemptFailure failure;
    failure.statusCode = response.statusCode;
    failure.timedOut = response.errorType == TransportError::Timeout;
    failure.cancelled = response.errorType == TransportError::Cancelled;
    failure.cause = response.error.empty()
        ? "HTTP " + std::to_string(response.statusCode)
        : response.error;
    attempt.outcome = std::move(failure);
    return attempt;
}

} // namespace Thinkara
