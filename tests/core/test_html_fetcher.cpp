// test_html_fetcher.cpp — тесты HtmlFetcher (цепочка direct + прокси)

#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "thinkara/HtmlFetcher.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <thread>

using namespace Thinkara;
using namespace Thinkara::TestHelpers;

namespace {

const std::string kTarget = "https://example.com/article";
const std::string kHtml = "<html><body><p>Hello</p></body></html>";

/// Локальный сокет, который принимает соединения в backlog и никогда не отвечает
class SilentServer {
public:
    SilentServer() {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (m_fd < 0 || ::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(m_fd, 16) != 0) {
            throw std::runtime_error("SilentServer: cannot listen on loopback");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        m_port = ntohs(addr.sin_port);
    }

    ~SilentServer() {
        if (m_fd >= 0) ::close(m_fd);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(m_port) + path;
    }

private:
    int m_fd = -1;
    int m_port = 0;
};

} // namespace

class HtmlFetcherTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> makeTransport(FakeTransport::Handler handler) {
        return std::make_shared<FakeTransport>(std::move(handler));
    }

    FetchConfig config;
};

// ═══════════════════════════════════════════════════════════
// Успех
// ═══════════════════════════════════════════════════════════

TEST_F(HtmlFetcherTest, DirectSuccessSkipsProxies) {
    auto transport = makeTransport([](const HttpRequest&) { return okResponse(kHtml); });
    HtmlFetcher fetcher(config, transport);

    auto report = fetcher.fetch(kTarget);

    EXPECT_EQ(report.html, kHtml);
    EXPECT_EQ(report.succeededWith(), "direct");
    ASSERT_EQ(transport->requests().size(), 1u);
    EXPECT_EQ(transport->requests()[0].url, kTarget);
}

TEST_F(HtmlFetcherTest, FallsBackToFirstProxyWithEncodedUrl) {
    auto transport = makeTransport([](const HttpRequest& r) {
        if (r.url == kTarget) {
            return transportFailure(TransportError::Network, "Connection refused");
        }
        return okResponse(kHtml);
    });
    HtmlFetcher fetcher(config, transport);

    auto report = fetcher.fetch(kTarget);

    EXPECT_EQ(report.html, kHtml);
    EXPECT_EQ(report.succeededWith(), "corsproxy.io");
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].url, "https://corsproxy.io/?https%3A%2F%2Fexample.com%2Farticle");
}

TEST_F(HtmlFetcherTest, EmptyProxyBodyCountsAsFailure) {
    auto transport = makeTransport([](const HttpRequest& r) {
        if (r.url == kTarget) return statusResponse(403);
        if (r.url.rfind("https://corsproxy.io/", 0) == 0) return okResponse("");
        return okResponse(kHtml);
    });
    HtmlFetcher fetcher(config, transport);

    auto report = fetcher.fetch(kTarget);

    EXPECT_EQ(report.succeededWith(), "codetabs");
    ASSERT_EQ(report.attempts.size(), 3u);
    const auto& failure = std::get<AttemptFailure>(report.attempts[1].outcome);
    EXPECT_EQ(failure.cause, "Empty response body");
}

TEST_F(HtmlFetcherTest, FetchHtmlReturnsBody) {
    auto transport = makeTransport([](const HttpRequest&) { return okResponse(kHtml); });
    HtmlFetcher fetcher(config, transport);

    EXPECT_EQ(fetcher.fetchHtml(kTarget), kHtml);
}

// ═══════════════════════════════════════════════════════════
// Неудачи
// ═══════════════════════════════════════════════════════════

TEST_F(HtmlFetcherTest, AllStrategiesFail) {
    auto transport = makeTransport([](const HttpRequest&) { return statusResponse(500); });
    HtmlFetcher fetcher(config, transport);

    try {
        fetcher.fetch(kTarget);
        FAIL() << "Expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.failure(), FetchFailure::AllAttemptsFailed);
        EXPECT_EQ(e.kind(), ErrorKind::Fetch);
        EXPECT_STREQ(e.what(), "All direct and proxy fetch attempts failed or timed out");
        ASSERT_EQ(e.attempts().size(), 4u);
        EXPECT_EQ(e.attempts()[0].strategyLabel, "direct");
        EXPECT_EQ(e.attempts()[3].strategyLabel, "allorigins");
        for (const auto& attempt : e.attempts()) {
            EXPECT_FALSE(attempt.succeeded());
        }
    }
    EXPECT_EQ(transport->requests().size(), 4u);
}

TEST_F(HtmlFetcherTest, LastAttemptTimeoutReportsTimedOut) {
    config.timeoutMs = 1500;
    auto transport = makeTransport([](const HttpRequest& r) {
        if (r.url.rfind("https://api.allorigins.win/", 0) == 0) {
            return transportFailure(TransportError::Timeout, "Operation timed out");
        }
        return statusResponse(502);
    });
    HtmlFetcher fetcher(config, transport);

    try {
        fetcher.fetch(kTarget);
        FAIL() << "Expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.failure(), FetchFailure::TimedOut);
        EXPECT_NE(std::string(e.what()).find("1500 ms"), std::string::npos);
        ASSERT_EQ(e.attempts().size(), 4u);
        const auto& last = std::get<AttemptFailure>(e.attempts().back().outcome);
        EXPECT_TRUE(last.timedOut);
        EXPECT_EQ(e.attempts().back().timedOutAfterMs, 1500);
    }
}

TEST_F(HtmlFetcherTest, InvalidUrlRejectedBeforeAnyRequest) {
    auto transport = makeTransport([](const HttpRequest&) { return okResponse(kHtml); });
    HtmlFetcher fetcher(config, transport);

    EXPECT_THROW(fetcher.fetch("ftp://example.com/file"), ValidationError);
    EXPECT_THROW(fetcher.fetch(""), ValidationError);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(HtmlFetcherTest, NoStrategiesConfigured) {
    auto transport = makeTransport([](const HttpRequest&) { return okResponse(kHtml); });
    HtmlFetcher fetcher(config, std::vector<FetchStrategy>{}, transport);

    EXPECT_THROW(fetcher.fetch(kTarget), FetchError);
}

// ═══════════════════════════════════════════════════════════
// Отмена
// ═══════════════════════════════════════════════════════════

TEST_F(HtmlFetcherTest, CancelledTokenStopsBeforeFirstAttempt) {
    auto transport = makeTransport([](const HttpRequest&) { return okResponse(kHtml); });
    HtmlFetcher fetcher(config, transport);

    CancellationToken token;
    token.cancel();

    try {
        fetcher.fetch(kTarget, &token);
        FAIL() << "Expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.failure(), FetchFailure::Cancelled);
        EXPECT_TRUE(e.attempts().empty());
    }
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(HtmlFetcherTest, TransportCancellationStopsChain) {
    auto transport = makeTransport([](const HttpRequest&) {
        return transportFailure(TransportError::Cancelled, "Callback aborted");
    });
    HtmlFetcher fetcher(config, transport);

    try {
        fetcher.fetch(kTarget);
        FAIL() << "Expected FetchError";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.failure(), FetchFailure::Cancelled);
        EXPECT_EQ(e.attempts().size(), 1u);
    }
    EXPECT_EQ(transport->requests().size(), 1u);
}

// ═══════════════════════════════════════════════════════════
// Параметры запроса
// ═══════════════════════════════════════════════════════════

TEST_F(HtmlFetcherTest, RequestCarriesConfiguredOptions) {
    config.timeoutMs = 4200;
    config.userAgent = "ThinkaraTest/1.0";
    auto transport = makeTransport([](const HttpRequest&) { return okResponse(kHtml); });
    HtmlFetcher fetcher(config, transport);

    fetcher.fetch(kTarget);

    auto request = transport->requests().at(0);
    EXPECT_EQ(request.timeout.count(), 4200);
    EXPECT_EQ(request.userAgent, "ThinkaraTest/1.0");
    EXPECT_TRUE(request.followRedirects);

    bool hasAccept = false;
    bool hasNoCache = false;
    for (const auto& header : request.headers) {
        if (header.rfind("Accept: text/html", 0) == 0) hasAccept = true;
        if (header == "Cache-Control: no-cache") hasNoCache = true;
    }
    EXPECT_TRUE(hasAccept);
    EXPECT_TRUE(hasNoCache);
}

TEST_F(HtmlFetcherTest, CustomStrategiesRunInOrder) {
    FetchStrategy mirror;
    mirror.label = "mirror";
    mirror.buildRequestUrl = [](const std::string& target) { return "https://mirror.local/?" + target; };

    auto transport = makeTransport([](const HttpRequest& r) {
        if (r.url.rfind("https://mirror.local/", 0) == 0) return okResponse(kHtml);
        return statusResponse(404);
    });
    HtmlFetcher fetcher(config, {FetchStrategy::direct(), mirror}, transport);

    auto report = fetcher.fetch(kTarget);
    EXPECT_EQ(report.succeededWith(), "mirror");
    EXPECT_EQ(transport->requests().size(), 2u);
}

TEST_F(HtmlFetcherTest, DefaultStrategiesFollowConfig) {
    config.proxies = {{"only", "https://only.local/?u="}};
    auto transport = makeTransport([](const HttpRequest&) { return okResponse(kHtml); });
    HtmlFetcher fetcher(config, transport);

    ASSERT_EQ(fetcher.strategies().size(), 2u);
    EXPECT_EQ(fetcher.strategies()[0].label, "direct");
    EXPECT_EQ(fetcher.strategies()[1].label, "only");
}

// ═══════════════════════════════════════════════════════════
// CurlHttpTransport
// ═══════════════════════════════════════════════════════════

TEST(CurlHttpTransportTest, ConcurrentRequestsDoNotWaitForEachOther) {
    SilentServer server;
    auto transport = std::make_shared<CurlHttpTransport>();

    HttpRequest request;
    request.timeout = std::chrono::milliseconds(1000);

    HttpResponse first;
    HttpResponse second;
    auto started = std::chrono::steady_clock::now();

    std::thread a([&] {
        HttpRequest r = request;
        r.url = server.url("/a");
        first = transport->get(r, nullptr);
    });
    std::thread b([&] {
        HttpRequest r = request;
        r.url = server.url("/b");
        second = transport->get(r, nullptr);
    });
    a.join();
    b.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    EXPECT_EQ(first.errorType, TransportError::Timeout);
    EXPECT_EQ(second.errorType, TransportError::Timeout);
    // Последовательно было бы не меньше 2000 мс
    EXPECT_LT(elapsed.count(), 1800);
}

TEST(CurlHttpTransportTest, SharedFetcherServesParallelInvocations) {
    SilentServer server;
    FetchConfig config;
    config.timeoutMs = 1000;
    config.proxies.clear();
    HtmlFetcher fetcher(config);

    std::atomic<int> timedOut{0};
    auto run = [&](const std::string& path) {
        try {
            fetcher.fetchHtml(server.url(path));
        } catch (const FetchError& e) {
            if (e.failure() == FetchFailure::TimedOut) {
                ++timedOut;
            }
        }
    };

    auto started = std::chrono::steady_clock::now();
    std::thread a(run, "/one");
    std::thread b(run, "/two");
    a.join();
    b.join();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    EXPECT_EQ(timedOut.load(), 2);
    EXPECT_LT(elapsed.count(), 1800);
}
