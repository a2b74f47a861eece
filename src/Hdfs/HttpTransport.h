//
// Pooled asynchronous HTTP(S) client shared by every WebHDFS operation
//

#ifndef BIGDATA_GATEWAY_HTTPTRANSPORT_H
#define BIGDATA_GATEWAY_HTTPTRANSPORT_H

#include "../Lib/GeneralUtils.h"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <chrono>
#include <client_http.hpp>
#include <client_https.hpp>
#include <exception>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using HttpClientImpl = SimpleWeb::Client<SimpleWeb::HTTP>;
using HttpsClientImpl = SimpleWeb::Client<SimpleWeb::HTTPS>;

// Where a request goes. pathAndQuery is sent verbatim as the request target.
struct sHttpTarget {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string pathAndQuery;

    [[nodiscard]] auto hostPort() const -> std::string { return host + ":" + std::to_string(port); }
};

// Parse an absolute http(s) url, throws std::invalid_argument if it can't be used as a target
auto parseHttpTarget(const std::string &url) -> sHttpTarget;

struct sHttpResult {
    // Set when no complete response was received (refused, timed out, reset, resolve failure)
    SimpleWeb::error_code errorCode;
    int statusCode = 0;
    SimpleWeb::CaseInsensitiveMultimap header;
    // The full body, unless it was handed to a chunk sink
    std::string content;
    // Set if the chunk sink threw, the remaining body was discarded
    std::exception_ptr sinkError;
    // Set when the stop token fired before the response completed, nothing else in the result is meaningful
    bool bCancelled = false;

    [[nodiscard]] auto isSuccess() const -> bool { return statusCode >= 200 && statusCode < 300; }

    [[nodiscard]] auto isRedirect() const -> bool;

    [[nodiscard]] auto getHeader(const std::string &name) const -> std::string;
};

// Receives the body of a 2xx response piece by piece, in order
using ChunkSink = std::function<void(const std::string &chunk)>;
using HttpCallback = std::function<void(const sHttpResult &result)>;

class HttpTransport {
public:
    HttpTransport(std::chrono::seconds timeout, uint32_t ioThreadCount, bool verifyCertificates = true);
    ~HttpTransport();
    HttpTransport(HttpTransport const&) = delete;
    auto operator =(HttpTransport const&) -> HttpTransport& = delete;
    HttpTransport(HttpTransport&&) = delete;
    auto operator=(HttpTransport&&) -> HttpTransport& = delete;

    // Issue one request. The callback runs exactly once, on an I/O thread, or on the thread requesting a stop when
    // the stop token fires first. When a sink is provided, a 2xx body is streamed to it instead of being collected
    // in sHttpResult::content. The content is copied into the request before this returns.
    void request(const sHttpTarget &target, const std::string &method, SimpleWeb::string_view content,
                 SimpleWeb::CaseInsensitiveMultimap header, ChunkSink sink, const std::stop_token &stopToken,
                 HttpCallback callback);

    // Aborts every open connection and waits for the I/O threads. Requests still in flight complete with an
    // error code, later requests fail immediately.
    void shutdown();

    [[nodiscard]] auto isRunning() const -> bool { return bRunning; }

private:
    std::chrono::seconds timeout;
    bool verifyCertificates;
    std::atomic<bool> bRunning = true;
    // Held shared while a request is handed to a client, so shutdown never misses a connection
    std::shared_mutex lifecycleMutex;

    std::shared_ptr<SimpleWeb::io_context> ioContext;
    std::unique_ptr<boost::asio::executor_work_guard<SimpleWeb::io_context::executor_type>> workGuard;
    std::vector<std::thread> ioThreads;

    // One client, and therefore one connection pool, per name node or data node
    folly::ConcurrentHashMap<std::string, std::shared_ptr<HttpClientImpl>> httpClients;
    folly::ConcurrentHashMap<std::string, std::shared_ptr<HttpsClientImpl>> httpsClients;

    auto getHttpClient(const sHttpTarget &target) -> std::shared_ptr<HttpClientImpl>;
    auto getHttpsClient(const sHttpTarget &target) -> std::shared_ptr<HttpsClientImpl>;

    template<class ClientT>
    void configureClient(ClientT &client);

    template<class ClientT>
    void dispatch(const std::shared_ptr<ClientT> &client, const sHttpTarget &target, const std::string &method,
                  SimpleWeb::string_view content, SimpleWeb::CaseInsensitiveMultimap header, ChunkSink sink,
                  const std::stop_token &stopToken, HttpCallback callback);

// Testing
    EXPOSE_PROPERTY_FOR_TESTING_READONLY(httpClients);
};

#endif //BIGDATA_GATEWAY_HTTPTRANSPORT_H
