//
// Pooled asynchronous HTTP(S) client shared by every WebHDFS operation
//

#include "HttpTransport.h"
#include "../Settings.h"
#include "ClientConfig.h"
#include <boost/asio/error.hpp>
#include <folly/Uri.h>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace {
    struct sRequestState {
        // Serialises the response handler against a stop request arriving on another thread
        std::mutex mutex;
        sHttpResult result;
        bool bHeadersSeen = false;
        bool bFinished = false;
        ChunkSink sink;
        HttpCallback callback;
        std::unique_ptr<std::stop_callback<std::function<void()>>> stopCallback;
    };

    auto shutDownResult() -> sHttpResult {
        sHttpResult result;
        result.errorCode = boost::asio::error::make_error_code(boost::asio::error::shut_down);
        return result;
    }

    auto parseStatusCode(const std::string &statusLine) -> int {
        try {
            return std::stoi(statusLine);
        } catch (const std::invalid_argument &) {
            return 0;
        } catch (const std::out_of_range &) {
            return 0;
        }
    }
}

auto parseHttpTarget(const std::string &url) -> sHttpTarget {
    folly::Uri uri(url);

    sHttpTarget target;
    target.scheme = uri.scheme();
    target.host = uri.host();
    target.port = uri.port() != 0 ? uri.port() : defaultPortForScheme(target.scheme);

    if (target.scheme != "http" && target.scheme != "https") {
        throw std::invalid_argument("unsupported scheme '" + target.scheme + "' in " + url);
    }

    if (target.host.empty()) {
        throw std::invalid_argument("no host in " + url);
    }

    target.pathAndQuery = uri.path().empty() ? "/" : uri.path();
    if (!uri.query().empty()) {
        target.pathAndQuery += "?" + uri.query();
    }

    return target;
}

auto sHttpResult::isRedirect() const -> bool {
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    return statusCode == 301 || statusCode == 302 || statusCode == 303 || statusCode == 307 || statusCode == 308;
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
}

auto sHttpResult::getHeader(const std::string &name) const -> std::string {
    auto item = header.find(name);
    if (item != header.end()) {
        return item->second;
    }
    return {};
}

HttpTransport::HttpTransport(std::chrono::seconds timeout, uint32_t ioThreadCount, bool verifyCertificates)
        : timeout(timeout), verifyCertificates(verifyCertificates) {
    ioContext = std::make_shared<SimpleWeb::io_context>();
    workGuard = std::make_unique<boost::asio::executor_work_guard<SimpleWeb::io_context::executor_type>>(
            boost::asio::make_work_guard(*ioContext)
    );

    for (uint32_t index = 0; index < ioThreadCount; index++) {
        ioThreads.emplace_back([this]() {
            // A throwing handler must not take the I/O thread down with it
            while (true) {
                try {
                    ioContext->run();
                    break;
                } catch (std::exception &e) {
                    dumpExceptions(e);
                }
            }
        });
    }
}

HttpTransport::~HttpTransport() {
    shutdown();
}

void HttpTransport::shutdown() {
    {
        std::unique_lock<std::shared_mutex> lock(lifecycleMutex);
        if (!bRunning.exchange(false)) {
            return;
        }
    }

    // Closing the connections makes every pending handler run with operation_aborted, so the io context has to
    // keep running until they are done
    for (const auto &client : httpClients) {
        client.second->stop();
    }

    for (const auto &client : httpsClients) {
        client.second->stop();
    }

    workGuard.reset();

    for (auto &thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    httpClients.clear();
    httpsClients.clear();
}

template<class ClientT>
void HttpTransport::configureClient(ClientT &client) {
    client.io_service = ioContext;
    client.config.timeout = static_cast<long>(timeout.count());
    client.config.timeout_connect = static_cast<long>(timeout.count());
    client.config.max_response_streambuf_size = READ_CHUNK_SIZE;
}

auto HttpTransport::getHttpClient(const sHttpTarget &target) -> std::shared_ptr<HttpClientImpl> {
    auto key = target.hostPort();

    auto existing = httpClients.find(key);
    if (existing != httpClients.cend()) {
        return existing->second;
    }

    auto client = std::make_shared<HttpClientImpl>(key);
    configureClient(*client);

    // If another thread raced us here, use whichever client made it into the pool
    return httpClients.insert(key, client).first->second;
}

auto HttpTransport::getHttpsClient(const sHttpTarget &target) -> std::shared_ptr<HttpsClientImpl> {
    auto key = target.hostPort();

    auto existing = httpsClients.find(key);
    if (existing != httpsClients.cend()) {
        return existing->second;
    }

    auto client = std::make_shared<HttpsClientImpl>(key, verifyCertificates);
    configureClient(*client);

    return httpsClients.insert(key, client).first->second;
}

void HttpTransport::request(const sHttpTarget &target, const std::string &method, SimpleWeb::string_view content,
                            SimpleWeb::CaseInsensitiveMultimap header, ChunkSink sink,
                            const std::stop_token &stopToken, HttpCallback callback) {
    if (!bRunning) {
        callback(shutDownResult());
        return;
    }

    if (target.scheme == "https") {
        dispatch(getHttpsClient(target), target, method, content, std::move(header), std::move(sink), stopToken,
                 std::move(callback));
    } else {
        dispatch(getHttpClient(target), target, method, content, std::move(header), std::move(sink), stopToken,
                 std::move(callback));
    }
}

template<class ClientT>
void HttpTransport::dispatch(const std::shared_ptr<ClientT> &client, const sHttpTarget &target,
                             const std::string &method, SimpleWeb::string_view content,
                             SimpleWeb::CaseInsensitiveMultimap header, ChunkSink sink,
                             const std::stop_token &stopToken, HttpCallback callback) {
    auto state = std::make_shared<sRequestState>();
    state->sink = std::move(sink);
    state->callback = std::move(callback);

    std::shared_lock<std::shared_mutex> lifecycleLock(lifecycleMutex);

    // Shutdown may have started since the caller checked
    if (!bRunning) {
        lifecycleLock.unlock();
        state->callback(shutDownResult());
        return;
    }

    client->request(
            method,
            target.pathAndQuery,
            content,
            header,
            [state](const std::shared_ptr<typename ClientT::Response> &response, const SimpleWeb::error_code &errorCode) {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->bFinished) {
                    return;
                }

                if (errorCode) {
                    state->bFinished = true;
                    state->result.errorCode = errorCode;
                    state->callback(state->result);
                    return;
                }

                if (!state->bHeadersSeen) {
                    state->bHeadersSeen = true;
                    state->result.statusCode = parseStatusCode(response->status_code);
                    state->result.header = response->header;
                }

                // Large bodies arrive over several calls, each holding the next piece of the content
                auto chunk = response->content.string();
                if (state->sink && state->result.isSuccess()) {
                    if (!state->result.sinkError && !chunk.empty()) {
                        try {
                            state->sink(chunk);
                        } catch (const std::exception &) {
                            state->result.sinkError = std::current_exception();
                        }
                    }
                } else {
                    state->result.content += chunk;
                }

                if (response->content.end) {
                    state->bFinished = true;
                    state->callback(state->result);
                }
            }
    );

    lifecycleLock.unlock();

    if (!stopToken.stop_possible()) {
        return;
    }

    // There is no way to abort a single request on a pooled client. A stop completes the caller straight away, and
    // whatever the backend sends later is dropped when it arrives or when the request times out.
    std::weak_ptr<sRequestState> weakState = state;
    state->stopCallback = std::make_unique<std::stop_callback<std::function<void()>>>(
            stopToken,
            [weakState]() {
                auto state = weakState.lock();
                if (!state) {
                    return;
                }

                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->bFinished) {
                    return;
                }

                state->bFinished = true;
                state->result.bCancelled = true;
                state->callback(state->result);
            }
    );
}
