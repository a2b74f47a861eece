//
// HTTP server hosting the gateway routes
//

#include "../Settings.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <memory>

HttpServer::HttpServer(std::shared_ptr<IApiKeyValidator> apiKeyValidator, const std::shared_ptr<HdfsClient>& hdfsClient)
        : apiKeyValidator(std::move(apiKeyValidator)), apiKeyHeader(API_KEY_HEADER) {
    server.config.port = HTTP_PORT;
    server.config.address = "0.0.0.0";
    server.config.thread_pool_size = HTTP_WORKER_POOL_SIZE;
    server.config.timeout_content = HTTP_CONTENT_TIMEOUT_SECONDS;

    // Add the various API's
    HdfsApi("/hadoop/", this, hdfsClient);
    HealthApi("/health", this);

    // Anything else gets a json 404 rather than a dropped connection
    for (const auto *method : {"GET", "POST", "PUT", "DELETE"}) {
        server.default_resource[method] = [](const std::shared_ptr<HttpServerImpl::Response> &response,
                                             const std::shared_ptr<HttpServerImpl::Request> &request) {
            writeError(response, SimpleWeb::StatusCode::client_error_not_found, "NOT_FOUND",
                       "No route for " + request->method + " " + request->path);
            logAccess(request, SimpleWeb::StatusCode::client_error_not_found, std::chrono::steady_clock::now());
        };
    }
}

void HttpServer::start() {
    server_thread = std::thread([this]() {
        // Start server
        this->server.start();
    });

    std::cout << "API: Server listening on port " << server.config.port << std::endl << std::endl;
}

void HttpServer::join() {
    if (server_thread.joinable()) {
        server_thread.join();
    }
}

void HttpServer::stop() {
    server.stop();
    join();
}

auto HttpServer::isAuthorized(const SimpleWeb::CaseInsensitiveMultimap &headers, const std::string &permission) -> std::shared_ptr<const sApiKeyInfo> {
    // Get the API key header from the request
    auto sApiKey = getHeader(headers, apiKeyHeader);

    // Check if the header existed
    if (sApiKey.empty()) {
        // Not authorized
        throw eNotAuthorized();
    }

    // Throws eForbidden if no issuer signed this key
    auto keyInfo = apiKeyValidator->validate(sApiKey);

    if (!keyInfo->hasPermission(permission)) {
        throw eForbidden("API key issued by " + keyInfo->issuer + " does not grant " + permission + " access");
    }

    return keyInfo;
}
