//
// HTTP server hosting the gateway routes
//

#ifndef BIGDATA_GATEWAY_HTTPSERVER_H
#define BIGDATA_GATEWAY_HTTPSERVER_H

#include "../Lib/GeneralUtils.h"
#include "ApiKeyValidator.h"
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <server_http.hpp>
#include <thread>
#include <utility>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

// Forward declarations
class HdfsClient;

class HttpServer {
public:
    HttpServer(std::shared_ptr<IApiKeyValidator> apiKeyValidator, const std::shared_ptr<HdfsClient>& hdfsClient);

    void start();

    void join();

    void stop();

    auto getServer() -> HttpServerImpl & { return this->server; }

    // Throws eNotAuthorized when no key was sent, and eForbidden when the key is invalid or lacks permission
    auto isAuthorized(const SimpleWeb::CaseInsensitiveMultimap &headers, const std::string &permission) -> std::shared_ptr<const sApiKeyInfo>;

private:
    HttpServerImpl server;
    std::thread server_thread;
    std::shared_ptr<IApiKeyValidator> apiKeyValidator;
    std::string apiKeyHeader;

// Testing
EXPOSE_PROPERTY_FOR_TESTING(apiKeyValidator);
};

void HdfsApi(const std::string &path, HttpServer *server, const std::shared_ptr<HdfsClient>& hdfsClient);
void HealthApi(const std::string &path, HttpServer *server);


#endif //BIGDATA_GATEWAY_HTTPSERVER_H
