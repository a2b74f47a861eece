//
// Application wiring: the HDFS client, the API key validator and the HTTP server
//

#ifndef BIGDATA_GATEWAY_APPLICATION_H
#define BIGDATA_GATEWAY_APPLICATION_H

#include "HTTP/ApiKeyValidator.h"
#include "HTTP/HttpServer.h"
#include "Hdfs/ClientConfig.h"
#include "Hdfs/HdfsClient.h"
#include "Lib/GeneralUtils.h"
#include <atomic>
#include <memory>

class Application {
public:
    Application(const sHdfsClientConfig &config, std::shared_ptr<IApiKeyValidator> apiKeyValidator);
    ~Application();
    Application(Application const&) = delete;
    auto operator =(Application const&) -> Application& = delete;
    Application(Application&&) = delete;
    auto operator=(Application&&) -> Application& = delete;

    // Starts the http server and blocks until it stops
    void run();

    // Starts the http server without blocking
    void start();

    // Stops the http server, then the HDFS client. Safe to call more than once.
    void shutdown();

    [[nodiscard]] auto isRunning() const -> bool { return running; }

    auto getHdfsClient() -> std::shared_ptr<HdfsClient> { return hdfsClient; }

    auto getHttpServer() -> std::shared_ptr<HttpServer> { return httpServer; }

private:
    std::atomic<bool> running = false;

    std::shared_ptr<HdfsClient> hdfsClient;
    std::shared_ptr<IApiKeyValidator> apiKeyValidator;
    std::shared_ptr<HttpServer> httpServer;
};

// Builds the application from the HDFS_* and ACCESS_SECRET_CONFIG environment variables
auto createApplication() -> std::shared_ptr<Application>;
auto createApplication(const sHdfsClientConfig &config, std::shared_ptr<IApiKeyValidator> apiKeyValidator) -> std::shared_ptr<Application>;

#endif //BIGDATA_GATEWAY_APPLICATION_H
