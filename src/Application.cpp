//
// Application wiring: the HDFS client, the API key validator and the HTTP server
//

#include "Application.h"
#include <iostream>

Application::Application(const sHdfsClientConfig &config, std::shared_ptr<IApiKeyValidator> apiKeyValidator)
        : hdfsClient(std::make_shared<HdfsClient>(config)),
          apiKeyValidator(std::move(apiKeyValidator)) {
    httpServer = std::make_shared<HttpServer>(this->apiKeyValidator, hdfsClient);
}

Application::~Application() {
    shutdown();
}

void Application::run() {
    start();
    httpServer->join();
}

void Application::start() {
    std::cout << "Application starting, HDFS at " << hdfsClient->getConfig().getBaseUrl()
              << " as " << hdfsClient->getConfig().getIdentityUser() << std::endl;

    running = true;
    httpServer->start();
}

void Application::shutdown() {
    if (!running.exchange(false)) {
        return;
    }

    std::cout << "Application shutting down..." << std::endl;

    httpServer->stop();
    hdfsClient->shutdown();
}

auto createApplication() -> std::shared_ptr<Application> {
    return createApplication(sHdfsClientConfig::fromEnvironment(), std::make_shared<ApiKeyValidator>());
}

auto createApplication(const sHdfsClientConfig &config, std::shared_ptr<IApiKeyValidator> apiKeyValidator) -> std::shared_ptr<Application> {
    return std::make_shared<Application>(config, std::move(apiKeyValidator));
}
