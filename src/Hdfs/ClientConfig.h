//
// Connection settings for one WebHDFS client, fixed at construction
//

#ifndef BIGDATA_GATEWAY_CLIENTCONFIG_H
#define BIGDATA_GATEWAY_CLIENTCONFIG_H

#include <chrono>
#include <cstdint>
#include <string>

struct sHdfsClientConfig {
    // baseUrl is the REST root of the name node, eg http://namenode:9870/webhdfs/v1
    sHdfsClientConfig(const std::string &baseUrl, std::string identityUser, std::chrono::seconds requestTimeout);

    static auto fromEnvironment() -> sHdfsClientConfig;

    [[nodiscard]] auto getBaseUrl() const -> const std::string & { return baseUrl; }

    [[nodiscard]] auto getIdentityUser() const -> const std::string & { return identityUser; }

    [[nodiscard]] auto getRequestTimeout() const -> std::chrono::seconds { return requestTimeout; }

    [[nodiscard]] auto getScheme() const -> const std::string & { return scheme; }

    [[nodiscard]] auto getHost() const -> const std::string & { return host; }

    [[nodiscard]] auto getPort() const -> uint16_t { return port; }

    // Path of the REST root without a trailing separator
    [[nodiscard]] auto getPathPrefix() const -> const std::string & { return pathPrefix; }

private:
    std::string baseUrl;
    std::string identityUser;
    std::chrono::seconds requestTimeout;

    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string pathPrefix;
};

auto defaultPortForScheme(const std::string &scheme) -> uint16_t;

#endif //BIGDATA_GATEWAY_CLIENTCONFIG_H
