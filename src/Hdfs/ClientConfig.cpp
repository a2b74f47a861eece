//
// Connection settings for one WebHDFS client, fixed at construction
//

#include "ClientConfig.h"
#include "../Settings.h"
#include <folly/Uri.h>
#include <stdexcept>
#include <utility>

auto defaultPortForScheme(const std::string &scheme) -> uint16_t {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    return scheme == "https" ? 443 : 80;
}

sHdfsClientConfig::sHdfsClientConfig(const std::string &baseUrl, std::string identityUser,
                                     std::chrono::seconds requestTimeout)
        : baseUrl(baseUrl), identityUser(std::move(identityUser)), requestTimeout(requestTimeout) {
    try {
        folly::Uri uri(baseUrl);
        scheme = uri.scheme();
        host = uri.host();
        port = uri.port() != 0 ? uri.port() : defaultPortForScheme(scheme);
        pathPrefix = uri.path();
    } catch (const std::exception &e) {
        throw std::invalid_argument("Invalid WebHDFS base url " + baseUrl + ": " + e.what());
    }

    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("Unsupported WebHDFS url scheme '" + scheme + "'");
    }

    if (host.empty()) {
        throw std::invalid_argument("WebHDFS base url " + baseUrl + " does not name a host");
    }

    while (!pathPrefix.empty() && pathPrefix.back() == '/') {
        pathPrefix.pop_back();
    }

    if (this->identityUser.empty()) {
        throw std::invalid_argument("A WebHDFS identity user is required");
    }
}

auto sHdfsClientConfig::fromEnvironment() -> sHdfsClientConfig {
    return {
            HDFS_SCHEME + "://" + HDFS_NAMENODE_HOST + ":" + std::to_string(HDFS_WEB_PORT) + WEBHDFS_PATH_PREFIX,
            HDFS_USER,
            std::chrono::seconds(HDFS_REQUEST_TIMEOUT_SECONDS)
    };
}
