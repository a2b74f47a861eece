//
// Runs the gateway against the fake WebHDFS backend
//

#ifndef BIGDATA_GATEWAY_HTTPSERVERFIXTURE_H
#define BIGDATA_GATEWAY_HTTPSERVERFIXTURE_H

#include <boost/test/unit_test.hpp>
#include <jwt/jwt.hpp>

#include "../../Application.h"
#include "../../HTTP/ApiKeyValidator.h"
#include "../../Lib/GeneralUtils.h"
#include "../../Settings.h"
#include "../utils.h"
#include "WebHdfsFixture.h"

// The gateway, started against the fake WebHDFS backend
struct HttpServerFixture : public WebHdfsFixture
{
    const std::string sAccess = R"(
    [
        {
            "name": "reader",
            "secret": "super_secret1",
            "permissions": ["read"]
        },
        {
            "name": "writer",
            "secret": "super_secret2",
            "permissions": ["read", "write"]
        },
        {
            "name": "nobody",
            "secret": "super_secret3",
            "permissions": []
        }
    ]
    )";

    std::shared_ptr<Application> application;
    std::shared_ptr<HttpServer> httpServer;

    std::string readKey;
    std::string writeKey;
    std::string noPermissionKey;

    HttpServerFixture()
    {
        // Set up the test server
        setenv(ACCESS_SECRET_ENV_VARIABLE, base64Encode(sAccess).c_str(), 1);  // NOLINT(concurrency-mt-unsafe)

        application = createApplication(makeConfig(), std::make_shared<ApiKeyValidator>());
        httpServer  = application->getHttpServer();

        readKey         = makeApiKey("super_secret1");
        writeKey        = makeApiKey("super_secret2");
        noPermissionKey = makeApiKey("super_secret3");

        // Start the http server
        application->start();

        // Wait for the http server
        BOOST_CHECK_EQUAL(acceptingConnections(HTTP_PORT), true);
    }

    ~HttpServerFixture()
    {
        // Finished with the server
        application->shutdown();
    }

    HttpServerFixture(HttpServerFixture const&)                    = delete;
    auto operator=(HttpServerFixture const&) -> HttpServerFixture& = delete;
    HttpServerFixture(HttpServerFixture&&)                         = delete;
    auto operator=(HttpServerFixture&&) -> HttpServerFixture&      = delete;

    static auto makeApiKey(const std::string& secret, std::chrono::seconds lifetime = std::chrono::minutes{10})
        -> std::string
    {
        auto timeNow = std::chrono::system_clock::now() + lifetime;
        jwt::jwt_object jwtToken{
            jwt::params::algorithm("HS256"), jwt::params::payload({{"userName", "User"}}), jwt::params::secret(secret)};
        jwtToken.add_claim("exp", timeNow);

        return jwtToken.signature();
    }
};

#endif  // BIGDATA_GATEWAY_HTTPSERVERFIXTURE_H
