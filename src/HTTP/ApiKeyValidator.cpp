//
// API key checks for the gateway. Keys are HS256 JWTs signed by one of the configured issuers.
//

#include "ApiKeyValidator.h"
#include "../Settings.h"
#include <algorithm>
#include <jwt/jwt.hpp>
#include <utility>
#include <vector>

auto sApiKeyInfo::hasPermission(const std::string &permission) const -> bool {
    return std::find(permissions.begin(), permissions.end(), permission) != permissions.end();
}

ApiKeyValidator::ApiKeyValidator() {
    // Ready the issuer config from the environment
    auto jIssuerConfig = nlohmann::json::parse(
            base64Decode(
                    GET_ENV(
                            ACCESS_SECRET_ENV_VARIABLE,
                            base64Encode("[]")
                    )
            )
    );

    // Parse the issuer json config
    for (const auto &issuer : jIssuerConfig) {
        vIssuers.emplace_back(issuer);
    }
}

ApiKeyValidator::ApiKeyValidator(std::vector<sApiKeyIssuer> issuers) : vIssuers(std::move(issuers)) {}

auto ApiKeyValidator::validate(const std::string &apiKey) -> std::shared_ptr<const sApiKeyInfo> {
    auto cached = validatedKeys.find(apiKey);
    if (cached != validatedKeys.cend()) {
        if (cached->second->cacheExpiry > std::chrono::system_clock::now()) {
            return cached->second;
        }

        validatedKeys.erase(apiKey);
    }

    auto info = decode(apiKey);

    sweepExpiredKeys();
    validatedKeys.insert_or_assign(apiKey, info);
    return info;
}

void ApiKeyValidator::sweepExpiredKeys() {
    auto now = std::chrono::system_clock::now();

    std::vector<std::string> expired;
    for (const auto &item : validatedKeys) {
        if (item.second->cacheExpiry <= now) {
            expired.push_back(item.first);
        }
    }

    for (const auto &apiKey : expired) {
        validatedKeys.erase(apiKey);
    }
}

auto ApiKeyValidator::decode(const std::string &apiKey) -> std::shared_ptr<const sApiKeyInfo> {
    // Try to decode the key with each issuer's secret. The first one that verifies without setting an error_code
    // issued the key.
    for (const auto &issuer : vIssuers) {
        std::error_code errorCode;
        jwt::jwt_object decodedToken;
        try {
            decodedToken = jwt::decode(
                    apiKey,
                    jwt::params::algorithms({"HS256"}),
                    errorCode,
                    jwt::params::secret(issuer.secret()),
                    jwt::params::verify(true)
            );
        } catch (const std::exception &) {
            // Keys that are not even well formed JWTs make the decoder throw rather than set errorCode
            continue;
        }

        if (errorCode) {
            continue;
        }

        auto info = std::make_shared<sApiKeyInfo>();
        info->issuer = issuer.name();
        info->payload = decodedToken.payload().create_json_obj();
        info->permissions = issuer.permissions();

        // Never trust a cached key beyond its own expiry
        info->cacheExpiry = std::chrono::system_clock::now() + std::chrono::seconds(API_KEY_CACHE_SECONDS);
        if (info->payload.contains("exp") && info->payload["exp"].is_number_integer()) {
            auto expiry = std::chrono::system_clock::time_point(std::chrono::seconds(info->payload["exp"].get<int64_t>()));
            info->cacheExpiry = std::min(info->cacheExpiry, expiry);
        }

        return info;
    }

    throw eForbidden("Invalid API key");
}
