//
// API key checks for the gateway. Keys are HS256 JWTs signed by one of the configured issuers.
//

#ifndef BIGDATA_GATEWAY_APIKEYVALIDATOR_H
#define BIGDATA_GATEWAY_APIKEYVALIDATOR_H

#include "../Lib/GeneralUtils.h"
#include <chrono>
#include <exception>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// No API key was presented
class eNotAuthorized : public std::exception {
public:
    [[nodiscard]] auto what() const noexcept -> const char * override { return "Missing API key"; }
};

// The API key was not valid, or does not grant what was asked for
class eForbidden : public std::exception {
public:
    explicit eForbidden(std::string reason) : reason(std::move(reason)) {}

    [[nodiscard]] auto what() const noexcept -> const char * override { return reason.c_str(); }

private:
    std::string reason;
};

struct sApiKeyIssuer {
public:
    explicit sApiKeyIssuer(nlohmann::json jIssuer) {
        name_ = jIssuer["name"];
        secret_ = jIssuer["secret"];

        if (jIssuer.contains("permissions")) {
            for (const auto &permission : jIssuer["permissions"]) {
                permissions_.push_back(permission);
            }
        }
    }

    // The name of this issuer
    auto name() const -> const auto & { return name_; }

    // The HS256 secret keys from this issuer are signed with
    auto secret() const -> const auto & { return secret_; }

    // What keys from this issuer may do, "read" and/or "write"
    auto permissions() const -> const auto & { return permissions_; }

private:
    std::string name_;
    std::string secret_;
    std::vector<std::string> permissions_;
};

struct sApiKeyInfo {
    std::string issuer;
    nlohmann::json payload;
    std::vector<std::string> permissions;
    std::chrono::system_clock::time_point cacheExpiry;

    [[nodiscard]] auto hasPermission(const std::string &permission) const -> bool;
};

class IApiKeyValidator {
public:
    virtual ~IApiKeyValidator() = default;

    // Throws eForbidden if the key is not valid
    virtual auto validate(const std::string &apiKey) -> std::shared_ptr<const sApiKeyInfo> = 0;
};

class ApiKeyValidator : public IApiKeyValidator {
public:
    // Reads the issuers from the ACCESS_SECRET_CONFIG environment variable (base64 encoded JSON). A value that is
    // not base64 throws std::invalid_argument, one that is not JSON throws nlohmann::json::parse_error.
    ApiKeyValidator();
    explicit ApiKeyValidator(std::vector<sApiKeyIssuer> issuers);

    auto validate(const std::string &apiKey) -> std::shared_ptr<const sApiKeyInfo> override;

private:
    std::vector<sApiKeyIssuer> vIssuers;
    folly::ConcurrentHashMap<std::string, std::shared_ptr<const sApiKeyInfo>> validatedKeys;

    auto decode(const std::string &apiKey) -> std::shared_ptr<const sApiKeyInfo>;

    // Drops every cached key past its expiry, including keys that are never presented again
    void sweepExpiredKeys();

// Testing
EXPOSE_PROPERTY_FOR_TESTING(vIssuers);
EXPOSE_PROPERTY_FOR_TESTING_READONLY(validatedKeys);
};

#endif //BIGDATA_GATEWAY_APIKEYVALIDATOR_H
