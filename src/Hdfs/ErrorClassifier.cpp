//
// Maps WebHDFS responses onto the client error taxonomy
//

#include "ErrorClassifier.h"

namespace {
    // NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    const int HTTP_UNAUTHORIZED = 401;
    const int HTTP_FORBIDDEN = 403;
    const int HTTP_NOT_FOUND = 404;
    const int HTTP_CONFLICT = 409;
    // NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

    auto messageOr(const sBackendResponse &response, const std::string &fallback) -> std::string {
        if (response.structuredBody) {
            if (auto message = extractRemoteMessage(*response.structuredBody)) {
                return *message;
            }
        }
        return fallback;
    }
}

auto extractRemoteMessage(const nlohmann::json &body) -> std::optional<std::string> {
    if (!body.is_object()) {
        return std::nullopt;
    }

    auto remote = body.find("RemoteException");
    if (remote != body.end() && remote->is_object()) {
        auto message = remote->find("message");
        if (message != remote->end() && message->is_string()) {
            return message->get<std::string>();
        }
    }

    // Some proxies in front of the name node report errors without the RemoteException wrapper
    auto message = body.find("message");
    if (message != body.end() && message->is_string()) {
        return message->get<std::string>();
    }

    return std::nullopt;
}

auto classifyResponse(const sBackendResponse &response) -> eHdfsError {
    const auto status = response.statusCode;

    if (status == HTTP_NOT_FOUND) {
        return {eHdfsErrorKind::NOT_FOUND, messageOr(response, "Requested path not found"), status};
    }

    if (status == HTTP_CONFLICT) {
        return {eHdfsErrorKind::CONFLICT, messageOr(response, "Path already exists"), status};
    }

    if (status == HTTP_UNAUTHORIZED || status == HTTP_FORBIDDEN) {
        return {eHdfsErrorKind::UNAUTHORIZED, messageOr(response, "Access to the path was denied"), status};
    }

    if (!response.structuredBody) {
        return {eHdfsErrorKind::PROTOCOL, response.rawText, status};
    }

    if (auto message = extractRemoteMessage(*response.structuredBody)) {
        return {eHdfsErrorKind::UNKNOWN, *message, status};
    }

    return {eHdfsErrorKind::UNKNOWN, "Unexpected HTTP status " + std::to_string(status), status};
}

auto classifyResponse(int statusCode, const std::string &body) -> eHdfsError {
    return classifyResponse(sBackendResponse::fromRaw(statusCode, body));
}

auto classifyTransportFailure(const std::string &detail) -> eHdfsError {
    return {eHdfsErrorKind::TRANSPORT, detail};
}
