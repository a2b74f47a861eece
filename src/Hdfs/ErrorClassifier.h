//
// Maps WebHDFS responses onto the client error taxonomy
//

#ifndef BIGDATA_GATEWAY_ERRORCLASSIFIER_H
#define BIGDATA_GATEWAY_ERRORCLASSIFIER_H

#include "HdfsError.h"
#include "HdfsTypes.h"
#include <optional>
#include <string>

// Classify a response that carried a status the caller does not accept. Rules, first match wins:
//  404 -> NOT_FOUND, 409 -> CONFLICT, 401/403 -> UNAUTHORIZED,
//  JSON body with a RemoteException (or top level) message -> UNKNOWN carrying that message,
//  body that is not JSON -> PROTOCOL carrying the raw text,
//  anything else -> UNKNOWN
auto classifyResponse(const sBackendResponse &response) -> eHdfsError;
auto classifyResponse(int statusCode, const std::string &body) -> eHdfsError;

// A request that produced no response at all
auto classifyTransportFailure(const std::string &detail) -> eHdfsError;

// Pulls the backend's own error message out of a structured error body
auto extractRemoteMessage(const nlohmann::json &body) -> std::optional<std::string>;

#endif //BIGDATA_GATEWAY_ERRORCLASSIFIER_H
