//
// Plain data exchanged between the WebHDFS client layers
//

#include "HdfsTypes.h"
#include <utility>

auto pathKindToString(ePathKind kind) -> std::string {
    return kind == ePathKind::DIRECTORY ? "DIRECTORY" : "FILE";
}

auto sBackendResponse::fromRaw(int statusCode, std::string rawText) -> sBackendResponse {
    sBackendResponse result;
    result.statusCode = statusCode;

    auto parsed = nlohmann::json::parse(rawText, nullptr, false);
    if (!parsed.is_discarded()) {
        result.structuredBody = std::move(parsed);
    }

    result.rawText = std::move(rawText);
    return result;
}
