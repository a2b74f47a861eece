//
// Plain data exchanged between the WebHDFS client layers
//

#ifndef BIGDATA_GATEWAY_HDFSTYPES_H
#define BIGDATA_GATEWAY_HDFSTYPES_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class ePathKind {
    FILE,
    DIRECTORY
};

auto pathKindToString(ePathKind kind) -> std::string;

// Normalised metadata for one remote path. sizeBytes is always 0 for directories.
struct sPathDescriptor {
    std::string path;
    ePathKind kind = ePathKind::FILE;
    uint64_t sizeBytes = 0;
    uint64_t blockSizeBytes = 0;
    uint16_t replicationFactor = 0;

    std::string owner;
    std::string group;
    std::string permission;
    uint64_t modificationTime = 0;

    [[nodiscard]] auto isDirectory() const -> bool { return kind == ePathKind::DIRECTORY; }
};

struct sWriteParams {
    bool overwrite = false;
    uint16_t replication = 0;
    uint64_t blockSize = 0;
    std::string permission;
    uint32_t bufferSize = 0;
};

// A backend response, reduced to what the error classifier and the status parser need. structuredBody is only set
// when rawText parsed as JSON.
struct sBackendResponse {
    int statusCode = 0;
    std::optional<nlohmann::json> structuredBody;
    std::string rawText;

    static auto fromRaw(int statusCode, std::string rawText) -> sBackendResponse;

    [[nodiscard]] auto isSuccess() const -> bool { return statusCode >= 200 && statusCode < 300; }
};

using ByteBuffer = std::vector<uint8_t>;

#endif //BIGDATA_GATEWAY_HDFSTYPES_H
