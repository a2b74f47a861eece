//
// Converts WebHDFS FileStatus payloads into path descriptors
//

#ifndef BIGDATA_GATEWAY_STATUSPARSER_H
#define BIGDATA_GATEWAY_STATUSPARSER_H

#include "HdfsTypes.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Parse a single FileStatus object. The descriptor's path is parentPath joined with the entry's pathSuffix.
auto parseFileStatus(const nlohmann::json &status, const std::string &parentPath) -> sPathDescriptor;

// Parse a GETFILESTATUS body, {"FileStatus": {...}}
auto parseFileStatusResponse(const nlohmann::json &body, const std::string &path) -> sPathDescriptor;

// Parse a LISTSTATUS body, {"FileStatuses": {"FileStatus": [...]}}, preserving backend order
auto parseListingResponse(const nlohmann::json &body, const std::string &parentPath) -> std::vector<sPathDescriptor>;

// Listing a file yields the file itself as the only entry, with an empty pathSuffix
auto isListingOfFile(const nlohmann::json &body) -> bool;

// Removes duplicate and trailing separators. The root stays "/".
auto normalisePath(const std::string &path) -> std::string;

// Joins a child suffix onto a parent path without ever producing "//"
auto joinPath(const std::string &parent, const std::string &suffix) -> std::string;

#endif //BIGDATA_GATEWAY_STATUSPARSER_H
