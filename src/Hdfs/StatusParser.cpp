//
// Converts WebHDFS FileStatus payloads into path descriptors
//

#include "StatusParser.h"
#include "HdfsError.h"
#include <limits>

namespace {
    auto protocolError(const std::string &detail) -> eHdfsError {
        return {eHdfsErrorKind::PROTOCOL, "Malformed FileStatus: " + detail};
    }

    auto requireField(const nlohmann::json &object, const std::string &key) -> const nlohmann::json & {
        auto field = object.find(key);
        if (field == object.end()) {
            throw protocolError("missing field '" + key + "'");
        }
        return *field;
    }

    auto requireUnsigned(const nlohmann::json &object, const std::string &key) -> uint64_t {
        const auto &field = requireField(object, key);
        // Parsed non-negative integers are stored unsigned, and reading one above INT64_MAX as int64_t wraps negative
        auto nonNegative = field.is_number_unsigned() || (field.is_number_integer() && field.get<int64_t>() >= 0);
        if (!nonNegative) {
            throw protocolError("field '" + key + "' is not a non-negative integer");
        }
        return field.get<uint64_t>();
    }

    auto optionalString(const nlohmann::json &object, const std::string &key) -> std::string {
        auto field = object.find(key);
        if (field != object.end() && field->is_string()) {
            return field->get<std::string>();
        }
        return {};
    }

    auto parseKind(const nlohmann::json &status) -> ePathKind {
        const auto &type = requireField(status, "type");
        if (!type.is_string()) {
            throw protocolError("field 'type' is not a string");
        }

        auto sType = type.get<std::string>();
        if (sType == "DIRECTORY") {
            return ePathKind::DIRECTORY;
        }

        // Symlinks are reported as files, the namespace has no third kind
        if (sType == "FILE" || sType == "SYMLINK") {
            return ePathKind::FILE;
        }

        throw protocolError("unknown entry type '" + sType + "'");
    }
}

auto normalisePath(const std::string &path) -> std::string {
    std::string result;
    result.reserve(path.size() + 1);

    for (auto character : path) {
        if (character == '/' && !result.empty() && result.back() == '/') {
            continue;
        }
        result.push_back(character);
    }

    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }

    if (result.empty() || result.front() != '/') {
        result.insert(result.begin(), '/');
    }

    return result;
}

auto joinPath(const std::string &parent, const std::string &suffix) -> std::string {
    auto base = normalisePath(parent);

    auto start = suffix.find_first_not_of('/');
    if (start == std::string::npos) {
        return base;
    }

    if (base.back() != '/') {
        base.push_back('/');
    }

    return normalisePath(base + suffix.substr(start));
}

auto parseFileStatus(const nlohmann::json &status, const std::string &parentPath) -> sPathDescriptor {
    if (!status.is_object()) {
        throw protocolError("entry is not an object");
    }

    sPathDescriptor descriptor;
    descriptor.path = joinPath(parentPath, optionalString(status, "pathSuffix"));
    descriptor.kind = parseKind(status);

    // Length is only meaningful for files
    auto length = requireUnsigned(status, "length");
    descriptor.sizeBytes = descriptor.isDirectory() ? 0 : length;

    descriptor.blockSizeBytes = requireUnsigned(status, "blockSize");

    auto replication = requireUnsigned(status, "replication");
    if (replication > std::numeric_limits<uint16_t>::max()) {
        throw protocolError("replication " + std::to_string(replication) + " is out of range");
    }
    descriptor.replicationFactor = static_cast<uint16_t>(replication);

    descriptor.owner = optionalString(status, "owner");
    descriptor.group = optionalString(status, "group");
    descriptor.permission = optionalString(status, "permission");

    auto modificationTime = status.find("modificationTime");
    if (modificationTime != status.end() && modificationTime->is_number_unsigned()) {
        descriptor.modificationTime = modificationTime->get<uint64_t>();
    }

    return descriptor;
}

auto parseFileStatusResponse(const nlohmann::json &body, const std::string &path) -> sPathDescriptor {
    if (!body.is_object()) {
        throw protocolError("response is not an object");
    }

    return parseFileStatus(requireField(body, "FileStatus"), path);
}

auto parseListingResponse(const nlohmann::json &body, const std::string &parentPath) -> std::vector<sPathDescriptor> {
    if (!body.is_object()) {
        throw protocolError("response is not an object");
    }

    const auto &statuses = requireField(body, "FileStatuses");
    if (!statuses.is_object()) {
        throw protocolError("'FileStatuses' is not an object");
    }

    const auto &entries = requireField(statuses, "FileStatus");
    if (!entries.is_array()) {
        throw protocolError("'FileStatus' is not a list");
    }

    std::vector<sPathDescriptor> result;
    result.reserve(entries.size());
    for (const auto &entry : entries) {
        result.push_back(parseFileStatus(entry, parentPath));
    }

    return result;
}

auto isListingOfFile(const nlohmann::json &body) -> bool {
    if (!body.is_object() || !body.contains("FileStatuses")) {
        return false;
    }

    const auto &statuses = body["FileStatuses"];
    if (!statuses.is_object() || !statuses.contains("FileStatus") || !statuses["FileStatus"].is_array()) {
        return false;
    }

    const auto &entries = statuses["FileStatus"];
    if (entries.size() != 1 || !entries[0].is_object()) {
        return false;
    }

    const auto &entry = entries[0];
    return optionalString(entry, "pathSuffix").empty() && optionalString(entry, "type") != "DIRECTORY";
}
