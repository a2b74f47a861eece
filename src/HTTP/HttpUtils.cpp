//
// Request parsing and response helpers shared by the routes
//

#include "HttpUtils.h"
#include <iomanip>
#include <iostream>
#include <sstream>

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string {
    auto headerItem = headers.find(header);
    if (headerItem != headers.end()) {
        return headerItem->second;
    }

    // Return an empty string
    return {};
}

auto getQueryParamAsInt(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what, uint64_t _default) -> uint64_t {
    auto ptr = query_fields.find(what);
    if (ptr == query_fields.end()) {
        return _default;
    }

    try {
        std::size_t consumed = 0;
        auto result = std::stoull(ptr->second, &consumed);
        if (consumed != ptr->second.size()) {
            throw eBadRequest("Parameter '" + what + "' is not an integer");
        }
        return result;
    } catch (const std::invalid_argument &) {
        throw eBadRequest("Parameter '" + what + "' is not an integer");
    } catch (const std::out_of_range &) {
        throw eBadRequest("Parameter '" + what + "' is out of range");
    }
}

auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> std::string {
    auto ptr = query_fields.find(what);
    std::string result;
    if (ptr != query_fields.end()) {
        result = ptr->second;
    }
    return result;
}

auto getQueryParamAsBool(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what, bool _default) -> bool {
    auto ptr = query_fields.find(what);
    if (ptr == query_fields.end()) {
        return _default;
    }

    if (ptr->second == "true" || ptr->second == "1") {
        return true;
    }

    if (ptr->second == "false" || ptr->second == "0") {
        return false;
    }

    throw eBadRequest("Parameter '" + what + "' must be true or false");
}

auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> bool {
    auto ptr = query_fields.find(what);
    return ptr != query_fields.end();
}

auto requireQueryParam(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> std::string {
    auto value = getQueryParamAsString(query_fields, what);
    if (value.empty()) {
        throw eBadRequest("Parameter '" + what + "' is required");
    }
    return value;
}

auto descriptorToJson(const sPathDescriptor &descriptor) -> nlohmann::json {
    return {
            {"hdfs_path", descriptor.path},
            {"type", pathKindToString(descriptor.kind)},
            {"file_size", descriptor.sizeBytes},
            {"block_size", descriptor.blockSizeBytes},
            {"replication", descriptor.replicationFactor},
            {"owner", descriptor.owner},
            {"group", descriptor.group},
            {"permission", descriptor.permission},
            {"modification_time", descriptor.modificationTime}
    };
}

auto statusCodeForError(const eHdfsError &error) -> SimpleWeb::StatusCode {
    switch (error.kind()) {
        case eHdfsErrorKind::NOT_FOUND:
            return SimpleWeb::StatusCode::client_error_not_found;
        case eHdfsErrorKind::CONFLICT:
            return SimpleWeb::StatusCode::client_error_conflict;
        case eHdfsErrorKind::UNAUTHORIZED:
            // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
            return error.httpStatus() == 401
                   ? SimpleWeb::StatusCode::client_error_unauthorized
                   : SimpleWeb::StatusCode::client_error_forbidden;
        default:
            return SimpleWeb::StatusCode::server_error_internal_server_error;
    }
}

auto errorCodeForError(const eHdfsError &error) -> std::string {
    switch (error.kind()) {
        case eHdfsErrorKind::NOT_FOUND:
            return "HDFS_PATH_NOT_FOUND";
        case eHdfsErrorKind::CONFLICT:
            return "HDFS_PATH_EXISTS";
        case eHdfsErrorKind::UNAUTHORIZED:
            return "HDFS_UNAUTHORIZED";
        default:
            return "HDFS_OPERATION_FAILED";
    }
}

void writeJson(const std::shared_ptr<HttpServerImpl::Response> &response, SimpleWeb::StatusCode status,
               const nlohmann::json &body) {
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", "application/json");

    response->write(status, body.dump(), headers);
}

void writeError(const std::shared_ptr<HttpServerImpl::Response> &response, SimpleWeb::StatusCode status,
                const std::string &errorCode, const std::string &detail) {
    writeJson(response, status, {
            {"success", false},
            {"error_code", errorCode},
            {"detail", detail}
    });
}

void writeHdfsError(const std::shared_ptr<HttpServerImpl::Response> &response, const eHdfsError &error) {
    writeJson(response, statusCodeForError(error), {
            {"success", false},
            {"error_code", errorCodeForError(error)},
            {"kind", errorKindToString(error.kind())},
            {"detail", error.message()}
    });
}

void logAccess(const std::shared_ptr<HttpServerImpl::Request> &request, SimpleWeb::StatusCode status,
               std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);

    auto address = request->remote_endpoint().address().to_string();

    std::stringstream line;
    line << "API: " << request->method << " " << request->path << " " << static_cast<int>(status) << " " << address
         << " " << std::fixed << std::setprecision(2) << elapsed.count() << "ms";
    std::cout << line.str() << std::endl;
}
