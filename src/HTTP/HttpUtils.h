//
// Request parsing and response helpers shared by the routes
//

#ifndef BIGDATA_GATEWAY_HTTPUTILS_H
#define BIGDATA_GATEWAY_HTTPUTILS_H

#include "../Hdfs/HdfsError.h"
#include "../Hdfs/HdfsTypes.h"
#include "HttpServer.h"
#include <chrono>

auto getHeader(const SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string;
auto getQueryParamAsInt(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what, uint64_t _default) -> uint64_t;
auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string;
auto getQueryParamAsBool(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what, bool _default) -> bool;
auto hasQueryParam(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> bool;

// Thrown while reading request parameters, reported to the client as 400
class eBadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

auto requireQueryParam(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string;

auto descriptorToJson(const sPathDescriptor &descriptor) -> nlohmann::json;

// Maps a classified backend error to the status the gateway answers with
auto statusCodeForError(const eHdfsError &error) -> SimpleWeb::StatusCode;
auto errorCodeForError(const eHdfsError &error) -> std::string;

void writeJson(const std::shared_ptr<HttpServerImpl::Response> &response, SimpleWeb::StatusCode status,
               const nlohmann::json &body);
void writeError(const std::shared_ptr<HttpServerImpl::Response> &response, SimpleWeb::StatusCode status,
                const std::string &errorCode, const std::string &detail);
void writeHdfsError(const std::shared_ptr<HttpServerImpl::Response> &response, const eHdfsError &error);

void logAccess(const std::shared_ptr<HttpServerImpl::Request> &request, SimpleWeb::StatusCode status,
               std::chrono::steady_clock::time_point start);

#endif //BIGDATA_GATEWAY_HTTPUTILS_H
