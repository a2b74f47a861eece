//
// Gateway routes over the HDFS path operations
//

#include "../Hdfs/HdfsClient.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include "HttpServer.h"
#include "HttpUtils.h"
#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace {
using RouteHandler = std::function<SimpleWeb::StatusCode(
        const std::shared_ptr<HttpServerImpl::Response> &,
        const std::shared_ptr<HttpServerImpl::Request> &)>;

// Wraps a route with the API key check and the mapping from failures to error responses
auto authorizedRoute(HttpServer *server, const std::string &permission, RouteHandler handler) {
    return [server, permission, handler = std::move(handler)](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto start = std::chrono::steady_clock::now();
        auto status = SimpleWeb::StatusCode::success_ok;

        try {
            server->isAuthorized(request->header, permission);
            status = handler(response, request);
        } catch (const eNotAuthorized &e) {
            status = SimpleWeb::StatusCode::client_error_unauthorized;
            writeError(response, status, "UNAUTHORIZED", e.what());
        } catch (const eForbidden &e) {
            status = SimpleWeb::StatusCode::client_error_forbidden;
            writeError(response, status, "FORBIDDEN", e.what());
        } catch (const eBadRequest &e) {
            status = SimpleWeb::StatusCode::client_error_bad_request;
            writeError(response, status, "BAD_REQUEST", e.what());
        } catch (const eHdfsError &e) {
            std::cerr << "API: HDFS operation failed: " << e.what() << std::endl;

            status = statusCodeForError(e);
            writeHdfsError(response, e);
        } catch (const std::exception &e) {
            dumpExceptions(e);

            auto errorId = generateUUID();
            std::cerr << "API: Internal error " << errorId << " handling " << request->path << ": " << e.what()
                      << std::endl;

            status = SimpleWeb::StatusCode::server_error_internal_server_error;
            writeJson(response, status, {
                    {"success", false},
                    {"error_code", "INTERNAL_ERROR"},
                    {"error_id", errorId},
                    {"detail", "An unexpected error occurred"}
            });
        }

        logAccess(request, status, start);
    };
}

auto successMessage(const std::string &message) -> nlohmann::json {
    return {
            {"success", true},
            {"message", message}
    };
}

void sendAndWait(const std::shared_ptr<HttpServerImpl::Response> &response, const std::string &what) {
    std::promise<SimpleWeb::error_code> sendPromise;
    response->send([&sendPromise](const SimpleWeb::error_code &errorCode) {
        sendPromise.set_value(errorCode);
    });

    if (auto errorCode = sendPromise.get_future().get()) {
        throw std::runtime_error(
                "Error transmitting " + what + " to client. Perhaps client has disconnected? "
                + std::to_string(errorCode.value()) + " " + errorCode.message()
        );
    }
}

auto fileName(const std::string &path) -> std::string {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void HdfsApi(const std::string &path, HttpServer *server, const std::shared_ptr<HdfsClient>& hdfsClient) {
    // Post     upload      -> Write the request body to hdfs_path
    // Get      download    -> Stream hdfs_path back to the client
    // Delete   delete      -> Remove hdfs_path
    // Post     mkdir       -> Create hdfs_path and any missing parents
    // Post     rename      -> Move src to dst
    // Get      list        -> Children of hdfs_path
    // Get      status      -> Status of hdfs_path
    // Get      home        -> Home directory of the gateway's identity

    // Upload a file
    server->getServer().resource["^" + path + "upload$"]["POST"] = authorizedRoute(server, "write", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto query_fields = request->parse_query_string();

        auto hdfsPath = requireQueryParam(query_fields, "hdfs_path");
        auto overwrite = getQueryParamAsBool(query_fields, "overwrite", false);
        auto replication = getQueryParamAsInt(query_fields, "replication", DEFAULT_REPLICATION);
        auto blockSize = getQueryParamAsInt(query_fields, "blocksize", DEFAULT_BLOCK_SIZE);

        if (replication < 1 || replication > MAX_UPLOAD_REPLICATION) {
            throw eBadRequest("Parameter 'replication' must be between 1 and " + std::to_string(MAX_UPLOAD_REPLICATION));
        }

        if (blockSize == 0) {
            throw eBadRequest("Parameter 'blocksize' must be greater than zero");
        }

        // Read the raw body
        auto content = request->content.string();
        ByteBuffer bytes(content.begin(), content.end());

        auto descriptor = hdfsClient->upload(
                hdfsPath, std::move(bytes), overwrite, static_cast<uint16_t>(replication), blockSize
        ).get();

        std::cout << "API: Uploaded " << descriptor.path << " (" << descriptor.sizeBytes << " bytes)" << std::endl;

        auto result = descriptorToJson(descriptor);
        result["success"] = true;

        writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        return SimpleWeb::StatusCode::success_ok;
    });

    // Download a file
    server->getServer().resource["^" + path + "download$"]["GET"] = authorizedRoute(server, "read", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto query_fields = request->parse_query_string();

        auto hdfsPath = requireQueryParam(query_fields, "hdfs_path");

        // The status gives the Content-Length, and rejects directories before anything is sent
        auto descriptor = hdfsClient->status(hdfsPath).get();
        if (descriptor.isDirectory()) {
            throw eBadRequest(descriptor.path + " is a directory");
        }

        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", "application/octet-stream");
        headers.emplace("Content-Disposition", "attachment; filename=\"" + fileName(descriptor.path) + "\"");
        headers.emplace("Content-Length", std::to_string(descriptor.sizeBytes));

        // Write the headers
        response->write(headers);
        sendAndWait(response, "file transfer headers");

        // Past this point the status line has gone out, failures can only cut the transfer short. The file is read
        // in bounded segments pulled from this thread, with the next segment in flight while the last one is sent.
        std::stop_source transferStop;
        auto fileSize = descriptor.sizeBytes;
        auto nextSegment = [&](uint64_t offset) {
            return hdfsClient->downloadRange(
                    hdfsPath, offset, std::min(DOWNLOAD_SEGMENT_SIZE, fileSize - offset), transferStop.get_token()
            );
        };

        try {
            uint64_t offset = 0;
            std::future<ByteBuffer> pending;
            if (offset < fileSize) {
                pending = nextSegment(offset);
            }

            while (offset < fileSize) {
                auto segment = pending.get();
                if (segment.empty()) {
                    throw std::runtime_error(
                            "File ended at " + std::to_string(offset) + " bytes, expected " + std::to_string(fileSize)
                    );
                }

                offset += segment.size();
                if (offset < fileSize) {
                    pending = nextSegment(offset);
                }

                // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
                response->write(reinterpret_cast<const char *>(segment.data()), static_cast<std::streamsize>(segment.size()));
                sendAndWait(response, "file content");
            }
        } catch (const std::exception &e) {
            transferStop.request_stop();

            dumpExceptions(e);
            std::cerr << "API: Download of " << hdfsPath << " aborted: " << e.what() << std::endl;

            response->close_connection_after_response = true;
            return SimpleWeb::StatusCode::server_error_internal_server_error;
        }

        return SimpleWeb::StatusCode::success_ok;
    });

    // Delete a path
    server->getServer().resource["^" + path + "delete$"]["DELETE"] = authorizedRoute(server, "write", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto query_fields = request->parse_query_string();

        auto hdfsPath = requireQueryParam(query_fields, "hdfs_path");
        auto recursive = getQueryParamAsBool(query_fields, "recursive", false);

        hdfsClient->deletePath(hdfsPath, recursive).get();

        writeJson(response, SimpleWeb::StatusCode::success_ok, successMessage("Deleted " + hdfsPath));
        return SimpleWeb::StatusCode::success_ok;
    });

    // Create a directory
    server->getServer().resource["^" + path + "mkdir$"]["POST"] = authorizedRoute(server, "write", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto query_fields = request->parse_query_string();

        auto hdfsPath = requireQueryParam(query_fields, "hdfs_path");

        std::optional<std::string> permission;
        if (hasQueryParam(query_fields, "permission")) {
            permission = getQueryParamAsString(query_fields, "permission");
        }

        hdfsClient->mkdir(hdfsPath, permission).get();

        writeJson(response, SimpleWeb::StatusCode::success_ok, successMessage("Created directory " + hdfsPath));
        return SimpleWeb::StatusCode::success_ok;
    });

    // Rename a path
    server->getServer().resource["^" + path + "rename$"]["POST"] = authorizedRoute(server, "write", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto query_fields = request->parse_query_string();

        auto src = requireQueryParam(query_fields, "src");
        auto dst = requireQueryParam(query_fields, "dst");

        hdfsClient->rename(src, dst).get();

        writeJson(response, SimpleWeb::StatusCode::success_ok, successMessage("Renamed " + src + " to " + dst));
        return SimpleWeb::StatusCode::success_ok;
    });

    // List a directory
    server->getServer().resource["^" + path + "list$"]["GET"] = authorizedRoute(server, "read", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto query_fields = request->parse_query_string();

        auto hdfsPath = requireQueryParam(query_fields, "hdfs_path");

        auto entries = hdfsClient->list(hdfsPath).get();

        nlohmann::json result;
        result["success"] = true;
        result["hdfs_path"] = hdfsPath;
        result["entries"] = nlohmann::json::array();
        for (const auto &entry : entries) {
            result["entries"].push_back(descriptorToJson(entry));
        }

        writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        return SimpleWeb::StatusCode::success_ok;
    });

    // Status of a path
    server->getServer().resource["^" + path + "status$"]["GET"] = authorizedRoute(server, "read", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto query_fields = request->parse_query_string();

        auto hdfsPath = requireQueryParam(query_fields, "hdfs_path");

        auto result = descriptorToJson(hdfsClient->status(hdfsPath).get());
        result["success"] = true;

        writeJson(response, SimpleWeb::StatusCode::success_ok, result);
        return SimpleWeb::StatusCode::success_ok;
    });

    // Home directory
    server->getServer().resource["^" + path + "home$"]["GET"] = authorizedRoute(server, "read", [hdfsClient](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &) {
        auto home = hdfsClient->homeDirectory().get();

        writeJson(response, SimpleWeb::StatusCode::success_ok, {
                {"success", true},
                {"home_directory", home}
        });
        return SimpleWeb::StatusCode::success_ok;
    });
}

void HealthApi(const std::string &path, HttpServer *server) {
    server->getServer().resource["^" + path + "$"]["GET"] = [](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {
        auto start = std::chrono::steady_clock::now();

        writeJson(response, SimpleWeb::StatusCode::success_ok, {
                {"status", "ok"},
                {"version", APP_VERSION}
        });

        logAccess(request, SimpleWeb::StatusCode::success_ok, start);
    };
}
