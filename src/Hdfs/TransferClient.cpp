//
// Speaks the WebHDFS control and data protocol against one name node
//

#include "TransferClient.h"
#include "../Settings.h"
#include "ErrorClassifier.h"
#include "HdfsError.h"
#include "StatusParser.h"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {
    const int HTTP_TEMPORARY_REDIRECT = 307;

    auto transportError(const SimpleWeb::error_code &errorCode) -> std::exception_ptr {
        return std::make_exception_ptr(classifyTransportFailure(errorCode.message()));
    }

    auto responseError(const sHttpResult &result) -> std::exception_ptr {
        return std::make_exception_ptr(classifyResponse(result.statusCode, result.content));
    }

    auto protocolError(const std::string &detail) -> std::exception_ptr {
        return std::make_exception_ptr(eHdfsError(eHdfsErrorKind::PROTOCOL, detail));
    }
}

auto cancelledError() -> std::exception_ptr {
    return std::make_exception_ptr(eHdfsError(eHdfsErrorKind::TRANSPORT, "Operation cancelled"));
}

namespace {
    // Null when a complete response arrived
    auto connectionFailure(const sHttpResult &result) -> std::exception_ptr {
        if (result.bCancelled) {
            return cancelledError();
        }

        if (result.errorCode) {
            return transportError(result.errorCode);
        }

        return nullptr;
    }
}

auto encodeRemotePath(const std::string &path) -> std::string {
    auto normalised = normalisePath(path);

    std::string result;
    std::size_t start = 1;
    while (start <= normalised.size()) {
        auto end = normalised.find('/', start);
        if (end == std::string::npos) {
            end = normalised.size();
        }

        result += "/" + SimpleWeb::Percent::encode(normalised.substr(start, end - start));
        start = end + 1;
    }

    return result.empty() ? "/" : result;
}

TransferClient::TransferClient(const sHdfsClientConfig &config, std::shared_ptr<HttpTransport> transport)
        : config(config), transport(std::move(transport)) {}

auto TransferClient::controlTarget(const std::string &path, const std::string &op,
                                   SimpleWeb::CaseInsensitiveMultimap params) const -> sHttpTarget {
    params.emplace("op", op);
    params.emplace("user.name", config.getIdentityUser());

    sHttpTarget target;
    target.scheme = config.getScheme();
    target.host = config.getHost();
    target.port = config.getPort();
    target.pathAndQuery = config.getPathPrefix() + encodeRemotePath(path) + "?" + SimpleWeb::QueryString::create(params);
    return target;
}

void TransferClient::negotiateWrite(const std::string &path, const sWriteParams &params,
                                    const std::stop_token &stopToken, RedirectCallback callback) {
    if (stopToken.stop_requested()) {
        callback(cancelledError(), std::nullopt);
        return;
    }

    auto target = controlTarget(
            path,
            "CREATE",
            {
                    {"overwrite", params.overwrite ? "true" : "false"},
                    {"replication", std::to_string(params.replication)},
                    {"blocksize", std::to_string(params.blockSize)},
                    {"permission", params.permission},
                    {"buffersize", std::to_string(params.bufferSize)},
                    // Keep the 307 hand off even on name nodes that can answer with a JSON Location instead
                    {"noredirect", "false"}
            }
    );

    transport->request(target, "PUT", "", {}, nullptr, stopToken, [callback](const sHttpResult &result) {
        if (auto error = connectionFailure(result)) {
            callback(error, std::nullopt);
            return;
        }

        if (result.statusCode == HTTP_TEMPORARY_REDIRECT) {
            auto location = result.getHeader("Location");
            if (location.empty()) {
                callback(protocolError("Write redirect did not include a Location header"), std::nullopt);
                return;
            }

            callback(nullptr, location);
            return;
        }

        if (!result.isSuccess()) {
            callback(responseError(result), std::nullopt);
            return;
        }

        // The name node accepted the write without a data node hop. Whether this happens is backend version
        // dependent, so every 2xx is treated alike.
        callback(nullptr, std::nullopt);
    });
}

void TransferClient::transferPayload(const std::string &redirectUrl, const std::shared_ptr<const ByteBuffer> &bytes,
                                     const std::stop_token &stopToken, DoneCallback callback) {
    if (stopToken.stop_requested()) {
        callback(cancelledError());
        return;
    }

    sHttpTarget target;
    try {
        target = parseHttpTarget(redirectUrl);
    } catch (const std::exception &e) {
        callback(protocolError("Write redirect Location is unusable: " + std::string(e.what())));
        return;
    }

    SimpleWeb::CaseInsensitiveMultimap header;
    header.emplace("Content-Type", "application/octet-stream");

    // The data node url already carries every parameter the backend needs, nothing is added to it
    transport->request(
            target,
            "PUT",
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            SimpleWeb::string_view(reinterpret_cast<const char *>(bytes->data()), bytes->size()),
            header,
            nullptr,
            stopToken,
            [callback](const sHttpResult &result) {
                if (auto error = connectionFailure(result)) {
                    callback(error);
                    return;
                }

                if (!result.isSuccess()) {
                    callback(responseError(result));
                    return;
                }

                callback(nullptr);
            }
    );
}

void TransferClient::read(const std::string &path, ChunkSink sink, const std::stop_token &stopToken,
                          DoneCallback callback) {
    readFrom(controlTarget(path, "OPEN", {}), MAX_REDIRECT_HOPS, sink, stopToken, std::move(callback));
}

void TransferClient::readRange(const std::string &path, uint64_t offset, uint64_t length, ChunkSink sink,
                               const std::stop_token &stopToken, DoneCallback callback) {
    auto target = controlTarget(
            path,
            "OPEN",
            {
                    {"offset", std::to_string(offset)},
                    {"length", std::to_string(length)}
            }
    );

    readFrom(target, MAX_REDIRECT_HOPS, sink, stopToken, std::move(callback));
}

void TransferClient::readFrom(const sHttpTarget &target, uint32_t hopsLeft, const ChunkSink &sink,
                              const std::stop_token &stopToken, DoneCallback callback) {
    if (stopToken.stop_requested()) {
        callback(cancelledError());
        return;
    }

    transport->request(target, "GET", "", {}, sink, stopToken,
                       [this, hopsLeft, sink, stopToken, callback](const sHttpResult &result) {
        if (auto error = connectionFailure(result)) {
            callback(error);
            return;
        }

        if (result.sinkError) {
            callback(result.sinkError);
            return;
        }

        if (result.isRedirect()) {
            auto location = result.getHeader("Location");
            if (location.empty()) {
                callback(protocolError("Read redirect did not include a Location header"));
                return;
            }

            if (hopsLeft == 0) {
                callback(protocolError("Too many redirects while reading, last Location was " + location));
                return;
            }

            sHttpTarget next;
            try {
                next = parseHttpTarget(location);
            } catch (const std::exception &e) {
                callback(protocolError("Read redirect Location is unusable: " + std::string(e.what())));
                return;
            }

            readFrom(next, hopsLeft - 1, sink, stopToken, callback);
            return;
        }

        if (!result.isSuccess()) {
            callback(responseError(result));
            return;
        }

        callback(nullptr);
    });
}

void TransferClient::controlRequest(const std::string &method, const std::string &path, const std::string &op,
                                    SimpleWeb::CaseInsensitiveMultimap params, const std::stop_token &stopToken,
                                    JsonCallback callback) {
    if (stopToken.stop_requested()) {
        callback(cancelledError(), nullptr);
        return;
    }

    auto target = controlTarget(path, op, std::move(params));

    transport->request(target, method, "", {}, nullptr, stopToken, [op, callback](const sHttpResult &result) {
        if (auto error = connectionFailure(result)) {
            callback(error, nullptr);
            return;
        }

        if (!result.isSuccess()) {
            callback(responseError(result), nullptr);
            return;
        }

        auto response = sBackendResponse::fromRaw(result.statusCode, result.content);
        if (!response.structuredBody) {
            callback(protocolError("Unparseable " + op + " response: " + response.rawText), nullptr);
            return;
        }

        callback(nullptr, *response.structuredBody);
    });
}

void TransferClient::upload(const std::shared_ptr<TransferSession> &session,
                            const std::shared_ptr<const ByteBuffer> &bytes, const sWriteParams &params,
                            const std::stop_token &stopToken, DescriptorCallback callback) {
    auto fail = [session, callback](const std::exception_ptr &error) {
        session->fail();
        callback(error, {});
    };

    negotiateWrite(
            session->getTargetPath(),
            params,
            stopToken,
            [this, session, bytes, stopToken, callback, fail](const std::exception_ptr &error,
                                                              const std::optional<std::string> &redirectUrl) {
                if (error) {
                    fail(error);
                    return;
                }

                if (!redirectUrl) {
                    session->immediate();
                    confirmUpload(session, stopToken, callback);
                    return;
                }

                session->redirect(*redirectUrl);
                if (stopToken.stop_requested()) {
                    fail(cancelledError());
                    return;
                }

                session->beginTransfer();
                transferPayload(*redirectUrl, bytes, stopToken,
                                [this, session, stopToken, callback, fail](const std::exception_ptr &error) {
                                    if (error) {
                                        fail(error);
                                        return;
                                    }

                                    confirmUpload(session, stopToken, callback);
                                });
            }
    );
}

void TransferClient::confirmUpload(const std::shared_ptr<TransferSession> &session, const std::stop_token &stopToken,
                                   DescriptorCallback callback) {
    // A successful control phase does not prove the bytes were committed, only the status query does
    controlRequest(
            "GET",
            session->getTargetPath(),
            "GETFILESTATUS",
            {},
            stopToken,
            [session, callback](const std::exception_ptr &error, const nlohmann::json &body) {
                if (error) {
                    session->fail();
                    callback(error, {});
                    return;
                }

                sPathDescriptor descriptor;
                try {
                    descriptor = parseFileStatusResponse(body, session->getTargetPath());
                } catch (const std::exception &) {
                    session->fail();
                    callback(std::current_exception(), {});
                    return;
                }

                session->complete();
                callback(nullptr, descriptor);
            }
    );
}
