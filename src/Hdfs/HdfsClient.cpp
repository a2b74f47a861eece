//
// Path level operations on the remote file store
//

#include "HdfsClient.h"
#include "HdfsError.h"
#include "StatusParser.h"
#include <iostream>
#include <utility>

namespace {
    template<class T, class Producer>
    void settle(std::promise<T> &promise, const std::exception_ptr &error, Producer &&produce) {
        if (error) {
            promise.set_exception(error);
            return;
        }

        try {
            promise.set_value(produce());
        } catch (const std::exception &) {
            promise.set_exception(std::current_exception());
        }
    }

    // {"boolean": true|false}, the answer of DELETE, MKDIRS and RENAME
    auto parseBoolean(const nlohmann::json &body, const std::string &op) -> bool {
        auto value = body.is_object() ? body.find("boolean") : body.end();
        if (value == body.end() || !value->is_boolean()) {
            throw eHdfsError(eHdfsErrorKind::PROTOCOL, "Malformed " + op + " response: " + body.dump());
        }
        return value->get<bool>();
    }
}

HdfsClient::HdfsClient(sHdfsClientConfig config, bool verifyCertificates) : config(std::move(config)) {
    transport = std::make_shared<HttpTransport>(
            this->config.getRequestTimeout(),
            HDFS_IO_THREAD_POOL_SIZE,
            verifyCertificates
    );
    transferClient = std::make_unique<TransferClient>(this->config, transport);

    std::cout << "HDFS: Client for " << this->config.getBaseUrl() << " as " << this->config.getIdentityUser()
              << std::endl;
}

HdfsClient::~HdfsClient() {
    shutdown();
}

void HdfsClient::shutdown() {
    transport->shutdown();
}

auto HdfsClient::upload(const std::string &path, ByteBuffer bytes, bool overwrite, uint16_t replication,
                        uint64_t blockSize, std::stop_token stopToken) -> std::future<sPathDescriptor> {
    auto promise = std::make_shared<std::promise<sPathDescriptor>>();
    auto future = promise->get_future();

    sWriteParams params;
    params.overwrite = overwrite;
    params.replication = replication;
    params.blockSize = blockSize;
    params.permission = DEFAULT_PERMISSION;
    params.bufferSize = DEFAULT_BUFFER_SIZE;

    // One session per call, it never outlives the completion chain
    auto session = std::make_shared<TransferSession>(normalisePath(path));

    transferClient->upload(
            session,
            std::make_shared<const ByteBuffer>(std::move(bytes)),
            params,
            stopToken,
            [promise](const std::exception_ptr &error, const sPathDescriptor &descriptor) {
                settle(*promise, error, [&descriptor]() { return descriptor; });
            }
    );

    return future;
}

auto HdfsClient::download(const std::string &path, std::stop_token stopToken) -> std::future<ByteBuffer> {
    auto promise = std::make_shared<std::promise<ByteBuffer>>();
    auto future = promise->get_future();
    auto buffer = std::make_shared<ByteBuffer>();

    transferClient->read(
            normalisePath(path),
            [buffer](const std::string &chunk) {
                buffer->insert(buffer->end(), chunk.begin(), chunk.end());
            },
            stopToken,
            [promise, buffer](const std::exception_ptr &error) {
                settle(*promise, error, [&buffer]() { return std::move(*buffer); });
            }
    );

    return future;
}

auto HdfsClient::downloadRange(const std::string &path, uint64_t offset, uint64_t length,
                               std::stop_token stopToken) -> std::future<ByteBuffer> {
    auto promise = std::make_shared<std::promise<ByteBuffer>>();
    auto future = promise->get_future();
    auto buffer = std::make_shared<ByteBuffer>();

    transferClient->readRange(
            normalisePath(path),
            offset,
            length,
            [buffer](const std::string &chunk) {
                buffer->insert(buffer->end(), chunk.begin(), chunk.end());
            },
            stopToken,
            [promise, buffer](const std::exception_ptr &error) {
                settle(*promise, error, [&buffer]() { return std::move(*buffer); });
            }
    );

    return future;
}

auto HdfsClient::downloadStream(const std::string &path, ChunkSink sink, std::stop_token stopToken) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    transferClient->read(normalisePath(path), std::move(sink), stopToken, [promise](const std::exception_ptr &error) {
        if (error) {
            promise->set_exception(error);
        } else {
            promise->set_value();
        }
    });

    return future;
}

auto HdfsClient::deletePath(const std::string &path, bool recursive, std::stop_token stopToken) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto target = normalisePath(path);

    transferClient->controlRequest(
            "DELETE",
            target,
            "DELETE",
            {{"recursive", recursive ? "true" : "false"}},
            stopToken,
            [promise, target](const std::exception_ptr &error, const nlohmann::json &body) {
                if (error) {
                    promise->set_exception(error);
                    return;
                }

                try {
                    if (!parseBoolean(body, "DELETE")) {
                        // What a false means is up to the backend (usually that nothing existed), it is not an error
                        std::cout << "HDFS: Delete of " << target << " removed nothing" << std::endl;
                    }
                    promise->set_value();
                } catch (const std::exception &) {
                    promise->set_exception(std::current_exception());
                }
            }
    );

    return future;
}

auto HdfsClient::mkdir(const std::string &path, const std::optional<std::string> &permission,
                       std::stop_token stopToken) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto target = normalisePath(path);

    SimpleWeb::CaseInsensitiveMultimap params;
    if (permission) {
        params.emplace("permission", *permission);
    }

    transferClient->controlRequest(
            "PUT",
            target,
            "MKDIRS",
            params,
            stopToken,
            [promise, target](const std::exception_ptr &error, const nlohmann::json &body) {
                if (error) {
                    promise->set_exception(error);
                    return;
                }

                try {
                    if (!parseBoolean(body, "MKDIRS")) {
                        throw eHdfsError(eHdfsErrorKind::UNKNOWN, "Directory " + target + " could not be created");
                    }
                    promise->set_value();
                } catch (const std::exception &) {
                    promise->set_exception(std::current_exception());
                }
            }
    );

    return future;
}

auto HdfsClient::rename(const std::string &src, const std::string &dst, std::stop_token stopToken) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto source = normalisePath(src);
    auto destination = normalisePath(dst);

    transferClient->controlRequest(
            "PUT",
            source,
            "RENAME",
            {{"destination", destination}},
            stopToken,
            [this, promise, source, destination, stopToken](const std::exception_ptr &error, const nlohmann::json &body) {
                if (error) {
                    promise->set_exception(error);
                    return;
                }

                bool renamed = false;
                try {
                    renamed = parseBoolean(body, "RENAME");
                } catch (const std::exception &) {
                    promise->set_exception(std::current_exception());
                    return;
                }

                if (renamed) {
                    promise->set_value();
                    return;
                }

                // The backend answers false rather than 404 for a missing source. Ask about the source so a missing
                // one is reported NOT_FOUND by the classifier like every other operation.
                transferClient->controlRequest(
                        "GET",
                        source,
                        "GETFILESTATUS",
                        {},
                        stopToken,
                        [promise, source, destination](const std::exception_ptr &statusError, const nlohmann::json &) {
                            if (statusError) {
                                promise->set_exception(statusError);
                                return;
                            }

                            promise->set_exception(std::make_exception_ptr(eHdfsError(
                                    eHdfsErrorKind::UNKNOWN,
                                    "Rename of " + source + " to " + destination + " was refused"
                            )));
                        }
                );
            }
    );

    return future;
}

auto HdfsClient::list(const std::string &path, std::stop_token stopToken) -> std::future<std::vector<sPathDescriptor>> {
    auto promise = std::make_shared<std::promise<std::vector<sPathDescriptor>>>();
    auto future = promise->get_future();
    auto target = normalisePath(path);

    transferClient->controlRequest(
            "GET",
            target,
            "LISTSTATUS",
            {},
            stopToken,
            [promise, target](const std::exception_ptr &error, const nlohmann::json &body) {
                settle(*promise, error, [&body, &target]() {
                    if (isListingOfFile(body)) {
                        throw eHdfsError(eHdfsErrorKind::NOT_FOUND, target + " is not a directory");
                    }
                    return parseListingResponse(body, target);
                });
            }
    );

    return future;
}

auto HdfsClient::status(const std::string &path, std::stop_token stopToken) -> std::future<sPathDescriptor> {
    auto promise = std::make_shared<std::promise<sPathDescriptor>>();
    auto future = promise->get_future();
    auto target = normalisePath(path);

    transferClient->controlRequest(
            "GET",
            target,
            "GETFILESTATUS",
            {},
            stopToken,
            [promise, target](const std::exception_ptr &error, const nlohmann::json &body) {
                settle(*promise, error, [&body, &target]() { return parseFileStatusResponse(body, target); });
            }
    );

    return future;
}

auto HdfsClient::homeDirectory(std::stop_token stopToken) -> std::future<std::string> {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();

    transferClient->controlRequest(
            "GET",
            "/",
            "GETHOMEDIRECTORY",
            {},
            stopToken,
            [promise](const std::exception_ptr &error, const nlohmann::json &body) {
                settle(*promise, error, [&body]() {
                    auto path = body.is_object() ? body.find("Path") : body.end();
                    if (path == body.end() || !path->is_string()) {
                        throw eHdfsError(eHdfsErrorKind::PROTOCOL, "Malformed GETHOMEDIRECTORY response: " + body.dump());
                    }
                    return path->get<std::string>();
                });
            }
    );

    return future;
}
