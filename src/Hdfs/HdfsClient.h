//
// Path level operations on the remote file store
//

#ifndef BIGDATA_GATEWAY_HDFSCLIENT_H
#define BIGDATA_GATEWAY_HDFSCLIENT_H

#include "../Settings.h"
#include "ClientConfig.h"
#include "HdfsTypes.h"
#include "HttpTransport.h"
#include "TransferClient.h"
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

/*
 * Uniform upload/download/delete/mkdir/rename/list/status over WebHDFS. Every call is asynchronous and independent of
 * every other call: the returned future yields the result, or rethrows the eHdfsError the transfer client classified.
 * Nothing is serialised per path; concurrent writers to one path race under the backend's rules.
 *
 * The client owns its configuration and its pooled transport. Both live until shutdown() or destruction.
 */
class HdfsClient {
public:
    explicit HdfsClient(sHdfsClientConfig config, bool verifyCertificates = true);
    ~HdfsClient();
    HdfsClient(HdfsClient const&) = delete;
    auto operator =(HdfsClient const&) -> HdfsClient& = delete;
    HdfsClient(HdfsClient&&) = delete;
    auto operator=(HdfsClient&&) -> HdfsClient& = delete;

    // Writes bytes to path and returns the committed status. Fails CONFLICT when path exists and overwrite is false.
    auto upload(const std::string &path, ByteBuffer bytes, bool overwrite = false,
                uint16_t replication = DEFAULT_REPLICATION, uint64_t blockSize = DEFAULT_BLOCK_SIZE,
                std::stop_token stopToken = {}) -> std::future<sPathDescriptor>;

    auto download(const std::string &path, std::stop_token stopToken = {}) -> std::future<ByteBuffer>;

    // At most length bytes of the file starting at offset. Empty once offset reaches the end of the file.
    auto downloadRange(const std::string &path, uint64_t offset, uint64_t length,
                       std::stop_token stopToken = {}) -> std::future<ByteBuffer>;

    // As download, but hands each piece of the file to sink as it arrives. The sink runs on a transport I/O thread
    // and must not block.
    auto downloadStream(const std::string &path, ChunkSink sink, std::stop_token stopToken = {}) -> std::future<void>;

    auto deletePath(const std::string &path, bool recursive = false, std::stop_token stopToken = {}) -> std::future<void>;

    // Creates path and any missing parents. Succeeds if the directory already exists.
    auto mkdir(const std::string &path, const std::optional<std::string> &permission = std::nullopt,
               std::stop_token stopToken = {}) -> std::future<void>;

    auto rename(const std::string &src, const std::string &dst, std::stop_token stopToken = {}) -> std::future<void>;

    // Immediate children in backend order. Fails NOT_FOUND if path is absent or is not a directory.
    auto list(const std::string &path, std::stop_token stopToken = {}) -> std::future<std::vector<sPathDescriptor>>;

    auto status(const std::string &path, std::stop_token stopToken = {}) -> std::future<sPathDescriptor>;

    auto homeDirectory(std::stop_token stopToken = {}) -> std::future<std::string>;

    void shutdown();

    [[nodiscard]] auto getConfig() const -> const sHdfsClientConfig & { return config; }

private:
    const sHdfsClientConfig config;
    std::shared_ptr<HttpTransport> transport;
    std::unique_ptr<TransferClient> transferClient;

// Testing
    EXPOSE_PROPERTY_FOR_TESTING_READONLY(transport);
};

#endif //BIGDATA_GATEWAY_HDFSCLIENT_H
