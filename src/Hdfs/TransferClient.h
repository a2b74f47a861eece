//
// Speaks the WebHDFS control and data protocol against one name node
//

#ifndef BIGDATA_GATEWAY_TRANSFERCLIENT_H
#define BIGDATA_GATEWAY_TRANSFERCLIENT_H

#include "ClientConfig.h"
#include "HdfsTypes.h"
#include "HttpTransport.h"
#include "TransferSession.h"
#include <exception>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>

// Every completion receives either an error (an eHdfsError, or whatever a caller supplied sink threw) or a value
using DoneCallback = std::function<void(const std::exception_ptr &error)>;
using RedirectCallback = std::function<void(const std::exception_ptr &error, const std::optional<std::string> &redirectUrl)>;
using JsonCallback = std::function<void(const std::exception_ptr &error, const nlohmann::json &body)>;
using DescriptorCallback = std::function<void(const std::exception_ptr &error, const sPathDescriptor &descriptor)>;

class TransferClient {
public:
    TransferClient(const sHdfsClientConfig &config, std::shared_ptr<HttpTransport> transport);

    // Ask the name node where to write. Yields the data node url from a 307, or nullopt when the name node reports
    // the write as already done with any 2xx.
    void negotiateWrite(const std::string &path, const sWriteParams &params, const std::stop_token &stopToken,
                        RedirectCallback callback);

    // PUT the bytes to the url handed out by negotiateWrite, exactly as given
    void transferPayload(const std::string &redirectUrl, const std::shared_ptr<const ByteBuffer> &bytes,
                         const std::stop_token &stopToken, DoneCallback callback);

    // Stream the file to the sink, following the name node's hand off to a data node
    void read(const std::string &path, ChunkSink sink, const std::stop_token &stopToken, DoneCallback callback);

    // As read, limited to at most length bytes starting at offset. Nothing arrives at the sink past the end of file.
    void readRange(const std::string &path, uint64_t offset, uint64_t length, ChunkSink sink,
                   const std::stop_token &stopToken, DoneCallback callback);

    // Any JSON returning operation: DELETE, MKDIRS, RENAME, LISTSTATUS, GETFILESTATUS, GETHOMEDIRECTORY
    void controlRequest(const std::string &method, const std::string &path, const std::string &op,
                        SimpleWeb::CaseInsensitiveMultimap params, const std::stop_token &stopToken,
                        JsonCallback callback);

    // negotiate, transfer when redirected, then confirm with a status query. Drives the session through its phases.
    void upload(const std::shared_ptr<TransferSession> &session, const std::shared_ptr<const ByteBuffer> &bytes,
                const sWriteParams &params, const std::stop_token &stopToken, DescriptorCallback callback);

    // The name node url for an operation on path, including the identity parameter
    [[nodiscard]] auto controlTarget(const std::string &path, const std::string &op,
                                     SimpleWeb::CaseInsensitiveMultimap params) const -> sHttpTarget;

private:
    const sHdfsClientConfig &config;
    std::shared_ptr<HttpTransport> transport;

    void readFrom(const sHttpTarget &target, uint32_t hopsLeft, const ChunkSink &sink,
                  const std::stop_token &stopToken, DoneCallback callback);

    void confirmUpload(const std::shared_ptr<TransferSession> &session, const std::stop_token &stopToken,
                       DescriptorCallback callback);
};

auto cancelledError() -> std::exception_ptr;

// Percent encodes each segment of a remote path, keeping the separators
auto encodeRemotePath(const std::string &path) -> std::string;

#endif //BIGDATA_GATEWAY_TRANSFERCLIENT_H
