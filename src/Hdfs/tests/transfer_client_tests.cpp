//
// WebHDFS wire protocol against the fake name node and data node
//

#include <boost/test/unit_test.hpp>
#include <chrono>
#include <future>
#include <stop_token>
#include <thread>

#include "../../Settings.h"
#include "../../tests/fixtures/WebHdfsFixture.h"
#include "../../tests/utils.h"
#include "../HttpTransport.h"
#include "../TransferClient.h"

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers,readability-function-cognitive-complexity)
struct TransferClientFixture : public WebHdfsFixture
{
    sHdfsClientConfig config                 = makeConfig(std::chrono::seconds{2});
    std::shared_ptr<HttpTransport> transport = std::make_shared<HttpTransport>(config.getRequestTimeout(), 2);
    TransferClient client{config, transport};

    ~TransferClientFixture()
    {
        transport->shutdown();
    }

    TransferClientFixture()                                                = default;
    TransferClientFixture(TransferClientFixture const&)                    = delete;
    auto operator=(TransferClientFixture const&) -> TransferClientFixture& = delete;
    TransferClientFixture(TransferClientFixture&&)                         = delete;
    auto operator=(TransferClientFixture&&) -> TransferClientFixture&      = delete;

    static auto writeParams(bool overwrite = false) -> sWriteParams
    {
        sWriteParams params;
        params.overwrite   = overwrite;
        params.replication = 2;
        params.blockSize   = 1048576;
        params.permission  = DEFAULT_PERMISSION;
        params.bufferSize  = DEFAULT_BUFFER_SIZE;
        return params;
    }

    auto negotiate(const std::string& path, const sWriteParams& params, const std::stop_token& stopToken = {})
        -> std::optional<std::string>
    {
        std::promise<std::optional<std::string>> promise;
        client.negotiateWrite(
            path,
            params,
            stopToken,
            [&promise](const std::exception_ptr& error, const std::optional<std::string>& redirectUrl) {
                if (error)
                {
                    promise.set_exception(error);
                }
                else
                {
                    promise.set_value(redirectUrl);
                }
            });
        return promise.get_future().get();
    }

    void transfer(const std::string& url, const std::string& data, const std::stop_token& stopToken = {})
    {
        auto bytes = std::make_shared<const ByteBuffer>(toBytes(data));

        std::promise<void> promise;
        client.transferPayload(url, bytes, stopToken, [&promise](const std::exception_ptr& error) {
            if (error)
            {
                promise.set_exception(error);
            }
            else
            {
                promise.set_value();
            }
        });
        promise.get_future().get();
    }

    auto read(const std::string& path, const std::stop_token& stopToken = {}) -> std::string
    {
        auto data = std::make_shared<std::string>();

        std::promise<void> promise;
        client.read(
            path,
            [data](const std::string& chunk) { *data += chunk; },
            stopToken,
            [&promise](const std::exception_ptr& error) {
                if (error)
                {
                    promise.set_exception(error);
                }
                else
                {
                    promise.set_value();
                }
            });
        promise.get_future().get();

        return *data;
    }

    auto control(const std::string& method,
                 const std::string& path,
                 const std::string& op,
                 const SimpleWeb::CaseInsensitiveMultimap& params = {}) -> nlohmann::json
    {
        std::promise<nlohmann::json> promise;
        client.controlRequest(
            method, path, op, params, {}, [&promise](const std::exception_ptr& error, const nlohmann::json& body) {
                if (error)
                {
                    promise.set_exception(error);
                }
                else
                {
                    promise.set_value(body);
                }
            });
        return promise.get_future().get();
    }

    auto upload(const std::shared_ptr<TransferSession>& session,
                const std::string& data,
                const std::stop_token& stopToken = {}) -> sPathDescriptor
    {
        std::promise<sPathDescriptor> promise;
        client.upload(session,
                      std::make_shared<const ByteBuffer>(toBytes(data)),
                      writeParams(),
                      stopToken,
                      [&promise](const std::exception_ptr& error, const sPathDescriptor& descriptor) {
                          if (error)
                          {
                              promise.set_exception(error);
                          }
                          else
                          {
                              promise.set_value(descriptor);
                          }
                      });
        return promise.get_future().get();
    }
};

BOOST_FIXTURE_TEST_SUITE(TransferClient_test_suite, TransferClientFixture)

BOOST_AUTO_TEST_CASE(test_control_target)
{
    auto target = client.controlTarget("/dir with space//a#b.txt", "GETFILESTATUS", {});

    BOOST_CHECK_EQUAL(target.scheme, "http");
    BOOST_CHECK_EQUAL(target.host, "127.0.0.1");
    BOOST_CHECK_EQUAL(target.port, NAME_NODE_PORT);
    BOOST_CHECK_EQUAL(target.pathAndQuery.rfind("/webhdfs/v1/dir%20with%20space/a%23b.txt?", 0), 0);

    auto query  = target.pathAndQuery.substr(target.pathAndQuery.find('?') + 1);
    auto fields = SimpleWeb::QueryString::parse(query);
    BOOST_CHECK_EQUAL(fields.find("op")->second, "GETFILESTATUS");
    BOOST_CHECK_EQUAL(fields.find("user.name")->second, IDENTITY_USER);

    BOOST_CHECK_EQUAL(encodeRemotePath("/"), "/");
    BOOST_CHECK_EQUAL(encodeRemotePath("a/b/"), "/a/b");
}

BOOST_AUTO_TEST_CASE(test_negotiate_redirect)
{
    auto location = negotiate("/data/a.txt", writeParams());

    BOOST_REQUIRE(location.has_value());
    BOOST_CHECK_EQUAL(location->rfind("http://127.0.0.1:" + std::to_string(DATA_NODE_PORT) + "/webhdfs/v1/data/a.txt?", 0),
                      0);

    // The name node saw every write parameter, and was asked to keep the 307 hand off
    auto requests = recordedRequests();
    BOOST_REQUIRE_EQUAL(requests.size(), 1);
    BOOST_CHECK_EQUAL(requests[0].method, "PUT");
    BOOST_CHECK_EQUAL(requests[0].path, "/data/a.txt");

    const auto& fields = requests[0].queryFields;
    BOOST_CHECK_EQUAL(fields.find("op")->second, "CREATE");
    BOOST_CHECK_EQUAL(fields.find("overwrite")->second, "false");
    BOOST_CHECK_EQUAL(fields.find("replication")->second, "2");
    BOOST_CHECK_EQUAL(fields.find("blocksize")->second, "1048576");
    BOOST_CHECK_EQUAL(fields.find("permission")->second, "755");
    BOOST_CHECK_EQUAL(fields.find("buffersize")->second, "4096");
    BOOST_CHECK_EQUAL(fields.find("noredirect")->second, "false");
    BOOST_CHECK_EQUAL(fields.find("user.name")->second, IDENTITY_USER);

    // Negotiation alone writes nothing
    BOOST_CHECK_EQUAL(exists("/data/a.txt"), false);
}

BOOST_AUTO_TEST_CASE(test_negotiate_immediate)
{
    bImmediateCreate = true;

    auto location = negotiate("/data/a.txt", writeParams());
    BOOST_CHECK_EQUAL(location.has_value(), false);
    BOOST_CHECK_EQUAL(countRequests("datanode"), 0);
}

BOOST_AUTO_TEST_CASE(test_negotiate_redirect_without_location)
{
    bOmitCreateLocation = true;

    auto error = captureHdfsError([&] { negotiate("/data/a.txt", writeParams()); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::PROTOCOL);
    BOOST_CHECK_EQUAL(error->message(), "Write redirect did not include a Location header");
}

BOOST_AUTO_TEST_CASE(test_negotiate_conflict)
{
    addFile("/data/a.txt", "existing");

    auto error = captureHdfsError([&] { negotiate("/data/a.txt", writeParams()); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::CONFLICT);
    BOOST_CHECK_EQUAL(error->message(), "/data/a.txt for client 127.0.0.1 already exists");

    // Overwrite is allowed through
    BOOST_CHECK(negotiate("/data/a.txt", writeParams(true)).has_value());
}

BOOST_AUTO_TEST_CASE(test_negotiate_unauthorized)
{
    denyUser(IDENTITY_USER);

    auto error = captureHdfsError([&] { negotiate("/data/a.txt", writeParams()); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(error->httpStatus().value(), 403);
}

BOOST_AUTO_TEST_CASE(test_transfer_uses_location_verbatim)
{
    auto location = negotiate("/data/a.txt", writeParams());
    BOOST_REQUIRE(location.has_value());

    transfer(*location, "hello world");

    BOOST_CHECK_EQUAL(fileData("/data/a.txt").value(), "hello world");

    // Nothing was added to or removed from the data node url
    std::optional<sRecordedRequest> dataNodeRequest;
    for (const auto& request : recordedRequests())
    {
        if (request.node == "datanode")
        {
            dataNodeRequest = request;
        }
    }

    BOOST_REQUIRE(dataNodeRequest.has_value());
    BOOST_CHECK_EQUAL(dataNodeRequest->method, "PUT");
    BOOST_CHECK_EQUAL(dataNodeRequest->query, location->substr(location->find('?') + 1));
    BOOST_CHECK_EQUAL(dataNodeRequest->contentLength, 11);
}

BOOST_AUTO_TEST_CASE(test_transfer_refused)
{
    bRedirectToRefusedPort = true;

    auto location = negotiate("/data/a.txt", writeParams());
    BOOST_REQUIRE(location.has_value());

    auto error = captureHdfsError([&] { transfer(*location, "hello world"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::TRANSPORT);
    BOOST_CHECK_EQUAL(error->httpStatus().has_value(), false);
}

BOOST_AUTO_TEST_CASE(test_transfer_unusable_location)
{
    auto error = captureHdfsError([&] { transfer("ftp://datanode/a", "x"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::PROTOCOL);
}

BOOST_AUTO_TEST_CASE(test_read_follows_redirect)
{
    addFile("/data/a.txt", "some file content");

    BOOST_CHECK_EQUAL(read("/data/a.txt"), "some file content");
    BOOST_CHECK_EQUAL(countRequests("namenode", "OPEN"), 1);
    BOOST_CHECK_EQUAL(countRequests("datanode", "OPEN"), 1);
}

BOOST_AUTO_TEST_CASE(test_read_large_file_in_chunks)
{
    // Bigger than the transport's response buffer, so the body arrives in several pieces
    auto data = generateRandomData(READ_CHUNK_SIZE * 3 + 17);
    addFile("/data/big.bin", std::string(data->begin(), data->end()));

    auto result = read("/data/big.bin");
    BOOST_CHECK_EQUAL(result.size(), data->size());
    BOOST_CHECK(result == std::string(data->begin(), data->end()));
}

BOOST_AUTO_TEST_CASE(test_read_errors)
{
    // Missing file
    auto error = captureHdfsError([&] { read("/missing.txt"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::NOT_FOUND);
    BOOST_CHECK_EQUAL(error->message(), "File does not exist: /missing.txt");

    addFile("/data/a.txt", "content");

    // Redirect without a Location
    bOmitOpenLocation = true;
    error             = captureHdfsError([&] { read("/data/a.txt"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::PROTOCOL);
    bOmitOpenLocation = false;

    // Endless redirects
    bRedirectLoop = true;
    error         = captureHdfsError([&] { read("/data/a.txt"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::PROTOCOL);
    BOOST_CHECK_EQUAL(countRequests("namenode", "OPEN"), 1 + 1 + MAX_REDIRECT_HOPS + 1);
}

BOOST_AUTO_TEST_CASE(test_control_request)
{
    addDirectory("/data");

    auto body = control("GET", "/data", "GETFILESTATUS");
    BOOST_CHECK_EQUAL(body["FileStatus"]["type"], "DIRECTORY");

    body = control("PUT", "/data/new", "MKDIRS", {{"permission", "700"}});
    BOOST_CHECK_EQUAL(body["boolean"], true);
    BOOST_CHECK_EQUAL(exists("/data/new"), true);

    auto error = captureHdfsError([&] { control("GET", "/nope", "GETFILESTATUS"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(test_control_request_unparseable_success)
{
    forceResponse("GETFILESTATUS", 200, "this is not json");

    auto error = captureHdfsError([&] { control("GET", "/data", "GETFILESTATUS"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::PROTOCOL);
    BOOST_CHECK_EQUAL(error->message(), "Unparseable GETFILESTATUS response: this is not json");
}

BOOST_AUTO_TEST_CASE(test_control_request_timeout)
{
    slowResponseSeconds = 4;

    auto error = captureHdfsError([&] { control("GET", "/data", "GETFILESTATUS"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::TRANSPORT);

    slowResponseSeconds = 0;
}

BOOST_AUTO_TEST_CASE(test_upload_redirected)
{
    auto session    = std::make_shared<TransferSession>("/data/a.txt");
    auto descriptor = upload(session, "payload");

    BOOST_CHECK_EQUAL(descriptor.path, "/data/a.txt");
    BOOST_CHECK_EQUAL(descriptor.sizeBytes, 7);
    BOOST_CHECK_EQUAL(descriptor.replicationFactor, 2);

    std::vector<eTransferPhase> expected = {eTransferPhase::NEGOTIATING,
                                            eTransferPhase::REDIRECTED,
                                            eTransferPhase::TRANSFERRING,
                                            eTransferPhase::DONE};
    BOOST_CHECK(session->getHistory() == expected);
    BOOST_CHECK(session->getRedirectLocation().has_value());

    // The upload ends with a status confirmation
    BOOST_CHECK_EQUAL(countRequests("namenode", "GETFILESTATUS"), 1);
}

BOOST_AUTO_TEST_CASE(test_upload_immediate)
{
    bImmediateCreate = true;

    auto session    = std::make_shared<TransferSession>("/data/a.txt");
    auto descriptor = upload(session, "payload");

    BOOST_CHECK_EQUAL(descriptor.path, "/data/a.txt");

    std::vector<eTransferPhase> expected = {
        eTransferPhase::NEGOTIATING, eTransferPhase::IMMEDIATE, eTransferPhase::DONE};
    BOOST_CHECK(session->getHistory() == expected);
    BOOST_CHECK_EQUAL(countRequests("datanode"), 0);
    BOOST_CHECK_EQUAL(countRequests("namenode", "GETFILESTATUS"), 1);
}

BOOST_AUTO_TEST_CASE(test_upload_failures_end_failed)
{
    // Refused data node
    bRedirectToRefusedPort = true;
    auto session           = std::make_shared<TransferSession>("/data/a.txt");
    auto error             = captureHdfsError([&] { upload(session, "payload"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::TRANSPORT);
    BOOST_CHECK(session->getPhase() == eTransferPhase::FAILED);
    BOOST_CHECK_EQUAL(countRequests("namenode", "GETFILESTATUS"), 0);
    bRedirectToRefusedPort = false;

    // The status confirmation fails after a successful transfer
    forceResponse("GETFILESTATUS", 404, remoteException("FileNotFoundException", "File does not exist: /data/b.txt"));
    session = std::make_shared<TransferSession>("/data/b.txt");
    error   = captureHdfsError([&] { upload(session, "payload"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::NOT_FOUND);
    BOOST_CHECK(session->getPhase() == eTransferPhase::FAILED);
    BOOST_CHECK_EQUAL(fileData("/data/b.txt").value(), "payload");
}

BOOST_AUTO_TEST_CASE(test_cancelled_before_start)
{
    std::stop_source stopSource;
    stopSource.request_stop();

    auto session = std::make_shared<TransferSession>("/data/a.txt");
    auto error   = captureHdfsError([&] { upload(session, "payload", stopSource.get_token()); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::TRANSPORT);
    BOOST_CHECK_EQUAL(error->message(), "Operation cancelled");
    BOOST_CHECK(session->getPhase() == eTransferPhase::FAILED);

    error = captureHdfsError([&] { read("/data/a.txt", stopSource.get_token()); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK_EQUAL(error->message(), "Operation cancelled");

    // Nothing reached the backend
    BOOST_CHECK_EQUAL(recordedRequests().size(), 0);
}

BOOST_AUTO_TEST_CASE(test_cancelled_mid_request)
{
    // The name node holds the CREATE for longer than the request timeout
    slowResponseSeconds = 4;

    std::stop_source stopSource;
    auto session = std::make_shared<TransferSession>("/data/a.txt");

    auto started = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&] {
        return captureHdfsError([&] { upload(session, "payload", stopSource.get_token()); });
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    BOOST_CHECK_EQUAL(countRequests("namenode", "CREATE"), 1);
    stopSource.request_stop();

    auto error   = pending.get();
    auto elapsed = std::chrono::steady_clock::now() - started;

    // Settled by the stop, not by the two second timeout or the late response
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::TRANSPORT);
    BOOST_CHECK_EQUAL(error->message(), "Operation cancelled");
    BOOST_CHECK(elapsed < std::chrono::milliseconds(1500));
    BOOST_CHECK(session->getPhase() == eTransferPhase::FAILED);
    BOOST_CHECK_EQUAL(countRequests("datanode"), 0);

    slowResponseSeconds = 0;
}

BOOST_AUTO_TEST_CASE(test_requests_after_shutdown)
{
    transport->shutdown();

    auto error = captureHdfsError([&] { control("GET", "/", "GETFILESTATUS"); });
    BOOST_REQUIRE(error.has_value());
    BOOST_CHECK(error->kind() == eHdfsErrorKind::TRANSPORT);
    BOOST_CHECK_EQUAL(recordedRequests().size(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers,readability-function-cognitive-complexity)
