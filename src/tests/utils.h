//
// Shared test helpers
//

#ifndef BIGDATA_GATEWAY_TEST_UTILS_H
#define BIGDATA_GATEWAY_TEST_UTILS_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "../Hdfs/HdfsError.h"

#include <client_http.hpp>
#include <server_http.hpp>

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>;
auto toBytes(const std::string& text) -> std::vector<uint8_t>;
auto toString(const std::vector<uint8_t>& bytes) -> std::string;

// Runs action and returns the eHdfsError it threw, if any
auto captureHdfsError(const std::function<void()>& action) -> std::optional<eHdfsError>;

using TestHttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;
using TestHttpClient = SimpleWeb::Client<SimpleWeb::HTTP>;

#endif  // BIGDATA_GATEWAY_TEST_UTILS_H
