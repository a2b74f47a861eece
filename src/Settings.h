//
// Build and environment settings
//

#ifndef BIGDATA_GATEWAY_SETTINGS_H
#define BIGDATA_GATEWAY_SETTINGS_H

#include <cstdint>
#include <cstdlib>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

#define HDFS_NAMENODE_HOST              GET_ENV("HDFS_NAMENODE_HOST", "hadoop-cluster")
#define HDFS_WEB_PORT                   std::stoi(GET_ENV("HDFS_WEB_PORT", "9870"))
#define HDFS_SCHEME                     GET_ENV("HDFS_SCHEME", "http")
#define HDFS_USER                       GET_ENV("HDFS_USER", "root")
#define HDFS_REQUEST_TIMEOUT_SECONDS    std::stoi(GET_ENV("HDFS_REQUEST_TIMEOUT_SECONDS", "30"))

#define API_KEY_HEADER                  GET_ENV("API_KEY_HEADER", "X-API-Key")

constexpr const char* ACCESS_SECRET_ENV_VARIABLE = "ACCESS_SECRET_CONFIG";

// WebHDFS REST root on every name node and data node
constexpr const char* WEBHDFS_PATH_PREFIX = "/webhdfs/v1";

const uint16_t DEFAULT_REPLICATION = 3;
const uint64_t DEFAULT_BLOCK_SIZE = (1024ULL*1024ULL*128ULL);
constexpr const char* DEFAULT_PERMISSION = "755";
const uint32_t DEFAULT_BUFFER_SIZE = 4096;
const uint16_t MAX_UPLOAD_REPLICATION = 10;

const uint32_t MAX_REDIRECT_HOPS = 5;

const uint32_t API_KEY_CACHE_SECONDS = 300;

constexpr const char* APP_VERSION = "0.1";

#ifndef BUILD_TESTS
    const uint16_t HTTP_PORT = 8000;
    const std::size_t READ_CHUNK_SIZE = (1024ULL*1024ULL*4ULL);
    const uint64_t DOWNLOAD_SEGMENT_SIZE = (1024ULL*1024ULL*16ULL);
#else
    const uint16_t HTTP_PORT = 23456;
    const std::size_t READ_CHUNK_SIZE = (1024ULL*64ULL);
    const uint64_t DOWNLOAD_SEGMENT_SIZE = READ_CHUNK_SIZE*2;
#endif

const uint32_t HTTP_WORKER_POOL_SIZE = 32;
const uint32_t HTTP_CONTENT_TIMEOUT_SECONDS = 300;

const uint32_t HDFS_IO_THREAD_POOL_SIZE = 4;

#endif //BIGDATA_GATEWAY_SETTINGS_H
