//
// Error taxonomy surfaced by the WebHDFS client
//

#ifndef BIGDATA_GATEWAY_HDFSERROR_H
#define BIGDATA_GATEWAY_HDFSERROR_H

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

enum class eHdfsErrorKind {
    NOT_FOUND,
    CONFLICT,
    UNAUTHORIZED,
    TRANSPORT,
    PROTOCOL,
    UNKNOWN
};

auto errorKindToString(eHdfsErrorKind kind) -> std::string;

class eHdfsError : public std::exception {
public:
    eHdfsError(eHdfsErrorKind kind, std::string message, std::optional<int> httpStatus = std::nullopt);

    [[nodiscard]] auto kind() const -> eHdfsErrorKind { return kind_; }

    [[nodiscard]] auto message() const -> const std::string & { return message_; }

    // The status of the backend response that was classified, empty for connection level failures
    [[nodiscard]] auto httpStatus() const -> std::optional<int> { return httpStatus_; }

    [[nodiscard]] auto what() const noexcept -> const char * override { return what_.c_str(); }

private:
    eHdfsErrorKind kind_;
    std::string message_;
    std::optional<int> httpStatus_;
    std::string what_;
};

#endif //BIGDATA_GATEWAY_HDFSERROR_H
