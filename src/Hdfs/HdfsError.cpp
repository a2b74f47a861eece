//
// Error taxonomy surfaced by the WebHDFS client
//

#include "HdfsError.h"
#include <utility>

auto errorKindToString(eHdfsErrorKind kind) -> std::string {
    switch (kind) {
        case eHdfsErrorKind::NOT_FOUND:
            return "NOT_FOUND";
        case eHdfsErrorKind::CONFLICT:
            return "CONFLICT";
        case eHdfsErrorKind::UNAUTHORIZED:
            return "UNAUTHORIZED";
        case eHdfsErrorKind::TRANSPORT:
            return "TRANSPORT";
        case eHdfsErrorKind::PROTOCOL:
            return "PROTOCOL";
        case eHdfsErrorKind::UNKNOWN:
            return "UNKNOWN";
    }

    return "UNKNOWN";
}

eHdfsError::eHdfsError(eHdfsErrorKind kind, std::string message, std::optional<int> httpStatus)
        : kind_(kind), message_(std::move(message)), httpStatus_(httpStatus) {
    what_ = errorKindToString(kind_) + ": " + message_;
}
