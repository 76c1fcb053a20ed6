#include "util/Expected.hpp"

namespace chuck {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::EmptyQuery: return "empty-query";
        case ErrorCode::Network: return "network";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::HttpStatus: return "http-status";
        case ErrorCode::InvalidJson: return "invalid-json";
        case ErrorCode::UnexpectedShape: return "unexpected-shape";
        case ErrorCode::InternalError: return "internal";
    }
    return "unknown";
}

}
