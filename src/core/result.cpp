#include "partvault/core/result.hpp"

namespace partvault::core {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::NOT_FOUND: return "not found";
        case ErrorCode::IO_ERROR: return "i/o error";
        case ErrorCode::PARSE_ERROR: return "parse error";
        case ErrorCode::TRANSIENT_TRANSPORT_ERROR: return "transport error";
        case ErrorCode::PERMANENT_TRANSPORT_ERROR: return "permanent transport error";
        case ErrorCode::INCOMPLETE_MANIFEST: return "incomplete manifest";
        case ErrorCode::PARTIAL_DOWNLOAD: return "partial download";
        case ErrorCode::INTEGRITY_ERROR: return "integrity error";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
    }
    return "unknown";
}

}
