#include "partvault/transport/part_transport.hpp"

namespace partvault::transport {

const char* to_string(TransportErrorKind kind) {
    switch (kind) {
        case TransportErrorKind::NONE: return "none";
        case TransportErrorKind::RATE_LIMITED: return "rate_limited";
        case TransportErrorKind::TRANSIENT: return "transient";
        case TransportErrorKind::PERMANENT: return "permanent";
    }
    return "unknown";
}

} // namespace partvault::transport
