#include "hubtrace/errors.hpp"

namespace hubtrace {

const char *protocol_error_kind_label(ProtocolErrorKind kind) {
    switch (kind) {
    case ProtocolErrorKind::MalformedHeader:
        return "malformed header";
    case ProtocolErrorKind::UnknownReportType:
        return "unknown report type";
    case ProtocolErrorKind::TruncatedPayload:
        return "truncated payload";
    }
    return "protocol error";
}

} // namespace hubtrace
