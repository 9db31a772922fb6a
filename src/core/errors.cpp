#include "core/errors.hpp"

namespace lanscout {

const char* to_string(DecodeErrorKind kind) noexcept {
    switch (kind) {
        case DecodeErrorKind::MalformedEncoding: return "malformed-encoding";
        case DecodeErrorKind::MalformedStructure: return "malformed-structure";
    }
    return "unknown";
}

const char* to_string(TransportErrorKind kind) noexcept {
    switch (kind) {
        case TransportErrorKind::SocketSetup: return "socket-setup";
        case TransportErrorKind::SendFailed: return "send-failed";
        case TransportErrorKind::Receive: return "receive";
        case TransportErrorKind::SessionReused: return "session-reused";
    }
    return "unknown";
}

} // namespace lanscout
