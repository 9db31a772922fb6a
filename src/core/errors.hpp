#pragma once

#include <string>

namespace lanscout {

/**
 * Why a response datagram was rejected by the decoder.
 */
enum class DecodeErrorKind {
    MalformedEncoding,  // bytes are not valid text in the claimed encoding
    MalformedStructure, // valid text, but not a usable JSON object
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::MalformedStructure;
    std::string message;

    bool operator==(const DecodeError& other) const = default;
};

enum class TransportErrorKind {
    SocketSetup,   // socket could not be created, bound or broadcast-enabled
    SendFailed,    // the network stack rejected the probe datagram
    Receive,       // the listening socket failed while polling
    SessionReused, // a DiscoverySession was run a second time
};

struct TransportError {
    TransportErrorKind kind = TransportErrorKind::SocketSetup;
    std::string message;

    bool operator==(const TransportError& other) const = default;
};

struct ConfigError {
    std::string message;

    bool operator==(const ConfigError& other) const = default;
};

[[nodiscard]] const char* to_string(DecodeErrorKind kind) noexcept;
[[nodiscard]] const char* to_string(TransportErrorKind kind) noexcept;

} // namespace lanscout
