#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "network/device_record.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QStringConverter>

namespace lanscout::network {

// Discovery wire helpers. Kept free of sockets so they can be tested directly.

// Probe payload: the bare token, no terminator.
[[nodiscard]] QByteArray encode_probe();

// True when the payload is our own probe token, which the listener hears
// because it shares the discovery port with the broadcast.
[[nodiscard]] bool is_probe_echo(const QByteArray& payload);

// Parses one response datagram. `sender` is the packet's real source
// address and becomes the record's identity; nothing inside the payload
// can override it.
[[nodiscard]] Result<DeviceRecord, DecodeError> decode_response(
    const QByteArray& payload,
    const QHostAddress& sender,
    QStringConverter::Encoding encoding = QStringConverter::Utf8);

} // namespace lanscout::network
