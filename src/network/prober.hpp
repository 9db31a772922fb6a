#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"

#include <QHostAddress>

#include <cstdint>

class QUdpSocket;

namespace lanscout::network {

/**
 * Prober - sends the single discovery probe datagram.
 *
 * The probe goes out on the listener's own socket, so its source port is
 * the discovery port and devices that answer the source port reach the
 * listener. Fire-and-forget: nothing is awaited after the send.
 */
class Prober {
public:
    virtual ~Prober() = default;

    // SocketSetup if `socket` cannot send at all (not bound), SendFailed if
    // the stack rejected the datagram (e.g. broadcast not permitted).
    [[nodiscard]] virtual Result<void, TransportError> send_probe(QUdpSocket& socket,
                                                                  uint16_t port) const = 0;
};

class BroadcastProber final : public Prober {
public:
    explicit BroadcastProber(QHostAddress broadcast_address);

    [[nodiscard]] Result<void, TransportError> send_probe(QUdpSocket& socket,
                                                          uint16_t port) const override;

    [[nodiscard]] const QHostAddress& broadcast_address() const noexcept { return broadcast_address_; }

private:
    QHostAddress broadcast_address_;
};

} // namespace lanscout::network
