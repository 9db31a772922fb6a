#include "network/prober.hpp"

#include "core/logging.hpp"
#include "network/response_decoder.hpp"

#include <QUdpSocket>

namespace lanscout::network {

BroadcastProber::BroadcastProber(QHostAddress broadcast_address)
    : broadcast_address_(std::move(broadcast_address))
{
}

Result<void, TransportError> BroadcastProber::send_probe(QUdpSocket& socket, uint16_t port) const {
    using ProbeResult = Result<void, TransportError>;

    if (socket.state() != QAbstractSocket::BoundState) {
        qCWarning(lanscoutProbeLog) << "probe socket is not bound";
        return ProbeResult::err(TransportError{TransportErrorKind::SocketSetup,
                                               "probe socket is not bound"});
    }

    // Qt enables SO_BROADCAST on every UDP socket it creates.
    const auto probe = encode_probe();
    const qint64 sent = socket.writeDatagram(probe, broadcast_address_, port);
    if (sent != probe.size()) {
        auto msg = socket.errorString().toStdString();
        qCWarning(lanscoutProbeLog) << "error sending discovery broadcast to"
                                    << broadcast_address_.toString() << "port" << port
                                    << ":" << msg.c_str();
        return ProbeResult::err(TransportError{TransportErrorKind::SendFailed, std::move(msg)});
    }

    qCInfo(lanscoutProbeLog) << "sent discovery broadcast to"
                             << broadcast_address_.toString() << "port" << port
                             << "from port" << socket.localPort();
    return ProbeResult::ok();
}

} // namespace lanscout::network
