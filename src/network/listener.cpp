#include "network/listener.hpp"

#include "core/logging.hpp"
#include "network/response_decoder.hpp"

#include <QElapsedTimer>
#include <QNetworkDatagram>
#include <QScopeGuard>
#include <QUdpSocket>

#include <algorithm>

namespace lanscout::network {

ResponseListener::ResponseListener(DiscoveryConfig config,
                                   DeviceRegistry& registry,
                                   CancellationToken token)
    : config_(std::move(config))
    , registry_(registry)
    , token_(std::move(token))
{
}

ResponseListener::~ResponseListener() {
    release();
}

Result<uint16_t, TransportError> ResponseListener::bind() {
    using BindResult = Result<uint16_t, TransportError>;

    if (socket_) {
        return BindResult::ok(socket_->localPort());
    }

    auto socket = std::make_unique<QUdpSocket>();
    if (!socket->bind(config_.bind_address,
                      config_.port,
                      QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto msg = socket->errorString().toStdString();
        qCWarning(lanscoutListenerLog) << "cannot bind discovery port" << config_.port
                                       << ":" << msg.c_str();
        return BindResult::err(TransportError{TransportErrorKind::SocketSetup, std::move(msg)});
    }

    socket_ = std::move(socket);
    qCDebug(lanscoutListenerLog) << "bound" << config_.bind_address.toString()
                                 << "port" << socket_->localPort();
    return BindResult::ok(socket_->localPort());
}

Result<void, TransportError> ResponseListener::send_probe(const Prober& prober, uint16_t port) {
    if (!socket_) {
        return Result<void, TransportError>::err(
            TransportError{TransportErrorKind::SocketSetup, "listener is not bound"});
    }
    return prober.send_probe(*socket_, port);
}

std::vector<DeviceRecord> ResponseListener::listen(std::chrono::milliseconds window) {
    const auto cleanup = qScopeGuard([this] { release(); });

    if (!socket_) {
        qCWarning(lanscoutListenerLog) << "listen() called without a bound socket";
        return registry_.snapshot();
    }

    QElapsedTimer elapsed;
    elapsed.start();
    const qint64 poll_ms = config_.poll_interval.count();

    for (;;) {
        if (token_.is_cancelled()) {
            cancelled_ = true;
            break;
        }
        const qint64 remaining = window.count() - elapsed.elapsed();
        if (remaining <= 0) {
            break;
        }

        if (!socket_->hasPendingDatagrams()) {
            const int wait_ms = static_cast<int>(std::min(poll_ms, remaining));
            if (!socket_->waitForReadyRead(wait_ms)) {
                if (socket_->error() == QAbstractSocket::SocketTimeoutError) {
                    continue;
                }
                auto msg = socket_->errorString().toStdString();
                qCWarning(lanscoutListenerLog) << "receive failed, ending collection early:"
                                               << msg.c_str();
                receive_error_ = TransportError{TransportErrorKind::Receive, std::move(msg)};
                break;
            }
        }

        while (socket_->hasPendingDatagrams() && !token_.is_cancelled()) {
            // Oversized datagrams are truncated to max_datagram_size.
            const auto datagram = socket_->receiveDatagram(config_.max_datagram_size);
            if (!datagram.isValid()) {
                qCDebug(lanscoutListenerLog) << "dropped unreadable datagram:" << socket_->errorString();
                break;
            }
            handle_datagram(datagram);
        }
    }

    if (cancelled_) {
        qCInfo(lanscoutListenerLog) << "collection cancelled after" << elapsed.elapsed() << "ms";
    }
    return registry_.snapshot();
}

void ResponseListener::handle_datagram(const QNetworkDatagram& datagram) {
    const auto payload = datagram.data();
    const auto sender = canonical_address(datagram.senderAddress());

    if (is_probe_echo(payload)) {
        qCDebug(lanscoutListenerLog) << "ignoring probe echo from" << sender.toString();
        return;
    }

    auto decoded = decode_response(payload, sender);
    if (decoded.is_err()) {
        ++rejected_;
        const auto& error = decoded.unwrap_err();
        qCInfo(lanscoutListenerLog) << "received unusable response from" << sender.toString()
                                    << "(" << to_string(error.kind) << "):" << error.message.c_str();
        if (on_rejected) {
            on_rejected(sender, error);
        }
        return;
    }

    const auto& record = decoded.unwrap();
    if (!registry_.try_insert(record.origin_address(), record)) {
        qCDebug(lanscoutListenerLog) << "duplicate response from" << record.origin_address();
        return;
    }

    qCDebug(lanscoutListenerLog) << "device" << record.origin_address()
                                 << "hostname=" << record.hostname().value_or(QString{});
    if (on_device) {
        on_device(record);
    }
}

void ResponseListener::release() {
    if (!socket_) return;
    socket_->close();
    socket_.reset();
    qCDebug(lanscoutListenerLog) << "released discovery socket";
}

} // namespace lanscout::network
