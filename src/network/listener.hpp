#pragma once

#include "core/cancellation.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "network/device_record.hpp"
#include "network/device_registry.hpp"
#include "network/discovery_config.hpp"
#include "network/prober.hpp"

#include <QHostAddress>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

class QNetworkDatagram;
class QUdpSocket;

namespace lanscout::network {

/**
 * ResponseListener - collects probe responses on the discovery port.
 *
 * bind() and listen() must run on the same thread; the socket belongs to
 * that thread and is released before listen() returns, whichever way the
 * loop ends.
 *
 * listen() never blocks longer than one poll interval at a time, so it
 * honours both the window deadline and the cancellation token even when
 * no datagrams arrive.
 */
class ResponseListener {
public:
    ResponseListener(DiscoveryConfig config, DeviceRegistry& registry, CancellationToken token);
    ~ResponseListener();

    ResponseListener(const ResponseListener&) = delete;
    ResponseListener& operator=(const ResponseListener&) = delete;

    // Binds the receive socket and returns the port actually bound.
    [[nodiscard]] Result<uint16_t, TransportError> bind();

    // Sends the probe from the bound socket so replies addressed to the
    // probe's source port arrive here. Call between bind() and listen().
    [[nodiscard]] Result<void, TransportError> send_probe(const Prober& prober, uint16_t port);

    // Receives until `window` elapses or the token is cancelled, then
    // returns the registry snapshot.
    std::vector<DeviceRecord> listen(std::chrono::milliseconds window);

    [[nodiscard]] bool is_bound() const noexcept { return socket_ != nullptr; }

    // True only when the loop ended because the token was cancelled before
    // the window elapsed. Read only after listen() returned.
    [[nodiscard]] bool was_cancelled() const noexcept { return cancelled_; }

    // Datagrams the decoder rejected. Read only after listen() returned.
    [[nodiscard]] size_t rejected_count() const noexcept { return rejected_; }

    // Set when the loop ended on a socket error rather than the deadline.
    [[nodiscard]] const std::optional<TransportError>& receive_error() const noexcept {
        return receive_error_;
    }

    // Callbacks, invoked on the listening thread.
    std::function<void(const DeviceRecord&)> on_device;
    std::function<void(const QHostAddress&, const DecodeError&)> on_rejected;

private:
    void handle_datagram(const QNetworkDatagram& datagram);
    void release();

    DiscoveryConfig config_;
    DeviceRegistry& registry_;
    CancellationToken token_;
    std::unique_ptr<QUdpSocket> socket_;
    size_t rejected_ = 0;
    bool cancelled_ = false;
    std::optional<TransportError> receive_error_;
};

} // namespace lanscout::network
