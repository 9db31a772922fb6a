#pragma once

#include "core/cancellation.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "network/device_record.hpp"
#include "network/discovery_config.hpp"
#include "network/prober.hpp"

#include <QHostAddress>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace lanscout::network {

/**
 * DiscoveryResult - what one discovery session found.
 */
struct DiscoveryResult {
    // Unique by origin address, in first-seen order.
    std::vector<DeviceRecord> devices;
    // Set when the probe send was rejected; collection still ran.
    std::optional<TransportError> probe_error;
    // Set when collection ended early on a socket error; the window was cut short.
    std::optional<TransportError> receive_error;
    bool cancelled = false;
    size_t rejected_datagrams = 0;
};

enum class SessionState {
    Idle,
    Listening,
    Probing,
    Collecting,
    Done,
};

[[nodiscard]] const char* to_string(SessionState state) noexcept;

/**
 * DiscoverySession - one probe, one bounded collection window.
 *
 * run() binds the listener on a worker thread, waits until the bind is
 * confirmed, has the worker send exactly one probe from the listening
 * socket to the bound port, then waits for the worker to finish its window. A session runs once; a second run() fails
 * with TransportErrorKind::SessionReused.
 *
 * Only transport setup failures (listener bind, probe socket) fail the
 * session. A rejected probe send is recorded in DiscoveryResult::probe_error.
 * Cancellation ends the window early and returns what was collected.
 */
class DiscoverySession {
public:
    explicit DiscoverySession(DiscoveryConfig config, CancellationToken token = {});

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    [[nodiscard]] Result<DiscoveryResult, TransportError> run();

    [[nodiscard]] SessionState state() const noexcept { return state_.load(); }
    [[nodiscard]] const DiscoveryConfig& config() const noexcept { return config_; }

    // Replaces the default BroadcastProber. Must be called before run().
    void set_prober(std::unique_ptr<Prober> prober) { prober_ = std::move(prober); }

    // Callbacks. on_listening runs on the calling thread after the bind is
    // confirmed and before the probe; the others run on the worker thread.
    std::function<void(uint16_t port)> on_listening;
    std::function<void(const DeviceRecord&)> on_device;
    std::function<void(const QHostAddress&, const DecodeError&)> on_rejected;

private:
    void set_state(SessionState state);

    DiscoveryConfig config_;
    CancellationToken token_;
    std::unique_ptr<Prober> prober_;
    std::atomic<SessionState> state_{SessionState::Idle};
    bool started_ = false;
};

// Convenience entry point: one session with the given config.
[[nodiscard]] Result<DiscoveryResult, TransportError> discover(const DiscoveryConfig& config,
                                                               CancellationToken token = {});

} // namespace lanscout::network
