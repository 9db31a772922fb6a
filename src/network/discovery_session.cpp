#include "network/discovery_session.hpp"

#include "core/logging.hpp"
#include "network/device_registry.hpp"
#include "network/listener.hpp"

#include <QScopeGuard>
#include <QThread>

#include <exception>
#include <future>
#include <memory>

namespace lanscout::network {
namespace {

// Waits for a value the worker promised. nullopt means the worker is not
// running and never delivered it, e.g. the thread failed to start.
template<typename T>
std::optional<T> await_worker(std::future<T>& future,
                              const QThread& worker,
                              std::chrono::milliseconds poll) {
    while (future.wait_for(poll) != std::future_status::ready) {
        if (!worker.isRunning()) {
            if (future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                break;
            }
            return std::nullopt;
        }
    }
    return future.get();
}

} // namespace

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Listening: return "listening";
        case SessionState::Probing: return "probing";
        case SessionState::Collecting: return "collecting";
        case SessionState::Done: return "done";
    }
    return "unknown";
}

DiscoverySession::DiscoverySession(DiscoveryConfig config, CancellationToken token)
    : config_(std::move(config))
    , token_(std::move(token))
{
}

void DiscoverySession::set_state(SessionState state) {
    state_.store(state);
    qCDebug(lanscoutDiscoveryLog) << "session state ->" << to_string(state);
}

Result<DiscoveryResult, TransportError> DiscoverySession::run() {
    using RunResult = Result<DiscoveryResult, TransportError>;
    using BindResult = Result<uint16_t, TransportError>;
    using ProbeResult = Result<void, TransportError>;

    if (started_) {
        return RunResult::err(TransportError{TransportErrorKind::SessionReused,
                                             "a discovery session can only run once"});
    }
    started_ = true;

    const auto valid = config_.validate();
    if (valid.is_err()) {
        set_state(SessionState::Done);
        return RunResult::err(TransportError{TransportErrorKind::SocketSetup,
                                             "invalid configuration: " + valid.unwrap_err().message});
    }
    if (!prober_) {
        prober_ = std::make_unique<BroadcastProber>(config_.broadcast_address);
    }

    DeviceRegistry registry;
    // Stops the listener when the session aborts; also follows the caller's token.
    const auto listener_stop = token_.child();

    // Worker -> session: bind outcome, then probe outcome.
    // Session -> worker: whether to go ahead with the probe.
    std::promise<BindResult> bound_promise;
    std::promise<bool> go_promise;
    std::promise<ProbeResult> probe_promise;
    auto bound_future = bound_promise.get_future();
    auto go_future = go_promise.get_future();
    auto probe_future = probe_promise.get_future();

    size_t rejected = 0;
    bool cancelled = false;
    std::optional<TransportError> receive_error;
    const Prober& prober = *prober_;

    // The listener socket is created, probed from, polled and destroyed on the worker.
    std::unique_ptr<QThread> worker(QThread::create([&] {
        bool bound_reported = false;
        bool probe_reported = false;
        try {
            ResponseListener listener(config_, registry, listener_stop);
            listener.on_device = on_device;
            listener.on_rejected = on_rejected;

            auto bound = listener.bind();
            const bool ok = bound.is_ok();
            const uint16_t port = ok ? bound.unwrap() : 0;
            bound_reported = true;
            bound_promise.set_value(std::move(bound));
            if (!ok || !go_future.get()) {
                return;
            }

            auto probe = listener.send_probe(prober, port);
            const bool fatal = probe.is_err() && probe.unwrap_err().kind != TransportErrorKind::SendFailed;
            probe_reported = true;
            probe_promise.set_value(std::move(probe));
            if (fatal) {
                return;
            }

            listener.listen(config_.window);
            rejected = listener.rejected_count();
            cancelled = listener.was_cancelled();
            receive_error = listener.receive_error();
        } catch (const std::exception& e) {
            qCWarning(lanscoutDiscoveryLog) << "listener worker failed:" << e.what();
            TransportError error{TransportErrorKind::SocketSetup, e.what()};
            if (!bound_reported) {
                bound_promise.set_value(BindResult::err(std::move(error)));
            } else if (!probe_reported) {
                probe_promise.set_value(ProbeResult::err(std::move(error)));
            } else {
                error.kind = TransportErrorKind::Receive;
                receive_error = std::move(error);
            }
        }
    }));
    worker->setObjectName(QStringLiteral("lanscout-listener"));

    bool go_sent = false;
    const auto join_worker = qScopeGuard([&] {
        if (!go_sent) {
            go_sent = true;
            go_promise.set_value(false);
        }
        if (worker->isRunning()) {
            listener_stop.cancel();
            worker->wait();
        }
        set_state(SessionState::Done);
    });

    set_state(SessionState::Listening);
    worker->start();

    auto bound = await_worker(bound_future, *worker, config_.poll_interval);
    if (!bound) {
        return RunResult::err(TransportError{TransportErrorKind::SocketSetup,
                                             "listener thread did not start"});
    }
    if (bound->is_err()) {
        return RunResult::err(bound->unwrap_err());
    }
    const uint16_t port = bound->unwrap();
    qCInfo(lanscoutDiscoveryLog) << "listening for STM32 devices on port" << port
                                 << "for" << config_.window.count() << "ms";
    if (on_listening) {
        on_listening(port);
    }

    set_state(SessionState::Probing);
    go_sent = true;
    go_promise.set_value(true);

    auto probe = await_worker(probe_future, *worker, config_.poll_interval);
    if (!probe) {
        return RunResult::err(TransportError{TransportErrorKind::SocketSetup,
                                             "listener thread stopped before probing"});
    }
    DiscoveryResult result;
    if (probe->is_err()) {
        const auto& error = probe->unwrap_err();
        if (error.kind != TransportErrorKind::SendFailed) {
            // The probe could not be attempted at all; the worker has already
            // released the socket and join_worker reaps it.
            return RunResult::err(error);
        }
        qCWarning(lanscoutDiscoveryLog) << "probe send failed, still collecting responses:"
                                        << error.message.c_str();
        result.probe_error = error;
    }

    set_state(SessionState::Collecting);
    worker->wait();

    result.devices = registry.snapshot();
    result.cancelled = cancelled;
    result.rejected_datagrams = rejected;
    result.receive_error = std::move(receive_error);

    if (result.receive_error) {
        qCWarning(lanscoutDiscoveryLog) << "collection ended early:" << result.receive_error->message.c_str();
    }
    qCInfo(lanscoutDiscoveryLog) << "discovery finished:" << result.devices.size() << "device(s),"
                                 << result.rejected_datagrams << "rejected datagram(s)"
                                 << (result.cancelled ? "(cancelled)" : "");
    return RunResult::ok(std::move(result));
}

Result<DiscoveryResult, TransportError> discover(const DiscoveryConfig& config,
                                                 CancellationToken token) {
    DiscoverySession session(config, std::move(token));
    return session.run();
}

} // namespace lanscout::network
