#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"

#include <QHostAddress>
#include <QString>

#include <chrono>
#include <cstdint>

namespace lanscout::network {

// Wire protocol constants shared with the firmware responder.
inline constexpr uint16_t kDiscoveryPort = 5678;
inline constexpr const char* kProbeMessage = "DISCOVER_STM32";
inline constexpr qint64 kMaxDatagramSize = 1024;

inline constexpr std::chrono::milliseconds kDefaultWindow{5000};
inline constexpr std::chrono::milliseconds kDefaultPollInterval{250};
inline constexpr std::chrono::milliseconds kMinPollInterval{1};
inline constexpr std::chrono::milliseconds kMaxPollInterval{10000};
inline constexpr qint64 kMaxUdpPayload = 65507;

/**
 * DiscoveryConfig - tunables for one discovery session.
 *
 * Defaults match the firmware protocol. A port of 0 asks the OS for an
 * ephemeral listening port; the probe then targets whatever port the
 * listener actually bound.
 */
struct DiscoveryConfig {
    uint16_t port = kDiscoveryPort;
    QHostAddress broadcast_address{QHostAddress::Broadcast};
    QHostAddress bind_address{QHostAddress::AnyIPv4};
    std::chrono::milliseconds window = kDefaultWindow;
    // Upper bound on one blocking receive. Smaller values notice
    // cancellation sooner at the cost of more wakeups.
    std::chrono::milliseconds poll_interval = kDefaultPollInterval;
    qint64 max_datagram_size = kMaxDatagramSize;

    [[nodiscard]] Result<void, ConfigError> validate() const;
};

// Overrides fields from LANSCOUT_PORT, LANSCOUT_BROADCAST_ADDR,
// LANSCOUT_TIMEOUT_S and LANSCOUT_POLL_MS when they are set.
[[nodiscard]] Result<DiscoveryConfig, ConfigError> apply_environment(DiscoveryConfig config);

[[nodiscard]] Result<uint16_t, ConfigError> parse_port(const QString& text);
[[nodiscard]] Result<QHostAddress, ConfigError> parse_broadcast_address(const QString& text);
[[nodiscard]] Result<std::chrono::milliseconds, ConfigError> parse_window_seconds(const QString& text);
[[nodiscard]] Result<std::chrono::milliseconds, ConfigError> parse_poll_interval_ms(const QString& text);

} // namespace lanscout::network
