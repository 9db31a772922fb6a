#include "network/discovery_config.hpp"

#include <QAbstractSocket>
#include <QtGlobal>

#include <cmath>

namespace lanscout::network {
namespace {

using ConfigResult = Result<void, ConfigError>;

ConfigError config_error(const QString& message) {
    return ConfigError{message.toStdString()};
}

} // namespace

Result<void, ConfigError> DiscoveryConfig::validate() const {
    if (broadcast_address.isNull() ||
        broadcast_address.protocol() != QAbstractSocket::IPv4Protocol) {
        return ConfigResult::err(ConfigError{"broadcast address must be an IPv4 address"});
    }
    if (bind_address.isNull()) {
        return ConfigResult::err(ConfigError{"bind address is not set"});
    }
    if (window.count() < 0) {
        return ConfigResult::err(ConfigError{"discovery window must not be negative"});
    }
    if (poll_interval < kMinPollInterval || poll_interval > kMaxPollInterval) {
        return ConfigResult::err(config_error(
            QStringLiteral("poll interval must be between %1 and %2 ms")
                .arg(kMinPollInterval.count())
                .arg(kMaxPollInterval.count())));
    }
    if (max_datagram_size <= 0 || max_datagram_size > kMaxUdpPayload) {
        return ConfigResult::err(config_error(
            QStringLiteral("max datagram size must be between 1 and %1 bytes").arg(kMaxUdpPayload)));
    }
    return ConfigResult::ok();
}

Result<DiscoveryConfig, ConfigError> apply_environment(DiscoveryConfig config) {
    using Out = Result<DiscoveryConfig, ConfigError>;

    if (qEnvironmentVariableIsSet("LANSCOUT_PORT")) {
        auto port = parse_port(qEnvironmentVariable("LANSCOUT_PORT"));
        if (port.is_err()) return Out::err(port.unwrap_err());
        config.port = port.unwrap();
    }
    if (qEnvironmentVariableIsSet("LANSCOUT_BROADCAST_ADDR")) {
        auto address = parse_broadcast_address(qEnvironmentVariable("LANSCOUT_BROADCAST_ADDR"));
        if (address.is_err()) return Out::err(address.unwrap_err());
        config.broadcast_address = address.unwrap();
    }
    if (qEnvironmentVariableIsSet("LANSCOUT_TIMEOUT_S")) {
        auto window = parse_window_seconds(qEnvironmentVariable("LANSCOUT_TIMEOUT_S"));
        if (window.is_err()) return Out::err(window.unwrap_err());
        config.window = window.unwrap();
    }
    if (qEnvironmentVariableIsSet("LANSCOUT_POLL_MS")) {
        auto poll = parse_poll_interval_ms(qEnvironmentVariable("LANSCOUT_POLL_MS"));
        if (poll.is_err()) return Out::err(poll.unwrap_err());
        config.poll_interval = poll.unwrap();
    }
    return Out::ok(std::move(config));
}

Result<uint16_t, ConfigError> parse_port(const QString& text) {
    using Out = Result<uint16_t, ConfigError>;
    bool ok = false;
    const uint value = text.trimmed().toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        return Out::err(config_error(QStringLiteral("invalid port '%1'").arg(text)));
    }
    return Out::ok(static_cast<uint16_t>(value));
}

Result<QHostAddress, ConfigError> parse_broadcast_address(const QString& text) {
    using Out = Result<QHostAddress, ConfigError>;
    const QHostAddress address(text.trimmed());
    if (address.isNull() || address.protocol() != QAbstractSocket::IPv4Protocol) {
        return Out::err(config_error(QStringLiteral("invalid IPv4 broadcast address '%1'").arg(text)));
    }
    return Out::ok(address);
}

Result<std::chrono::milliseconds, ConfigError> parse_window_seconds(const QString& text) {
    using Out = Result<std::chrono::milliseconds, ConfigError>;
    bool ok = false;
    const double seconds = text.trimmed().toDouble(&ok);
    // One day is far beyond any sensible discovery window.
    if (!ok || !std::isfinite(seconds) || seconds < 0.0 || seconds > 86400.0) {
        return Out::err(config_error(QStringLiteral("invalid timeout '%1'").arg(text)));
    }
    return Out::ok(std::chrono::milliseconds(std::llround(seconds * 1000.0)));
}

Result<std::chrono::milliseconds, ConfigError> parse_poll_interval_ms(const QString& text) {
    using Out = Result<std::chrono::milliseconds, ConfigError>;
    bool ok = false;
    const qlonglong value = text.trimmed().toLongLong(&ok);
    if (!ok || value < kMinPollInterval.count() || value > kMaxPollInterval.count()) {
        return Out::err(config_error(QStringLiteral("invalid poll interval '%1'").arg(text)));
    }
    return Out::ok(std::chrono::milliseconds(value));
}

} // namespace lanscout::network
