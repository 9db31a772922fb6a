#pragma once

#include <QHostAddress>
#include <QJsonObject>
#include <QString>

#include <optional>

namespace lanscout::network {

/**
 * DeviceRecord - one device that answered the discovery probe.
 *
 * Built in a single step from one decoded response and never modified
 * afterwards. Identity is the address the datagram actually came from;
 * the payload's own "ip" field is kept only as claimed_ip().
 *
 * Recognized response keys:
 * - hostname : human-readable name
 * - ip       : address the device believes it has (informational)
 * - type     : device classification
 * - version  : firmware version, optional
 */
class DeviceRecord {
public:
    DeviceRecord(const QHostAddress& origin, QJsonObject raw_fields);

    [[nodiscard]] const QHostAddress& origin() const noexcept { return origin_; }
    [[nodiscard]] const QString& origin_address() const noexcept { return origin_address_; }

    [[nodiscard]] const std::optional<QString>& hostname() const noexcept { return hostname_; }
    [[nodiscard]] const std::optional<QString>& device_type() const noexcept { return device_type_; }
    [[nodiscard]] const std::optional<QString>& firmware_version() const noexcept { return firmware_version_; }
    [[nodiscard]] const std::optional<QString>& claimed_ip() const noexcept { return claimed_ip_; }

    [[nodiscard]] const QJsonObject& raw_fields() const noexcept { return raw_fields_; }

    bool operator==(const DeviceRecord& other) const {
        return origin_address_ == other.origin_address_ && raw_fields_ == other.raw_fields_;
    }

private:
    QHostAddress origin_;
    QString origin_address_;
    std::optional<QString> hostname_;
    std::optional<QString> device_type_;
    std::optional<QString> firmware_version_;
    std::optional<QString> claimed_ip_;
    QJsonObject raw_fields_;
};

// Strips the IPv4-mapped IPv6 form (::ffff:a.b.c.d) so that one device
// always yields the same dotted-quad key.
[[nodiscard]] QHostAddress canonical_address(const QHostAddress& address);

} // namespace lanscout::network
