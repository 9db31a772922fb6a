#include "cli/device_report.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace lanscout::cli {

namespace {

[[nodiscard]] QString or_unknown(const std::optional<QString>& value) {
    return value.value_or(QStringLiteral("Unknown"));
}

[[nodiscard]] QString format_seconds(std::chrono::milliseconds window) {
    if (window.count() % 1000 == 0) {
        return QString::number(window.count() / 1000);
    }
    return QString::number(static_cast<double>(window.count()) / 1000.0, 'g', 6);
}

} // namespace

QString format_listening_banner(std::chrono::milliseconds window) {
    return QStringLiteral("Listening for STM32 devices for %1 seconds...\n")
        .arg(format_seconds(window));
}

QString format_device_block(const network::DeviceRecord& device) {
    QStringList lines;
    lines.append(QString{});
    lines.append(QStringLiteral("=== STM32 Device Found ==="));
    lines.append(QStringLiteral("Hostname: ") + or_unknown(device.hostname()));
    lines.append(QStringLiteral("IP Address: ") + device.origin_address());
    lines.append(QStringLiteral("Device Type: ") + or_unknown(device.device_type()));
    if (device.firmware_version()) {
        lines.append(QStringLiteral("Firmware Version: ") + *device.firmware_version());
    }
    lines.append(QStringLiteral("========================"));
    lines.append(QString{});
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_summary(size_t device_count) {
    if (device_count == 0) {
        return QStringLiteral("\nNo STM32 devices found on the network.\n");
    }
    return QStringLiteral("\nFound %1 STM32 device(s) on the network.\n").arg(static_cast<qulonglong>(device_count));
}

QString format_receive_warning(const TransportError& error) {
    return QStringLiteral("\nWarning: collection ended early (%1): %2\n")
        .arg(QString::fromLatin1(to_string(error.kind)), QString::fromStdString(error.message));
}

QString format_result_json(const network::DiscoveryResult& result) {
    QJsonArray devices;
    for (const auto& device : result.devices) {
        QJsonObject entry;
        entry.insert(QStringLiteral("origin"), device.origin_address());
        entry.insert(QStringLiteral("fields"), device.raw_fields());
        devices.append(entry);
    }

    QJsonObject root;
    root.insert(QStringLiteral("devices"), devices);
    root.insert(QStringLiteral("cancelled"), result.cancelled);
    root.insert(QStringLiteral("rejectedDatagrams"), static_cast<qint64>(result.rejected_datagrams));
    if (result.probe_error) {
        root.insert(QStringLiteral("probeError"), QString::fromStdString(result.probe_error->message));
    }
    if (result.receive_error) {
        root.insert(QStringLiteral("receiveError"), QString::fromStdString(result.receive_error->message));
    }

    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace lanscout::cli
