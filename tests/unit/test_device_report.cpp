#include <catch2/catch_test_macros.hpp>

#include "cli/device_report.hpp"

#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace lanscout;
using namespace lanscout::network;
using namespace std::chrono_literals;

namespace {

DeviceRecord record_from(const char* json, const char* origin) {
    return DeviceRecord(QHostAddress(QString::fromLatin1(origin)),
                        QJsonDocument::fromJson(QByteArray(json)).object());
}

} // namespace

TEST_CASE("Listening banner shows whole seconds", "[report]") {
    REQUIRE(cli::format_listening_banner(5000ms)
            == QStringLiteral("Listening for STM32 devices for 5 seconds...\n"));
    REQUIRE(cli::format_listening_banner(1500ms)
            == QStringLiteral("Listening for STM32 devices for 1.5 seconds...\n"));
}

TEST_CASE("Device block lists every known field", "[report]") {
    const auto device = record_from(
        R"({"hostname":"stm32-lab","ip":"10.0.0.5","type":"STM32F4","version":"1.2.0"})", "10.0.0.5");

    REQUIRE(cli::format_device_block(device) == QStringLiteral(
        "\n"
        "=== STM32 Device Found ===\n"
        "Hostname: stm32-lab\n"
        "IP Address: 10.0.0.5\n"
        "Device Type: STM32F4\n"
        "Firmware Version: 1.2.0\n"
        "========================\n"
        "\n"));
}

TEST_CASE("Device block falls back to Unknown and omits missing firmware", "[report]") {
    const auto device = record_from(R"({"foo":"bar"})", "10.0.0.7");

    REQUIRE(cli::format_device_block(device) == QStringLiteral(
        "\n"
        "=== STM32 Device Found ===\n"
        "Hostname: Unknown\n"
        "IP Address: 10.0.0.7\n"
        "Device Type: Unknown\n"
        "========================\n"
        "\n"));
}

TEST_CASE("Device block prints the observed origin, not the claimed ip", "[report]") {
    const auto device = record_from(R"({"hostname":"spoof","ip":"10.0.0.9"})", "10.0.0.5");
    const auto block = cli::format_device_block(device);

    REQUIRE(block.contains(QStringLiteral("IP Address: 10.0.0.5\n")));
    REQUIRE_FALSE(block.contains(QStringLiteral("10.0.0.9")));
}

TEST_CASE("Summary reports the device count", "[report]") {
    REQUIRE(cli::format_summary(0) == QStringLiteral("\nNo STM32 devices found on the network.\n"));
    REQUIRE(cli::format_summary(1) == QStringLiteral("\nFound 1 STM32 device(s) on the network.\n"));
    REQUIRE(cli::format_summary(3) == QStringLiteral("\nFound 3 STM32 device(s) on the network.\n"));
}

TEST_CASE("JSON report carries devices and session flags", "[report][json]") {
    DiscoveryResult result;
    result.devices.push_back(record_from(R"({"hostname":"dev-A","uptime":12})", "10.0.0.5"));
    result.cancelled = true;
    result.rejected_datagrams = 2;

    const auto doc = QJsonDocument::fromJson(cli::format_result_json(result).toUtf8());
    REQUIRE(doc.isObject());
    const auto root = doc.object();

    REQUIRE(root.value(QStringLiteral("cancelled")).toBool());
    REQUIRE(root.value(QStringLiteral("rejectedDatagrams")).toInt() == 2);
    REQUIRE_FALSE(root.contains(QStringLiteral("probeError")));

    const auto devices = root.value(QStringLiteral("devices")).toArray();
    REQUIRE(devices.size() == 1);
    const auto entry = devices.at(0).toObject();
    REQUIRE(entry.value(QStringLiteral("origin")).toString() == QStringLiteral("10.0.0.5"));
    const auto fields = entry.value(QStringLiteral("fields")).toObject();
    REQUIRE(fields.value(QStringLiteral("hostname")).toString() == QStringLiteral("dev-A"));
    REQUIRE(fields.value(QStringLiteral("uptime")).toInt() == 12);
}

TEST_CASE("JSON report includes the probe error when the send failed", "[report][json]") {
    DiscoveryResult result;
    result.probe_error = TransportError{TransportErrorKind::SendFailed, "Network unreachable"};

    const auto root = QJsonDocument::fromJson(cli::format_result_json(result).toUtf8()).object();
    REQUIRE(root.value(QStringLiteral("probeError")).toString() == QStringLiteral("Network unreachable"));
    REQUIRE(root.value(QStringLiteral("devices")).toArray().isEmpty());
    REQUIRE_FALSE(root.value(QStringLiteral("cancelled")).toBool());
}

TEST_CASE("JSON report includes the receive error when collection ended early", "[report][json]") {
    DiscoveryResult result;
    result.receive_error = TransportError{TransportErrorKind::Receive, "Connection refused"};

    const auto root = QJsonDocument::fromJson(cli::format_result_json(result).toUtf8()).object();
    REQUIRE(root.value(QStringLiteral("receiveError")).toString() == QStringLiteral("Connection refused"));
    REQUIRE_FALSE(root.contains(QStringLiteral("probeError")));
}

TEST_CASE("Receive warning names the error kind", "[report]") {
    const TransportError error{TransportErrorKind::Receive, "Connection refused"};

    REQUIRE(cli::format_receive_warning(error)
            == QStringLiteral("\nWarning: collection ended early (receive): Connection refused\n"));
}
