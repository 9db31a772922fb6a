#pragma once

#include "network/device_record.hpp"
#include "network/discovery_session.hpp"

#include <QString>

#include <chrono>

namespace lanscout::cli {

// "Listening for STM32 devices for 5 seconds..." banner.
[[nodiscard]] QString format_listening_banner(std::chrono::milliseconds window);

// One "=== STM32 Device Found ===" block. Missing fields read "Unknown";
// the firmware line only appears when the device reported a version.
[[nodiscard]] QString format_device_block(const network::DeviceRecord& device);

[[nodiscard]] QString format_summary(size_t device_count);

// "Collection ended early" notice for a window cut short by a socket error.
[[nodiscard]] QString format_receive_warning(const TransportError& error);

// JSON output:
// {
//   "devices": [{ "origin": "10.0.0.5", "fields": { ...raw response... } }],
//   "cancelled": false,
//   "rejectedDatagrams": 0,
//   "probeError"?: "...",
//   "receiveError"?: "..."
// }
[[nodiscard]] QString format_result_json(const network::DiscoveryResult& result);

} // namespace lanscout::cli
