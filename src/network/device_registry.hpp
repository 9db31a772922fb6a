#pragma once

#include "network/device_record.hpp"

#include <QMutex>
#include <QSet>
#include <QString>

#include <vector>

namespace lanscout::network {

/**
 * DeviceRegistry - devices found during one discovery session.
 *
 * Append-only and deduplicated by origin address: the first response from an
 * address wins, later ones are dropped without merging. Safe for any number
 * of concurrent writers and readers.
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Inserts iff no entry has this origin address. Returns whether it did.
    bool try_insert(const QString& origin_address, DeviceRecord record);

    // All entries in first-inserted order.
    [[nodiscard]] std::vector<DeviceRecord> snapshot() const;

    [[nodiscard]] bool contains(const QString& origin_address) const;
    [[nodiscard]] size_t size() const;

private:
    mutable QMutex mu_;
    QSet<QString> seen_;
    std::vector<DeviceRecord> devices_;
};

} // namespace lanscout::network
