#include "network/device_registry.hpp"

#include <QMutexLocker>

namespace lanscout::network {

bool DeviceRegistry::try_insert(const QString& origin_address, DeviceRecord record) {
    QMutexLocker lock(&mu_);
    if (seen_.contains(origin_address)) {
        return false;
    }
    seen_.insert(origin_address);
    devices_.push_back(std::move(record));
    return true;
}

std::vector<DeviceRecord> DeviceRegistry::snapshot() const {
    QMutexLocker lock(&mu_);
    return devices_;
}

bool DeviceRegistry::contains(const QString& origin_address) const {
    QMutexLocker lock(&mu_);
    return seen_.contains(origin_address);
}

size_t DeviceRegistry::size() const {
    QMutexLocker lock(&mu_);
    return devices_.size();
}

} // namespace lanscout::network
