#include "network/device_record.hpp"

#include <QJsonValue>

namespace lanscout::network {
namespace {

std::optional<QString> string_field(const QJsonObject& obj, const QString& key) {
    const auto value = obj.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

} // namespace

QHostAddress canonical_address(const QHostAddress& address) {
    bool is_v4 = false;
    const quint32 v4 = address.toIPv4Address(&is_v4);
    if (is_v4) {
        return QHostAddress(v4);
    }
    return address;
}

DeviceRecord::DeviceRecord(const QHostAddress& origin, QJsonObject raw_fields)
    : origin_(canonical_address(origin))
    , origin_address_(origin_.toString())
    , hostname_(string_field(raw_fields, QStringLiteral("hostname")))
    , device_type_(string_field(raw_fields, QStringLiteral("type")))
    , firmware_version_(string_field(raw_fields, QStringLiteral("version")))
    , claimed_ip_(string_field(raw_fields, QStringLiteral("ip")))
    , raw_fields_(std::move(raw_fields))
{
}

} // namespace lanscout::network
