#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>

#include "network/device_registry.hpp"
#include "network/response_decoder.hpp"

#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>

#include <cstdlib>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace lanscout::network;

namespace {

QString address_for(int octet) {
    return QStringLiteral("10.0.0.%1").arg(octet);
}

} // namespace

TEST_CASE("Property: registry holds one record per distinct origin", "[property][registry]") {
    rc::check("N responses from K distinct addresses yield K records, first one kept",
        [](const std::vector<int>& raw_octets) {
            DeviceRegistry registry;
            std::vector<int> first_seen;
            std::set<int> distinct;

            for (size_t seq = 0; seq < raw_octets.size(); ++seq) {
                const int octet = 1 + std::abs(raw_octets[seq] % 254);
                const auto address = address_for(octet);
                QJsonObject fields;
                fields.insert(QStringLiteral("hostname"), QStringLiteral("dev-%1").arg(octet));
                fields.insert(QStringLiteral("seq"), static_cast<int>(seq));

                const bool inserted = registry.try_insert(address, DeviceRecord(QHostAddress(address), fields));
                RC_ASSERT(inserted == distinct.insert(octet).second);
                if (inserted) {
                    first_seen.push_back(octet);
                }
            }

            const auto devices = registry.snapshot();
            RC_ASSERT(devices.size() == distinct.size());
            for (size_t i = 0; i < devices.size(); ++i) {
                RC_ASSERT(devices[i].origin_address() == address_for(first_seen[i]));
                // The retained record is the earliest response from that address.
                int earliest = -1;
                for (size_t seq = 0; seq < raw_octets.size(); ++seq) {
                    if (1 + std::abs(raw_octets[seq] % 254) == first_seen[i]) {
                        earliest = static_cast<int>(seq);
                        break;
                    }
                }
                RC_ASSERT(devices[i].raw_fields().value(QStringLiteral("seq")).toInt() == earliest);
            }
            return true;
        }
    );
}

TEST_CASE("Property: decoder preserves every field of a JSON object", "[property][decoder]") {
    rc::check("decode(encode(fields)).raw_fields() == fields",
        [](const std::map<std::string, std::string>& entries) {
            if (entries.empty()) return true;  // an empty object is not a valid response

            QJsonObject fields;
            for (const auto& [key, value] : entries) {
                fields.insert(QString::fromStdString(key), QString::fromStdString(value));
            }
            // Distinct std::string keys can collapse to one QString after
            // invalid UTF-8 is replaced.
            if (fields.isEmpty()) return true;

            const auto payload = QJsonDocument(fields).toJson(QJsonDocument::Compact);
            const QHostAddress sender(QStringLiteral("10.0.0.5"));
            const auto decoded = decode_response(payload, sender);

            RC_ASSERT(decoded.is_ok());
            RC_ASSERT(decoded.unwrap().raw_fields() == fields);
            RC_ASSERT(decoded.unwrap().origin_address() == QStringLiteral("10.0.0.5"));
            return true;
        }
    );
}

TEST_CASE("Property: decoder never accepts invalid UTF-8", "[property][decoder]") {
    rc::check("payloads containing a stray continuation byte are rejected",
        [](const std::string& prefix) {
            QByteArray payload = QByteArray::fromStdString(prefix);
            payload.append(char(0x80));
            payload.append("{\"hostname\":\"x\"}");

            const auto decoded = decode_response(payload, QHostAddress(QStringLiteral("10.0.0.5")));
            RC_ASSERT(decoded.is_err());
            return true;
        }
    );
}
