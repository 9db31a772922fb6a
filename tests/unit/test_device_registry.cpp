#include <catch2/catch_test_macros.hpp>

#include "network/device_registry.hpp"

#include <QHostAddress>
#include <QJsonObject>

#include <atomic>
#include <thread>
#include <vector>

using namespace lanscout::network;

namespace {

DeviceRecord make_record(const QString& address, const QString& hostname) {
    QJsonObject fields;
    fields.insert(QStringLiteral("hostname"), hostname);
    return DeviceRecord(QHostAddress(address), fields);
}

} // namespace

TEST_CASE("Registry starts empty", "[registry]") {
    DeviceRegistry registry;
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.snapshot().empty());
    REQUIRE_FALSE(registry.contains(QStringLiteral("10.0.0.5")));
}

TEST_CASE("Registry keeps the first record per address", "[registry]") {
    DeviceRegistry registry;
    REQUIRE(registry.try_insert(QStringLiteral("10.0.0.5"), make_record("10.0.0.5", "dev-A")));
    REQUIRE_FALSE(registry.try_insert(QStringLiteral("10.0.0.5"), make_record("10.0.0.5", "dev-A-again")));

    const auto devices = registry.snapshot();
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].hostname() == QStringLiteral("dev-A"));
}

TEST_CASE("Registry snapshot is in first-seen order", "[registry]") {
    DeviceRegistry registry;
    registry.try_insert(QStringLiteral("10.0.0.9"), make_record("10.0.0.9", "dev-B"));
    registry.try_insert(QStringLiteral("10.0.0.5"), make_record("10.0.0.5", "dev-A"));
    registry.try_insert(QStringLiteral("10.0.0.9"), make_record("10.0.0.9", "dev-B2"));
    registry.try_insert(QStringLiteral("10.0.0.7"), make_record("10.0.0.7", "dev-C"));

    const auto devices = registry.snapshot();
    REQUIRE(devices.size() == 3);
    REQUIRE(devices[0].origin_address() == QStringLiteral("10.0.0.9"));
    REQUIRE(devices[1].origin_address() == QStringLiteral("10.0.0.5"));
    REQUIRE(devices[2].origin_address() == QStringLiteral("10.0.0.7"));
    REQUIRE(registry.contains(QStringLiteral("10.0.0.7")));
}

TEST_CASE("Registry snapshot is a copy", "[registry]") {
    DeviceRegistry registry;
    registry.try_insert(QStringLiteral("10.0.0.5"), make_record("10.0.0.5", "dev-A"));
    const auto before = registry.snapshot();

    registry.try_insert(QStringLiteral("10.0.0.9"), make_record("10.0.0.9", "dev-B"));

    REQUIRE(before.size() == 1);
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Registry is safe under concurrent inserts", "[registry][threads]") {
    DeviceRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kAddresses = 200;
    std::atomic<int> inserted{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, &inserted, t] {
            // Every thread offers every address, so each one races kThreads ways.
            for (int i = 0; i < kAddresses; ++i) {
                const auto address = QStringLiteral("10.0.%1.%2").arg(i / 100).arg(i % 100 + 1);
                if (registry.try_insert(address, make_record(address, QStringLiteral("t%1").arg(t)))) {
                    inserted.fetch_add(1);
                }
                (void)registry.snapshot();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(inserted.load() == kAddresses);
    REQUIRE(registry.size() == kAddresses);
    REQUIRE(registry.snapshot().size() == kAddresses);
}
