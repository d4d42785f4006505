#include <gtest/gtest.h>
#include "FakeRadio.hpp"
#include "ConnectionOrchestrator.hpp"
#include "DeviceRegistry.hpp"
#include "Whitelist.hpp"
#include "core/EventBroadcaster.hpp"
#include "core/LogBuffer.hpp"
#include <functional>
#include <future>
#include <thread>

using namespace bluegate;
using bluegate::fakes::FakeRadio;
using errors::ErrorKind;

namespace {

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

struct OrchestratorFixture : public ::testing::Test {
    FakeRadio radio;
    DeviceRegistry registry;
    Whitelist whitelist;
    EventBroadcaster bus{ 256 };
    LogBuffer log{ 200 };
    std::unique_ptr<ConnectionOrchestrator> orch;
    std::shared_ptr<Subscription> sub;

    void SetUp() override {
        log.set_mirror(false);
        whitelist.add("AA:01", "Front door");
        whitelist.add("AA:02", "Back door");
        whitelist.add("AA:03", "Garage");
        registry.upsert(fakes::sighting("AA:01", "lock1", -50));
        registry.upsert(fakes::sighting("AA:02", "lock2", -60));
        // AA:03 is whitelisted but never discovered.
        registry.upsert(fakes::sighting("BB:01", "speaker", -70));
        make(std::chrono::milliseconds(500), false);
    }

    void make(std::chrono::milliseconds timeout, bool restrict) {
        orch = std::make_unique<ConnectionOrchestrator>(radio, registry, whitelist, bus, log,
                                                        OrchestratorOptions{ timeout, restrict });
        if (sub) bus.unsubscribe(sub);
        sub = bus.subscribe();
    }

    size_t count_level(LogLevel level) const {
        size_t n = 0;
        for (const auto& e : log.list()) if (e.level == level) ++n;
        return n;
    }
};

} // namespace

TEST_F(OrchestratorFixture, UnknownAddressIsNotFound) {
    auto r = orch->connect_one("ZZ:99");
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, ErrorKind::NotFound);
    EXPECT_FALSE(registry.contains("ZZ:99"));
    EXPECT_EQ(radio.connect_calls(), 0);

    auto d = orch->disconnect_one("ZZ:99");
    EXPECT_FALSE(d.success);
    EXPECT_EQ(*d.error, ErrorKind::NotFound);
}

TEST_F(OrchestratorFixture, ConnectIsIdempotent) {
    auto first = orch->connect_one("AA:01");
    EXPECT_TRUE(first.success);
    EXPECT_TRUE(registry.get("AA:01")->connected);
    auto after_first = fakes::drain(*sub);
    EXPECT_EQ(fakes::count_type(after_first, events::DEVICE_CONNECTED), 1u);

    auto second = orch->connect_one("AA:01");
    EXPECT_TRUE(second.success);
    EXPECT_EQ(radio.connect_calls(), 1);
    auto after_second = fakes::drain(*sub);
    EXPECT_EQ(fakes::count_type(after_second, events::DEVICE_CONNECTED), 0u);
    EXPECT_EQ(fakes::count_type(after_second, events::DEVICES_UPDATE), 0u);
}

TEST_F(OrchestratorFixture, ConnectPublishesDeviceThenLinkEvent) {
    ASSERT_TRUE(orch->connect_one("AA:02").success);
    std::vector<std::string> order;
    for (const auto& e : fakes::drain(*sub)) {
        if (e.address && *e.address == "AA:02") order.push_back(e.type);
    }
    ASSERT_GE(order.size(), 2u);
    auto it = std::find(order.begin(), order.end(), events::DEVICES_UPDATE);
    auto jt = std::find(order.begin(), order.end(), events::DEVICE_CONNECTED);
    ASSERT_NE(it, order.end());
    ASSERT_NE(jt, order.end());
    EXPECT_LT(it - order.begin(), jt - order.begin());
}

TEST_F(OrchestratorFixture, ConnectFailureLeavesDeviceDisconnected) {
    radio.set_connect_reply(FakeRadio::Reply::Fail);
    auto r = orch->connect_one("AA:01");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(*r.error, ErrorKind::CapabilityFailure);
    auto d = registry.get("AA:01");
    EXPECT_FALSE(d->connected);
    EXPECT_EQ(d->connection_attempts, 1);
    EXPECT_GE(count_level(LogLevel::Error), 1u);
    // No automatic retry.
    EXPECT_EQ(radio.connect_calls(), 1);
}

TEST_F(OrchestratorFixture, LateResultAfterTimeoutIsIgnored) {
    make(std::chrono::milliseconds(50), false);
    radio.set_connect_reply(FakeRadio::Reply::Hold);

    auto r = orch->connect_one("AA:01");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(*r.error, ErrorKind::Timeout);
    EXPECT_GE(count_level(LogLevel::Error), 1u);
    (void)fakes::drain(*sub);

    ASSERT_TRUE(radio.complete("AA:01", RadioResult{ true, "" }));
    EXPECT_FALSE(registry.get("AA:01")->connected);
    auto evs = fakes::drain(*sub);
    EXPECT_EQ(fakes::count_type(evs, events::DEVICE_CONNECTED), 0u);

    // A fresh attempt still works afterwards.
    radio.set_connect_reply(FakeRadio::Reply::Succeed);
    EXPECT_TRUE(orch->connect_one("AA:01").success);
    EXPECT_TRUE(registry.get("AA:01")->connected);
}

TEST_F(OrchestratorFixture, ResultFromAnotherThreadIsApplied) {
    radio.set_connect_reply(FakeRadio::Reply::Hold);
    auto pending = std::async(std::launch::async, [this]() { return orch->connect_one("AA:02"); });
    ASSERT_TRUE(wait_until([&]() { return radio.held("AA:02") == 1; }));
    std::thread completer([this]() { radio.complete("AA:02", RadioResult{ true, "" }); });
    auto r = pending.get();
    completer.join();
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(registry.get("AA:02")->connected);
}

TEST_F(OrchestratorFixture, DisconnectIsIdempotentAndSymmetric) {
    auto noop = orch->disconnect_one("AA:01");
    EXPECT_TRUE(noop.success);
    EXPECT_EQ(radio.disconnect_calls(), 0);

    ASSERT_TRUE(orch->connect_one("AA:01").success);
    (void)fakes::drain(*sub);
    auto r = orch->disconnect_one("AA:01");
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(registry.get("AA:01")->connected);
    auto evs = fakes::drain(*sub);
    EXPECT_EQ(fakes::count_type(evs, events::DEVICE_DISCONNECTED), 1u);
}

TEST_F(OrchestratorFixture, DisconnectFailureStillDropsLink) {
    ASSERT_TRUE(orch->connect_one("AA:01").success);
    radio.set_disconnect_reply(FakeRadio::Reply::Fail);
    auto r = orch->disconnect_one("AA:01");
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(registry.get("AA:01")->connected);
    EXPECT_GE(count_level(LogLevel::Warning), 1u);
}

TEST_F(OrchestratorFixture, RestrictedConnectRejectsUnlistedDevice) {
    make(std::chrono::milliseconds(500), true);
    auto r = orch->connect_one("BB:01");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(*r.error, ErrorKind::Unauthorized);
    EXPECT_EQ(radio.connect_calls(), 0);
    EXPECT_TRUE(orch->connect_one("AA:01").success);
}

TEST_F(OrchestratorFixture, RestrictedConnectStillReportsUndiscoveredAsNotFound) {
    make(std::chrono::milliseconds(500), true);
    auto r = orch->connect_one("ZZ:42");
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, ErrorKind::NotFound);
    EXPECT_FALSE(registry.contains("ZZ:42"));
    EXPECT_EQ(radio.connect_calls(), 0);
}

TEST_F(OrchestratorFixture, BulkConnectCoversDiscoveredWhitelistInOrder) {
    auto r = orch->connect_all();
    EXPECT_TRUE(r.success);
    ASSERT_EQ(r.results.size(), 2u);
    EXPECT_EQ(r.results[0].address, "AA:01");
    EXPECT_EQ(r.results[1].address, "AA:02");
    EXPECT_TRUE(r.results[0].success);
    EXPECT_TRUE(r.results[1].success);
    // Full-scan-only devices are left alone.
    EXPECT_FALSE(registry.get("BB:01")->connected);
    EXPECT_EQ(orch->connection_state(), ConnectionState::Idle);

    auto evs = fakes::drain(*sub);
    EXPECT_EQ(fakes::count_type(evs, events::CONNECTION_STATUS), 2u);
    EXPECT_EQ(evs.front().type, events::CONNECTION_STATUS);
    EXPECT_EQ(evs.front().data["is_connecting"], true);
}

TEST_F(OrchestratorFixture, BulkFailureOfOneDeviceDoesNotAbortOthers) {
    make(std::chrono::milliseconds(100), false);
    radio.set_connect_reply(FakeRadio::Reply::Hold);
    auto pending = std::async(std::launch::async, [this]() { return orch->connect_all(); });
    ASSERT_TRUE(wait_until([&]() { return radio.held("AA:01") == 1 && radio.held("AA:02") == 1; }));
    radio.complete("AA:02", RadioResult{ true, "" });
    auto r = pending.get();

    EXPECT_FALSE(r.success);
    ASSERT_EQ(r.results.size(), 2u);
    EXPECT_FALSE(r.results[0].success);
    EXPECT_EQ(*r.results[0].error, ErrorKind::Timeout);
    EXPECT_TRUE(r.results[1].success);
    EXPECT_TRUE(registry.get("AA:02")->connected);
    EXPECT_FALSE(registry.get("AA:01")->connected);
}

TEST_F(OrchestratorFixture, ConcurrentBulkSweepIsBusy) {
    radio.set_connect_reply(FakeRadio::Reply::Hold);
    auto first = std::async(std::launch::async, [this]() { return orch->connect_all(); });
    ASSERT_TRUE(wait_until([&]() { return radio.held("AA:01") == 1 && radio.held("AA:02") == 1; }));
    EXPECT_EQ(orch->connection_state(), ConnectionState::ConnectingBulk);

    auto second = orch->connect_all();
    EXPECT_FALSE(second.success);
    ASSERT_TRUE(second.error.has_value());
    EXPECT_EQ(*second.error, ErrorKind::Busy);
    EXPECT_TRUE(second.results.empty());

    auto third = orch->disconnect_all();
    EXPECT_EQ(*third.error, ErrorKind::Busy);

    radio.complete("AA:01", RadioResult{ true, "" });
    radio.complete("AA:02", RadioResult{ true, "" });
    auto r = first.get();
    EXPECT_TRUE(r.success);
    EXPECT_EQ(orch->connection_state(), ConnectionState::Idle);

    // The guard is released once the sweep ends.
    auto again = orch->disconnect_all();
    EXPECT_TRUE(again.success);
    EXPECT_FALSE(registry.get("AA:01")->connected);
}

TEST_F(OrchestratorFixture, SingleConnectsRunWhileBulkInFlight) {
    radio.set_connect_reply(FakeRadio::Reply::Hold);
    auto sweep = std::async(std::launch::async, [this]() { return orch->connect_all(); });
    ASSERT_TRUE(wait_until([&]() { return radio.held("AA:01") == 1; }));

    auto single = std::async(std::launch::async, [this]() { return orch->connect_one("BB:01"); });
    ASSERT_TRUE(wait_until([&]() { return radio.held("BB:01") == 1; }));
    radio.complete("BB:01", RadioResult{ true, "" });
    EXPECT_TRUE(single.get().success);

    radio.complete("AA:01", RadioResult{ true, "" });
    ASSERT_TRUE(wait_until([&]() { return radio.held("AA:02") == 1; }));
    radio.complete("AA:02", RadioResult{ true, "" });
    EXPECT_TRUE(sweep.get().success);
}

TEST_F(OrchestratorFixture, EmptySweepSucceeds) {
    whitelist.replace({ {"AA:03", "Garage"} });
    auto r = orch->connect_all();
    EXPECT_TRUE(r.success);
    EXPECT_TRUE(r.results.empty());
    EXPECT_EQ(radio.connect_calls(), 0);
}
