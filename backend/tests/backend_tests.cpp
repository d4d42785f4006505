#include <gtest/gtest.h>
#include "FakeRadio.hpp"
#include "Backend.hpp"
#include "ControlProtocol.hpp"
#include "core/BuildInfo.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>

using nlohmann::json;
using namespace bluegate;
using bluegate::fakes::FakeRadio;

namespace {

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

BackendConfig test_config(const std::string& file) {
    BackendConfig cfg = default_config();
    auto p = std::filesystem::temp_directory_path() / file;
    std::filesystem::remove(p);
    cfg.whitelist_path = p.string();
    cfg.connection_timeout = std::chrono::milliseconds(200);
    cfg.probe_timeout = std::chrono::milliseconds(50);
    cfg.scan_grace = std::chrono::milliseconds(200);
    return cfg;
}

json read_json(const std::string& path) {
    std::ifstream f(path);
    return json::parse(f);
}

} // namespace

TEST(Backend, SeedsAndPersistsDefaultWhitelist) {
    FakeRadio radio;
    auto cfg = test_config("bluegate_backend_seed.json");
    Backend backend(cfg, radio);
    backend.log().set_mirror(false);
    EXPECT_EQ(backend.whitelist().size(), 2u);
    auto doc = read_json(cfg.whitelist_path);
    ASSERT_TRUE(doc["valid_devices"].is_array());
    EXPECT_EQ(doc["valid_devices"].size(), 2u);
}

TEST(Backend, InitialDataComesFirst) {
    FakeRadio radio;
    Backend backend(test_config("bluegate_backend_initial.json"), radio);
    backend.log().set_mirror(false);
    backend.start();
    backend.log().info("before subscribe");

    auto sub = backend.subscribe();
    backend.log().info("after subscribe");

    auto first = sub->next(std::chrono::milliseconds(100));
    ASSERT_TRUE(first);
    EXPECT_EQ(first->type, events::INITIAL_DATA);
    EXPECT_TRUE(first->data.contains("devices"));
    EXPECT_TRUE(first->data["devices"].contains("authorized"));
    EXPECT_TRUE(first->data["devices"].contains("all"));
    EXPECT_EQ(first->data["whitelist"].size(), 2u);
    ASSERT_TRUE(first->data["logs"].is_array());
    EXPECT_EQ(first->data["logs"].back()["message"], "before subscribe");

    auto second = sub->next(std::chrono::milliseconds(100));
    ASSERT_TRUE(second);
    EXPECT_EQ(second->type, events::LOG_UPDATE);
    EXPECT_EQ(second->data["message"], "after subscribe");
    backend.unsubscribe(sub);
}

TEST(Backend, InitialDataLogsAreCapped) {
    FakeRadio radio;
    auto cfg = test_config("bluegate_backend_logcap.json");
    cfg.initial_log_count = 5;
    cfg.status_log_count = 7;
    Backend backend(cfg, radio);
    backend.log().set_mirror(false);
    for (int i = 0; i < 20; ++i) backend.log().info("line " + std::to_string(i));
    auto sub = backend.subscribe();
    auto first = sub->next(std::chrono::milliseconds(100));
    ASSERT_TRUE(first);
    EXPECT_EQ(first->data["logs"].size(), 5u);
    EXPECT_EQ(backend.get_status()["recent_logs"].size(), 7u);
}

TEST(Backend, AddToWhitelistPersistsNotifiesAndProbes) {
    FakeRadio radio;
    radio.add_probe_hit("CC:CC", "Thermo");
    auto cfg = test_config("bluegate_backend_add.json");
    Backend backend(cfg, radio);
    backend.log().set_mirror(false);
    auto sub = backend.subscribe();
    (void)sub->next(std::chrono::milliseconds(50));

    auto r = backend.add_to_whitelist("CC:CC", "Thermostat");
    EXPECT_TRUE(r.success);

    // Persisted before the call returned.
    auto doc = read_json(cfg.whitelist_path);
    bool stored = false;
    for (const auto& e : doc["valid_devices"]) {
        if (e["address"] == "CC:CC" && e["name"] == "Thermostat") stored = true;
    }
    EXPECT_TRUE(stored);

    ASSERT_TRUE(wait_until([&]() { return backend.registry().contains("CC:CC"); }));
    backend.stop();

    auto evs = fakes::drain(*sub);
    EXPECT_GE(fakes::count_type(evs, events::WHITELIST_UPDATE), 1u);
    bool device_event = false;
    for (const auto& e : evs) {
        if (e.type == events::DEVICES_UPDATE && e.data["device"]["address"] == "CC:CC") {
            EXPECT_EQ(e.data["device"]["name"], "Thermostat");
            EXPECT_EQ(e.data["device"]["is_authorized"], true);
            device_event = true;
        }
    }
    EXPECT_TRUE(device_event);
}

TEST(Backend, WhitelistSurvivesRestart) {
    FakeRadio radio;
    auto cfg = test_config("bluegate_backend_restart.json");
    {
        Backend backend(cfg, radio);
        backend.log().set_mirror(false);
        backend.update_whitelist({ {"D1", "One"}, {"D2", "Two"}, {"D3", "Three"} });
        backend.remove_from_whitelist("D2");
    }
    Backend again(cfg, radio);
    again.log().set_mirror(false);
    auto all = again.whitelist().all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].address, "D1");
    EXPECT_EQ(all[1].address, "D3");
}

TEST(Backend, AuthorizationIsDerivedAtReadTime) {
    FakeRadio radio;
    Backend backend(test_config("bluegate_backend_authz.json"), radio);
    backend.log().set_mirror(false);
    backend.registry().upsert(fakes::sighting("EE:EE", "Speaker", -40));

    auto status = backend.get_status();
    EXPECT_EQ(status["devices"]["authorized"].size(), 0u);
    EXPECT_EQ(status["devices"]["all"].size(), 1u);
    EXPECT_EQ(status["devices"]["all"][0]["is_authorized"], false);

    backend.add_to_whitelist("EE:EE", "Living room");
    status = backend.get_status();
    ASSERT_EQ(status["devices"]["authorized"].size(), 1u);
    EXPECT_EQ(status["devices"]["authorized"][0]["name"], "Living room");
    EXPECT_EQ(status["devices"]["all"][0]["is_authorized"], true);

    backend.remove_from_whitelist("EE:EE");
    status = backend.get_status();
    EXPECT_EQ(status["devices"]["authorized"].size(), 0u);
}

TEST(Backend, StatusCarriesStats) {
    FakeRadio radio;
    Backend backend(test_config("bluegate_backend_stats.json"), radio);
    backend.log().set_mirror(false);
    backend.start();
    backend.registry().upsert(fakes::sighting("11:22:33:44:55:66", "a", -40));
    backend.registry().upsert(fakes::sighting("FF:FF", "b", -40));
    ASSERT_TRUE(backend.connect_device("11:22:33:44:55:66").success);
    ASSERT_TRUE(backend.connect_device("FF:FF").success);

    auto status = backend.get_status();
    EXPECT_EQ(status["scan_state"], "Idle");
    EXPECT_EQ(status["connection_state"], "Idle");
    auto stats = status["stats"];
    EXPECT_EQ(stats["valid_addresses_count"], 2);
    EXPECT_EQ(stats["detected_devices"], 1);
    EXPECT_EQ(stats["all_devices_count"], 2);
    EXPECT_EQ(stats["connected_devices"], 1);
    EXPECT_EQ(stats["all_connected_devices"], 2);
    EXPECT_TRUE(stats["uptime"].is_string());
    EXPECT_TRUE(status["recent_logs"].is_array());

    auto build = status["build"];
    EXPECT_EQ(build["version"], BuildInfo::current().version);
    EXPECT_FALSE(build["commit"].get<std::string>().empty());
    EXPECT_EQ(BuildInfo::current().banner().rfind("BlueGate " + build["version"].get<std::string>(), 0), 0u);
}

TEST(Backend, ScanFailureBecomesFailedResult) {
    FakeRadio radio;
    radio.set_available(false);
    Backend backend(test_config("bluegate_backend_scanfail.json"), radio);
    backend.log().set_mirror(false);
    auto r = backend.start_scan(ScanMode::Authorized);
    EXPECT_FALSE(r.success);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, errors::ErrorKind::CapabilityFailure);

    radio.set_available(true);
    EXPECT_TRUE(backend.start_scan(ScanMode::Authorized).success);
    EXPECT_TRUE(backend.start_scan(ScanMode::Authorized).success);
    EXPECT_TRUE(backend.stop_scan(std::nullopt).success);
}

TEST(Backend, ClearLogsEmptiesBuffer) {
    FakeRadio radio;
    Backend backend(test_config("bluegate_backend_clear.json"), radio);
    backend.log().set_mirror(false);
    backend.log().info("x");
    auto sub = backend.subscribe();
    (void)fakes::drain(*sub);

    EXPECT_TRUE(backend.clear_logs().success);
    auto remaining = backend.log().list();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].message, "Logs cleared");

    auto evs = fakes::drain(*sub);
    ASSERT_EQ(fakes::count_type(evs, events::LOG_UPDATE), 1u);
    EXPECT_EQ(evs.back().data["message"], "Logs cleared");
    backend.unsubscribe(sub);
}

TEST(Backend, WhitelistingKeepsAdvertisedNameWhenNoneGiven) {
    FakeRadio radio;
    Backend backend(test_config("bluegate_backend_advname.json"), radio);
    backend.log().set_mirror(false);
    backend.registry().upsert(fakes::sighting("CC:DD", "Heart Strap", -60));

    EXPECT_TRUE(backend.add_to_whitelist("CC:DD", "").success);
    EXPECT_EQ(*backend.whitelist().name_of("CC:DD"), "Heart Strap");
    auto authorized = backend.get_status()["devices"]["authorized"];
    ASSERT_EQ(authorized.size(), 1u);
    EXPECT_EQ(authorized[0]["name"], "Heart Strap");

    // Unknown device with no name falls back to its address.
    EXPECT_TRUE(backend.add_to_whitelist("EE:FF", "").success);
    EXPECT_EQ(*backend.whitelist().name_of("EE:FF"), "EE:FF");
    backend.stop();
}

TEST(Backend, RemovingUnknownEntryFails) {
    FakeRadio radio;
    Backend backend(test_config("bluegate_backend_rm.json"), radio);
    backend.log().set_mirror(false);
    auto r = backend.remove_from_whitelist("00:00");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(*r.error, errors::ErrorKind::NotFound);
}

class ControlProtocolTest : public ::testing::Test {
protected:
    FakeRadio radio;
    std::unique_ptr<Backend> backend;
    std::unique_ptr<ControlProtocol> proto;

    void SetUp() override {
        backend = std::make_unique<Backend>(test_config("bluegate_protocol.json"), radio);
        backend->log().set_mirror(false);
        proto = std::make_unique<ControlProtocol>(*backend);
    }

    json rpc(const std::string& method, json params = json::object()) {
        return proto->handle(json{ {"type", "rpc"}, {"id", "t1"}, {"method", method}, {"params", params} });
    }
};

TEST_F(ControlProtocolTest, UnparseableTextIsRejected) {
    auto reply = proto->handle_text("{oops");
    EXPECT_EQ(reply["type"], "rpc_result");
    EXPECT_EQ(reply["ok"], false);
    EXPECT_EQ(reply["error"]["code"], errors::E2400_CONTROL_REJECTED);
}

TEST_F(ControlProtocolTest, MissingMethodIsRejected) {
    auto reply = proto->handle(json{ {"type", "rpc"}, {"id", 7} });
    EXPECT_EQ(reply["ok"], false);
    EXPECT_EQ(reply["id"], 7);
    EXPECT_EQ(reply["error"]["code"], errors::E2400_CONTROL_REJECTED);
}

TEST_F(ControlProtocolTest, UnknownMethodIsRejected) {
    auto reply = rpc("reboot_everything");
    EXPECT_EQ(reply["ok"], false);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("unknown rpc method"), std::string::npos);
}

TEST_F(ControlProtocolTest, MissingAddressIsRejected) {
    auto reply = rpc("connect_device");
    EXPECT_EQ(reply["ok"], false);
    EXPECT_NE(reply["error"]["message"].get<std::string>().find("params.address"), std::string::npos);
}

TEST_F(ControlProtocolTest, BadScanModeIsRejected) {
    EXPECT_EQ(rpc("start_scan", json{ {"mode", "sideways"} })["ok"], false);
    EXPECT_EQ(rpc("update_whitelist", json{ {"devices", "AA"} })["ok"], false);
}

TEST_F(ControlProtocolTest, DomainFailureIsAResultNotAnError) {
    auto reply = rpc("connect_device", json{ {"address", "00:11"} });
    EXPECT_EQ(reply["ok"], true);
    EXPECT_EQ(reply["result"]["success"], false);
    EXPECT_EQ(reply["result"]["error"], "NotFound");
}

TEST_F(ControlProtocolTest, EveryMethodIsRoutable) {
    const json params = { {"address", "AA:BB"}, {"name", "x"}, {"mode", "all"}, {"devices", json::array()} };
    for (const auto& m : ControlProtocol::methods()) {
        auto reply = rpc(m, params);
        EXPECT_EQ(reply["ok"], true) << m << ": " << reply.dump();
    }
    backend->stop();
}

TEST_F(ControlProtocolTest, StatusAndBulkResultsAreJson) {
    backend->registry().upsert(fakes::sighting("11:22:33:44:55:66", "a", -40));
    auto bulk = rpc("connect_all");
    ASSERT_EQ(bulk["ok"], true);
    ASSERT_TRUE(bulk["result"]["results"].is_array());
    EXPECT_EQ(bulk["result"]["results"][0]["address"], "11:22:33:44:55:66");

    auto status = rpc("get_status");
    ASSERT_EQ(status["ok"], true);
    EXPECT_EQ(status["result"]["stats"]["all_connected_devices"], 1);
}

TEST(ControlProtocolFrames, EventMessageShape) {
    Event ev;
    ev.type = events::SCANNING_STATUS;
    ev.data = { {"is_scanning", true} };
    auto j = ControlProtocol::build_event_message(ev);
    EXPECT_EQ(j["type"], "event");
    EXPECT_EQ(j["event"], "scanning_status");
    EXPECT_EQ(j["data"]["is_scanning"], true);
}
