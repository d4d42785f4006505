#pragma once
#include "radio/IRadioAdapter.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace bluegate {

struct SimPeripheral {
    std::string address;
    std::string name;
    double rssi_mean = -65.0;
    double rssi_stddev = 4.0;
    std::chrono::milliseconds connect_latency{300};
    // Probability in [0,1] that a connect attempt fails.
    double connect_failure_rate = 0.0;
    bool in_range = true;
};

// Radio stand-in driven by a fleet of simulated peripherals.
class SimulatedRadio : public IRadioAdapter {
public:
    explicit SimulatedRadio(uint64_t seed = 0, std::chrono::milliseconds scan_interval = std::chrono::milliseconds(5000));
    ~SimulatedRadio() override;

    // Load peripherals from a fleet JSON file: { "peripherals": [ {...} ] }
    bool load_fleet(const std::string& path);
    void load_default_fleet();
    void add_peripheral(const SimPeripheral& p);
    std::vector<SimPeripheral> fleet() const;

    // Simulate the adapter being powered off / unplugged.
    void set_available(bool available);
    bool available() const { return available_.load(); }
    bool is_linked(const std::string& address) const;

    std::string name() const override { return "SimulatedRadio"; }
    std::unique_ptr<DiscoveryStream> open_discovery() override;
    void connect(const std::string& address, Completion done) override;
    void disconnect(const std::string& address, Completion done) override;
    std::optional<Sighting> probe(const std::string& address, std::chrono::milliseconds timeout) override;

private:
    friend class SimDiscoveryStream;

    std::vector<Sighting> sample_cycle();
    Sighting sample(const SimPeripheral& p);
    void spawn(std::function<void()> fn);

    std::chrono::milliseconds scan_interval_;
    mutable std::mutex m_;
    std::mt19937_64 rng_;
    std::vector<SimPeripheral> fleet_;
    std::set<std::string> linked_;
    std::atomic<bool> available_{true};

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_m_;
    std::vector<Worker> workers_;
};

} // namespace bluegate
