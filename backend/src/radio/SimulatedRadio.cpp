#include "radio/SimulatedRadio.hpp"
#include "core/ErrorCatalog.hpp"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace bluegate {

class SimDiscoveryStream : public DiscoveryStream {
public:
    SimDiscoveryStream(SimulatedRadio& radio, std::chrono::milliseconds interval)
    : radio_(radio), interval_(interval), next_cycle_(std::chrono::steady_clock::now()) {}

    std::optional<Sighting> next(std::chrono::milliseconds wait) override {
        const auto deadline = std::chrono::steady_clock::now() + wait;
        std::unique_lock<std::mutex> lk(m_);
        while (true) {
            if (cancelled_) return std::nullopt;
            if (!radio_.available()) {
                throw errors::Error(errors::ErrorKind::CapabilityFailure, errors::D2130_SCAN_UNAVAILABLE);
            }
            if (!pending_.empty()) {
                Sighting s = std::move(pending_.front());
                pending_.erase(pending_.begin());
                return s;
            }
            auto now = std::chrono::steady_clock::now();
            if (now >= next_cycle_) {
                lk.unlock();
                auto batch = radio_.sample_cycle();
                lk.lock();
                pending_ = std::move(batch);
                next_cycle_ = now + interval_;
                continue;
            }
            if (now >= deadline) return std::nullopt;
            cv_.wait_until(lk, std::min(deadline, next_cycle_));
        }
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lk(m_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

private:
    SimulatedRadio& radio_;
    std::chrono::milliseconds interval_;
    std::mutex m_;
    std::condition_variable cv_;
    std::vector<Sighting> pending_;
    std::chrono::steady_clock::time_point next_cycle_;
    bool cancelled_ = false;
};

SimulatedRadio::SimulatedRadio(uint64_t seed, std::chrono::milliseconds scan_interval)
: scan_interval_(scan_interval) {
    if (seed == 0) {
        rng_.seed((unsigned)std::chrono::high_resolution_clock::now().time_since_epoch().count());
    } else {
        rng_.seed(seed);
    }
}

SimulatedRadio::~SimulatedRadio() {
    std::vector<Worker> pending;
    {
        std::lock_guard<std::mutex> lk(workers_m_);
        pending.swap(workers_);
    }
    for (auto& w : pending) {
        if (w.thread.joinable()) w.thread.join();
    }
}

bool SimulatedRadio::load_fleet(const std::string& path) {
    try {
        std::ifstream f(path);
        if (!f) {
            std::cerr << "SimulatedRadio: unable to open fleet file: " << path << std::endl;
            return false;
        }
        json doc = json::parse(f);
        auto items = doc.contains("peripherals") ? doc["peripherals"] : json::array();
        std::vector<SimPeripheral> loaded;
        for (const auto& n : items) {
            SimPeripheral p;
            p.address = n.value("address", "");
            if (p.address.empty()) continue;
            p.name = n.value("name", "");
            p.rssi_mean = n.value("rssi_mean", p.rssi_mean);
            p.rssi_stddev = n.value("rssi_stddev", p.rssi_stddev);
            p.connect_latency = std::chrono::milliseconds(n.value("connect_latency_ms", (int64_t)p.connect_latency.count()));
            p.connect_failure_rate = std::clamp(n.value("connect_failure_rate", 0.0), 0.0, 1.0);
            p.in_range = n.value("in_range", true);
            loaded.push_back(std::move(p));
        }
        std::lock_guard<std::mutex> lk(m_);
        fleet_ = std::move(loaded);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "SimulatedRadio: fleet load error: " << e.what() << std::endl;
        return false;
    }
}

void SimulatedRadio::load_default_fleet() {
    std::lock_guard<std::mutex> lk(m_);
    fleet_ = {
        {"11:22:33:44:55:66", "Sensor Wand", -58.0, 3.0, std::chrono::milliseconds(250), 0.0, true},
        {"77:88:99:AA:BB:CC", "Heart Strap", -71.0, 5.0, std::chrono::milliseconds(400), 0.1, true},
        {"C0:FF:EE:00:00:01", "", -80.0, 6.0, std::chrono::milliseconds(600), 0.3, true},
        {"C0:FF:EE:00:00:02", "Kitchen Speaker", -67.0, 4.0, std::chrono::milliseconds(350), 0.0, true},
        {"DE:AD:BE:EF:00:10", "Bike Cadence", -88.0, 8.0, std::chrono::milliseconds(900), 0.5, false},
    };
}

void SimulatedRadio::add_peripheral(const SimPeripheral& p) {
    std::lock_guard<std::mutex> lk(m_);
    fleet_.push_back(p);
}

std::vector<SimPeripheral> SimulatedRadio::fleet() const {
    std::lock_guard<std::mutex> lk(m_);
    return fleet_;
}

void SimulatedRadio::set_available(bool available) {
    available_.store(available);
}

bool SimulatedRadio::is_linked(const std::string& address) const {
    std::lock_guard<std::mutex> lk(m_);
    return linked_.count(address) > 0;
}

Sighting SimulatedRadio::sample(const SimPeripheral& p) {
    std::normal_distribution<double> d(p.rssi_mean, std::max(0.1, p.rssi_stddev));
    Sighting s;
    s.address = p.address;
    s.name = p.name;
    s.rssi = (int)std::lround(std::clamp(d(rng_), -127.0, 0.0));
    s.seen_at = Clock::now();
    return s;
}

std::vector<Sighting> SimulatedRadio::sample_cycle() {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<Sighting> out;
    for (const auto& p : fleet_) {
        if (p.in_range) out.push_back(sample(p));
    }
    return out;
}

std::unique_ptr<DiscoveryStream> SimulatedRadio::open_discovery() {
    if (!available()) {
        throw errors::Error(errors::ErrorKind::CapabilityFailure, errors::D2130_SCAN_UNAVAILABLE);
    }
    return std::make_unique<SimDiscoveryStream>(*this, scan_interval_);
}

void SimulatedRadio::spawn(std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(workers_m_);
    // reap finished link operations
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread t([fn = std::move(fn), done]() {
        fn();
        done->store(true);
    });
    workers_.push_back({std::move(t), done});
}

void SimulatedRadio::connect(const std::string& address, Completion done) {
    std::optional<SimPeripheral> target;
    bool fail = false;
    {
        std::lock_guard<std::mutex> lk(m_);
        for (const auto& p : fleet_) {
            if (p.address == address) { target = p; break; }
        }
        if (target) {
            std::uniform_real_distribution<double> u(0.0, 1.0);
            fail = u(rng_) < target->connect_failure_rate;
        }
    }
    spawn([this, address, target, fail, done = std::move(done)]() {
        if (!available()) {
            done({false, "radio unavailable"});
            return;
        }
        if (!target || !target->in_range) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            done({false, "device out of range"});
            return;
        }
        std::this_thread::sleep_for(target->connect_latency);
        if (fail) {
            done({false, "link establishment failed"});
            return;
        }
        {
            std::lock_guard<std::mutex> lk(m_);
            linked_.insert(address);
        }
        done({true, ""});
    });
}

void SimulatedRadio::disconnect(const std::string& address, Completion done) {
    spawn([this, address, done = std::move(done)]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        {
            std::lock_guard<std::mutex> lk(m_);
            linked_.erase(address);
        }
        done({true, ""});
    });
}

std::optional<Sighting> SimulatedRadio::probe(const std::string& address, std::chrono::milliseconds timeout) {
    if (!available()) return std::nullopt;
    // A real inquiry would block for up to `timeout`; answer after a short air time.
    std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(100)));
    std::lock_guard<std::mutex> lk(m_);
    for (const auto& p : fleet_) {
        if (p.address == address && p.in_range) return sample(p);
    }
    return std::nullopt;
}

} // namespace bluegate
