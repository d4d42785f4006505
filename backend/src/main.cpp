#include "Backend.hpp"
#include "WebSocketServer.hpp"
#include "core/BuildInfo.hpp"
#include "core/Config.hpp"
#include "radio/SimulatedRadio.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <thread>
#include <unistd.h>

static std::atomic<bool> g_shutdown{false};

static void on_signal(int) { g_shutdown = true; }

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help          Show this help message and exit\n"
              << "  -p, --port PORT     Set listening TCP port (default 5001, or web_port from config)\n"
              << "  -c, --config PATH   Config file (default $BLUEGATE_CONFIG or bluetooth_config.json)\n"
              << "      --fleet PATH    Simulated peripheral fleet (JSON)\n"
              << "      --seed N        Seed for the simulated radio\n"
              << std::flush;
}

static bool parse_int(const std::string& s, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string fleet_path;
    int port = -1;
    long long seed = -1;

    // Accept either a numeric first argument (legacy) or explicit flags
    if (argc > 1) {
        std::string first(argv[1]);
        bool is_number = !first.empty() && std::all_of(first.begin(), first.end(), [](unsigned char c){ return std::isdigit(c); });
        if (is_number) parse_int(first, port);
    }

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if ((a == "--port" || a == "-p") && i+1 < argc) {
            if (!parse_int(argv[++i], port)) std::cerr << "Ignoring invalid port: " << argv[i] << std::endl;
        } else if (a.rfind("--port=", 0) == 0) {
            if (!parse_int(a.substr(7), port)) std::cerr << "Ignoring invalid port: " << a.substr(7) << std::endl;
        } else if ((a == "--config" || a == "-c") && i+1 < argc) {
            config_path = argv[++i];
        } else if (a == "--fleet" && i+1 < argc) {
            fleet_path = argv[++i];
        } else if (a == "--seed" && i+1 < argc) {
            try { seed = std::stoll(argv[++i]); } catch (const std::exception&) {
                std::cerr << "Ignoring invalid seed: " << argv[i] << std::endl;
            }
        }
    }

    bluegate::BackendConfig cfg = bluegate::load_config(bluegate::resolve_config_path(config_path));
    // CLI flags override the config file.
    if (port > 0) cfg.web_port = port;
    if (!fleet_path.empty()) cfg.fleet_path = fleet_path;
    if (seed >= 0) cfg.sim_seed = (uint64_t)seed;

    bluegate::SimulatedRadio radio(cfg.sim_seed, cfg.scan_interval);
    if (cfg.fleet_path.empty() || !radio.load_fleet(cfg.fleet_path)) {
        if (!cfg.fleet_path.empty()) {
            std::cerr << "Warning: failed to load fleet '" << cfg.fleet_path << "', using the built-in fleet" << std::endl;
        }
        radio.load_default_fleet();
    }

    bluegate::Backend backend(cfg, radio);
    backend.start();

    bluegate::WebSocketServer server(cfg.web_port, backend);
    if (!server.start()) {
        std::cerr << "Failed to start WebSocket server on port " << cfg.web_port << std::endl;
        return 1;
    }

    std::cout << bluegate::BuildInfo::current().banner() << " running on port " << cfg.web_port << std::endl;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    // Start a small stdin control thread to accept JSON control lines for development
    // Only start this thread when stdin is a TTY; when run detached (nohup, systemd)
    // stdin will typically not be a TTY and we should avoid blocking on it.
    bool interactive_stdin = isatty(fileno(stdin));
    if (interactive_stdin) {
        std::thread control_thread([&server](){
            std::string line;
            while (!g_shutdown && std::getline(std::cin, line)) {
                if (line.empty()) continue;
                auto j = nlohmann::json::parse(line, nullptr, false);
                if (j.is_discarded()) {
                    std::cerr << "control: failed to parse input" << std::endl;
                    continue;
                }
                std::cout << server.handle_control(j).dump() << std::endl;
            }
        });
        // getline cannot be interrupted; the thread ends with the process.
        control_thread.detach();
    } else {
        std::cerr << "stdin not a TTY; skipping stdin control thread (detached/background mode)" << std::endl;
    }

    // CTRL-C quits
    while (!g_shutdown) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::cout << "Shutting down..." << std::endl;
    server.stop();
    backend.stop();
    return 0;
}
