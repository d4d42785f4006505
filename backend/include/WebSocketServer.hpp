#pragma once
#include <thread>
#include <atomic>
#include <functional>
#include <string>
#include <memory>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>

namespace bluegate {

class Backend;
class ControlProtocol;

class WebSocketServer {
public:
    WebSocketServer(int port, Backend& backend);
    ~WebSocketServer();

    // Returns false when the listening socket could not be set up.
    bool start();
    void stop();
    // Handle a control message (from a websocket session or the stdin channel).
    nlohmann::json handle_control(const nlohmann::json& msg);

    int port() const { return port_; }
    size_t session_count() const;

private:
    struct Impl;
    struct Session;

    void run_event_loop();
    void open_session(std::shared_ptr<Session> s);
    void close_session(std::shared_ptr<Session> s);
    void pump_events(std::shared_ptr<Session> s);
    void dispatch_command(std::shared_ptr<Session> s, std::string text);
    void reap_commands();

    int port_;
    std::atomic<bool> running;
    std::thread event_thread;

    Backend& backend;
    std::unique_ptr<ControlProtocol> protocol;
    std::shared_ptr<Impl> impl;

    struct Command {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex commands_m;
    std::vector<Command> commands;
};

} // namespace bluegate
