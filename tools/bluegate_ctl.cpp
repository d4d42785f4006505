#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

static bool parse_ws_url(const std::string& url, WsUrl& out) {
    // Minimal parser for ws://host:port/path
    std::string s = url;
    const std::string prefix = "ws://";
    if (s.rfind(prefix, 0) != 0) return false;
    s = s.substr(prefix.size());

    std::string hostport;
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
        if (out.target.empty()) out.target = "/";
    }

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = "5001";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) out.port = "5001";
    }

    return !out.host.empty();
}

static std::string next_id() {
    static uint64_t n = 0;
    return "ctl_" + std::to_string(++n);
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--watch] ws://host:port/ [method [params_json]]\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << prog << " ws://localhost:5001/ get_status\n";
    std::cerr << "  " << prog << " ws://localhost:5001/ start_scan '{\"mode\":\"all\"}'\n";
    std::cerr << "  " << prog << " ws://localhost:5001/ connect_device '{\"address\":\"11:22:33:44:55:66\"}'\n";
    std::cerr << "  " << prog << " --watch ws://localhost:5001/\n";
}

int main(int argc, char** argv) {
    bool watch = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (a == "--watch" || a == "-w") {
            watch = true;
            continue;
        }
        args.push_back(a);
    }

    if (args.empty() || (!watch && args.size() < 2)) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string ws_url = args[0];
    const std::string method = args.size() >= 2 ? args[1] : std::string{};
    json params = json::object();
    if (args.size() >= 3) {
        try {
            params = json::parse(args[2]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid params_json: " << e.what() << "\n";
            return 2;
        }
    }

    WsUrl u;
    if (!parse_ws_url(ws_url, u)) {
        std::cerr << "Invalid ws url (expected ws://host:port/path): " << ws_url << "\n";
        return 2;
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};

        auto const results = resolver.resolve(u.host, u.port);
        net::connect(ws.next_layer(), results);
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.handshake(u.host + ":" + u.port, u.target);

        std::string id;
        if (!method.empty()) {
            id = next_id();
            json req = {
                {"type", "rpc"},
                {"id", id},
                {"method", method},
                {"params", params},
            };
            ws.write(net::buffer(req.dump()));
        }

        int rc = 0;
        beast::flat_buffer buffer;
        for (;;) {
            buffer.clear();
            ws.read(buffer);
            std::string data = beast::buffers_to_string(buffer.data());
            json msg = json::parse(data, nullptr, false);
            if (!msg.is_object()) continue;

            const std::string type = msg.value("type", std::string{});
            if (type == "rpc_result" && !id.empty() && msg.value("id", std::string{}) == id) {
                std::cout << msg.dump(2) << std::endl;
                if (!msg.value("ok", false)) rc = 1;
                else if (msg.contains("result") && msg["result"].is_object() && !msg["result"].value("success", true)) rc = 1;
                if (!watch) break;
            } else if (watch && type == "event") {
                std::cout << msg.value("event", std::string{}) << " " << msg.value("data", json::object()).dump() << std::endl;
            }
        }

        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
