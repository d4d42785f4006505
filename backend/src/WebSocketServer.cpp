#include "WebSocketServer.hpp"
#include "Backend.hpp"
#include "ControlProtocol.hpp"
#include "core/ErrorCatalog.hpp"
#include <iostream>
#include <chrono>
// Boost.Beast / Asio for WebSocket
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <set>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>

namespace bluegate {

// One connected client: its stream, its observer channel and the thread that
// forwards that channel to the client.
struct WebSocketServer::Session : std::enable_shared_from_this<WebSocketServer::Session> {
    std::shared_ptr<websocket::stream<tcp::socket>> ws;
    std::shared_ptr<Subscription> sub;
    std::thread writer;
    std::atomic<bool> open{true};

    // Writes happen on the io_context thread, in post order.
    void send(std::string payload) {
        auto self = shared_from_this();
        asio::post(ws->get_executor(), [self, payload = std::move(payload)]() {
            if (!self->open.load()) return;
            boost::system::error_code ec;
            self->ws->text(true);
            self->ws->write(asio::buffer(payload), ec);
            if (ec) {
                // the session read loop will clean up
                std::cerr << "WebSocketServer: write failed: " << ec.message() << std::endl;
            }
        });
    }
};

// Implementation details hidden behind PIMPL
struct WebSocketServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    bool listening = false;
    mutable std::mutex sessions_m;
    std::set<std::shared_ptr<Session>> sessions;
    Impl(int port): ioc(), acceptor(ioc) {
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (ec) {
            std::cerr << "acceptor.open failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "set_option failed: " << ec.message() << std::endl;
        }
        acceptor.bind(tcp::endpoint(tcp::v4(), port), ec);
        if (ec) {
            std::cerr << "bind failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            std::cerr << "listen failed: " << ec.message() << std::endl;
            return;
        }
        listening = true;
    }

    void add_session(std::shared_ptr<Session> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "WebSocketServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(std::shared_ptr<Session> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        if (sessions.erase(s) > 0) {
            std::cerr << "WebSocketServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
        }
    }
    std::vector<std::shared_ptr<Session>> snapshot() const {
        std::lock_guard<std::mutex> lk(sessions_m);
        return { sessions.begin(), sessions.end() };
    }
};

WebSocketServer::WebSocketServer(int p, Backend& b)
: port_(p), running(false), backend(b) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

size_t WebSocketServer::session_count() const {
    if (!impl) return 0;
    return impl->snapshot().size();
}

bool WebSocketServer::start() {
    if (running) return true;
    protocol = std::make_unique<ControlProtocol>(backend);

    // initialize impl with port and start event loop
    impl = std::make_shared<Impl>(port_);
    if (!impl->listening) {
        std::cerr << "WebSocketServer: could not listen on port " << port_ << std::endl;
        impl.reset();
        return false;
    }

    running = true;
    event_thread = std::thread([this](){ run_event_loop(); });
    return true;
}

void WebSocketServer::stop() {
    running = false;
    if (event_thread.joinable()) event_thread.join();

    std::vector<Command> pending;
    {
        std::lock_guard<std::mutex> lk(commands_m);
        pending.swap(commands);
    }
    for (auto& c : pending) {
        if (c.thread.joinable()) c.thread.join();
    }
}

nlohmann::json WebSocketServer::handle_control(const nlohmann::json& msg) {
    if (!protocol) protocol = std::make_unique<ControlProtocol>(backend);
    return protocol->handle(msg);
}

void WebSocketServer::open_session(std::shared_ptr<Session> s) {
    // initial_data is already queued on the fresh subscription.
    s->sub = backend.subscribe();
    impl->add_session(s);
    s->writer = std::thread([this, s]() { pump_events(s); });
}

void WebSocketServer::close_session(std::shared_ptr<Session> s) {
    if (!s->open.exchange(false)) return;
    if (s->sub) backend.unsubscribe(s->sub);
    if (s->writer.joinable()) s->writer.join();
    impl->remove_session(s);
}

void WebSocketServer::pump_events(std::shared_ptr<Session> s) {
    while (s->open.load() && !s->sub->closed()) {
        auto ev = s->sub->next(std::chrono::milliseconds(200));
        if (!ev) continue;
        try {
            s->send(ControlProtocol::build_event_message(*ev).dump());
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: failed to encode " << ev->type << ": " << e.what() << std::endl;
        }
    }
}

void WebSocketServer::reap_commands() {
    auto it = commands.begin();
    while (it != commands.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = commands.erase(it);
        } else {
            ++it;
        }
    }
}

void WebSocketServer::dispatch_command(std::shared_ptr<Session> s, std::string text) {
    // Commands may block on the radio; each gets its own thread so one slow
    // connect never stalls the read loop.
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lk(commands_m);
    reap_commands();
    commands.push_back(Command{ std::thread([this, s, text = std::move(text), done]() {
        nlohmann::json reply = protocol->handle_text(text);
        try {
            s->send(reply.dump());
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: failed to encode reply: " << e.what() << std::endl;
        }
        done->store(true);
    }), done });
}

void WebSocketServer::run_event_loop() {
    try {
        // Start accepting loop using Boost.Asio/Beast
        auto& ioc = impl->ioc;
        auto& acceptor = impl->acceptor;

        std::function<void()> do_accept;
        do_accept = [&]() {
            auto socket = std::make_shared<tcp::socket>(ioc);
            acceptor.async_accept(*socket, [this, socket, &do_accept](boost::system::error_code ec) {
                if (ec) {
                    if (running) std::cerr << "accept error: " << ec.message() << std::endl;
                } else {
                    // Create a websocket stream and accept the handshake
                    auto session = std::make_shared<Session>();
                    session->ws = std::make_shared<websocket::stream<tcp::socket>>(std::move(*socket));
                    session->ws->async_accept([this, session](boost::system::error_code ec) {
                        if (ec) {
                            std::cerr << "websocket accept failed: " << ec.message() << std::endl;
                            return;
                        }
                        open_session(session);
                        // Read loop: every frame is one control request
                        auto buffer = std::make_shared<beast::flat_buffer>();
                        auto do_read = std::make_shared<std::function<void()>>();
                        *do_read = [this, session, buffer, do_read]() {
                            session->ws->async_read(*buffer, [this, session, buffer, do_read](boost::system::error_code ec, std::size_t) {
                                if (ec) {
                                    if (ec != websocket::error::closed && running) {
                                        std::cerr << errors::MSG_E2410_SESSION_DROPPED << ": " << ec.message() << std::endl;
                                    }
                                    close_session(session);
                                    *do_read = nullptr;
                                    return;
                                }
                                auto data = beast::buffers_to_string(buffer->data());
                                buffer->consume(buffer->size());
                                dispatch_command(session, std::move(data));
                                (*do_read)();
                            });
                        };
                        (*do_read)();
                    });
                }
                if (running) do_accept();
            });
        };

        // kickoff accept loop
        do_accept();

        // Run the I/O context until stopped (use non-blocking poll loop)
        while (running) {
            try {
                impl->ioc.poll();
            } catch (const std::exception& e) {
                std::cerr << "I/O context error: " << e.what() << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        // cleanly close sessions
        boost::system::error_code ec;
        acceptor.close(ec);
        for (auto& s : impl->snapshot()) {
            s->ws->close(websocket::close_code::normal, ec);
            close_session(s);
        }

    } catch (const std::exception& e) {
        std::cerr << "run_event_loop exception: " << e.what() << std::endl;
    }
}

} // namespace bluegate
