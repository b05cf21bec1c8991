#include "WebSocketServer.hpp"
#include "SnapshotProtocol.hpp"
#include "core/ErrorCatalog.hpp"
#include <iostream>
#include <chrono>
// Boost.Beast / Asio for WebSocket
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>

namespace wmn {

using WsStream = websocket::stream<tcp::socket>;
using WsPtr = std::shared_ptr<WsStream>;

// Implementation details hidden behind PIMPL
struct WebSocketServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    std::mutex sessions_m;
    std::set<WsPtr> sessions;

    // RPC frames are handled on rpc_thread_, replies are posted back here.
    std::mutex rpc_m;
    std::condition_variable rpc_cv;
    std::deque<std::pair<WsPtr, std::string>> rpc_queue;

    explicit Impl(int port): ioc(), acceptor(ioc) {
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (ec) throw std::runtime_error("WebSocketServer: acceptor.open failed: " + ec.message());
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) {
            std::cerr << "WebSocketServer: set_option failed: " << ec.message() << std::endl;
        }
        acceptor.bind(tcp::endpoint(tcp::v4(), static_cast<unsigned short>(port)), ec);
        if (ec) throw std::runtime_error("WebSocketServer: bind to port " + std::to_string(port) + " failed: " + ec.message());
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("WebSocketServer: listen failed: " + ec.message());
    }

    void add_session(const WsPtr& s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "WebSocketServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(const WsPtr& s, const boost::system::error_code& ec) {
        std::lock_guard<std::mutex> lk(sessions_m);
        if (sessions.erase(s) == 0) return;
        if (ec && ec != websocket::error::closed && ec != asio::error::operation_aborted) {
            std::cerr << "WebSocketServer: " << errors::MSG_E2410_SESSION_DROPPED << " (" << ec.message() << ")" << std::endl;
        }
        std::cerr << "WebSocketServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
    }
    template<typename Fn>
    void for_each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (auto &s : sessions) fn(s);
    }

    // Only ever called on the I/O thread, so writes never overlap.
    void send(const WsPtr& s, const std::string& payload) {
        boost::system::error_code ec;
        s->text(true);
        s->write(asio::buffer(payload), ec);
        if (ec && ec != websocket::error::closed) {
            std::cerr << "WebSocketServer: write failed: " << ec.message() << std::endl;
        }
    }

    void post_send(const WsPtr& s, std::string payload) {
        asio::post(ioc, [this, s, payload = std::move(payload)]() { send(s, payload); });
    }

    void do_accept(const std::atomic<bool>& running) {
        auto socket = std::make_shared<tcp::socket>(ioc);
        acceptor.async_accept(*socket, [this, socket, &running](boost::system::error_code ec) {
            if (ec) {
                if (running) std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
            } else {
                auto ws = std::make_shared<WsStream>(std::move(*socket));
                ws->async_accept([this, ws](boost::system::error_code ec) {
                    if (ec) {
                        std::cerr << "WebSocketServer: websocket accept failed: " << ec.message() << std::endl;
                        return;
                    }
                    add_session(ws);
                    do_read(ws, std::make_shared<beast::flat_buffer>());
                });
            }
            if (running) do_accept(running);
        });
    }

    void do_read(const WsPtr& ws, const std::shared_ptr<beast::flat_buffer>& buffer) {
        ws->async_read(*buffer, [this, ws, buffer](boost::system::error_code ec, std::size_t) {
            if (ec) {
                remove_session(ws, ec);
                return;
            }
            auto data = beast::buffers_to_string(buffer->data());
            buffer->consume(buffer->size());
            {
                std::lock_guard<std::mutex> lk(rpc_m);
                rpc_queue.emplace_back(ws, std::move(data));
            }
            rpc_cv.notify_one();
            do_read(ws, buffer);
        });
    }
};

WebSocketServer::WebSocketServer(ServerConfig cfg, SnapshotProtocol& protocol)
: cfg_(std::move(cfg)), protocol_(protocol) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

std::size_t WebSocketServer::session_count() const {
    auto impl = impl_;
    if (!impl) return 0;
    std::lock_guard<std::mutex> lk(impl->sessions_m);
    return impl->sessions.size();
}

void WebSocketServer::start() {
    if (running_) return;
    impl_ = std::make_shared<Impl>(cfg_.port);
    bound_port_ = impl_->acceptor.local_endpoint().port();
    running_ = true;

    event_thread_ = std::thread([this](){ run_event_loop(); });
    broadcast_thread_ = std::thread([this](){ broadcast_loop(); });
    rpc_thread_ = std::thread([this](){ rpc_loop(); });
    std::cout << "WebSocketServer: listening on port " << bound_port_ << std::endl;
}

void WebSocketServer::stop() {
    if (!impl_) return;
    {
        std::lock_guard<std::mutex> lk(impl_->rpc_m);
        if (!running_.exchange(false)) return;
    }
    impl_->rpc_cv.notify_all();
    if (rpc_thread_.joinable()) rpc_thread_.join();
    if (broadcast_thread_.joinable()) broadcast_thread_.join();
    if (event_thread_.joinable()) event_thread_.join();
}

void WebSocketServer::run_event_loop() {
    try {
        impl_->do_accept(running_);

        while (running_) {
            try {
                impl_->ioc.run_for(std::chrono::milliseconds(50));
                if (impl_->ioc.stopped()) impl_->ioc.restart();
            } catch (const std::exception& e) {
                std::cerr << "WebSocketServer: I/O context error: " << e.what() << std::endl;
            }
        }

        // cleanly close sessions
        boost::system::error_code ec;
        impl_->acceptor.close(ec);
        impl_->for_each_session([&](const WsPtr& s){
            boost::system::error_code cec;
            s->close(websocket::close_code::going_away, cec);
        });
        impl_->ioc.stop();

    } catch (const std::exception& e) {
        std::cerr << "WebSocketServer: run_event_loop exception: " << e.what() << std::endl;
    }
}

void WebSocketServer::rpc_loop() {
    while (running_) {
        std::pair<WsPtr, std::string> job;
        {
            std::unique_lock<std::mutex> lk(impl_->rpc_m);
            impl_->rpc_cv.wait(lk, [this]() { return !running_ || !impl_->rpc_queue.empty(); });
            if (!running_) break;
            job = std::move(impl_->rpc_queue.front());
            impl_->rpc_queue.pop_front();
        }
        try {
            auto reply = protocol_.handle_text(job.second);
            if (reply) impl_->post_send(job.first, reply->dump());
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: rpc error: " << e.what() << std::endl;
        }
    }
}

void WebSocketServer::broadcast_loop() {
    auto next = std::chrono::steady_clock::now();
    while (running_) {
        try {
            auto payload = protocol_.build_fleet_update().dump();
            impl_->for_each_session([&](const WsPtr& s){
                impl_->post_send(s, payload);
            });
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: broadcast error: " << e.what() << std::endl;
        }
        next += cfg_.broadcast_interval;
        while (running_ && std::chrono::steady_clock::now() < next) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

} // namespace wmn
