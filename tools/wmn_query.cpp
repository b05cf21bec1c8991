// Command line client for the wmn backend query channel.
// Usage: wmn_query ws://host:port[/path] method [params_json]
//        wmn_query ws://host:port[/path] --watch [count]

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
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
    const std::string prefix = "ws://";
    if (url.rfind(prefix, 0) != 0) return false;
    std::string s = url.substr(prefix.size());

    auto slash = s.find('/');
    std::string hostport = slash == std::string::npos ? s : s.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : s.substr(slash);

    auto colon = hostport.find(':');
    out.host = hostport.substr(0, colon);
    out.port = colon == std::string::npos ? "9001" : hostport.substr(colon + 1);
    if (out.port.empty()) out.port = "9001";
    return !out.host.empty();
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " ws://host:port method [params_json]\n"
              << "       " << prog << " ws://host:port --watch [count]\n"
              << "Methods: status, devices.list, device.view, device.latency_trend, device.score_trend,\n"
              << "         fleet.overview, incidents, device.explain, record.start, record.stop\n"
              << "Example:\n"
              << "  " << prog << " ws://localhost:9001 device.view '{\"device_id\":\"sim-node-01\"}'\n";
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 2;
    }

    const std::string ws_url = argv[1];
    const std::string method = argv[2];
    const bool watch = method == "--watch";
    int watch_count = 0;
    json params = json::object();
    if (argc >= 4) {
        if (watch) {
            watch_count = std::atoi(argv[3]);
        } else {
            params = json::parse(argv[3], nullptr, false);
            if (params.is_discarded()) {
                std::cerr << "Invalid params_json: " << argv[3] << "\n";
                return 2;
            }
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

        const std::string id = "wmn_query_1";
        if (!watch) {
            json req = {
                {"type", "rpc"},
                {"id", id},
                {"method", method},
                {"params", params},
            };
            ws.text(true);
            ws.write(net::buffer(req.dump()));
        }

        int exit_code = 0;
        int seen = 0;
        beast::flat_buffer buffer;
        for (;;) {
            buffer.clear();
            ws.read(buffer);
            json msg = json::parse(beast::buffers_to_string(buffer.data()), nullptr, false);
            if (!msg.is_object()) continue;

            const std::string type = msg.value("type", std::string{});
            if (watch && type == "fleet_update") {
                std::cout << msg.dump() << std::endl;
                if (watch_count > 0 && ++seen >= watch_count) break;
            } else if (!watch && type == "rpc_result" && msg.value("id", std::string{}) == id) {
                std::cout << msg.dump(2) << std::endl;
                if (!msg.value("ok", false)) exit_code = 1;
                break;
            }
        }

        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
