#include "SnapshotProtocol.hpp"
#include "WebSocketServer.hpp"
#include "core/BuildInfo.hpp"
#include "core/Config.hpp"
#include "core/DeviceStore.hpp"
#include "core/IngestionLoop.hpp"
#include "core/Recorder.hpp"
#include "core/SnapshotService.hpp"
#include "net/ExplainerClient.hpp"
#include "simulator/Simulator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help          Show this help message and exit\n"
              << "  -v, --version       Print version and build info and exit\n"
              << "  -d, --demo          Feed simulated telemetry instead of subscribing to a broker\n"
              << "  -p, --port PORT     WebSocket query port (default 9001)\n"
              << "  -c, --config FILE   JSON config file (bus/store/incidents/anomaly/server/explainer/demo)\n"
              << "Environment:\n"
              << "  MQTT_BROKER, MQTT_PORT, MQTT_USERNAME, MQTT_PASSWORD, MQTT_TLS, MQTT_TLS_INSECURE,\n"
              << "  MQTT_CLIENT_ID, EXPLAINER_HTTP_BASE, WMN_RECORDINGS_DIR\n"
              << std::flush;
}

static std::optional<int> parse_port(const std::string& s) {
    try {
        std::size_t used = 0;
        int port = std::stoi(s, &used);
        if (used != s.size() || port < 0 || port > 65535) return std::nullopt;
        return port;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int main(int argc, char** argv) {
    std::optional<int> port_flag;
    std::string config_path;
    bool demo_flag = false;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (a == "-v" || a == "--version") {
            std::cout << "wmn_backend " << wmn::buildinfo::version() << " (commit " << wmn::buildinfo::git_commit()
                      << ", built " << wmn::buildinfo::build_time_utc_approx() << ")" << std::endl;
            return 0;
        }
        if (a == "-d" || a == "--demo") {
            demo_flag = true;
        } else if ((a == "-p" || a == "--port") && i + 1 < argc) {
            port_flag = parse_port(argv[++i]);
            if (!port_flag) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 2;
            }
        } else if (a.rfind("--port=", 0) == 0) {
            port_flag = parse_port(a.substr(7));
            if (!port_flag) {
                std::cerr << "Invalid port: " << a.substr(7) << std::endl;
                return 2;
            }
        } else if ((a == "-c" || a == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a.rfind("--config=", 0) == 0) {
            config_path = a.substr(9);
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    wmn::ServiceConfig cfg;
    if (!config_path.empty()) {
        std::string error;
        if (!wmn::load_config_file(config_path, cfg, error)) {
            std::cerr << error << std::endl;
            return 2;
        }
    }
    wmn::apply_env(cfg);
    if (port_flag) cfg.server.port = *port_flag;
    if (demo_flag) cfg.demo.enabled = true;

    if (!cfg.demo.enabled && cfg.bus.host.empty()) {
        std::cerr << "MQTT_BROKER not configured (set MQTT_BROKER or run with --demo)" << std::endl;
        return 2;
    }

    wmn::DeviceStore store(cfg.store);
    wmn::IngestionLoop ingest(store);
    wmn::SnapshotService service(store, cfg.incidents, [&ingest]() { return ingest.connected(); });
    wmn::ExplainerClient explainer(cfg.explainer);
    wmn::Recorder recorder(service, cfg.recordings_dir, cfg.server.port);
    wmn::SnapshotProtocol protocol(service, explainer, &recorder);
    wmn::WebSocketServer server(cfg.server, protocol);

    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<wmn::Simulator> sim;
    if (cfg.demo.enabled) {
        sim = std::make_unique<wmn::Simulator>(cfg.demo);
        sim->start([&ingest](const std::string& topic, const std::string& payload) {
            ingest.handle_message(topic, payload);
        });
    } else {
        try {
            ingest.start(cfg.bus);
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            server.stop();
            return 1;
        }
    }

    std::cout << "wmn backend " << wmn::buildinfo::version() << " running on port " << server.port()
              << (cfg.demo.enabled ? " (demo feed)" : "") << "..." << std::endl;

    // Block until SIGINT/SIGTERM.
    boost::asio::io_context signals_ioc;
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) std::cout << "Received signal " << signo << ", shutting down" << std::endl;
        signals_ioc.stop();
    });
    signals_ioc.run();

    if (sim) sim->stop();
    ingest.stop();
    server.stop();
    std::cout << "Stopped after " << ingest.accepted() << " messages (" << ingest.rejected() << " rejected, "
              << ingest.ignored() << " ignored)" << std::endl;
    return 0;
}
