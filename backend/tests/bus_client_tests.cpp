#include <gtest/gtest.h>
#include "net/BusClient.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <future>
#include <mutex>
#include <thread>

using namespace wmn;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

TEST(BusClient, BackoffDoublesUpToCap) {
    using ms = std::chrono::milliseconds;
    EXPECT_EQ(next_backoff(ms(1000), ms(30000)), ms(2000));
    EXPECT_EQ(next_backoff(ms(16000), ms(30000)), ms(30000));
    EXPECT_EQ(next_backoff(ms(30000), ms(30000)), ms(30000));
}

TEST(BusClient, StartRequiresHostAndTopics) {
    BusClient no_host(BusConfig{}, {"wmn/metrics/#"});
    EXPECT_THROW(no_host.start(), std::runtime_error);

    BusConfig cfg;
    cfg.host = "127.0.0.1";
    BusClient no_topics(cfg, {});
    EXPECT_THROW(no_topics.start(), std::runtime_error);
}

TEST(BusClient, GeneratesClientId) {
    BusClient a(BusConfig{}, {"x"});
    BusClient b(BusConfig{}, {"x"});
    EXPECT_EQ(a.client_id().rfind("wmn-backend-", 0), 0u);
    EXPECT_NE(a.client_id(), b.client_id());

    BusConfig cfg;
    cfg.client_id = "fixed";
    EXPECT_EQ(BusClient(cfg, {"x"}).client_id(), "fixed");
}

TEST(BusClient, ServerUriFollowsTls) {
    BusConfig cfg;
    cfg.host = "broker.example";
    cfg.port = 8883;
    EXPECT_EQ(BusClient::server_uri(cfg), "ssl://broker.example:8883");
    cfg.tls = false;
    cfg.port = 1883;
    EXPECT_EQ(BusClient::server_uri(cfg), "tcp://broker.example:1883");
}

TEST(BusClient, ConnectOptionsCarryCredentialsAndKeepAlive) {
    BusConfig cfg;
    cfg.host = "broker.example";
    cfg.username = "ops";
    cfg.password = "secret";
    cfg.keepalive_s = 45;
    cfg.tls_insecure = true;

    auto opts = BusClient::build_connect_options(cfg);
    EXPECT_EQ(opts.get_user_name(), "ops");
    EXPECT_EQ(opts.get_keep_alive_interval(), std::chrono::seconds(45));
    EXPECT_TRUE(opts.get_clean_session());
    EXPECT_TRUE(opts.get_automatic_reconnect());
    EXPECT_FALSE(opts.get_ssl_options().get_enable_server_cert_auth());

    cfg.tls_insecure = false;
    EXPECT_TRUE(BusClient::build_connect_options(cfg).get_ssl_options().get_enable_server_cert_auth());
}

// Plain-TCP broker for one client session: acknowledges CONNECT and
// SUBSCRIBE, publishes one QoS 0 message, then records packet types until
// the client hangs up.
class FakeBroker {
public:
    FakeBroker() : acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)), sock_(ioc_) {}

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    std::vector<std::uint8_t> serve(const std::string& topic, const std::string& payload) {
        std::vector<std::uint8_t> seen;
        acceptor_.accept(sock_);

        auto connect = read_packet();
        seen.push_back(connect.first);
        write({0x20, 0x02, 0x00, 0x00});

        auto subscribe = read_packet();
        seen.push_back(subscribe.first);
        const auto& body = subscribe.second;
        std::vector<std::uint8_t> suback = {0x90, 0x00, body.at(0), body.at(1)};
        for (std::size_t i = 2; i + 1 < body.size();) {
            const std::size_t len = (static_cast<std::size_t>(body[i]) << 8) | body[i + 1];
            i += 2 + len + 1;
            suback.push_back(0x00);
        }
        suback[1] = static_cast<std::uint8_t>(suback.size() - 2);
        write(suback);

        std::vector<std::uint8_t> publish = {0x30, 0x00,
            static_cast<std::uint8_t>(topic.size() >> 8), static_cast<std::uint8_t>(topic.size() & 0xFF)};
        publish.insert(publish.end(), topic.begin(), topic.end());
        publish.insert(publish.end(), payload.begin(), payload.end());
        publish[1] = static_cast<std::uint8_t>(publish.size() - 2);
        write(publish);

        try {
            for (;;) seen.push_back(read_packet().first);
        } catch (const boost::system::system_error&) {
            // client closed the connection
        }
        return seen;
    }

private:
    std::pair<std::uint8_t, std::vector<std::uint8_t>> read_packet() {
        std::uint8_t header = 0;
        asio::read(sock_, asio::buffer(&header, 1));
        std::size_t remaining = 0;
        std::size_t shift = 0;
        for (;;) {
            std::uint8_t b = 0;
            asio::read(sock_, asio::buffer(&b, 1));
            remaining |= static_cast<std::size_t>(b & 0x7F) << shift;
            if (!(b & 0x80)) break;
            shift += 7;
        }
        std::vector<std::uint8_t> body(remaining);
        if (remaining) asio::read(sock_, asio::buffer(body));
        return {header, body};
    }

    void write(const std::vector<std::uint8_t>& bytes) {
        asio::write(sock_, asio::buffer(bytes));
    }

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    tcp::socket sock_;
};

TEST(BusClient, SubscribesAndDeliversMessages) {
    FakeBroker broker;
    const std::string payload = R"({"device_id":"ap","metrics":{"rssi_dbm":-60}})";

    BusConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = broker.port();
    cfg.tls = false;
    cfg.client_id = "wmn-test";
    cfg.keepalive_s = 30;

    std::mutex m;
    std::promise<std::pair<std::string, std::string>> delivered;
    auto delivered_f = delivered.get_future();
    bool got_one = false;

    BusClient client(cfg, {"wmn/metrics/#", "wmn/analysis/#"});
    client.set_handler([&](const std::string& topic, const std::string& body) {
        std::lock_guard<std::mutex> lk(m);
        if (got_one) return;
        got_one = true;
        delivered.set_value({topic, body});
    });

    auto served = std::async(std::launch::async, [&]() { return broker.serve("wmn/metrics/ap", payload); });
    client.start();

    ASSERT_EQ(delivered_f.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    auto msg = delivered_f.get();
    EXPECT_EQ(msg.first, "wmn/metrics/ap");
    EXPECT_EQ(msg.second, payload);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!client.connected() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(client.connected());
    EXPECT_EQ(client.connect_attempts(), 1u);

    client.stop();
    EXPECT_FALSE(client.connected());

    ASSERT_EQ(served.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    auto packets = served.get();
    ASSERT_GE(packets.size(), 2u);
    EXPECT_EQ(packets[0], 0x10);  // CONNECT
    EXPECT_EQ(packets[1], 0x82);  // SUBSCRIBE
    EXPECT_EQ(packets.back(), 0xE0);  // DISCONNECT
}

TEST(BusClient, RetriesUnreachableBroker) {
    unsigned short closed_port;
    {
        asio::io_context ioc;
        tcp::acceptor a(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        closed_port = a.local_endpoint().port();
    }

    BusConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = closed_port;
    cfg.tls = false;
    cfg.backoff_initial = std::chrono::milliseconds(20);
    cfg.backoff_max = std::chrono::milliseconds(40);

    BusClient client(cfg, {"wmn/metrics/#"});
    client.start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (client.connect_attempts() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    client.stop();
    EXPECT_GE(client.connect_attempts(), 3u);
    EXPECT_FALSE(client.connected());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
