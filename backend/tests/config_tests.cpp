#include <gtest/gtest.h>
#include "core/Config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>

using namespace wmn;
using json = nlohmann::json;

static EnvLookup env_from(const std::map<std::string, std::string>& vars) {
    return [vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

TEST(Config, DefaultsMatchDeployment) {
    ServiceConfig cfg;
    EXPECT_TRUE(cfg.bus.host.empty());
    EXPECT_EQ(cfg.bus.port, 8883);
    EXPECT_TRUE(cfg.bus.tls);
    EXPECT_EQ(cfg.server.port, 9001);
    EXPECT_EQ(cfg.store.latency_capacity, 800u);
    EXPECT_EQ(cfg.incidents.online_grace, std::chrono::seconds(20));
    EXPECT_EQ(cfg.incidents.anomaly.window, 30u);
    EXPECT_NO_THROW(validate(cfg.incidents));
}

TEST(Config, EnvironmentOverlay) {
    ServiceConfig cfg;
    apply_env(cfg, env_from({
        {"MQTT_BROKER", "broker.local"},
        {"MQTT_PORT", "1883"},
        {"MQTT_USERNAME", "user"},
        {"MQTT_PASSWORD", "secret"},
        {"MQTT_TLS", "false"},
        {"MQTT_CLIENT_ID", "wmn-test"},
        {"EXPLAINER_HTTP_BASE", "http://explainer:8000"},
        {"WMN_RECORDINGS_DIR", "/tmp/rec"},
    }));
    EXPECT_EQ(cfg.bus.host, "broker.local");
    EXPECT_EQ(cfg.bus.port, 1883);
    EXPECT_EQ(cfg.bus.username, std::optional<std::string>("user"));
    EXPECT_EQ(cfg.bus.password, std::optional<std::string>("secret"));
    EXPECT_FALSE(cfg.bus.tls);
    EXPECT_EQ(cfg.bus.client_id, "wmn-test");
    EXPECT_EQ(cfg.explainer.base_url, "http://explainer:8000");
    EXPECT_EQ(cfg.recordings_dir, "/tmp/rec");
}

TEST(Config, EnvironmentIgnoresBadValues) {
    ServiceConfig cfg;
    apply_env(cfg, env_from({ {"MQTT_PORT", "eighty"}, {"MQTT_TLS", "maybe"}, {"MQTT_USERNAME", "lonely"} }));
    EXPECT_EQ(cfg.bus.port, 8883);
    EXPECT_TRUE(cfg.bus.tls);
    // a user name without a password is not used
    EXPECT_FALSE(cfg.bus.username.has_value());

    apply_env(cfg, env_from({ {"MQTT_PORT", "70000"} }));
    EXPECT_EQ(cfg.bus.port, 8883);
}

TEST(Config, JsonSections) {
    ServiceConfig cfg;
    apply_config_json(cfg, json::parse(R"({
        "bus": {"host": "mq", "port": 1883, "tls": false, "keepalive_s": 30, "backoff_max_ms": 5000},
        "store": {"latency_capacity": 100},
        "incidents": {"online_grace_s": 45, "rssi_weak_dbm": -75},
        "anomaly": {"window": 20, "min_samples": 25, "z_threshold": 2.5},
        "server": {"port": 9100, "broadcast_interval_ms": 500},
        "explainer": {"base_url": "http://x", "timeout_s": 5},
        "demo": {"enabled": true, "nodes": 3, "seed": 7},
        "recordings_dir": "out"
    })"));
    EXPECT_EQ(cfg.bus.host, "mq");
    EXPECT_EQ(cfg.bus.port, 1883);
    EXPECT_FALSE(cfg.bus.tls);
    EXPECT_EQ(cfg.bus.keepalive_s, 30);
    EXPECT_EQ(cfg.bus.backoff_max, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.store.latency_capacity, 100u);
    EXPECT_EQ(cfg.store.score_capacity, 800u);
    EXPECT_EQ(cfg.incidents.online_grace, std::chrono::seconds(45));
    EXPECT_DOUBLE_EQ(cfg.incidents.rssi_weak_dbm, -75.0);
    EXPECT_EQ(cfg.incidents.anomaly.window, 20u);
    EXPECT_EQ(cfg.incidents.anomaly.min_samples, 25u);
    EXPECT_DOUBLE_EQ(cfg.incidents.anomaly.z_threshold, 2.5);
    EXPECT_EQ(cfg.server.port, 9100);
    EXPECT_EQ(cfg.server.broadcast_interval, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.explainer.timeout_s, 5);
    EXPECT_TRUE(cfg.demo.enabled);
    EXPECT_EQ(cfg.demo.nodes, 3);
    EXPECT_EQ(cfg.demo.seed, 7u);
    EXPECT_EQ(cfg.recordings_dir, "out");
}

TEST(Config, JsonRejectsWrongTypes) {
    ServiceConfig cfg;
    EXPECT_THROW(apply_config_json(cfg, json::array()), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{ {"bus", 5} }), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{ {"bus", { {"port", "x"} }} }), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{ {"server", { {"port", 70000} }} }), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{ {"store", { {"latency_capacity", 0} }} }), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{ {"anomaly", { {"window", 1} }} }), std::runtime_error);
    EXPECT_THROW(apply_config_json(cfg, json{ {"incidents", { {"loss_bad_factor", 0.5} }} }), std::runtime_error);
}

TEST(Config, OnlineGraceOutOfRangeIsRejected) {
    for (double grace : {1e10, 1e300, -1.0}) {
        ServiceConfig cfg;
        EXPECT_THROW(apply_config_json(cfg, json{ {"incidents", { {"online_grace_s", grace} }} }), std::runtime_error)
            << grace;
        EXPECT_THROW(incident_config_with_overrides(IncidentConfig{}, json{ {"online_grace_s", grace} }),
                     std::runtime_error) << grace;
    }

    ServiceConfig cfg;
    apply_config_json(cfg, json{ {"incidents", { {"online_grace_s", 1e6} }} });
    EXPECT_EQ(cfg.incidents.online_grace, std::chrono::seconds(1000000));

    IncidentConfig too_long;
    too_long.online_grace = std::chrono::hours(1000);
    EXPECT_THROW(validate(too_long), std::runtime_error);
}

TEST(Config, LoadFile) {
    const auto dir = std::filesystem::temp_directory_path();
    const auto good = (dir / "wmn_config_test_good.json").string();
    const auto bad = (dir / "wmn_config_test_bad.json").string();
    {
        std::ofstream(good) << R"({"server": {"port": 9200}})";
        std::ofstream(bad) << "{ not json";
    }

    ServiceConfig cfg;
    std::string error;
    EXPECT_TRUE(load_config_file(good, cfg, error));
    EXPECT_EQ(cfg.server.port, 9200);

    EXPECT_FALSE(load_config_file(bad, cfg, error));
    EXPECT_NE(error.find("not valid JSON"), std::string::npos);

    EXPECT_FALSE(load_config_file((dir / "wmn_config_test_missing.json").string(), cfg, error));
    EXPECT_NE(error.find("unable to open"), std::string::npos);

    std::remove(good.c_str());
    std::remove(bad.c_str());
}

TEST(Config, IncidentOverrides) {
    IncidentConfig base;
    auto same = incident_config_with_overrides(base, nullptr);
    EXPECT_DOUBLE_EQ(same.latency_warn_ms, base.latency_warn_ms);

    auto flat = incident_config_with_overrides(base, json{ {"latency_warn_ms", 90}, {"window", 10} });
    EXPECT_DOUBLE_EQ(flat.latency_warn_ms, 90.0);
    EXPECT_EQ(flat.anomaly.window, 10u);
    EXPECT_DOUBLE_EQ(flat.jitter_warn_ms, base.jitter_warn_ms);

    auto nested = incident_config_with_overrides(base, json{ {"anomaly", { {"z_threshold", 4.0} }} });
    EXPECT_DOUBLE_EQ(nested.anomaly.z_threshold, 4.0);

    EXPECT_THROW(incident_config_with_overrides(base, json::array()), std::runtime_error);
    EXPECT_THROW(incident_config_with_overrides(base, json{ {"z_threshold", 0} }), std::runtime_error);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
