#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/DeviceStore.hpp"
#include "core/IncidentCorrelator.hpp"

namespace wmn {

struct BusConfig {
    std::string host;                       // empty: no broker configured
    int port = 8883;
    std::optional<std::string> username;
    std::optional<std::string> password;
    bool tls = true;
    bool tls_insecure = false;              // skip peer verification
    std::string client_id;                  // empty: generated
    int keepalive_s = 60;
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{30000};
};

struct ServerConfig {
    int port = 9001;
    std::chrono::milliseconds broadcast_interval{2000};
};

struct ExplainerConfig {
    std::string base_url;                   // empty: explanation requests disabled
    long timeout_s = 30;
};

struct DemoConfig {
    bool enabled = false;
    int nodes = 6;
    std::chrono::milliseconds interval{1000};
    std::uint64_t seed = 0;
};

struct ServiceConfig {
    BusConfig bus;
    StoreConfig store;
    IncidentConfig incidents;
    ServerConfig server;
    ExplainerConfig explainer;
    DemoConfig demo;
    std::string recordings_dir;             // empty: ./recordings
};

using EnvLookup = std::function<const char*(const char*)>;

// Overlay MQTT_* / EXPLAINER_HTTP_BASE / WMN_RECORDINGS_DIR. Unparseable
// values are reported on stderr and leave the previous value in place.
void apply_env(ServiceConfig& cfg, const EnvLookup& lookup);
void apply_env(ServiceConfig& cfg);

// Overlay a JSON document with optional bus/store/incidents/anomaly/server/
// explainer/demo sections. Throws std::runtime_error on a wrongly typed or
// out-of-range field.
void apply_config_json(ServiceConfig& cfg, const nlohmann::json& doc);

// Read and apply a JSON config file. Returns false and fills `error` when
// the file cannot be read, parsed or applied.
bool load_config_file(const std::string& path, ServiceConfig& cfg, std::string& error);

// Incident thresholds with per-request overrides (same keys as the
// "incidents"/"anomaly" config sections, flattened or nested).
IncidentConfig incident_config_with_overrides(const IncidentConfig& base, const nlohmann::json& params);

void validate(const IncidentConfig& cfg);

} // namespace wmn
