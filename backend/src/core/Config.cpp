/*
src/core/Config.cpp
Service configuration: compiled defaults, then an optional JSON file, then
environment variables. Command line flags are applied by main.
*/
#include "core/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace wmn {

namespace {

// Largest accepted online grace window, in seconds.
constexpr double kMaxOnlineGraceSeconds = 1e6;

bool env_truthy(const std::string& v) {
    return v == "1" || v == "true" || v == "TRUE" || v == "True" || v == "yes" || v == "on";
}

bool env_falsy(const std::string& v) {
    return v == "0" || v == "false" || v == "FALSE" || v == "False" || v == "no" || v == "off";
}

void env_bool(const EnvLookup& lookup, const char* name, bool& out) {
    const char* raw = lookup(name);
    if (!raw || !*raw) return;
    std::string v(raw);
    if (env_truthy(v)) {
        out = true;
    } else if (env_falsy(v)) {
        out = false;
    } else {
        std::cerr << "Config: ignoring " << name << "='" << v << "' (expected true/false)" << std::endl;
    }
}

const json* section(const json& doc, const char* name) {
    auto it = doc.find(name);
    if (it == doc.end()) return nullptr;
    if (!it->is_object()) throw std::runtime_error(std::string("config: section '") + name + "' must be an object");
    return &*it;
}

[[noreturn]] void bad_field(const char* sect, const char* key, const char* expected) {
    throw std::runtime_error(std::string("config: ") + sect + "." + key + " must be " + expected);
}

void read_number(const json& s, const char* sect, const char* key, double& out) {
    auto it = s.find(key);
    if (it == s.end()) return;
    if (!it->is_number()) bad_field(sect, key, "a number");
    out = it->get<double>();
}

template <typename Int>
void read_int(const json& s, const char* sect, const char* key, Int& out, long long min_value) {
    auto it = s.find(key);
    if (it == s.end()) return;
    if (!it->is_number_integer()) bad_field(sect, key, "an integer");
    long long v = it->get<long long>();
    if (v < min_value) bad_field(sect, key, ("an integer >= " + std::to_string(min_value)).c_str());
    out = static_cast<Int>(v);
}

void read_bool(const json& s, const char* sect, const char* key, bool& out) {
    auto it = s.find(key);
    if (it == s.end()) return;
    if (!it->is_boolean()) bad_field(sect, key, "a boolean");
    out = it->get<bool>();
}

void read_string(const json& s, const char* sect, const char* key, std::string& out) {
    auto it = s.find(key);
    if (it == s.end()) return;
    if (!it->is_string()) bad_field(sect, key, "a string");
    out = it->get<std::string>();
}

void read_millis(const json& s, const char* sect, const char* key, std::chrono::milliseconds& out) {
    long long ms = out.count();
    read_int(s, sect, key, ms, 1);
    out = std::chrono::milliseconds(ms);
}

void apply_incidents(IncidentConfig& cfg, const json& s, const char* sect) {
    double grace_s = std::chrono::duration<double>(cfg.online_grace).count();
    read_number(s, sect, "online_grace_s", grace_s);
    if (!(grace_s >= 0.0 && grace_s <= kMaxOnlineGraceSeconds)) bad_field(sect, "online_grace_s", "between 0 and 1000000");
    cfg.online_grace = std::chrono::milliseconds(static_cast<long long>(grace_s * 1000.0));
    read_number(s, sect, "rssi_weak_dbm", cfg.rssi_weak_dbm);
    read_number(s, sect, "latency_warn_ms", cfg.latency_warn_ms);
    read_number(s, sect, "jitter_warn_ms", cfg.jitter_warn_ms);
    read_number(s, sect, "loss_warn_pct", cfg.loss_warn_pct);
    read_number(s, sect, "latency_bad_factor", cfg.latency_bad_factor);
    read_number(s, sect, "jitter_bad_factor", cfg.jitter_bad_factor);
    read_number(s, sect, "loss_bad_factor", cfg.loss_bad_factor);
}

void apply_anomaly(AnomalyConfig& cfg, const json& s, const char* sect) {
    read_int(s, sect, "window", cfg.window, 2);
    read_int(s, sect, "min_samples", cfg.min_samples, 0);
    read_number(s, sect, "z_threshold", cfg.z_threshold);
    read_number(s, sect, "bad_multiplier", cfg.bad_multiplier);
}

} // namespace

void apply_env(ServiceConfig& cfg, const EnvLookup& lookup) {
    if (const char* v = lookup("MQTT_BROKER"); v && *v) cfg.bus.host = v;
    if (const char* v = lookup("MQTT_PORT"); v && *v) {
        try {
            int port = std::stoi(v);
            if (port <= 0 || port > 65535) throw std::out_of_range("port");
            cfg.bus.port = port;
        } catch (const std::exception&) {
            std::cerr << "Config: ignoring MQTT_PORT='" << v << "' (expected 1-65535)" << std::endl;
        }
    }
    // credentials are only used as a pair
    const char* user = lookup("MQTT_USERNAME");
    const char* pass = lookup("MQTT_PASSWORD");
    if (user && *user && pass && *pass) {
        cfg.bus.username = std::string(user);
        cfg.bus.password = std::string(pass);
    }
    env_bool(lookup, "MQTT_TLS", cfg.bus.tls);
    env_bool(lookup, "MQTT_TLS_INSECURE", cfg.bus.tls_insecure);
    if (const char* v = lookup("MQTT_CLIENT_ID"); v && *v) cfg.bus.client_id = v;
    if (const char* v = lookup("EXPLAINER_HTTP_BASE"); v && *v) cfg.explainer.base_url = v;
    if (const char* v = lookup("WMN_RECORDINGS_DIR"); v && *v) cfg.recordings_dir = v;
}

void apply_env(ServiceConfig& cfg) {
    apply_env(cfg, [](const char* name) -> const char* { return std::getenv(name); });
}

void apply_config_json(ServiceConfig& cfg, const json& doc) {
    if (!doc.is_object()) throw std::runtime_error("config: document must be a JSON object");

    if (const json* s = section(doc, "bus")) {
        read_string(*s, "bus", "host", cfg.bus.host);
        read_int(*s, "bus", "port", cfg.bus.port, 1);
        if (cfg.bus.port > 65535) bad_field("bus", "port", "<= 65535");
        if (s->contains("username")) {
            std::string u;
            read_string(*s, "bus", "username", u);
            cfg.bus.username = u;
        }
        if (s->contains("password")) {
            std::string p;
            read_string(*s, "bus", "password", p);
            cfg.bus.password = p;
        }
        read_bool(*s, "bus", "tls", cfg.bus.tls);
        read_bool(*s, "bus", "tls_insecure", cfg.bus.tls_insecure);
        read_string(*s, "bus", "client_id", cfg.bus.client_id);
        read_int(*s, "bus", "keepalive_s", cfg.bus.keepalive_s, 1);
        if (cfg.bus.keepalive_s > 65535) bad_field("bus", "keepalive_s", "<= 65535");
        read_millis(*s, "bus", "backoff_initial_ms", cfg.bus.backoff_initial);
        read_millis(*s, "bus", "backoff_max_ms", cfg.bus.backoff_max);
        if (cfg.bus.backoff_max < cfg.bus.backoff_initial) bad_field("bus", "backoff_max_ms", ">= backoff_initial_ms");
    }

    if (const json* s = section(doc, "store")) {
        read_int(*s, "store", "latency_capacity", cfg.store.latency_capacity, 1);
        read_int(*s, "store", "score_capacity", cfg.store.score_capacity, 1);
    }

    if (const json* s = section(doc, "incidents")) apply_incidents(cfg.incidents, *s, "incidents");
    if (const json* s = section(doc, "anomaly")) apply_anomaly(cfg.incidents.anomaly, *s, "anomaly");
    validate(cfg.incidents);

    if (const json* s = section(doc, "server")) {
        read_int(*s, "server", "port", cfg.server.port, 1);
        if (cfg.server.port > 65535) bad_field("server", "port", "<= 65535");
        read_millis(*s, "server", "broadcast_interval_ms", cfg.server.broadcast_interval);
    }

    if (const json* s = section(doc, "explainer")) {
        read_string(*s, "explainer", "base_url", cfg.explainer.base_url);
        read_int(*s, "explainer", "timeout_s", cfg.explainer.timeout_s, 1);
    }

    if (const json* s = section(doc, "demo")) {
        read_bool(*s, "demo", "enabled", cfg.demo.enabled);
        read_int(*s, "demo", "nodes", cfg.demo.nodes, 1);
        read_millis(*s, "demo", "interval_ms", cfg.demo.interval);
        read_int(*s, "demo", "seed", cfg.demo.seed, 0);
    }

    auto it = doc.find("recordings_dir");
    if (it != doc.end()) {
        if (!it->is_string()) throw std::runtime_error("config: recordings_dir must be a string");
        cfg.recordings_dir = it->get<std::string>();
    }
}

bool load_config_file(const std::string& path, ServiceConfig& cfg, std::string& error) {
    std::ifstream f(path);
    if (!f) {
        error = "unable to open config file: " + path;
        return false;
    }
    json doc = json::parse(f, nullptr, false);
    if (doc.is_discarded()) {
        error = "config file is not valid JSON: " + path;
        return false;
    }
    try {
        apply_config_json(cfg, doc);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    return true;
}

IncidentConfig incident_config_with_overrides(const IncidentConfig& base, const json& params) {
    IncidentConfig cfg = base;
    if (params.is_null()) return cfg;
    if (!params.is_object()) throw std::runtime_error("incident overrides must be an object");

    apply_incidents(cfg, params, "params");
    apply_anomaly(cfg.anomaly, params, "params");
    if (const json* s = section(params, "anomaly")) apply_anomaly(cfg.anomaly, *s, "anomaly");
    validate(cfg);
    return cfg;
}

void validate(const IncidentConfig& cfg) {
    if (cfg.online_grace.count() < 0 || cfg.online_grace > std::chrono::duration<double>(kMaxOnlineGraceSeconds)) {
        throw std::runtime_error("config: online_grace_s must be between 0 and 1000000");
    }
    if (!(cfg.latency_bad_factor >= 1.0) || !(cfg.jitter_bad_factor >= 1.0) || !(cfg.loss_bad_factor >= 1.0)) {
        throw std::runtime_error("config: bad factors must be >= 1.0");
    }
    if (cfg.anomaly.window < 2) throw std::runtime_error("config: anomaly.window must be >= 2");
    if (!(cfg.anomaly.z_threshold > 0.0)) throw std::runtime_error("config: anomaly.z_threshold must be > 0");
    if (!(cfg.anomaly.bad_multiplier >= 1.0)) throw std::runtime_error("config: anomaly.bad_multiplier must be >= 1.0");
}

} // namespace wmn
