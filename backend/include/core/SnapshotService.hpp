#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/DeviceStore.hpp"
#include "core/HealthScorer.hpp"
#include "core/IncidentCorrelator.hpp"

namespace wmn {

inline constexpr std::size_t kTrendMovingAverage = 12;

struct DeviceDetail {
    DeviceView view;
    HealthAssessment health;
    std::optional<double> last_seen_age_s;
    bool online = false;
};

// One row of the fleet table.
struct FleetRow {
    std::string device_id;
    HealthAssessment health;
    std::optional<double> rssi_dbm;
    std::optional<double> latency_ms;
    std::optional<double> packet_loss_pct;
    std::optional<double> last_seen_age_s;
    bool online = false;
};

struct TrendPoint {
    TimePoint ts;
    double value = 0.0;
    double moving_avg = 0.0;
};

struct ServiceStatus {
    bool bus_connected = false;
    std::optional<double> last_message_age_s;
    // "ok" <= 10 s, "warn" <= 30 s, "bad" otherwise or no message yet
    std::string freshness = "bad";
    std::uint64_t messages_ingested = 0;
    std::size_t devices = 0;
};

struct ExplainRequestBuild {
    std::optional<nlohmann::json> payload;
    int error_code = 0;
    std::string error;

    explicit operator bool() const { return payload.has_value(); }
};

/**
 * @brief Read-only query surface over the device store.
 *
 * Everything here is side-effect free and safe to call from any thread while
 * ingestion is running; each call works on its own store snapshot.
 */
class SnapshotService {
public:
    using NowFn = std::function<TimePoint()>;
    using ConnectedFn = std::function<bool()>;

    SnapshotService(const DeviceStore& store, IncidentConfig defaults,
                    ConnectedFn connected = {}, NowFn now = {});

    std::vector<std::string> list_devices() const;
    std::optional<DeviceDetail> device_view(const std::string& device_id) const;
    std::vector<TrendPoint> latency_trend(const std::string& device_id) const;
    std::vector<Sample> score_trend(const std::string& device_id) const;
    std::vector<Incident> incidents() const;
    std::vector<Incident> incidents(const IncidentConfig& cfg) const;
    // Sorted by health descending; devices without a health value last.
    std::vector<FleetRow> fleet_overview() const;
    ServiceStatus status() const;

    ExplainRequestBuild build_explain_request(const std::string& device_id, const std::string& question) const;

    const IncidentConfig& incident_defaults() const { return defaults_; }

private:
    TimePoint now() const;
    std::optional<double> age_s(const std::optional<TimePoint>& ts, TimePoint now) const;
    bool online(const std::optional<TimePoint>& last_seen, TimePoint now) const;

    const DeviceStore& store_;
    IncidentConfig defaults_;
    ConnectedFn connected_;
    NowFn now_;
};

nlohmann::json to_json(const HealthAssessment& h);
nlohmann::json to_json(const DeviceDetail& d);
nlohmann::json to_json(const FleetRow& r);
nlohmann::json to_json(const std::vector<TrendPoint>& trend);
nlohmann::json to_json(const ServiceStatus& s);

} // namespace wmn
