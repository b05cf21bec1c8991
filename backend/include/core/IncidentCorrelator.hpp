#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/AnomalyDetector.hpp"
#include "core/DeviceStore.hpp"

namespace wmn {

enum class IncidentType {
    Offline,
    WeakSignal,
    HighLatency,
    HighJitter,
    PacketLoss,
    Handover,
    Congestion,
    LatencyAnomaly,
};

const char* to_string(IncidentType t);

struct Incident {
    std::string device_id;
    Severity severity = Severity::Warn;
    IncidentType type = IncidentType::Offline;
    std::string detail;
    TimePoint generated_at;
};

bool operator==(const Incident& a, const Incident& b);
nlohmann::json to_json(const Incident& i);

struct IncidentConfig {
    std::chrono::milliseconds online_grace{20000};
    double rssi_weak_dbm = -80.0;
    double latency_warn_ms = 150.0;
    double jitter_warn_ms = 50.0;
    double loss_warn_pct = 3.0;
    double latency_bad_factor = 1.6;
    double jitter_bad_factor = 1.6;
    double loss_bad_factor = 2.0;
    AnomalyConfig anomaly;
};

using CorrelationInput = DeviceRecord;

/**
 * @brief Evaluate every device against the threshold, flag and anomaly rules.
 *
 * Per device, in order: offline (bad, and nothing else is reported for that
 * device), weak signal, high latency, high jitter, packet loss, handover flag,
 * congestion flag, latency anomaly. Output is ordered bad before warn, then
 * newest first, then by device id; rule order is kept within a device.
 *
 * Stateless: the same input, config and `now` give the same list.
 */
std::vector<Incident> correlate_incidents(const std::vector<CorrelationInput>& devices,
                                          const IncidentConfig& cfg,
                                          TimePoint now);

// Same, over one consistent snapshot of a live store.
std::vector<Incident> correlate_incidents(const DeviceStore& store,
                                          const IncidentConfig& cfg,
                                          TimePoint now);

} // namespace wmn
