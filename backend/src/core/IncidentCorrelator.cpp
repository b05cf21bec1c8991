#include "core/IncidentCorrelator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace wmn {

const char* to_string(IncidentType t) {
    switch (t) {
        case IncidentType::Offline: return "offline";
        case IncidentType::WeakSignal: return "weak_signal";
        case IncidentType::HighLatency: return "high_latency";
        case IncidentType::HighJitter: return "high_jitter";
        case IncidentType::PacketLoss: return "packet_loss";
        case IncidentType::Handover: return "handover";
        case IncidentType::Congestion: return "congestion";
        case IncidentType::LatencyAnomaly: return "latency_anomaly";
    }
    return "unknown";
}

bool operator==(const Incident& a, const Incident& b) {
    return a.device_id == b.device_id && a.severity == b.severity && a.type == b.type &&
           a.detail == b.detail && a.generated_at == b.generated_at;
}

json to_json(const Incident& i) {
    return {
        {"device_id", i.device_id},
        {"severity", to_string(i.severity)},
        {"type", to_string(i.type)},
        {"detail", i.detail},
        {"generated_at", to_epoch_seconds(i.generated_at)}
    };
}

namespace {

std::string fmt1(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << v;
    return os.str();
}

class DeviceRules {
public:
    DeviceRules(const CorrelationInput& in, const IncidentConfig& cfg, TimePoint now, std::vector<Incident>& out)
    : in_(in), cfg_(cfg), now_(now), out_(out) {}

    void run() {
        if (offline()) return;

        const auto& m = in_.view.metrics;
        if (m) {
            if (m->rssi_dbm && *m->rssi_dbm < cfg_.rssi_weak_dbm) {
                emit(Severity::Warn, IncidentType::WeakSignal,
                     "RSSI " + fmt1(*m->rssi_dbm) + " dBm below " + fmt1(cfg_.rssi_weak_dbm) + " dBm");
            }
            threshold(m->latency_ms, cfg_.latency_warn_ms, cfg_.latency_bad_factor,
                      IncidentType::HighLatency, "latency", "ms");
            threshold(m->jitter_ms, cfg_.jitter_warn_ms, cfg_.jitter_bad_factor,
                      IncidentType::HighJitter, "jitter", "ms");
            threshold(m->packet_loss_pct, cfg_.loss_warn_pct, cfg_.loss_bad_factor,
                      IncidentType::PacketLoss, "packet loss", "%");
        }

        const auto& a = in_.view.analysis;
        if (a && a->handover_detected) {
            emit(Severity::Warn, IncidentType::Handover, "handover detected by analyzer");
        }
        if (a && a->congestion_detected) {
            emit(Severity::Warn, IncidentType::Congestion, "congestion detected by analyzer");
        }

        auto verdict = evaluate_latency(in_.latency_history, cfg_.anomaly);
        if (verdict && verdict->anomalous) {
            std::ostringstream os;
            os << "latency " << fmt1(verdict->latest) << " ms is " << std::fixed << std::setprecision(2)
               << verdict->z << " sigma from rolling mean " << fmt1(verdict->mean) << " ms ("
               << verdict->samples << " samples)";
            emit(*verdict->severity, IncidentType::LatencyAnomaly, os.str());
        }
    }

private:
    bool offline() {
        if (!in_.view.last_seen) return false;
        const auto silence = now_ - *in_.view.last_seen;
        if (silence <= cfg_.online_grace) return false;
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(silence).count();
        const auto grace = std::chrono::duration_cast<std::chrono::seconds>(cfg_.online_grace).count();
        emit(Severity::Bad, IncidentType::Offline,
             "no telemetry for " + std::to_string(secs) + "s (grace " + std::to_string(grace) + "s)");
        return true;
    }

    void threshold(const std::optional<double>& value, double warn, double bad_factor,
                   IncidentType type, const char* label, const char* unit) {
        if (!value || !(*value > warn)) return;
        const double bad = warn * bad_factor;
        const Severity sev = *value > bad ? Severity::Bad : Severity::Warn;
        emit(sev, type, std::string(label) + " " + fmt1(*value) + " " + unit + " above " +
                        fmt1(sev == Severity::Bad ? bad : warn) + " " + unit);
    }

    void emit(Severity sev, IncidentType type, std::string detail) {
        out_.push_back(Incident{ in_.view.device_id, sev, type, std::move(detail), now_ });
    }

    const CorrelationInput& in_;
    const IncidentConfig& cfg_;
    TimePoint now_;
    std::vector<Incident>& out_;
};

} // namespace

std::vector<Incident> correlate_incidents(const std::vector<CorrelationInput>& devices,
                                          const IncidentConfig& cfg,
                                          TimePoint now) {
    std::vector<Incident> out;
    for (const auto& d : devices) {
        DeviceRules(d, cfg, now, out).run();
    }

    std::stable_sort(out.begin(), out.end(), [](const Incident& a, const Incident& b) {
        if (a.severity != b.severity) return a.severity == Severity::Bad;
        if (a.generated_at != b.generated_at) return a.generated_at > b.generated_at;
        return a.device_id < b.device_id;
    });
    return out;
}

std::vector<Incident> correlate_incidents(const DeviceStore& store,
                                          const IncidentConfig& cfg,
                                          TimePoint now) {
    return correlate_incidents(store.snapshot_with_history(), cfg, now);
}

} // namespace wmn
