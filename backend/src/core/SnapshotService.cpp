#include "core/SnapshotService.hpp"

#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace wmn {

SnapshotService::SnapshotService(const DeviceStore& store, IncidentConfig defaults,
                                 ConnectedFn connected, NowFn now)
: store_(store), defaults_(std::move(defaults)), connected_(std::move(connected)), now_(std::move(now)) {
    validate(defaults_);
}

TimePoint SnapshotService::now() const {
    return now_ ? now_() : Clock::now();
}

std::optional<double> SnapshotService::age_s(const std::optional<TimePoint>& ts, TimePoint now) const {
    if (!ts) return std::nullopt;
    return std::max(0.0, std::chrono::duration<double>(now - *ts).count());
}

bool SnapshotService::online(const std::optional<TimePoint>& last_seen, TimePoint now) const {
    return last_seen && (now - *last_seen) <= defaults_.online_grace;
}

std::vector<std::string> SnapshotService::list_devices() const {
    std::vector<std::string> ids;
    for (const auto& v : store_.snapshot()) ids.push_back(v.device_id);
    return ids;
}

std::optional<DeviceDetail> SnapshotService::device_view(const std::string& device_id) const {
    auto v = store_.device(device_id);
    if (!v) return std::nullopt;
    const TimePoint t = now();
    DeviceDetail d;
    d.health = assess_health(v->metrics, v->analysis);
    d.last_seen_age_s = age_s(v->last_seen, t);
    d.online = online(v->last_seen, t);
    d.view = std::move(*v);
    return d;
}

std::vector<TrendPoint> SnapshotService::latency_trend(const std::string& device_id) const {
    const auto hist = store_.latency_history(device_id);
    std::vector<TrendPoint> out;
    out.reserve(hist.size());
    double window_sum = 0.0;
    for (std::size_t i = 0; i < hist.size(); ++i) {
        window_sum += hist[i].value;
        if (i >= kTrendMovingAverage) window_sum -= hist[i - kTrendMovingAverage].value;
        const std::size_t n = std::min(i + 1, kTrendMovingAverage);
        out.push_back(TrendPoint{ hist[i].ts, hist[i].value, window_sum / static_cast<double>(n) });
    }
    return out;
}

std::vector<Sample> SnapshotService::score_trend(const std::string& device_id) const {
    return store_.score_history(device_id);
}

std::vector<Incident> SnapshotService::incidents() const {
    return incidents(defaults_);
}

std::vector<Incident> SnapshotService::incidents(const IncidentConfig& cfg) const {
    return correlate_incidents(store_, cfg, now());
}

std::vector<FleetRow> SnapshotService::fleet_overview() const {
    const TimePoint t = now();
    std::vector<FleetRow> rows;
    for (const auto& v : store_.snapshot()) {
        FleetRow r;
        r.device_id = v.device_id;
        r.health = assess_health(v.metrics, v.analysis);
        if (v.metrics) {
            r.rssi_dbm = v.metrics->rssi_dbm;
            r.latency_ms = v.metrics->latency_ms;
            r.packet_loss_pct = v.metrics->packet_loss_pct;
        }
        r.last_seen_age_s = age_s(v.last_seen, t);
        r.online = online(v.last_seen, t);
        rows.push_back(std::move(r));
    }
    std::stable_sort(rows.begin(), rows.end(), [](const FleetRow& a, const FleetRow& b) {
        if (a.health.score.has_value() != b.health.score.has_value()) return a.health.score.has_value();
        if (a.health.score && *a.health.score != *b.health.score) return *a.health.score > *b.health.score;
        return a.device_id < b.device_id;
    });
    return rows;
}

ServiceStatus SnapshotService::status() const {
    ServiceStatus s;
    s.bus_connected = connected_ ? connected_() : false;
    s.last_message_age_s = age_s(store_.last_message_at(), now());
    s.messages_ingested = store_.messages_ingested();
    s.devices = store_.snapshot().size();
    if (s.last_message_age_s) {
        if (*s.last_message_age_s <= 10.0) {
            s.freshness = "ok";
        } else if (*s.last_message_age_s <= 30.0) {
            s.freshness = "warn";
        }
    }
    return s;
}

ExplainRequestBuild SnapshotService::build_explain_request(const std::string& device_id,
                                                           const std::string& question) const {
    ExplainRequestBuild out;
    const bool blank = std::all_of(question.begin(), question.end(),
                                   [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        out.error_code = errors::E3101_EXPLAINER_BAD_REQUEST;
        out.error = errors::D3101_EMPTY_QUESTION;
        return out;
    }
    auto v = store_.device(device_id);
    if (!v) {
        out.error_code = errors::E3101_EXPLAINER_BAD_REQUEST;
        out.error = std::string(errors::D3101_UNKNOWN_DEVICE) + ": " + device_id;
        return out;
    }
    out.payload = json{
        {"analysis", {
            {"device_id", device_id},
            {"raw", v->metrics ? v->metrics->raw : json::object()},
            {"analysis", v->analysis ? v->analysis->raw : json::object()},
            {"question", question}
        }}
    };
    return out;
}

template <typename T>
static json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

json to_json(const HealthAssessment& h) {
    return { {"score", opt(h.score)}, {"source", to_string(h.source)} };
}

json to_json(const DeviceDetail& d) {
    json out = {
        {"device_id", d.view.device_id},
        {"metrics", d.view.metrics ? to_json(*d.view.metrics) : json(nullptr)},
        {"analysis", d.view.analysis ? to_json(*d.view.analysis) : json(nullptr)},
        {"explanation", d.view.explanation ? json(d.view.explanation->text) : json(nullptr)},
        {"health", to_json(d.health)},
        {"last_seen", d.view.last_seen ? json(to_epoch_seconds(*d.view.last_seen)) : json(nullptr)},
        {"last_seen_age_s", opt(d.last_seen_age_s)},
        {"online", d.online}
    };
    return out;
}

json to_json(const FleetRow& r) {
    return {
        {"device", r.device_id},
        {"score", opt(r.health.score)},
        {"score_source", to_string(r.health.source)},
        {"rssi", opt(r.rssi_dbm)},
        {"latency", opt(r.latency_ms)},
        {"loss", opt(r.packet_loss_pct)},
        {"last_seen", opt(r.last_seen_age_s)},
        {"online", r.online}
    };
}

json to_json(const std::vector<TrendPoint>& trend) {
    json arr = json::array();
    for (const auto& p : trend) {
        arr.push_back({ {"t", to_epoch_seconds(p.ts)}, {"lat", p.value}, {"ma", p.moving_avg} });
    }
    return arr;
}

json to_json(const ServiceStatus& s) {
    return {
        {"bus_connected", s.bus_connected},
        {"last_message_age_s", opt(s.last_message_age_s)},
        {"freshness", s.freshness},
        {"messages_ingested", s.messages_ingested},
        {"devices", s.devices}
    };
}

} // namespace wmn
