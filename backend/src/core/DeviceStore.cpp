/*
src/core/DeviceStore.cpp
Per-device latest records and bounded histories fed by the ingestion loop
and read by the snapshot queries.
*/
#include "core/DeviceStore.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace wmn {

bool operator==(const DeviceView& a, const DeviceView& b) {
    return a.device_id == b.device_id && a.metrics == b.metrics && a.analysis == b.analysis &&
           a.explanation == b.explanation && a.last_seen == b.last_seen;
}

DeviceStore::DeviceStore(StoreConfig cfg) : cfg_(cfg) {
    if (cfg_.latency_capacity == 0 || cfg_.score_capacity == 0) {
        throw std::invalid_argument("history capacity must be > 0");
    }
}

void DeviceStore::ingest(const TelemetryMessage& msg, TimePoint received_at) {
    const TimePoint sample_ts = msg.origin_ts.value_or(received_at);

    std::lock_guard<std::mutex> lock(mu_);
    switch (msg.kind) {
        case MessageKind::Metrics: {
            const MetricSnapshot m = msg.metrics.value_or(MetricSnapshot{});
            metrics_[msg.device_id] = m;
            if (m.latency_ms) {
                auto it = latency_hist_.find(msg.device_id);
                if (it == latency_hist_.end()) {
                    it = latency_hist_.emplace(msg.device_id, History(cfg_.latency_capacity)).first;
                }
                it->second.push_back(Sample{sample_ts, *m.latency_ms});
            }
            break;
        }
        case MessageKind::Analysis: {
            const AnalysisSnapshot a = msg.analysis.value_or(AnalysisSnapshot{});
            analysis_[msg.device_id] = a;
            if (a.score) {
                auto it = score_hist_.find(msg.device_id);
                if (it == score_hist_.end()) {
                    it = score_hist_.emplace(msg.device_id, History(cfg_.score_capacity)).first;
                }
                it->second.push_back(Sample{sample_ts, *a.score});
            }
            break;
        }
        case MessageKind::Explain:
            explain_[msg.device_id] = msg.explanation.value_or(ExplanationSnapshot{});
            break;
    }
    last_seen_[msg.device_id] = received_at;
    last_message_at_ = received_at;
    ++messages_;
}

DeviceView DeviceStore::view_locked(const std::string& device_id) const {
    DeviceView v;
    v.device_id = device_id;
    if (auto it = metrics_.find(device_id); it != metrics_.end()) v.metrics = it->second;
    if (auto it = analysis_.find(device_id); it != analysis_.end()) v.analysis = it->second;
    if (auto it = explain_.find(device_id); it != explain_.end()) v.explanation = it->second;
    if (auto it = last_seen_.find(device_id); it != last_seen_.end()) v.last_seen = it->second;
    return v;
}

std::vector<std::string> DeviceStore::ids_locked() const {
    std::set<std::string> ids;
    for (const auto& p : metrics_) ids.insert(p.first);
    for (const auto& p : analysis_) ids.insert(p.first);
    for (const auto& p : explain_) ids.insert(p.first);
    return std::vector<std::string>(ids.begin(), ids.end());
}

std::vector<DeviceView> DeviceStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<DeviceView> out;
    for (const auto& id : ids_locked()) out.push_back(view_locked(id));
    return out;
}

std::vector<DeviceRecord> DeviceStore::snapshot_with_history() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<DeviceRecord> out;
    for (const auto& id : ids_locked()) {
        out.push_back(DeviceRecord{ view_locked(id), copy_history(latency_hist_, id) });
    }
    return out;
}

std::optional<DeviceView> DeviceStore::device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!metrics_.count(device_id) && !analysis_.count(device_id) && !explain_.count(device_id)) {
        return std::nullopt;
    }
    return view_locked(device_id);
}

std::vector<Sample> DeviceStore::copy_history(const std::unordered_map<std::string, History>& map,
                                              const std::string& device_id) {
    std::vector<Sample> out;
    auto it = map.find(device_id);
    if (it == map.end()) return out;
    out.assign(it->second.begin(), it->second.end());
    return out;
}

std::vector<Sample> DeviceStore::latency_history(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return copy_history(latency_hist_, device_id);
}

std::vector<Sample> DeviceStore::score_history(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return copy_history(score_hist_, device_id);
}

std::vector<std::string> DeviceStore::device_ids(MessageKind kind) const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    auto collect = [&out](const auto& map) {
        out.reserve(map.size());
        for (const auto& p : map) out.push_back(p.first);
    };
    switch (kind) {
        case MessageKind::Metrics: collect(metrics_); break;
        case MessageKind::Analysis: collect(analysis_); break;
        case MessageKind::Explain: collect(explain_); break;
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<TimePoint> DeviceStore::last_message_at() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_message_at_;
}

std::uint64_t DeviceStore::messages_ingested() const {
    std::lock_guard<std::mutex> lock(mu_);
    return messages_;
}

} // namespace wmn
