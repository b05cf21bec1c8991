#include "core/TelemetryDecoder.hpp"

#include "core/ErrorCatalog.hpp"

#include <cmath>
#include <vector>

using json = nlohmann::json;

namespace wmn {

namespace {

// Upper bound for a payload `ts` in epoch seconds; larger values are
// milli/microsecond stamps and are dropped.
constexpr double kMaxOriginTsSeconds = 1e11;

std::vector<std::string_view> split_levels(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    for (;;) {
        auto pos = s.find('/', start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

// Numbers only: booleans and numeric strings are not readings.
std::optional<double> json_number(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return std::nullopt;
    double v = it->get<double>();
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<int> json_int(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<int>();
    return std::nullopt;
}

std::optional<std::string> json_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

bool json_flag(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

// Nested record under `key`; absent or non-object is an empty record.
json sub_object(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_object()) return json::object();
    return *it;
}

MetricSnapshot parse_metrics(const json& m) {
    MetricSnapshot out;
    out.rssi_dbm = json_number(m, "rssi_dbm");
    out.latency_ms = json_number(m, "latency_ms_avg");
    out.jitter_ms = json_number(m, "jitter_ms");
    out.packet_loss_pct = json_number(m, "packet_loss_pct");
    out.interface_name = json_string(m, "interface");
    out.channel = json_int(m, "channel");
    out.throughput_up_mbps = json_number(m, "throughput_up_mbps");
    out.throughput_down_mbps = json_number(m, "throughput_down_mbps");
    out.raw = m;
    return out;
}

AnalysisSnapshot parse_analysis(const json& a) {
    AnalysisSnapshot out;
    out.score = json_number(a, "wireless_score_0_100");
    out.handover_detected = json_flag(a, "handover_detected");
    out.congestion_detected = json_flag(a, "congestion_detected");
    out.raw = a;
    return out;
}

ExplanationSnapshot parse_explanation(const json& payload) {
    ExplanationSnapshot out;
    for (const char* key : {"text", "explanation"}) {
        auto s = json_string(payload, key);
        if (s && !s->empty()) {
            out.text = *s;
            return out;
        }
    }
    out.text = payload.dump();
    return out;
}

} // namespace

bool topic_matches(std::string_view filter, std::string_view topic) {
    // wildcards in the first level never match $-prefixed system topics
    if (!topic.empty() && topic.front() == '$' && !filter.empty() && (filter.front() == '+' || filter.front() == '#')) {
        return false;
    }
    auto f = split_levels(filter);
    auto t = split_levels(topic);
    for (std::size_t i = 0; i < f.size(); ++i) {
        if (f[i] == "#") return true;  // also matches the parent level
        if (i >= t.size()) return false;
        if (f[i] != "+" && f[i] != t[i]) return false;
    }
    return f.size() == t.size();
}

std::optional<MessageKind> classify_topic(std::string_view topic) {
    if (topic_matches(kMetricsTopicFilter, topic)) return MessageKind::Metrics;
    if (topic_matches(kAnalysisTopicFilter, topic)) return MessageKind::Analysis;
    if (topic_matches(kExplainTopicFilter, topic)) return MessageKind::Explain;
    return std::nullopt;
}

DecodeOutcome decode_message(std::string_view topic, std::string_view payload) {
    DecodeOutcome outcome;

    auto kind = classify_topic(topic);
    if (!kind) {
        outcome.error_code = errors::E1102_TOPIC_IGNORED;
        outcome.error = "topic outside wmn namespaces: " + std::string(topic);
        return outcome;
    }

    json doc = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (doc.is_discarded()) {
        outcome.error_code = errors::E1100_PAYLOAD_NOT_JSON;
        outcome.error = errors::MSG_E1100_PAYLOAD_NOT_JSON;
        return outcome;
    }
    if (!doc.is_object()) {
        outcome.error_code = errors::E1101_PAYLOAD_NOT_OBJECT;
        outcome.error = errors::MSG_E1101_PAYLOAD_NOT_OBJECT;
        return outcome;
    }

    TelemetryMessage msg;
    msg.kind = *kind;
    if (auto id = json_string(doc, "device_id"); id && !id->empty()) msg.device_id = *id;
    if (auto ts = json_number(doc, "ts"); ts && *ts >= 0.0 && *ts < kMaxOriginTsSeconds) {
        msg.origin_ts = from_epoch_seconds(*ts);
    }

    switch (msg.kind) {
        case MessageKind::Metrics:
            msg.metrics = parse_metrics(sub_object(doc, "metrics"));
            break;
        case MessageKind::Analysis:
            msg.analysis = parse_analysis(sub_object(doc, "analysis"));
            break;
        case MessageKind::Explain:
            msg.explanation = parse_explanation(doc);
            break;
    }

    outcome.message = std::move(msg);
    return outcome;
}

} // namespace wmn
