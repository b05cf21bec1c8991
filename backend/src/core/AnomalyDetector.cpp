#include "core/AnomalyDetector.hpp"

#include <algorithm>
#include <cmath>

namespace wmn {

const char* to_string(Severity s) {
    switch (s) {
        case Severity::Warn: return "warn";
        case Severity::Bad: return "bad";
    }
    return "warn";
}

std::optional<AnomalyVerdict> evaluate_latency(const std::vector<Sample>& history,
                                               const AnomalyConfig& cfg) {
    const std::size_t needed = std::max(cfg.min_samples, cfg.window);
    if (cfg.window < 2 || history.size() < needed) return std::nullopt;

    std::vector<Sample> sorted = history;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Sample& a, const Sample& b) { return a.ts < b.ts; });

    auto first = sorted.end() - static_cast<std::ptrdiff_t>(cfg.window);
    auto [lo, hi] = std::minmax_element(first, sorted.end(),
                                        [](const Sample& a, const Sample& b) { return a.value < b.value; });
    if (lo->value == hi->value) return std::nullopt;

    double sum = 0.0;
    for (auto it = first; it != sorted.end(); ++it) sum += it->value;
    const double n = static_cast<double>(cfg.window);
    const double mean = sum / n;

    double sq = 0.0;
    for (auto it = first; it != sorted.end(); ++it) sq += (it->value - mean) * (it->value - mean);
    const double stddev = std::sqrt(sq / (n - 1.0));
    if (!(stddev > 0.0) || !std::isfinite(stddev)) return std::nullopt;

    const Sample& latest = sorted.back();

    AnomalyVerdict v;
    v.mean = mean;
    v.stddev = stddev;
    v.latest = latest.value;
    v.latest_ts = latest.ts;
    v.samples = cfg.window;
    v.z = (latest.value - mean) / stddev;

    const double az = std::abs(v.z);
    if (az >= cfg.z_threshold) {
        v.anomalous = true;
        v.severity = az >= cfg.z_threshold * cfg.bad_multiplier ? Severity::Bad : Severity::Warn;
    }
    return v;
}

} // namespace wmn
