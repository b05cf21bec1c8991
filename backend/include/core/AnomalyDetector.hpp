#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/Telemetry.hpp"

namespace wmn {

enum class Severity {
    Warn,
    Bad,
};

const char* to_string(Severity s);

struct AnomalyConfig {
    std::size_t window = 30;
    std::size_t min_samples = 30;
    double z_threshold = 3.0;
    // |z| >= z_threshold * bad_multiplier escalates warn -> bad
    double bad_multiplier = 1.35;
};

struct AnomalyVerdict {
    bool anomalous = false;
    std::optional<Severity> severity; // set iff anomalous
    double z = 0.0;
    double mean = 0.0;
    double stddev = 0.0;
    double latest = 0.0;
    TimePoint latest_ts;
    std::size_t samples = 0;
};

/**
 * @brief Rolling z-score check of the newest latency sample.
 *
 * The history is ordered by sample timestamp first (arrival order can differ
 * under concurrent delivery), then mean and sample standard deviation are
 * taken over the trailing `window` samples, newest included.
 *
 * @return nullopt ("no verdict") when there are fewer than
 *         max(min_samples, window) samples, or the window has zero variance.
 */
std::optional<AnomalyVerdict> evaluate_latency(const std::vector<Sample>& history,
                                               const AnomalyConfig& cfg);

} // namespace wmn
