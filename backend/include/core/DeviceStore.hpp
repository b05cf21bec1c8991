#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/circular_buffer.hpp>

#include "core/Telemetry.hpp"

namespace wmn {

struct StoreConfig {
    std::size_t latency_capacity = 800;
    std::size_t score_capacity = 800;
};

// Joined latest records for one device. Records the device never sent stay
// empty.
struct DeviceView {
    std::string device_id;
    std::optional<MetricSnapshot> metrics;
    std::optional<AnalysisSnapshot> analysis;
    std::optional<ExplanationSnapshot> explanation;
    std::optional<TimePoint> last_seen;
};

bool operator==(const DeviceView& a, const DeviceView& b);

// A device view together with its latency history, read under one lock.
struct DeviceRecord {
    DeviceView view;
    std::vector<Sample> latency_history;
};

/**
 * @brief Owner of all per-device telemetry state.
 *
 * One instance per process, shared by reference between the ingestion loop
 * (writer) and every query path (readers). Each ingest() is applied under a
 * single lock, so a reader sees either none or all of a message's effects:
 * the per-kind record, the history append and last_seen.
 */
class DeviceStore {
public:
    explicit DeviceStore(StoreConfig cfg = {});

    void ingest(const TelemetryMessage& msg, TimePoint received_at);

    // Union of devices across metrics/analysis/explain records, sorted by id.
    std::vector<DeviceView> snapshot() const;
    std::vector<DeviceRecord> snapshot_with_history() const;
    std::optional<DeviceView> device(const std::string& device_id) const;

    // Samples in arrival order, oldest first. Empty for unknown devices.
    std::vector<Sample> latency_history(const std::string& device_id) const;
    std::vector<Sample> score_history(const std::string& device_id) const;

    // Ids holding a record of one kind, sorted.
    std::vector<std::string> device_ids(MessageKind kind) const;

    std::optional<TimePoint> last_message_at() const;
    std::uint64_t messages_ingested() const;

    const StoreConfig& config() const { return cfg_; }

private:
    using History = boost::circular_buffer<Sample>;

    std::vector<std::string> ids_locked() const;
    DeviceView view_locked(const std::string& device_id) const;
    static std::vector<Sample> copy_history(const std::unordered_map<std::string, History>& map,
                                            const std::string& device_id);

    const StoreConfig cfg_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, MetricSnapshot> metrics_;
    std::unordered_map<std::string, AnalysisSnapshot> analysis_;
    std::unordered_map<std::string, ExplanationSnapshot> explain_;
    std::unordered_map<std::string, History> latency_hist_;
    std::unordered_map<std::string, History> score_hist_;
    std::unordered_map<std::string, TimePoint> last_seen_;
    std::optional<TimePoint> last_message_at_;
    std::uint64_t messages_ = 0;
};

} // namespace wmn
