#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace wmn {

class SnapshotService;

struct RecordStartResult {
    std::string recording_id;
    std::string path;
};

struct RecordStopResult {
    std::string recording_id;
    std::string path;
    int64_t snapshots_written = 0;
    int64_t started_ts_ms = 0;
    int64_t stopped_ts_ms = 0;
};

/**
 * @brief Periodic fleet snapshot export to JSON-lines files.
 *
 * Each recording owns a worker thread that samples the snapshot service at
 * `rate_hz` and appends one line per tick. File layout:
 *   header   {"type":"wmn_recording", ...provenance}
 *   snapshot {"type":"snapshot","ts_ms",status,fleet[,incidents]}
 *   stop     {"type":"stop","snapshots_written",...}
 */
class Recorder {
public:
    // Empty recordings_dir falls back to ./recordings.
    Recorder(const SnapshotService& service, std::string recordings_dir, int port);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // params: {rate_hz?, file_base?, include_incidents?, operator?}
    // Throws std::runtime_error carrying a catalogued detail string.
    RecordStartResult start(const nlohmann::json& params);
    std::optional<RecordStopResult> stop(const std::string& recording_id);

    std::size_t active() const;
    const std::string& recordings_dir() const { return dir_; }

private:
    struct Session {
        std::string id;
        std::string path;
        std::string operator_name;
        double rate_hz = 1.0;
        bool include_incidents = true;
        int64_t started_ts_ms = 0;

        std::atomic<bool> running{false};
        std::thread worker;
        std::mutex wake_m;
        std::condition_variable wake_cv;

        std::ofstream file;
        int64_t snapshots_written = 0;
        int64_t stopped_ts_ms = 0;
    };

    const SnapshotService& service_;
    std::string dir_;
    int port_;

    mutable std::mutex sessions_m_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;

    static std::string random_id();
    static int64_t now_ms();
    static std::string day_folder();

    nlohmann::json snapshot_line(const Session& s, int64_t ts_ms) const;
    void run_session(const std::shared_ptr<Session>& s);
};

} // namespace wmn
