#include "core/Recorder.hpp"

#include "core/BuildInfo.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/SnapshotService.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace wmn {

Recorder::Recorder(const SnapshotService& service, std::string recordings_dir, int port)
: service_(service), dir_(std::move(recordings_dir)), port_(port) {
    if (dir_.empty()) dir_ = "recordings";
}

Recorder::~Recorder() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(sessions_m_);
        for (const auto& [id, _] : sessions_) ids.push_back(id);
    }
    for (const auto& id : ids) {
        stop(id);
    }
}

int64_t Recorder::now_ms() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Recorder::random_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (int i = 0; i < 32; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
    return out;
}

std::string Recorder::day_folder() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream day;
    day << std::setfill('0') << std::setw(4) << (tm.tm_year + 1900) << "-" << std::setw(2) << (tm.tm_mon + 1)
        << "-" << std::setw(2) << tm.tm_mday;
    return day.str();
}

std::size_t Recorder::active() const {
    std::lock_guard<std::mutex> lk(sessions_m_);
    return sessions_.size();
}

RecordStartResult Recorder::start(const json& params) {
    const json p = params.is_null() ? json::object() : params;
    if (!p.is_object()) throw std::runtime_error(errors::D2400_RECORD_PARAMS_NOT_OBJECT);

    auto session = std::make_shared<Session>();
    auto rate = p.find("rate_hz");
    if (rate != p.end()) {
        if (!rate->is_number()) throw std::runtime_error(errors::D2400_RECORD_RATE_INVALID);
        session->rate_hz = rate->get<double>();
    }
    if (!(session->rate_hz > 0.0) || !std::isfinite(session->rate_hz)) {
        throw std::runtime_error(errors::D2400_RECORD_RATE_INVALID);
    }
    session->include_incidents = p.value("include_incidents", true);
    session->operator_name = p.value("operator", "");
    session->id = random_id();
    session->started_ts_ms = now_ms();

    std::string base = p.value("file_base", std::string("fleet"));
    for (char& c : base) {
        if (!(std::isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.')) c = '_';
    }
    if (base.empty()) base = "fleet";

    std::filesystem::path day_dir = std::filesystem::path(dir_) / day_folder();
    std::error_code fs_ec;
    std::filesystem::create_directories(day_dir, fs_ec);
    if (fs_ec) {
        throw std::runtime_error(std::string(errors::D2400_RECORD_OPEN_FILE_FAILED) + ": " + fs_ec.message());
    }

    std::filesystem::path path = day_dir / (base + "_" + session->id + ".jsonl");
    session->path = path.string();

    session->file.open(session->path, std::ios::out | std::ios::trunc);
    if (!session->file) throw std::runtime_error(errors::D2400_RECORD_OPEN_FILE_FAILED);

    json header = {
        {"type", "wmn_recording"},
        {"schema_version", 1},
        {"recording_id", session->id},
        {"started_ts_ms", session->started_ts_ms},
        {"rate_hz", session->rate_hz},
        {"include_incidents", session->include_incidents},
        {"meta", {
            {"operator", session->operator_name},
            {"backend", {
                {"port", port_},
                {"version", buildinfo::version()},
                {"git_commit", buildinfo::git_commit()},
                {"build_time", buildinfo::build_time_utc_approx()}
            }}
        }}
    };
    session->file << header.dump() << "\n";
    session->file.flush();

    session->running.store(true);
    session->worker = std::thread([this, session]() { run_session(session); });

    {
        std::lock_guard<std::mutex> lk(sessions_m_);
        sessions_[session->id] = session;
    }
    std::cout << "Recorder: started " << session->id << " -> " << session->path << std::endl;
    return { session->id, session->path };
}

json Recorder::snapshot_line(const Session& s, int64_t ts_ms) const {
    json fleet = json::array();
    for (const auto& row : service_.fleet_overview()) fleet.push_back(to_json(row));
    json line = {
        {"type", "snapshot"},
        {"ts_ms", ts_ms},
        {"status", to_json(service_.status())},
        {"fleet", std::move(fleet)}
    };
    if (s.include_incidents) {
        json inc = json::array();
        for (const auto& i : service_.incidents()) inc.push_back(to_json(i));
        line["incidents"] = std::move(inc);
    }
    return line;
}

void Recorder::run_session(const std::shared_ptr<Session>& s) {
    const auto interval = std::chrono::milliseconds((int64_t)std::max(1.0, 1000.0 / s->rate_hz));
    auto next_due = std::chrono::steady_clock::now();

    while (s->running.load()) {
        try {
            json line = snapshot_line(*s, now_ms());
            s->file << line.dump() << "\n";
            s->snapshots_written += 1;
        } catch (const std::exception& e) {
            std::cerr << "Recorder: snapshot failed for " << s->id << ": " << e.what() << std::endl;
        }

        next_due += interval;
        std::unique_lock<std::mutex> lk(s->wake_m);
        s->wake_cv.wait_until(lk, next_due, [&]() { return !s->running.load(); });
    }

    s->stopped_ts_ms = now_ms();
    if (s->file) {
        json footer = {
            {"type", "stop"},
            {"recording_id", s->id},
            {"stopped_ts_ms", s->stopped_ts_ms},
            {"snapshots_written", s->snapshots_written}
        };
        s->file << footer.dump() << "\n";
        s->file.flush();
        s->file.close();
    }
}

std::optional<RecordStopResult> Recorder::stop(const std::string& recording_id) {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lk(sessions_m_);
        auto it = sessions_.find(recording_id);
        if (it == sessions_.end()) return std::nullopt;
        s = it->second;
        sessions_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lk(s->wake_m);
        s->running.store(false);
    }
    s->wake_cv.notify_all();
    if (s->worker.joinable()) s->worker.join();

    RecordStopResult out;
    out.recording_id = s->id;
    out.path = s->path;
    out.snapshots_written = s->snapshots_written;
    out.started_ts_ms = s->started_ts_ms;
    out.stopped_ts_ms = s->stopped_ts_ms;
    std::cout << "Recorder: stopped " << s->id << " (" << out.snapshots_written << " snapshots)" << std::endl;
    return out;
}

} // namespace wmn
