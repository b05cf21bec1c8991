#include "SnapshotProtocol.hpp"

#include "core/BuildInfo.hpp"
#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/Recorder.hpp"
#include "core/SnapshotService.hpp"
#include "net/ExplainerClient.hpp"

#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace wmn {

static RpcError rejected(const std::string& detail) {
    return RpcError(errors::E2400_CONTROL_REJECTED, errors::format_E2400_control_rejected(detail));
}

static std::string required_string(const json& params, const char* key, const char* missing_detail) {
    if (!params.is_object()) throw rejected(missing_detail);
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) throw rejected(missing_detail);
    return it->get<std::string>();
}

json rpc_ok(const json& id, json result) {
    return { {"type", "rpc_result"}, {"id", id}, {"ok", true}, {"result", std::move(result)} };
}

json rpc_error(const json& id, int code, const std::string& message, const json& details) {
    json err = { {"code", code}, {"message", message} };
    if (!details.is_null()) err["details"] = details;
    return { {"type", "rpc_result"}, {"id", id}, {"ok", false}, {"error", std::move(err)} };
}

SnapshotProtocol::SnapshotProtocol(const SnapshotService& service, const ExplainerClient& explainer, Recorder* recorder)
: service_(service), explainer_(explainer), recorder_(recorder) {}

json SnapshotProtocol::build_fleet_update() const {
    json incidents = json::array();
    for (const auto& i : service_.incidents()) incidents.push_back(to_json(i));
    return {
        {"type", "fleet_update"},
        {"ts", to_epoch_seconds(Clock::now())},
        {"status", to_json(service_.status())},
        {"fleet", fleet_overview()["rows"]},
        {"incidents", std::move(incidents)}
    };
}

std::optional<json> SnapshotProtocol::handle_text(const std::string& data) {
    json msg = json::parse(data, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        return rpc_error(nullptr, errors::E2400_CONTROL_REJECTED,
                         errors::format_E2400_control_rejected(errors::D2400_INVALID_REQUEST));
    }
    if (msg.value("type", std::string{}) != "rpc") {
        std::cerr << "SnapshotProtocol: ignoring message type '" << msg.value("type", std::string{}) << "'" << std::endl;
        return std::nullopt;
    }
    return handle_rpc(msg);
}

json SnapshotProtocol::handle_rpc(const json& req) {
    json id = req.contains("id") ? req["id"] : json(nullptr);
    if (!(id.is_string() || id.is_number_integer())) {
        return rpc_error(nullptr, errors::E2400_CONTROL_REJECTED,
                         errors::format_E2400_control_rejected(errors::D2400_RPC_MISSING_ID));
    }
    auto m = req.find("method");
    if (m == req.end() || !m->is_string()) {
        return rpc_error(id, errors::E2400_CONTROL_REJECTED,
                         errors::format_E2400_control_rejected(errors::D2400_RPC_MISSING_METHOD));
    }
    const std::string method = m->get<std::string>();
    const json params = req.contains("params") ? req["params"] : json::object();

    try {
        return rpc_ok(id, dispatch(method, params));
    } catch (const RpcError& e) {
        return rpc_error(id, e.code(), e.what(), e.details());
    } catch (const std::exception& e) {
        std::cerr << "SnapshotProtocol: " << method << " failed: " << e.what() << std::endl;
        return rpc_error(id, errors::E2400_CONTROL_REJECTED, errors::format_E2400_control_rejected(e.what()));
    }
}

json SnapshotProtocol::dispatch(const std::string& method, const json& params) {
    if (method == "status") return status();
    if (method == "devices.list") return { {"devices", service_.list_devices()} };
    if (method == "device.view") return device_view(params);
    if (method == "device.latency_trend") return latency_trend(params);
    if (method == "device.score_trend") return score_trend(params);
    if (method == "fleet.overview") return fleet_overview();
    if (method == "incidents") return incidents(params);
    if (method == "device.explain") return explain(params);
    if (method == "record.start") return record_start(params);
    if (method == "record.stop") return record_stop(params);
    throw rejected(std::string(errors::D2400_RPC_UNKNOWN_METHOD) + ": " + method);
}

std::string SnapshotProtocol::known_device(const json& params) const {
    std::string id = required_string(params, "device_id", errors::D2400_MISSING_DEVICE_ID);
    auto ids = service_.list_devices();
    if (!std::binary_search(ids.begin(), ids.end(), id)) {
        throw rejected(std::string(errors::D2400_UNKNOWN_DEVICE) + ": " + id);
    }
    return id;
}

json SnapshotProtocol::status() const {
    json out = to_json(service_.status());
    out["build"] = {
        {"version", buildinfo::version()},
        {"git_commit", buildinfo::git_commit()},
        {"build_time", buildinfo::build_time_utc_approx()}
    };
    out["explainer_configured"] = explainer_.configured();
    out["recordings_active"] = recorder_ ? recorder_->active() : 0;
    return out;
}

json SnapshotProtocol::device_view(const json& params) const {
    std::string id = required_string(params, "device_id", errors::D2400_MISSING_DEVICE_ID);
    auto d = service_.device_view(id);
    if (!d) throw rejected(std::string(errors::D2400_UNKNOWN_DEVICE) + ": " + id);
    return to_json(*d);
}

json SnapshotProtocol::latency_trend(const json& params) const {
    std::string id = known_device(params);
    return { {"device_id", id}, {"points", to_json(service_.latency_trend(id))} };
}

json SnapshotProtocol::score_trend(const json& params) const {
    std::string id = known_device(params);
    return { {"device_id", id}, {"points", to_json(service_.score_trend(id))} };
}

json SnapshotProtocol::fleet_overview() const {
    json rows = json::array();
    for (const auto& r : service_.fleet_overview()) rows.push_back(to_json(r));
    return { {"rows", std::move(rows)} };
}

json SnapshotProtocol::incidents(const json& params) const {
    if (!params.is_null() && !params.is_object()) throw rejected(errors::D2400_INCIDENT_PARAMS_INVALID);
    std::vector<Incident> list;
    if (params.is_null() || params.empty()) {
        list = service_.incidents();
    } else {
        list = service_.incidents(incident_config_with_overrides(service_.incident_defaults(), params));
    }
    json arr = json::array();
    for (const auto& i : list) arr.push_back(to_json(i));
    return { {"incidents", std::move(arr)} };
}

json SnapshotProtocol::explain(const json& params) const {
    std::string id = required_string(params, "device_id", errors::D2400_MISSING_DEVICE_ID);
    auto q = params.find("question");
    if (q == params.end() || !q->is_string()) throw rejected(errors::D2400_MISSING_QUESTION);

    auto req = service_.build_explain_request(id, q->get<std::string>());
    if (!req) throw RpcError(req.error_code, req.error);

    ExplainResult r = explainer_.explain(*req.payload);
    if (!r.ok) throw RpcError(r.error_code, r.error, to_json(r));
    return { {"device_id", id}, {"response", r.body} };
}

json SnapshotProtocol::record_start(const json& params) {
    if (!recorder_) throw rejected(errors::D2400_RECORDER_NOT_INITIALIZED);
    auto r = recorder_->start(params);
    return { {"recording_id", r.recording_id}, {"path", r.path} };
}

json SnapshotProtocol::record_stop(const json& params) {
    if (!recorder_) throw rejected(errors::D2400_RECORDER_NOT_INITIALIZED);
    std::string id = required_string(params, "recording_id", errors::D2400_MISSING_RECORDING_ID);
    auto r = recorder_->stop(id);
    if (!r) throw rejected(std::string(errors::D2400_UNKNOWN_RECORDING_ID) + ": " + id);
    return {
        {"recording_id", r->recording_id},
        {"path", r->path},
        {"snapshots_written", r->snapshots_written},
        {"started_ts_ms", r->started_ts_ms},
        {"stopped_ts_ms", r->stopped_ts_ms}
    };
}

} // namespace wmn
