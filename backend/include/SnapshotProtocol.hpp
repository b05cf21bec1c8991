#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace wmn {

class ExplainerClient;
class Recorder;
class SnapshotService;

// Raised inside an RPC handler; turned into an ok:false result.
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, nlohmann::json details = nullptr)
    : std::runtime_error(message), code_(code), details_(std::move(details)) {}

    int code() const { return code_; }
    const nlohmann::json& details() const { return details_; }

private:
    int code_;
    nlohmann::json details_;
};

/**
 * @brief Query-channel message builder and RPC dispatcher.
 *
 * Requests:  {"type":"rpc","id","method","params"}
 * Responses: {"type":"rpc_result","id","ok","result"} or
 *            {"type":"rpc_result","id","ok":false,"error":{"code","message"}}
 */
class SnapshotProtocol {
public:
    // recorder may be null (record.* then fails with E2400)
    SnapshotProtocol(const SnapshotService& service, const ExplainerClient& explainer, Recorder* recorder);

    nlohmann::json build_fleet_update() const;

    // One inbound text frame. nullopt when the frame needs no reply.
    std::optional<nlohmann::json> handle_text(const std::string& data);
    nlohmann::json handle_rpc(const nlohmann::json& req);

    // Throws RpcError / std::runtime_error.
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

private:
    nlohmann::json status() const;
    nlohmann::json device_view(const nlohmann::json& params) const;
    nlohmann::json latency_trend(const nlohmann::json& params) const;
    nlohmann::json score_trend(const nlohmann::json& params) const;
    nlohmann::json fleet_overview() const;
    nlohmann::json incidents(const nlohmann::json& params) const;
    nlohmann::json explain(const nlohmann::json& params) const;
    nlohmann::json record_start(const nlohmann::json& params);
    nlohmann::json record_stop(const nlohmann::json& params);

    std::string known_device(const nlohmann::json& params) const;

    const SnapshotService& service_;
    const ExplainerClient& explainer_;
    Recorder* recorder_;
};

nlohmann::json rpc_ok(const nlohmann::json& id, nlohmann::json result);
nlohmann::json rpc_error(const nlohmann::json& id, int code, const std::string& message,
                         const nlohmann::json& details = nullptr);

} // namespace wmn
