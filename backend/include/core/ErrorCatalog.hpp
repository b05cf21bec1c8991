#pragma once

#include <string>
#include <string_view>

namespace wmn::errors {

// Numbered error catalog.
// 1100-1199: telemetry decode (logged, never raised to the ingestion loop)
// 2100-2199: message bus session
// 2400-2499: WebSocket / query channel errors
// 3100-3199: explanation service

inline constexpr int E1100_PAYLOAD_NOT_JSON = 1100;
inline constexpr int E1101_PAYLOAD_NOT_OBJECT = 1101;
inline constexpr int E1102_TOPIC_IGNORED = 1102;

inline constexpr int E2100_BUS_CONNECT_FAILED = 2100;
inline constexpr int E2101_BUS_REFUSED = 2101;
inline constexpr int E2102_BUS_SUBSCRIBE_FAILED = 2102;

inline constexpr int E2400_CONTROL_REJECTED = 2400;
inline constexpr int E2410_SESSION_DROPPED = 2410;

inline constexpr int E3100_EXPLAINER_NOT_CONFIGURED = 3100;
inline constexpr int E3101_EXPLAINER_BAD_REQUEST = 3101;
inline constexpr int E3110_EXPLAINER_TRANSPORT = 3110;
inline constexpr int E3120_EXPLAINER_HTTP_STATUS = 3120;
inline constexpr int E3130_EXPLAINER_NOT_JSON = 3130;

inline constexpr const char* MSG_E1100_PAYLOAD_NOT_JSON = "Error 1100: telemetry payload is not valid JSON";
inline constexpr const char* MSG_E1101_PAYLOAD_NOT_OBJECT = "Error 1101: telemetry payload is not a JSON object";

inline constexpr const char* MSG_E2100_BUS_CONNECT_FAILED_PREFIX = "Error 2100: bus connection failed: ";
inline constexpr const char* MSG_E2101_BUS_REFUSED_PREFIX = "Error 2101: broker refused connection: ";
inline constexpr const char* MSG_E2102_BUS_SUBSCRIBE_FAILED_PREFIX = "Error 2102: bus subscription failed: ";

inline constexpr const char* MSG_E2400_CONTROL_REJECTED_PREFIX = "Error 2400: Control message rejected: ";
inline constexpr const char* MSG_E2410_SESSION_DROPPED = "Error 2410: WebSocket session dropped unexpectedly";

// Common, catalogued detail strings for E2400.
inline constexpr const char* D2400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D2400_RPC_MISSING_ID = "rpc request missing id";
inline constexpr const char* D2400_RPC_MISSING_METHOD = "rpc request missing method";
inline constexpr const char* D2400_RPC_UNKNOWN_METHOD = "unknown rpc method";
inline constexpr const char* D2400_MISSING_DEVICE_ID = "missing params.device_id";
inline constexpr const char* D2400_MISSING_QUESTION = "missing params.question";
inline constexpr const char* D2400_UNKNOWN_DEVICE = "unknown device";
inline constexpr const char* D2400_INCIDENT_PARAMS_INVALID = "incidents params must be object";
inline constexpr const char* D2400_RECORDER_NOT_INITIALIZED = "recorder not initialized";
inline constexpr const char* D2400_MISSING_RECORDING_ID = "missing params.recording_id";
inline constexpr const char* D2400_UNKNOWN_RECORDING_ID = "unknown recording_id";

// Recorder validation / I/O details (kept in catalog to avoid ad-hoc strings crossing RPC boundary).
inline constexpr const char* D2400_RECORD_PARAMS_NOT_OBJECT = "record.start params must be object";
inline constexpr const char* D2400_RECORD_RATE_INVALID = "record.start rate_hz must be > 0";
inline constexpr const char* D2400_RECORD_OPEN_FILE_FAILED = "failed to open recording file";

// Explanation service details.
inline constexpr const char* D3100_NOT_CONFIGURED = "EXPLAINER_HTTP_BASE not configured";
inline constexpr const char* D3101_EMPTY_QUESTION = "question is empty";
inline constexpr const char* D3101_UNKNOWN_DEVICE = "no telemetry for device";
inline constexpr const char* D3130_NOT_JSON = "explainer response is not JSON";

inline std::string code_string(int code) {
    return std::to_string(code);
}

inline std::string format_E2400_control_rejected(std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(MSG_E2400_CONTROL_REJECTED_PREFIX) + detail.size());
    out.append(MSG_E2400_CONTROL_REJECTED_PREFIX);
    if (detail.empty()) {
        out.append(D2400_INVALID_REQUEST);
    } else {
        out.append(detail.data(), detail.size());
    }
    return out;
}

inline std::string format_with_prefix(const char* prefix, std::string_view detail) {
    std::string out(prefix);
    out.append(detail.data(), detail.size());
    return out;
}

} // namespace wmn::errors
