#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/Telemetry.hpp"

namespace wmn {

inline constexpr const char* kMetricsTopicFilter = "wmn/metrics/#";
inline constexpr const char* kAnalysisTopicFilter = "wmn/analysis/#";
inline constexpr const char* kExplainTopicFilter = "wmn/explain/#";

struct DecodeOutcome {
    std::optional<TelemetryMessage> message;
    // 0 when a message was produced, otherwise an errors::E11xx code
    int error_code = 0;
    std::string error;

    explicit operator bool() const { return message.has_value(); }
};

// MQTT filter match: `+` is one level, a trailing `#` is the remainder
// including the parent level.
bool topic_matches(std::string_view filter, std::string_view topic);

// Map a bus topic onto a message kind; nullopt for topics outside the wmn
// namespaces.
std::optional<MessageKind> classify_topic(std::string_view topic);

// Decode one bus message. Never throws: malformed payloads and foreign topics
// come back as an outcome without a message.
DecodeOutcome decode_message(std::string_view topic, std::string_view payload);

} // namespace wmn
