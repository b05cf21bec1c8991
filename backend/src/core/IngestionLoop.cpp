#include "core/IngestionLoop.hpp"

#include "core/ErrorCatalog.hpp"
#include "core/TelemetryDecoder.hpp"
#include "net/BusClient.hpp"

#include <iostream>

namespace wmn {

IngestionLoop::IngestionLoop(DeviceStore& store) : store_(store) {}

IngestionLoop::~IngestionLoop() {
    stop();
}

std::vector<std::string> IngestionLoop::topic_filters() {
    return { kMetricsTopicFilter, kAnalysisTopicFilter, kExplainTopicFilter };
}

bool IngestionLoop::handle_message(const std::string& topic, const std::string& payload, TimePoint received_at) {
    auto outcome = decode_message(topic, payload);
    if (!outcome) {
        if (outcome.error_code == errors::E1102_TOPIC_IGNORED) {
            ignored_ += 1;
        } else {
            rejected_ += 1;
            std::cerr << "IngestionLoop: dropped message on " << topic << ": " << outcome.error << std::endl;
        }
        return false;
    }
    store_.ingest(*outcome.message, received_at);
    accepted_ += 1;
    return true;
}

void IngestionLoop::start(const BusConfig& cfg) {
    if (bus_) return;
    bus_ = std::make_unique<BusClient>(cfg, topic_filters());
    bus_->set_handler([this](const std::string& topic, const std::string& payload) {
        handle_message(topic, payload);
    });
    std::cout << "IngestionLoop: subscribing to " << cfg.host << ":" << cfg.port
              << " as " << bus_->client_id() << std::endl;
    bus_->start();
}

void IngestionLoop::stop() {
    if (!bus_) return;
    bus_->stop();
    bus_.reset();
}

bool IngestionLoop::connected() const {
    return bus_ && bus_->connected();
}

} // namespace wmn
