#include <iostream>
#include <algorithm>
#include "core/IngestionLoop.hpp"
#include "core/SnapshotService.hpp"
#include "simulator/Simulator.hpp"

using namespace wmn;

static bool has_incident(const std::vector<Incident>& list, const std::string& device, IncidentType type) {
    return std::any_of(list.begin(), list.end(), [&](const Incident& i) {
        return i.device_id == device && i.type == type;
    });
}

int main() {
    std::cout << "Pipeline CI-less tests starting...\n";
    try {
        DemoConfig demo;
        demo.nodes = 6;
        demo.seed = 42;
        Simulator sim(demo);

        DeviceStore store;
        IngestionLoop ingest(store);
        const TimePoint base = from_epoch_seconds(1700000000.0);
        TimePoint now = base;
        SnapshotService service(store, IncidentConfig{}, {}, [&]() { return now; });

        // 45 ticks puts the spiky node's first latency spike last
        for (int i = 0; i < 45; ++i) {
            now = base + std::chrono::seconds(i);
            sim.tick(now, [&](const std::string& topic, const std::string& payload) {
                ingest.handle_message(topic, payload, now);
            });
        }

        if (ingest.rejected() != 0 || ingest.ignored() != 0) {
            std::cerr << "simulator produced undecodable messages\n";
            return 2;
        }
        auto devices = service.list_devices();
        if (devices.size() != 6) { std::cerr << "expected 6 devices, got " << devices.size() << "\n"; return 3; }

        auto incidents = service.incidents();
        if (!has_incident(incidents, "sim-node-06", IncidentType::Offline)) {
            std::cerr << "silent node not reported offline\n";
            return 4;
        }
        if (!has_incident(incidents, "sim-node-04", IncidentType::Congestion)) {
            std::cerr << "congested node not reported\n";
            return 5;
        }
        if (!has_incident(incidents, "sim-node-03", IncidentType::LatencyAnomaly)) {
            std::cerr << "latency spike not detected\n";
            return 6;
        }
        auto first_warn = std::find_if(incidents.begin(), incidents.end(),
                                       [](const Incident& i) { return i.severity == Severity::Warn; });
        if (std::any_of(first_warn, incidents.end(), [](const Incident& i) { return i.severity == Severity::Bad; })) {
            std::cerr << "incidents not ordered bad before warn\n";
            return 7;
        }

        auto nominal = service.device_view("sim-node-01");
        if (!nominal || nominal->health.source != HealthSource::Analyzer) {
            std::cerr << "nominal node should carry an analyzer score\n";
            return 8;
        }
        auto weak = service.device_view("sim-node-02");
        if (!weak || weak->health.source != HealthSource::Computed) {
            std::cerr << "weak node should fall back to the computed score\n";
            return 9;
        }
        if (service.status().freshness != "ok") { std::cerr << "status not fresh\n"; return 10; }

        std::cout << "Pipeline CI-less tests passed\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << std::endl;
        return 1;
    }
}
