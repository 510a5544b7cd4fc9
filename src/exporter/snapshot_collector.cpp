/**
 * @file snapshot_collector.cpp
 * @brief SnapshotCollector implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/exporter/snapshot_collector.hpp"
#include "kasad/utils/logger.hpp"

#include <prometheus/client_metric.h>
#include <prometheus/metric_type.h>

#include <chrono>
#include <string>

namespace kasad {
namespace exporter {

namespace {

prometheus::MetricFamily family(const std::string& name, const std::string& help,
                                prometheus::MetricType type) {
    prometheus::MetricFamily f;
    f.name = name;
    f.help = help;
    f.type = type;
    return f;
}

std::vector<prometheus::ClientMetric::Label> deviceLabels(const std::string& alias,
                                                          const std::string& deviceId) {
    prometheus::ClientMetric::Label aliasLabel;
    aliasLabel.name = "device_alias";
    aliasLabel.value = alias;

    prometheus::ClientMetric::Label idLabel;
    idLabel.name = "device_id";
    idLabel.value = deviceId;

    return {aliasLabel, idLabel};
}

prometheus::ClientMetric gauge(double value,
                               std::vector<prometheus::ClientMetric::Label> labels = {}) {
    prometheus::ClientMetric metric;
    metric.label = std::move(labels);
    metric.gauge.value = value;
    return metric;
}

prometheus::ClientMetric counter(double value,
                                 std::vector<prometheus::ClientMetric::Label> labels) {
    prometheus::ClientMetric metric;
    metric.label = std::move(labels);
    metric.counter.value = value;
    return metric;
}

double toSeconds(core::TimePoint time) {
    return std::chrono::duration<double>(time.time_since_epoch()).count();
}

}  // namespace

SnapshotCollector::SnapshotCollector(std::shared_ptr<const core::SnapshotStore> store)
    : store_(std::move(store))
{}

std::vector<prometheus::MetricFamily> SnapshotCollector::Collect() const {
    auto snapshot = store_->getSnapshot();
    LOG_TRACE("Exporter", "Scrape of generation {} ({} device(s))",
              snapshot->generation, snapshot->entries.size());
    return collectSnapshot(*snapshot);
}

std::vector<prometheus::MetricFamily> SnapshotCollector::collectSnapshot(
    const core::Snapshot& snapshot)
{
    using prometheus::MetricType;

    auto current = family("device_electric_current_amperes",
                          "Electric current drawn through the plug", MetricType::Gauge);
    auto voltage = family("device_electric_potential_volts",
                          "Mains voltage at the plug", MetricType::Gauge);
    auto power = family("device_electric_power_watts",
                        "Active power drawn through the plug", MetricType::Gauge);
    auto energy = family("device_electric_energy_joules_total",
                         "Energy drawn through the plug since the meter was reset",
                         MetricType::Counter);

    for (const auto& entry : snapshot.entries) {
        const core::SnapshotEntry& device = entry.second;
        auto labels = deviceLabels(device.alias, device.device_id);

        current.metric.push_back(gauge(device.reading.current_amperes, labels));
        voltage.metric.push_back(gauge(device.reading.voltage_volts, labels));
        power.metric.push_back(gauge(device.reading.power_watts, labels));
        energy.metric.push_back(counter(device.reading.energy_joules_total, labels));
    }

    auto up = family("device_up",
                     "1 if the device's latest reading is being exported", MetricType::Gauge);
    for (const auto& status : snapshot.devices) {
        up.metric.push_back(gauge(status.in_snapshot ? 1.0 : 0.0,
                                  deviceLabels(status.alias, status.device_id)));
    }

    auto known = family("kasad_known_devices", "Devices in the known-device set",
                        MetricType::Gauge);
    known.metric.push_back(gauge(static_cast<double>(snapshot.devices.size())));

    auto duration = family("kasad_poll_cycle_duration_seconds",
                           "Duration of the latest poll cycle", MetricType::Gauge);
    duration.metric.push_back(gauge(
        std::chrono::duration<double>(snapshot.cycle_duration).count()));

    auto lastPoll = family("kasad_last_poll_timestamp_seconds",
                           "Time the latest poll cycle was published (0 before the first)",
                           MetricType::Gauge);
    lastPoll.metric.push_back(gauge(snapshot.generation == 0 ? 0.0
                                                             : toSeconds(snapshot.published_at)));

    return {current, voltage, power, energy, up, known, duration, lastPoll};
}

}  // namespace exporter
}  // namespace kasad
