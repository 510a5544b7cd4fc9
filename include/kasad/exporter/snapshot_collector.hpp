/**
 * @file snapshot_collector.hpp
 * @brief Prometheus collectable over the latest poll snapshot.
 *
 * Every scrape reads the snapshot store once and turns that snapshot into
 * metric families. Scraping never triggers a poll.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/snapshot_store.hpp"
#include "kasad/exporter/export.hpp"

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>

#include <memory>
#include <vector>

namespace kasad {
namespace exporter {

/**
 * @class SnapshotCollector
 * @brief Emits device telemetry and exporter health families.
 *
 * Usage:
 * Registered on an Exposer through MetricsEndpoint, which keeps it alive.
 */
class KASAD_EXPORTER_API SnapshotCollector : public prometheus::Collectable {
public:
    explicit SnapshotCollector(std::shared_ptr<const core::SnapshotStore> store);

    std::vector<prometheus::MetricFamily> Collect() const override;

    /**
     * @brief Families for one snapshot.
     */
    static std::vector<prometheus::MetricFamily> collectSnapshot(const core::Snapshot& snapshot);

private:
    std::shared_ptr<const core::SnapshotStore> store_;
};

}  // namespace exporter
}  // namespace kasad
