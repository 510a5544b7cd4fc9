/**
 * @file metrics_endpoint.hpp
 * @brief HTTP /metrics endpoint serving the snapshot collector.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/snapshot_store.hpp"
#include "kasad/exporter/export.hpp"
#include "kasad/exporter/snapshot_collector.hpp"

#include <memory>
#include <string>
#include <vector>

namespace prometheus {
class Exposer;
}

namespace kasad {
namespace exporter {

/**
 * @class MetricsEndpoint
 * @brief Owns the Exposer and the collector registered on it.
 *
 * The Exposer keeps only a weak reference to registered collectables, so the
 * collector lives here for as long as the endpoint does.
 *
 * @code
 * MetricsEndpoint endpoint(config.web_listen_address, orchestrator->store());
 * @endcode
 */
class KASAD_EXPORTER_API MetricsEndpoint {
public:
    /**
     * @param bindAddress "host:port"; port 0 picks a free port.
     * @throws std::exception from prometheus-cpp if the address cannot be bound.
     */
    MetricsEndpoint(const std::string& bindAddress,
                    std::shared_ptr<const core::SnapshotStore> store);
    ~MetricsEndpoint();

    MetricsEndpoint(const MetricsEndpoint&) = delete;
    MetricsEndpoint& operator=(const MetricsEndpoint&) = delete;

    std::vector<int> listeningPorts() const;

    std::shared_ptr<const SnapshotCollector> collector() const { return collector_; }

private:
    // Declared first so the Exposer stops serving before the collector goes
    std::shared_ptr<SnapshotCollector> collector_;
    std::unique_ptr<prometheus::Exposer> exposer_;
};

}  // namespace exporter
}  // namespace kasad
