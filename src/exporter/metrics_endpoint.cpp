/**
 * @file metrics_endpoint.cpp
 * @brief MetricsEndpoint implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/exporter/metrics_endpoint.hpp"
#include "kasad/utils/logger.hpp"

#include <prometheus/exposer.h>

namespace kasad {
namespace exporter {

MetricsEndpoint::MetricsEndpoint(const std::string& bindAddress,
                                 std::shared_ptr<const core::SnapshotStore> store)
    : collector_(std::make_shared<SnapshotCollector>(std::move(store)))
    , exposer_(std::make_unique<prometheus::Exposer>(bindAddress))
{
    exposer_->RegisterCollectable(collector_);
    LOG_INFO("Exporter", "Serving /metrics on {}", bindAddress);
}

MetricsEndpoint::~MetricsEndpoint() = default;

std::vector<int> MetricsEndpoint::listeningPorts() const {
    return exposer_->GetListeningPorts();
}

}  // namespace exporter
}  // namespace kasad
