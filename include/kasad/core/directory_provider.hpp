/**
 * @file directory_provider.hpp
 * @brief Sources of device addresses other than broadcast discovery.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/core/export.hpp"
#include "kasad/core/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace kasad {
namespace core {

/**
 * @class DirectoryProvider
 * @brief A list of devices known by some other means (account, inventory).
 *
 * Called once per sourcing pass from the sourcing thread.
 */
class KASAD_CORE_API DirectoryProvider {
public:
    virtual ~DirectoryProvider() = default;

    virtual std::string name() const = 0;

    /**
     * @throws DirectoryError if the directory cannot be read this pass.
     */
    virtual std::vector<DeviceCandidate> listDevices() = 0;
};

/**
 * @class StaticDirectoryProvider
 * @brief A fixed list, typically from --device flags.
 */
class KASAD_CORE_API StaticDirectoryProvider : public DirectoryProvider {
public:
    explicit StaticDirectoryProvider(std::vector<DeviceCandidate> devices)
        : devices_(std::move(devices))
    {}

    std::string name() const override { return "static"; }

    std::vector<DeviceCandidate> listDevices() override { return devices_; }

private:
    std::vector<DeviceCandidate> devices_;
};

/**
 * @brief Parse "<id>,<alias>,<host>[:<port>]".
 * @param defaultPort Port used when the spec carries none.
 * @throws std::invalid_argument on a malformed spec.
 */
KASAD_CORE_API DeviceCandidate parseDeviceSpec(const std::string& spec, uint16_t defaultPort);

}  // namespace core
}  // namespace kasad
