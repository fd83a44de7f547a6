#pragma once

#include "hal/Device.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace labflow {

/// Device type name -> factory. One registry per HardwareManager.
class DeviceRegistry {
public:
    using Factory = std::function<std::unique_ptr<Device>(
        const std::string& id, const std::string& name, Board& board, DeviceConfig config)>;

    // Replaces an existing registration of the same type.
    void registerType(const std::string& type, Factory factory);
    bool hasType(const std::string& type) const;
    std::vector<std::string> typeNames() const;

    // Returns nullptr for an unknown type.
    std::unique_ptr<Device> create(const std::string& type, const std::string& id,
                                   const std::string& name, Board& board,
                                   DeviceConfig config) const;

private:
    std::map<std::string, Factory> factories_;
};

void registerBuiltinDevices(DeviceRegistry& registry);

} // namespace labflow
