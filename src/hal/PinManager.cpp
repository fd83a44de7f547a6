#include "hal/PinManager.h"
#include "core/Logger.h"

namespace labflow {

// ═══════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════

PinConflictError::PinConflictError(int pin, const std::string& existingDevice,
                                   const std::string& newDevice)
    : std::runtime_error("Pin " + std::to_string(pin) + " is already claimed by '" +
                         existingDevice + "', cannot assign to '" + newDevice + "'")
    , pin_(pin)
    , existingDevice_(existingDevice)
    , newDevice_(newDevice)
{
}

InvalidPinError::InvalidPinError(int pin, OperationKind requested, std::set<OperationKind> supported)
    : std::runtime_error("Pin " + std::to_string(pin) + " does not support '" +
                         toString(requested) + "'. Supported types: " + describeKinds(supported))
    , pin_(pin)
    , requested_(requested)
    , supported_(std::move(supported))
{
}

// ═══════════════════════════════════════════════════════════════════
// Allocation
// ═══════════════════════════════════════════════════════════════════

PinManager::PinManager(BoardCapabilities capabilities)
    : capabilities_(std::move(capabilities))
{
}

const PinAllocation& PinManager::allocate(int pin, const std::string& deviceId,
                                          const std::string& deviceName, const std::string& role)
{
    auto it = allocations_.find(pin);
    if (it != allocations_.end())
    {
        LF_WARN("PinManager::allocate: pin %d owned by '%s', rejecting '%s'",
                pin, it->second.deviceName.c_str(), deviceName.c_str());
        throw PinConflictError(pin, it->second.deviceName, deviceName);
    }

    auto inserted = allocations_.emplace(pin, PinAllocation{pin, deviceId, deviceName, role});
    LF_DEBUG("PinManager::allocate: pin %d -> %s (%s)", pin, deviceId.c_str(), role.c_str());
    return inserted.first->second;
}

std::vector<PinAllocation> PinManager::allocateDevicePins(const std::string& deviceId,
                                                          const std::string& deviceName,
                                                          const std::map<std::string, int>& pinsByRole)
{
    std::set<int> requested;
    for (const auto& entry : pinsByRole)
    {
        int pin = entry.second;
        auto it = allocations_.find(pin);
        if (it != allocations_.end())
        {
            LF_WARN("PinManager::allocateDevicePins: pin %d owned by '%s', rejecting '%s'",
                    pin, it->second.deviceName.c_str(), deviceName.c_str());
            throw PinConflictError(pin, it->second.deviceName, deviceName);
        }
        if (!requested.insert(pin).second)
            throw PinConflictError(pin, deviceName, deviceName);
    }

    std::vector<PinAllocation> result;
    for (const auto& entry : pinsByRole)
    {
        PinAllocation allocation{entry.second, deviceId, deviceName, entry.first};
        allocations_[entry.second] = allocation;
        result.push_back(allocation);
    }
    LF_DEBUG("PinManager::allocateDevicePins: %s claimed %d pins",
             deviceId.c_str(), static_cast<int>(result.size()));
    return result;
}

bool PinManager::release(int pin)
{
    return allocations_.erase(pin) > 0;
}

std::vector<PinAllocation> PinManager::releaseAllForDevice(const std::string& deviceId)
{
    std::vector<PinAllocation> released;
    for (auto it = allocations_.begin(); it != allocations_.end();)
    {
        if (it->second.deviceId == deviceId)
        {
            released.push_back(it->second);
            it = allocations_.erase(it);
        }
        else
        {
            ++it;
        }
    }
    LF_DEBUG("PinManager::releaseAllForDevice: %s released %d pins",
             deviceId.c_str(), static_cast<int>(released.size()));
    return released;
}

void PinManager::clear()
{
    allocations_.clear();
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

void PinManager::validatePinType(int pin, OperationKind kind) const
{
    const PinCapability* cap = capabilities_.find(pin);
    if (!cap)
        throw InvalidPinError(pin, kind, {});
    if (!cap->supports(kind))
        throw InvalidPinError(pin, kind, cap->kinds);
}

std::vector<int> PinManager::compatiblePins(OperationKind kind) const
{
    std::vector<int> pins;
    for (const auto& entry : capabilities_.pins)
    {
        if (entry.second.supports(kind))
            pins.push_back(entry.first);
    }
    return pins;  // std::map iteration is already ascending
}

std::vector<int> PinManager::availableCompatiblePins(OperationKind kind) const
{
    std::vector<int> pins;
    for (int pin : compatiblePins(kind))
    {
        if (!allocations_.count(pin))
            pins.push_back(pin);
    }
    return pins;
}

const PinAllocation* PinManager::getAllocation(int pin) const
{
    auto it = allocations_.find(pin);
    return it == allocations_.end() ? nullptr : &it->second;
}

bool PinManager::isAvailable(int pin) const
{
    return allocations_.count(pin) == 0;
}

std::vector<PinAllocation> PinManager::getPinsForDevice(const std::string& deviceId) const
{
    std::vector<PinAllocation> result;
    for (const auto& entry : allocations_)
    {
        if (entry.second.deviceId == deviceId)
            result.push_back(entry.second);
    }
    return result;
}

std::set<int> PinManager::allocatedPins() const
{
    std::set<int> pins;
    for (const auto& entry : allocations_)
        pins.insert(entry.first);
    return pins;
}

std::set<int> PinManager::availablePins() const
{
    std::set<int> pins;
    for (const auto& entry : capabilities_.pins)
    {
        if (!allocations_.count(entry.first))
            pins.insert(entry.first);
    }
    return pins;
}

std::string PinManager::summary() const
{
    if (allocations_.empty())
        return "No pins allocated";
    std::string out = "Pin Allocations:";
    for (const auto& entry : allocations_)
    {
        out += "\n  Pin " + std::to_string(entry.first) + ": " + entry.second.deviceName +
               " (" + entry.second.role + ")";
    }
    return out;
}

nlohmann::json PinManager::toJson() const
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto& entry : allocations_)
    {
        out[std::to_string(entry.first)] = {
            {"device_id", entry.second.deviceId},
            {"device_name", entry.second.deviceName},
            {"pin_role", entry.second.role},
        };
    }
    return out;
}

} // namespace labflow
