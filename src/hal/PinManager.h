#pragma once

#include "hal/HalTypes.h"

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace labflow {

struct PinAllocation {
    int pin;
    std::string deviceId;
    std::string deviceName;
    std::string role;
};

class PinConflictError : public std::runtime_error {
public:
    PinConflictError(int pin, const std::string& existingDevice, const std::string& newDevice);

    int pin() const { return pin_; }
    const std::string& existingDevice() const { return existingDevice_; }
    const std::string& newDevice() const { return newDevice_; }

private:
    int pin_;
    std::string existingDevice_;
    std::string newDevice_;
};

class InvalidPinError : public std::runtime_error {
public:
    InvalidPinError(int pin, OperationKind requested, std::set<OperationKind> supported);

    int pin() const { return pin_; }
    OperationKind requested() const { return requested_; }
    const std::set<OperationKind>& supported() const { return supported_; }

private:
    int pin_;
    OperationKind requested_;
    std::set<OperationKind> supported_;
};

/// Exclusive ownership of a board's physical pins by devices.
class PinManager {
public:
    explicit PinManager(BoardCapabilities capabilities);

    const BoardCapabilities& getCapabilities() const { return capabilities_; }

    // Throws PinConflictError if the pin already has an owner.
    const PinAllocation& allocate(int pin, const std::string& deviceId,
                                  const std::string& deviceName, const std::string& role);

    // All-or-nothing: every pin is checked before any is claimed.
    std::vector<PinAllocation> allocateDevicePins(const std::string& deviceId,
                                                  const std::string& deviceName,
                                                  const std::map<std::string, int>& pinsByRole);

    bool release(int pin);
    std::vector<PinAllocation> releaseAllForDevice(const std::string& deviceId);
    void clear();

    // Throws InvalidPinError when the pin is unknown or lacks the kind.
    void validatePinType(int pin, OperationKind kind) const;

    std::vector<int> compatiblePins(OperationKind kind) const;
    std::vector<int> availableCompatiblePins(OperationKind kind) const;

    const PinAllocation* getAllocation(int pin) const;
    bool isAvailable(int pin) const;
    std::vector<PinAllocation> getPinsForDevice(const std::string& deviceId) const;
    std::set<int> allocatedPins() const;
    std::set<int> availablePins() const;
    int allocationCount() const { return static_cast<int>(allocations_.size()); }

    std::string summary() const;
    nlohmann::json toJson() const;

private:
    BoardCapabilities capabilities_;
    std::map<int, PinAllocation> allocations_;
};

} // namespace labflow
