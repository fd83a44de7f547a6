#pragma once

#include "core/ObserverList.h"
#include "core/TaskGroup.h"
#include "hal/Board.h"

#include <map>
#include <string>
#include <vector>

namespace labflow {

struct DeviceConfig {
    std::map<std::string, int> pins;  // role -> board pin
    Value settings = Value::object();
};

/// Semantic wrapper around one or more pins of a board.
///
/// Actions are addressed by name so nodes can drive any device generically.
/// A device does not own its board; the HardwareManager guarantees the board
/// outlives every device attached to it. Completions arriving after the
/// device is destroyed are dropped.
class Device {
public:
    using ChangeCallback = std::function<void(const Value&)>;

    Device(std::string id, std::string name, Board& board, DeviceConfig config);
    virtual ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    virtual std::string getType() const = 0;
    virtual std::vector<std::string> requiredPins() const = 0;
    virtual OperationKind pinKind(const std::string& role) const = 0;
    virtual std::vector<std::string> actions() const = 0;

    bool hasAction(const std::string& name) const;

    const std::string& getId() const { return id_; }
    const std::string& getName() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }
    Board& getBoard() const { return board_; }
    const std::map<std::string, int>& getPins() const { return config_.pins; }
    const Value& getSettings() const { return config_.settings; }

    // -1 when the role is not assigned
    int pin(const std::string& role) const;

    bool isEnabled() const { return enabled_; }
    void setEnabled(bool enabled) { enabled_ = enabled; }
    bool isInitialized() const { return initialized_; }

    // Every required role is assigned and each pin supports its kind.
    bool validateConfig(std::string& error) const;

    // Configures pin modes and drives outputs to their idle state.
    void initialize(IoCallback done);
    // Drives the device to a safe state. Succeeds trivially when never initialized.
    void shutdown(IoCallback done);

    // Fails when the device is disabled, not initialized or the action is unknown.
    void executeAction(const std::string& name, const Value& argument, IoCallback done);

    uint32_t addChangeObserver(ChangeCallback callback);
    bool removeChangeObserver(uint32_t id);

    virtual nlohmann::json toJson() const;

protected:
    virtual void doInitialize(IoCallback done) = 0;
    virtual void doShutdown(IoCallback done);
    virtual void doAction(const std::string& name, const Value& argument, IoCallback done) = 0;

    using Step = std::function<void(IoCallback)>;

    // Runs steps in order, stopping at the first failure. done receives the
    // result of the last step run.
    void runSteps(std::vector<Step> steps, IoCallback done);

    // Drops the completion once the device is gone or shut down.
    IoCallback guard(IoCallback callback);

    void notifyChange(const Value& value) { changeObservers_.notify(value); }

    Board& board_;
    DeviceConfig config_;
    TaskGroup tasks_;

private:
    std::string id_;
    std::string name_;
    bool enabled_ = true;
    bool initialized_ = false;
    ObserverList<const Value&> changeObservers_;
};

} // namespace labflow
