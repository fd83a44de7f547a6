#pragma once

#include "core/Config.h"
#include "core/ObserverList.h"
#include "core/Scheduler.h"
#include "hal/Board.h"
#include "hal/Device.h"
#include "hal/DeviceRegistry.h"
#include "hal/PinManager.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace labflow {

/// Owns every board and device of an experiment.
///
/// Each board gets its own PinManager, so a device can only be added when all
/// of its pins are free and support the operation the device needs. Devices
/// are always destroyed before the board they sit on.
///
/// All members are called on the scheduler thread.
class HardwareManager {
public:
    using BoardFactory = std::function<std::unique_ptr<Board>(
        const std::string& id, const std::string& port, const nlohmann::json& settings)>;
    using ConnectionCallback = std::function<void(const std::string& boardId, BoardState state)>;
    using ErrorCallback = std::function<void(const std::string& source, const std::string& message)>;
    using DeviceRemovedCallback = std::function<void(const std::string& deviceId)>;
    using ResultsCallback = std::function<void(const std::map<std::string, bool>& results)>;

    explicit HardwareManager(Scheduler& scheduler, Config config = Config());
    ~HardwareManager();

    HardwareManager(const HardwareManager&) = delete;
    HardwareManager& operator=(const HardwareManager&) = delete;

    Scheduler& getScheduler() const { return scheduler_; }
    const Config& getConfig() const { return config_; }

    // --- Drivers ---
    void registerDriver(const std::string& type, BoardFactory factory);
    bool hasDriver(const std::string& type) const;
    std::vector<std::string> driverNames() const;
    DeviceRegistry& getDeviceRegistry() { return deviceRegistry_; }

    // Every board added afterwards is created as a MockBoard, whatever its type.
    void setForceMockBoards(bool force) { forceMock_ = force; }

    // --- Boards ---
    bool addBoard(const std::string& id, const std::string& type, const std::string& port,
                  std::string& error, const nlohmann::json& settings = nlohmann::json::object());
    // done runs once the board has connected or failed to.
    void connectBoard(const std::string& id, Board::ConnectCallback done);
    // Shuts the board's devices down first. Unknown ids are ignored.
    void disconnectBoard(const std::string& id);
    // Removes the board's devices as well.
    bool removeBoard(const std::string& id);

    // --- Devices ---

    // Single-pin device. The role is derived from the type (see defaultRole).
    bool addDevice(const std::string& id, const std::string& type, const std::string& boardId,
                   int pin, const std::string& name, std::string& error,
                   const nlohmann::json& settings = nlohmann::json::object());
    bool addDevice(const std::string& id, const std::string& type, const std::string& boardId,
                   DeviceConfig config, const std::string& name, std::string& error);
    bool removeDevice(const std::string& id);

    void initializeDevice(const std::string& id, IoCallback done);
    void shutdownDevice(const std::string& id, IoCallback done);

    static std::string defaultRole(const std::string& deviceType);

    // --- Bulk operations ---
    void connectAll(ResultsCallback done);
    void initializeAllDevices(ResultsCallback done);
    void disconnectAll();

    // Devices to their safe state, then every board's emergency stop.
    void emergencyStop() noexcept;

    // Emergency stop, disconnect, then forget everything.
    void shutdown();
    void clear();

    // --- Lookup ---
    Board* getBoard(const std::string& id) const;
    Device* getDevice(const std::string& id) const;
    PinManager* getPinManager(const std::string& boardId) const;
    std::vector<std::string> boardIds() const;
    std::vector<std::string> deviceIds() const;

    // --- Observers ---
    uint32_t addConnectionObserver(ConnectionCallback callback);
    bool removeConnectionObserver(uint32_t id);
    uint32_t addErrorObserver(ErrorCallback callback);
    bool removeErrorObserver(uint32_t id);
    // Called just before a device is destroyed.
    uint32_t addDeviceRemovedObserver(DeviceRemovedCallback callback);
    bool removeDeviceRemovedObserver(uint32_t id);

    // --- Layout "hardware" section ---
    nlohmann::json toJson() const;
    // Adds the boards and devices described by json. Stops at the first
    // invalid entry; entries added before it are kept.
    bool loadJson(const nlohmann::json& json, std::string& error);

private:
    struct BoardEntry {
        std::unique_ptr<Board> board;
        std::unique_ptr<PinManager> pins;
        uint32_t stateSubscription = 0;
        uint32_t errorSubscription = 0;
    };

    void registerBuiltinDrivers();
    std::vector<Device*> devicesOnBoard(const std::string& boardId) const;
    void destroyDevice(const std::string& id);
    bool loadEntries(const nlohmann::json& json, std::string& error);
    void applyDeviceDefaults(const std::string& type, nlohmann::json& settings) const;

    Scheduler& scheduler_;
    Config config_;
    bool forceMock_ = false;

    std::map<std::string, BoardFactory> drivers_;
    DeviceRegistry deviceRegistry_;

    std::map<std::string, BoardEntry> boards_;
    std::map<std::string, std::unique_ptr<Device>> devices_;
    std::vector<std::string> boardOrder_;
    std::vector<std::string> deviceOrder_;

    ObserverList<const std::string&, BoardState> connectionObservers_;
    ObserverList<const std::string&, const std::string&> errorObservers_;
    ObserverList<const std::string&> deviceRemovedObservers_;
};

} // namespace labflow
