#include "hal/HardwareManager.h"
#include "core/Logger.h"
#include "hal/GpioBoard.h"
#include "hal/MockBoard.h"
#include "hal/SerialFirmwareBoard.h"

#include <algorithm>

namespace labflow {

HardwareManager::HardwareManager(Scheduler& scheduler, Config config)
    : scheduler_(scheduler)
    , config_(std::move(config))
{
    registerBuiltinDrivers();
    registerBuiltinDevices(deviceRegistry_);
}

HardwareManager::~HardwareManager()
{
    clear();
}

// ═══════════════════════════════════════════════════════════════════
// Drivers
// ═══════════════════════════════════════════════════════════════════

void HardwareManager::registerBuiltinDrivers()
{
    Scheduler* scheduler = &scheduler_;
    const Config* config = &config_;

    registerDriver("mock", [scheduler](const std::string& id, const std::string& port,
                                       const nlohmann::json&) {
        return std::make_unique<MockBoard>(id, port, *scheduler);
    });

    BoardFactory serial = [scheduler, config](const std::string& id, const std::string& port,
                                              const nlohmann::json& settings) {
        SerialFirmwareBoard::Variant variant = SerialFirmwareBoard::Variant::uno;
        std::string name = stateString(settings, "board_type", "uno");
        if (!SerialFirmwareBoard::parseVariant(name, variant))
            LF_WARN("Unknown Arduino board type '%s', using uno", name.c_str());
        int baud = stateInt(settings, "baud", config->hardware.serialBaud);
        return std::make_unique<SerialFirmwareBoard>(
            id, port, *scheduler, variant, baud, config->timing.boardReadyTimeout);
    };
    registerDriver("arduino", serial);
    registerDriver("telemetrix", serial);

    BoardFactory gpio = [scheduler](const std::string& id, const std::string& port,
                                    const nlohmann::json&) {
        return std::make_unique<GpioBoard>(id, port, *scheduler);
    };
    registerDriver("raspberry_pi", gpio);
    registerDriver("pigpio", gpio);
}

void HardwareManager::registerDriver(const std::string& type, BoardFactory factory)
{
    drivers_[type] = std::move(factory);
}

bool HardwareManager::hasDriver(const std::string& type) const
{
    return drivers_.count(type) > 0;
}

std::vector<std::string> HardwareManager::driverNames() const
{
    std::vector<std::string> names;
    for (const auto& entry : drivers_)
        names.push_back(entry.first);
    return names;
}

// ═══════════════════════════════════════════════════════════════════
// Boards
// ═══════════════════════════════════════════════════════════════════

bool HardwareManager::addBoard(const std::string& id, const std::string& type,
                               const std::string& port, std::string& error,
                               const nlohmann::json& settings)
{
    // 1. Unique id
    if (id.empty() || boards_.count(id))
    {
        error = id.empty() ? "Board id must not be empty" : "Board already exists: " + id;
        LF_WARN("HardwareManager::addBoard: %s", error.c_str());
        return false;
    }

    // 2. Known driver
    std::string driverType = forceMock_ ? "mock" : type;
    auto it = drivers_.find(driverType);
    if (it == drivers_.end())
    {
        error = "Unknown driver type: " + type;
        LF_WARN("HardwareManager::addBoard: %s", error.c_str());
        return false;
    }

    std::unique_ptr<Board> board = it->second(id, port, settings);
    if (!board)
    {
        error = "Driver '" + driverType + "' could not create board " + id;
        LF_WARN("HardwareManager::addBoard: %s", error.c_str());
        return false;
    }

    board->setReconnectInterval(config_.timing.reconnectInterval);
    board->setAutoReconnect(stateBool(settings, "auto_reconnect", false));

    BoardEntry entry;
    entry.stateSubscription = board->addStateObserver([this, id](BoardState state) {
        connectionObservers_.notify(id, state);
    });
    entry.errorSubscription = board->addErrorObserver([this, id](const std::string& message) {
        errorObservers_.notify(id, message);
    });
    entry.pins = std::make_unique<PinManager>(board->getCapabilities());
    entry.board = std::move(board);

    boards_[id] = std::move(entry);
    boardOrder_.push_back(id);
    LF_INFO("Added board %s (type %s, port '%s')", id.c_str(), driverType.c_str(), port.c_str());
    return true;
}

void HardwareManager::connectBoard(const std::string& id, Board::ConnectCallback done)
{
    Board* board = getBoard(id);
    if (!board)
    {
        std::string error = "Board not found: " + id;
        LF_WARN("HardwareManager::connectBoard: %s", error.c_str());
        if (done)
            done(false, error);
        return;
    }
    board->connect(std::move(done));
}

void HardwareManager::disconnectBoard(const std::string& id)
{
    Board* board = getBoard(id);
    if (!board)
        return;

    for (Device* device : devicesOnBoard(id))
    {
        std::string deviceId = device->getId();
        device->shutdown([deviceId](const IoResult& result) {
            if (!result.ok)
                LF_WARN("Error shutting down device %s: %s", deviceId.c_str(), result.error.c_str());
        });
    }
    board->disconnect();
}

bool HardwareManager::removeBoard(const std::string& id)
{
    auto it = boards_.find(id);
    if (it == boards_.end())
        return false;

    for (Device* device : devicesOnBoard(id))
        destroyDevice(device->getId());

    Board& board = *it->second.board;
    board.removeStateObserver(it->second.stateSubscription);
    board.removeErrorObserver(it->second.errorSubscription);
    board.disconnect();

    boards_.erase(it);
    boardOrder_.erase(std::remove(boardOrder_.begin(), boardOrder_.end(), id), boardOrder_.end());
    LF_INFO("Removed board %s", id.c_str());
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Devices
// ═══════════════════════════════════════════════════════════════════

std::string HardwareManager::defaultRole(const std::string& deviceType)
{
    if (deviceType == "DigitalOutput" || deviceType == "PWMOutput")
        return "output";
    if (deviceType == "DigitalInput" || deviceType == "AnalogInput")
        return "input";
    if (deviceType == "Servo")
        return "signal";
    return "pin";
}

void HardwareManager::applyDeviceDefaults(const std::string& type, nlohmann::json& settings) const
{
    if (type == "AnalogInput" && !settings.contains("reference_voltage"))
        settings["reference_voltage"] = config_.hardware.adcReferenceVoltage;
    else if (type == "Servo")
    {
        if (!settings.contains("min_angle"))
            settings["min_angle"] = config_.hardware.servoMinAngle;
        if (!settings.contains("max_angle"))
            settings["max_angle"] = config_.hardware.servoMaxAngle;
    }
    else if (type == "MotorGovernor" && !settings.contains("pulse_duration"))
        settings["pulse_duration"] = config_.timing.pulseDuration;
}

bool HardwareManager::addDevice(const std::string& id, const std::string& type,
                                const std::string& boardId, int pin, const std::string& name,
                                std::string& error, const nlohmann::json& settings)
{
    DeviceConfig config;
    config.pins[defaultRole(type)] = pin;
    config.settings = settings.is_object() ? settings : nlohmann::json::object();
    return addDevice(id, type, boardId, std::move(config), name, error);
}

bool HardwareManager::addDevice(const std::string& id, const std::string& type,
                                const std::string& boardId, DeviceConfig config,
                                const std::string& name, std::string& error)
{
    auto fail = [&error](std::string message) {
        error = std::move(message);
        LF_WARN("HardwareManager::addDevice: %s", error.c_str());
        return false;
    };

    // 1. Unique id
    if (id.empty())
        return fail("Device id must not be empty");
    if (devices_.count(id))
        return fail("Device already exists: " + id);

    // 2. Board exists
    auto boardIt = boards_.find(boardId);
    if (boardIt == boards_.end())
        return fail("Board not found: " + boardId);
    Board& board = *boardIt->second.board;
    PinManager& pins = *boardIt->second.pins;

    // 3. Known type
    if (!config.settings.is_object())
        config.settings = nlohmann::json::object();
    applyDeviceDefaults(type, config.settings);
    std::string displayName = name.empty() ? id : name;
    std::unique_ptr<Device> device = deviceRegistry_.create(type, id, displayName, board, std::move(config));
    if (!device)
        return fail("Unknown device type: " + type);

    // 4. Roles present and pin kinds supported
    std::string configError;
    if (!device->validateConfig(configError))
        return fail("Device configuration error for " + id + ": " + configError);

    // 5. Pins free (all-or-nothing)
    try
    {
        pins.allocateDevicePins(id, displayName, device->getPins());
    }
    catch (const PinConflictError& e)
    {
        return fail(e.what());
    }
    catch (const InvalidPinError& e)
    {
        return fail(e.what());
    }

    devices_[id] = std::move(device);
    deviceOrder_.push_back(id);
    LF_INFO("Added device %s (type %s on %s)", id.c_str(), type.c_str(), boardId.c_str());
    return true;
}

void HardwareManager::destroyDevice(const std::string& id)
{
    auto it = devices_.find(id);
    if (it == devices_.end())
        return;

    auto boardIt = boards_.find(it->second->getBoard().getId());
    if (boardIt != boards_.end())
        boardIt->second.pins->releaseAllForDevice(id);

    deviceRemovedObservers_.notify(id);
    devices_.erase(it);
    deviceOrder_.erase(std::remove(deviceOrder_.begin(), deviceOrder_.end(), id), deviceOrder_.end());
}

bool HardwareManager::removeDevice(const std::string& id)
{
    Device* device = getDevice(id);
    if (!device)
        return false;

    device->shutdown([id](const IoResult& result) {
        if (!result.ok)
            LF_WARN("Error shutting down device %s: %s", id.c_str(), result.error.c_str());
    });
    destroyDevice(id);
    LF_INFO("Removed device %s", id.c_str());
    return true;
}

void HardwareManager::initializeDevice(const std::string& id, IoCallback done)
{
    Device* device = getDevice(id);
    if (!device)
    {
        if (done)
            done(IoResult::failure("Device not found: " + id));
        return;
    }
    if (!device->getBoard().isConnected())
    {
        if (done)
            done(IoResult::failure("Board not connected: " + device->getBoard().getId()));
        return;
    }
    device->initialize(std::move(done));
}

void HardwareManager::shutdownDevice(const std::string& id, IoCallback done)
{
    Device* device = getDevice(id);
    if (!device)
    {
        if (done)
            done(IoResult::failure("Device not found: " + id));
        return;
    }
    device->shutdown(std::move(done));
}

// ═══════════════════════════════════════════════════════════════════
// Bulk operations
// ═══════════════════════════════════════════════════════════════════

void HardwareManager::connectAll(ResultsCallback done)
{
    struct Pending {
        std::map<std::string, bool> results;
        size_t remaining = 0;
        ResultsCallback done;
    };
    auto pending = std::make_shared<Pending>();
    pending->remaining = boardOrder_.size();
    pending->done = std::move(done);

    if (pending->remaining == 0)
    {
        if (pending->done)
            pending->done(pending->results);
        return;
    }

    std::vector<std::string> ids = boardOrder_;
    for (const auto& id : ids)
    {
        connectBoard(id, [pending, id](bool ok, const std::string& error) {
            if (!ok)
                LF_WARN("Failed to connect board %s: %s", id.c_str(), error.c_str());
            pending->results[id] = ok;
            if (--pending->remaining == 0 && pending->done)
                pending->done(pending->results);
        });
    }
}

void HardwareManager::initializeAllDevices(ResultsCallback done)
{
    struct Pending {
        std::map<std::string, bool> results;
        size_t remaining = 0;
        ResultsCallback done;
    };
    auto pending = std::make_shared<Pending>();
    pending->remaining = deviceOrder_.size();
    pending->done = std::move(done);

    if (pending->remaining == 0)
    {
        if (pending->done)
            pending->done(pending->results);
        return;
    }

    std::vector<std::string> ids = deviceOrder_;
    for (const auto& id : ids)
    {
        initializeDevice(id, [pending, id](const IoResult& result) {
            if (!result.ok)
                LF_WARN("Failed to initialize device %s: %s", id.c_str(), result.error.c_str());
            pending->results[id] = result.ok;
            if (--pending->remaining == 0 && pending->done)
                pending->done(pending->results);
        });
    }
}

void HardwareManager::disconnectAll()
{
    for (const auto& id : std::vector<std::string>(boardOrder_))
        disconnectBoard(id);
}

void HardwareManager::emergencyStop() noexcept
{
    LF_WARN("EMERGENCY STOP triggered");

    for (const auto& entry : devices_)
    {
        const std::string& id = entry.first;
        try
        {
            entry.second->shutdown([id](const IoResult& result) {
                if (!result.ok)
                    LF_WARN("Emergency shutdown error for device %s: %s", id.c_str(), result.error.c_str());
            });
        }
        catch (const std::exception& e)
        {
            LF_WARN("Emergency shutdown error for device %s: %s", id.c_str(), e.what());
        }
    }

    for (const auto& entry : boards_)
        entry.second.board->emergencyStop();
}

void HardwareManager::shutdown()
{
    LF_INFO("Shutting down hardware manager");
    emergencyStop();
    disconnectAll();
    clear();
}

void HardwareManager::clear()
{
    for (const auto& id : deviceOrder_)
        deviceRemovedObservers_.notify(id);
    devices_.clear();
    deviceOrder_.clear();
    for (auto& entry : boards_)
    {
        entry.second.board->removeStateObserver(entry.second.stateSubscription);
        entry.second.board->removeErrorObserver(entry.second.errorSubscription);
        entry.second.board->disconnect();
    }
    boards_.clear();
    boardOrder_.clear();
}

// ═══════════════════════════════════════════════════════════════════
// Lookup
// ═══════════════════════════════════════════════════════════════════

Board* HardwareManager::getBoard(const std::string& id) const
{
    auto it = boards_.find(id);
    return it == boards_.end() ? nullptr : it->second.board.get();
}

Device* HardwareManager::getDevice(const std::string& id) const
{
    auto it = devices_.find(id);
    return it == devices_.end() ? nullptr : it->second.get();
}

PinManager* HardwareManager::getPinManager(const std::string& boardId) const
{
    auto it = boards_.find(boardId);
    return it == boards_.end() ? nullptr : it->second.pins.get();
}

std::vector<std::string> HardwareManager::boardIds() const
{
    return boardOrder_;
}

std::vector<std::string> HardwareManager::deviceIds() const
{
    return deviceOrder_;
}

std::vector<Device*> HardwareManager::devicesOnBoard(const std::string& boardId) const
{
    std::vector<Device*> result;
    for (const auto& id : deviceOrder_)
    {
        Device* device = getDevice(id);
        if (device && device->getBoard().getId() == boardId)
            result.push_back(device);
    }
    return result;
}

uint32_t HardwareManager::addConnectionObserver(ConnectionCallback callback)
{
    return connectionObservers_.add(std::move(callback));
}

bool HardwareManager::removeConnectionObserver(uint32_t id)
{
    return connectionObservers_.remove(id);
}

uint32_t HardwareManager::addErrorObserver(ErrorCallback callback)
{
    return errorObservers_.add(std::move(callback));
}

bool HardwareManager::removeErrorObserver(uint32_t id)
{
    return errorObservers_.remove(id);
}

uint32_t HardwareManager::addDeviceRemovedObserver(DeviceRemovedCallback callback)
{
    return deviceRemovedObservers_.add(std::move(callback));
}

bool HardwareManager::removeDeviceRemovedObserver(uint32_t id)
{
    return deviceRemovedObservers_.remove(id);
}

// ═══════════════════════════════════════════════════════════════════
// Layout
// ═══════════════════════════════════════════════════════════════════

nlohmann::json HardwareManager::toJson() const
{
    nlohmann::json boards = nlohmann::json::array();
    for (const auto& id : boardOrder_)
        boards.push_back(getBoard(id)->toJson());

    nlohmann::json devices = nlohmann::json::array();
    for (const auto& id : deviceOrder_)
        devices.push_back(getDevice(id)->toJson());

    return {{"boards", boards}, {"devices", devices}};
}

bool HardwareManager::loadJson(const nlohmann::json& json, std::string& error)
{
    try
    {
        return loadEntries(json, error);
    }
    catch (const nlohmann::json::exception& e)
    {
        error = std::string("malformed hardware section: ") + e.what();
        LF_WARN("HardwareManager::loadJson: %s", error.c_str());
        return false;
    }
}

bool HardwareManager::loadEntries(const nlohmann::json& json, std::string& error)
{
    if (json.is_null())
        return true;
    if (!json.is_object())
    {
        error = "hardware section must be an object";
        return false;
    }

    for (const auto& board : json.value("boards", nlohmann::json::array()))
    {
        if (!board.is_object() || !board.contains("id") || !board.contains("type"))
        {
            error = "board entry needs 'id' and 'type'";
            return false;
        }
        std::string port = board.contains("port") && board["port"].is_string()
                               ? board["port"].get<std::string>() : std::string();
        nlohmann::json settings = board.value("settings", nlohmann::json::object());
        if (!addBoard(board["id"].get<std::string>(), board["type"].get<std::string>(),
                      port, error, settings))
            return false;
    }

    for (const auto& device : json.value("devices", nlohmann::json::array()))
    {
        if (!device.is_object() || !device.contains("id") || !device.contains("type") ||
            !device.contains("board_id"))
        {
            error = "device entry needs 'id', 'type' and 'board_id'";
            return false;
        }

        std::string id = device["id"].get<std::string>();
        std::string type = device["type"].get<std::string>();
        DeviceConfig config;
        config.settings = device.value("settings", nlohmann::json::object());

        if (device.contains("pins") && device["pins"].is_object() && !device["pins"].empty())
        {
            for (auto it = device["pins"].begin(); it != device["pins"].end(); ++it)
                config.pins[it.key()] = it.value().get<int>();
        }
        else if (device.contains("pin") && device["pin"].is_number_integer())
        {
            config.pins[defaultRole(type)] = device["pin"].get<int>();
        }

        std::string name = device.contains("name") && device["name"].is_string()
                               ? device["name"].get<std::string>() : std::string();
        if (!addDevice(id, type, device["board_id"].get<std::string>(), std::move(config), name, error))
            return false;
        if (device.contains("enabled") && device["enabled"].is_boolean())
            getDevice(id)->setEnabled(device["enabled"].get<bool>());
    }
    return true;
}

} // namespace labflow
