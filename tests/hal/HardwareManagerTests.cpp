#include <catch2/catch_test_macros.hpp>

#include "hal/Devices.h"
#include "hal/HardwareManager.h"
#include "hal/MockBoard.h"

#include <string>
#include <vector>

using namespace labflow;

namespace {

struct Rig {
    Scheduler scheduler{ClockMode::manual};
    HardwareManager hardware{scheduler};
    std::string error;

    Rig()
    {
        hardware.addBoard("b1", "mock", "", error);
    }
};

} // namespace

TEST_CASE("addBoard rejects duplicates and unknown drivers")
{
    Rig rig;
    REQUIRE_FALSE(rig.hardware.addBoard("b1", "mock", "", rig.error));
    REQUIRE(rig.error == "Board already exists: b1");

    REQUIRE_FALSE(rig.hardware.addBoard("b2", "teensy", "", rig.error));
    REQUIRE(rig.error == "Unknown driver type: teensy");
    REQUIRE(rig.hardware.boardIds() == std::vector<std::string>{"b1"});
}

TEST_CASE("Builtin drivers are registered")
{
    Rig rig;
    for (const char* type : {"mock", "arduino", "telemetrix", "raspberry_pi", "pigpio"})
        REQUIRE(rig.hardware.hasDriver(type));
}

TEST_CASE("Forced mock boards replace the requested driver")
{
    Scheduler s(ClockMode::manual);
    HardwareManager hardware(s);
    hardware.setForceMockBoards(true);
    std::string error;

    REQUIRE(hardware.addBoard("uno", "arduino", "/dev/ttyACM0", error));
    REQUIRE(hardware.getBoard("uno")->getType() == "mock");
}

TEST_CASE("addDevice claims pins and rejects conflicts")
{
    Rig rig;
    REQUIRE(rig.hardware.addDevice("led", "DigitalOutput", "b1", 13, "LED", rig.error));
    REQUIRE(rig.hardware.getPinManager("b1")->getAllocation(13)->deviceId == "led");

    REQUIRE_FALSE(rig.hardware.addDevice("relay", "DigitalOutput", "b1", 13, "Relay", rig.error));
    REQUIRE(rig.error.find("Pin 13") != std::string::npos);
    REQUIRE(rig.hardware.getDevice("relay") == nullptr);
}

TEST_CASE("addDevice validates the board, type and pins")
{
    Rig rig;
    REQUIRE_FALSE(rig.hardware.addDevice("x", "DigitalOutput", "nope", 1, "", rig.error));
    REQUIRE(rig.error == "Board not found: nope");

    REQUIRE_FALSE(rig.hardware.addDevice("x", "Laser", "b1", 1, "", rig.error));
    REQUIRE(rig.error == "Unknown device type: Laser");

    REQUIRE_FALSE(rig.hardware.addDevice("x", "DigitalOutput", "b1", 80, "", rig.error));
    REQUIRE(rig.error.find("configuration error") != std::string::npos);

    DeviceConfig motor;
    motor.pins = {{"up", 3}, {"down", 4}};
    REQUIRE_FALSE(rig.hardware.addDevice("gov", "MotorGovernor", "b1", motor, "", rig.error));
    REQUIRE(rig.error.find("signal") != std::string::npos);
    REQUIRE(rig.hardware.getPinManager("b1")->allocationCount() == 0);
}

TEST_CASE("removeDevice releases pins and notifies observers")
{
    Rig rig;
    rig.hardware.addDevice("led", "DigitalOutput", "b1", 13, "LED", rig.error);
    std::vector<std::string> removed;
    rig.hardware.addDeviceRemovedObserver([&](const std::string& id) { removed.push_back(id); });

    REQUIRE(rig.hardware.removeDevice("led"));
    REQUIRE_FALSE(rig.hardware.removeDevice("led"));
    REQUIRE(removed == std::vector<std::string>{"led"});
    REQUIRE(rig.hardware.getPinManager("b1")->isAvailable(13));
}

TEST_CASE("removeBoard removes its devices first")
{
    Rig rig;
    rig.hardware.addDevice("led", "DigitalOutput", "b1", 13, "LED", rig.error);
    std::vector<std::string> removed;
    rig.hardware.addDeviceRemovedObserver([&](const std::string& id) { removed.push_back(id); });

    REQUIRE(rig.hardware.removeBoard("b1"));
    REQUIRE(removed == std::vector<std::string>{"led"});
    REQUIRE(rig.hardware.deviceIds().empty());
    REQUIRE(rig.hardware.getBoard("b1") == nullptr);
}

TEST_CASE("connectAll and initializeAllDevices report per-item results")
{
    Rig rig;
    rig.hardware.addBoard("b2", "mock", "", rig.error);
    rig.hardware.addDevice("led", "DigitalOutput", "b1", 13, "LED", rig.error);
    rig.hardware.addDevice("pot", "AnalogInput", "b2", 14, "Pot", rig.error);
    static_cast<MockBoard*>(rig.hardware.getBoard("b2"))->setTransportFailure(true);

    auto connected = rig.hardware.connectAll(nullptr);
    REQUIRE(connected["b1"]);
    REQUIRE_FALSE(connected["b2"]);

    std::map<std::string, bool> initialized;
    bool done = false;
    rig.hardware.initializeAllDevices([&](const std::map<std::string, bool>& results) {
        initialized = results;
        done = true;
    });
    REQUIRE(done);
    REQUIRE(initialized["led"]);
    REQUIRE_FALSE(initialized["pot"]);
    REQUIRE(rig.hardware.getDevice("led")->isInitialized());
}

TEST_CASE("initializeAllDevices with no devices completes immediately")
{
    Scheduler s(ClockMode::manual);
    HardwareManager hardware(s);
    bool done = false;
    hardware.initializeAllDevices([&](const std::map<std::string, bool>& results) {
        done = results.empty();
    });
    REQUIRE(done);
}

TEST_CASE("Analog input devices pick up the configured reference voltage")
{
    Scheduler s(ClockMode::manual);
    Config config;
    config.hardware.adcReferenceVoltage = 3.3;
    HardwareManager hardware(s, config);
    std::string error;
    hardware.addBoard("b1", "mock", "", error);
    REQUIRE(hardware.addDevice("pot", "AnalogInput", "b1", 14, "", error));

    auto* pot = static_cast<AnalogInputDevice*>(hardware.getDevice("pot"));
    REQUIRE(pot->referenceVoltage() == 3.3);
    REQUIRE(pot->getName() == "pot");
}

TEST_CASE("emergencyStop drives outputs low")
{
    Rig rig;
    rig.hardware.addDevice("led", "DigitalOutput", "b1", 13, "LED", rig.error);
    rig.hardware.connectAll(nullptr);
    rig.hardware.initializeAllDevices(nullptr);

    IoResult result;
    rig.hardware.getDevice("led")->executeAction("on", nullptr, [&](const IoResult& r) { result = r; });
    auto* board = static_cast<MockBoard*>(rig.hardware.getBoard("b1"));
    REQUIRE(board->getPinState(13) == 1);

    rig.hardware.emergencyStop();
    REQUIRE(board->getPinState(13) == 0);
}

TEST_CASE("Connection observers see board state changes")
{
    Rig rig;
    std::vector<BoardState> states;
    rig.hardware.addConnectionObserver([&](const std::string& id, BoardState state) {
        if (id == "b1")
            states.push_back(state);
    });

    rig.hardware.connectAll(nullptr);
    rig.hardware.disconnectAll();
    REQUIRE(states == std::vector<BoardState>{BoardState::connecting, BoardState::connected,
                                              BoardState::disconnected});
}

TEST_CASE("Hardware section survives toJson and loadJson")
{
    Rig rig;
    DeviceConfig motor;
    motor.pins = {{"up", 3}, {"down", 4}, {"signal", 15}};
    rig.hardware.addDevice("led", "DigitalOutput", "b1", 13, "LED", rig.error);
    rig.hardware.addDevice("gov", "MotorGovernor", "b1", motor, "Governor", rig.error);
    rig.hardware.getDevice("led")->setEnabled(false);

    nlohmann::json saved = rig.hardware.toJson();

    Scheduler s(ClockMode::manual);
    HardwareManager copy(s);
    std::string error;
    REQUIRE(copy.loadJson(saved, error));
    REQUIRE(copy.boardIds() == std::vector<std::string>{"b1"});
    REQUIRE(copy.deviceIds() == std::vector<std::string>{"led", "gov"});
    REQUIRE(copy.getDevice("gov")->pin("signal") == 15);
    REQUIRE(copy.getDevice("gov")->getName() == "Governor");
    REQUIRE_FALSE(copy.getDevice("led")->isEnabled());
}

TEST_CASE("loadJson stops at the first invalid entry")
{
    Scheduler s(ClockMode::manual);
    HardwareManager hardware(s);
    std::string error;
    nlohmann::json json = {
        {"boards", {{{"id", "b1"}, {"type", "mock"}}}},
        {"devices", {
            {{"id", "led"}, {"type", "DigitalOutput"}, {"board_id", "b1"}, {"pin", 13}},
            {{"id", "bad"}, {"type", "DigitalOutput"}},
        }},
    };

    REQUIRE_FALSE(hardware.loadJson(json, error));
    REQUIRE(error.find("board_id") != std::string::npos);
    REQUIRE(hardware.getDevice("led") != nullptr);

    REQUIRE_FALSE(hardware.loadJson({{"boards", {{{"id", 5}, {"type", "mock"}}}}}, error));
}
