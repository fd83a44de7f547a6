#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "hal/DeviceRegistry.h"
#include "hal/Devices.h"
#include "hal/MockBoard.h"

#include <memory>

using namespace labflow;
using Catch::Matchers::WithinAbs;

namespace {

struct Rig {
    Scheduler scheduler{ClockMode::manual};
    MockBoard board{"mock1", "", scheduler};

    Rig() { board.connect(); }
};

IoCallback capture(IoResult& out)
{
    return [&out](const IoResult& result) { out = result; };
}

DeviceConfig singlePin(const std::string& role, int pin, Value settings = Value::object())
{
    DeviceConfig config;
    config.pins[role] = pin;
    config.settings = std::move(settings);
    return config;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Base contract
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Actions fail before initialize")
{
    Rig rig;
    DigitalOutputDevice led("led", "LED", rig.board, singlePin("output", 13));
    IoResult result;

    led.executeAction("on", nullptr, capture(result));
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.find("not initialized") != std::string::npos);
}

TEST_CASE("validateConfig reports a missing role")
{
    Rig rig;
    DigitalOutputDevice led("led", "LED", rig.board, singlePin("pin", 13));
    std::string error;
    REQUIRE_FALSE(led.validateConfig(error));
    REQUIRE(error == "Missing required pin: output");

    IoResult result;
    led.initialize(capture(result));
    REQUIRE_FALSE(result.ok);
    REQUIRE_FALSE(led.isInitialized());
}

TEST_CASE("Unknown actions and disabled devices are rejected")
{
    Rig rig;
    DigitalOutputDevice led("led", "LED", rig.board, singlePin("output", 13));
    IoResult result;
    led.initialize(capture(result));
    REQUIRE(result.ok);

    led.executeAction("blink", nullptr, capture(result));
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error == "Unknown action: blink");

    led.setEnabled(false);
    led.executeAction("on", nullptr, capture(result));
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.find("disabled") != std::string::npos);
}

TEST_CASE("Shutdown of a never-initialized device succeeds trivially")
{
    Rig rig;
    DigitalOutputDevice led("led", "LED", rig.board, singlePin("output", 13));
    IoResult result = IoResult::failure("unset");
    led.shutdown(capture(result));
    REQUIRE(result.ok);
    REQUIRE(rig.board.writeCount() == 0);
}

TEST_CASE("toJson lists pins and the single-pin shorthand")
{
    Rig rig;
    DigitalOutputDevice led("led", "LED", rig.board, singlePin("output", 13));
    auto json = led.toJson();
    REQUIRE(json["type"] == "DigitalOutput");
    REQUIRE(json["board_id"] == "mock1");
    REQUIRE(json["pins"]["output"] == 13);
    REQUIRE(json["pin"] == 13);
}

// ═══════════════════════════════════════════════════════════════════
// Device types
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("DigitalOutput initializes low and follows on, off, toggle, set")
{
    Rig rig;
    DigitalOutputDevice led("led", "LED", rig.board, singlePin("output", 13));
    IoResult result;
    led.initialize(capture(result));
    REQUIRE(result.ok);
    REQUIRE(rig.board.getPinState(13) == 0);

    led.executeAction("on", nullptr, capture(result));
    REQUIRE(rig.board.getPinState(13) == 1);
    REQUIRE(result.value == true);

    led.executeAction("toggle", nullptr, capture(result));
    REQUIRE(rig.board.getPinState(13) == 0);

    led.executeAction("set", 1, capture(result));
    REQUIRE(led.getOutputState());

    led.executeAction("get_state", nullptr, capture(result));
    REQUIRE(result.value == true);

    led.shutdown(capture(result));
    REQUIRE(rig.board.getPinState(13) == 0);
    REQUIRE_FALSE(led.isInitialized());
}

TEST_CASE("DigitalInput reports changes from the board without a read")
{
    Rig rig;
    DigitalInputDevice button("btn", "Button", rig.board, singlePin("input", 2, {{"pullup", true}}));
    IoResult result;
    button.initialize(capture(result));
    REQUIRE(result.ok);

    PinMode mode = PinMode::input;
    REQUIRE(rig.board.getPinMode(2, mode));
    REQUIRE(mode == PinMode::inputPullup);

    int changes = 0;
    button.addChangeObserver([&](const Value&) { ++changes; });
    rig.board.injectPinValue(2, 1);
    rig.board.injectPinValue(2, 1);
    REQUIRE(changes == 1);
    REQUIRE(button.getLastValue() == true);

    rig.board.injectPinValue(2, 0);
    button.executeAction("read", nullptr, capture(result));
    REQUIRE(result.value == false);
}

TEST_CASE("AnalogInput converts raw readings to volts")
{
    Rig rig;
    AnalogInputDevice pot("pot", "Pot", rig.board, singlePin("input", 14, {{"reference_voltage", 5.0}}));
    IoResult result;
    pot.initialize(capture(result));
    REQUIRE(result.ok);

    rig.board.injectPinValue(14, 1023);
    pot.executeAction("read", nullptr, capture(result));
    REQUIRE(result.value == 1023);

    rig.board.injectPinValue(14, 512);
    pot.executeAction("read_voltage", nullptr, capture(result));
    REQUIRE_THAT(toDouble(result.value), WithinAbs(512.0 / 1023.0 * 5.0, 1e-9));
}

TEST_CASE("AnalogInput clamps out-of-range readings")
{
    Rig rig;
    AnalogInputDevice pot("pot", "Pot", rig.board, singlePin("input", 14));
    IoResult result;
    pot.initialize(capture(result));

    rig.board.injectPinValue(14, 5000);
    pot.executeAction("read", nullptr, capture(result));
    REQUIRE(result.ok);
    REQUIRE(result.value == 1023);
}

TEST_CASE("PWMOutput clamps values and converts percentages")
{
    Rig rig;
    PWMOutputDevice dimmer("dim", "Dimmer", rig.board, singlePin("output", 9));
    IoResult result;
    dimmer.initialize(capture(result));

    dimmer.executeAction("set", 999, capture(result));
    REQUIRE(dimmer.getValue() == 255);

    dimmer.executeAction("set_percent", 50, capture(result));
    REQUIRE(dimmer.getValue() == 127);

    dimmer.executeAction("off", nullptr, capture(result));
    REQUIRE(rig.board.getPinState(9) == 0);
}

TEST_CASE("Servo centres on initialize and clamps to its range")
{
    Rig rig;
    ServoDevice servo("arm", "Arm", rig.board, singlePin("signal", 6, {{"min_angle", 20}, {"max_angle", 160}}));
    IoResult result;
    servo.initialize(capture(result));
    REQUIRE(result.ok);
    REQUIRE(servo.getAngle() == 90);

    servo.executeAction("set_angle", 10, capture(result));
    REQUIRE(servo.getAngle() == 20);
    REQUIRE(rig.board.getPinState(6) == 20);

    servo.executeAction("set_angle", 175, capture(result));
    REQUIRE(servo.getAngle() == 160);
}

TEST_CASE("MotorGovernor pulses the up line for the pulse duration")
{
    Rig rig;
    DeviceConfig config;
    config.pins = {{"up", 3}, {"down", 4}, {"signal", 15}};
    config.settings = {{"pulse_duration", 0.05}};
    MotorGovernorDevice motor("gov", "Governor", rig.board, config);
    IoResult result;
    motor.initialize(capture(result));
    REQUIRE(result.ok);

    bool finished = false;
    motor.executeAction("up", nullptr, [&](const IoResult& r) {
        finished = true;
        result = r;
    });
    REQUIRE(rig.board.getPinState(3) == 1);
    REQUIRE(rig.board.getPinState(4) == 1);
    REQUIRE_FALSE(finished);

    rig.scheduler.advance(0.05);
    REQUIRE(finished);
    REQUIRE(result.ok);
    REQUIRE(rig.board.getPinState(3) == 0);
    REQUIRE(rig.board.getPinState(4) == 1);

    motor.executeAction("stop", nullptr, capture(result));
    REQUIRE(rig.board.getPinState(4) == 0);

    rig.board.injectPinValue(15, 300);
    motor.executeAction("read_position", nullptr, capture(result));
    REQUIRE(motor.getPosition() == 300);
}

TEST_CASE("Shutdown during a motor pulse drops the pending completion")
{
    Rig rig;
    DeviceConfig config;
    config.pins = {{"up", 3}, {"down", 4}, {"signal", 15}};
    MotorGovernorDevice motor("gov", "Governor", rig.board, config);
    motor.initialize(nullptr);

    bool finished = false;
    motor.executeAction("down", nullptr, [&](const IoResult&) { finished = true; });
    motor.shutdown(nullptr);
    rig.scheduler.advance(1.0);

    REQUIRE_FALSE(finished);
    REQUIRE(rig.board.getPinState(3) == 0);
    REQUIRE(rig.board.getPinState(4) == 0);
}

// ═══════════════════════════════════════════════════════════════════
// Registry
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Builtin device registry creates every device type")
{
    Rig rig;
    DeviceRegistry registry;
    registerBuiltinDevices(registry);

    for (const char* type : {"DigitalOutput", "DigitalInput", "AnalogInput", "PWMOutput", "Servo", "MotorGovernor"})
    {
        REQUIRE(registry.hasType(type));
        auto device = registry.create(type, "d", "D", rig.board, DeviceConfig());
        REQUIRE(device);
        REQUIRE(device->getType() == type);
    }
    REQUIRE(registry.create("Laser", "d", "D", rig.board, DeviceConfig()) == nullptr);
}
