#pragma once

#include <cstdint>
#include <vector>

namespace labflow {
namespace firmware {

// Wire format: every frame is [length, id, payload...] where length counts
// the bytes after itself. Host to board frames carry a command id, board to
// host frames carry a report id.

enum Command : uint8_t {
    SET_PIN_MODE = 1,
    DIGITAL_WRITE = 2,
    ANALOG_WRITE = 3,
    MODIFY_REPORTING = 4,
    GET_FIRMWARE_VERSION = 5,
    ARE_U_THERE = 6,
    SERVO_ATTACH = 7,
    SERVO_WRITE = 8,
    SERVO_DETACH = 9,
};

enum WirePinMode : uint8_t {
    MODE_INPUT = 0,
    MODE_OUTPUT = 1,
    MODE_INPUT_PULLUP = 2,
    MODE_ANALOG = 3,
};

enum Report : uint8_t {
    DIGITAL_REPORT = 2,
    ANALOG_REPORT = 3,
    FIRMWARE_REPORT = 5,
    I_AM_HERE = 6,
};

enum ReportingMode : uint8_t {
    REPORTING_DISABLE_ALL = 0,
    REPORTING_ENABLE_ALL = 1,
};

using Frame = std::vector<uint8_t>;

Frame areYouThere();
Frame getFirmwareVersion();
Frame setPinMode(int pin, WirePinMode mode, bool reportChanges);
Frame digitalWrite(int pin, bool value);
Frame analogWrite(int pin, int value);   // clamped 0-255
Frame modifyReporting(ReportingMode mode);
Frame servoAttach(int pin, int minPulseUs = 544, int maxPulseUs = 2400);
Frame servoWrite(int pin, int angle);    // clamped 0-180
Frame servoDetach(int pin);

struct DecodedReport {
    uint8_t id = 0;
    int pin = -1;     // digital pin, or analog channel for ANALOG_REPORT
    int value = 0;
    int major = 0;    // FIRMWARE_REPORT
    int minor = 0;
};

// Interprets a complete frame body (id + payload, without the length byte).
bool decodeReport(const Frame& body, DecodedReport& report);

/// Incremental frame splitter for bytes arriving from the serial port.
class FrameDecoder {
public:
    // Returns true when byte completes a frame; the body is written to frame.
    bool feed(uint8_t byte, Frame& frame);
    void reset();

private:
    int expected_ = -1;
    Frame buffer_;
};

} // namespace firmware
} // namespace labflow
