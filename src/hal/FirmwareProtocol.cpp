#include "hal/FirmwareProtocol.h"

#include <algorithm>

namespace labflow {
namespace firmware {

static Frame frame(std::initializer_list<uint8_t> body)
{
    Frame out;
    out.reserve(body.size() + 1);
    out.push_back(static_cast<uint8_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

static uint8_t clampByte(int value, int maxValue)
{
    return static_cast<uint8_t>(std::max(0, std::min(value, maxValue)));
}

Frame areYouThere() { return frame({ARE_U_THERE}); }

Frame getFirmwareVersion() { return frame({GET_FIRMWARE_VERSION}); }

Frame setPinMode(int pin, WirePinMode mode, bool reportChanges)
{
    return frame({SET_PIN_MODE, static_cast<uint8_t>(pin), mode,
                  static_cast<uint8_t>(reportChanges ? 1 : 0)});
}

Frame digitalWrite(int pin, bool value)
{
    return frame({DIGITAL_WRITE, static_cast<uint8_t>(pin), static_cast<uint8_t>(value ? 1 : 0)});
}

Frame analogWrite(int pin, int value)
{
    return frame({ANALOG_WRITE, static_cast<uint8_t>(pin), clampByte(value, 255)});
}

Frame modifyReporting(ReportingMode mode)
{
    return frame({MODIFY_REPORTING, mode});
}

Frame servoAttach(int pin, int minPulseUs, int maxPulseUs)
{
    return frame({SERVO_ATTACH, static_cast<uint8_t>(pin),
                  static_cast<uint8_t>((minPulseUs >> 8) & 0xff), static_cast<uint8_t>(minPulseUs & 0xff),
                  static_cast<uint8_t>((maxPulseUs >> 8) & 0xff), static_cast<uint8_t>(maxPulseUs & 0xff)});
}

Frame servoWrite(int pin, int angle)
{
    return frame({SERVO_WRITE, static_cast<uint8_t>(pin), clampByte(angle, 180)});
}

Frame servoDetach(int pin)
{
    return frame({SERVO_DETACH, static_cast<uint8_t>(pin)});
}

bool decodeReport(const Frame& body, DecodedReport& report)
{
    if (body.empty())
        return false;

    report = DecodedReport();
    report.id = body[0];
    switch (body[0])
    {
        case DIGITAL_REPORT:
            if (body.size() < 3)
                return false;
            report.pin = body[1];
            report.value = body[2] ? 1 : 0;
            return true;
        case ANALOG_REPORT:
            if (body.size() < 4)
                return false;
            report.pin = body[1];
            report.value = (body[2] << 8) | body[3];
            return true;
        case FIRMWARE_REPORT:
            if (body.size() < 3)
                return false;
            report.major = body[1];
            report.minor = body[2];
            return true;
        case I_AM_HERE:
            report.value = body.size() > 1 ? body[1] : 0;
            return true;
        default:
            return false;
    }
}

bool FrameDecoder::feed(uint8_t byte, Frame& frame)
{
    if (expected_ < 0)
    {
        // zero-length frames carry nothing
        if (byte == 0)
            return false;
        expected_ = byte;
        buffer_.clear();
        return false;
    }

    buffer_.push_back(byte);
    if (static_cast<int>(buffer_.size()) < expected_)
        return false;

    frame.swap(buffer_);
    buffer_.clear();
    expected_ = -1;
    return true;
}

void FrameDecoder::reset()
{
    expected_ = -1;
    buffer_.clear();
}

} // namespace firmware
} // namespace labflow
