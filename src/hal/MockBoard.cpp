#include "hal/MockBoard.h"
#include "core/Logger.h"

namespace labflow {

MockBoard::MockBoard(std::string id, std::string port, Scheduler& scheduler)
    : Board(std::move(id), std::move(port), scheduler)
{
    capabilities_.name = "Mock Board";
    capabilities_.analogResolution = 10;
    capabilities_.pwmMax = 255;
    for (int pin = 0; pin < kPinCount; ++pin)
    {
        PinCapability cap;
        cap.kinds = {OperationKind::digital, OperationKind::analog,
                     OperationKind::pwm, OperationKind::servo};
        cap.maxValue = 255;
        cap.description = "Mock pin " + std::to_string(pin);
        capabilities_.pins[pin] = cap;
    }
}

void MockBoard::injectPinValue(int pin, int value)
{
    pinStates_[pin] = value;
    notifyPinValue(pin, value);
}

void MockBoard::simulateConnectionLoss(const std::string& reason)
{
    handleConnectionLost(reason);
}

int MockBoard::getPinState(int pin) const
{
    auto it = pinStates_.find(pin);
    return it == pinStates_.end() ? 0 : it->second;
}

bool MockBoard::getPinMode(int pin, PinMode& mode) const
{
    auto it = pinModes_.find(pin);
    if (it == pinModes_.end())
        return false;
    mode = it->second;
    return true;
}

bool MockBoard::doConnect(std::string& error)
{
    ++connectAttempts_;
    if (transportFailing_)
    {
        error = "mock transport unavailable";
        return false;
    }
    return true;
}

void MockBoard::doDisconnect()
{
    LF_DEBUG("MockBoard %s: transport closed", getId().c_str());
}

bool MockBoard::failIo(const IoCallback& done)
{
    if (!transportFailing_)
        return false;
    if (done)
        done(IoResult::failure("mock transport failure"));
    handleConnectionLost("mock transport failure");
    return true;
}

void MockBoard::doSetPinMode(int pin, PinMode mode, OperationKind, IoCallback done)
{
    if (failIo(done))
        return;
    pinModes_[pin] = mode;
    if (done)
        done(IoResult::success());
}

void MockBoard::doWriteDigital(int pin, bool value, IoCallback done)
{
    if (failIo(done))
        return;
    pinStates_[pin] = value ? 1 : 0;
    ++writeCount_;
    LF_TRACE("MockBoard %s: D%d <- %d", getId().c_str(), pin, value ? 1 : 0);
    if (done)
        done(IoResult::success());
}

void MockBoard::doReadDigital(int pin, IoCallback done)
{
    if (failIo(done))
        return;
    if (done)
        done(IoResult::success(getPinState(pin) != 0));
}

void MockBoard::doWriteAnalog(int pin, int value, IoCallback done)
{
    if (failIo(done))
        return;
    pinStates_[pin] = value;
    ++writeCount_;
    LF_TRACE("MockBoard %s: A%d <- %d", getId().c_str(), pin, value);
    if (done)
        done(IoResult::success());
}

void MockBoard::doReadAnalog(int pin, IoCallback done)
{
    if (failIo(done))
        return;
    if (done)
        done(IoResult::success(getPinState(pin)));
}

void MockBoard::doWriteServo(int pin, int angle, IoCallback done)
{
    if (failIo(done))
        return;
    pinStates_[pin] = angle;
    ++writeCount_;
    if (done)
        done(IoResult::success());
}

void MockBoard::forceSafe(int pin, OperationKind)
{
    pinStates_[pin] = 0;
}

} // namespace labflow
