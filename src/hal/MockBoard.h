#pragma once

#include "hal/Board.h"

#include <map>

namespace labflow {

/// In-memory board for tests and dry runs.
/// 54 pins supporting every kind, 10-bit ADC, 8-bit PWM. All operations
/// complete synchronously.
class MockBoard : public Board {
public:
    static constexpr int kPinCount = 54;

    MockBoard(std::string id, std::string port, Scheduler& scheduler);

    std::string getType() const override { return "mock"; }
    std::string getName() const override { return "Mock Board"; }
    const BoardCapabilities& getCapabilities() const override { return capabilities_; }

    // Sets the value seen by the next read and reports it to pin observers.
    void injectPinValue(int pin, int value);

    // While set, connect fails and every I/O call fails and reports a
    // connection loss.
    void setTransportFailure(bool failing) { transportFailing_ = failing; }
    bool isTransportFailing() const { return transportFailing_; }

    void simulateConnectionLoss(const std::string& reason = "simulated connection loss");

    // Last written or injected value; 0 if never touched.
    int getPinState(int pin) const;
    bool getPinMode(int pin, PinMode& mode) const;
    int connectAttempts() const { return connectAttempts_; }
    int writeCount() const { return writeCount_; }

protected:
    bool doConnect(std::string& error) override;
    void doDisconnect() override;
    void doSetPinMode(int pin, PinMode mode, OperationKind kind, IoCallback done) override;
    void doWriteDigital(int pin, bool value, IoCallback done) override;
    void doReadDigital(int pin, IoCallback done) override;
    void doWriteAnalog(int pin, int value, IoCallback done) override;
    void doReadAnalog(int pin, IoCallback done) override;
    void doWriteServo(int pin, int angle, IoCallback done) override;
    void forceSafe(int pin, OperationKind kind) override;

private:
    bool failIo(const IoCallback& done);

    BoardCapabilities capabilities_;
    std::map<int, int> pinStates_;
    std::map<int, PinMode> pinModes_;
    bool transportFailing_ = false;
    int connectAttempts_ = 0;
    int writeCount_ = 0;
};

} // namespace labflow
