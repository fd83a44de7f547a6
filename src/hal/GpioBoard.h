#pragma once

#include "hal/Board.h"
#include "hal/ReaderGate.h"

#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace labflow {

class WorkerExecutor;

/// Raspberry Pi 40-pin header through the Linux GPIO character device.
///
/// Digital lines are requested one per pin with the v2 uAPI; every ioctl runs
/// on the worker thread. PWM and servo pins use the hardware PWM channels
/// exported under /sys/class/pwm. Input lines are requested with both edges
/// enabled and a reader thread forwards edge events to the scheduler. A line
/// is only closed while the reader is outside poll() and read(), so its fd
/// number cannot be reused under the reader.
class GpioBoard : public Board {
public:
    GpioBoard(std::string id, std::string port, Scheduler& scheduler);
    ~GpioBoard() override;

    std::string getType() const override { return "raspberry_pi"; }
    std::string getName() const override { return "Raspberry Pi"; }
    const BoardCapabilities& getCapabilities() const override { return capabilities_; }

    const std::string& getChipPath() const { return chipPath_; }

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
    struct Line {
        int fd = -1;
        bool input = false;
    };

    // Worker-thread helpers. Return an empty string on success.
    std::string requestLine(int pin, PinMode mode);
    std::string setLineValue(int pin, bool value);
    std::string getLineValue(int pin, bool& value);
    std::string setupPwm(int pin, long periodNs);
    std::string setPwmDuty(int pin, long dutyNs);
    void releaseLine(int pin);

    void wakeReader();
    void readerLoop();

    std::string chipPath_;
    BoardCapabilities capabilities_;
    int chipFd_ = -1;

    std::mutex linesMutex_;
    std::map<int, Line> lines_;
    ReaderGate gate_;   // guarded by linesMutex_
    int wakeFd_ = -1;
    std::map<int, long> pwmPeriods_;

    std::unique_ptr<WorkerExecutor> worker_;
    std::thread reader_;
};

} // namespace labflow
