#pragma once

#include "hal/Board.h"
#include "hal/FirmwareProtocol.h"

#include <atomic>
#include <map>
#include <memory>
#include <thread>

namespace labflow {

class WorkerExecutor;

/// Arduino-class controller running Telemetrix-style firmware on a serial
/// port. Writes go through the worker thread; reads return the last value the
/// firmware reported, since the board pushes pin changes on its own.
/// Opening the port and the firmware handshake run on a connect worker.
class SerialFirmwareBoard : public Board {
public:
    enum class Variant { uno, mega };

    SerialFirmwareBoard(std::string id, std::string port, Scheduler& scheduler,
                        Variant variant = Variant::uno, int baud = 115200,
                        double readyTimeout = 10.0);
    ~SerialFirmwareBoard() override;

    static bool parseVariant(const std::string& text, Variant& variant);

    std::string getType() const override { return "arduino"; }
    std::string getName() const override { return capabilities_.name; }
    const BoardCapabilities& getCapabilities() const override { return capabilities_; }

    Variant getVariant() const { return variant_; }
    int firstAnalogPin() const { return variant_ == Variant::mega ? 54 : 14; }

    nlohmann::json toJson() const override;

protected:
    void doConnectAsync(ConnectCallback done) override;
    void doDisconnect() override;
    void doSetPinMode(int pin, PinMode mode, OperationKind kind, IoCallback done) override;
    void doWriteDigital(int pin, bool value, IoCallback done) override;
    void doReadDigital(int pin, IoCallback done) override;
    void doWriteAnalog(int pin, int value, IoCallback done) override;
    void doReadAnalog(int pin, IoCallback done) override;
    void doWriteServo(int pin, int angle, IoCallback done) override;
    void forceSafe(int pin, OperationKind kind) override;

private:
    void attachPort(int fd);
    void send(firmware::Frame frame, IoCallback done);
    void readerLoop(int fd, uint64_t session);
    void handleReport(const firmware::DecodedReport& report);

    Variant variant_;
    int baud_;
    double readyTimeout_;
    BoardCapabilities capabilities_;

    int fd_ = -1;
    uint64_t session_ = 0;
    std::unique_ptr<WorkerExecutor> worker_;
    std::unique_ptr<WorkerExecutor> connector_;
    std::thread reader_;
    std::atomic<bool> readerRunning_{false};

    std::map<int, int> pinValues_;   // last reported value per board pin
    std::map<int, OperationKind> pinKinds_;
};

} // namespace labflow
