#pragma once

#include "core/ObserverList.h"
#include "core/Scheduler.h"
#include "hal/HalTypes.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace labflow {

class WorkerExecutor;

/// Driver contract for a controller exposing pins.
///
/// The public I/O calls validate connection state and pin capability before
/// the driver is reached, so an unsupported request never produces a hardware
/// call. Every I/O call completes exactly once through its IoCallback, either
/// synchronously or later on the scheduler thread.
///
/// Connecting may block (port open, firmware handshake), so drivers can
/// complete it later on the scheduler thread. The board stays CONNECTING or
/// RECONNECTING while an attempt is in flight.
///
/// State machine:
///   DISCONNECTED -> CONNECTING -> CONNECTED | ERROR
///   CONNECTED    -> DISCONNECTED | RECONNECTING
///   RECONNECTING -> CONNECTED | RECONNECTING (retry every reconnect interval)
class Board {
public:
    using StateCallback = std::function<void(BoardState)>;
    using PinCallback = std::function<void(int pin, const Value& value)>;
    using ErrorCallback = std::function<void(const std::string& message)>;
    using ConnectCallback = std::function<void(bool ok, const std::string& error)>;

    Board(std::string id, std::string port, Scheduler& scheduler);
    virtual ~Board();

    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;

    const std::string& getId() const { return id_; }
    const std::string& getPort() const { return port_; }
    Scheduler& getScheduler() const { return scheduler_; }

    virtual std::string getType() const = 0;
    virtual std::string getName() const = 0;
    virtual const BoardCapabilities& getCapabilities() const = 0;

    BoardState getState() const { return state_; }
    bool isConnected() const { return state_ == BoardState::connected; }

    // --- Connection ---

    // done runs exactly once. A disconnect() while the attempt is in flight
    // abandons it and done reports failure.
    void connect(ConnectCallback done);
    // For drivers that finish at once (mock, GPIO). Returns false with
    // "Connection in progress" while an asynchronous attempt is running.
    bool connect(std::string& error);
    bool connect();
    void disconnect();

    // --- Pin I/O ---
    void setPinMode(int pin, PinMode mode, OperationKind kind, IoCallback done);
    void writeDigital(int pin, bool value, IoCallback done);
    void readDigital(int pin, IoCallback done);
    void writeAnalog(int pin, int value, IoCallback done);
    void readAnalog(int pin, IoCallback done);
    void writeServo(int pin, int angle, IoCallback done);

    // Generic dispatch by operation kind
    void writePin(int pin, OperationKind kind, const Value& value, IoCallback done);
    void readPin(int pin, OperationKind kind, IoCallback done);

    bool validateOperation(int pin, OperationKind kind, std::string& error) const;

    // Drives every output written since connect to LOW / 0. Never throws;
    // a failing pin is logged and the remaining pins are still stopped.
    void emergencyStop() noexcept;

    // --- Reconnection ---
    void setAutoReconnect(bool enabled);
    bool getAutoReconnect() const { return autoReconnect_; }
    void setReconnectInterval(double seconds);
    double getReconnectInterval() const { return reconnectInterval_; }
    bool isReconnecting() const { return state_ == BoardState::reconnecting; }
    void stopReconnect();

    // Called by drivers (on the scheduler thread) when the transport drops.
    void handleConnectionLost(const std::string& reason);

    // --- Observers ---
    uint32_t addStateObserver(StateCallback callback);
    bool removeStateObserver(uint32_t id);
    // pin < 0 observes every pin
    uint32_t addPinObserver(int pin, PinCallback callback);
    bool removePinObserver(uint32_t id);
    uint32_t addErrorObserver(ErrorCallback callback);
    bool removeErrorObserver(uint32_t id);

    virtual nlohmann::json toJson() const;

protected:
    // Opens the transport. The default runs doConnect() and completes at once;
    // drivers with a blocking open override this and complete on the
    // scheduler thread. Completing after the board is gone is not allowed.
    virtual void doConnectAsync(ConnectCallback done);
    virtual bool doConnect(std::string& error);
    virtual void doDisconnect() = 0;
    virtual void doSetPinMode(int pin, PinMode mode, OperationKind kind, IoCallback done) = 0;
    virtual void doWriteDigital(int pin, bool value, IoCallback done) = 0;
    virtual void doReadDigital(int pin, IoCallback done) = 0;
    virtual void doWriteAnalog(int pin, int value, IoCallback done) = 0;
    virtual void doReadAnalog(int pin, IoCallback done) = 0;
    virtual void doWriteServo(int pin, int angle, IoCallback done);

    // Synchronously drives one output to its safe value. May throw.
    virtual void forceSafe(int pin, OperationKind kind) = 0;

    void setState(BoardState state);
    void notifyPinValue(int pin, const Value& value);
    void notifyError(const std::string& message);

    // Runs op on the worker thread and completes done on the scheduler thread.
    void runBlocking(WorkerExecutor& worker, std::function<IoResult()> op, IoCallback done);

    // Expires when this board is destroyed.
    std::weak_ptr<bool> lifetime() const { return alive_; }

    // Posts task to the scheduler; dropped if this board is gone by then.
    void postToScheduler(std::function<void()> task);

private:
    bool checkReady(int pin, OperationKind kind, std::string& error) const;
    void startConnect(ConnectCallback done);
    void finishConnect(uint64_t attempt, bool ok, std::string error, const ConnectCallback& done);
    void releaseAbandonedTransport();
    void scheduleReconnectAttempt();
    void attemptReconnect();
    void restorePinModes();

    struct PinSetup {
        PinMode mode;
        OperationKind kind;
    };

    std::string id_;
    std::string port_;
    Scheduler& scheduler_;
    BoardState state_ = BoardState::disconnected;

    bool autoReconnect_ = false;
    double reconnectInterval_ = 5.0;
    Scheduler::TimerId reconnectTimer_ = 0;
    int reconnectAttempts_ = 0;
    uint64_t connectAttempt_ = 0;

    std::map<int, PinSetup> pinSetups_;
    std::map<int, OperationKind> outputPins_;

    ObserverList<BoardState> stateObservers_;
    ObserverList<int, const Value&> pinObservers_;
    ObserverList<const std::string&> errorObservers_;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace labflow
