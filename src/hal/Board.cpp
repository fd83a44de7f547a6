#include "hal/Board.h"
#include "core/Logger.h"
#include "core/WorkerExecutor.h"

#include <algorithm>
#include <exception>

namespace labflow {

static void complete(const IoCallback& done, const IoResult& result)
{
    if (done)
        done(result);
}

Board::Board(std::string id, std::string port, Scheduler& scheduler)
    : id_(std::move(id))
    , port_(std::move(port))
    , scheduler_(scheduler)
{
}

Board::~Board()
{
    *alive_ = false;
    if (reconnectTimer_ != 0)
        scheduler_.cancel(reconnectTimer_);
}

// ═══════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════

void Board::connect(ConnectCallback done)
{
    if (state_ == BoardState::connected)
    {
        if (done)
            done(true, std::string());
        return;
    }
    if (state_ == BoardState::connecting)
    {
        if (done)
            done(false, "Connection in progress");
        return;
    }

    stopReconnect();
    setState(BoardState::connecting);
    uint64_t attempt = ++connectAttempt_;
    startConnect([this, attempt, done](bool ok, const std::string& error) {
        finishConnect(attempt, ok, error, done);
    });
}

bool Board::connect(std::string& error)
{
    struct Outcome {
        bool finished = false;
        bool ok = false;
        std::string error;
    };
    auto outcome = std::make_shared<Outcome>();
    connect([outcome](bool ok, const std::string& message) {
        outcome->finished = true;
        outcome->ok = ok;
        outcome->error = message;
    });

    if (!outcome->finished)
    {
        error = "Connection in progress";
        return false;
    }
    error = outcome->error;
    return outcome->ok;
}

bool Board::connect()
{
    std::string error;
    return connect(error);
}

void Board::startConnect(ConnectCallback done)
{
    try
    {
        doConnectAsync(done);
    }
    catch (const std::exception& e)
    {
        done(false, e.what());
    }
}

void Board::doConnectAsync(ConnectCallback done)
{
    std::string error;
    bool ok = doConnect(error);
    done(ok, error);
}

bool Board::doConnect(std::string& error)
{
    error = "driver " + getType() + " cannot connect synchronously";
    return false;
}

void Board::finishConnect(uint64_t attempt, bool ok, std::string error, const ConnectCallback& done)
{
    if (attempt != connectAttempt_ || state_ != BoardState::connecting)
    {
        LF_DEBUG("Board %s: connect attempt abandoned", id_.c_str());
        if (ok)
            releaseAbandonedTransport();
        if (done)
            done(false, "Connection attempt abandoned");
        return;
    }

    if (!ok)
    {
        if (error.empty())
            error = "connection failed";
        LF_WARN("Board %s: connect failed: %s", id_.c_str(), error.c_str());
        setState(BoardState::error);
        notifyError(error);
        if (done)
            done(false, error);
        return;
    }

    LF_INFO("Board %s: connected (%s on %s)", id_.c_str(), getName().c_str(), port_.c_str());
    setState(BoardState::connected);
    if (done)
        done(true, std::string());
}

// A driver finished opening after the board gave up on the attempt.
void Board::releaseAbandonedTransport()
{
    try
    {
        doDisconnect();
    }
    catch (const std::exception& e)
    {
        LF_WARN("Board %s: releasing an abandoned connection raised: %s", id_.c_str(), e.what());
    }
}

void Board::disconnect()
{
    ++connectAttempt_;
    stopReconnect();
    if (state_ == BoardState::disconnected)
        return;

    try
    {
        doDisconnect();
    }
    catch (const std::exception& e)
    {
        LF_WARN("Board %s: disconnect raised: %s", id_.c_str(), e.what());
    }

    pinSetups_.clear();
    outputPins_.clear();
    setState(BoardState::disconnected);
    LF_INFO("Board %s: disconnected", id_.c_str());
}

// ═══════════════════════════════════════════════════════════════════
// Pin I/O
// ═══════════════════════════════════════════════════════════════════

bool Board::validateOperation(int pin, OperationKind kind, std::string& error) const
{
    const PinCapability* cap = getCapabilities().find(pin);
    if (!cap)
    {
        error = "Pin " + std::to_string(pin) + " does not exist on board " + id_;
        return false;
    }
    if (!cap->supports(kind))
    {
        error = "Pin " + std::to_string(pin) + " does not support '" + toString(kind) +
                "'. Supported types: " + describeKinds(cap->kinds);
        return false;
    }
    return true;
}

bool Board::checkReady(int pin, OperationKind kind, std::string& error) const
{
    if (!isConnected())
    {
        error = "Board " + id_ + " is not connected (" + toString(state_) + ")";
        return false;
    }
    return validateOperation(pin, kind, error);
}

void Board::setPinMode(int pin, PinMode mode, OperationKind kind, IoCallback done)
{
    std::string error;
    if (!checkReady(pin, kind, error))
    {
        LF_WARN("Board %s: setPinMode rejected: %s", id_.c_str(), error.c_str());
        complete(done, IoResult::failure(error));
        return;
    }

    LF_DEBUG("Board %s: pin %d mode %s (%s)", id_.c_str(), pin, toString(mode), toString(kind));
    pinSetups_[pin] = {mode, kind};
    try
    {
        doSetPinMode(pin, mode, kind, done);
    }
    catch (const std::exception& e)
    {
        complete(done, IoResult::failure(e.what()));
    }
}

void Board::writeDigital(int pin, bool value, IoCallback done)
{
    std::string error;
    if (!checkReady(pin, OperationKind::digital, error))
    {
        complete(done, IoResult::failure(error));
        return;
    }
    outputPins_[pin] = OperationKind::digital;
    try
    {
        doWriteDigital(pin, value, done);
    }
    catch (const std::exception& e)
    {
        complete(done, IoResult::failure(e.what()));
    }
}

void Board::readDigital(int pin, IoCallback done)
{
    std::string error;
    if (!checkReady(pin, OperationKind::digital, error))
    {
        complete(done, IoResult::failure(error));
        return;
    }
    try
    {
        doReadDigital(pin, done);
    }
    catch (const std::exception& e)
    {
        complete(done, IoResult::failure(e.what()));
    }
}

void Board::writeAnalog(int pin, int value, IoCallback done)
{
    std::string error;
    if (!checkReady(pin, OperationKind::pwm, error))
    {
        complete(done, IoResult::failure(error));
        return;
    }
    int maxValue = getCapabilities().maxValueFor(pin, OperationKind::pwm);
    value = std::max(0, std::min(value, maxValue));
    outputPins_[pin] = OperationKind::pwm;
    try
    {
        doWriteAnalog(pin, value, done);
    }
    catch (const std::exception& e)
    {
        complete(done, IoResult::failure(e.what()));
    }
}

void Board::readAnalog(int pin, IoCallback done)
{
    std::string error;
    if (!checkReady(pin, OperationKind::analog, error))
    {
        complete(done, IoResult::failure(error));
        return;
    }
    try
    {
        doReadAnalog(pin, done);
    }
    catch (const std::exception& e)
    {
        complete(done, IoResult::failure(e.what()));
    }
}

void Board::writeServo(int pin, int angle, IoCallback done)
{
    std::string error;
    if (!checkReady(pin, OperationKind::servo, error))
    {
        complete(done, IoResult::failure(error));
        return;
    }
    angle = std::max(0, std::min(angle, getCapabilities().servoMax));
    try
    {
        doWriteServo(pin, angle, done);
    }
    catch (const std::exception& e)
    {
        complete(done, IoResult::failure(e.what()));
    }
}

void Board::doWriteServo(int, int, IoCallback done)
{
    complete(done, IoResult::failure("Servo not supported on " + getName()));
}

void Board::writePin(int pin, OperationKind kind, const Value& value, IoCallback done)
{
    switch (kind)
    {
        case OperationKind::digital:
            writeDigital(pin, toBool(value), std::move(done));
            return;
        case OperationKind::analog:
        case OperationKind::pwm:
            writeAnalog(pin, toInt(value), std::move(done));
            return;
        case OperationKind::servo:
            writeServo(pin, toInt(value), std::move(done));
            return;
        default:
            break;
    }
    complete(done, IoResult::failure(std::string("Unsupported pin type for write: ") + toString(kind)));
}

void Board::readPin(int pin, OperationKind kind, IoCallback done)
{
    switch (kind)
    {
        case OperationKind::digital:
            readDigital(pin, std::move(done));
            return;
        case OperationKind::analog:
            readAnalog(pin, std::move(done));
            return;
        default:
            break;
    }
    complete(done, IoResult::failure(std::string("Unsupported pin type for read: ") + toString(kind)));
}

void Board::emergencyStop() noexcept
{
    LF_WARN("Board %s: emergency stop (%d outputs)", id_.c_str(),
            static_cast<int>(outputPins_.size()));

    for (const auto& entry : outputPins_)
    {
        try
        {
            forceSafe(entry.first, entry.second);
        }
        catch (const std::exception& e)
        {
            LF_WARN("Board %s: emergency stop failed on pin %d: %s",
                    id_.c_str(), entry.first, e.what());
        }
        catch (...)
        {
            LF_WARN("Board %s: emergency stop failed on pin %d", id_.c_str(), entry.first);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════
// Reconnection
// ═══════════════════════════════════════════════════════════════════

void Board::setAutoReconnect(bool enabled)
{
    autoReconnect_ = enabled;
    if (enabled)
        return;

    // An attempt already in flight settles the state when it completes.
    bool waiting = reconnectTimer_ != 0;
    stopReconnect();
    if (waiting && state_ == BoardState::reconnecting)
        setState(BoardState::disconnected);
}

void Board::setReconnectInterval(double seconds)
{
    if (seconds > 0.0)
        reconnectInterval_ = seconds;
}

void Board::stopReconnect()
{
    if (reconnectTimer_ != 0)
    {
        scheduler_.cancel(reconnectTimer_);
        reconnectTimer_ = 0;
        LF_DEBUG("Board %s: reconnect loop stopped", id_.c_str());
    }
}

void Board::handleConnectionLost(const std::string& reason)
{
    if (state_ != BoardState::connected)
        return;

    LF_WARN("Board %s: connection lost: %s", id_.c_str(), reason.c_str());
    notifyError(reason);

    try
    {
        doDisconnect();
    }
    catch (const std::exception& e)
    {
        LF_WARN("Board %s: cleanup after connection loss raised: %s", id_.c_str(), e.what());
    }

    if (!autoReconnect_)
    {
        setState(BoardState::disconnected);
        return;
    }

    reconnectAttempts_ = 0;
    setState(BoardState::reconnecting);
    scheduleReconnectAttempt();
}

void Board::scheduleReconnectAttempt()
{
    std::weak_ptr<bool> alive = alive_;
    reconnectTimer_ = scheduler_.callAfter(reconnectInterval_, [this, alive]() {
        if (alive.expired())
            return;
        reconnectTimer_ = 0;
        attemptReconnect();
    });
}

void Board::attemptReconnect()
{
    if (state_ != BoardState::reconnecting || !autoReconnect_)
        return;

    ++reconnectAttempts_;
    uint64_t attempt = ++connectAttempt_;
    startConnect([this, attempt](bool ok, const std::string& error) {
        if (attempt != connectAttempt_ || state_ != BoardState::reconnecting)
        {
            if (ok)
                releaseAbandonedTransport();
            return;
        }
        if (!autoReconnect_)
        {
            if (ok)
                releaseAbandonedTransport();
            setState(BoardState::disconnected);
            return;
        }

        if (ok)
        {
            LF_INFO("Board %s: reconnected after %d attempts", id_.c_str(), reconnectAttempts_);
            setState(BoardState::connected);
            restorePinModes();
            return;
        }

        LF_DEBUG("Board %s: reconnect attempt %d failed: %s",
                 id_.c_str(), reconnectAttempts_, error.c_str());
        scheduleReconnectAttempt();
    });
}

void Board::restorePinModes()
{
    for (const auto& entry : pinSetups_)
    {
        int pin = entry.first;
        std::string id = id_;
        try
        {
            doSetPinMode(pin, entry.second.mode, entry.second.kind,
                [id, pin](const IoResult& result) {
                    if (!result.ok)
                        LF_WARN("Board %s: restoring mode of pin %d failed: %s",
                                id.c_str(), pin, result.error.c_str());
                });
        }
        catch (const std::exception& e)
        {
            LF_WARN("Board %s: restoring mode of pin %d raised: %s", id_.c_str(), pin, e.what());
        }
    }
}

// ═══════════════════════════════════════════════════════════════════
// Observers
// ═══════════════════════════════════════════════════════════════════

void Board::setState(BoardState state)
{
    if (state_ == state)
        return;
    LF_DEBUG("Board %s: state %s -> %s", id_.c_str(), toString(state_), toString(state));
    state_ = state;
    stateObservers_.notify(state);
}

void Board::notifyPinValue(int pin, const Value& value)
{
    pinObservers_.notify(pin, value);
}

void Board::notifyError(const std::string& message)
{
    errorObservers_.notify(message);
}

uint32_t Board::addStateObserver(StateCallback callback)
{
    return stateObservers_.add(std::move(callback));
}

bool Board::removeStateObserver(uint32_t id)
{
    return stateObservers_.remove(id);
}

uint32_t Board::addPinObserver(int pin, PinCallback callback)
{
    if (!callback)
        return 0;
    return pinObservers_.add([pin, callback](int reported, const Value& value) {
        if (pin < 0 || pin == reported)
            callback(reported, value);
    });
}

bool Board::removePinObserver(uint32_t id)
{
    return pinObservers_.remove(id);
}

uint32_t Board::addErrorObserver(ErrorCallback callback)
{
    return errorObservers_.add(std::move(callback));
}

bool Board::removeErrorObserver(uint32_t id)
{
    return errorObservers_.remove(id);
}

// ═══════════════════════════════════════════════════════════════════
// Worker hand-over
// ═══════════════════════════════════════════════════════════════════

void Board::runBlocking(WorkerExecutor& worker, std::function<IoResult()> op, IoCallback done)
{
    Scheduler* scheduler = &scheduler_;
    std::weak_ptr<bool> alive = alive_;
    bool submitted = worker.submit([scheduler, alive, op, done]() {
        IoResult result;
        try
        {
            result = op();
        }
        catch (const std::exception& e)
        {
            result = IoResult::failure(e.what());
        }
        scheduler->post([alive, done, result]() {
            if (alive.expired())
                return;
            complete(done, result);
        });
    });

    if (!submitted)
        complete(done, IoResult::failure("Board " + id_ + " worker is not running"));
}

void Board::postToScheduler(std::function<void()> task)
{
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([alive, task]() {
        if (!alive.expired())
            task();
    });
}

nlohmann::json Board::toJson() const
{
    return {
        {"id", id_},
        {"type", getType()},
        {"port", port_},
        {"settings", {{"auto_reconnect", autoReconnect_}}},
    };
}

} // namespace labflow
