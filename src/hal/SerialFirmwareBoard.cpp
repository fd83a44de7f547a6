#include "hal/SerialFirmwareBoard.h"
#include "core/Logger.h"
#include "core/WorkerExecutor.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>

namespace labflow {

// ═══════════════════════════════════════════════════════════════════
// Serial port helpers
// ═══════════════════════════════════════════════════════════════════

static speed_t baudConstant(int baud)
{
    switch (baud)
    {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 230400: return B230400;
        default:     return B115200;
    }
}

static bool setRaw(int fd, speed_t baud)
{
    termios tio{};
    if (tcgetattr(fd, &tio) != 0)
        return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0)
        return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

static bool writeAll(int fd, const firmware::Frame& frame)
{
    size_t written = 0;
    while (written < frame.size())
    {
        ssize_t n = ::write(fd, frame.data() + written, frame.size() - written);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Pin maps
// ═══════════════════════════════════════════════════════════════════

static PinCapability pinCap(std::set<OperationKind> kinds, int maxValue, std::string description)
{
    PinCapability cap;
    cap.kinds = std::move(kinds);
    cap.maxValue = maxValue;
    cap.description = std::move(description);
    return cap;
}

static BoardCapabilities unoCapabilities()
{
    using K = OperationKind;
    BoardCapabilities caps;
    caps.name = "Arduino Uno";
    for (int pin = 0; pin <= 13; ++pin)
        caps.pins[pin] = pinCap({K::digital}, 1, "Digital");
    caps.pins[0].description = "Digital (RX)";
    caps.pins[1].description = "Digital (TX)";
    caps.pins[13].description = "Digital (LED)";
    for (int pin : {3, 5, 6, 11})
        caps.pins[pin] = pinCap({K::digital, K::pwm}, 255, "Digital/PWM");
    for (int pin : {9, 10})
        caps.pins[pin] = pinCap({K::digital, K::pwm, K::servo}, 255, "Digital/PWM/Servo");
    for (int pin = 14; pin <= 19; ++pin)
        caps.pins[pin] = pinCap({K::digital, K::analog}, 1023, "A" + std::to_string(pin - 14));
    caps.pins[18].kinds.insert(K::i2c);
    caps.pins[18].description = "A4 (SDA)";
    caps.pins[19].kinds.insert(K::i2c);
    caps.pins[19].description = "A5 (SCL)";
    return caps;
}

static BoardCapabilities megaCapabilities()
{
    using K = OperationKind;
    BoardCapabilities caps;
    caps.name = "Arduino Mega";
    for (int pin = 0; pin < 54; ++pin)
        caps.pins[pin] = pinCap({K::digital}, 1, "Digital");
    for (int pin : {2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 44, 45, 46})
        caps.pins[pin] = pinCap({K::digital, K::pwm}, 255, "Digital/PWM");
    for (int pin = 54; pin < 70; ++pin)
        caps.pins[pin] = pinCap({K::digital, K::analog}, 1023, "A" + std::to_string(pin - 54));
    return caps;
}

// ═══════════════════════════════════════════════════════════════════
// SerialFirmwareBoard
// ═══════════════════════════════════════════════════════════════════

SerialFirmwareBoard::SerialFirmwareBoard(std::string id, std::string port, Scheduler& scheduler,
                                         Variant variant, int baud, double readyTimeout)
    : Board(std::move(id), std::move(port), scheduler)
    , variant_(variant)
    , baud_(baud)
    , readyTimeout_(readyTimeout)
    , capabilities_(variant == Variant::mega ? megaCapabilities() : unoCapabilities())
{
}

SerialFirmwareBoard::~SerialFirmwareBoard()
{
    doDisconnect();
    // A pending attempt finishes here; its port is closed by the posted
    // completion once this board is gone.
    if (connector_)
        connector_->shutdown();
}

bool SerialFirmwareBoard::parseVariant(const std::string& text, Variant& variant)
{
    if (text.empty() || text == "uno")
        variant = Variant::uno;
    else if (text == "mega")
        variant = Variant::mega;
    else
        return false;
    return true;
}

static int openPort(const std::string& port, int baud, std::string& error)
{
    int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0)
    {
        error = "cannot open " + port + ": " + std::strerror(errno);
        return -1;
    }
    if (!setRaw(fd, baudConstant(baud)))
    {
        error = "cannot configure " + port + ": " + std::strerror(errno);
        ::close(fd);
        return -1;
    }
    return fd;
}

// Blocks until the firmware answers I_AM_HERE or the ready timeout expires.
// Boards that reset on open miss the first queries, so the query is repeated.
static bool handshake(int fd, const std::string& id, const std::string& port,
                      double readyTimeout, std::string& error)
{
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                                       std::chrono::duration<double>(readyTimeout));
    auto nextQuery = Clock::now();
    firmware::FrameDecoder decoder;
    firmware::Frame body;

    while (Clock::now() < deadline)
    {
        if (Clock::now() >= nextQuery)
        {
            if (!writeAll(fd, firmware::areYouThere()))
            {
                error = std::string("write failed: ") + std::strerror(errno);
                return false;
            }
            nextQuery = Clock::now() + std::chrono::milliseconds(500);
        }

        pollfd pfd{fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 50);
        if (pr < 0 && errno != EINTR)
        {
            error = std::string("poll failed: ") + std::strerror(errno);
            return false;
        }
        if (pr <= 0 || !(pfd.revents & POLLIN))
            continue;

        uint8_t buf[64];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        for (ssize_t i = 0; i < n; ++i)
        {
            firmware::DecodedReport report;
            if (decoder.feed(buf[i], body) && firmware::decodeReport(body, report) &&
                report.id == firmware::I_AM_HERE)
            {
                LF_DEBUG_WK("SerialFirmwareBoard %s: firmware instance %d answered",
                            id.c_str(), report.value);
                return true;
            }
        }
    }

    error = "board on " + port + " did not answer within " +
            std::to_string(readyTimeout) + " s";
    return false;
}

// Open and handshake run on the connect worker; the scheduler only sees the
// finished port.
void SerialFirmwareBoard::doConnectAsync(ConnectCallback done)
{
    doDisconnect();

    if (getPort().empty())
    {
        done(false, "no serial port configured");
        return;
    }
    if (!connector_)
        connector_ = std::make_unique<WorkerExecutor>("serial-connect:" + getId());

    std::string id = getId();
    std::string port = getPort();
    int baud = baud_;
    double readyTimeout = readyTimeout_;
    Scheduler* scheduler = &getScheduler();
    std::weak_ptr<bool> alive = lifetime();

    bool submitted = connector_->submit([this, id, port, baud, readyTimeout, scheduler, alive, done]() {
        std::string error;
        int fd = openPort(port, baud, error);
        if (fd >= 0 && !handshake(fd, id, port, readyTimeout, error))
        {
            ::close(fd);
            fd = -1;
        }

        scheduler->post([this, alive, fd, error, done]() {
            if (alive.expired())
            {
                if (fd >= 0)
                    ::close(fd);
                return;
            }
            if (fd < 0)
            {
                done(false, error);
                return;
            }
            attachPort(fd);
            done(true, std::string());
        });
    });

    if (!submitted)
        done(false, "Board " + id + " connect worker is not running");
}

void SerialFirmwareBoard::attachPort(int fd)
{
    fd_ = fd;
    ++session_;
    worker_ = std::make_unique<WorkerExecutor>("serial:" + getId());
    readerRunning_ = true;
    reader_ = std::thread(&SerialFirmwareBoard::readerLoop, this, fd_, session_);

    if (!writeAll(fd_, firmware::modifyReporting(firmware::REPORTING_ENABLE_ALL)))
        LF_WARN("SerialFirmwareBoard %s: enabling reports failed", getId().c_str());
}

void SerialFirmwareBoard::doDisconnect()
{
    readerRunning_ = false;
    if (reader_.joinable())
        reader_.join();
    if (worker_)
    {
        worker_->shutdown();
        worker_.reset();
    }
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    pinValues_.clear();
    pinKinds_.clear();
}

void SerialFirmwareBoard::readerLoop(int fd, uint64_t session)
{
    firmware::FrameDecoder decoder;
    firmware::Frame body;
    std::string lostReason;

    while (readerRunning_)
    {
        pollfd pfd{fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 100);
        if (pr < 0)
        {
            if (errno == EINTR)
                continue;
            lostReason = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (pr == 0)
            continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        {
            lostReason = "serial port closed";
            break;
        }

        uint8_t buf[128];
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n == 0)
        {
            lostReason = "serial port reached EOF";
            break;
        }
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
                continue;
            lostReason = std::string("read failed: ") + std::strerror(errno);
            break;
        }

        for (ssize_t i = 0; i < n; ++i)
        {
            firmware::DecodedReport report;
            if (!decoder.feed(buf[i], body) || !firmware::decodeReport(body, report))
                continue;
            postToScheduler([this, session, report]() {
                if (session == session_)
                    handleReport(report);
            });
        }
    }

    if (!lostReason.empty())
    {
        LF_WARN_WK("SerialFirmwareBoard %s: %s", getId().c_str(), lostReason.c_str());
        postToScheduler([this, session, lostReason]() {
            if (session == session_)
                handleConnectionLost(lostReason);
        });
    }
}

void SerialFirmwareBoard::handleReport(const firmware::DecodedReport& report)
{
    switch (report.id)
    {
        case firmware::DIGITAL_REPORT:
            pinValues_[report.pin] = report.value;
            notifyPinValue(report.pin, report.value != 0);
            break;
        case firmware::ANALOG_REPORT:
        {
            int pin = report.pin + firstAnalogPin();
            pinValues_[pin] = report.value;
            notifyPinValue(pin, report.value);
            break;
        }
        case firmware::FIRMWARE_REPORT:
            LF_INFO("SerialFirmwareBoard %s: firmware %d.%d", getId().c_str(), report.major, report.minor);
            break;
        default:
            break;
    }
}

void SerialFirmwareBoard::send(firmware::Frame frame, IoCallback done)
{
    if (!worker_ || fd_ < 0)
    {
        if (done)
            done(IoResult::failure("serial port is not open"));
        return;
    }

    int fd = fd_;
    uint64_t session = session_;
    runBlocking(*worker_, [fd, frame]() {
        if (!writeAll(fd, frame))
            return IoResult::failure(std::string("serial write failed: ") + std::strerror(errno));
        return IoResult::success();
    }, [this, session, done](const IoResult& result) {
        if (!result.ok && session == session_)
            handleConnectionLost(result.error);
        if (done)
            done(result);
    });
}

void SerialFirmwareBoard::doSetPinMode(int pin, PinMode mode, OperationKind kind, IoCallback done)
{
    pinKinds_[pin] = kind;
    switch (kind)
    {
        case OperationKind::digital:
            if (mode == PinMode::output)
                send(firmware::setPinMode(pin, firmware::MODE_OUTPUT, false), std::move(done));
            else if (mode == PinMode::inputPullup)
                send(firmware::setPinMode(pin, firmware::MODE_INPUT_PULLUP, true), std::move(done));
            else
                send(firmware::setPinMode(pin, firmware::MODE_INPUT, true), std::move(done));
            return;
        case OperationKind::analog:
            send(firmware::setPinMode(pin - firstAnalogPin(), firmware::MODE_ANALOG, true), std::move(done));
            return;
        case OperationKind::pwm:
            send(firmware::setPinMode(pin, firmware::MODE_OUTPUT, false), std::move(done));
            return;
        case OperationKind::servo:
            send(firmware::servoAttach(pin), std::move(done));
            return;
        default:
            break;
    }
    if (done)
        done(IoResult::failure(std::string("firmware has no mode for ") + toString(kind)));
}

void SerialFirmwareBoard::doWriteDigital(int pin, bool value, IoCallback done)
{
    pinValues_[pin] = value ? 1 : 0;
    send(firmware::digitalWrite(pin, value), std::move(done));
}

void SerialFirmwareBoard::doReadDigital(int pin, IoCallback done)
{
    auto it = pinValues_.find(pin);
    bool value = it != pinValues_.end() && it->second != 0;
    if (done)
        done(IoResult::success(value));
}

void SerialFirmwareBoard::doWriteAnalog(int pin, int value, IoCallback done)
{
    pinValues_[pin] = value;
    send(firmware::analogWrite(pin, value), std::move(done));
}

void SerialFirmwareBoard::doReadAnalog(int pin, IoCallback done)
{
    auto it = pinValues_.find(pin);
    int value = it == pinValues_.end() ? 0 : it->second;
    if (done)
        done(IoResult::success(value));
}

void SerialFirmwareBoard::doWriteServo(int pin, int angle, IoCallback done)
{
    pinValues_[pin] = angle;
    send(firmware::servoWrite(pin, angle), std::move(done));
}

void SerialFirmwareBoard::forceSafe(int pin, OperationKind kind)
{
    if (fd_ < 0)
        return;
    bool pwm = kind == OperationKind::pwm && capabilities_.supports(pin, OperationKind::pwm);
    firmware::Frame frame = pwm ? firmware::analogWrite(pin, 0) : firmware::digitalWrite(pin, false);
    if (!writeAll(fd_, frame))
        throw std::runtime_error(std::string("serial write failed: ") + std::strerror(errno));
    pinValues_[pin] = 0;
}

nlohmann::json SerialFirmwareBoard::toJson() const
{
    nlohmann::json json = Board::toJson();
    json["settings"]["board_type"] = variant_ == Variant::mega ? "mega" : "uno";
    json["settings"]["baud"] = baud_;
    return json;
}

} // namespace labflow
