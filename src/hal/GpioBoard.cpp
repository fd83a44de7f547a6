#include "hal/GpioBoard.h"
#include "core/Logger.h"
#include "core/WorkerExecutor.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <linux/gpio.h>
#include <poll.h>
#include <stdexcept>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <vector>

namespace labflow {

static constexpr const char* kPwmChip = "/sys/class/pwm/pwmchip0";
static constexpr long kPwmPeriodNs = 10000000;    // 100 Hz
static constexpr long kServoPeriodNs = 20000000;  // 50 Hz
static constexpr long kServoMinPulseNs = 500000;
static constexpr long kServoMaxPulseNs = 2500000;

static std::string errnoText(const std::string& what)
{
    return what + ": " + std::strerror(errno);
}

// GPIO12 and GPIO18 share PWM channel 0, GPIO13 and GPIO19 channel 1.
static int pwmChannel(int pin)
{
    return (pin == 13 || pin == 19) ? 1 : 0;
}

static bool writeSysfs(const std::string& path, const std::string& value)
{
    std::ofstream out(path);
    if (!out)
        return false;
    out << value;
    out.flush();
    return static_cast<bool>(out);
}

GpioBoard::GpioBoard(std::string id, std::string port, Scheduler& scheduler)
    : Board(std::move(id), port, scheduler)
    , chipPath_(port.empty() ? "/dev/gpiochip0" : port)
    , gate_([this] { wakeReader(); })
{
    using K = OperationKind;
    capabilities_.name = "Raspberry Pi";
    capabilities_.analogResolution = 0;
    capabilities_.pwmMax = 255;
    for (int pin = 2; pin <= 27; ++pin)
    {
        PinCapability cap;
        cap.kinds = {K::digital};
        cap.description = "GPIO" + std::to_string(pin);
        capabilities_.pins[pin] = cap;
    }
    for (int pin : {12, 13, 18, 19})
    {
        capabilities_.pins[pin].kinds.insert({K::pwm, K::servo});
        capabilities_.pins[pin].maxValue = 100;
        capabilities_.pins[pin].description += pwmChannel(pin) == 0 ? " (PWM0)" : " (PWM1)";
    }
    for (int pin : {2, 3})
        capabilities_.pins[pin].kinds.insert(K::i2c);
    capabilities_.pins[2].description += " (SDA)";
    capabilities_.pins[3].description += " (SCL)";
    for (int pin = 7; pin <= 11; ++pin)
        capabilities_.pins[pin].kinds.insert(K::spi);
}

GpioBoard::~GpioBoard()
{
    doDisconnect();
}

// ═══════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════

bool GpioBoard::doConnect(std::string& error)
{
    doDisconnect();

    int fd = ::open(chipPath_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0)
    {
        error = errnoText("cannot open " + chipPath_);
        return false;
    }

    gpiochip_info info{};
    if (::ioctl(fd, GPIO_GET_CHIPINFO_IOCTL, &info) < 0)
    {
        error = errnoText("chip info query failed on " + chipPath_);
        ::close(fd);
        return false;
    }
    LF_DEBUG("GpioBoard %s: %s (%s), %u lines", getId().c_str(), info.name, info.label, info.lines);

    int wake = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wake < 0)
    {
        error = errnoText("cannot create reader wake-up for " + chipPath_);
        ::close(fd);
        return false;
    }

    chipFd_ = fd;
    wakeFd_ = wake;
    worker_ = std::make_unique<WorkerExecutor>("gpio:" + getId());
    {
        std::lock_guard<std::mutex> lock(linesMutex_);
        gate_.reset();
    }
    reader_ = std::thread(&GpioBoard::readerLoop, this);
    return true;
}

void GpioBoard::doDisconnect()
{
    {
        std::lock_guard<std::mutex> lock(linesMutex_);
        gate_.stop();
    }
    wakeReader();
    if (reader_.joinable())
        reader_.join();
    if (worker_)
    {
        worker_->shutdown();
        worker_.reset();
    }

    {
        std::lock_guard<std::mutex> lock(linesMutex_);
        for (auto& entry : lines_)
            if (entry.second.fd >= 0)
                ::close(entry.second.fd);
        lines_.clear();
    }

    for (const auto& entry : pwmPeriods_)
    {
        std::string channel = std::string(kPwmChip) + "/pwm" + std::to_string(pwmChannel(entry.first));
        writeSysfs(channel + "/enable", "0");
        writeSysfs(std::string(kPwmChip) + "/unexport", std::to_string(pwmChannel(entry.first)));
    }
    pwmPeriods_.clear();

    if (chipFd_ >= 0)
    {
        ::close(chipFd_);
        chipFd_ = -1;
    }
    if (wakeFd_ >= 0)
    {
        ::close(wakeFd_);
        wakeFd_ = -1;
    }
}

// ═══════════════════════════════════════════════════════════════════
// Worker-thread helpers
// ═══════════════════════════════════════════════════════════════════

void GpioBoard::wakeReader()
{
    if (wakeFd_ < 0)
        return;
    uint64_t one = 1;
    if (::write(wakeFd_, &one, sizeof(one)) < 0 && errno != EAGAIN)
        LF_WARN("GpioBoard %s: reader wake-up failed: %s", getId().c_str(), std::strerror(errno));
}

void GpioBoard::releaseLine(int pin)
{
    std::unique_lock<std::mutex> lock(linesMutex_);
    auto it = lines_.find(pin);
    if (it == lines_.end())
        return;

    gate_.waitForReader(lock);
    it = lines_.find(pin);
    if (it != lines_.end())
    {
        if (it->second.fd >= 0)
            ::close(it->second.fd);
        lines_.erase(it);
    }
    gate_.closed();
}

std::string GpioBoard::requestLine(int pin, PinMode mode)
{
    releaseLine(pin);

    gpio_v2_line_request request{};
    request.offsets[0] = static_cast<__u32>(pin);
    request.num_lines = 1;
    std::strncpy(request.consumer, "labflow", sizeof(request.consumer) - 1);

    bool input = mode != PinMode::output;
    if (input)
    {
        request.config.flags = GPIO_V2_LINE_FLAG_INPUT | GPIO_V2_LINE_FLAG_EDGE_RISING |
                               GPIO_V2_LINE_FLAG_EDGE_FALLING;
        if (mode == PinMode::inputPullup)
            request.config.flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_UP;
        else if (mode == PinMode::inputPulldown)
            request.config.flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_DOWN;
    }
    else
    {
        request.config.flags = GPIO_V2_LINE_FLAG_OUTPUT;
    }

    if (::ioctl(chipFd_, GPIO_V2_GET_LINE_IOCTL, &request) < 0)
        return errnoText("line request for GPIO" + std::to_string(pin) + " failed");

    {
        std::lock_guard<std::mutex> lock(linesMutex_);
        lines_[pin] = {request.fd, input};
    }
    if (input)
        wakeReader();
    return {};
}

// The ioctl runs under the lines lock so the line cannot be closed under it.
std::string GpioBoard::setLineValue(int pin, bool value)
{
    std::lock_guard<std::mutex> lock(linesMutex_);
    int fd = -1;
    auto it = lines_.find(pin);
    if (it != lines_.end() && !it->second.input)
        fd = it->second.fd;
    if (fd < 0)
        return "GPIO" + std::to_string(pin) + " is not configured as an output";

    gpio_v2_line_values values{};
    values.mask = 1;
    values.bits = value ? 1 : 0;
    if (::ioctl(fd, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) < 0)
        return errnoText("write to GPIO" + std::to_string(pin) + " failed");
    return {};
}

std::string GpioBoard::getLineValue(int pin, bool& value)
{
    std::lock_guard<std::mutex> lock(linesMutex_);
    int fd = -1;
    auto it = lines_.find(pin);
    if (it != lines_.end())
        fd = it->second.fd;
    if (fd < 0)
        return "GPIO" + std::to_string(pin) + " is not configured";

    gpio_v2_line_values values{};
    values.mask = 1;
    if (::ioctl(fd, GPIO_V2_LINE_GET_VALUES_IOCTL, &values) < 0)
        return errnoText("read from GPIO" + std::to_string(pin) + " failed");
    value = (values.bits & 1) != 0;
    return {};
}

std::string GpioBoard::setupPwm(int pin, long periodNs)
{
    releaseLine(pin);
    std::string channel = std::to_string(pwmChannel(pin));
    std::string base = std::string(kPwmChip) + "/pwm" + channel;

    if (::access(base.c_str(), F_OK) != 0 &&
        !writeSysfs(std::string(kPwmChip) + "/export", channel))
        return "cannot export PWM channel " + channel + " for GPIO" + std::to_string(pin);

    writeSysfs(base + "/enable", "0");
    if (!writeSysfs(base + "/duty_cycle", "0") ||
        !writeSysfs(base + "/period", std::to_string(periodNs)) ||
        !writeSysfs(base + "/enable", "1"))
        return "cannot configure PWM channel " + channel;
    return {};
}

std::string GpioBoard::setPwmDuty(int pin, long dutyNs)
{
    std::string base = std::string(kPwmChip) + "/pwm" + std::to_string(pwmChannel(pin));
    if (!writeSysfs(base + "/duty_cycle", std::to_string(dutyNs)))
        return "cannot set duty cycle on GPIO" + std::to_string(pin);
    return {};
}

// ═══════════════════════════════════════════════════════════════════
// Pin I/O
// ═══════════════════════════════════════════════════════════════════

void GpioBoard::doSetPinMode(int pin, PinMode mode, OperationKind kind, IoCallback done)
{
    if (!worker_)
    {
        if (done)
            done(IoResult::failure("GPIO chip is not open"));
        return;
    }

    long period = 0;
    if (kind == OperationKind::pwm)
        period = kPwmPeriodNs;
    else if (kind == OperationKind::servo)
        period = kServoPeriodNs;

    if (period > 0)
        pwmPeriods_[pin] = period;
    else
        pwmPeriods_.erase(pin);

    runBlocking(*worker_, [this, pin, mode, period]() {
        std::string error = period > 0 ? setupPwm(pin, period) : requestLine(pin, mode);
        return error.empty() ? IoResult::success() : IoResult::failure(error);
    }, std::move(done));
}

void GpioBoard::doWriteDigital(int pin, bool value, IoCallback done)
{
    if (!worker_)
    {
        if (done)
            done(IoResult::failure("GPIO chip is not open"));
        return;
    }
    runBlocking(*worker_, [this, pin, value]() {
        std::string error = setLineValue(pin, value);
        return error.empty() ? IoResult::success() : IoResult::failure(error);
    }, std::move(done));
}

void GpioBoard::doReadDigital(int pin, IoCallback done)
{
    if (!worker_)
    {
        if (done)
            done(IoResult::failure("GPIO chip is not open"));
        return;
    }
    runBlocking(*worker_, [this, pin]() {
        bool value = false;
        std::string error = getLineValue(pin, value);
        return error.empty() ? IoResult::success(value) : IoResult::failure(error);
    }, std::move(done));
}

void GpioBoard::doWriteAnalog(int pin, int value, IoCallback done)
{
    if (!worker_)
    {
        if (done)
            done(IoResult::failure("GPIO chip is not open"));
        return;
    }
    long dutyNs = kPwmPeriodNs * value / capabilities_.pwmMax;
    runBlocking(*worker_, [this, pin, dutyNs]() {
        std::string error = setPwmDuty(pin, dutyNs);
        return error.empty() ? IoResult::success() : IoResult::failure(error);
    }, std::move(done));
}

void GpioBoard::doReadAnalog(int pin, IoCallback done)
{
    if (done)
        done(IoResult::failure("Raspberry Pi has no ADC (GPIO" + std::to_string(pin) + ")"));
}

void GpioBoard::doWriteServo(int pin, int angle, IoCallback done)
{
    if (!worker_)
    {
        if (done)
            done(IoResult::failure("GPIO chip is not open"));
        return;
    }
    long pulseNs = kServoMinPulseNs + (kServoMaxPulseNs - kServoMinPulseNs) * angle / 180;
    runBlocking(*worker_, [this, pin, pulseNs]() {
        std::string error = setPwmDuty(pin, pulseNs);
        return error.empty() ? IoResult::success() : IoResult::failure(error);
    }, std::move(done));
}

void GpioBoard::forceSafe(int pin, OperationKind kind)
{
    std::string error;
    if (kind == OperationKind::pwm || kind == OperationKind::servo)
        error = setPwmDuty(pin, 0);
    else
        error = setLineValue(pin, false);
    if (!error.empty())
        throw std::runtime_error(error);
}

// ═══════════════════════════════════════════════════════════════════
// Edge events
// ═══════════════════════════════════════════════════════════════════

void GpioBoard::readerLoop()
{
    std::unique_lock<std::mutex> lock(linesMutex_);
    while (gate_.enterPoll(lock))
    {
        // Slot 0 is the wake-up eventfd.
        std::vector<pollfd> fds{{wakeFd_, POLLIN, 0}};
        std::vector<int> pins{-1};
        for (const auto& entry : lines_)
        {
            if (!entry.second.input)
                continue;
            fds.push_back({entry.second.fd, POLLIN, 0});
            pins.push_back(entry.first);
        }

        lock.unlock();

        int pr = ::poll(fds.data(), fds.size(), 100);
        if (pr > 0)
        {
            if (fds[0].revents & POLLIN)
            {
                uint64_t count = 0;
                if (::read(wakeFd_, &count, sizeof(count)) < 0 && errno != EAGAIN)
                    LF_DEBUG_WK("GpioBoard %s: wake-up read failed", getId().c_str());
            }
            for (size_t i = 1; i < fds.size(); ++i)
            {
                if (!(fds[i].revents & POLLIN))
                    continue;
                gpio_v2_line_event event{};
                ssize_t n = ::read(fds[i].fd, &event, sizeof(event));
                if (n != static_cast<ssize_t>(sizeof(event)))
                {
                    LF_DEBUG_WK("GpioBoard %s: short event read on GPIO%d", getId().c_str(), pins[i]);
                    continue;
                }
                int pin = pins[i];
                bool high = event.id == GPIO_V2_LINE_EVENT_RISING_EDGE;
                postToScheduler([this, pin, high]() { notifyPinValue(pin, high); });
            }
        }

        lock.lock();
        gate_.leavePoll();
    }
}

} // namespace labflow
