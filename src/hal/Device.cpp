#include "hal/Device.h"
#include "core/Logger.h"

#include <algorithm>
#include <memory>

namespace labflow {

Device::Device(std::string id, std::string name, Board& board, DeviceConfig config)
    : board_(board)
    , config_(std::move(config))
    , tasks_(&board.getScheduler())
    , id_(std::move(id))
    , name_(std::move(name))
{
    if (!config_.settings.is_object())
        config_.settings = Value::object();
}

Device::~Device() = default;

bool Device::hasAction(const std::string& name) const
{
    auto names = actions();
    return std::find(names.begin(), names.end(), name) != names.end();
}

int Device::pin(const std::string& role) const
{
    auto it = config_.pins.find(role);
    return it == config_.pins.end() ? -1 : it->second;
}

bool Device::validateConfig(std::string& error) const
{
    for (const auto& role : requiredPins())
    {
        int p = pin(role);
        if (p < 0)
        {
            error = "Missing required pin: " + role;
            return false;
        }
        if (!board_.validateOperation(p, pinKind(role), error))
            return false;
    }
    return true;
}

void Device::initialize(IoCallback done)
{
    std::string error;
    if (!validateConfig(error))
    {
        LF_WARN("Device %s: invalid configuration: %s", id_.c_str(), error.c_str());
        if (done)
            done(IoResult::failure(error));
        return;
    }

    doInitialize(guard([this, done](const IoResult& result) {
        if (result.ok)
        {
            initialized_ = true;
            LF_DEBUG("Device %s (%s) initialized", id_.c_str(), getType().c_str());
        }
        else
        {
            LF_WARN("Device %s: initialization failed: %s", id_.c_str(), result.error.c_str());
        }
        if (done)
            done(result);
    }));
}

void Device::shutdown(IoCallback done)
{
    tasks_.cancelAll();
    if (!initialized_ || !board_.isConnected())
    {
        initialized_ = false;
        if (done)
            done(IoResult::success());
        return;
    }

    doShutdown(guard([this, done](const IoResult& result) {
        initialized_ = false;
        if (!result.ok)
            LF_WARN("Device %s: shutdown failed: %s", id_.c_str(), result.error.c_str());
        if (done)
            done(result);
    }));
}

void Device::doShutdown(IoCallback done)
{
    done(IoResult::success());
}

void Device::executeAction(const std::string& name, const Value& argument, IoCallback done)
{
    std::string error;
    if (!enabled_)
        error = "Device " + name_ + " is disabled";
    else if (!initialized_)
        error = "Device " + name_ + " is not initialized";
    else if (!hasAction(name))
        error = "Unknown action: " + name;

    if (!error.empty())
    {
        if (done)
            done(IoResult::failure(error));
        return;
    }

    LF_TRACE("Device %s: %s(%s)", id_.c_str(), name.c_str(), toDisplayString(argument).c_str());
    IoCallback callback = done ? guard(done) : IoCallback([](const IoResult&) {});
    try
    {
        doAction(name, argument, callback);
    }
    catch (const std::exception& e)
    {
        if (done)
            done(IoResult::failure(e.what()));
    }
}

uint32_t Device::addChangeObserver(ChangeCallback callback)
{
    return changeObservers_.add(std::move(callback));
}

bool Device::removeChangeObserver(uint32_t id)
{
    return changeObservers_.remove(id);
}

void Device::runSteps(std::vector<Step> steps, IoCallback done)
{
    auto shared = std::make_shared<std::vector<Step>>(std::move(steps));
    auto next = std::make_shared<std::function<void(size_t, IoResult)>>();
    std::weak_ptr<std::function<void(size_t, IoResult)>> weakNext = next;

    *next = [shared, weakNext, done](size_t index, IoResult last) {
        if (!last.ok || index >= shared->size())
        {
            if (done)
                done(last);
            return;
        }
        auto self = weakNext.lock();
        (*shared)[index]([self, index](const IoResult& result) {
            (*self)(index + 1, result);
        });
    };
    (*next)(0, IoResult::success());
}

IoCallback Device::guard(IoCallback callback)
{
    if (!callback)
        return callback;
    return tasks_.wrap(std::move(callback));
}

nlohmann::json Device::toJson() const
{
    nlohmann::json pins = nlohmann::json::object();
    for (const auto& entry : config_.pins)
        pins[entry.first] = entry.second;

    nlohmann::json json = {
        {"id", id_},
        {"type", getType()},
        {"board_id", board_.getId()},
        {"name", name_},
        {"pins", pins},
        {"settings", config_.settings},
    };
    if (config_.pins.size() == 1)
        json["pin"] = config_.pins.begin()->second;
    if (!enabled_)
        json["enabled"] = false;
    return json;
}

} // namespace labflow
