#include "hal/DeviceRegistry.h"
#include "hal/Devices.h"

namespace labflow {

void DeviceRegistry::registerType(const std::string& type, Factory factory)
{
    factories_[type] = std::move(factory);
}

bool DeviceRegistry::hasType(const std::string& type) const
{
    return factories_.count(type) > 0;
}

std::vector<std::string> DeviceRegistry::typeNames() const
{
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& entry : factories_)
        names.push_back(entry.first);
    return names;
}

std::unique_ptr<Device> DeviceRegistry::create(const std::string& type, const std::string& id,
                                               const std::string& name, Board& board,
                                               DeviceConfig config) const
{
    auto it = factories_.find(type);
    if (it == factories_.end())
        return nullptr;
    return it->second(id, name, board, std::move(config));
}

template <typename T>
static DeviceRegistry::Factory factoryFor()
{
    return [](const std::string& id, const std::string& name, Board& board, DeviceConfig config) {
        return std::make_unique<T>(id, name, board, std::move(config));
    };
}

void registerBuiltinDevices(DeviceRegistry& registry)
{
    registry.registerType("DigitalOutput", factoryFor<DigitalOutputDevice>());
    registry.registerType("DigitalInput", factoryFor<DigitalInputDevice>());
    registry.registerType("AnalogInput", factoryFor<AnalogInputDevice>());
    registry.registerType("PWMOutput", factoryFor<PWMOutputDevice>());
    registry.registerType("Servo", factoryFor<ServoDevice>());
    registry.registerType("MotorGovernor", factoryFor<MotorGovernorDevice>());
}

} // namespace labflow
