#include "engine/NodeRegistry.h"
#include "core/Logger.h"

namespace labflow {

bool NodeRegistry::registerType(const NodeDefinition& definition, Factory factory)
{
    if (!factory || !isValid(definition))
    {
        LF_WARN("NodeRegistry: rejected definition '%s'", definition.typeName.c_str());
        return false;
    }
    entries_[definition.typeName] = Entry{definition, std::move(factory)};
    return true;
}

const NodeDefinition* NodeRegistry::find(const std::string& type) const
{
    auto it = entries_.find(type);
    return it == entries_.end() ? nullptr : &it->second.definition;
}

std::vector<std::string> NodeRegistry::typeNames() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_)
        names.push_back(entry.first);
    return names;
}

std::unique_ptr<Node> NodeRegistry::create(const std::string& type, const std::string& id) const
{
    auto it = entries_.find(type);
    if (it == entries_.end())
        return nullptr;
    return it->second.factory(id);
}

} // namespace labflow
