#include "engine/Port.h"

#include <set>

namespace labflow {

const char* toString(PortKind kind)
{
    return kind == PortKind::exec ? "exec" : "data";
}

const char* toString(NodeCategory category)
{
    switch (category)
    {
        case NodeCategory::hardware:  return "hardware";
        case NodeCategory::logic:     return "logic";
        case NodeCategory::interface: return "interface";
    }
    return "logic";
}

bool parsePortKind(const std::string& text, PortKind& kind)
{
    if (text == "data")
        kind = PortKind::data;
    else if (text == "exec")
        kind = PortKind::exec;
    else
        return false;
    return true;
}

PortDefinition dataPort(std::string name, std::string valueType, Value defaultValue,
                        std::string description)
{
    PortDefinition port;
    port.name = std::move(name);
    port.kind = PortKind::data;
    port.valueType = std::move(valueType);
    port.defaultValue = std::move(defaultValue);
    port.description = std::move(description);
    return port;
}

PortDefinition execPort(std::string name, std::string description)
{
    PortDefinition port;
    port.name = std::move(name);
    port.kind = PortKind::exec;
    port.valueType = "exec";
    port.description = std::move(description);
    return port;
}

static int findPort(const std::vector<PortDefinition>& ports, const std::string& name)
{
    for (size_t i = 0; i < ports.size(); ++i)
        if (ports[i].name == name)
            return static_cast<int>(i);
    return -1;
}

int NodeDefinition::findInput(const std::string& name) const
{
    return findPort(inputs, name);
}

int NodeDefinition::findOutput(const std::string& name) const
{
    return findPort(outputs, name);
}

bool isValid(const PortDefinition& port)
{
    if (port.name.empty())
        return false;
    if (port.kind == PortKind::exec && !port.defaultValue.is_null())
        return false;
    return true;
}

bool isValid(const NodeDefinition& definition)
{
    if (definition.typeName.empty())
        return false;
    std::set<std::string> names;
    for (const auto& port : definition.inputs)
        if (!isValid(port) || !names.insert(port.name).second)
            return false;
    names.clear();
    for (const auto& port : definition.outputs)
        if (!isValid(port) || !names.insert(port.name).second)
            return false;
    return true;
}

static bool isNumeric(const std::string& type)
{
    return type == "number" || type == "int" || type == "float" || type == "bool";
}

bool canConnect(const PortDefinition& src, const PortDefinition& dst)
{
    if (src.kind != dst.kind)
        return false;
    if (src.kind == PortKind::exec)
        return true;
    if (src.valueType == "any" || dst.valueType == "any" || src.valueType == dst.valueType)
        return true;
    // Numbers and booleans convert into each other; strings only go to strings.
    return isNumeric(src.valueType) && isNumeric(dst.valueType);
}

} // namespace labflow
