#pragma once

#include "core/Value.h"

#include <string>
#include <vector>

namespace labflow {

enum class PortKind { data, exec };
enum class NodeCategory { hardware, logic, interface };

const char* toString(PortKind kind);
const char* toString(NodeCategory category);
bool parsePortKind(const std::string& text, PortKind& kind);

struct PortDefinition {
    std::string name;
    PortKind kind = PortKind::data;
    std::string valueType = "any";   // "any", "number", "int", "float", "bool", "string"
    Value defaultValue;              // null means unset
    std::string description;
};

PortDefinition dataPort(std::string name, std::string valueType = "any",
                        Value defaultValue = nullptr, std::string description = {});
PortDefinition execPort(std::string name, std::string description = {});

struct NodeDefinition {
    std::string typeName;
    NodeCategory category = NodeCategory::logic;
    std::string description;
    std::vector<PortDefinition> inputs;
    std::vector<PortDefinition> outputs;

    // -1 if there is no port with that name
    int findInput(const std::string& name) const;
    int findOutput(const std::string& name) const;
};

bool isValid(const PortDefinition& port);
bool isValid(const NodeDefinition& definition);

// Same kind, and for data ports compatible value types.
bool canConnect(const PortDefinition& src, const PortDefinition& dst);

} // namespace labflow
