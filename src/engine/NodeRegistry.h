#pragma once

#include "engine/Node.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace labflow {

/// Node type name -> definition and factory. Each FlowEngine owns one, so
/// engines never share registrations.
class NodeRegistry {
public:
    using Factory = std::function<std::unique_ptr<Node>(const std::string& id)>;

    // Rejects invalid definitions. Replaces an existing registration.
    bool registerType(const NodeDefinition& definition, Factory factory);

    // T provides `static NodeDefinition describe()` and a constructor taking the id.
    template <typename T>
    bool add()
    {
        return registerType(T::describe(), [](const std::string& id) {
            return std::make_unique<T>(id);
        });
    }

    bool hasType(const std::string& type) const { return entries_.count(type) > 0; }
    const NodeDefinition* find(const std::string& type) const;
    std::vector<std::string> typeNames() const;
    int size() const { return static_cast<int>(entries_.size()); }

    // Returns nullptr for an unknown type.
    std::unique_ptr<Node> create(const std::string& type, const std::string& id) const;

private:
    struct Entry {
        NodeDefinition definition;
        Factory factory;
    };
    std::map<std::string, Entry> entries_;
};

} // namespace labflow
