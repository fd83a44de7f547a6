#pragma once

#include "engine/NodeRegistry.h"

namespace labflow {

// Registers every node type shipped with labflow.
void registerBuiltinNodes(NodeRegistry& registry);

} // namespace labflow
