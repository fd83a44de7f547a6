#include "nodes/BuiltinNodes.h"
#include "nodes/ControlNodes.h"
#include "nodes/ExperimentNodes.h"
#include "nodes/FunctionNodes.h"
#include "nodes/HardwareNodes.h"
#include "nodes/InterfaceNodes.h"
#include "nodes/LogicNodes.h"

namespace labflow {

void registerBuiltinNodes(NodeRegistry& registry)
{
    // Experiment flow
    registry.add<StartExperimentNode>();
    registry.add<EndExperimentNode>();
    registry.add<DelayNode>();
    registry.add<LoopNode>();

    // Hardware
    registry.add<WaitForInputNode>();
    registry.add<OutputNode>();
    registry.add<InputNode>();
    registry.add<MotorGovernorNode>();
    registry.add<DeviceActionNode>();
    registry.add<DeviceReadNode>();
    registry.add<DigitalWriteNode>();
    registry.add<DigitalReadNode>();
    registry.add<AnalogReadNode>();
    registry.add<PWMWriteNode>();

    // Functions
    registry.add<StartFunctionNode>();
    registry.add<EndFunctionNode>();
    registry.add<FunctionCallNode>();

    // Logic
    registry.add<AddNode>();
    registry.add<SubtractNode>();
    registry.add<MultiplyNode>();
    registry.add<DivideNode>();
    registry.add<MapRangeNode>();
    registry.add<ClampNode>();
    registry.add<ThresholdNode>();
    registry.add<InRangeNode>();
    registry.add<PIDNode>();

    // Control
    registry.add<ToggleNode>();
    registry.add<SequenceNode>();
    registry.add<TimerNode>();

    // Dashboard
    registry.add<LabelNode>();
    registry.add<GaugeNode>();
    registry.add<ChartNode>();
    registry.add<LedIndicatorNode>();
    registry.add<ButtonNode>();
    registry.add<ToggleSwitchNode>();
    registry.add<SliderNode>();
}

} // namespace labflow
