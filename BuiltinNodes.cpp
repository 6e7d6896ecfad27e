// BuiltinNodes.cpp
#include "BuiltinNodes.hpp"
#include "FlowSerializer.hpp"
#include "Log.hpp"

namespace GraphFlow {

namespace {

// Folds the numeric inputs of a node; strings and empty inputs are skipped
template <typename Op>
Value foldNumericInputs(Node& node, double identity, Op op) {
    bool allInts = true;
    bool any = false;
    double acc = identity;
    for (size_t i = 0; i < node.numInputs(); ++i) {
        Value v = node.input(static_cast<int>(i));
        auto d = valueAsDouble(v);
        if (!d) continue;
        any = true;
        if (!std::holds_alternative<int>(v) && !std::holds_alternative<bool>(v)) allInts = false;
        acc = op(acc, *d);
    }
    if (!any) return std::monostate{};
    if (allInts) return static_cast<int>(acc);
    return acc;
}

} // namespace

// -- ValueNode --

ValueNode::ValueNode(Flow& flow, std::string title) : Node(flow, std::move(title)) {
    createOutput({"value"});
}

void ValueNode::updateEvent(int /*inp*/) {
    setOutput(0, value);
}

nlohmann::json ValueNode::getState() const {
    return {{"value", valueToJson(value)}};
}

void ValueNode::setState(const nlohmann::json& state) {
    if (state.contains("value")) value = valueFromJson(state["value"]);
}

void ValueNode::setValue(Value v) {
    value = std::move(v);
    update();
}

// -- AddNode --

AddNode::AddNode(Flow& flow, std::string title) : Node(flow, std::move(title)) {
    createInput({"a", PortKind::Data, "", 0});
    createInput({"b", PortKind::Data, "", 0});
    createOutput({"sum", PortKind::Data, "number"});
}

void AddNode::updateEvent(int /*inp*/) {
    setOutput(0, foldNumericInputs(*this, 0.0, [](double a, double b) { return a + b; }));
}

// -- MultiplyNode --

MultiplyNode::MultiplyNode(Flow& flow, std::string title) : Node(flow, std::move(title)) {
    createInput({"a", PortKind::Data, "", 1});
    createInput({"b", PortKind::Data, "", 1});
    createOutput({"product", PortKind::Data, "number"});
}

void MultiplyNode::updateEvent(int /*inp*/) {
    setOutput(0, foldNumericInputs(*this, 1.0, [](double a, double b) { return a * b; }));
}

// -- ProbeNode --

ProbeNode::ProbeNode(Flow& flow, std::string title) : Node(flow, std::move(title)) {
    createInput({"in"});
}

void ProbeNode::updateEvent(int inp) {
    lastValue = input(inp < 0 ? 0 : inp);
    ++count;
    logInfo("probe '{}' <- {}", getTitle(), valueToString(lastValue));
}

// -- TickerNode --

TickerNode::TickerNode(Flow& flow, std::string title) : FrameNode(flow, std::move(title)) {
    createOutput({"tick", PortKind::Data, "int"});
}

bool TickerNode::frameUpdateEvent() {
    ++ticks;
    setOutput(0, ticks);
    if (frames > 0 && ticks >= frames) finish();
    return true;
}

nlohmann::json TickerNode::getState() const {
    return {{"frames", frames}};
}

void TickerNode::setState(const nlohmann::json& state) {
    frames = state.value("frames", 0);
}

void registerBuiltinNodes(NodeRegistry& registry) {
    registry.registerNode<ValueNode>("Value");
    registry.registerNode<AddNode>("Add");
    registry.registerNode<MultiplyNode>("Multiply");
    registry.registerNode<ProbeNode>("Probe");
    registry.registerNode<TickerNode>("Ticker");
}

} // namespace GraphFlow
