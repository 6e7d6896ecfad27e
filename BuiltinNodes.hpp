// BuiltinNodes.hpp
//
// Small general-purpose nodes shipped with the engine and used by the CLI
// host: constants, arithmetic, a probe sink and a frame ticker.
#pragma once
#include "Node.hpp"
#include "NodeRegistry.hpp"

namespace GraphFlow {

// Outputs its stored value whenever it is updated
class ValueNode : public Node {
public:
    explicit ValueNode(Flow& flow, std::string title = "Value");

    void updateEvent(int inp) override;
    nlohmann::json getState() const override;
    void setState(const nlohmann::json& state) override;

    const Value& getValue() const { return value; }
    // Stores the value and updates the node
    void setValue(Value v);

private:
    Value value{0};
};

// Sums every numeric input. The result is an int if all summands are ints.
class AddNode : public Node {
public:
    explicit AddNode(Flow& flow, std::string title = "Add");
    void updateEvent(int inp) override;
};

class MultiplyNode : public Node {
public:
    explicit MultiplyNode(Flow& flow, std::string title = "Multiply");
    void updateEvent(int inp) override;
};

// Sink that logs and remembers what reached it
class ProbeNode : public Node {
public:
    explicit ProbeNode(Flow& flow, std::string title = "Probe");

    void updateEvent(int inp) override;
    void init() override { count = 0; }

    const Value& getLastValue() const { return lastValue; }
    int getCount() const { return count; }

private:
    Value lastValue;
    int count = 0;
};

// Emits its tick count once per frame; finishes after `frames` ticks
// (never when frames is 0)
class TickerNode : public FrameNode {
public:
    explicit TickerNode(Flow& flow, std::string title = "Ticker");

    bool frameUpdateEvent() override;
    void init() override { ticks = 0; }
    nlohmann::json getState() const override;
    void setState(const nlohmann::json& state) override;

    void setFrames(int f) { frames = f; }
    int getFrames() const { return frames; }
    int getTicks() const { return ticks; }

private:
    int frames = 0;
    int ticks = 0;
};

// Registers Value, Add, Multiply, Probe and Ticker
void registerBuiltinNodes(NodeRegistry& registry);

} // namespace GraphFlow
