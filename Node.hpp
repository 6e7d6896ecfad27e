// Node.hpp
//
// Node is the computational vertex of a flow. Implementations derive from it
// and provide updateEvent(); every other hook is an optional no-op. A node is
// created against a flow (it can reach its flow from the constructor, e.g. to
// declare its static ports), may be removed from and re-added to that flow
// any number of times, and is destroyed together with the flow.
//
// All algorithm-related calls (update, input, setOutput, execOutput) are
// handed to the flow's current executor, which decides propagation.
#pragma once
#include "FlowTypes.hpp"
#include "Event.hpp"
#include "Port.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <vector>
#include <string>

namespace GraphFlow {

class Flow;

class Node {
public:
    explicit Node(Flow& flow, std::string title = {});
    virtual ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // -- Hooks (override in node implementations) --

    // Called when an input received data (inp = its index), when the node
    // is updated directly (inp = -1), or in exec mode when a successor pulls
    // data from this node (inp = -1).
    virtual void updateEvent(int inp) = 0;
    // Every time the node is placed in its flow (also after undo/redo)
    virtual void placeEvent() {}
    // Every time the node is removed from its flow
    virtual void removeEvent() {}
    // Player hooks
    virtual void init() {}
    virtual void pause() {}
    virtual void stop() {}
    // After a load, once all connections of the loaded set exist
    virtual void rebuilt() {}

    // Frame-driven nodes are ticked by a player once per frame
    virtual bool isFrameDriven() const { return false; }
    // Returns true when the frame produced new output
    virtual bool frameUpdateEvent() { return false; }

    // Custom state for save/load
    virtual nlohmann::json getState() const { return nlohmann::json::object(); }
    virtual void setState(const nlohmann::json& /*state*/) {}

    // -- Algorithm --

    void update(int inp = -1);
    Value input(int index);
    void setOutput(int index, Value value);
    void execOutput(int index);
    // Runs frameUpdateEvent() guarded like an executor invocation
    bool frameUpdate();

    bool isFinished() const { return finished.load(); }
    void clearFinished() { finished.store(false); }

    // -- Ports --

    Port& createInput(const PortConfig& config = {}, std::optional<size_t> insert = std::nullopt);
    Port& createOutput(const PortConfig& config = {}, std::optional<size_t> insert = std::nullopt);
    // Disconnects and removes a port
    void deleteInput(size_t index);
    void deleteOutput(size_t index);
    void renameInput(size_t index, const std::string& label);
    void renameOutput(size_t index, const std::string& label);

    size_t numInputs() const { return inputs.size(); }
    size_t numOutputs() const { return outputs.size(); }
    Port& getInput(size_t index) const;
    Port& getOutput(size_t index) const;
    const std::vector<std::unique_ptr<Port>>& getInputs() const { return inputs; }
    const std::vector<std::unique_ptr<Port>>& getOutputs() const { return outputs; }
    int inputIndex(const Port& port) const;
    int outputIndex(const Port& port) const;

    bool inputConnected(size_t index) const;
    bool outputConnected(size_t index) const;
    bool anyInputConnected() const;
    bool anyOutputConnected() const;

    // -- Identity --

    Flow& getFlow() const { return *flow; }
    GlobalId getGlobalId() const { return globalId; }
    std::optional<GlobalId> getPrevGlobalId() const { return prevGlobalId; }
    void setPrevGlobalId(GlobalId id) { prevGlobalId = id; }
    const std::string& getTitle() const { return title; }
    void setTitle(std::string t) { title = std::move(t); }

    // Called by executors when updateEvent threw
    void reportUpdateError(const std::exception& e);

    // While set, update() is ignored
    bool blockUpdates = false;

    Event<int> updating;
    Event<int> updated;
    Event<const std::string&> updateError;
    Event<Node&, int, Port&> inputAdded;
    Event<Node&, int, Port&> inputRemoved;
    Event<Node&, int, Port&> outputAdded;
    Event<Node&, int, Port&> outputRemoved;
    Event<Node&, int, const Value&> outputUpdated;

protected:
    // Marks a frame-driven node as done; the player stops ticking it
    void finish() { finished.store(true); }

private:
    friend class Flow;

    Port& createPort(PortDirection dir, const PortConfig& config, std::optional<size_t> insert);
    void deletePort(PortDirection dir, size_t index);

    Flow* flow;
    std::string title;
    GlobalId globalId;
    std::optional<GlobalId> prevGlobalId;
    std::vector<std::unique_ptr<Port>> inputs;
    std::vector<std::unique_ptr<Port>> outputs;
    std::atomic<bool> finished{false};
};

// Convenience base for frame-driven nodes
class FrameNode : public Node {
public:
    using Node::Node;
    bool isFrameDriven() const override { return true; }
    void updateEvent(int /*inp*/) override {}
    bool frameUpdateEvent() override = 0;
};

} // namespace GraphFlow
