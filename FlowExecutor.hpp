// FlowExecutor.hpp
//
// Executors mediate every node/port interaction of a flow and decide the
// propagation semantics:
//   ManualFlow         no propagation; records what was updated (player substrate)
//   DataFlowNaive      eager depth-first push on every setOutput
//   DataFlowOptimized  push with at most one activation per connection per execution
//   ExecFlowNaive      exec connections trigger, data is pulled on input()
// All of them guard node callbacks: an exception thrown by updateEvent is
// reported through the node's error hook and does not abort the pass.
#pragma once
#include "FlowTypes.hpp"
#include "Event.hpp"
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <deque>

namespace GraphFlow {

class Flow;
class Node;
struct Port;

class FlowExecutor {
public:
    explicit FlowExecutor(Flow& flow) : flow(&flow) {}
    virtual ~FlowExecutor() = default;

    FlowExecutor(const FlowExecutor&) = delete;
    FlowExecutor& operator=(const FlowExecutor&) = delete;

    virtual FlowAlg algorithm() const = 0;

    // Invokes the node's updateEvent (with whatever propagation follows)
    virtual void updateNode(Node& node, int inp) = 0;
    // Value present at a data input
    virtual Value input(Node& node, int index) = 0;
    virtual void setOutput(Node& node, int index, Value value) = 0;
    // Fires a trigger signal on an exec output
    virtual void execOutput(Node& node, int index) = 0;

    virtual void connAdded(Port& /*out*/, Port& /*inp*/, bool /*silent*/) {}
    virtual void connRemoved(Port& /*out*/, Port& /*inp*/, bool /*silent*/) {}
    // Topology changed (nodes, ports or connections)
    virtual void flowChanged() {}
    // Drops all per-execution bookkeeping
    virtual void reset() {}

    Flow& getFlow() const { return *flow; }

    // Emitted whenever a connection carries a value or a trigger
    Event<const Port&, const Port&> edgeActivated;

protected:
    // Runs node.updateEvent(inp); false if it threw (already reported)
    bool invokeNode(Node& node, int inp);
    // Connected output's value, else the input's default
    Value readInput(Node& node, int index) const;
    Port& dataInput(Node& node, int index) const;

    Flow* flow;
};

class ManualFlow : public FlowExecutor {
public:
    using FlowExecutor::FlowExecutor;

    FlowAlg algorithm() const override { return FlowAlg::Manual; }
    void updateNode(Node& node, int inp) override;
    Value input(Node& node, int index) override;
    void setOutput(Node& node, int index, Value value) override;
    void execOutput(Node& node, int index) override;
    void reset() override { clearUpdates(); }

    // Did the output feeding this input receive data since the last clear?
    bool shouldInputUpdate(const Port& inp) const;
    bool hasUpdatedOutputs(const Node& node) const;
    bool outputUpdated(const Port& out) const { return updatedOutputs.count(&out) != 0; }
    void clearUpdates() { updatedOutputs.clear(); }

private:
    std::unordered_set<const Port*> updatedOutputs;
};

class DataFlowNaive : public FlowExecutor {
public:
    using FlowExecutor::FlowExecutor;

    FlowAlg algorithm() const override { return FlowAlg::Data; }
    void updateNode(Node& node, int inp) override;
    Value input(Node& node, int index) override;
    void setOutput(Node& node, int index, Value value) override;
    void execOutput(Node& node, int index) override;

protected:
    // Activates every connection of `out`, updating the connected nodes
    void propagate(Port& out);
};

// Per-trigger execution. On a trigger the reachable subgraph is planned
// (distinct successors and wait counts, O(V+E), cached until the topology
// changes). Outputs set during the execution are only marked dirty; when a
// node finishes, its dirty outputs are pushed once and its successors' wait
// counts drop. A node whose count reaches zero runs once if it received
// data, and finishes either way.
class DataFlowOptimized : public DataFlowNaive {
public:
    using DataFlowNaive::DataFlowNaive;

    FlowAlg algorithm() const override { return FlowAlg::DataOpt; }
    void updateNode(Node& node, int inp) override;
    void setOutput(Node& node, int index, Value value) override;
    void execOutput(Node& node, int index) override;
    void connAdded(Port& out, Port& inp, bool silent) override;
    void connRemoved(Port& out, Port& inp, bool silent) override;
    void flowChanged() override { plans.clear(); }
    void reset() override;

    bool isExecuting() const { return execution.has_value(); }
    size_t cachedPlanCount() const { return plans.size(); }

private:
    struct ExecutionPlan {
        std::vector<Node*> nodes; // reachable from the trigger, trigger first
        std::unordered_map<const Node*, std::vector<Node*>> successors; // distinct, within the plan
        std::unordered_map<const Node*, int> waitCount;
    };

    struct ExecutionState {
        const ExecutionPlan* plan = nullptr;
        std::unordered_map<const Node*, int> waiting;
        std::unordered_map<const Node*, std::vector<int>> freshInputs;
        std::unordered_set<const Node*> finished;
        std::unordered_set<const Port*> dirty;
    };

    const ExecutionPlan& planFor(Node& trigger);
    template <typename Seed>
    void runExecution(Node& trigger, Seed seed);
    void finishNode(Node& node, std::deque<Node*>& ready);

    std::unordered_map<const Node*, ExecutionPlan> plans;
    std::optional<ExecutionState> execution;
};

class ExecFlowNaive : public FlowExecutor {
public:
    using FlowExecutor::FlowExecutor;

    FlowAlg algorithm() const override { return FlowAlg::Exec; }
    void updateNode(Node& node, int inp) override;
    // Pulls: the predecessor runs with inp = -1 before the value is read
    Value input(Node& node, int index) override;
    void setOutput(Node& node, int index, Value value) override;
    void execOutput(Node& node, int index) override;
    void reset() override { pulling.clear(); }

private:
    // Nodes currently being pulled; re-entry would recurse without bound
    std::unordered_set<const Node*> pulling;
};

std::shared_ptr<FlowExecutor> makeExecutor(FlowAlg alg, Flow& flow);

} // namespace GraphFlow
