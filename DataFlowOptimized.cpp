// DataFlowOptimized.cpp
//
// Data flow executor with at most one activation per connection per
// execution. An execution starts at a trigger node (updateNode, or setOutput
// outside of an execution) and covers everything reachable from it.
//
// Planning is a linear pass over the reachable subgraph: BFS for the node
// set, distinct successor lists, and for every node the number of distinct
// reachable predecessors (its wait count). A Kahn pass over those counts
// rejects triggers that can reach a cycle before any callback runs.
#include "FlowExecutor.hpp"
#include "Flow.hpp"
#include "Node.hpp"
#include "Log.hpp"
#include <algorithm>

namespace GraphFlow {

const DataFlowOptimized::ExecutionPlan& DataFlowOptimized::planFor(Node& trigger) {
    auto cached = plans.find(&trigger);
    if (cached != plans.end()) return cached->second;

    ExecutionPlan plan;
    std::unordered_set<const Node*> seen{&trigger};
    plan.nodes.push_back(&trigger);
    for (size_t head = 0; head < plan.nodes.size(); ++head) {
        Node* n = plan.nodes[head];
        plan.waitCount.emplace(n, 0);
        auto& distinct = plan.successors[n];
        std::unordered_set<const Node*> local;
        for (Node* s : flow->getNodeSuccessors(*n)) {
            if (!local.insert(s).second) continue;
            distinct.push_back(s);
            if (seen.insert(s).second) plan.nodes.push_back(s);
        }
    }
    for (Node* n : plan.nodes) {
        for (Node* s : plan.successors[n]) ++plan.waitCount[s];
    }

    // Kahn over the wait counts; leftovers sit on a cycle
    std::unordered_map<const Node*, int> remaining = plan.waitCount;
    std::vector<Node*> queue;
    if (remaining[&trigger] == 0) queue.push_back(&trigger);
    size_t visited = 0;
    while (!queue.empty()) {
        Node* n = queue.back();
        queue.pop_back();
        ++visited;
        for (Node* s : plan.successors[n]) {
            if (--remaining[s] == 0) queue.push_back(s);
        }
    }
    if (visited != plan.nodes.size()) {
        throw FlowError("Cycle reachable from node '" + trigger.getTitle() +
                        "'; optimized data flow execution rejected");
    }

    logDebug("data-opt plan for '{}': {} nodes", trigger.getTitle(), plan.nodes.size());
    return plans.emplace(&trigger, std::move(plan)).first->second;
}

template <typename Seed>
void DataFlowOptimized::runExecution(Node& trigger, Seed seed) {
    const ExecutionPlan& plan = planFor(trigger);

    Flow::ExecutionScope lock(*flow);
    execution.emplace();
    execution->plan = &plan;
    execution->waiting = plan.waitCount;
    struct ExecutionGuard {
        std::optional<ExecutionState>& state;
        ~ExecutionGuard() { state.reset(); }
    } guard{execution};

    seed();

    std::deque<Node*> ready;
    finishNode(trigger, ready);
    while (!ready.empty()) {
        Node* n = ready.front();
        ready.pop_front();
        auto fresh = execution->freshInputs.find(n);
        if (fresh != execution->freshInputs.end() && !fresh->second.empty() && !n->blockUpdates) {
            int inp = *std::min_element(fresh->second.begin(), fresh->second.end());
            n->updating.emit(inp);
            // a failed node still finishes so successors are not blocked
            invokeNode(*n, inp);
        }
        finishNode(*n, ready);
    }

    if (!execution->dirty.empty()) {
        logDebug("data-opt: {} output(s) set after their node finished were not propagated",
                 execution->dirty.size());
    }
}

void DataFlowOptimized::finishNode(Node& node, std::deque<Node*>& ready) {
    ExecutionState& state = *execution;
    state.finished.insert(&node);
    for (auto& outPtr : node.getOutputs()) {
        Port* out = outPtr.get();
        if (state.dirty.erase(out) == 0) continue;
        for (Port* inp : flow->connectedInputs(*out)) {
            edgeActivated.emit(*out, *inp);
            state.freshInputs[inp->node].push_back(inp->index());
        }
    }
    auto succ = state.plan->successors.find(&node);
    if (succ == state.plan->successors.end()) return;
    for (Node* s : succ->second) {
        if (--state.waiting[s] == 0) ready.push_back(s);
    }
}

void DataFlowOptimized::updateNode(Node& node, int inp) {
    if (execution) {
        // nested update from inside a callback
        invokeNode(node, inp);
        if (execution->finished.count(&node) || !execution->plan->waitCount.count(&node)) {
            logDebug("data-opt: '{}' updated outside its turn; its outputs will not propagate", node.getTitle());
        }
        return;
    }
    runExecution(node, [&] { invokeNode(node, inp); });
}

void DataFlowOptimized::setOutput(Node& node, int index, Value value) {
    Port& out = node.getOutput(static_cast<size_t>(index));
    out.value = std::move(value);
    if (execution) {
        execution->dirty.insert(&out);
        return;
    }
    runExecution(node, [&] { execution->dirty.insert(&out); });
}

void DataFlowOptimized::execOutput(Node& node, int index) {
    Port& out = node.getOutput(static_cast<size_t>(index));
    if (execution) {
        execution->dirty.insert(&out);
        return;
    }
    runExecution(node, [&] { execution->dirty.insert(&out); });
}

void DataFlowOptimized::connAdded(Port& /*out*/, Port& /*inp*/, bool /*silent*/) {
    plans.clear();
}

void DataFlowOptimized::connRemoved(Port& /*out*/, Port& /*inp*/, bool /*silent*/) {
    plans.clear();
}

void DataFlowOptimized::reset() {
    plans.clear();
    execution.reset();
}

} // namespace GraphFlow
