// FlowExecutor.cpp
//
// Shared executor plumbing plus the manual, naive data and exec executors.
// The optimized data executor lives in DataFlowOptimized.cpp.
#include "FlowExecutor.hpp"
#include "Flow.hpp"
#include "Node.hpp"
#include "Log.hpp"

namespace GraphFlow {

bool FlowExecutor::invokeNode(Node& node, int inp) {
    try {
        node.updateEvent(inp);
    } catch (const std::exception& e) {
        node.reportUpdateError(e);
        return false;
    }
    node.updated.emit(inp);
    return true;
}

Port& FlowExecutor::dataInput(Node& node, int index) const {
    Port& inp = node.getInput(static_cast<size_t>(index));
    if (!inp.isData()) {
        throw FlowError("input(" + std::to_string(index) + ") called on exec input of '" + node.getTitle() + "'");
    }
    return inp;
}

Value FlowExecutor::readInput(Node& node, int index) const {
    Port& inp = dataInput(node, index);
    if (Port* out = flow->connectedOutput(inp)) return out->value;
    return inp.defaultValue;
}

std::shared_ptr<FlowExecutor> makeExecutor(FlowAlg alg, Flow& flow) {
    switch (alg) {
        case FlowAlg::Manual: return std::make_shared<ManualFlow>(flow);
        case FlowAlg::Data: return std::make_shared<DataFlowNaive>(flow);
        case FlowAlg::DataOpt: return std::make_shared<DataFlowOptimized>(flow);
        case FlowAlg::Exec: return std::make_shared<ExecFlowNaive>(flow);
    }
    throw std::invalid_argument("Unknown algorithm mode");
}

// -- ManualFlow --

void ManualFlow::updateNode(Node& node, int inp) {
    invokeNode(node, inp);
}

Value ManualFlow::input(Node& node, int index) {
    return readInput(node, index);
}

void ManualFlow::setOutput(Node& node, int index, Value value) {
    Port& out = node.getOutput(static_cast<size_t>(index));
    out.value = std::move(value);
    updatedOutputs.insert(&out);
}

void ManualFlow::execOutput(Node& node, int index) {
    updatedOutputs.insert(&node.getOutput(static_cast<size_t>(index)));
}

bool ManualFlow::shouldInputUpdate(const Port& inp) const {
    Port* out = flow->connectedOutput(inp);
    return out != nullptr && updatedOutputs.count(out) != 0;
}

bool ManualFlow::hasUpdatedOutputs(const Node& node) const {
    for (auto& out : node.getOutputs()) {
        if (updatedOutputs.count(out.get())) return true;
    }
    return false;
}

// -- DataFlowNaive --

void DataFlowNaive::updateNode(Node& node, int inp) {
    invokeNode(node, inp);
}

Value DataFlowNaive::input(Node& node, int index) {
    return readInput(node, index);
}

void DataFlowNaive::setOutput(Node& node, int index, Value value) {
    Port& out = node.getOutput(static_cast<size_t>(index));
    out.value = std::move(value);
    propagate(out);
}

void DataFlowNaive::execOutput(Node& node, int index) {
    propagate(node.getOutput(static_cast<size_t>(index)));
}

void DataFlowNaive::propagate(Port& out) {
    // copy: callbacks further down may rewire this output
    std::vector<Port*> targets = flow->connectedInputs(out);
    for (Port* inp : targets) {
        edgeActivated.emit(out, *inp);
        inp->node->update(inp->index());
    }
}

// -- ExecFlowNaive --

void ExecFlowNaive::updateNode(Node& node, int inp) {
    invokeNode(node, inp);
}

Value ExecFlowNaive::input(Node& node, int index) {
    Port& inp = dataInput(node, index);
    Port* out = flow->connectedOutput(inp);
    if (!out) return inp.defaultValue;

    Node* pred = out->node;
    if (pulling.count(pred)) {
        logWarn("exec pull cycle at '{}' -> '{}'; returning last value", pred->getTitle(), node.getTitle());
        return out->value;
    }
    pulling.insert(pred);
    struct PullGuard {
        std::unordered_set<const Node*>& set;
        const Node* n;
        ~PullGuard() { set.erase(n); }
    } guard{pulling, pred};

    edgeActivated.emit(*out, inp);
    pred->update(-1);
    return out->value;
}

void ExecFlowNaive::setOutput(Node& node, int index, Value value) {
    node.getOutput(static_cast<size_t>(index)).value = std::move(value);
}

void ExecFlowNaive::execOutput(Node& node, int index) {
    Port& out = node.getOutput(static_cast<size_t>(index));
    std::vector<Port*> targets = flow->connectedInputs(out);
    for (Port* inp : targets) {
        edgeActivated.emit(out, *inp);
        inp->node->update(inp->index());
    }
}

} // namespace GraphFlow
