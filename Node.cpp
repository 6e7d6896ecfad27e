// Node.cpp
//
// Node port management and the thin forwarding layer to the flow's
// executor. The flow learns about port changes through the node's port
// events, subscribed internally at construction.
#include "Node.hpp"
#include "Flow.hpp"
#include "FlowExecutor.hpp"
#include "Log.hpp"
#include <algorithm>

namespace GraphFlow {

Node::Node(Flow& f, std::string t)
    : flow(&f), title(std::move(t)), globalId(f.getIdCounter().next()) {
    InternalKey key;
    inputAdded.subInternal(key, [this](Node& n, int, Port& p) { flow->addNodeInput(n, p); }, -5);
    outputAdded.subInternal(key, [this](Node& n, int, Port& p) { flow->addNodeOutput(n, p); }, -5);
    inputRemoved.subInternal(key, [this](Node& n, int, Port& p) { flow->removeNodeInput(n, p); }, -5);
    outputRemoved.subInternal(key, [this](Node& n, int, Port& p) { flow->removeNodeOutput(n, p); }, -5);
}

Node::~Node() = default;

void Node::update(int inp) {
    if (blockUpdates) return;
    updating.emit(inp);
    // keep the executor alive even if a callback swaps the flow's mode
    auto exec = flow->getExecutorPtr();
    exec->updateNode(*this, inp);
}

Value Node::input(int index) {
    auto exec = flow->getExecutorPtr();
    return exec->input(*this, index);
}

void Node::setOutput(int index, Value value) {
    Port& out = getOutput(static_cast<size_t>(index));
    if (out.isData() && !flow->getTypeRegistry().bears(value, out.allowedData)) {
        throw FlowError("Output " + std::to_string(index) + " of '" + title + "' expects '" +
                        out.allowedData + "', got " + valueToString(value));
    }
    auto exec = flow->getExecutorPtr();
    exec->setOutput(*this, index, value);
    outputUpdated.emit(*this, index, out.value);
}

void Node::execOutput(int index) {
    (void)getOutput(static_cast<size_t>(index)); // range check
    auto exec = flow->getExecutorPtr();
    exec->execOutput(*this, index);
}

bool Node::frameUpdate() {
    try {
        if (frameUpdateEvent()) {
            updating.emit(-1);
            return true;
        }
    } catch (const std::exception& e) {
        reportUpdateError(e);
    }
    return false;
}

void Node::reportUpdateError(const std::exception& e) {
    logError("EXCEPTION in node '{}' (gid {}): {}", title, globalId, e.what());
    updateError.emit(std::string(e.what()));
}

Port& Node::createInput(const PortConfig& config, std::optional<size_t> insert) {
    return createPort(PortDirection::Input, config, insert);
}

Port& Node::createOutput(const PortConfig& config, std::optional<size_t> insert) {
    return createPort(PortDirection::Output, config, insert);
}

Port& Node::createPort(PortDirection dir, const PortConfig& config, std::optional<size_t> insert) {
    auto guard = flow->lockTopology();
    if (flow->isPlaced(*this)) flow->requireUnlocked("create port");
    auto& list = dir == PortDirection::Input ? inputs : outputs;
    auto port = std::make_unique<Port>(*this, dir, config, flow->getIdCounter().next());
    Port& ref = *port;
    size_t index = list.size();
    if (insert && *insert < list.size()) {
        index = *insert;
        list.insert(list.begin() + static_cast<std::ptrdiff_t>(index), std::move(port));
    } else {
        list.push_back(std::move(port));
    }
    if (dir == PortDirection::Input) {
        inputAdded.emit(*this, static_cast<int>(index), ref);
    } else {
        outputAdded.emit(*this, static_cast<int>(index), ref);
    }
    return ref;
}

void Node::deleteInput(size_t index) {
    deletePort(PortDirection::Input, index);
}

void Node::deleteOutput(size_t index) {
    deletePort(PortDirection::Output, index);
}

void Node::deletePort(PortDirection dir, size_t index) {
    auto guard = flow->lockTopology();
    auto& list = dir == PortDirection::Input ? inputs : outputs;
    if (index >= list.size()) {
        throw FlowError("Port index " + std::to_string(index) + " out of range on '" + title + "'");
    }
    Port& port = *list[index];
    if (flow->isPlaced(*this)) {
        flow->requireUnlocked("delete port");
        // break all connections first
        if (dir == PortDirection::Input) {
            if (Port* out = flow->connectedOutput(port)) flow->disconnectPorts(*out, port);
        } else {
            auto targets = flow->connectedInputs(port);
            for (Port* inp : targets) flow->disconnectPorts(port, *inp);
        }
    }
    if (dir == PortDirection::Input) {
        inputRemoved.emit(*this, static_cast<int>(index), port);
    } else {
        outputRemoved.emit(*this, static_cast<int>(index), port);
    }
    list.erase(list.begin() + static_cast<std::ptrdiff_t>(index));
}

void Node::renameInput(size_t index, const std::string& label) {
    getInput(index).label = label;
}

void Node::renameOutput(size_t index, const std::string& label) {
    getOutput(index).label = label;
}

Port& Node::getInput(size_t index) const {
    if (index >= inputs.size()) {
        throw FlowError("Input index " + std::to_string(index) + " out of range on '" + title + "'");
    }
    return *inputs[index];
}

Port& Node::getOutput(size_t index) const {
    if (index >= outputs.size()) {
        throw FlowError("Output index " + std::to_string(index) + " out of range on '" + title + "'");
    }
    return *outputs[index];
}

int Node::inputIndex(const Port& port) const {
    auto it = std::find_if(inputs.begin(), inputs.end(), [&](const std::unique_ptr<Port>& p) { return p.get() == &port; });
    return it == inputs.end() ? -1 : static_cast<int>(it - inputs.begin());
}

int Node::outputIndex(const Port& port) const {
    auto it = std::find_if(outputs.begin(), outputs.end(), [&](const std::unique_ptr<Port>& p) { return p.get() == &port; });
    return it == outputs.end() ? -1 : static_cast<int>(it - outputs.begin());
}

bool Node::inputConnected(size_t index) const {
    if (index >= inputs.size() || !flow->isPlaced(*this)) return false;
    return flow->connectedOutput(*inputs[index]) != nullptr;
}

bool Node::outputConnected(size_t index) const {
    if (index >= outputs.size() || !flow->isPlaced(*this)) return false;
    return !flow->connectedInputs(*outputs[index]).empty();
}

bool Node::anyInputConnected() const {
    for (size_t i = 0; i < inputs.size(); ++i) if (inputConnected(i)) return true;
    return false;
}

bool Node::anyOutputConnected() const {
    for (size_t i = 0; i < outputs.size(); ++i) if (outputConnected(i)) return true;
    return false;
}

} // namespace GraphFlow
