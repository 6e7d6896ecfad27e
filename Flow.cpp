// Flow.cpp
//
// Flow bookkeeping: node placement, adjacency indices, connection validity
// and executor management.
#include "Flow.hpp"
#include "FlowExecutor.hpp"
#include "Log.hpp"
#include <algorithm>

namespace GraphFlow {

namespace {
const std::vector<Port*> noPorts;
const std::vector<Node*> noNodes;
} // namespace

Flow::Flow(std::string t, IdCounter& idCounter, std::shared_ptr<const TypeRegistry> typeRegistry)
    : title(std::move(t)), ids(idCounter), globalId(idCounter.next()), types(std::move(typeRegistry)) {
    if (!types) types = TypeRegistry::builtin();
    executor = makeExecutor(FlowAlg::Data, *this);
}

Flow::~Flow() {
    // nodes may reference the executor from their destructors; drop nodes first
    nodes.clear();
    graphAdj.clear();
    graphAdjRev.clear();
    nodeSuccessors.clear();
    ownedNodes.clear();
}

// -- Nodes --

Node& Flow::adoptNode(std::unique_ptr<Node> node, bool silent) {
    if (!node) throw FlowError("adoptNode: null node");
    if (&node->getFlow() != this) throw FlowError("Node '" + node->getTitle() + "' was created for another flow");
    auto guard = lockTopology();
    requireUnlocked("add node");
    Node& ref = *node;
    ownedNodes.push_back(std::move(node));
    if (!silent) nodeCreated.emit(ref);
    addNode(ref, silent);
    return ref;
}

void Flow::addNode(Node& node, bool silent) {
    if (!owns(node)) throw FlowError("Node '" + node.getTitle() + "' is not owned by flow '" + title + "'");
    auto guard = lockTopology();
    if (isPlaced(node)) return;
    requireUnlocked("add node");
    nodes.push_back(&node);
    nodeSuccessors[&node] = {};
    // catch up on ports created while the node was detached
    for (auto& out : node.getOutputs()) graphAdj[out.get()] = {};
    for (auto& inp : node.getInputs()) graphAdjRev[inp.get()] = nullptr;

    node.placeEvent();
    flowChanged();
    if (!silent) nodeAdded.emit(node);
}

void Flow::removeNode(Node& node, bool silent) {
    auto guard = lockTopology();
    if (!isPlaced(node)) {
        throw FlowError("Node '" + node.getTitle() + "' is not placed in flow '" + title + "'");
    }
    requireUnlocked("remove node");
    node.removeEvent();
    disconnectAll(node);

    nodes.erase(std::find(nodes.begin(), nodes.end(), &node));
    nodeSuccessors.erase(&node);
    for (auto& out : node.getOutputs()) graphAdj.erase(out.get());
    for (auto& inp : node.getInputs()) graphAdjRev.erase(inp.get());

    flowChanged();
    if (!silent) nodeRemoved.emit(node);
}

bool Flow::isPlaced(const Node& node) const {
    return nodeSuccessors.count(&node) != 0;
}

bool Flow::owns(const Node& node) const {
    return std::any_of(ownedNodes.begin(), ownedNodes.end(),
                       [&](const std::unique_ptr<Node>& n) { return n.get() == &node; });
}

void Flow::disconnectAll(Node& node) {
    for (auto& inp : node.getInputs()) {
        if (Port* out = connectedOutput(*inp)) removeConnection(*out, *inp, false);
    }
    for (auto& out : node.getOutputs()) {
        auto targets = connectedInputs(*out);
        for (Port* inp : targets) removeConnection(*out, *inp, false);
    }
}

// -- Port bookkeeping --

void Flow::addNodeInput(Node& node, Port& inp) {
    auto guard = lockTopology();
    if (!isPlaced(node)) return;
    graphAdjRev[&inp] = nullptr;
    flowChanged();
}

void Flow::addNodeOutput(Node& node, Port& out) {
    auto guard = lockTopology();
    if (!isPlaced(node)) return;
    graphAdj[&out] = {};
    flowChanged();
}

void Flow::removeNodeInput(Node& node, Port& inp) {
    auto guard = lockTopology();
    if (!isPlaced(node)) return;
    graphAdjRev.erase(&inp);
    flowChanged();
}

void Flow::removeNodeOutput(Node& node, Port& out) {
    auto guard = lockTopology();
    if (!isPlaced(node)) return;
    graphAdj.erase(&out);
    flowChanged();
}

// -- Connections --

void Flow::requirePlaced(const Port& port, const char* action) const {
    if (!port.node || !isPlaced(*port.node)) {
        throw FlowError(std::string(action) + ": port '" + port.label + "' does not belong to a node placed in flow '" +
                        title + "'");
    }
}

ConnValidType Flow::checkConnectionValidity(const Port& out, const Port& inp) {
    ConnValidType result = checkValidConn(out, inp, *types);
    connectionRequestValid.emit(result);
    return result;
}

ConnValidType Flow::canPortsConnect(const Port& out, const Port& inp) {
    requirePlaced(out, "connect");
    requirePlaced(inp, "connect");
    ConnValidType result = checkValidConn(out, inp, *types);
    if (result == ConnValidType::Valid) {
        const auto& targets = connectedInputs(out);
        if (std::find(targets.begin(), targets.end(), &inp) != targets.end()) {
            result = ConnValidType::AlreadyConnected;
        } else if (connectedOutput(inp) != nullptr) {
            result = ConnValidType::InputTaken;
        } else if (isTopologyLocked()) {
            result = ConnValidType::ExecutionInProgress;
        }
    }
    connectionRequestValid.emit(result);
    return result;
}

ConnValidType Flow::canPortsDisconnect(const Port& out, const Port& inp) {
    requirePlaced(out, "disconnect");
    requirePlaced(inp, "disconnect");
    ConnValidType result;
    const auto& targets = connectedInputs(out);
    if (out.isInput() || std::find(targets.begin(), targets.end(), &inp) == targets.end()) {
        result = ConnValidType::AlreadyDisconnected;
    } else if (isTopologyLocked()) {
        result = ConnValidType::ExecutionInProgress;
    } else {
        result = checkValidConn(out, inp, *types);
    }
    connectionRequestValid.emit(result);
    return result;
}

ConnValidType Flow::connectPorts(Port& out, Port& inp, bool silent) {
    auto guard = lockTopology();
    ConnValidType result = canPortsConnect(out, inp);
    if (result != ConnValidType::Valid) {
        logWarn("Invalid connect request {}:{} -> {}:{} ({})", out.node->getTitle(), out.label,
                inp.node->getTitle(), inp.label, toString(result));
        return result;
    }
    addConnection(out, inp, silent);
    return result;
}

ConnValidType Flow::disconnectPorts(Port& out, Port& inp, bool silent) {
    auto guard = lockTopology();
    ConnValidType result = canPortsDisconnect(out, inp);
    if (result != ConnValidType::Valid) {
        logWarn("Invalid disconnect request {}:{} -> {}:{} ({})", out.node->getTitle(), out.label,
                inp.node->getTitle(), inp.label, toString(result));
        return result;
    }
    removeConnection(out, inp, silent);
    return result;
}

ConnValidType Flow::connectNodes(Node& out, size_t outIndex, Node& inp, size_t inpIndex, bool silent) {
    return connectPorts(out.getOutput(outIndex), inp.getInput(inpIndex), silent);
}

ConnValidType Flow::disconnectNodes(Node& out, size_t outIndex, Node& inp, size_t inpIndex, bool silent) {
    return disconnectPorts(out.getOutput(outIndex), inp.getInput(inpIndex), silent);
}

ConnValidType Flow::connectFromInfo(const ConnectionInfo& info, bool silent) {
    return connectNodes(*info.outNode, static_cast<size_t>(info.outIndex), *info.inpNode,
                        static_cast<size_t>(info.inpIndex), silent);
}

ConnValidType Flow::disconnectFromInfo(const ConnectionInfo& info, bool silent) {
    return disconnectNodes(*info.outNode, static_cast<size_t>(info.outIndex), *info.inpNode,
                           static_cast<size_t>(info.inpIndex), silent);
}

void Flow::addConnection(Port& out, Port& inp, bool silent) {
    graphAdj[&out].push_back(&inp);
    graphAdjRev[&inp] = &out;
    nodeSuccessors[out.node].push_back(inp.node);
    flowChanged();
    logDebug("connect {}:{} -> {}:{}", out.node->getTitle(), out.index(), inp.node->getTitle(), inp.index());

    executor->connAdded(out, inp, silent);
    if (!silent) connectionAdded.emit(out, inp);
}

void Flow::removeConnection(Port& out, Port& inp, bool silent) {
    auto& targets = graphAdj[&out];
    targets.erase(std::remove(targets.begin(), targets.end(), &inp), targets.end());
    graphAdjRev[&inp] = nullptr;
    auto& succ = nodeSuccessors[out.node];
    auto it = std::find(succ.begin(), succ.end(), inp.node);
    if (it != succ.end()) succ.erase(it);
    flowChanged();
    logDebug("disconnect {}:{} -> {}:{}", out.node->getTitle(), out.index(), inp.node->getTitle(), inp.index());

    executor->connRemoved(out, inp, silent);
    if (!silent) connectionRemoved.emit(out, inp);
}

const std::vector<Port*>& Flow::connectedInputs(const Port& out) const {
    auto it = graphAdj.find(&out);
    return it == graphAdj.end() ? noPorts : it->second;
}

Port* Flow::connectedOutput(const Port& inp) const {
    auto it = graphAdjRev.find(&inp);
    return it == graphAdjRev.end() ? nullptr : it->second;
}

const std::vector<Node*>& Flow::getNodeSuccessors(const Node& node) const {
    auto it = nodeSuccessors.find(&node);
    return it == nodeSuccessors.end() ? noNodes : it->second;
}

ConnectionInfo Flow::connectionInfo(const Port& out, const Port& inp) const {
    return ConnectionInfo{out.node, out.index(), inp.node, inp.index()};
}

std::vector<Connection> Flow::getConnections() const {
    std::vector<Connection> result;
    for (Node* n : nodes) {
        for (auto& out : n->getOutputs()) {
            for (Port* inp : connectedInputs(*out)) result.push_back(Connection{out.get(), inp});
        }
    }
    return result;
}

std::vector<ConnectionTuple> Flow::getConnectionTuples(const std::vector<Node*>& subset) const {
    std::unordered_map<const Node*, size_t> position;
    for (size_t i = 0; i < subset.size(); ++i) position[subset[i]] = i;

    std::vector<ConnectionTuple> result;
    for (size_t i = 0; i < subset.size(); ++i) {
        const Node* n = subset[i];
        for (size_t j = 0; j < n->numOutputs(); ++j) {
            for (Port* inp : connectedInputs(n->getOutput(j))) {
                auto it = position.find(inp->node);
                if (it == position.end()) continue;
                result.push_back(ConnectionTuple{i, j, it->second, static_cast<size_t>(inp->index())});
            }
        }
    }
    return result;
}

// -- Executor --

FlowAlg Flow::getAlgorithmMode() const {
    return executor->algorithm();
}

bool Flow::setAlgorithmMode(FlowAlg mode, bool silent) {
    auto guard = lockTopology();
    requireExecutorFree();
    if (executor && executor->algorithm() == mode) return false;
    setExecutor(makeExecutor(mode, *this), silent);
    return true;
}

bool Flow::setAlgorithmMode(const std::string& mode, bool silent) {
    auto alg = flowAlgFromString(mode);
    if (!alg) throw std::invalid_argument("Unknown algorithm mode: " + mode);
    return setAlgorithmMode(*alg, silent);
}

void Flow::setExecutor(std::shared_ptr<FlowExecutor> exec, bool silent) {
    if (!exec) throw std::invalid_argument("setExecutor: null executor");
    if (&exec->getFlow() != this) throw FlowError("Executor belongs to another flow");
    auto guard = lockTopology();
    requireExecutorFree();
    requireUnlocked("swap executor");
    FlowAlg prev = executor ? executor->algorithm() : exec->algorithm();
    exec->reset();
    executor = std::move(exec);
    logDebug("flow '{}' executor -> {}", title, toString(executor->algorithm()));
    if (!silent && prev != executor->algorithm()) algorithmModeChanged.emit(executor->algorithm());
}

std::shared_ptr<FlowExecutor> Flow::claimExecutor(std::shared_ptr<FlowExecutor> exec) {
    auto guard = lockTopology();
    requireExecutorFree();
    std::shared_ptr<FlowExecutor> previous = executor;
    setExecutor(std::move(exec), true);
    executorClaimed.store(true);
    return previous;
}

void Flow::releaseExecutor(std::shared_ptr<FlowExecutor> previous) {
    auto guard = lockTopology();
    executorClaimed.store(false);
    if (previous) setExecutor(std::move(previous), true);
}

void Flow::requireExecutorFree() const {
    if (executorClaimed.load()) {
        throw FlowError("Cannot swap the executor of flow '" + title + "' while a player runs it");
    }
}

// -- Misc --

void Flow::requireUnlocked(const char* action) const {
    if (isTopologyLocked()) {
        throw FlowError(std::string("Cannot ") + action + " in flow '" + title + "' while an execution is in progress");
    }
}

void Flow::setTitle(const std::string& t) {
    if (t == title) return;
    std::string old = title;
    title = t;
    renamed.emit(old, title);
}

void Flow::flowChanged() {
    if (executor) executor->flowChanged();
}

} // namespace GraphFlow
