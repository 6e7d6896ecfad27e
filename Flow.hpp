// Flow.hpp
//
// The graph container. A flow owns its nodes, the connections between their
// ports and the indices executors work on:
//   graphAdj       output port -> connected input ports
//   graphAdjRev    input port  -> connected output port (or none)
//   nodeSuccessors node        -> successor nodes, one entry per connection
// It delegates every propagation decision to its current executor.
#pragma once
#include "FlowTypes.hpp"
#include "Event.hpp"
#include "Node.hpp"
#include "TypeRegistry.hpp"
#include "IdCounter.hpp"
#include <memory>
#include <vector>
#include <unordered_map>
#include <atomic>
#include <mutex>
#include <type_traits>

namespace GraphFlow {

class FlowExecutor;

// A connection expressed through its nodes and port indices
struct ConnectionInfo {
    Node* outNode;
    int outIndex;
    Node* inpNode;
    int inpIndex;
};

// Index-based connection relative to an ordered node list, used for export
struct ConnectionTuple {
    size_t sourceNode;
    size_t sourcePort;
    size_t targetNode;
    size_t targetPort;

    bool operator==(const ConnectionTuple& o) const {
        return sourceNode == o.sourceNode && sourcePort == o.sourcePort &&
               targetNode == o.targetNode && targetPort == o.targetPort;
    }
};

struct Connection {
    Port* out;
    Port* inp;
};

class Flow {
public:
    Flow(std::string title, IdCounter& ids,
         std::shared_ptr<const TypeRegistry> types = TypeRegistry::builtin());
    ~Flow();

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;

    // -- Nodes --

    // Constructs a node of type T against this flow, takes ownership and places it
    template <typename T, typename... Args>
    T& createNode(Args&&... args) {
        static_assert(std::is_base_of<Node, T>::value, "createNode requires a Node subclass");
        auto node = std::make_unique<T>(*this, std::forward<Args>(args)...);
        T& ref = *node;
        adoptNode(std::move(node));
        return ref;
    }
    // Takes ownership of a node constructed against this flow and places it
    Node& adoptNode(std::unique_ptr<Node> node, bool silent = false);
    // Places an owned node (again). No-op if already placed.
    void addNode(Node& node, bool silent = false);
    // Disconnects and detaches a node without destroying it
    void removeNode(Node& node, bool silent = false);
    bool isPlaced(const Node& node) const;
    bool owns(const Node& node) const;
    // Placed nodes in placement order
    const std::vector<Node*>& getNodes() const { return nodes; }

    // -- Port bookkeeping, driven by node port events --

    void addNodeInput(Node& node, Port& inp);
    void addNodeOutput(Node& node, Port& out);
    void removeNodeInput(Node& node, Port& inp);
    void removeNodeOutput(Node& node, Port& out);

    // -- Connections --

    // Structural checks only (SameNode .. DataMismatch)
    ConnValidType checkConnectionValidity(const Port& out, const Port& inp);
    // Structural checks plus AlreadyConnected / InputTaken / ExecutionInProgress
    ConnValidType canPortsConnect(const Port& out, const Port& inp);
    // AlreadyDisconnected / ExecutionInProgress, then structural checks
    ConnValidType canPortsDisconnect(const Port& out, const Port& inp);

    ConnValidType connectPorts(Port& out, Port& inp, bool silent = false);
    ConnValidType disconnectPorts(Port& out, Port& inp, bool silent = false);
    ConnValidType connectNodes(Node& out, size_t outIndex, Node& inp, size_t inpIndex, bool silent = false);
    ConnValidType disconnectNodes(Node& out, size_t outIndex, Node& inp, size_t inpIndex, bool silent = false);
    ConnValidType connectFromInfo(const ConnectionInfo& info, bool silent = false);
    ConnValidType disconnectFromInfo(const ConnectionInfo& info, bool silent = false);

    const std::vector<Port*>& connectedInputs(const Port& out) const;
    Port* connectedOutput(const Port& inp) const;
    const std::vector<Node*>& getNodeSuccessors(const Node& node) const;
    ConnectionInfo connectionInfo(const Port& out, const Port& inp) const;
    // All connections in node/port order
    std::vector<Connection> getConnections() const;
    // Connections between the given nodes, indexed relative to that list
    std::vector<ConnectionTuple> getConnectionTuples(const std::vector<Node*>& subset) const;
    std::vector<ConnectionTuple> getConnectionTuples() const { return getConnectionTuples(nodes); }

    // -- Executor --

    FlowAlg getAlgorithmMode() const;
    // Replaces the executor with a fresh one; false if already in that mode
    bool setAlgorithmMode(FlowAlg mode, bool silent = false);
    // String form; throws std::invalid_argument on unknown modes
    bool setAlgorithmMode(const std::string& mode, bool silent = false);
    // Throws FlowError while a player has claimed the executor
    void setExecutor(std::shared_ptr<FlowExecutor> exec, bool silent = false);
    // Installs `exec` for a player run and refuses executor swaps until
    // released. Returns the executor it replaced.
    std::shared_ptr<FlowExecutor> claimExecutor(std::shared_ptr<FlowExecutor> exec);
    // Ends the claim and reinstalls `previous`
    void releaseExecutor(std::shared_ptr<FlowExecutor> previous);
    bool isExecutorClaimed() const { return executorClaimed.load(); }
    FlowExecutor& getExecutor() const { return *executor; }
    std::shared_ptr<FlowExecutor> getExecutorPtr() const { return executor; }

    // -- Execution lock --

    // While alive the topology (nodes, ports, connections, executor) is frozen.
    // The scope holds the topology mutex: mutations from the owning thread
    // are rejected, mutations from other threads wait until it ends.
    class ExecutionScope {
    public:
        explicit ExecutionScope(Flow& f) : flow(f), guard(f.topologyMutex) { ++flow.topologyLocks; }
        ~ExecutionScope() { --flow.topologyLocks; }
        ExecutionScope(const ExecutionScope&) = delete;
        ExecutionScope& operator=(const ExecutionScope&) = delete;

    private:
        Flow& flow;
        std::lock_guard<std::recursive_mutex> guard;
    };
    // True while an ExecutionScope is alive on the thread holding the
    // topology mutex
    bool isTopologyLocked() const { return topologyLocks.load() > 0; }
    // Taken by every topology mutation
    std::unique_lock<std::recursive_mutex> lockTopology() const {
        return std::unique_lock<std::recursive_mutex>(topologyMutex);
    }
    // Throws FlowError if locked
    void requireUnlocked(const char* action) const;

    // -- Misc --

    const std::string& getTitle() const { return title; }
    void setTitle(const std::string& t);
    GlobalId getGlobalId() const { return globalId; }
    IdCounter& getIdCounter() const { return ids; }
    const TypeRegistry& getTypeRegistry() const { return *types; }

    Event<Node&> nodeCreated;
    Event<Node&> nodeAdded;
    Event<Node&> nodeRemoved;
    Event<Port&, Port&> connectionAdded;
    Event<Port&, Port&> connectionRemoved;
    Event<ConnValidType> connectionRequestValid;
    Event<FlowAlg> algorithmModeChanged;
    Event<const std::string&, const std::string&> renamed;

private:
    void addConnection(Port& out, Port& inp, bool silent);
    void removeConnection(Port& out, Port& inp, bool silent);
    void disconnectAll(Node& node);
    void requirePlaced(const Port& port, const char* action) const;
    void requireExecutorFree() const;
    void flowChanged();

    std::string title;
    IdCounter& ids;
    GlobalId globalId;
    std::shared_ptr<const TypeRegistry> types;

    std::vector<std::unique_ptr<Node>> ownedNodes;
    std::vector<Node*> nodes;
    std::unordered_map<const Port*, std::vector<Port*>> graphAdj;
    std::unordered_map<const Port*, Port*> graphAdjRev;
    std::unordered_map<const Node*, std::vector<Node*>> nodeSuccessors;

    std::shared_ptr<FlowExecutor> executor;
    std::atomic<bool> executorClaimed{false};
    mutable std::recursive_mutex topologyMutex;
    std::atomic<int> topologyLocks{0};
};

} // namespace GraphFlow
