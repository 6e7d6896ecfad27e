// Session.hpp
//
// Top-level container: owns the id counter, the type and node registries,
// flows (unique, non-empty titles, creation order) and one player per flow.
// Player actions are addressed by flow title.
#pragma once
#include "Flow.hpp"
#include "GraphPlayer.hpp"
#include "NodeRegistry.hpp"
#include "IdCounter.hpp"
#include "TypeRegistry.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <unordered_map>
#include <vector>

namespace GraphFlow {

class Session {
public:
    Session();
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    IdCounter& getIdCounter() { return ids; }
    // Shared with every flow of this session; register custom tags before
    // creating flows that use them
    TypeRegistry& getTypeRegistry() { return *types; }
    NodeRegistry& getNodeRegistry() { return nodeTypes; }

    // -- Flows --

    // nullptr if the title is empty or taken
    Flow* createFlow(const std::string& title);
    bool renameFlow(Flow& flow, const std::string& title);
    // Stops and joins the flow's player before destroying the flow; false
    // if the player is still running (called from its own run)
    bool deleteFlow(Flow& flow);
    Flow* getFlow(const std::string& title) const;
    std::vector<Flow*> getFlows() const;
    bool newFlowTitleValid(const std::string& title) const;

    // -- Players --

    GraphPlayer* getPlayer(const std::string& title) const;
    // Replaces the flow's player; refused while the current one is not stopped
    bool setPlayer(const std::string& title, std::unique_ptr<GraphPlayer> player);

    GraphActionResponse playFlow(const std::string& title, bool onOtherThread = false);
    GraphActionResponse pauseFlow(const std::string& title);
    GraphActionResponse resumeFlow(const std::string& title);
    GraphActionResponse stopFlow(const std::string& title);
    // Stops every player and waits for the ones running on worker threads
    void shutdown();

    // -- Persistence --

    // { "flows": { title: flow, ... } }
    nlohmann::json serialize() const;
    // Creates a flow per saved entry. Throws FlowError when a title is taken
    // or a node identifier is unknown; the flows created by a failed load are
    // deleted again.
    std::vector<Flow*> load(const nlohmann::json& data);

    Event<Flow&> flowCreated;
    Event<Flow&, const std::string&> flowRenamed;
    Event<const std::string&> flowDeleted;

private:
    IdCounter ids;
    std::shared_ptr<TypeRegistry> types;
    NodeRegistry nodeTypes;
    std::vector<std::unique_ptr<Flow>> flows;
    std::unordered_map<const Flow*, std::unique_ptr<GraphPlayer>> players;
};

} // namespace GraphFlow
