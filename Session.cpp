// Session.cpp
#include "Session.hpp"
#include "FlowSerializer.hpp"
#include "Log.hpp"
#include <algorithm>

namespace GraphFlow {

Session::Session() : types(std::make_shared<TypeRegistry>()) {
    TypeRegistry::registerBuiltins(*types);
}

Session::~Session() {
    shutdown();
    // players reference their flows
    players.clear();
    flows.clear();
}

// -- Flows --

bool Session::newFlowTitleValid(const std::string& title) const {
    return !title.empty() && getFlow(title) == nullptr;
}

Flow* Session::createFlow(const std::string& title) {
    if (!newFlowTitleValid(title)) {
        logWarn("cannot create flow '{}': title empty or taken", title);
        return nullptr;
    }
    auto flow = std::make_unique<Flow>(title, ids, types);
    Flow* ref = flow.get();
    InternalKey key;
    flow->renamed.subInternal(key, [this, ref](const std::string&, const std::string& now) {
        flowRenamed.emit(*ref, now);
    }, -5);
    flows.push_back(std::move(flow));
    players[ref] = std::make_unique<FlowPlayer>(ref);
    flowCreated.emit(*ref);
    return ref;
}

bool Session::renameFlow(Flow& flow, const std::string& title) {
    if (getFlow(flow.getTitle()) != &flow || !newFlowTitleValid(title)) return false;
    flow.setTitle(title);
    return true;
}

bool Session::deleteFlow(Flow& flow) {
    auto it = std::find_if(flows.begin(), flows.end(), [&](const std::unique_ptr<Flow>& f) { return f.get() == &flow; });
    if (it == flows.end()) return false;

    auto player = players.find(&flow);
    if (player != players.end()) {
        player->second->stop();
        player->second->join();
        if (player->second->getState() != GraphState::Stopped) {
            // deleting from inside the flow's own synchronous run
            logWarn("cannot delete flow '{}' while its player is running", flow.getTitle());
            return false;
        }
        players.erase(player);
    }
    std::string title = flow.getTitle();
    flows.erase(it);
    flowDeleted.emit(title);
    return true;
}

Flow* Session::getFlow(const std::string& title) const {
    for (auto& f : flows) {
        if (f->getTitle() == title) return f.get();
    }
    return nullptr;
}

std::vector<Flow*> Session::getFlows() const {
    std::vector<Flow*> result;
    for (auto& f : flows) result.push_back(f.get());
    return result;
}

// -- Players --

GraphPlayer* Session::getPlayer(const std::string& title) const {
    Flow* flow = getFlow(title);
    if (!flow) return nullptr;
    auto it = players.find(flow);
    return it == players.end() ? nullptr : it->second.get();
}

bool Session::setPlayer(const std::string& title, std::unique_ptr<GraphPlayer> player) {
    Flow* flow = getFlow(title);
    if (!flow || !player || player->getState() != GraphState::Stopped) return false;
    GraphPlayer* current = getPlayer(title);
    if (current) {
        if (current->getState() != GraphState::Stopped) return false;
        current->join();
    }
    if (!player->setFlow(flow)) return false;
    players[flow] = std::move(player);
    return true;
}

GraphActionResponse Session::playFlow(const std::string& title, bool onOtherThread) {
    GraphPlayer* player = getPlayer(title);
    if (!player) return GraphActionResponse::NoGraph;
    if (player->getState() != GraphState::Stopped) {
        logWarn("flow '{}' is {}", title, toString(player->getState()));
        return GraphActionResponse::NotAllowed;
    }
    return onOtherThread ? player->playAsync() : player->play();
}

GraphActionResponse Session::pauseFlow(const std::string& title) {
    GraphPlayer* player = getPlayer(title);
    if (!player) return GraphActionResponse::NoGraph;
    return player->pause();
}

GraphActionResponse Session::resumeFlow(const std::string& title) {
    GraphPlayer* player = getPlayer(title);
    if (!player) return GraphActionResponse::NoGraph;
    return player->resume();
}

GraphActionResponse Session::stopFlow(const std::string& title) {
    GraphPlayer* player = getPlayer(title);
    if (!player) return GraphActionResponse::NoGraph;
    return player->stop();
}

void Session::shutdown() {
    for (auto& entry : players) entry.second->stop();
    for (auto& entry : players) entry.second->join();
}

// -- Persistence --

nlohmann::json Session::serialize() const {
    FlowSerializer serializer(nodeTypes);
    nlohmann::json j;
    j["flows"] = nlohmann::json::object();
    for (auto& f : flows) j["flows"][f->getTitle()] = serializer.serialize(*f);
    return j;
}

std::vector<Flow*> Session::load(const nlohmann::json& data) {
    FlowSerializer serializer(nodeTypes);
    std::vector<Flow*> created;
    try {
        for (const auto& item : data.at("flows").items()) {
            Flow* flow = createFlow(item.key());
            if (!flow) throw FlowError("Cannot load flow '" + item.key() + "': title empty or taken");
            created.push_back(flow);
            serializer.load(*flow, item.value());
        }
    } catch (...) {
        // a failed load leaves no flow behind
        for (Flow* flow : created) deleteFlow(*flow);
        throw;
    }
    return created;
}

} // namespace GraphFlow
