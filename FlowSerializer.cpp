// FlowSerializer.cpp
//
// Flow <-> JSON. Loading rebuilds nodes through the NodeRegistry, restores
// their state and ports, then re-establishes connections by index.
#include "FlowSerializer.hpp"
#include "Flow.hpp"
#include "NodeRegistry.hpp"
#include "Log.hpp"
#include <type_traits>

namespace GraphFlow {

nlohmann::json valueToJson(const Value& v) {
    return std::visit([](const auto& x) -> nlohmann::json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return x;
        }
    }, v);
}

Value valueFromJson(const nlohmann::json& j) {
    if (j.is_null()) return std::monostate{};
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number_integer()) return j.get<int>();
    // keep precision; nodes handle double and float alike
    if (j.is_number_float()) return j.get<double>();
    if (j.is_string()) return j.get<std::string>();
    throw FlowError("Unsupported JSON value: " + j.dump());
}

nlohmann::json FlowSerializer::serializePort(const Port& port) {
    nlohmann::json j;
    j["GID"] = port.globalId;
    j["port_type"] = toString(port.kind);
    j["label"] = port.label;
    j["allowed_data"] = port.allowedData.empty() ? nlohmann::json(nullptr) : nlohmann::json(port.allowedData);
    if (port.isInput()) j["default"] = valueToJson(port.defaultValue);
    return j;
}

nlohmann::json FlowSerializer::serializeNode(const Node& node) const {
    auto identifier = registry.identifierOf(node);
    if (!identifier) throw FlowError("Node '" + node.getTitle() + "' has no registered identifier");

    nlohmann::json j;
    j["GID"] = node.getGlobalId();
    j["identifier"] = *identifier;
    j["title"] = node.getTitle();
    j["state"] = node.getState();
    j["inputs"] = nlohmann::json::array();
    for (auto& inp : node.getInputs()) j["inputs"].push_back(serializePort(*inp));
    j["outputs"] = nlohmann::json::array();
    for (auto& out : node.getOutputs()) j["outputs"].push_back(serializePort(*out));
    return j;
}

nlohmann::json FlowSerializer::serialize(const Flow& flow) const {
    nlohmann::json j;
    j["GID"] = flow.getGlobalId();
    j["title"] = flow.getTitle();
    j["algorithm mode"] = toString(flow.getAlgorithmMode());
    j["nodes"] = nlohmann::json::array();
    for (Node* n : flow.getNodes()) j["nodes"].push_back(serializeNode(*n));
    j["connections"] = nlohmann::json::array();
    for (const ConnectionTuple& c : flow.getConnectionTuples()) {
        j["connections"].push_back({{"parent node index", c.sourceNode},
                                    {"output port index", c.sourcePort},
                                    {"connected node", c.targetNode},
                                    {"connected input port index", c.targetPort}});
    }
    return j;
}

namespace {

PortConfig portConfigFromJson(const nlohmann::json& j) {
    PortConfig config;
    config.label = j.value("label", std::string());
    config.kind = portKindFromString(j.value("port_type", std::string("data")));
    if (j.contains("allowed_data") && j["allowed_data"].is_string()) {
        config.allowedData = j["allowed_data"].get<std::string>();
    }
    if (j.contains("default")) config.defaultValue = valueFromJson(j["default"]);
    return config;
}

void restorePorts(Node& node, const nlohmann::json& nodeJson) {
    if (nodeJson.contains("inputs")) {
        while (node.numInputs() > 0) node.deleteInput(node.numInputs() - 1);
        for (const auto& p : nodeJson["inputs"]) {
            Port& port = node.createInput(portConfigFromJson(p));
            if (p.contains("GID")) port.prevGlobalId = p["GID"].get<GlobalId>();
        }
    }
    if (nodeJson.contains("outputs")) {
        while (node.numOutputs() > 0) node.deleteOutput(node.numOutputs() - 1);
        for (const auto& p : nodeJson["outputs"]) {
            Port& port = node.createOutput(portConfigFromJson(p));
            if (p.contains("GID")) port.prevGlobalId = p["GID"].get<GlobalId>();
        }
    }
}

} // namespace

IdRemap FlowSerializer::load(Flow& flow, const nlohmann::json& data) const {
    flow.requireUnlocked("load");
    if (data.contains("algorithm mode")) {
        flow.setAlgorithmMode(data["algorithm mode"].get<std::string>());
    }

    IdRemap remap;
    std::vector<Node*> loaded;
    for (const auto& nodeJson : data.at("nodes")) {
        std::unique_ptr<Node> node = registry.create(nodeJson.at("identifier").get<std::string>(), flow);
        if (nodeJson.contains("title")) node->setTitle(nodeJson["title"].get<std::string>());
        if (nodeJson.contains("state")) node->setState(nodeJson["state"]);
        restorePorts(*node, nodeJson);
        if (nodeJson.contains("GID")) {
            GlobalId prev = nodeJson["GID"].get<GlobalId>();
            node->setPrevGlobalId(prev);
            remap.add(prev, node.get());
        }
        loaded.push_back(&flow.adoptNode(std::move(node)));
    }

    if (data.contains("connections")) {
        for (const auto& c : data["connections"]) {
            size_t src = c.at("parent node index").get<size_t>();
            size_t dst = c.at("connected node").get<size_t>();
            if (src >= loaded.size() || dst >= loaded.size()) {
                throw FlowError("Connection refers to node index out of range: " + c.dump());
            }
            ConnValidType r = flow.connectNodes(*loaded[src], c.at("output port index").get<size_t>(), *loaded[dst],
                                                c.at("connected input port index").get<size_t>());
            if (r != ConnValidType::Valid) {
                throw FlowError(std::string("Could not restore connection ") + c.dump() + ": " + toString(r));
            }
        }
    }

    for (Node* n : loaded) n->rebuilt();
    logDebug("loaded {} nodes into flow '{}'", loaded.size(), flow.getTitle());
    return remap;
}

} // namespace GraphFlow
