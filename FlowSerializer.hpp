// FlowSerializer.hpp
//
// JSON save/load of flows (nlohmann::json). A saved flow is
//   { "GID", "title", "algorithm mode", "nodes": [...], "connections": [...] }
// where every node stores its registry identifier, title, custom state and
// its ports, and connections are index tuples relative to the node list.
#pragma once
#include "FlowTypes.hpp"
#include "IdCounter.hpp"
#include <nlohmann/json.hpp>

namespace GraphFlow {

class Flow;
class Node;
class NodeRegistry;
struct Port;

nlohmann::json valueToJson(const Value& v);
Value valueFromJson(const nlohmann::json& j);

class FlowSerializer {
public:
    explicit FlowSerializer(const NodeRegistry& registry) : registry(registry) {}

    nlohmann::json serialize(const Flow& flow) const;
    nlohmann::json serializeNode(const Node& node) const;
    static nlohmann::json serializePort(const Port& port);

    // Adds the saved nodes and connections to `flow` and applies the saved
    // algorithm mode. Throws FlowError on unknown node identifiers or
    // connections that cannot be re-established, and nlohmann::json errors
    // on malformed data. Returns the previous-id table of the loaded nodes.
    IdRemap load(Flow& flow, const nlohmann::json& data) const;

private:
    const NodeRegistry& registry;
};

} // namespace GraphFlow
