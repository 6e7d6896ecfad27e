// Port.hpp
//
// Ports are the connection terminals of a node. They are owned by their node
// (stable addresses; flows index them by pointer) and carry the declared
// kind and allowed-data tag used for connection validity checks.
#pragma once
#include "FlowTypes.hpp"
#include <string>

namespace GraphFlow {

class Node;
class TypeRegistry;

// Declarative description of a port, used for static node ports and for
// ports created at runtime.
struct PortConfig {
    std::string label;
    PortKind kind = PortKind::Data;
    std::string allowedData; // empty = accepts anything
    Value defaultValue;      // inputs only
};

struct Port {
    Port(Node& owner, PortDirection dir, const PortConfig& config, GlobalId gid)
        : node(&owner), direction(dir), kind(config.kind), label(config.label),
          allowedData(config.allowedData), defaultValue(config.defaultValue), globalId(gid) {}

    Port(const Port&) = delete;
    Port& operator=(const Port&) = delete;

    bool isInput() const { return direction == PortDirection::Input; }
    bool isOutput() const { return direction == PortDirection::Output; }
    bool isData() const { return kind == PortKind::Data; }
    bool isExec() const { return kind == PortKind::Exec; }
    // Index of this port in its owner's input or output list
    int index() const;

    Node* node;
    PortDirection direction;
    PortKind kind;
    std::string label;
    std::string allowedData;
    Value defaultValue;
    Value value; // last value set on an output
    GlobalId globalId;
    std::optional<GlobalId> prevGlobalId; // set when loaded from data
};

// Structural validity of out -> inp, independent of existing connections.
ConnValidType checkValidConn(const Port& out, const Port& inp, const TypeRegistry& types);

} // namespace GraphFlow
