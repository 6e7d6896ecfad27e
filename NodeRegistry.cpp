// NodeRegistry.cpp
#include "NodeRegistry.hpp"
#include "Node.hpp"

namespace GraphFlow {

void NodeRegistry::registerNode(const std::string& identifier, std::type_index type, Factory factory) {
    if (identifier.empty()) throw FlowError("Node identifier must not be empty");
    if (factories.count(identifier)) throw FlowError("Node identifier already registered: " + identifier);
    if (byType.count(type)) throw FlowError("Node type already registered as: " + byType.at(type));
    factories.emplace(identifier, std::move(factory));
    byType.emplace(type, identifier);
    order.push_back(identifier);
}

bool NodeRegistry::contains(const std::string& identifier) const {
    return factories.count(identifier) != 0;
}

std::unique_ptr<Node> NodeRegistry::create(const std::string& identifier, Flow& flow) const {
    auto it = factories.find(identifier);
    if (it == factories.end()) throw FlowError("Unknown node identifier: " + identifier);
    return it->second(flow);
}

std::optional<std::string> NodeRegistry::identifierOf(const Node& node) const {
    auto it = byType.find(std::type_index(typeid(node)));
    if (it == byType.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> NodeRegistry::identifiers() const {
    return order;
}

} // namespace GraphFlow
