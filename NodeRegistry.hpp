// NodeRegistry.hpp
//
// Maps node identifiers (as stored in saved flows) to factories and back.
#pragma once
#include "FlowTypes.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace GraphFlow {

class Flow;
class Node;

class NodeRegistry {
public:
    using Factory = std::function<std::unique_ptr<Node>(Flow&)>;

    // T must be constructible from (Flow&)
    template <typename T>
    void registerNode(const std::string& identifier) {
        registerNode(identifier, std::type_index(typeid(T)), [](Flow& f) { return std::make_unique<T>(f); });
    }
    // Throws FlowError if the identifier or the type is already registered
    void registerNode(const std::string& identifier, std::type_index type, Factory factory);

    bool contains(const std::string& identifier) const;
    // Throws FlowError for unknown identifiers
    std::unique_ptr<Node> create(const std::string& identifier, Flow& flow) const;
    std::optional<std::string> identifierOf(const Node& node) const;
    std::vector<std::string> identifiers() const;

private:
    std::unordered_map<std::string, Factory> factories;
    std::unordered_map<std::type_index, std::string> byType;
    std::vector<std::string> order;
};

} // namespace GraphFlow
