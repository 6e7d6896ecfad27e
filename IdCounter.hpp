// IdCounter.hpp
//
// Explicit identity service. A session owns one counter and hands it to its
// flows; every node and port draws its global id from it. Loading saved data
// rebuilds an IdRemap so objects can be found by the id they had when they
// were saved.
#pragma once
#include "FlowTypes.hpp"
#include <unordered_map>
#include <mutex>

namespace GraphFlow {

class Node;

class IdCounter {
public:
    IdCounter() = default;
    IdCounter(const IdCounter&) = delete;
    IdCounter& operator=(const IdCounter&) = delete;

    // Ascending ids starting at 0
    GlobalId next();
    // Raises the counter so the next id is count + 1. Decreasing is refused.
    void setCount(GlobalId count);
    // Last id handed out, or nullopt if none yet
    std::optional<GlobalId> current() const;

private:
    mutable std::mutex mutex;
    GlobalId counter = 0;
    bool started = false;
};

// Previous-id to object table for one load operation
class IdRemap {
public:
    void add(GlobalId previousId, Node* node);
    Node* find(GlobalId previousId) const;
    size_t size() const { return byPrevId.size(); }
    void clear() { byPrevId.clear(); }

private:
    std::unordered_map<GlobalId, Node*> byPrevId;
};

} // namespace GraphFlow
