// IdCounter.cpp
#include "IdCounter.hpp"
#include <string>

namespace GraphFlow {

GlobalId IdCounter::next() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!started) {
        started = true;
        counter = 0;
        return counter;
    }
    return ++counter;
}

void IdCounter::setCount(GlobalId count) {
    std::lock_guard<std::mutex> lock(mutex);
    if (started && count < counter) {
        throw FlowError("Decreasing id counter from " + std::to_string(counter) +
                        " to " + std::to_string(count) + " is not allowed");
    }
    counter = count;
    started = true;
}

std::optional<GlobalId> IdCounter::current() const {
    std::lock_guard<std::mutex> lock(mutex);
    if (!started) return std::nullopt;
    return counter;
}

void IdRemap::add(GlobalId previousId, Node* node) {
    byPrevId[previousId] = node;
}

Node* IdRemap::find(GlobalId previousId) const {
    auto it = byPrevId.find(previousId);
    return it == byPrevId.end() ? nullptr : it->second;
}

} // namespace GraphFlow
