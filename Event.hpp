// Event.hpp
//
// Prioritized observer used by flows, nodes, executors and players.
// Subscribers are called in ascending priority ("nice") order and, on equal
// priority, in registration order. User code subscribes with nice 0..10;
// the negative range -5..-1 is reserved for engine internals and reachable
// only through subInternal(), which needs an InternalKey.
#pragma once
#include <functional>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <cstdint>

namespace GraphFlow {

class Flow;
class Node;
class Session;

// Passkey for internal subscriptions; only engine classes can make one.
class InternalKey {
    friend class Flow;
    friend class Node;
    friend class Session;
    InternalKey() = default;
};

using SubscriptionId = std::uint64_t;

template <typename... Args>
class Event {
public:
    using Callback = std::function<void(Args...)>;

    static constexpr int MinUserNice = 0;
    static constexpr int MaxNice = 10;
    static constexpr int MinInternalNice = -5;

    SubscriptionId sub(Callback callback, int nice = 0, bool oneOff = false) {
        if (nice < MinUserNice || nice > MaxNice) {
            throw std::invalid_argument("Event priority must be within [0, 10]");
        }
        return insert(std::move(callback), nice, oneOff);
    }

    SubscriptionId subInternal(const InternalKey&, Callback callback, int nice, bool oneOff = false) {
        if (nice < MinInternalNice || nice > MaxNice) {
            throw std::invalid_argument("Event priority must be within [-5, 10]");
        }
        return insert(std::move(callback), nice, oneOff);
    }

    // Returns false if the id is unknown (already removed or one-off fired)
    bool unsub(SubscriptionId id) {
        auto it = std::find_if(slots.begin(), slots.end(), [&](const Slot& s) { return s.id == id; });
        if (it == slots.end()) return false;
        slots.erase(it);
        return true;
    }

    void emit(Args... args) {
        // Iterate a snapshot so callbacks may sub/unsub while we run
        std::vector<Slot> snapshot = slots;
        std::vector<SubscriptionId> fired;
        for (auto& slot : snapshot) {
            slot.callback(args...);
            if (slot.oneOff) fired.push_back(slot.id);
        }
        for (SubscriptionId id : fired) unsub(id);
    }

    void clear() { slots.clear(); }
    size_t size() const { return slots.size(); }
    bool empty() const { return slots.empty(); }

private:
    struct Slot {
        SubscriptionId id;
        int nice;
        Callback callback;
        bool oneOff;
    };

    SubscriptionId insert(Callback callback, int nice, bool oneOff) {
        SubscriptionId id = nextId++;
        // upper_bound keeps registration order among equal priorities
        auto pos = std::upper_bound(slots.begin(), slots.end(), nice,
                                    [](int n, const Slot& s) { return n < s.nice; });
        slots.insert(pos, Slot{id, nice, std::move(callback), oneOff});
        return id;
    }

    std::vector<Slot> slots;
    SubscriptionId nextId = 1;
};

} // namespace GraphFlow
