// TypeRegistry.hpp
//
// Allowed-data type tags for data ports. Each tag has a value check (does a
// Value bear this tag?) and a set of tags it accepts on connect (itself plus
// narrower tags). An empty tag is "anything": an untyped input accepts every
// output, an untyped output only connects to untyped inputs.
//
// Flows receive the registry by shared pointer, so applications can inject
// their own tags without touching the engine.
#pragma once
#include "FlowTypes.hpp"
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace GraphFlow {

class TypeRegistry {
public:
    using ValueCheck = std::function<bool(const Value&)>;

    // Shared registry preloaded with bool, int, float, double, number, string
    static std::shared_ptr<const TypeRegistry> builtin();
    static void registerBuiltins(TypeRegistry& registry);

    // Adds or replaces a tag. `accepts` lists narrower tags an input of this
    // tag may be fed from, in addition to the tag itself.
    void registerType(const std::string& tag, ValueCheck check, std::vector<std::string> accepts = {});
    bool isKnown(const std::string& tag) const;

    // Connect-time check: may an output declared `outputTag` feed an input
    // declared `inputTag`?
    bool accepts(const std::string& inputTag, const std::string& outputTag) const;
    // Set-time check. Empty values are always bearable; unknown tags are
    // opaque and bear anything.
    bool bears(const Value& value, const std::string& tag) const;

private:
    struct Entry {
        ValueCheck check;
        std::unordered_set<std::string> accepts;
    };
    std::unordered_map<std::string, Entry> entries;
};

} // namespace GraphFlow
