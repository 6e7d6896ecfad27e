// TypeRegistry.cpp
#include "TypeRegistry.hpp"

namespace GraphFlow {

std::shared_ptr<const TypeRegistry> TypeRegistry::builtin() {
    static const std::shared_ptr<const TypeRegistry> instance = [] {
        auto reg = std::make_shared<TypeRegistry>();
        registerBuiltins(*reg);
        return reg;
    }();
    return instance;
}

void TypeRegistry::registerBuiltins(TypeRegistry& registry) {
    registry.registerType("bool", [](const Value& v) { return std::holds_alternative<bool>(v); });
    registry.registerType("int", [](const Value& v) { return std::holds_alternative<int>(v); });
    // Numeric widening mirrors the int/float/double coercion allowed on wires
    registry.registerType("float", [](const Value& v) { return std::holds_alternative<float>(v); }, {"int"});
    registry.registerType("double", [](const Value& v) { return std::holds_alternative<double>(v); },
                          {"int", "float"});
    registry.registerType("number",
                          [](const Value& v) {
                              return std::holds_alternative<int>(v) || std::holds_alternative<float>(v) ||
                                     std::holds_alternative<double>(v);
                          },
                          {"int", "float", "double"});
    registry.registerType("string", [](const Value& v) { return std::holds_alternative<std::string>(v); });
}

void TypeRegistry::registerType(const std::string& tag, ValueCheck check, std::vector<std::string> accepts) {
    if (tag.empty()) throw std::invalid_argument("Type tag must not be empty");
    Entry entry;
    entry.check = std::move(check);
    entry.accepts.insert(tag);
    for (auto& t : accepts) entry.accepts.insert(std::move(t));
    entries[tag] = std::move(entry);
}

bool TypeRegistry::isKnown(const std::string& tag) const {
    return entries.count(tag) != 0;
}

bool TypeRegistry::accepts(const std::string& inputTag, const std::string& outputTag) const {
    if (inputTag.empty()) return true;
    if (outputTag.empty()) return false;
    if (inputTag == outputTag) return true;
    auto it = entries.find(inputTag);
    if (it == entries.end()) return false;
    return it->second.accepts.count(outputTag) != 0;
}

bool TypeRegistry::bears(const Value& value, const std::string& tag) const {
    if (tag.empty() || std::holds_alternative<std::monostate>(value)) return true;
    auto it = entries.find(tag);
    if (it == entries.end() || !it->second.check) return true;
    return it->second.check(value);
}

} // namespace GraphFlow
