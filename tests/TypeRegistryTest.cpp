#include "TypeRegistry.hpp"
#include <gtest/gtest.h>

using namespace GraphFlow;

TEST(TypeRegistryTest, UntypedInputAcceptsEverything) {
    auto types = TypeRegistry::builtin();
    EXPECT_TRUE(types->accepts("", ""));
    EXPECT_TRUE(types->accepts("", "int"));
    EXPECT_TRUE(types->accepts("", "custom"));
}

TEST(TypeRegistryTest, UntypedOutputOnlyFeedsUntypedInputs) {
    auto types = TypeRegistry::builtin();
    EXPECT_FALSE(types->accepts("int", ""));
}

TEST(TypeRegistryTest, NumericWidening) {
    auto types = TypeRegistry::builtin();
    EXPECT_TRUE(types->accepts("double", "int"));
    EXPECT_TRUE(types->accepts("number", "float"));
    EXPECT_FALSE(types->accepts("int", "double"));
    EXPECT_FALSE(types->accepts("string", "int"));
}

TEST(TypeRegistryTest, BearsChecksValueAlternatives) {
    auto types = TypeRegistry::builtin();
    EXPECT_TRUE(types->bears(Value{3}, "int"));
    EXPECT_FALSE(types->bears(Value{3.0}, "int"));
    EXPECT_TRUE(types->bears(Value{3.0}, "number"));
    EXPECT_TRUE(types->bears(Value{std::string("x")}, "string"));
    EXPECT_TRUE(types->bears(Value{}, "int"));
    EXPECT_TRUE(types->bears(Value{1}, ""));
    EXPECT_TRUE(types->bears(Value{1}, "opaque"));
}

TEST(TypeRegistryTest, CustomTags) {
    TypeRegistry types;
    types.registerType("even", [](const Value& v) {
        return std::holds_alternative<int>(v) && std::get<int>(v) % 2 == 0;
    });
    types.registerType("integral", [](const Value& v) { return std::holds_alternative<int>(v); }, {"even"});
    EXPECT_TRUE(types.isKnown("even"));
    EXPECT_TRUE(types.accepts("integral", "even"));
    EXPECT_FALSE(types.accepts("even", "integral"));
    EXPECT_TRUE(types.bears(Value{4}, "even"));
    EXPECT_FALSE(types.bears(Value{5}, "even"));
    EXPECT_THROW(types.registerType("", nullptr), std::invalid_argument);
}
