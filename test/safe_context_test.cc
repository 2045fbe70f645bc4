#include "src/server/safe_context.h"

#include <gtest/gtest.h>
#include <iterator>

using jsgate::CapabilityKind;
using jsgate::CreateSafeContext;
using jsgate::SafeContext;

// NOLINTNEXTLINE
TEST(safe_context, exposes_only_the_allow_list) {
    SafeContext context = CreateSafeContext();
    const char* const expected[] = {
        "console", "Math", "Number", "String", "Array", "Object", "Boolean", "Date", "JSON",
        "RegExp", "Error", "TypeError", "ReferenceError", "SyntaxError", "parseInt",
        "parseFloat", "isNaN", "isFinite", "Infinity", "NaN",
    };
    for (const char* name : expected) {
        EXPECT_TRUE(context.Has(name)) << name;
    }
    EXPECT_EQ(context.bindings.size(), std::size(expected));
}

// NOLINTNEXTLINE
TEST(safe_context, has_no_ambient_bindings) {
    SafeContext context = CreateSafeContext();
    for (const char* name : {"window", "document", "globalThis", "fetch", "XMLHttpRequest", "localStorage",
                             "eval", "Function", "setTimeout", "Reflect", "Proxy", "process", "require"}) {
        EXPECT_FALSE(context.Has(name)) << name;
        EXPECT_EQ(context.Find(name), nullptr) << name;
    }
}

// NOLINTNEXTLINE
TEST(safe_context, console_has_three_channels) {
    SafeContext context = CreateSafeContext();
    const auto* console = context.Find("console");
    ASSERT_NE(console, nullptr);
    EXPECT_EQ(console->kind, CapabilityKind::kConsole);
    EXPECT_EQ(console->members, (std::vector<std::string>{"log", "error", "warn"}));
}

// NOLINTNEXTLINE
TEST(safe_context, object_is_a_reduced_facade) {
    SafeContext context = CreateSafeContext();
    const auto* object = context.Find("Object");
    ASSERT_NE(object, nullptr);
    EXPECT_EQ(object->kind, CapabilityKind::kFacade);
    EXPECT_EQ(object->source, "Object");
    EXPECT_EQ(object->members, (std::vector<std::string>{"keys", "values", "entries", "assign", "create",
                                                         "freeze", "seal", "is", "hasOwn"}));
    for (const auto& member : object->members) {
        EXPECT_NE(member, "getPrototypeOf");
        EXPECT_NE(member, "setPrototypeOf");
        EXPECT_NE(member, "defineProperty");
    }
}

// NOLINTNEXTLINE
TEST(safe_context, every_call_builds_the_same_context) {
    SafeContext first = CreateSafeContext();
    SafeContext second = CreateSafeContext();
    ASSERT_EQ(first.bindings.size(), second.bindings.size());
    for (const auto& [name, capability] : first.bindings) {
        const auto* other = second.Find(name);
        ASSERT_NE(other, nullptr) << name;
        EXPECT_EQ(capability.kind, other->kind);
        EXPECT_EQ(capability.source, other->source);
        EXPECT_EQ(capability.members, other->members);
    }
}
