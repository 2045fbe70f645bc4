#include "src/server/safe_context.h"

#include <iterator>

namespace jsgate {

namespace {

const char* const kIntrinsics[] = {
    "Math", "Number", "String", "Array", "Boolean", "Date", "JSON", "RegExp",
    "Error", "TypeError", "ReferenceError", "SyntaxError",
    "parseInt", "parseFloat", "isNaN", "isFinite", "Infinity", "NaN",
};

// getPrototypeOf, setPrototypeOf, defineProperty and friends are left out on purpose.
const char* const kObjectMembers[] = {
    "keys", "values", "entries", "assign", "create", "freeze", "seal", "is", "hasOwn",
};

} // namespace

const Capability* SafeContext::Find(const std::string& name) const {
    auto it = bindings.find(name);
    return it == bindings.end() ? nullptr : &it->second;
}

SafeContext CreateSafeContext() {
    SafeContext context;
    context.bindings.emplace("console", Capability{CapabilityKind::kConsole, "console", {"log", "error", "warn"}});

    for (const char* name : kIntrinsics) {
        context.bindings.emplace(name, Capability{CapabilityKind::kIntrinsic, name, {}});
    }

    Capability object{CapabilityKind::kFacade, "Object", {}};
    object.members.assign(std::begin(kObjectMembers), std::end(kObjectMembers));
    context.bindings.emplace("Object", std::move(object));
    return context;
}

} // namespace jsgate
