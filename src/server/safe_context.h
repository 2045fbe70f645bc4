#pragma once

#include <map>
#include <string>
#include <vector>

namespace jsgate {

enum class CapabilityKind {
    // Output-recording console with log/error/warn channels.
    kConsole,
    // An interpreter built-in passed through as-is (constructor, function or value).
    kIntrinsic,
    // A fresh object carrying only the listed members of an intrinsic.
    kFacade
};

struct Capability {
    CapabilityKind kind;
    // Name of the interpreter built-in the capability is taken from.
    std::string source;
    // Members exposed by kConsole and kFacade capabilities.
    std::vector<std::string> members;
};

// The complete set of names visible to guest code. It describes capabilities
// but holds no interpreter state, so it is safe to build anywhere.
struct SafeContext {
    std::map<std::string, Capability> bindings;

    bool Has(const std::string& name) const { return bindings.count(name) > 0; }
    const Capability* Find(const std::string& name) const;
};

// Stateless; returns the same bindings on every call.
SafeContext CreateSafeContext();

} // namespace jsgate
