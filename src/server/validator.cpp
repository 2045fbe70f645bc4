#include "src/server/validator.h"

#include <algorithm>
#include <memory>

#include <re2/re2.h>

namespace jsgate {

namespace {

enum class Category {
    kDynamicEvaluation,
    kAmbientGlobal,
    kModuleLoading,
    kNetwork,
    kStorage,
    kStringTimer,
    kPrototypeMutation,
    kReflection,
    kHostProcess,
    kLowLevelMemory,
    kDomMutation,
    kEventHijack,
    kNavigation,
    kDeviceAccess,
    kDebugging,
    kMessaging,
    kObfuscation
};

const char* CategoryName(Category category) {
    switch (category) {
        case Category::kDynamicEvaluation: return "dynamic evaluation";
        case Category::kAmbientGlobal: return "ambient global access";
        case Category::kModuleLoading: return "module loading";
        case Category::kNetwork: return "network access";
        case Category::kStorage: return "storage access";
        case Category::kStringTimer: return "string timer";
        case Category::kPrototypeMutation: return "prototype mutation";
        case Category::kReflection: return "reflection";
        case Category::kHostProcess: return "host process access";
        case Category::kLowLevelMemory: return "low-level memory";
        case Category::kDomMutation: return "DOM mutation";
        case Category::kEventHijack: return "event hijacking";
        case Category::kNavigation: return "navigation";
        case Category::kDeviceAccess: return "device access";
        case Category::kDebugging: return "debugging construct";
        case Category::kMessaging: return "messaging";
        case Category::kObfuscation: return "obfuscation";
    }
    return "unknown";
}

struct Signature {
    Category category;
    const char* pattern;
};

// Declaration order is report order.
const Signature kSignatures[] = {
    {Category::kDynamicEvaluation, R"(\beval\s*\()"},
    {Category::kDynamicEvaluation, R"(\bFunction\s*\()"},
    {Category::kDynamicEvaluation, R"(\bnew\s+Function\s*\()"},

    {Category::kAmbientGlobal, R"(\bwindow\b)"},
    {Category::kAmbientGlobal, R"(\bdocument\b)"},
    {Category::kAmbientGlobal, R"(\bglobalThis\b)"},
    {Category::kAmbientGlobal, R"(\bglobal\b)"},
    {Category::kAmbientGlobal, R"(\bself\b)"},
    {Category::kAmbientGlobal, R"(\btop\b)"},
    {Category::kAmbientGlobal, R"(\bparent\b)"},
    {Category::kAmbientGlobal, R"(\bframes\b)"},

    {Category::kNetwork, R"(\bfetch\s*\()"},
    {Category::kNetwork, R"(\bXMLHttpRequest\b)"},
    {Category::kNetwork, R"(\bWebSocket\b)"},
    {Category::kNetwork, R"(\bEventSource\b)"},
    {Category::kNetwork, R"(\bRTCPeerConnection\b)"},

    {Category::kModuleLoading, R"(\brequire\s*\()"},
    {Category::kModuleLoading, R"(\bimport\s+)"},
    {Category::kModuleLoading, R"(\bimport\s*\()"},
    {Category::kModuleLoading, R"(\bexport\s+)"},

    {Category::kStorage, R"(\blocalStorage\b)"},
    {Category::kStorage, R"(\bsessionStorage\b)"},
    {Category::kStorage, R"(\bindexedDB\b)"},
    {Category::kStorage, R"(\bcookie\b)"},
    {Category::kStorage, R"(\bdocument\.cookie\b)"},

    {Category::kStringTimer, R"(\bsetTimeout\s*\(\s*["'`])"},
    {Category::kStringTimer, R"(\bsetInterval\s*\(\s*["'`])"},
    {Category::kStringTimer, R"(\bsetImmediate\s*\(\s*["'`])"},

    {Category::kPrototypeMutation, R"(\.__proto__\s*=)"},
    {Category::kPrototypeMutation, R"(\.constructor\s*=)"},
    {Category::kPrototypeMutation, R"(\bObject\.prototype\b)"},
    {Category::kPrototypeMutation, R"(\bArray\.prototype\b)"},
    {Category::kPrototypeMutation, R"(\bString\.prototype\b)"},

    {Category::kReflection, R"(\bReflect\s*\.)"},
    {Category::kReflection, R"(\bProxy\s*\()"},

    {Category::kHostProcess, R"(\bprocess\b)"},
    {Category::kHostProcess, R"(\bchild_process\b)"},
    {Category::kHostProcess, R"(\bos\b)"},

    {Category::kLowLevelMemory, R"(\bWebAssembly\b)"},
    {Category::kLowLevelMemory, R"(\bSharedArrayBuffer\b)"},

    {Category::kDomMutation, R"(\binnerHTML\s*=)"},
    {Category::kDomMutation, R"(\bouterHTML\s*=)"},
    {Category::kDomMutation, R"(\binsertAdjacentHTML\s*\()"},
    {Category::kDomMutation, R"(\bdocument\.write\s*\()"},
    {Category::kDomMutation, R"(\bdocument\.writeln\s*\()"},
    {Category::kDomMutation, R"(\bcreateElement\s*\()"},
    {Category::kDomMutation, R"(\bappendChild\s*\()"},
    {Category::kDomMutation, R"(\bremoveChild\s*\()"},
    {Category::kDomMutation, R"(\bcreateTextNode\s*\()"},
    {Category::kDomMutation, R"(\bstyle\s*=)"},
    {Category::kDomMutation, R"(\bsetAttribute\s*\()"},
    {Category::kDomMutation, R"(\bcreateScript\b)"},
    {Category::kDomMutation, R"(\bscript\s*=)"},
    {Category::kDomMutation, R"(\bcreateElement\s*\(\s*["']iframe)"},
    {Category::kDomMutation, R"(\biframe\b)"},

    {Category::kEventHijack, R"(\baddEventListener\s*\()"},
    {Category::kEventHijack, R"(\battachEvent\s*\()"},

    {Category::kNavigation, R"(\blocation\s*=)"},
    {Category::kNavigation, R"(\bwindow\.location\b)"},
    {Category::kNavigation, R"(\bhistory\s*\.)"},

    {Category::kDeviceAccess, R"(\bclipboard\b)"},
    {Category::kDeviceAccess, R"(\bnavigator\.clipboard\b)"},
    {Category::kDeviceAccess, R"(\bnavigator\.geolocation\b)"},
    {Category::kDeviceAccess, R"(\bgetUserMedia\s*\()"},
    {Category::kDeviceAccess, R"(\bMediaDevices\b)"},
    {Category::kDeviceAccess, R"(\bserviceWorker\b)"},
    {Category::kDeviceAccess, R"(\bnavigator\.serviceWorker\b)"},

    {Category::kDebugging, R"(\bwith\s*\()"},
    {Category::kDebugging, R"(\bdebugger\b)"},

    {Category::kMessaging, R"(\bpostMessage\s*\()"},
    {Category::kMessaging, R"(\bMessageChannel\b)"},
    {Category::kMessaging, R"(\bBroadcastChannel\b)"},

    {Category::kObfuscation, R"(\batob\s*\()"},
    {Category::kObfuscation, R"(\bbtoa\s*\()"},
    {Category::kObfuscation, R"(\\u[0-9a-f]{4})"},
    {Category::kObfuscation, R"(\\x[0-9a-f]{2})"},
};

// Bare identifiers that are rejected when called.
const char* const kDangerousFunctions[] = {
    "eval", "Function", "setTimeout", "setInterval", "setImmediate",
    "clearTimeout", "clearInterval", "clearImmediate", "fetch", "XMLHttpRequest",
    "WebSocket", "EventSource", "require", "import", "export",
    "localStorage", "sessionStorage", "indexedDB", "document", "window",
    "globalThis", "global", "self", "top", "parent",
    "frames", "process", "Reflect", "Proxy", "WebAssembly",
    "SharedArrayBuffer", "postMessage", "MessageChannel", "BroadcastChannel", "navigator",
    "location", "history", "atob", "btoa",
};

struct CompiledSignature {
    Category category;
    std::string source;
    std::unique_ptr<RE2> regex;
};

struct CompiledFunction {
    std::string name;
    std::unique_ptr<RE2> regex;
};

// RE2 matches in linear time without recursion, so a long whitespace run
// after a keyword cannot exhaust the stack of the calling thread.
std::unique_ptr<RE2> CompileDenyPattern(const std::string& pattern) {
    RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);
    return std::make_unique<RE2>(pattern, options);
}

// Compiled once; RE2 objects are thread-safe for concurrent matching.
const std::vector<CompiledSignature>& Signatures() {
    static const std::vector<CompiledSignature> compiled = [] {
        std::vector<CompiledSignature> out;
        for (const auto& signature : kSignatures) {
            out.push_back({signature.category, signature.pattern, CompileDenyPattern(signature.pattern)});
        }
        return out;
    }();
    return compiled;
}

const std::vector<CompiledFunction>& DangerousFunctions() {
    static const std::vector<CompiledFunction> compiled = [] {
        std::vector<CompiledFunction> out;
        for (const char* name : kDangerousFunctions) {
            out.push_back({name, CompileDenyPattern(std::string("\\b") + name + "\\s*\\(")});
        }
        return out;
    }();
    return compiled;
}

const RE2& PrototypePollution() {
    static const RE2 regex(R"(\.__proto__|\.constructor\[|Object\.prototype|Array\.prototype)");
    return regex;
}

const RE2& InfiniteLoop() {
    static const RE2 regex(R"(while\s*\(\s*true\s*\)|for\s*\(\s*;\s*;\s*\)|for\s*\(\s*;\s*true\s*;)");
    return regex;
}

bool IsStrippedControl(unsigned char c) {
    if (c == '\t' || c == '\n' || c == '\r') return false;
    return c < 0x20 || c == 0x7f;
}

} // namespace

ValidationResult ValidateCode(const std::string& code) {
    ValidationResult result{false, {}, {}};

    if (code.empty()) {
        result.errors.push_back("Code must be a non-empty string");
        return result;
    }

    for (const auto& signature : Signatures()) {
        if (RE2::PartialMatch(code, *signature.regex)) {
            result.errors.push_back(std::string("Dangerous pattern detected (") +
                                    CategoryName(signature.category) + "): " + signature.source);
        }
    }

    for (const auto& function : DangerousFunctions()) {
        if (RE2::PartialMatch(code, *function.regex)) {
            result.errors.push_back("Dangerous function call detected: " + function.name + "()");
        }
    }

    if (RE2::PartialMatch(code, PrototypePollution())) {
        result.errors.push_back("Prototype pollution attempt detected");
    }

    if (code.size() > kMaxCodeLength) {
        result.warnings.push_back("Code is very long and may cause performance issues");
    }
    if (MaxBraceDepth(code) > kMaxBraceDepth) {
        result.warnings.push_back("Code has very deep nesting which may cause stack overflow");
    }
    if (RE2::PartialMatch(code, InfiniteLoop())) {
        result.warnings.push_back("Potential infinite loop detected");
    }

    result.valid = result.errors.empty();
    return result;
}

std::string SanitizeCode(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    for (char c : code) {
        if (!IsStrippedControl(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

int MaxBraceDepth(const std::string& code) {
    int depth = 0;
    int max_depth = 0;
    for (char c : code) {
        if (c == '{') {
            max_depth = std::max(max_depth, ++depth);
        } else if (c == '}' && depth > 0) {
            --depth;
        }
    }
    return max_depth;
}

} // namespace jsgate
