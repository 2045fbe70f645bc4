#include "src/server/script_engine.h"
#include "src/server/logger.h"

#include <memory>
#include <vector>

extern "C" {
#include "quickjs.h"
}

namespace jsgate {

namespace {

enum ConsoleChannel {
    kLogChannel = 0,
    kErrorChannel = 1,
    kWarnChannel = 2
};

struct Deadline {
    std::chrono::steady_clock::time_point at;
    bool expired = false;
};

int InterruptHandler(JSRuntime* /*rt*/, void* opaque) {
    auto* deadline = static_cast<Deadline*>(opaque);
    if (std::chrono::steady_clock::now() >= deadline->at) {
        deadline->expired = true;
        return 1;
    }
    return 0;
}

// Console lines recorded during one evaluation. log() lines come first in the
// joined output, error()/warn() lines after them.
class OutputAccumulator {
public:
    explicit OutputAccumulator(size_t limit) : limit_(limit) {}

    void Info(std::string line) { Append(info_, std::move(line)); }
    void Diagnostic(std::string line) { Append(diagnostics_, std::move(line)); }

    std::string Join() const {
        std::string out;
        auto add = [&out](const std::string& line) {
            if (!out.empty()) out += '\n';
            out += line;
        };
        for (const auto& line : info_) add(line);
        for (const auto& line : diagnostics_) add(line);
        if (truncated_) add("[output truncated]");
        return out;
    }

private:
    void Append(std::vector<std::string>& lines, std::string line) {
        if (truncated_) return;
        if (used_ + line.size() + 1 > limit_) {
            truncated_ = true;
            return;
        }
        used_ += line.size() + 1;
        lines.push_back(std::move(line));
    }

    size_t limit_;
    size_t used_ = 0;
    bool truncated_ = false;
    std::vector<std::string> info_;
    std::vector<std::string> diagnostics_;
};

// Points the console functions of |ctx| at |sink| for the lifetime of the guard.
// Console calls made outside a capture are dropped.
class ConsoleCapture {
public:
    ConsoleCapture(JSContext* ctx, OutputAccumulator* sink) : ctx_(ctx) {
        JS_SetContextOpaque(ctx_, sink);
    }
    ~ConsoleCapture() { JS_SetContextOpaque(ctx_, nullptr); }

    ConsoleCapture(const ConsoleCapture&) = delete;
    ConsoleCapture& operator=(const ConsoleCapture&) = delete;

private:
    JSContext* ctx_;
};

class ScopedValue {
public:
    ScopedValue(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
    ~ScopedValue() { JS_FreeValue(ctx_, value_); }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

    JSValue get() const { return value_; }
    bool IsException() const { return JS_IsException(value_); }

private:
    JSContext* ctx_;
    JSValue value_;
};

struct RuntimeDeleter {
    void operator()(JSRuntime* rt) const { JS_FreeRuntime(rt); }
};

struct ContextDeleter {
    void operator()(JSContext* ctx) const { JS_FreeContext(ctx); }
};

void DiscardException(JSContext* ctx) {
    JS_FreeValue(ctx, JS_GetException(ctx));
}

std::string ToStdString(JSContext* ctx, JSValueConst value) {
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        DiscardException(ctx);
        return "[unprintable]";
    }
    std::string out(str, len);
    JS_FreeCString(ctx, str);
    return out;
}

// log() renders objects as JSON; error() and warn() use plain String().
std::string FormatArgument(JSContext* ctx, JSValueConst value, bool structured) {
    if (structured && JS_IsNull(value)) {
        return "null";
    }
    if (structured && JS_IsObject(value) && !JS_IsFunction(ctx, value)) {
        ScopedValue json(ctx, JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED));
        if (json.IsException()) {
            DiscardException(ctx);
            return "[Object]";
        }
        if (JS_IsUndefined(json.get())) {
            return "undefined";
        }
        return ToStdString(ctx, json.get());
    }
    return ToStdString(ctx, value);
}

JSValue ConsoleWrite(JSContext* ctx, JSValueConst /*this_val*/, int argc, JSValueConst* argv, int magic) {
    auto* sink = static_cast<OutputAccumulator*>(JS_GetContextOpaque(ctx));
    if (!sink) {
        return JS_UNDEFINED;
    }
    std::string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) line += ' ';
        line += FormatArgument(ctx, argv[i], magic == kLogChannel);
    }
    switch (magic) {
        case kLogChannel: sink->Info(std::move(line)); break;
        case kErrorChannel: sink->Diagnostic("ERROR: " + line); break;
        case kWarnChannel: sink->Diagnostic("WARN: " + line); break;
    }
    return JS_UNDEFINED;
}

int ChannelFor(const std::string& member) {
    if (member == "error") return kErrorChannel;
    if (member == "warn") return kWarnChannel;
    return kLogChannel;
}

// Object.hasOwn is missing from older QuickJS releases.
JSValue MakeHasOwnFallback(JSContext* ctx) {
    static const char kSource[] =
        "(function (hasOwnProperty) {\n"
        "  return function hasOwn(object, key) { return hasOwnProperty.call(object, key); };\n"
        "})(Object.prototype.hasOwnProperty)";
    return JS_Eval(ctx, kSource, sizeof(kSource) - 1, "<hasOwn>", JS_EVAL_TYPE_GLOBAL);
}

bool BuildSandboxObject(JSContext* ctx, const SafeContext& context, JSValueConst global,
                        JSValueConst sandbox, std::string* error) {
    for (const auto& [name, capability] : context.bindings) {
        JSValue value = JS_UNDEFINED;
        switch (capability.kind) {
            case CapabilityKind::kConsole: {
                value = JS_NewObject(ctx);
                for (const auto& member : capability.members) {
                    JS_SetPropertyStr(ctx, value, member.c_str(),
                                      JS_NewCFunctionMagic(ctx, ConsoleWrite, member.c_str(), 0,
                                                           JS_CFUNC_generic_magic, ChannelFor(member)));
                }
                break;
            }
            case CapabilityKind::kIntrinsic:
                value = JS_GetPropertyStr(ctx, global, capability.source.c_str());
                if (JS_IsUndefined(value)) {
                    Logger::Warn("Interpreter has no built-in named ", capability.source);
                }
                break;
            case CapabilityKind::kFacade: {
                ScopedValue source(ctx, JS_GetPropertyStr(ctx, global, capability.source.c_str()));
                value = JS_NewObject(ctx);
                for (const auto& member : capability.members) {
                    JSValue method = JS_GetPropertyStr(ctx, source.get(), member.c_str());
                    if (JS_IsUndefined(method) && member == "hasOwn") {
                        method = MakeHasOwnFallback(ctx);
                    }
                    if (JS_IsException(method)) {
                        JS_FreeValue(ctx, value);
                        *error = "Failed to bind " + name + "." + member;
                        return false;
                    }
                    JS_SetPropertyStr(ctx, value, member.c_str(), method);
                }
                break;
            }
        }
        if (JS_IsException(value)) {
            *error = "Failed to bind " + name;
            return false;
        }
        if (JS_SetPropertyStr(ctx, sandbox, name.c_str(), value) < 0) {
            *error = "Failed to bind " + name;
            return false;
        }
    }
    return true;
}

// Deletes every configurable own property of the global object. What is left
// (undefined, NaN, Infinity) cannot be removed and is harmless.
void StripGlobals(JSContext* ctx, JSValueConst global) {
    JSPropertyEnum* props = nullptr;
    uint32_t count = 0;
    if (JS_GetOwnPropertyNames(ctx, &props, &count, global, JS_GPN_STRING_MASK | JS_GPN_SYMBOL_MASK) != 0) {
        DiscardException(ctx);
        return;
    }
    for (uint32_t i = 0; i < count; ++i) {
        if (JS_DeleteProperty(ctx, global, props[i].atom, 0) < 0) {
            DiscardException(ctx);
        }
        JS_FreeAtom(ctx, props[i].atom);
    }
    js_free(ctx, props);
}

std::string ExceptionMessage(JSContext* ctx) {
    ScopedValue exception(ctx, JS_GetException(ctx));
    if (JS_IsError(ctx, exception.get())) {
        ScopedValue message(ctx, JS_GetPropertyStr(ctx, exception.get(), "message"));
        if (JS_IsString(message.get())) {
            return ToStdString(ctx, message.get());
        }
    }
    return ToStdString(ctx, exception.get());
}

} // namespace

ScriptEngine::ScriptEngine(EngineLimits limits) : limits_(limits) {}

std::string ScriptEngine::WrapGuestCode(const SafeContext& context, const std::string& code) {
    std::string wrapped = "(function (sandbox) {\n\"use strict\";\n";
    for (const auto& binding : context.bindings) {
        wrapped += "const " + binding.first + " = sandbox." + binding.first + ";\n";
    }
    wrapped += "return (function () {\n";
    wrapped += code;
    wrapped += "\n})();\n})";
    return wrapped;
}

std::optional<EvaluationResult> ScriptEngine::Evaluate(const std::string& code, std::chrono::milliseconds budget) const {
    Deadline deadline{std::chrono::steady_clock::now() + budget, false};

    std::unique_ptr<JSRuntime, RuntimeDeleter> runtime(JS_NewRuntime());
    if (!runtime) {
        Logger::Error("Failed to create QuickJS runtime");
        return std::nullopt;
    }
    JS_SetMemoryLimit(runtime.get(), limits_.memory_bytes);
    JS_SetMaxStackSize(runtime.get(), limits_.stack_bytes);
    JS_SetInterruptHandler(runtime.get(), InterruptHandler, &deadline);

    std::unique_ptr<JSContext, ContextDeleter> context(JS_NewContext(runtime.get()));
    if (!context) {
        Logger::Error("Failed to create QuickJS context");
        return std::nullopt;
    }
    JSContext* ctx = context.get();

    SafeContext safe_context = CreateSafeContext();
    OutputAccumulator output(limits_.max_output_bytes);
    EvaluationResult evaluation;
    {
        ScopedValue global(ctx, JS_GetGlobalObject(ctx));
        ScopedValue sandbox(ctx, JS_NewObject(ctx));
        std::string bind_error;
        if (!BuildSandboxObject(ctx, safe_context, global.get(), sandbox.get(), &bind_error)) {
            Logger::Error("Safe context binding failed: ", bind_error);
            DiscardException(ctx);
            return std::nullopt;
        }
        StripGlobals(ctx, global.get());

        std::string wrapped = WrapGuestCode(safe_context, code);
        ConsoleCapture capture(ctx, &output);

        ScopedValue function(ctx, JS_Eval(ctx, wrapped.c_str(), wrapped.size(), "<guest>",
                                          JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_STRICT));
        if (function.IsException()) {
            evaluation.error = ExceptionMessage(ctx);
        } else {
            JSValue argv[] = {sandbox.get()};
            ScopedValue result(ctx, JS_Call(ctx, function.get(), JS_UNDEFINED, 1, argv));
            if (result.IsException()) {
                evaluation.error = ExceptionMessage(ctx);
            } else {
                if (!JS_IsUndefined(result.get())) {
                    evaluation.result = ToStdString(ctx, result.get());
                }
                // Settle promise reactions queued by async guest code.
                JSContext* job_ctx = nullptr;
                int job_status;
                while ((job_status = JS_ExecutePendingJob(runtime.get(), &job_ctx)) > 0) {
                }
                if (job_status < 0) {
                    evaluation.error = ExceptionMessage(job_ctx);
                }
            }
        }
    }

    if (deadline.expired) {
        evaluation.timed_out = true;
        evaluation.error = kTimeoutMessage;
    }
    if (evaluation.error) {
        evaluation.result.clear();
    }
    evaluation.output = output.Join();
    return evaluation;
}

} // namespace jsgate
