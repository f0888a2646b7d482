#pragma once

#include "instance.h"
#include "log.h"
#include "registry.h"
#include "types.h"
#include "value.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capsule {

struct Invocation {
    ComponentId component_id;
    std::string function;                  // normalised tool name
    std::vector<Value> args;               // declared parameter order
    std::optional<SteadyTime> deadline;    // default: now + call timeout
    std::shared_ptr<CancelToken> cancel;   // optional
};

struct CallResult {
    bool ok{false};
    Value value;
    TypeTree result_type; // declared type of `value` at call time
    CallError error;

    static CallResult success(Value v);
    static CallResult failure(CallErrorKind k, std::string detail);
};

class CallDispatcher {
public:
    CallDispatcher(ComponentRegistry* registry, AuditLog* audit)
        : registry_(registry), audit_(audit) {}

    // Never throws; every outcome is a CallResult.
    CallResult invoke(const Invocation& inv);

    // Decode a named-argument object against the tool's signature, then invoke.
    CallResult invoke_json(const ComponentId& id, const std::string& function, json_object* args,
                           std::optional<SteadyTime> deadline, std::shared_ptr<CancelToken> cancel);

private:
    void audit_call(const Invocation& inv, const CallResult& r, long long elapsed_ms);

    ComponentRegistry* registry_;
    AuditLog* audit_;
};

} // namespace capsule
