#include "capsule/dispatcher.h"
#include "capsule/json_mini.h"

#include <chrono>
#include <iostream>

namespace capsule {

using Clock = std::chrono::steady_clock;

CallResult CallResult::success(Value v) {
    CallResult r;
    r.ok = true;
    r.value = std::move(v);
    return r;
}

CallResult CallResult::failure(CallErrorKind k, std::string detail) {
    CallResult r;
    r.error.kind = k;
    r.error.detail = std::move(detail);
    return r;
}

CallResult CallDispatcher::invoke(const Invocation& inv) {
    const auto started = Clock::now();
    auto finish = [&](CallResult r) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
        audit_call(inv, r, (long long)ms);
        return r;
    };

    auto rec = registry_->get(inv.component_id);
    if (rec && rec->status == ComponentState::Failed) {
        rec = registry_->ensure_ready(inv.component_id);
        if (!rec) {
            if (registry_->get(inv.component_id)) {
                return finish(CallResult::failure(CallErrorKind::ComponentFault,
                                                  "component failed and could not be restarted"));
            }
            return finish(CallResult::failure(CallErrorKind::NotFound, "unknown component: " + inv.component_id));
        }
    }
    if (!rec || rec->status != ComponentState::Ready || !rec->pool) {
        return finish(CallResult::failure(CallErrorKind::NotFound, "unknown component: " + inv.component_id));
    }

    const ToolSignature* sig = rec->schema.find(inv.function);
    if (!sig) {
        return finish(CallResult::failure(CallErrorKind::NotFound,
                                          inv.component_id + " has no tool " + inv.function));
    }

    if (inv.args.size() != sig->params.size()) {
        return finish(CallResult::failure(CallErrorKind::TypeMismatch,
                                          "expected " + std::to_string(sig->params.size()) +
                                              " arguments, got " + std::to_string(inv.args.size())));
    }
    for (size_t i = 0; i < sig->params.size(); i++) {
        CodecError ce;
        if (!validate_value(inv.args[i], sig->params[i].type, sig->params[i].name, &ce)) {
            CallResult r = CallResult::failure(CallErrorKind::TypeMismatch, ce.message);
            r.error.path = ce.path;
            return finish(r);
        }
    }

    const SteadyTime deadline = inv.deadline.value_or(
        Clock::now() + std::chrono::milliseconds(registry_->config().call_timeout_ms));
    const CancelToken* cancel = inv.cancel.get();

    InstanceReply reply;
    {
        InstancePool::Lease lease = rec->pool->acquire(deadline, cancel);
        if (!lease) {
            if (cancel && cancel->cancelled()) {
                return finish(CallResult::failure(CallErrorKind::Cancelled, "cancelled while queued"));
            }
            if (Clock::now() >= deadline) {
                return finish(CallResult::failure(CallErrorKind::Timeout, "no free instance before the deadline"));
            }
            return finish(CallResult::failure(CallErrorKind::NotFound, inv.component_id + " is unloading"));
        }
        reply = lease->call(sig->export_name, encode_arguments(inv.args, *sig), deadline, cancel);
    }

    if (reply.lost) registry_->mark_failed(inv.component_id, rec.get(), reply.error.detail);
    if (!reply.ok) {
        CallResult r;
        r.error = reply.error;
        return finish(r);
    }

    Value v;
    CodecError ce;
    if (!decode_result_text(reply.result_json, sig->result, &v, &ce)) {
        CallResult r = CallResult::failure(CallErrorKind::ComponentFault,
                                           "result does not match the declared type: " + ce.message);
        r.error.path = ce.path;
        return finish(r);
    }
    CallResult ok = CallResult::success(std::move(v));
    ok.result_type = sig->result;
    return finish(ok);
}

CallResult CallDispatcher::invoke_json(const ComponentId& id, const std::string& function, json_object* args,
                                       std::optional<SteadyTime> deadline, std::shared_ptr<CancelToken> cancel) {
    auto rec = registry_->get(id);
    const ToolSignature* sig = rec ? rec->schema.find(function) : nullptr;
    if (!sig) {
        Invocation inv;
        inv.component_id = id;
        inv.function = function;
        return invoke(inv); // reports NotFound the usual way
    }

    Invocation inv;
    inv.component_id = id;
    inv.function = function;
    inv.deadline = deadline;
    inv.cancel = std::move(cancel);
    CodecError ce;
    if (!decode_arguments(args, *sig, &inv.args, &ce)) {
        CallResult r = CallResult::failure(CallErrorKind::TypeMismatch, ce.message);
        r.error.path = ce.path;
        audit_call(inv, r, 0);
        return r;
    }
    return invoke(inv);
}

void CallDispatcher::audit_call(const Invocation& inv, const CallResult& r, long long elapsed_ms) {
    if (!r.ok && r.error.kind == CallErrorKind::ComponentFault) {
        std::cerr << "[dispatch] " << inv.component_id << "." << inv.function << ": fault: "
                  << r.error.detail << "\n";
    }
    if (!audit_ || !audit_->enabled()) return;
    json_mini::Doc p(json_object_new_object());
    json_object_object_add(p.root, "component", json_mini::new_string(inv.component_id));
    json_object_object_add(p.root, "function", json_mini::new_string(inv.function));
    json_object_object_add(p.root, "outcome", json_mini::new_string(r.ok ? "ok" : call_error_name(r.error.kind)));
    json_object_object_add(p.root, "elapsed_ms", json_object_new_int64(elapsed_ms));
    if (!r.ok && r.error.kind == CallErrorKind::CapabilityDenied) {
        json_object_object_add(p.root, "capability",
                               json_mini::new_string(capability_kind_name(r.error.capability)));
    }
    audit_->event("call", json_mini::dump(p.root));
}

} // namespace capsule
