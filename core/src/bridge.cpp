#include "capsule/bridge.h"
#include "capsule/crypto.h"
#include "capsule/json_mini.h"

#include <iostream>
#include <vector>

namespace capsule {

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kSessionClosing = -32000;

const char* const kSupportedProtocols[] = {"2025-06-18", "2025-03-26", "2024-11-05"};

struct ManagementTool {
    const char* name;
    const char* description;
    const char* input_schema;
};

const ManagementTool kManagementTools[] = {
    {"load-component",
     "Load a component binary from a path on the host and expose its functions as tools.",
     R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})"},
    {"unload-component",
     "Unload a component by id. In-flight calls are allowed to finish first.",
     R"({"type":"object","properties":{"id":{"type":"string"}},"required":["id"]})"},
    {"list-components",
     "List loaded components with their status and tools.",
     R"({"type":"object","properties":{}})"},
    {"get-policy",
     "Show the capability grants of a component as a permission document.",
     R"({"type":"object","properties":{"component_id":{"type":"string"}},"required":["component_id"]})"},
    {"grant-network-permission",
     "Allow a component to reach a host (exact name or *.suffix).",
     R"({"type":"object","properties":{"component_id":{"type":"string"},"host":{"type":"string"}},)"
     R"("required":["component_id","host"]})"},
    {"grant-storage-permission",
     "Allow a component to read and/or write below a path prefix (fs:// URI or absolute path).",
     R"({"type":"object","properties":{"component_id":{"type":"string"},"uri":{"type":"string"},)"
     R"("access":{"type":"array","items":{"enum":["read","write"]}}},"required":["component_id","uri","access"]})"},
    {"grant-environment-variable-permission",
     "Allow a component to read one host environment variable.",
     R"({"type":"object","properties":{"component_id":{"type":"string"},"key":{"type":"string"}},)"
     R"("required":["component_id","key"]})"},
    {"revoke-network-permission",
     "Remove a network grant from a component.",
     R"({"type":"object","properties":{"component_id":{"type":"string"},"host":{"type":"string"}},)"
     R"("required":["component_id","host"]})"},
    {"revoke-storage-permission",
     "Remove a storage grant, or only the listed access modes of it.",
     R"({"type":"object","properties":{"component_id":{"type":"string"},"uri":{"type":"string"},)"
     R"("access":{"type":"array","items":{"enum":["read","write"]}}},"required":["component_id","uri"]})"},
    {"revoke-environment-variable-permission",
     "Remove an environment variable grant from a component.",
     R"({"type":"object","properties":{"component_id":{"type":"string"},"key":{"type":"string"}},)"
     R"("required":["component_id","key"]})"},
    {"reset-permission",
     "Drop every grant of a component.",
     R"({"type":"object","properties":{"component_id":{"type":"string"}},"required":["component_id"]})"},
};

// MCP tool result around a structured payload (takes ownership).
json_object* tool_result(json_object* payload, bool is_error) {
    json_object* text = json_object_new_object();
    json_object_object_add(text, "type", json_object_new_string("text"));
    json_object_object_add(text, "text", json_mini::new_string(json_mini::dump(payload)));
    json_object* content = json_object_new_array();
    json_object_array_add(content, text);

    json_object* r = json_object_new_object();
    json_object_object_add(r, "content", content);
    json_object_object_add(r, "structuredContent", payload);
    json_object_object_add(r, "isError", json_object_new_boolean(is_error ? 1 : 0));
    return r;
}

json_object* error_payload(const char* kind, const std::string& message) {
    json_object* e = json_object_new_object();
    json_object_object_add(e, "kind", json_object_new_string(kind));
    json_object_object_add(e, "message", json_mini::new_string(message));
    json_object* p = json_object_new_object();
    json_object_object_add(p, "error", e);
    return p;
}

json_object* tool_error(const char* kind, const std::string& message) {
    return tool_result(error_payload(kind, message), true);
}

json_object* policy_error_result(const PolicyError& e) {
    json_object* p = error_payload("PolicyError", e.message);
    json_object_object_add(json_mini::member(p, "error"), "reason",
                           json_object_new_string(policy_error_name(e.kind)));
    return tool_result(p, true);
}

json_object* status_result(const std::string& status, const std::string& component) {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "status", json_mini::new_string(status));
    if (!component.empty()) json_object_object_add(p, "id", json_mini::new_string(component));
    return tool_result(p, false);
}

bool parse_access(json_object* args, unsigned* access, std::string* err) {
    json_object* arr = json_mini::member(args, "access");
    *access = 0;
    if (!arr) return true;
    if (!json_object_is_type(arr, json_type_array)) {
        *err = "access must be an array of \"read\" / \"write\"";
        return false;
    }
    for (size_t i = 0; i < json_object_array_length(arr); i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        std::string a = el && json_object_is_type(el, json_type_string) ? json_object_get_string(el) : "";
        if (a == "read") *access |= FS_READ;
        else if (a == "write") *access |= FS_WRITE;
        else {
            *err = "unknown access mode '" + a + "'";
            return false;
        }
    }
    return true;
}

std::string rpc_envelope(const std::string& request_id) {
    return "{\"jsonrpc\":\"2.0\",\"id\":" + request_id;
}

} // namespace

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::Connected:   return "connected";
        case SessionState::Discovering: return "discovering";
        case SessionState::Serving:     return "serving";
        case SessionState::Closing:     return "closing";
        case SessionState::Closed:      return "closed";
    }
    return "unknown";
}

bool split_tool_name(const std::string& qualified, ComponentId* id, std::string* function) {
    // Component ids never contain "__", function names may.
    size_t pos = qualified.find("__");
    if (pos == std::string::npos || pos == 0 || pos + 2 >= qualified.size()) return false;
    *id = qualified.substr(0, pos);
    *function = qualified.substr(pos + 2);
    return true;
}

json_object* call_error_json(const CallError& e) {
    std::string message;
    switch (e.kind) {
        case CallErrorKind::ComponentFault:   message = "component fault"; break;
        case CallErrorKind::Timeout:          message = "deadline exceeded"; break;
        case CallErrorKind::CapabilityDenied: message = "capability denied"; break;
        case CallErrorKind::Cancelled:        message = "call cancelled"; break;
        default:                              message = e.detail; break;
    }
    json_object* p = error_payload(call_error_name(e.kind), message);
    json_object* err = json_mini::member(p, "error");
    if (e.kind == CallErrorKind::TypeMismatch && !e.path.empty()) {
        json_object_object_add(err, "path", json_mini::new_string(e.path));
    }
    if (e.kind == CallErrorKind::CapabilityDenied) {
        json_object_object_add(err, "capability", json_object_new_string(capability_kind_name(e.capability)));
    }
    return p;
}

// ---- Session ----

Session::Session(Bridge* bridge, std::string id, MessageSink sink)
    : bridge_(bridge), id_(std::move(id)), sink_(std::move(sink)) {
    writer_ = std::thread([this] { writer_loop(); });
}

Session::~Session() {
    close();
}

SessionState Session::state() const {
    return state_.load();
}

size_t Session::in_flight() const {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (const auto& c : calls_) {
        if (!c.done->load()) n++;
    }
    return n;
}

void Session::writer_loop() {
    while (true) {
        std::string msg;
        {
            std::unique_lock<std::mutex> lk(out_mu_);
            out_cv_.wait(lk, [this] { return out_stop_ || !outbox_.empty(); });
            if (outbox_.empty()) return;
            msg = std::move(outbox_.front());
            outbox_.pop_front();
        }
        sink_(msg);
    }
}

void Session::send(const std::string& message) {
    {
        std::lock_guard<std::mutex> lk(out_mu_);
        if (out_stop_) return;
        outbox_.push_back(message);
    }
    out_cv_.notify_one();
}

void Session::respond(const std::string& request_id, json_object* result) {
    json_mini::Doc r(result);
    send(rpc_envelope(request_id) + ",\"result\":" + json_mini::dump(r.root) + "}");
}

void Session::respond_error(const std::string& request_id, int code, const std::string& message) {
    send(rpc_envelope(request_id) + ",\"error\":{\"code\":" + std::to_string(code) +
         ",\"message\":\"" + json_mini::json_escape(message) + "\"}}");
}

void Session::enter_serving() {
    SessionState expected = SessionState::Discovering;
    state_.compare_exchange_strong(expected, SessionState::Serving);
}

void Session::handle(const std::string& message) {
    json_mini::Doc doc = json_mini::parse(message);
    if (!doc) {
        respond_error("null", kParseError, "parse error");
        return;
    }
    if (json_object_is_type(doc.root, json_type_array)) {
        respond_error("null", kInvalidRequest, "batch requests are not supported");
        return;
    }
    if (!json_object_is_type(doc.root, json_type_object)) {
        respond_error("null", kInvalidRequest, "invalid request");
        return;
    }
    handle_object(doc.root);
}

void Session::handle_object(json_object* msg) {
    const bool is_request = json_mini::has_key(msg, "id");
    const std::string request_id = is_request ? json_mini::dump(json_mini::member(msg, "id")) : "";

    auto version = json_mini::get_string(msg, "jsonrpc");
    auto method = json_mini::get_string(msg, "method");
    if (!version || *version != "2.0") {
        if (is_request) respond_error(request_id, kInvalidRequest, "jsonrpc must be \"2.0\"");
        return;
    }
    if (!method) {
        // Responses from the client: nothing is ever asked of it.
        if (is_request && !json_mini::has_key(msg, "result") && !json_mini::has_key(msg, "error")) {
            respond_error(request_id, kInvalidRequest, "missing method");
        }
        return;
    }

    json_object* params = json_mini::member(msg, "params");
    const SessionState st = state();
    if (st == SessionState::Closing || st == SessionState::Closed) {
        if (is_request) respond_error(request_id, kSessionClosing, "session is closing");
        return;
    }
    if (!is_request) {
        handle_notification(*method, params);
        return;
    }

    if (*method == "initialize") {
        initialize(request_id, params);
    } else if (*method == "ping") {
        respond(request_id, json_object_new_object());
    } else if (st == SessionState::Connected) {
        respond_error(request_id, kInvalidRequest, "session not initialized");
    } else if (*method == "tools/list") {
        enter_serving();
        respond(request_id, bridge_->tools_list());
    } else if (*method == "tools/call") {
        enter_serving();
        start_call(request_id, params);
    } else {
        respond_error(request_id, kMethodNotFound, "method not found: " + *method);
    }
}

void Session::handle_notification(const std::string& method, json_object* params) {
    if (method == "notifications/initialized") {
        enter_serving();
    } else if (method == "notifications/cancelled") {
        cancel_request(params);
    }
}

void Session::initialize(const std::string& request_id, json_object* params) {
    SessionState expected = SessionState::Connected;
    if (!state_.compare_exchange_strong(expected, SessionState::Discovering)) {
        respond_error(request_id, kInvalidRequest, "session already initialized");
        return;
    }

    std::string protocol = CAPSULE_MCP_PROTOCOL_VERSION;
    if (auto requested = json_mini::get_string(params, "protocolVersion")) {
        for (const char* v : kSupportedProtocols) {
            if (*requested == v) protocol = v;
        }
    }

    json_object* tools = json_object_new_object();
    json_object_object_add(tools, "listChanged", json_object_new_boolean(1));
    json_object* caps = json_object_new_object();
    json_object_object_add(caps, "tools", tools);
    json_object* info = json_object_new_object();
    json_object_object_add(info, "name", json_object_new_string("capsule"));
    json_object_object_add(info, "version", json_object_new_string(CAPSULE_VERSION));

    json_object* r = json_object_new_object();
    json_object_object_add(r, "protocolVersion", json_mini::new_string(protocol));
    json_object_object_add(r, "capabilities", caps);
    json_object_object_add(r, "serverInfo", info);
    respond(request_id, r);
}

void Session::start_call(const std::string& request_id, json_object* params) {
    auto name = json_mini::get_string(params, "name");
    if (!name) {
        respond_error(request_id, kInvalidParams, "tools/call requires a tool name");
        return;
    }
    json_object* args = json_mini::member(params, "arguments");
    if (args && !json_object_is_type(args, json_type_object) && !json_object_is_type(args, json_type_null)) {
        respond_error(request_id, kInvalidParams, "arguments must be an object");
        return;
    }
    const std::string args_json = args && json_object_is_type(args, json_type_object) ? json_mini::dump(args) : "{}";

    std::lock_guard<std::mutex> lk(mu_);
    reap_finished_locked();
    for (const auto& c : calls_) {
        if (c.request_id == request_id && !c.done->load()) {
            respond_error(request_id, kInvalidRequest, "request id already in use");
            return;
        }
    }

    InFlight f;
    f.request_id = request_id;
    f.cancel = std::make_shared<CancelToken>();
    f.done = std::make_shared<std::atomic<bool>>(false);
    auto cancel = f.cancel;
    auto done = f.done;
    const std::string tool = *name;
    f.thread = std::thread([this, request_id, tool, args_json, cancel, done] {
        json_mini::Doc a = json_mini::parse(args_json);
        json_object* result = bridge_->call_tool(tool, a.root, cancel);
        // A cancelled request gets no response.
        if (cancel->cancelled()) json_object_put(result);
        else respond(request_id, result);
        done->store(true);
    });
    calls_.push_back(std::move(f));
}

void Session::cancel_request(json_object* params) {
    json_object* rid = json_mini::member(params, "requestId");
    if (!rid) return;
    const std::string key = json_mini::dump(rid);
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& c : calls_) {
        if (c.request_id == key) c.cancel->cancel();
    }
}

void Session::reap_finished_locked() {
    for (auto it = calls_.begin(); it != calls_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = calls_.erase(it);
        } else {
            ++it;
        }
    }
}

void Session::notify_tools_changed(const RegistryEvent& ev) {
    const SessionState st = state();
    if (st != SessionState::Discovering && st != SessionState::Serving) return;
    json_object* meta = json_object_new_object();
    json_object_object_add(meta, "seq", json_object_new_int64((int64_t)ev.seq));
    json_object_object_add(meta, "event", json_object_new_string(registry_event_name(ev.kind)));
    json_object_object_add(meta, "component", json_mini::new_string(ev.id));
    json_mini::Doc params(json_object_new_object());
    json_object_object_add(params.root, "_meta", meta);
    send("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/tools/list_changed\",\"params\":" +
         json_mini::dump(params.root) + "}");
}

void Session::disconnect() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& c : calls_) c.cancel->cancel();
    }
    close();
}

void Session::close() {
    std::lock_guard<std::mutex> close_lk(close_mu_);
    if (state() == SessionState::Closed) return;
    state_.store(SessionState::Closing);

    std::list<InFlight> calls;
    {
        std::lock_guard<std::mutex> lk(mu_);
        calls.swap(calls_);
    }
    for (auto& c : calls) {
        if (c.thread.joinable()) c.thread.join();
    }

    {
        std::lock_guard<std::mutex> lk(out_mu_);
        out_stop_ = true;
    }
    out_cv_.notify_all();
    if (writer_.joinable()) writer_.join();
    state_.store(SessionState::Closed);
}

// ---- Bridge ----

Bridge::Bridge(ComponentRegistry* registry, CallDispatcher* dispatcher)
    : registry_(registry), dispatcher_(dispatcher) {
    listener_token_ = registry_->subscribe([this](const RegistryEvent& ev) { on_registry_event(ev); });
}

Bridge::~Bridge() {
    shutdown();
    registry_->unsubscribe(listener_token_);
}

std::shared_ptr<Session> Bridge::open_session(MessageSink sink) {
    auto s = std::make_shared<Session>(this, random_hex(16), std::move(sink));
    std::lock_guard<std::mutex> lk(mu_);
    sessions_[s->id()] = s;
    return s;
}

std::shared_ptr<Session> Bridge::find_session(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

void Bridge::close_session(const std::string& id) {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        s = it->second;
        sessions_.erase(it);
    }
    s->close();
}

void Bridge::shutdown() {
    std::map<std::string, std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all.swap(sessions_);
    }
    for (auto& kv : all) kv.second->close();
}

size_t Bridge::session_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

void Bridge::on_registry_event(const RegistryEvent& ev) {
    // Runs under the registry's event lock: enqueue only.
    std::vector<std::shared_ptr<Session>> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& kv : sessions_) targets.push_back(kv.second);
    }
    for (auto& s : targets) s->notify_tools_changed(ev);
}

json_object* Bridge::tools_list() const {
    json_object* tools = json_object_new_array();

    for (const auto& c : registry_->list()) {
        if (c.status != ComponentState::Ready) continue;
        for (const auto& sig : c.schema.tools) {
            json_object* t = json_object_new_object();
            json_object_object_add(t, "name", json_mini::new_string(c.id + "__" + sig.name));
            json_object_object_add(t, "description",
                                   json_mini::new_string(sig.doc ? *sig.doc : sig.name + " (component " + c.id + ")"));
            json_object_object_add(t, "inputSchema", tool_input_schema(sig));

            json_object* props = json_object_new_object();
            json_object_object_add(props, "result", type_json_schema(sig.result));
            json_object* req = json_object_new_array();
            json_object_array_add(req, json_object_new_string("result"));
            json_object* out = json_object_new_object();
            json_object_object_add(out, "type", json_object_new_string("object"));
            json_object_object_add(out, "properties", props);
            json_object_object_add(out, "required", req);
            json_object_object_add(t, "outputSchema", out);
            json_object_array_add(tools, t);
        }
    }

    if (registry_->config().management_tools) {
        for (const auto& m : kManagementTools) {
            json_object* t = json_object_new_object();
            json_object_object_add(t, "name", json_object_new_string(m.name));
            json_object_object_add(t, "description", json_object_new_string(m.description));
            json_mini::Doc schema = json_mini::parse(m.input_schema);
            json_object_object_add(t, "inputSchema", schema.release());
            json_object_array_add(tools, t);
        }
    }

    json_object* r = json_object_new_object();
    json_object_object_add(r, "tools", tools);
    return r;
}

json_object* Bridge::call_tool(const std::string& name, json_object* arguments,
                               std::shared_ptr<CancelToken> cancel) {
    if (registry_->config().management_tools) {
        bool handled = false;
        json_object* r = call_management_tool(name, arguments, &handled);
        if (handled) return r;
    }

    ComponentId id;
    std::string function;
    if (!split_tool_name(name, &id, &function)) {
        return tool_error(call_error_name(CallErrorKind::NotFound), "unknown tool: " + name);
    }

    json_mini::Doc empty;
    if (!arguments) {
        empty = json_mini::Doc(json_object_new_object());
        arguments = empty.root;
    }

    CallResult r = dispatcher_->invoke_json(id, function, arguments, std::nullopt, std::move(cancel));
    if (!r.ok) return tool_result(call_error_json(r.error), true);

    json_object* p = json_object_new_object();
    json_object_object_add(p, "result", encode_value(r.value, r.result_type));
    return tool_result(p, false);
}

json_object* Bridge::call_management_tool(const std::string& name, json_object* args, bool* handled) {
    bool known = false;
    for (const auto& m : kManagementTools) {
        if (name == m.name) known = true;
    }
    *handled = known;
    if (!known) return nullptr;

    auto str = [&](const char* key) { return json_mini::get_string(args, key).value_or(""); };
    auto missing = [&](const char* key) {
        return tool_error("InvalidArguments", std::string("missing string argument '") + key + "'");
    };
    PolicyStore& policy = registry_->policy();

    if (name == "load-component") {
        const std::string path = str("path");
        if (path.empty()) return missing("path");
        std::cerr << "[bridge] load-component " << path << "\n";
        LoadResult lr = registry_->load(path);
        if (!lr.ok) {
            json_object* p = error_payload("LoadError", lr.error.message);
            json_object_object_add(json_mini::member(p, "error"), "reason",
                                   json_object_new_string(load_error_name(lr.error.kind)));
            return tool_result(p, true);
        }
        return status_result(lr.reloaded ? "component reloaded" : "component loaded", lr.id);
    }

    if (name == "list-components") {
        json_object* arr = json_object_new_array();
        for (const auto& c : registry_->list()) {
            json_object* o = json_object_new_object();
            json_object_object_add(o, "id", json_mini::new_string(c.id));
            json_object_object_add(o, "status", json_object_new_string(component_state_name(c.status)));
            if (!c.source.empty()) json_object_object_add(o, "source", json_mini::new_string(c.source));
            json_object_object_add(o, "digest", json_mini::new_string(c.digest));
            json_object* tools = json_object_new_array();
            for (const auto& sig : c.schema.tools) json_object_array_add(tools, json_mini::new_string(sig.name));
            json_object_object_add(o, "tools", tools);
            json_object_array_add(arr, o);
        }
        json_object* p = json_object_new_object();
        json_object_object_add(p, "components", arr);
        return tool_result(p, false);
    }

    if (name == "unload-component") {
        const std::string id = str("id");
        if (id.empty()) return missing("id");
        if (!registry_->unload(id)) return tool_error("NotFound", "unknown component: " + id);
        return status_result("component unloaded", id);
    }

    const std::string id = str("component_id");
    if (id.empty()) return missing("component_id");
    if (!policy.exists(id)) return tool_error("NotFound", "unknown component: " + id);

    if (name == "get-policy") {
        json_mini::Doc doc = json_mini::parse(policy.export_document(id));
        json_object* p = json_object_new_object();
        json_object_object_add(p, "id", json_mini::new_string(id));
        json_object_object_add(p, "policy", doc.release());
        return tool_result(p, false);
    }

    if (name == "reset-permission") {
        policy.reset(id);
        return status_result("permissions reset", id);
    }

    const bool grant = name.rfind("grant-", 0) == 0;
    CapabilityGrant g;
    GrantSelector sel;
    if (name == "grant-network-permission" || name == "revoke-network-permission") {
        const std::string host = str("host");
        if (host.empty()) return missing("host");
        g = CapabilityGrant::network(host);
        sel = GrantSelector::network(host);
    } else if (name == "grant-environment-variable-permission" ||
               name == "revoke-environment-variable-permission") {
        const std::string key = str("key");
        if (key.empty()) return missing("key");
        g = CapabilityGrant::environment(key);
        sel = GrantSelector::environment(key);
    } else {
        const std::string uri = str("uri");
        if (uri.empty()) return missing("uri");
        unsigned access = 0;
        std::string err;
        if (!parse_access(args, &access, &err)) return tool_error("InvalidArguments", err);
        if (grant && access == 0) return tool_error("InvalidArguments", "access must name read and/or write");
        g = CapabilityGrant::filesystem(uri, access);
        sel = GrantSelector::filesystem(uri, access);
    }

    if (grant) {
        PolicyError e = policy.grant(id, g);
        if (e.kind != PolicyErrorKind::None) return policy_error_result(e);
        std::cerr << "[bridge] " << name << " " << id << " " << g.pattern << "\n";
        return status_result("permission granted", id);
    }
    size_t n = policy.revoke(id, sel);
    std::cerr << "[bridge] " << name << " " << id << " " << sel.pattern << " (" << n << " removed)\n";
    json_object* p = json_object_new_object();
    json_object_object_add(p, "status", json_object_new_string("permission revoked"));
    json_object_object_add(p, "id", json_mini::new_string(id));
    json_object_object_add(p, "removed", json_object_new_int64((int64_t)n));
    return tool_result(p, false);
}

} // namespace capsule
