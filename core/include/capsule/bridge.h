#pragma once

// MCP (JSON-RPC 2.0) front end over the registry and dispatcher.
//
// Transport-agnostic: a transport opens a Session with a sink for outbound
// messages and feeds it inbound messages. Each session moves through
//
//   Connected -> Discovering -> Serving -> Closing -> Closed
//
// initialize enters Discovering; notifications/initialized (or the first
// tools/list or tools/call) enters Serving. close() stops accepting
// requests, drains in-flight tools/call and ends in Closed.

#include "dispatcher.h"
#include "registry.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace capsule {

#define CAPSULE_VERSION "0.3.0"
#define CAPSULE_MCP_PROTOCOL_VERSION "2025-06-18"

enum class SessionState { Connected, Discovering, Serving, Closing, Closed };

const char* session_state_name(SessionState s);

// Receives one serialised JSON-RPC message at a time, in order.
using MessageSink = std::function<void(const std::string&)>;

class Bridge;

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(Bridge* bridge, std::string id, MessageSink sink);
    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    SessionState state() const;

    // One inbound JSON-RPC message. Replies reach the sink, tools/call
    // replies from the call's own thread.
    void handle(const std::string& message);

    void notify_tools_changed(const RegistryEvent& ev);

    // Caller went away: cancel in-flight calls, then close.
    void disconnect();

    // Stop accepting requests, wait for in-flight calls, flush, Closed.
    void close();

    size_t in_flight() const;

private:
    // Request ids are kept as their JSON text so they echo back unchanged.
    struct InFlight {
        std::string request_id;
        std::thread thread;
        std::shared_ptr<CancelToken> cancel;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void handle_object(json_object* msg);
    void handle_notification(const std::string& method, json_object* params);
    void initialize(const std::string& request_id, json_object* params);
    void start_call(const std::string& request_id, json_object* params);
    void cancel_request(json_object* params);
    void reap_finished_locked();
    void enter_serving();

    void send(const std::string& message);
    void respond(const std::string& request_id, json_object* result); // takes result
    void respond_error(const std::string& request_id, int code, const std::string& message);
    void writer_loop();

    Bridge* bridge_;
    std::string id_;
    MessageSink sink_;

    std::atomic<SessionState> state_{SessionState::Connected};
    std::mutex close_mu_;

    mutable std::mutex mu_;
    std::list<InFlight> calls_;

    std::mutex out_mu_;
    std::condition_variable out_cv_;
    std::deque<std::string> outbox_;
    bool out_stop_{false};
    std::thread writer_;
};

class Bridge {
public:
    Bridge(ComponentRegistry* registry, CallDispatcher* dispatcher);
    ~Bridge();
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    std::shared_ptr<Session> open_session(MessageSink sink);
    std::shared_ptr<Session> find_session(const std::string& id) const;

    // Drain and forget one session.
    void close_session(const std::string& id);

    // Close every session (draining in-flight calls).
    void shutdown();

    size_t session_count() const;

    // tools/list result body: {"tools":[...]}
    json_object* tools_list() const;

    // tools/call result body. Never throws; errors come back as isError results.
    json_object* call_tool(const std::string& name, json_object* arguments,
                           std::shared_ptr<CancelToken> cancel);

private:
    json_object* call_management_tool(const std::string& name, json_object* arguments, bool* handled);
    void on_registry_event(const RegistryEvent& ev);

    ComponentRegistry* registry_;
    CallDispatcher* dispatcher_;
    size_t listener_token_{0};

    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

// Split "<component>__<function>"; false for names without the separator.
bool split_tool_name(const std::string& qualified, ComponentId* id, std::string* function);

// {"error":{"kind":..,"message":..}} payload for a failed call. Fault
// detail stays host-side.
json_object* call_error_json(const CallError& e);

} // namespace capsule
