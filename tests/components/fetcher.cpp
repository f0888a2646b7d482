#include "component_util.h"

// Every effect goes through the host import table; nothing is granted by
// default, so each of these is denied until a policy says otherwise.
CAPSULE_COMPONENT_INTERFACE(R"({
  "world": "fetch",
  "version": "0.1.0",
  "imports": ["http", "filesystem", "environment"],
  "exports": [
    {"name": "fetch", "doc": "GET a URL and return the body",
     "params": [{"name": "url", "type": "string"}], "result": "string"},
    {"name": "fetch-status", "params": [{"name": "url", "type": "string"}], "result": "s32"},
    {"name": "read-file", "params": [{"name": "path", "type": "string"}], "result": "string"},
    {"name": "write-file", "params": [{"name": "path", "type": "string"}, {"name": "data", "type": "string"}]},
    {"name": "list-dir", "params": [{"name": "path", "type": "string"}], "result": {"list": "string"}},
    {"name": "read-env", "params": [{"name": "name", "type": "string"}], "result": {"option": "string"}}
  ]
})");

TEST_COMPONENT_ABI

static capsule_status failed(const capsule_host* h, capsule_status st, const char* what) {
    // Denials and cancellations pass through; other failures are faults.
    if (st == CAPSULE_DENIED || st == CAPSULE_CANCELLED) return st;
    return testcomp::trap(h, what);
}

CAPSULE_COMPONENT_EXPORT capsule_status capsule_component_call(const capsule_host* h, const char* function,
                                                               const char* args_json) {
    const std::string fn = function;
    auto args = testcomp::split_args(args_json);

    if ((fn == "fetch" || fn == "fetch-status") && args.size() == 1) {
        int status = 0;
        char* body = nullptr;
        size_t len = 0;
        capsule_status st = h->http_request(h, "GET", args[0].c_str(), nullptr, 0, &status, &body, &len);
        if (st != CAPSULE_OK) return failed(h, st, "http request failed");
        std::string text(body ? body : "", len);
        h->release(h, body);
        h->log(h, "info", ("fetched " + std::to_string(len) + " bytes").c_str());
        testcomp::result(h, fn == "fetch" ? testcomp::quote(text) : std::to_string(status));
        return CAPSULE_OK;
    }
    if (fn == "read-file" && args.size() == 1) {
        char* data = nullptr;
        size_t len = 0;
        capsule_status st = h->file_read(h, args[0].c_str(), &data, &len);
        if (st != CAPSULE_OK) return failed(h, st, "read failed");
        std::string text(data ? data : "", len);
        h->release(h, data);
        testcomp::result(h, testcomp::quote(text));
        return CAPSULE_OK;
    }
    if (fn == "write-file" && args.size() == 2) {
        capsule_status st = h->file_write(h, args[0].c_str(), args[1].data(), args[1].size());
        if (st != CAPSULE_OK) return failed(h, st, "write failed");
        return CAPSULE_OK;
    }
    if (fn == "list-dir" && args.size() == 1) {
        char* json = nullptr;
        size_t len = 0;
        capsule_status st = h->file_list(h, args[0].c_str(), &json, &len);
        if (st != CAPSULE_OK) return failed(h, st, "list failed");
        testcomp::result(h, std::string(json ? json : "[]", json ? len : 2));
        h->release(h, json);
        return CAPSULE_OK;
    }
    if (fn == "read-env" && args.size() == 1) {
        char* value = nullptr;
        size_t len = 0;
        capsule_status st = h->env_get(h, args[0].c_str(), &value, &len);
        if (st == CAPSULE_ERROR) {
            testcomp::result(h, "null"); // granted but unset
            return CAPSULE_OK;
        }
        if (st != CAPSULE_OK) return failed(h, st, "env lookup failed");
        testcomp::result(h, testcomp::quote(std::string(value ? value : "", len)));
        h->release(h, value);
        return CAPSULE_OK;
    }
    return CAPSULE_NO_SUCH_FUNCTION;
}
