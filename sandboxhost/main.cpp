// capsule_sandbox: runs one component in its own process and proxies every
// import back to the host over stdin/stdout frames (see capsule/wire.h).
//
//   capsule_sandbox --component <path.so> --id <component id> [--seccomp]

#include "capsule/component_abi.h"
#include "capsule/sandbox.h"
#include "capsule/wire.h"

#include <dlfcn.h>
#include <fcntl.h>
#include <sys/prctl.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace capsule;

namespace {

volatile sig_atomic_t g_cancel = 0;

void on_cancel(int) { g_cancel = 1; }

int g_in = -1;
int g_out = -1;
std::string g_inbuf;

bool write_line(const std::string& s) {
    std::string line = s + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::write(g_out, line.data() + off, line.size() - off);
        if (n > 0) {
            off += (size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        return false;
    }
    return true;
}

bool read_line(std::string* line) {
    while (true) {
        auto nl = g_inbuf.find('\n');
        if (nl != std::string::npos) {
            line->assign(g_inbuf, 0, nl);
            g_inbuf.erase(0, nl + 1);
            return true;
        }
        char buf[8192];
        ssize_t n = ::read(g_in, buf, sizeof(buf));
        if (n > 0) {
            g_inbuf.append(buf, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        return false;
    }
}

bool send(const wire::Frame& f) { return write_line(wire::encode(f)); }

[[noreturn]] void fatal(const std::string& detail) {
    wire::Frame f;
    f.type = wire::FrameType::Fatal;
    f.detail = detail;
    (void)send(f);
    std::_Exit(3);
}

// Per-call state reachable from the import table.
struct CallCtx {
    std::string result;
    bool has_result{false};
    std::string error;
};

char* dup_buffer(const std::string& s) {
    char* p = static_cast<char*>(std::malloc(s.size() + 1));
    if (!p) return nullptr;
    std::memcpy(p, s.data(), s.size());
    p[s.size()] = '\0';
    return p;
}

capsule_status status_of(const std::string& s) {
    if (s == "ok") return CAPSULE_OK;
    if (s == "denied") return CAPSULE_DENIED;
    if (s == "cancelled") return CAPSULE_CANCELLED;
    return CAPSULE_ERROR;
}

// Send a host op and block for its reply. The host is the only writer on
// our stdin, so the next line is always the reply.
capsule_status round_trip(wire::Frame req, wire::Frame* reply) {
    if (g_cancel) return CAPSULE_CANCELLED;
    req.type = wire::FrameType::Host;
    if (!send(req)) std::_Exit(4);
    std::string line;
    if (!read_line(&line)) std::_Exit(4);
    std::string err;
    if (!wire::decode(line, reply, &err) || reply->type != wire::FrameType::HostReply) {
        fatal("bad host reply: " + err);
    }
    return status_of(reply->status);
}

capsule_status out_buffer(capsule_status st, const wire::Frame& reply, char** out, size_t* len) {
    if (out) *out = nullptr;
    if (len) *len = 0;
    if (st != CAPSULE_OK) return st;
    if (out) {
        *out = dup_buffer(reply.data);
        if (!*out) return CAPSULE_ERROR;
    }
    if (len) *len = reply.data.size();
    return CAPSULE_OK;
}

capsule_status host_http(const capsule_host*, const char* method, const char* url,
                         const char* body, size_t body_len, int* http_status,
                         char** response, size_t* response_len) {
    if (!url) return CAPSULE_ERROR;
    wire::Frame req, reply;
    req.op = "http";
    req.method = method ? method : "GET";
    req.target = url;
    if (body && body_len) req.data.assign(body, body_len);
    capsule_status st = round_trip(req, &reply);
    if (http_status) *http_status = st == CAPSULE_OK ? reply.http_status : 0;
    return out_buffer(st, reply, response, response_len);
}

capsule_status host_file_read(const capsule_host*, const char* path, char** data, size_t* len) {
    if (!path) return CAPSULE_ERROR;
    wire::Frame req, reply;
    req.op = "read";
    req.target = path;
    return out_buffer(round_trip(req, &reply), reply, data, len);
}

capsule_status host_file_write(const capsule_host*, const char* path, const char* data, size_t len) {
    if (!path) return CAPSULE_ERROR;
    wire::Frame req, reply;
    req.op = "write";
    req.target = path;
    if (data && len) req.data.assign(data, len);
    return round_trip(req, &reply);
}

capsule_status host_file_list(const capsule_host*, const char* path, char** json, size_t* len) {
    if (!path) return CAPSULE_ERROR;
    wire::Frame req, reply;
    req.op = "list";
    req.target = path;
    return out_buffer(round_trip(req, &reply), reply, json, len);
}

capsule_status host_env_get(const capsule_host*, const char* name, char** value, size_t* len) {
    if (!name) return CAPSULE_ERROR;
    wire::Frame req, reply;
    req.op = "env";
    req.target = name;
    return out_buffer(round_trip(req, &reply), reply, value, len);
}

capsule_status host_checkpoint(const capsule_host*) {
    return g_cancel ? CAPSULE_CANCELLED : CAPSULE_OK;
}

void host_log(const capsule_host*, const char* level, const char* message) {
    wire::Frame f;
    f.type = wire::FrameType::Log;
    f.level = level ? level : "info";
    f.detail = message ? message : "";
    if (!send(f)) std::_Exit(4);
}

void host_set_result(const capsule_host* h, const char* json, size_t len) {
    auto* ctx = static_cast<CallCtx*>(h->ctx);
    ctx->result.assign(json ? json : "", json ? len : 0);
    ctx->has_result = true;
}

void host_set_error(const capsule_host* h, const char* message) {
    static_cast<CallCtx*>(h->ctx)->error = message ? message : "";
}

void host_release(const capsule_host*, char* buffer) {
    std::free(buffer);
}

const char* done_status(capsule_status st) {
    switch (st) {
    case CAPSULE_OK: return "ok";
    case CAPSULE_DENIED: return "denied";
    case CAPSULE_CANCELLED: return "cancelled";
    case CAPSULE_NO_SUCH_FUNCTION: return "no_such_function";
    case CAPSULE_ERROR:
    case CAPSULE_TRAP: return "trap";
    }
    return "trap";
}

} // namespace

int main(int argc, char** argv) {
    std::string component;
    std::string id;
    bool seccomp = false;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--component" && i + 1 < argc) component = argv[++i];
        else if (a == "--id" && i + 1 < argc) id = argv[++i]; // labels the process only
        else if (a == "--seccomp") seccomp = true;
        else {
            std::cerr << "usage: capsule_sandbox --component <path.so> --id <id> [--seccomp]\n";
            return 2;
        }
    }

    // Keep the frame channel private: whatever the component prints goes to stderr.
    g_in = dup(STDIN_FILENO);
    g_out = dup(STDOUT_FILENO);
    if (g_in < 0 || g_out < 0) return 2;
    (void)fcntl(g_in, F_SETFD, FD_CLOEXEC);
    (void)fcntl(g_out, F_SETFD, FD_CLOEXEC);
    (void)dup2(STDERR_FILENO, STDOUT_FILENO);
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) {
        (void)dup2(devnull, STDIN_FILENO);
        close(devnull);
    }

    if (component.empty()) fatal("missing --component");

    struct sigaction sa{};
    sa.sa_handler = on_cancel;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGUSR1, &sa, nullptr) != 0) fatal("sigaction failed");

    void* h = dlopen(component.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) {
        const char* dl_err = dlerror(); // call once: dlerror() clears on read
        fatal(std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)"));
    }

    dlerror();
    auto abi_fn = (capsule_component_abi_version_fn)dlsym(h, CAPSULE_SYM_ABI_VERSION);
    if (!abi_fn) fatal("missing " CAPSULE_SYM_ABI_VERSION " export");
    int abi = abi_fn();
    if (abi != CAPSULE_COMPONENT_ABI_VERSION) {
        fatal("ABI version mismatch: host=" + std::to_string(CAPSULE_COMPONENT_ABI_VERSION) +
              " component=" + std::to_string(abi));
    }

    dlerror();
    auto call_fn = (capsule_component_call_fn)dlsym(h, CAPSULE_SYM_CALL);
    const char* sym_err = dlerror();
    if (sym_err != nullptr || !call_fn) {
        fatal(std::string("dlsym(" CAPSULE_SYM_CALL ") failed: ") + (sym_err ? sym_err : "(null)"));
    }

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) fatal("no_new_privs failed");
    if (seccomp) {
        std::string err = install_component_seccomp();
        if (!err.empty()) fatal(err);
    }

    wire::Frame ready;
    ready.type = wire::FrameType::Ready;
    ready.abi = CAPSULE_COMPONENT_ABI_VERSION;
    if (!send(ready)) return 4;

    std::string line;
    while (read_line(&line)) {
        if (line.empty()) continue;
        wire::Frame req;
        std::string err;
        if (!wire::decode(line, &req, &err) || req.type != wire::FrameType::Call) {
            fatal("expected a call frame: " + err);
        }

        g_cancel = 0;
        CallCtx ctx;
        capsule_host host{};
        host.abi_version = CAPSULE_COMPONENT_ABI_VERSION;
        host.ctx = &ctx;
        host.http_request = host_http;
        host.file_read = host_file_read;
        host.file_write = host_file_write;
        host.file_list = host_file_list;
        host.env_get = host_env_get;
        host.checkpoint = host_checkpoint;
        host.log = host_log;
        host.set_result = host_set_result;
        host.set_error = host_set_error;
        host.release = host_release;

        capsule_status st = call_fn(&host, req.function.c_str(), req.args.c_str());

        wire::Frame done;
        done.type = wire::FrameType::Done;
        done.id = req.id;
        done.status = done_status(st);
        if (st == CAPSULE_OK) done.result = ctx.has_result ? ctx.result : "";
        else if (st == CAPSULE_TRAP || st == CAPSULE_ERROR) done.detail = ctx.error;
        if (!send(done)) return 4;
    }
    return 0;
}
