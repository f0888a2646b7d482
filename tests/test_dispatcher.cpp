#include "test_common.h"
#include "capsule/bridge.h"
#include "capsule/dispatcher.h"
#include "capsule/json_mini.h"
#include "capsule/registry.h"
#include "capsule/sandbox.h"

#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace capsule;
using Clock = std::chrono::steady_clock;

// Answers every request on 127.0.0.1 with a fixed body.
class LocalHttpServer {
public:
    LocalHttpServer() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) die("socket failed");
        int one = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (bind(fd_, (sockaddr*)&addr, sizeof(addr)) != 0 || listen(fd_, 8) != 0) die("bind/listen failed");
        socklen_t len = sizeof(addr);
        getsockname(fd_, (sockaddr*)&addr, &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { loop(); });
    }
    ~LocalHttpServer() {
        stop_ = true;
        thread_.join();
        close(fd_);
    }
    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }
    int hits() const { return hits_.load(); }

private:
    void loop() {
        while (!stop_) {
            pollfd p{fd_, POLLIN, 0};
            if (poll(&p, 1, 50) <= 0) continue;
            int c = accept(fd_, nullptr, nullptr);
            if (c < 0) continue;
            char buf[4096];
            std::string req;
            while (req.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = recv(c, buf, sizeof(buf), 0);
                if (n <= 0) break;
                req.append(buf, (size_t)n);
            }
            hits_++;
            const std::string body = "hello from the test server";
            std::string resp = "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: " +
                               std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
            send(c, resp.data(), resp.size(), MSG_NOSIGNAL);
            close(c);
        }
    }

    int fd_{-1};
    int port_{0};
    std::atomic<bool> stop_{false};
    std::atomic<int> hits_{0};
    std::thread thread_;
};

static CallResult call(CallDispatcher& d, const std::string& id, const std::string& fn, const std::string& args,
                       std::optional<SteadyTime> deadline = std::nullopt,
                       std::shared_ptr<CancelToken> cancel = nullptr) {
    json_mini::Doc a = json_mini::parse(args);
    if (!a) die("bad test args: " + args);
    return d.invoke_json(id, fn, a.root, deadline, std::move(cancel));
}

static void expect_ok(const CallResult& r, const std::string& what) {
    if (!r.ok) die(what + ": " + call_error_name(r.error.kind) + ": " + r.error.detail);
}

static void expect_kind(const CallResult& r, CallErrorKind k, const std::string& what) {
    if (r.ok) die(what + ": unexpectedly succeeded");
    if (r.error.kind != k) {
        die(what + ": got " + std::string(call_error_name(r.error.kind)) + " (" + r.error.detail + "), want " +
            call_error_name(k));
    }
}

static long long ms_since(Clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t).count();
}

int main(int argc, char** argv) {
    TestRuntime rt = init_test_runtime(argc, argv, "test_dispatcher");
    RuntimeConfig cfg = load_runtime_config();
    PolicyStore policy;
    AuditLog audit((rt.scratch / "audit.jsonl").string());
    ComponentRegistry reg(cfg, &policy, &audit);
    for (const char* name : {"adder", "shapes", "fetcher", "sleeper", "crasher", "rogue"}) {
        LoadResult r = reg.load(rt.component(name));
        if (!r.ok) die(std::string("load ") + name + ": " + r.error.message);
    }
    CallDispatcher d(&reg, &audit);

    // Plain calls
    {
        CallResult r = call(d, "adder", "add", R"({"a":2,"b":3})");
        expect_ok(r, "add");
        expect_true(r.value.kind == ValueKind::Int && r.value.i == 5, "2 + 3");

        Invocation inv;
        inv.component_id = "adder";
        inv.function = "add";
        inv.args = {Value::int64(-40), Value::int64(-2)};
        r = d.invoke(inv);
        expect_ok(r, "typed invoke");
        expect_eq_ll(r.value.i, -42, "negative sum");
    }

    // Lookup failures
    {
        expect_kind(call(d, "nobody", "add", "{}"), CallErrorKind::NotFound, "unknown component");
        expect_kind(call(d, "adder", "mul", "{}"), CallErrorKind::NotFound, "unknown tool");
    }

    // Argument checking happens before the component runs
    {
        CallResult r = call(d, "adder", "add", R"({"a":"two","b":3})");
        expect_kind(r, CallErrorKind::TypeMismatch, "string for s32");
        expect_eq_str(r.error.path, "a", "mismatch path");
        r = call(d, "adder", "add", R"({"a":1})");
        expect_kind(r, CallErrorKind::TypeMismatch, "missing argument");
        expect_eq_str(r.error.path, "b", "missing argument path");
        r = call(d, "adder", "add", R"({"a":1,"b":2147483648})");
        expect_kind(r, CallErrorKind::TypeMismatch, "s32 overflow");

        Invocation inv;
        inv.component_id = "adder";
        inv.function = "add";
        inv.args = {Value::int64(1)};
        expect_kind(d.invoke(inv), CallErrorKind::TypeMismatch, "arity");
        inv.args = {Value::int64(1), Value::string("x")};
        r = d.invoke(inv);
        expect_kind(r, CallErrorKind::TypeMismatch, "wrong value kind");
        expect_eq_str(r.error.path, "b", "typed mismatch path");
    }

    // Composite types across the sandbox boundary
    {
        CallResult r = call(d, "shapes", "area", R"({"s":{"circle":2.0}})");
        expect_ok(r, "area circle");
        expect_true(r.value.kind == ValueKind::Float && r.value.f == 12.0, "3 * r * r");
        r = call(d, "shapes", "area", R"({"s":"empty"})");
        expect_ok(r, "area empty");
        expect_true(r.value.f == 0.0, "empty has no area");

        r = call(d, "shapes", "translate", R"({"p":{"x":1,"y":2},"dx":10,"dy":-5})");
        expect_ok(r, "translate");
        expect_true(r.value.kind == ValueKind::Record && r.value.items[0].i == 11 && r.value.items[1].i == -3,
                    "moved point");

        r = call(d, "shapes", "greet_label", R"({})");
        expect_ok(r, "greet none");
        expect_eq_str(r.value.s, "hello, anonymous", "absent option");
        r = call(d, "shapes", "greet_label", R"({"name":"Ada"})");
        expect_ok(r, "greet some");
        expect_eq_str(r.value.s, "hello, Ada", "present option");

        r = call(d, "shapes", "sum", R"({"values":[1,2,3,4]})");
        expect_ok(r, "sum");
        expect_eq_ll(r.value.i, 10, "list sum");

        r = call(d, "shapes", "sign", R"({"n":-3})");
        expect_ok(r, "sign");
        expect_true(r.value.kind == ValueKind::Variant && r.value.s == "err" && r.value.items[0].s == "negative",
                    "err case of a result");

        r = call(d, "shapes", "byte_count", R"({"data":"aGVsbG8="})");
        expect_ok(r, "byte count");
        expect_eq_ll((long long)r.value.u, 5, "decoded length");

        r = call(d, "shapes", "bad_result", "{}");
        expect_kind(r, CallErrorKind::ComponentFault, "result of the wrong type");
        expect_eq_str(r.error.path, "result", "result path");
    }

    // Capabilities are checked on every effect, against the live policy
    {
        LocalHttpServer srv;
        CallResult r = call(d, "fetcher", "fetch", "{\"url\":\"" + srv.url("/data") + "\"}");
        expect_kind(r, CallErrorKind::CapabilityDenied, "ungranted host");
        expect_true(r.error.capability == CapabilityKind::Network, "denial names network");
        expect_eq_ll(srv.hits(), 0, "denied request never left the host");

        expect_true(policy.grant("fetcher", CapabilityGrant::network("127.0.0.1")).kind == PolicyErrorKind::None,
                    "grant loopback");
        r = call(d, "fetcher", "fetch", "{\"url\":\"" + srv.url("/data") + "\"}");
        expect_ok(r, "granted fetch");
        expect_eq_str(r.value.s, "hello from the test server", "response body");
        r = call(d, "fetcher", "fetch_status", "{\"url\":\"" + srv.url("/") + "\"}");
        expect_ok(r, "fetch status");
        expect_eq_ll(r.value.i, 200, "status code");

        policy.revoke("fetcher", GrantSelector::network("127.0.0.1"));
        r = call(d, "fetcher", "fetch", "{\"url\":\"" + srv.url("/data") + "\"}");
        expect_kind(r, CallErrorKind::CapabilityDenied, "revoked before the next call");

        // Filesystem and environment
        const auto dir = rt.scratch / "files";
        std::filesystem::create_directories(dir);
        const std::string file = (dir / "note.txt").string();
        r = call(d, "fetcher", "write_file", "{\"path\":\"" + file + "\",\"data\":\"hi there\"}");
        expect_kind(r, CallErrorKind::CapabilityDenied, "write denied");
        expect_true(r.error.capability == CapabilityKind::Filesystem, "denial names filesystem");
        policy.grant("fetcher", CapabilityGrant::filesystem(dir.string(), FS_ALL));
        expect_ok(call(d, "fetcher", "write_file", "{\"path\":\"" + file + "\",\"data\":\"hi there\"}"), "write");
        r = call(d, "fetcher", "read_file", "{\"path\":\"" + file + "\"}");
        expect_ok(r, "read back");
        expect_eq_str(r.value.s, "hi there", "file contents");
        r = call(d, "fetcher", "list_dir", "{\"path\":\"" + dir.string() + "\"}");
        expect_ok(r, "list dir");
        expect_true(r.value.items.size() == 1 && r.value.items[0].s == "note.txt", "listing");

        setenv("CAPSULE_TEST_SECRET", "s3cret", 1);
        unsetenv("CAPSULE_TEST_ABSENT");
        expect_kind(call(d, "fetcher", "read_env", R"({"name":"CAPSULE_TEST_SECRET"})"), CallErrorKind::CapabilityDenied,
                    "env denied");
        policy.grant("fetcher", CapabilityGrant::environment("CAPSULE_TEST_SECRET"));
        policy.grant("fetcher", CapabilityGrant::environment("CAPSULE_TEST_ABSENT"));
        r = call(d, "fetcher", "read_env", R"({"name":"CAPSULE_TEST_SECRET"})");
        expect_ok(r, "env granted");
        expect_true(r.value.items.size() == 1 && r.value.items[0].s == "s3cret", "env value");
        r = call(d, "fetcher", "read_env", R"({"name":"CAPSULE_TEST_ABSENT"})");
        expect_ok(r, "unset env");
        expect_true(r.value.kind == ValueKind::Option && r.value.items.empty(), "unset is none");
    }

    // Deadlines: cooperative stop, then forced recycle
    {
        auto t0 = Clock::now();
        CallResult r = call(d, "sleeper", "nap", R"({"ms":10000})", Clock::now() + std::chrono::milliseconds(300));
        expect_kind(r, CallErrorKind::Timeout, "nap past the deadline");
        expect_true(ms_since(t0) < 3000, "timeout reported promptly");
        expect_ok(call(d, "sleeper", "quick", "{}"), "instance usable after cooperative stop");

        t0 = Clock::now();
        r = call(d, "sleeper", "spin", R"({"ms":10000})", Clock::now() + std::chrono::milliseconds(300));
        expect_kind(r, CallErrorKind::Timeout, "spin past the deadline");
        expect_true(ms_since(t0) < 4000, "recycled after the grace period");
        r = call(d, "sleeper", "quick", "{}");
        expect_ok(r, "fresh instance after recycle");
        expect_eq_str(r.value.s, "done", "quick result");
    }

    // Caller cancellation
    {
        auto token = std::make_shared<CancelToken>();
        std::thread canceller([token] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            token->cancel();
        });
        auto t0 = Clock::now();
        CallResult r = call(d, "sleeper", "nap", R"({"ms":10000})", std::nullopt, token);
        canceller.join();
        expect_kind(r, CallErrorKind::Cancelled, "cancelled nap");
        expect_true(ms_since(t0) < 3000, "cancellation is prompt");

        auto pre = std::make_shared<CancelToken>();
        pre->cancel();
        expect_kind(call(d, "sleeper", "nap", R"({"ms":10})", std::nullopt, pre), CallErrorKind::Cancelled,
                    "already-cancelled token");
    }

    // Faults are contained and the component recovers
    {
        CallResult r = call(d, "crasher", "crash", "{}");
        expect_kind(r, CallErrorKind::ComponentFault, "segfault in component");
        auto rec = reg.get("crasher");
        expect_true(rec && rec->status == ComponentState::Failed, "crashed component marked failed");
        expect_ok(call(d, "adder", "add", R"({"a":1,"b":1})"), "other components unaffected");

        r = call(d, "crasher", "ok", "{}");
        expect_ok(r, "re-instantiated on next call");
        expect_true(r.value.b, "ok returns true");
        expect_true(reg.get("crasher")->status == ComponentState::Ready, "ready again");

        r = call(d, "crasher", "fail", "{}");
        expect_kind(r, CallErrorKind::ComponentFault, "trap");
        expect_true(r.error.detail.find("secret-internal-detail") != std::string::npos, "detail kept host-side");
        json_mini::Doc shown(call_error_json(r.error));
        std::string text = json_mini::dump(shown.root);
        expect_true(text.find("secret-internal-detail") == std::string::npos, "detail not exposed to callers");
        expect_true(text.find("ComponentFault") != std::string::npos, "kind exposed");
    }

    // Concurrent calls share the pool
    {
        std::vector<std::thread> ts;
        std::atomic<int> good{0};
        for (int i = 0; i < 8; i++) {
            ts.emplace_back([&, i] {
                CallResult r = call(d, "adder", "add", "{\"a\":" + std::to_string(i) + ",\"b\":100}");
                if (r.ok && r.value.i == 100 + i) good++;
            });
        }
        for (auto& t : ts) t.join();
        expect_eq_ll(good.load(), 8, "concurrent calls all correct");
    }

    // An unknown function fails fast while a call to the same component runs
    {
        std::atomic<bool> nap_ok{false};
        std::thread napper([&] { nap_ok = call(d, "sleeper", "nap", R"({"ms":600})").ok; });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        auto t0 = Clock::now();
        expect_kind(call(d, "sleeper", "missing", "{}"), CallErrorKind::NotFound, "missing function");
        expect_true(ms_since(t0) < 300, "lookup failure does not wait for the busy instance");
        napper.join();
        expect_true(nap_ok.load(), "in-flight nap unaffected");
    }

    // A pool of two serves two calls at once
    {
        RuntimeConfig pooled_cfg = cfg;
        pooled_cfg.pool_size = 2;
        pooled_cfg.staging_dir = (rt.scratch / "staging-pooled").string();
        PolicyStore pooled_policy;
        ComponentRegistry pooled(pooled_cfg, &pooled_policy, &audit);
        if (!pooled.load(rt.component("sleeper")).ok) die("load pooled sleeper");
        CallDispatcher pd(&pooled, &audit);

        std::atomic<int> good{0};
        auto t0 = Clock::now();
        std::vector<std::thread> ts;
        for (int i = 0; i < 2; i++) {
            ts.emplace_back([&] {
                if (call(pd, "sleeper", "nap", R"({"ms":800})").ok) good++;
            });
        }
        for (auto& t : ts) t.join();
        const long long both = ms_since(t0);
        expect_eq_ll(good.load(), 2, "both naps completed");
        expect_true(both < 1500, "naps overlapped across pool members (" + std::to_string(both) + " ms)");
        pooled.shutdown();
    }

    // Components that skip the host imports
    {
        auto t0 = Clock::now();
        CallResult r = call(d, "rogue", "flood", "{}", Clock::now() + std::chrono::milliseconds(400));
        expect_kind(r, CallErrorKind::Timeout, "host ops flooded without reading replies");
        expect_true(ms_since(t0) < 5000, "flooding cannot stall the host");

        if (seccomp_available()) {
            const auto target = rt.scratch / "escaped.txt";
            r = call(d, "rogue", "touch", "{\"path\":\"" + target.string() + "\"}");
            expect_kind(r, CallErrorKind::ComponentFault, "raw open() kills the instance");
            expect_true(!std::filesystem::exists(target), "no file created behind the policy");
            expect_ok(call(d, "adder", "add", R"({"a":1,"b":2})"), "others unaffected by the filtered instance");
        } else {
            std::cerr << "test_dispatcher: seccomp unavailable, skipping raw syscall check" << std::endl;
        }
    }

    // Calls after unload
    reg.unload("adder");
    expect_kind(call(d, "adder", "add", R"({"a":1,"b":1})"), CallErrorKind::NotFound, "unloaded component");

    reg.shutdown();
    std::string err;
    expect_true(verify_audit_chain(audit.path(), audit.run_id(), &err) > 0, "call audit chain: " + err);

    std::error_code ec;
    std::filesystem::remove_all(rt.scratch, ec);
    std::cerr << "test_dispatcher: ALL PASSED" << std::endl;
    return 0;
}
