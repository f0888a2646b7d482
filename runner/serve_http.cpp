#include "transports.h"
#include "serve_http.h"

#include "capsule/json_mini.h"

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace capsule {

namespace {

std::string rpc_error(int code, const std::string& message) {
    return "{\"jsonrpc\":\"2.0\",\"id\":null,\"error\":{\"code\":" + std::to_string(code) +
           ",\"message\":\"" + json_mini::json_escape(message) + "\"}}";
}

// Replies of one streamable-http session: a response goes to the POST
// waiting on its id, anything else to the GET stream when one is open.
class ReplyRouter {
public:
    void deliver(const std::string& msg) {
        json_mini::Doc doc = json_mini::parse(msg);
        const bool response = doc && json_mini::has_key(doc.root, "id") && !json_mini::has_key(doc.root, "method");
        std::lock_guard<std::mutex> lk(mu_);
        if (response) {
            const std::string key = json_mini::dump(json_mini::member(doc.root, "id"));
            if (expected_.erase(key) == 0) return; // its POST gave up
            ready_[key] = msg;
            cv_.notify_all();
            return;
        }
        if (stream_fd_ >= 0 && !send_event(stream_fd_, "message", msg)) stream_fd_ = -1;
    }

    void expect(const std::string& key) {
        std::lock_guard<std::mutex> lk(mu_);
        expected_.insert(key);
    }

    // Gives up on stop, timeout or when the client hangs up.
    bool wait(const std::string& key, int timeout_ms, int fd, const std::atomic<bool>& stop, std::string* out) {
        const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        std::unique_lock<std::mutex> lk(mu_);
        while (true) {
            auto it = ready_.find(key);
            if (it != ready_.end()) {
                *out = std::move(it->second);
                ready_.erase(it);
                return true;
            }
            if (stop.load() || std::chrono::steady_clock::now() >= until) break;
            cv_.wait_for(lk, std::chrono::milliseconds(200));
            if (peer_closed(fd, 0)) break;
        }
        expected_.erase(key);
        return false;
    }

    bool attach_stream(int fd) {
        std::lock_guard<std::mutex> lk(mu_);
        if (stream_fd_ >= 0) return false;
        stream_fd_ = fd;
        return true;
    }

    void detach_stream(int fd) {
        std::lock_guard<std::mutex> lk(mu_);
        if (stream_fd_ == fd) stream_fd_ = -1;
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::set<std::string> expected_;
    std::map<std::string, std::string> ready_;
    int stream_fd_{-1};
};

class HttpServer {
public:
    HttpServer(Bridge& bridge, const HttpServeOptions& opt, const std::atomic<bool>& stop)
        : bridge_(bridge), opt_(opt), stop_(stop) {}

    void handle(int fd) {
        HttpRequest req;
        if (!read_http_request(fd, &req, opt_.max_body)) {
            send_json(fd, 400, rpc_error(-32600, "bad request"));
            return;
        }
        if (!api_token_ok(req.head, opt_.api_token)) {
            send_json(fd, 401, rpc_error(-32001, "unauthorized"));
            return;
        }

        if (opt_.mode == HttpMode::Sse) {
            if (req.path == "/sse") {
                if (req.method != "GET") return send_json(fd, 405, "");
                return sse_stream(fd);
            }
            if (req.path == "/message") {
                if (req.method != "POST") return send_json(fd, 405, "");
                return sse_message(fd, req);
            }
        } else if (req.path == "/mcp") {
            if (req.method == "POST") return mcp_post(fd, req);
            if (req.method == "GET") return mcp_get(fd, req);
            if (req.method == "DELETE") return mcp_delete(fd, req);
            return send_json(fd, 405, "");
        }
        send_json(fd, 404, rpc_error(-32600, "not found"));
    }

private:
    // Blocks until the client goes away, the write side fails or the host stops.
    void hold_stream(int fd, const std::shared_ptr<std::atomic<bool>>& alive,
                     const std::shared_ptr<std::mutex>& write_mu) {
        int idle_ms = 0;
        while (!stop_.load() && alive->load() && !peer_closed(fd, 500)) {
            idle_ms += 500;
            if (idle_ms >= 15000) {
                idle_ms = 0;
                std::lock_guard<std::mutex> lk(*write_mu);
                if (!send_all(fd, ": keepalive\n\n")) alive->store(false);
            }
        }
    }

    void sse_stream(int fd) {
        if (!start_event_stream(fd)) return;
        auto alive = std::make_shared<std::atomic<bool>>(true);
        auto write_mu = std::make_shared<std::mutex>();
        auto session = bridge_.open_session([fd, alive, write_mu](const std::string& msg) {
            if (!alive->load()) return;
            std::lock_guard<std::mutex> lk(*write_mu);
            if (!send_event(fd, "message", msg)) alive->store(false);
        });
        {
            std::lock_guard<std::mutex> lk(*write_mu);
            if (!send_event(fd, "endpoint", "/message?sessionId=" + session->id())) alive->store(false);
        }
        std::cerr << "[bridge] sse session " << session->id() << " opened\n";

        hold_stream(fd, alive, write_mu);

        // Gone client: cancel what it started. Host stop: let calls finish.
        if (stop_.load()) session->close();
        else session->disconnect();
        bridge_.close_session(session->id());
        std::cerr << "[bridge] sse session " << session->id() << " closed\n";
    }

    void sse_message(int fd, const HttpRequest& req) {
        auto session = bridge_.find_session(query_param(req.query, "sessionId"));
        if (!session) return send_json(fd, 404, rpc_error(-32600, "unknown session"));
        session->handle(req.body);
        send_json(fd, 202, "");
    }

    void mcp_post(int fd, const HttpRequest& req) {
        json_mini::Doc doc = json_mini::parse(req.body);
        if (!doc) return send_json(fd, 400, rpc_error(-32700, "parse error"));
        if (!json_object_is_type(doc.root, json_type_object)) {
            return send_json(fd, 400, rpc_error(-32600, "batch requests are not supported"));
        }
        const auto method = json_mini::get_string(doc.root, "method");
        const bool is_request = method && json_mini::has_key(doc.root, "id");

        std::string sid = header_value_ci(req.head, "mcp-session-id");
        std::shared_ptr<Session> session;
        std::shared_ptr<ReplyRouter> rt;
        if (sid.empty()) {
            if (!is_request || *method != "initialize") {
                return send_json(fd, 400, rpc_error(-32600, "missing Mcp-Session-Id"));
            }
            rt = std::make_shared<ReplyRouter>();
            session = bridge_.open_session([rt](const std::string& msg) { rt->deliver(msg); });
            std::lock_guard<std::mutex> lk(mu_);
            routers_[session->id()] = rt;
            std::cerr << "[bridge] streamable-http session " << session->id() << " opened\n";
        } else {
            session = bridge_.find_session(sid);
            rt = router(sid);
            if (!session || !rt) return send_json(fd, 404, rpc_error(-32600, "unknown session"));
        }
        const std::string session_header = "Mcp-Session-Id: " + session->id() + "\r\n";

        if (!is_request) {
            session->handle(req.body);
            return send_json(fd, 202, "", session_header);
        }

        const std::string key = json_mini::dump(json_mini::member(doc.root, "id"));
        rt->expect(key);
        session->handle(req.body);
        std::string reply;
        if (!rt->wait(key, opt_.response_wait_ms, fd, stop_, &reply)) {
            return send_json(fd, 503, rpc_error(-32000, "no reply"), session_header);
        }
        send_json(fd, 200, reply, session_header);
    }

    void mcp_get(int fd, const HttpRequest& req) {
        const std::string sid = header_value_ci(req.head, "mcp-session-id");
        auto rt = router(sid);
        if (!rt || !bridge_.find_session(sid)) return send_json(fd, 404, rpc_error(-32600, "unknown session"));
        if (!start_event_stream(fd, "Mcp-Session-Id: " + sid + "\r\n")) return;
        if (!rt->attach_stream(fd)) return; // one stream per session

        auto alive = std::make_shared<std::atomic<bool>>(true);
        auto write_mu = std::make_shared<std::mutex>();
        hold_stream(fd, alive, write_mu);
        rt->detach_stream(fd);
    }

    void mcp_delete(int fd, const HttpRequest& req) {
        const std::string sid = header_value_ci(req.head, "mcp-session-id");
        auto session = bridge_.find_session(sid);
        if (!session) return send_json(fd, 404, rpc_error(-32600, "unknown session"));
        session->disconnect();
        bridge_.close_session(sid);
        {
            std::lock_guard<std::mutex> lk(mu_);
            routers_.erase(sid);
        }
        std::cerr << "[bridge] streamable-http session " << sid << " deleted\n";
        send_json(fd, 200, "");
    }

    std::shared_ptr<ReplyRouter> router(const std::string& sid) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = routers_.find(sid);
        return it == routers_.end() ? nullptr : it->second;
    }

    Bridge& bridge_;
    HttpServeOptions opt_;
    const std::atomic<bool>& stop_;
    std::mutex mu_;
    std::map<std::string, std::shared_ptr<ReplyRouter>> routers_;
};

struct ConnThread {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

} // namespace

int serve_http(Bridge& bridge, const HttpServeOptions& opt, const std::atomic<bool>& stop) {
    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) {
        std::cerr << "[bridge] socket failed\n";
        return 2;
    }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)opt.port);
    if (::inet_pton(AF_INET, opt.host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[bridge] bad host " << opt.host << "\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "[bridge] bind " << opt.host << ":" << opt.port << " failed\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "[bridge] listen failed\n";
        ::close(sfd);
        return 2;
    }

    std::cerr << "[bridge] " << (opt.mode == HttpMode::Sse ? "sse" : "streamable-http") << " on http://"
              << opt.host << ":" << opt.port << (opt.mode == HttpMode::Sse ? "/sse" : "/mcp")
              << (opt.api_token.empty() ? "" : " (token required)") << "\n";

    HttpServer server(bridge, opt, stop);
    std::atomic<int> active_conns{0};
    std::list<ConnThread> threads;

    while (!stop.load()) {
        for (auto it = threads.begin(); it != threads.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = threads.erase(it);
            } else {
                ++it;
            }
        }

        struct pollfd p{sfd, POLLIN, 0};
        if (::poll(&p, 1, 200) <= 0) continue;
        sockaddr_in caddr{};
        socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) continue;
        if (active_conns.load() >= opt.max_conns) {
            send_json(cfd, 503, rpc_error(-32000, "too many connections"));
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10); // Slowloris defense

        ConnThread ct;
        ct.done = std::make_shared<std::atomic<bool>>(false);
        auto done = ct.done;
        ct.thread = std::thread([&server, &active_conns, cfd, done] {
            struct ConnGuard {
                std::atomic<int>& c;
                std::atomic<bool>& d;
                ~ConnGuard() {
                    c.fetch_sub(1);
                    d.store(true);
                }
            } cg{active_conns, *done};
            server.handle(cfd);
            ::close(cfd);
        });
        threads.push_back(std::move(ct));
    }

    ::close(sfd);
    for (auto& t : threads) {
        if (t.thread.joinable()) t.thread.join();
    }
    return 0;
}

} // namespace capsule
