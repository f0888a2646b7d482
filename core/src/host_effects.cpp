#include "capsule/host_effects.h"
#include "capsule/json_mini.h"
#include "capsule/proc.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace capsule {

static constexpr size_t kMaxFileBytes = 16ULL * 1024 * 1024;
static constexpr size_t kMaxResponseBytes = 8ULL * 1024 * 1024;

static EffectResult ok_result(CapabilityKind k, std::string data) {
    EffectResult r;
    r.status = EffectResult::Status::Ok;
    r.capability = k;
    r.data = std::move(data);
    return r;
}

static EffectResult error_result(CapabilityKind k, std::string msg) {
    EffectResult r;
    r.status = EffectResult::Status::Error;
    r.capability = k;
    r.message = std::move(msg);
    return r;
}

bool parse_http_url(const std::string& url, HttpUrl* out, std::string* err) {
    auto fail = [&](const char* m) {
        if (err) *err = m;
        return false;
    };
    auto p = url.find("://");
    if (p == std::string::npos) return fail("missing scheme");
    std::string scheme = url.substr(0, p);
    for (char& c : scheme) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    if (scheme != "http" && scheme != "https") return fail("only http/https allowed");

    std::string rest = url.substr(p + 3);
    auto end = rest.find_first_of("/?#");
    if (end != std::string::npos) rest = rest.substr(0, end);
    if (rest.find('@') != std::string::npos) return fail("userinfo not allowed");

    std::string host;
    std::string port;
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) return fail("unterminated IPv6 literal");
        host = rest.substr(0, close + 1);
        std::string tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') return fail("bad authority");
            port = tail.substr(1);
        }
    } else {
        auto colon = rest.find(':');
        host = rest.substr(0, colon);
        if (colon != std::string::npos) port = rest.substr(colon + 1);
    }
    if (port.empty()) port = scheme == "https" ? "443" : "80";
    if (port.size() > 5 || !std::all_of(port.begin(), port.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
        std::stoi(port) == 0 || std::stoi(port) > 65535) {
        return fail("bad port");
    }

    out->host = normalize_host(host);
    if (out->host.empty()) return fail("cannot parse host");
    out->scheme = scheme;
    out->port = port;
    return true;
}

bool is_private_or_reserved_ip(const std::string& ip) {
    struct in_addr addr4;
    if (inet_pton(AF_INET, ip.c_str(), &addr4) == 1) {
        uint32_t h = ntohl(addr4.s_addr);
        if ((h >> 24) == 127) return true;                          // 127.0.0.0/8 loopback
        if ((h >> 24) == 10)  return true;                          // 10.0.0.0/8
        if ((h >> 20) == (172 << 4 | 1)) return true;              // 172.16.0.0/12
        if ((h >> 16) == (192 << 8 | 168)) return true;            // 192.168.0.0/16
        if ((h >> 16) == (169 << 8 | 254)) return true;            // 169.254.0.0/16 link-local, metadata
        if ((h >> 22) == (100 << 2 | 1)) return true;              // 100.64.0.0/10 CGN
        if ((h >> 24) == 0)   return true;                          // 0.0.0.0/8
        if ((h >> 28) >= 0xE) return true;                          // multicast, reserved, broadcast
        if ((h >> 8) == (192u << 16 | 0 << 8 | 0)) return true;    // 192.0.0.0/24
        if ((h >> 8) == (192u << 16 | 0 << 8 | 2)) return true;    // 192.0.2.0/24
        if ((h >> 8) == (198u << 16 | 51 << 8 | 100)) return true; // 198.51.100.0/24
        if ((h >> 8) == (203u << 16 | 0 << 8 | 113)) return true;  // 203.0.113.0/24
        return false;
    }
    struct in6_addr addr6;
    if (inet_pton(AF_INET6, ip.c_str(), &addr6) == 1) {
        if (IN6_IS_ADDR_UNSPECIFIED(&addr6)) return true;
        if (IN6_IS_ADDR_LOOPBACK(&addr6)) return true;
        if (IN6_IS_ADDR_LINKLOCAL(&addr6)) return true;
        if (IN6_IS_ADDR_SITELOCAL(&addr6)) return true;
        if (IN6_IS_ADDR_MULTICAST(&addr6)) return true;
        if (addr6.s6_addr[0] == 0xfc || addr6.s6_addr[0] == 0xfd) return true; // fc00::/7 ULA
        if (IN6_IS_ADDR_V4MAPPED(&addr6)) {
            struct in_addr inner;
            std::memcpy(&inner.s_addr, &addr6.s6_addr[12], 4);
            char buf[INET_ADDRSTRLEN];
            if (!inet_ntop(AF_INET, &inner, buf, sizeof(buf))) return true;
            return is_private_or_reserved_ip(buf);
        }
        return false;
    }
    return true; // unparsable addresses never pass
}

namespace {

struct SsrfResult {
    std::string error;
    std::string resolved_ip; // pinned with curl --resolve against DNS rebinding
};

SsrfResult ssrf_check_host(const std::string& host) {
    if (host == "metadata.google.internal" || host == "metadata") {
        return {"blocked: cloud metadata endpoint", ""};
    }

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0) return {std::string("cannot resolve ") + host + ": " + gai_strerror(rc), ""};
    std::string first_ip;
    for (auto* rp = res; rp; rp = rp->ai_next) {
        char ip[INET6_ADDRSTRLEN]{};
        if (rp->ai_family == AF_INET) {
            inet_ntop(AF_INET, &((struct sockaddr_in*)rp->ai_addr)->sin_addr, ip, sizeof(ip));
        } else if (rp->ai_family == AF_INET6) {
            inet_ntop(AF_INET6, &((struct sockaddr_in6*)rp->ai_addr)->sin6_addr, ip, sizeof(ip));
        }
        if (ip[0] && is_private_or_reserved_ip(ip)) {
            freeaddrinfo(res);
            return {std::string("blocked: resolves to private address ") + ip, ""};
        }
        if (ip[0] && first_ip.empty()) first_ip = ip;
    }
    freeaddrinfo(res);
    if (first_ip.empty()) return {"no usable address for " + host, ""};
    return {"", first_ip};
}

bool is_ip_literal(const std::string& h) {
    unsigned char buf[16];
    return inet_pton(AF_INET, h.c_str(), buf) == 1 || inet_pton(AF_INET6, h.c_str(), buf) == 1;
}

bool known_method(const std::string& m) {
    static const char* methods[] = {"GET", "POST", "PUT", "DELETE", "PATCH", "HEAD"};
    for (const char* k : methods) if (m == k) return true;
    return false;
}

// Resolve the path once so the policy check and the operation see the same file.
bool resolve_request_path(const std::string& path, fs::path* out, std::string* err) {
    fs::path p(path);
    if (!p.is_absolute()) {
        *err = "path must be absolute";
        return false;
    }
    std::error_code ec;
    fs::path r = fs::weakly_canonical(p.lexically_normal(), ec);
    if (ec) {
        *err = "cannot resolve path: " + ec.message();
        return false;
    }
    *out = r;
    return true;
}

} // namespace

EffectResult HostEffects::denied(const ComponentId& id, const Decision& d, const std::string& target) const {
    EffectResult r;
    r.status = EffectResult::Status::Denied;
    r.capability = d.kind;
    r.message = d.reason;
    if (audit_) {
        std::ostringstream p;
        p << "{\"component\":\"" << json_mini::json_escape(id) << "\""
          << ",\"capability\":\"" << capability_kind_name(d.kind) << "\""
          << ",\"target\":\"" << json_mini::json_escape(target) << "\""
          << ",\"reason\":\"" << json_mini::json_escape(d.reason) << "\"}";
        audit_->event("deny", p.str());
    }
    return r;
}

EffectResult HostEffects::http(const ComponentId& id, const std::string& method,
                               const std::string& url, const std::string& body) const {
    const CapabilityKind k = CapabilityKind::Network;
    HttpUrl u;
    std::string err;
    if (!parse_http_url(url, &u, &err)) {
        // Malformed targets deny rather than error: nothing was granted for them.
        return denied(id, Decision::deny(k, "bad url: " + err), url);
    }

    Decision d = policy_->check(id, CapabilityRequest::network(u.host));
    if (!d.allowed) return denied(id, d, u.host);

    std::string m = method.empty() ? "GET" : method;
    for (char& c : m) if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    if (!known_method(m)) return error_result(k, "unsupported method " + m);

    std::string pin_ip;
    if (!is_ip_literal(u.host) && !cfg_.http_allow_private) {
        auto ssrf = ssrf_check_host(u.host);
        if (!ssrf.error.empty()) return error_result(k, ssrf.error);
        pin_ip = ssrf.resolved_ip;
    }

    ProcLimits lim;
    lim.timeout_ms = cfg_.http_timeout_ms + 1000;
    lim.stdout_max_bytes = kMaxResponseBytes + 16;
    lim.merge_stderr = false;
    lim.rlimit_fsize_mb = 1;
    lim.rlimit_nofile = 32;

    std::vector<std::string> argv = {
        "curl",
        "-sS",
        "--noproxy", "*",
        "--max-time", std::to_string(std::max(1, cfg_.http_timeout_ms / 1000)),
        "--max-redirs", "0",
        "-w", "\n%{http_code}",
    };
    if (m == "HEAD") {
        argv.push_back("--head");
    } else {
        argv.push_back("-X");
        argv.push_back(m);
    }
    if (!body.empty()) {
        argv.push_back("--data-binary");
        argv.push_back("@-");
    }
    if (!pin_ip.empty()) {
        std::string ip = pin_ip.find(':') != std::string::npos ? "[" + pin_ip + "]" : pin_ip;
        argv.push_back("--resolve");
        argv.push_back(u.host + ":" + u.port + ":" + ip);
    }
    argv.push_back("--");
    argv.push_back(url);

    ProcResult pr;
    if (!proc_run_capture(argv, "", body, lim, &pr)) return error_result(k, pr.error);
    if (pr.timed_out) return error_result(k, "request timed out");
    if (pr.output_truncated) return error_result(k, "response too large");
    if (pr.exit_code != 0) return error_result(k, "request failed (curl exit " + std::to_string(pr.exit_code) + ")");

    auto nl = pr.output.rfind('\n');
    if (nl == std::string::npos) return error_result(k, "malformed response");
    int code = 0;
    try {
        code = std::stoi(pr.output.substr(nl + 1));
    } catch (const std::exception&) {
        return error_result(k, "malformed response");
    }
    EffectResult r = ok_result(k, pr.output.substr(0, nl));
    r.http_status = code;
    return r;
}

EffectResult HostEffects::read_file(const ComponentId& id, const std::string& path) const {
    const CapabilityKind k = CapabilityKind::Filesystem;
    fs::path rp;
    std::string err;
    if (!resolve_request_path(path, &rp, &err)) return denied(id, Decision::deny(k, err), path);
    Decision d = policy_->check(id, CapabilityRequest::filesystem(rp.string(), FS_READ));
    if (!d.allowed) return denied(id, d, rp.string());

    std::error_code ec;
    if (!fs::is_regular_file(rp, ec)) return error_result(k, "not a regular file: " + rp.string());
    if (fs::file_size(rp, ec) > kMaxFileBytes) return error_result(k, "file too large");
    std::ifstream in(rp, std::ios::binary);
    if (!in) return error_result(k, "cannot open " + rp.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ok_result(k, ss.str());
}

EffectResult HostEffects::write_file(const ComponentId& id, const std::string& path, const std::string& data) const {
    const CapabilityKind k = CapabilityKind::Filesystem;
    fs::path rp;
    std::string err;
    if (!resolve_request_path(path, &rp, &err)) return denied(id, Decision::deny(k, err), path);
    Decision d = policy_->check(id, CapabilityRequest::filesystem(rp.string(), FS_WRITE));
    if (!d.allowed) return denied(id, d, rp.string());

    if (data.size() > kMaxFileBytes) return error_result(k, "data too large");
    // A final component that is still a symlink after resolution dangles;
    // following it would create a file outside the checked path.
    int fd = ::open(rp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == ELOOP) return denied(id, Decision::deny(k, "path is a symbolic link"), rp.string());
        return error_result(k, "cannot open " + rp.string() + " for writing: " + std::strerror(errno));
    }
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            const int e = errno;
            ::close(fd);
            return error_result(k, std::string("write failed: ") + std::strerror(e));
        }
        off += (size_t)n;
    }
    if (::close(fd) != 0) return error_result(k, std::string("write failed: ") + std::strerror(errno));
    return ok_result(k, "");
}

EffectResult HostEffects::list_dir(const ComponentId& id, const std::string& path) const {
    const CapabilityKind k = CapabilityKind::Filesystem;
    fs::path rp;
    std::string err;
    if (!resolve_request_path(path, &rp, &err)) return denied(id, Decision::deny(k, err), path);
    Decision d = policy_->check(id, CapabilityRequest::filesystem(rp.string(), FS_READ));
    if (!d.allowed) return denied(id, d, rp.string());

    std::error_code ec;
    std::vector<std::string> names;
    for (fs::directory_iterator it(rp, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) return error_result(k, "cannot list " + rp.string() + ": " + ec.message());
    std::sort(names.begin(), names.end());

    json_mini::Doc arr(json_object_new_array());
    for (const auto& n : names) json_object_array_add(arr.root, json_mini::new_string(n));
    return ok_result(k, json_mini::dump(arr.root));
}

EffectResult HostEffects::env(const ComponentId& id, const std::string& name) const {
    const CapabilityKind k = CapabilityKind::Environment;
    Decision d = policy_->check(id, CapabilityRequest::environment(name));
    if (!d.allowed) return denied(id, d, name);
    const char* v = std::getenv(name.c_str());
    if (!v) return error_result(k, name + " is not set");
    return ok_result(k, v);
}

wire::Frame HostEffects::serve(const ComponentId& id, const wire::Frame& req) const {
    EffectResult r;
    if (req.op == "http") {
        r = http(id, req.method, req.target, req.data);
    } else if (req.op == "read") {
        r = read_file(id, req.target);
    } else if (req.op == "write") {
        r = write_file(id, req.target, req.data);
    } else if (req.op == "list") {
        r = list_dir(id, req.target);
    } else if (req.op == "env") {
        r = env(id, req.target);
    } else {
        r = error_result(CapabilityKind::Resource, "unknown host op " + req.op);
    }

    wire::Frame reply;
    reply.type = wire::FrameType::HostReply;
    switch (r.status) {
    case EffectResult::Status::Ok:
        reply.status = "ok";
        reply.data = std::move(r.data);
        reply.http_status = r.http_status;
        break;
    case EffectResult::Status::Denied:
        reply.status = "denied";
        reply.capability = capability_kind_name(r.capability);
        break;
    case EffectResult::Status::Error:
        reply.status = "error";
        reply.detail = r.message;
        std::cerr << "[sandbox] " << id << ": " << req.op << " failed: " << r.message << "\n";
        break;
    }
    return reply;
}

} // namespace capsule
