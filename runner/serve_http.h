#pragma once

// HTTP helpers shared by the SSE and streamable-http transports

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include "capsule/crypto.h"

namespace capsule {

struct HttpRequest {
    std::string method;
    std::string path;   // without the query string
    std::string query;  // after '?', undecoded
    std::string head;   // request line and headers
    std::string body;
};

// Set socket recv/send timeouts for Slowloris defense
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Content-Length above max_body is rejected without reading the body.
inline bool read_http_request(int fd, HttpRequest* req, size_t max_body) {
    std::string buf;
    buf.resize(8192);
    std::string all;

    while (all.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false; // timeout or disconnect
        all.append(buf.data(), (size_t)n);
        if (all.size() > 64 * 1024) return false; // header cap
    }

    size_t p = all.find("\r\n\r\n");
    req->head = all.substr(0, p + 4);
    std::string rest = all.substr(p + 4);

    size_t cl = 0;
    {
        int cl_count = 0;
        std::istringstream iss(req->head);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            std::string low = line;
            for (char& c : low) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
            if (low.rfind("transfer-encoding:", 0) == 0) return false; // chunked bodies unsupported
            if (low.rfind("content-length:", 0) == 0) {
                cl_count++;
                if (cl_count > 1) return false; // duplicate Content-Length: request smuggling
                std::string v = line.substr(15);
                while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
                if (v.empty() || v.size() > 12 || v.find_first_not_of("0123456789") != std::string::npos) return false;
                cl = (size_t)std::stoull(v);
            }
        }
    }
    if (cl > max_body) return false;

    req->body = rest;
    while (req->body.size() < cl) {
        ssize_t n = ::recv(fd, buf.data(), buf.size(), 0);
        if (n <= 0) return false;
        req->body.append(buf.data(), (size_t)n);
    }
    if (req->body.size() > cl) req->body.resize(cl);

    std::istringstream iss(req->head);
    std::string target, ver;
    iss >> req->method >> target >> ver;
    size_t q = target.find('?');
    req->path = target.substr(0, q);
    req->query = q == std::string::npos ? "" : target.substr(q + 1);
    return !req->method.empty() && !req->path.empty();
}

inline bool send_all(int fd, const std::string& s) {
    size_t sent = 0;
    while (sent < s.size()) {
        ssize_t n = ::send(fd, s.data() + sent, s.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += (size_t)n;
    }
    return true;
}

inline const char* http_reason(int code) {
    switch (code) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 503: return "Service Unavailable";
        default:  return "ERR";
    }
}

// extra_headers: complete "Name: value\r\n" lines.
inline void send_json(int fd, int code, const std::string& json, const std::string& extra_headers = "") {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << code << " " << http_reason(code) << "\r\n";
    if (!json.empty()) oss << "Content-Type: application/json\r\n";
    oss << extra_headers;
    oss << "Content-Length: " << json.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << json;
    (void)send_all(fd, oss.str());
}

inline bool start_event_stream(int fd, const std::string& extra_headers = "") {
    return send_all(fd, "HTTP/1.1 200 OK\r\n"
                        "Content-Type: text/event-stream\r\n"
                        "Cache-Control: no-cache\r\n" +
                            extra_headers +
                            "Connection: keep-alive\r\n\r\n");
}

// One SSE event. JSON-RPC messages are single-line, so one data: line suffices.
inline bool send_event(int fd, const std::string& event, const std::string& data) {
    return send_all(fd, "event: " + event + "\ndata: " + data + "\n\n");
}

// True once the peer has closed its side (or the socket failed).
inline bool peer_closed(int fd, int wait_ms) {
    struct pollfd p{fd, POLLIN, 0};
    int r = ::poll(&p, 1, wait_ms);
    if (r <= 0) return false;
    if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) return true;
    char c;
    ssize_t n = ::recv(fd, &c, 1, MSG_PEEK | MSG_DONTWAIT);
    return n == 0;
}

inline std::string header_value_ci(const std::string& head, const std::string& key_lower) {
    std::istringstream iss(head);
    std::string line;
    std::getline(iss, line);
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c);
        for (char& ch : k) if (ch >= 'A' && ch <= 'Z') ch = (char)(ch - 'A' + 'a');
        if (k == key_lower) {
            std::string v = line.substr(c + 1);
            while (!v.empty() && (v[0] == ' ' || v[0] == '\t')) v.erase(0, 1);
            while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
            return v;
        }
    }
    return "";
}

// Value of `key` in an undecoded query string. Session ids are hex, so no
// percent-decoding is needed.
inline std::string query_param(const std::string& query, const std::string& key) {
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string kv = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        size_t eq = kv.find('=');
        if (kv.substr(0, eq) == key) return eq == std::string::npos ? "" : kv.substr(eq + 1);
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return "";
}

inline bool api_token_ok(const std::string& head, const std::string& expected_token) {
    if (expected_token.empty()) return true;
    std::string x = header_value_ci(head, "x-api-token");
    if (!x.empty() && constant_time_eq(x, expected_token)) return true;
    std::string auth = header_value_ci(head, "authorization");
    const std::string pfx = "Bearer ";
    if (auth.rfind(pfx, 0) == 0) {
        std::string t = auth.substr(pfx.size());
        return constant_time_eq(t, expected_token);
    }
    return false;
}

} // namespace capsule
