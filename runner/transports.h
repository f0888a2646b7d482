#pragma once

#include "capsule/bridge.h"

#include <atomic>
#include <string>

namespace capsule {

// Newline-delimited JSON-RPC on stdin/stdout; one session. Returns when
// stdin reaches EOF or `stop` is set, after draining in-flight calls.
int serve_stdio(Bridge& bridge, const std::atomic<bool>& stop);

enum class HttpMode {
    Sse,        // GET /sse event stream + POST /message?sessionId=
    Streamable, // POST/GET/DELETE /mcp with Mcp-Session-Id
};

struct HttpServeOptions {
    std::string host{"127.0.0.1"};
    int port{9001};
    HttpMode mode{HttpMode::Sse};
    std::string api_token;          // empty = open
    int max_conns{32};
    size_t max_body{4 * 1024 * 1024};
    int response_wait_ms{60000};    // streamable POST waiting for its reply
};

// 0 after a clean shutdown, 2 when the listener cannot be set up.
int serve_http(Bridge& bridge, const HttpServeOptions& opt, const std::atomic<bool>& stop);

} // namespace capsule
