#pragma once

// Frames exchanged between the host and a capsule_sandbox process, one
// JSON object per line on the child's stdin/stdout.
//
//   host -> sandbox   call        {"t":"call","id":7,"function":"add","args":[2,3]}
//                     host_reply  {"t":"host_reply","status":"ok","data_b64":"..","http_status":200}
//   sandbox -> host   ready       {"t":"ready","abi":1}
//                     fatal       {"t":"fatal","detail":"dlopen failed: .."}
//                     host        {"t":"host","op":"http","method":"GET","target":"http://..","data_b64":""}
//                     log         {"t":"log","level":"info","detail":".."}
//                     done        {"t":"done","id":7,"status":"ok","result":"5"}
//
// Host ops: http, read, write, list, env. Binary payloads
// travel base64-encoded; "result" carries the component's JSON text
// verbatim so the host validates it, not the sandbox.

#include <cstdint>
#include <string>

namespace capsule::wire {

enum class FrameType {
    Call,
    HostReply,
    Ready,
    Fatal,
    Host,
    Log,
    Done,
};

struct Frame {
    FrameType type{FrameType::Call};
    uint64_t id{0};

    std::string function;   // call
    std::string args;       // call: JSON array text

    std::string op;         // host
    std::string method;     // host (http)
    std::string target;     // host: url, path or variable name
    std::string data;       // host / host_reply: raw bytes

    std::string status;     // host_reply: ok|denied|error|cancelled
                            // done: ok|trap|denied|cancelled|no_such_function
    int http_status{0};     // host_reply (http)
    std::string capability; // host_reply (denied)

    std::string result;     // done (ok): JSON text
    std::string detail;     // fatal, log, done (trap), host_reply (error)
    std::string level;      // log
    int abi{0};             // ready
};

const char* frame_type_name(FrameType t);

// Single line, no trailing newline.
std::string encode(const Frame& f);

bool decode(const std::string& line, Frame* out, std::string* err);

} // namespace capsule::wire
