#include "capsule/wire.h"
#include "capsule/json_mini.h"
#include "capsule/value.h"

namespace capsule::wire {

const char* frame_type_name(FrameType t) {
    switch (t) {
    case FrameType::Call: return "call";
    case FrameType::HostReply: return "host_reply";
    case FrameType::Ready: return "ready";
    case FrameType::Fatal: return "fatal";
    case FrameType::Host: return "host";
    case FrameType::Log: return "log";
    case FrameType::Done: return "done";
    }
    return "call";
}

static bool frame_type_from_name(const std::string& s, FrameType* out) {
    static const FrameType all[] = {
        FrameType::Call, FrameType::HostReply, FrameType::Ready, FrameType::Fatal,
        FrameType::Host, FrameType::Log, FrameType::Done,
    };
    for (FrameType t : all) {
        if (s == frame_type_name(t)) {
            *out = t;
            return true;
        }
    }
    return false;
}

static void add_str(json_object* o, const char* key, const std::string& v) {
    json_object_object_add(o, key, json_mini::new_string(v));
}

std::string encode(const Frame& f) {
    json_mini::Doc o(json_object_new_object());
    add_str(o.root, "t", frame_type_name(f.type));

    switch (f.type) {
    case FrameType::Call: {
        json_object_object_add(o.root, "id", json_object_new_int64((int64_t)f.id));
        add_str(o.root, "function", f.function);
        json_mini::Doc args = json_mini::parse(f.args.empty() ? "[]" : f.args);
        json_object_object_add(o.root, "args", args ? args.release() : json_object_new_array());
        break;
    }
    case FrameType::HostReply:
        add_str(o.root, "status", f.status);
        if (!f.data.empty()) add_str(o.root, "data_b64", base64_encode(f.data));
        if (f.http_status) json_object_object_add(o.root, "http_status", json_object_new_int(f.http_status));
        if (!f.capability.empty()) add_str(o.root, "capability", f.capability);
        if (!f.detail.empty()) add_str(o.root, "detail", f.detail);
        break;
    case FrameType::Ready:
        json_object_object_add(o.root, "abi", json_object_new_int(f.abi));
        break;
    case FrameType::Fatal:
        add_str(o.root, "detail", f.detail);
        break;
    case FrameType::Host:
        add_str(o.root, "op", f.op);
        if (!f.method.empty()) add_str(o.root, "method", f.method);
        if (!f.target.empty()) add_str(o.root, "target", f.target);
        if (!f.data.empty()) add_str(o.root, "data_b64", base64_encode(f.data));
        break;
    case FrameType::Log:
        add_str(o.root, "level", f.level);
        add_str(o.root, "detail", f.detail);
        break;
    case FrameType::Done:
        json_object_object_add(o.root, "id", json_object_new_int64((int64_t)f.id));
        add_str(o.root, "status", f.status);
        if (f.status == "ok") add_str(o.root, "result", f.result);
        if (!f.detail.empty()) add_str(o.root, "detail", f.detail);
        break;
    }
    return json_mini::dump(o.root);
}

bool decode(const std::string& line, Frame* out, std::string* err) {
    json_mini::Doc d = json_mini::parse(line);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        if (err) *err = "frame is not a JSON object";
        return false;
    }
    Frame f;
    auto t = json_mini::get_string(d.root, "t");
    if (!t || !frame_type_from_name(*t, &f.type)) {
        if (err) *err = "unknown frame type";
        return false;
    }

    f.id = (uint64_t)json_mini::get_int(d.root, "id").value_or(0);
    f.function = json_mini::get_string(d.root, "function").value_or("");
    f.op = json_mini::get_string(d.root, "op").value_or("");
    f.method = json_mini::get_string(d.root, "method").value_or("");
    f.target = json_mini::get_string(d.root, "target").value_or("");
    f.status = json_mini::get_string(d.root, "status").value_or("");
    f.http_status = (int)json_mini::get_int(d.root, "http_status").value_or(0);
    f.capability = json_mini::get_string(d.root, "capability").value_or("");
    f.result = json_mini::get_string(d.root, "result").value_or("");
    f.detail = json_mini::get_string(d.root, "detail").value_or("");
    f.level = json_mini::get_string(d.root, "level").value_or("");
    f.abi = (int)json_mini::get_int(d.root, "abi").value_or(0);

    if (json_object* a = json_mini::member(d.root, "args")) {
        if (!json_object_is_type(a, json_type_array)) {
            if (err) *err = "args must be an array";
            return false;
        }
        f.args = json_mini::dump(a);
    }
    if (auto b64 = json_mini::get_string(d.root, "data_b64")) {
        if (!base64_decode(*b64, &f.data)) {
            if (err) *err = "bad data_b64";
            return false;
        }
    }

    if ((f.type == FrameType::Call && f.function.empty()) ||
        (f.type == FrameType::Host && f.op.empty()) ||
        ((f.type == FrameType::Done || f.type == FrameType::HostReply) && f.status.empty())) {
        if (err) *err = std::string("incomplete ") + frame_type_name(f.type) + " frame";
        return false;
    }

    *out = std::move(f);
    return true;
}

} // namespace capsule::wire
