#include "capsule/value.h"
#include "capsule/json_mini.h"

#include <cmath>
#include <limits>

namespace capsule {

Value Value::boolean(bool v) { Value x; x.kind = ValueKind::Bool; x.b = v; return x; }
Value Value::int64(int64_t v) { Value x; x.kind = ValueKind::Int; x.i = v; return x; }
Value Value::uint64(uint64_t v) { Value x; x.kind = ValueKind::UInt; x.u = v; return x; }
Value Value::float64(double v) { Value x; x.kind = ValueKind::Float; x.f = v; return x; }
Value Value::character(const std::string& utf8) { Value x; x.kind = ValueKind::Char; x.s = utf8; return x; }
Value Value::string(std::string v) { Value x; x.kind = ValueKind::String; x.s = std::move(v); return x; }
Value Value::bytes(std::string v) { Value x; x.kind = ValueKind::Bytes; x.s = std::move(v); return x; }

Value Value::list(std::vector<Value> v) {
    Value x;
    x.kind = ValueKind::List;
    x.items = std::move(v);
    return x;
}

Value Value::record(std::vector<std::pair<std::string, Value>> fields) {
    Value x;
    x.kind = ValueKind::Record;
    for (auto& f : fields) {
        x.names.push_back(std::move(f.first));
        x.items.push_back(std::move(f.second));
    }
    return x;
}

Value Value::variant(std::string tag, std::optional<Value> payload) {
    Value x;
    x.kind = ValueKind::Variant;
    x.s = std::move(tag);
    if (payload) x.items.push_back(std::move(*payload));
    return x;
}

Value Value::none() { Value x; x.kind = ValueKind::Option; return x; }

Value Value::some(Value v) {
    Value x;
    x.kind = ValueKind::Option;
    x.items.push_back(std::move(v));
    return x;
}

bool Value::operator==(const Value& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case ValueKind::Unit:   return true;
        case ValueKind::Bool:   return b == o.b;
        case ValueKind::Int:    return i == o.i;
        case ValueKind::UInt:   return u == o.u;
        case ValueKind::Float:  return f == o.f || (std::isnan(f) && std::isnan(o.f));
        case ValueKind::Char:
        case ValueKind::String:
        case ValueKind::Bytes:  return s == o.s;
        case ValueKind::List:
        case ValueKind::Option: return items == o.items;
        case ValueKind::Record: return names == o.names && items == o.items;
        case ValueKind::Variant: return s == o.s && items == o.items;
    }
    return false;
}

namespace {

bool fail(CodecError* err, const std::string& path, const std::string& msg) {
    if (err) {
        err->path = path;
        err->message = msg;
    }
    return false;
}

std::string join(const std::string& path, const std::string& field) {
    return path.empty() ? field : path + "." + field;
}

std::string index_path(const std::string& path, size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

bool is_single_code_point(const std::string& s) {
    if (s.empty()) return false;
    unsigned char c = static_cast<unsigned char>(s[0]);
    size_t len = 0;
    if (c < 0x80) len = 1;
    else if ((c & 0xE0) == 0xC0) len = 2;
    else if ((c & 0xF0) == 0xE0) len = 3;
    else if ((c & 0xF8) == 0xF0) len = 4;
    else return false;
    if (s.size() != len) return false;
    for (size_t k = 1; k < len; k++) {
        if ((static_cast<unsigned char>(s[k]) & 0xC0) != 0x80) return false;
    }
    return true;
}

bool nullable_encoding(const TypeTree& t) {
    return t.is_unit() || t.kind == TypeKind::Option;
}

bool signed_range(PrimitiveKind k, int64_t* lo, int64_t* hi) {
    switch (k) {
        case PrimitiveKind::S8:  *lo = INT8_MIN;  *hi = INT8_MAX;  return true;
        case PrimitiveKind::S16: *lo = INT16_MIN; *hi = INT16_MAX; return true;
        case PrimitiveKind::S32: *lo = INT32_MIN; *hi = INT32_MAX; return true;
        case PrimitiveKind::S64: *lo = INT64_MIN; *hi = INT64_MAX; return true;
        default: return false;
    }
}

bool unsigned_max(PrimitiveKind k, uint64_t* hi) {
    switch (k) {
        case PrimitiveKind::U8:  *hi = UINT8_MAX;  return true;
        case PrimitiveKind::U16: *hi = UINT16_MAX; return true;
        case PrimitiveKind::U32: *hi = UINT32_MAX; return true;
        case PrimitiveKind::U64: *hi = UINT64_MAX; return true;
        default: return false;
    }
}

// Integral JSON number as (negative?, magnitude-ish) pair. Accepts doubles with
// an exact integral value so clients that emit 3.0 are not rejected.
bool json_integer(json_object* j, bool* negative, int64_t* sv, uint64_t* uv) {
    if (json_object_is_type(j, json_type_int)) {
        int64_t s = json_object_get_int64(j);
        if (s < 0) {
            *negative = true;
            *sv = s;
            return true;
        }
        *negative = false;
        *uv = json_object_get_uint64(j);
        *sv = s;
        return true;
    }
    if (json_object_is_type(j, json_type_double)) {
        double d = json_object_get_double(j);
        if (!std::isfinite(d) || std::trunc(d) != d) return false;
        if (d < 0) {
            if (d < -9223372036854775808.0) return false;
            *negative = true;
            *sv = static_cast<int64_t>(d);
            return true;
        }
        if (d >= 18446744073709551616.0) return false;
        *negative = false;
        *uv = static_cast<uint64_t>(d);
        *sv = d >= 9223372036854775808.0 ? INT64_MAX : static_cast<int64_t>(d);
        return true;
    }
    return false;
}

bool decode_primitive(json_object* j, PrimitiveKind k, const std::string& path,
                      Value* out, CodecError* err) {
    const std::string want = primitive_name(k);
    switch (k) {
        case PrimitiveKind::Unit:
            if (j != nullptr && !json_object_is_type(j, json_type_null)) {
                return fail(err, path, "expected null");
            }
            *out = Value::unit();
            return true;
        case PrimitiveKind::Bool:
            if (!j || !json_object_is_type(j, json_type_boolean)) return fail(err, path, "expected bool");
            *out = Value::boolean(json_object_get_boolean(j) != 0);
            return true;
        case PrimitiveKind::S8:
        case PrimitiveKind::S16:
        case PrimitiveKind::S32:
        case PrimitiveKind::S64: {
            bool neg = false;
            int64_t sv = 0;
            uint64_t uv = 0;
            if (!j || !json_integer(j, &neg, &sv, &uv)) return fail(err, path, "expected " + want);
            int64_t lo = 0, hi = 0;
            signed_range(k, &lo, &hi);
            if (!neg && uv > static_cast<uint64_t>(hi)) return fail(err, path, want + " out of range");
            if (neg && sv < lo) return fail(err, path, want + " out of range");
            *out = Value::int64(neg ? sv : static_cast<int64_t>(uv));
            return true;
        }
        case PrimitiveKind::U8:
        case PrimitiveKind::U16:
        case PrimitiveKind::U32:
        case PrimitiveKind::U64: {
            bool neg = false;
            int64_t sv = 0;
            uint64_t uv = 0;
            if (!j || !json_integer(j, &neg, &sv, &uv)) return fail(err, path, "expected " + want);
            uint64_t hi = 0;
            unsigned_max(k, &hi);
            if (neg || uv > hi) return fail(err, path, want + " out of range");
            *out = Value::uint64(uv);
            return true;
        }
        case PrimitiveKind::F32:
        case PrimitiveKind::F64: {
            if (!j || !(json_object_is_type(j, json_type_double) || json_object_is_type(j, json_type_int))) {
                return fail(err, path, "expected " + want);
            }
            double d = json_object_get_double(j);
            if (k == PrimitiveKind::F32 && std::isfinite(d) &&
                std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max())) {
                return fail(err, path, "f32 out of range");
            }
            *out = Value::float64(d);
            return true;
        }
        case PrimitiveKind::Char: {
            if (!j || !json_object_is_type(j, json_type_string)) return fail(err, path, "expected char");
            std::string s(json_object_get_string(j), static_cast<size_t>(json_object_get_string_len(j)));
            if (!is_single_code_point(s)) return fail(err, path, "expected exactly one character");
            *out = Value::character(s);
            return true;
        }
        case PrimitiveKind::String:
            if (!j || !json_object_is_type(j, json_type_string)) return fail(err, path, "expected string");
            *out = Value::string(std::string(json_object_get_string(j),
                                             static_cast<size_t>(json_object_get_string_len(j))));
            return true;
        case PrimitiveKind::Bytes: {
            if (!j || !json_object_is_type(j, json_type_string)) return fail(err, path, "expected base64 string");
            std::string raw;
            if (!base64_decode(std::string(json_object_get_string(j),
                                           static_cast<size_t>(json_object_get_string_len(j))), &raw)) {
                return fail(err, path, "invalid base64");
            }
            *out = Value::bytes(std::move(raw));
            return true;
        }
    }
    return fail(err, path, "unsupported primitive");
}

} // namespace

bool decode_value(json_object* j, const TypeTree& t, const std::string& path,
                  Value* out, CodecError* err) {
    switch (t.kind) {
        case TypeKind::Primitive:
            return decode_primitive(j, t.prim, path, out, err);

        case TypeKind::List: {
            if (!j || !json_object_is_type(j, json_type_array)) return fail(err, path, "expected list");
            std::vector<Value> items;
            const size_t n = json_object_array_length(j);
            items.reserve(n);
            for (size_t k = 0; k < n; k++) {
                Value el;
                if (!decode_value(json_object_array_get_idx(j, k), t.children[0], index_path(path, k), &el, err)) {
                    return false;
                }
                items.push_back(std::move(el));
            }
            *out = Value::list(std::move(items));
            return true;
        }

        case TypeKind::Option: {
            const TypeTree& inner = t.children[0];
            if (!j || json_object_is_type(j, json_type_null)) {
                *out = Value::none();
                return true;
            }
            json_object* payload = j;
            if (nullable_encoding(inner)) {
                payload = json_mini::member(j, "some");
                if (!payload && !json_mini::has_key(j, "some")) {
                    return fail(err, path, "expected null or {\"some\": ...}");
                }
            }
            Value v;
            if (!decode_value(payload, inner, path, &v, err)) return false;
            *out = Value::some(std::move(v));
            return true;
        }

        case TypeKind::Record: {
            if (!j || !json_object_is_type(j, json_type_object)) return fail(err, path, "expected record");
            json_object_object_foreach(j, key, val) {
                (void)val;
                bool known = false;
                for (const auto& n : t.names) {
                    if (n == key) { known = true; break; }
                }
                if (!known) return fail(err, join(path, key), "unknown field");
            }
            std::vector<std::pair<std::string, Value>> fields;
            for (size_t k = 0; k < t.names.size(); k++) {
                const std::string fpath = join(path, t.names[k]);
                json_object* fv = nullptr;
                bool present = json_object_object_get_ex(j, t.names[k].c_str(), &fv);
                if (!present && t.children[k].kind != TypeKind::Option) {
                    return fail(err, fpath, "missing field");
                }
                Value v;
                if (!decode_value(fv, t.children[k], fpath, &v, err)) return false;
                fields.emplace_back(t.names[k], std::move(v));
            }
            *out = Value::record(std::move(fields));
            return true;
        }

        case TypeKind::Variant: {
            std::string tag;
            json_object* payload = nullptr;
            if (j && json_object_is_type(j, json_type_string)) {
                tag = json_object_get_string(j);
            } else if (j && json_object_is_type(j, json_type_object) && json_object_object_length(j) == 1) {
                json_object_object_foreach(j, key, val) {
                    tag = key;
                    payload = val;
                }
            } else {
                return fail(err, path, "expected variant (\"tag\" or {\"tag\": payload})");
            }
            for (size_t k = 0; k < t.names.size(); k++) {
                if (t.names[k] != tag) continue;
                const std::string cpath = join(path, tag);
                if (t.children[k].is_unit()) {
                    if (payload && !json_object_is_type(payload, json_type_null)) {
                        return fail(err, cpath, "case takes no payload");
                    }
                    *out = Value::variant(tag);
                    return true;
                }
                Value v;
                if (!decode_value(payload, t.children[k], cpath, &v, err)) return false;
                *out = Value::variant(tag, std::move(v));
                return true;
            }
            return fail(err, path, "unknown variant case '" + tag + "'");
        }
    }
    return fail(err, path, "unsupported type");
}

json_object* encode_value(const Value& v, const TypeTree& t) {
    switch (t.kind) {
        case TypeKind::Primitive:
            switch (t.prim) {
                case PrimitiveKind::Unit:   return nullptr;
                case PrimitiveKind::Bool:   return json_object_new_boolean(v.b ? 1 : 0);
                case PrimitiveKind::S8:
                case PrimitiveKind::S16:
                case PrimitiveKind::S32:
                case PrimitiveKind::S64:    return json_object_new_int64(v.i);
                case PrimitiveKind::U8:
                case PrimitiveKind::U16:
                case PrimitiveKind::U32:
                case PrimitiveKind::U64:    return json_object_new_uint64(v.u);
                case PrimitiveKind::F32:
                case PrimitiveKind::F64:    return json_object_new_double(v.f);
                case PrimitiveKind::Char:
                case PrimitiveKind::String: return json_mini::new_string(v.s);
                case PrimitiveKind::Bytes:  return json_mini::new_string(base64_encode(v.s));
            }
            return nullptr;
        case TypeKind::List: {
            json_object* arr = json_object_new_array();
            for (const auto& el : v.items) json_object_array_add(arr, encode_value(el, t.children[0]));
            return arr;
        }
        case TypeKind::Option: {
            if (v.items.empty()) return nullptr;
            const TypeTree& inner = t.children[0];
            json_object* payload = encode_value(v.items[0], inner);
            if (!nullable_encoding(inner)) return payload;
            json_object* o = json_object_new_object();
            json_object_object_add(o, "some", payload);
            return o;
        }
        case TypeKind::Record: {
            json_object* o = json_object_new_object();
            for (size_t k = 0; k < t.names.size() && k < v.items.size(); k++) {
                json_object_object_add(o, t.names[k].c_str(), encode_value(v.items[k], t.children[k]));
            }
            return o;
        }
        case TypeKind::Variant: {
            for (size_t k = 0; k < t.names.size(); k++) {
                if (t.names[k] != v.s) continue;
                if (t.children[k].is_unit()) return json_mini::new_string(v.s);
                json_object* o = json_object_new_object();
                json_object_object_add(o, v.s.c_str(),
                                       v.items.empty() ? nullptr : encode_value(v.items[0], t.children[k]));
                return o;
            }
            return nullptr;
        }
    }
    return nullptr;
}

bool validate_value(const Value& v, const TypeTree& t, const std::string& path, CodecError* err) {
    switch (t.kind) {
        case TypeKind::Primitive: {
            const std::string want = primitive_name(t.prim);
            switch (t.prim) {
                case PrimitiveKind::Unit:
                    return v.kind == ValueKind::Unit || fail(err, path, "expected unit");
                case PrimitiveKind::Bool:
                    return v.kind == ValueKind::Bool || fail(err, path, "expected bool");
                case PrimitiveKind::S8:
                case PrimitiveKind::S16:
                case PrimitiveKind::S32:
                case PrimitiveKind::S64: {
                    if (v.kind != ValueKind::Int) return fail(err, path, "expected " + want);
                    int64_t lo = 0, hi = 0;
                    signed_range(t.prim, &lo, &hi);
                    return (v.i >= lo && v.i <= hi) || fail(err, path, want + " out of range");
                }
                case PrimitiveKind::U8:
                case PrimitiveKind::U16:
                case PrimitiveKind::U32:
                case PrimitiveKind::U64: {
                    if (v.kind != ValueKind::UInt) return fail(err, path, "expected " + want);
                    uint64_t hi = 0;
                    unsigned_max(t.prim, &hi);
                    return v.u <= hi || fail(err, path, want + " out of range");
                }
                case PrimitiveKind::F32:
                case PrimitiveKind::F64:
                    return v.kind == ValueKind::Float || fail(err, path, "expected " + want);
                case PrimitiveKind::Char:
                    return (v.kind == ValueKind::Char && is_single_code_point(v.s)) ||
                           fail(err, path, "expected char");
                case PrimitiveKind::String:
                    return v.kind == ValueKind::String || fail(err, path, "expected string");
                case PrimitiveKind::Bytes:
                    return v.kind == ValueKind::Bytes || fail(err, path, "expected bytes");
            }
            return fail(err, path, "unsupported primitive");
        }
        case TypeKind::List:
            if (v.kind != ValueKind::List) return fail(err, path, "expected list");
            for (size_t k = 0; k < v.items.size(); k++) {
                if (!validate_value(v.items[k], t.children[0], index_path(path, k), err)) return false;
            }
            return true;
        case TypeKind::Option:
            if (v.kind != ValueKind::Option || v.items.size() > 1) return fail(err, path, "expected option");
            if (v.items.empty()) return true;
            return validate_value(v.items[0], t.children[0], path, err);
        case TypeKind::Record:
            if (v.kind != ValueKind::Record || v.items.size() != v.names.size()) {
                return fail(err, path, "expected record");
            }
            for (size_t k = 0; k < t.names.size(); k++) {
                const std::string fpath = join(path, t.names[k]);
                if (k >= v.names.size() || v.names[k] != t.names[k]) return fail(err, fpath, "missing field");
                if (!validate_value(v.items[k], t.children[k], fpath, err)) return false;
            }
            if (v.names.size() > t.names.size()) {
                return fail(err, join(path, v.names[t.names.size()]), "unknown field");
            }
            return true;
        case TypeKind::Variant:
            if (v.kind != ValueKind::Variant) return fail(err, path, "expected variant");
            for (size_t k = 0; k < t.names.size(); k++) {
                if (t.names[k] != v.s) continue;
                const std::string cpath = join(path, v.s);
                if (t.children[k].is_unit()) {
                    return v.items.empty() || fail(err, cpath, "case takes no payload");
                }
                if (v.items.size() != 1) return fail(err, cpath, "missing payload");
                return validate_value(v.items[0], t.children[k], cpath, err);
            }
            return fail(err, path, "unknown variant case '" + v.s + "'");
    }
    return fail(err, path, "unsupported type");
}

bool decode_arguments(json_object* args, const ToolSignature& sig,
                      std::vector<Value>* out, CodecError* err) {
    out->clear();
    if (args && json_object_is_type(args, json_type_null)) args = nullptr;
    if (args && !json_object_is_type(args, json_type_object)) {
        return fail(err, "arguments", "expected an object of named arguments");
    }
    if (args) {
        json_object_object_foreach(args, key, val) {
            (void)val;
            bool known = false;
            for (const auto& p : sig.params) {
                if (p.name == key) { known = true; break; }
            }
            if (!known) return fail(err, key, "unknown argument");
        }
    }
    for (const auto& p : sig.params) {
        json_object* pv = nullptr;
        bool present = args && json_object_object_get_ex(args, p.name.c_str(), &pv);
        if (!present && p.type.kind != TypeKind::Option) return fail(err, p.name, "missing argument");
        Value v;
        if (!decode_value(pv, p.type, p.name, &v, err)) return false;
        out->push_back(std::move(v));
    }
    return true;
}

std::string encode_arguments(const std::vector<Value>& args, const ToolSignature& sig) {
    json_mini::Doc arr(json_object_new_array());
    for (size_t k = 0; k < args.size() && k < sig.params.size(); k++) {
        json_object_array_add(arr.root, encode_value(args[k], sig.params[k].type));
    }
    return json_mini::dump(arr.root);
}

bool decode_result_text(const std::string& json, const TypeTree& t, Value* out, CodecError* err) {
    if (t.is_unit() && json.empty()) {
        *out = Value::unit();
        return true;
    }
    if (json == "null") return decode_value(nullptr, t, "result", out, err);
    json_mini::Doc d = json_mini::parse(json);
    if (!d) return fail(err, "result", "result is not valid JSON");
    return decode_value(d.root, t, "result", out, err);
}

static const char* kB64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& in) {
    std::string out;
    out.reserve(((in.size() + 2) / 3) * 4);
    size_t k = 0;
    while (k + 3 <= in.size()) {
        uint32_t n = (uint32_t(uint8_t(in[k])) << 16) | (uint32_t(uint8_t(in[k + 1])) << 8) | uint8_t(in[k + 2]);
        out.push_back(kB64[(n >> 18) & 0x3F]);
        out.push_back(kB64[(n >> 12) & 0x3F]);
        out.push_back(kB64[(n >> 6) & 0x3F]);
        out.push_back(kB64[n & 0x3F]);
        k += 3;
    }
    size_t rest = in.size() - k;
    if (rest == 1) {
        uint32_t n = uint32_t(uint8_t(in[k])) << 16;
        out.push_back(kB64[(n >> 18) & 0x3F]);
        out.push_back(kB64[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        uint32_t n = (uint32_t(uint8_t(in[k])) << 16) | (uint32_t(uint8_t(in[k + 1])) << 8);
        out.push_back(kB64[(n >> 18) & 0x3F]);
        out.push_back(kB64[(n >> 12) & 0x3F]);
        out.push_back(kB64[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

bool base64_decode(const std::string& in, std::string* out) {
    if (in.size() % 4 != 0) return false;
    auto val = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };
    out->clear();
    out->reserve(in.size() / 4 * 3);
    for (size_t k = 0; k < in.size(); k += 4) {
        int a = val(in[k]), b = val(in[k + 1]);
        if (a < 0 || b < 0) return false;
        bool last = (k + 4 == in.size());
        int c = (in[k + 2] == '=' && last) ? -2 : val(in[k + 2]);
        int d = (in[k + 3] == '=' && last) ? -2 : val(in[k + 3]);
        if (c == -1 || d == -1 || (c == -2 && d != -2)) return false;
        uint32_t n = (uint32_t(a) << 18) | (uint32_t(b) << 12);
        if (c >= 0) n |= uint32_t(c) << 6;
        if (d >= 0) n |= uint32_t(d);
        out->push_back(static_cast<char>((n >> 16) & 0xFF));
        if (c >= 0) out->push_back(static_cast<char>((n >> 8) & 0xFF));
        if (d >= 0) out->push_back(static_cast<char>(n & 0xFF));
    }
    return true;
}

} // namespace capsule
