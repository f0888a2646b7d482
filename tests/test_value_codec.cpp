#include "test_common.h"
#include "capsule/introspect.h"
#include "capsule/json_mini.h"
#include "capsule/value.h"

using namespace capsule;

static TypeTree prim(PrimitiveKind k) { return TypeTree::primitive(k); }

static CodecError decode_err(const std::string& json, const TypeTree& t) {
    json_mini::Doc d = json_mini::parse(json);
    Value v;
    CodecError err;
    if (decode_value(d.root, t, "", &v, &err)) die("expected decode failure for " + json);
    return err;
}

static Value decode_ok(const std::string& json, const TypeTree& t) {
    json_mini::Doc d = json_mini::parse(json);
    Value v;
    CodecError err;
    if (!decode_value(d.root, t, "", &v, &err)) die("decode failed for " + json + ": " + err.path + ": " + err.message);
    return v;
}

static std::string encode(const Value& v, const TypeTree& t) {
    json_mini::Doc d(encode_value(v, t));
    return json_mini::dump(d.root);
}

int main() {
    const TypeTree point = TypeTree::record({{"x", prim(PrimitiveKind::S32)}, {"y", prim(PrimitiveKind::S32)}});
    const TypeTree shape = TypeTree::variant({{"circle", prim(PrimitiveKind::F64)},
                                              {"square", prim(PrimitiveKind::F64)},
                                              {"empty", prim(PrimitiveKind::Unit)}});

    // Integer ranges
    {
        expect_true(decode_ok("127", prim(PrimitiveKind::S8)).i == 127, "s8 max");
        CodecError e = decode_err("128", prim(PrimitiveKind::S8));
        expect_true(e.message.find("out of range") != std::string::npos, "s8 overflow: " + e.message);
        decode_err("-1", prim(PrimitiveKind::U32));
        decode_err("1.5", prim(PrimitiveKind::S32));
        decode_err("\"7\"", prim(PrimitiveKind::S32));
        expect_true(decode_ok("18446744073709551615", prim(PrimitiveKind::U64)).u == UINT64_MAX, "u64 max");
    }

    // Chars are exactly one code point
    {
        expect_eq_str(decode_ok("\"\xc3\xa9\"", prim(PrimitiveKind::Char)).s, "\xc3\xa9", "two-byte char");
        decode_err("\"ab\"", prim(PrimitiveKind::Char));
        decode_err("\"\"", prim(PrimitiveKind::Char));
    }

    // Nested paths point at the offending leaf
    {
        const TypeTree pts = TypeTree::list(point);
        CodecError e = decode_err(R"([{"x":1,"y":2},{"x":1,"y":"two"}])", pts);
        expect_eq_str(e.path, "[1].y", "list element field path");

        e = decode_err(R"({"x":1})", point);
        expect_eq_str(e.path, "y", "missing field path");
        expect_eq_str(e.message, "missing field", "missing field message");

        e = decode_err(R"({"x":1,"y":2,"z":3})", point);
        expect_eq_str(e.path, "z", "unknown field path");

        e = decode_err(R"({"circle":"big"})", shape);
        expect_eq_str(e.path, "circle", "variant payload path");
        e = decode_err(R"("triangle")", shape);
        expect_true(e.message.find("triangle") != std::string::npos, "unknown case named");
        decode_err(R"({"empty":1})", shape);
    }

    // Variant and option encodings
    {
        Value c = decode_ok(R"({"circle":2.5})", shape);
        expect_true(c.kind == ValueKind::Variant && c.s == "circle" && c.items.size() == 1, "circle decoded");
        expect_eq_str(encode(Value::variant("empty"), shape), "\"empty\"", "payload-less case encodes as tag");
        expect_true(decode_ok(R"({"empty":null})", shape).items.empty(), "object form of payload-less case");

        const TypeTree opt = TypeTree::option(prim(PrimitiveKind::String));
        expect_true(decode_ok("null", opt).items.empty(), "null is none");
        expect_eq_str(decode_ok("\"x\"", opt).items[0].s, "x", "bare value is some");
        expect_eq_str(encode(Value::none(), opt), "null", "none encodes as null");

        // option<option<T>> needs the explicit {"some": ...} wrapper to keep some(none) apart from none
        const TypeTree nested = TypeTree::option(opt);
        Value sn = decode_ok(R"({"some":null})", nested);
        expect_true(sn.items.size() == 1 && sn.items[0].items.empty(), "some(none)");
        expect_eq_str(encode(sn, nested), R"({"some":null})", "some(none) encodes with wrapper");
        decode_err("\"x\"", nested);
    }

    // Bytes are base64
    {
        std::string raw("\x00\x01\xfe\xff", 4);
        expect_eq_str(base64_encode(raw), "AAH+/w==", "base64 encode");
        std::string back;
        expect_true(base64_decode("AAH+/w==", &back) && back == raw, "base64 decode");
        expect_true(!base64_decode("AAH", &back), "truncated base64");
        expect_true(!base64_decode("AA!=", &back), "bad base64 alphabet");
        expect_eq_str(decode_ok("\"aGk=\"", prim(PrimitiveKind::Bytes)).s, "hi", "bytes from base64");
    }

    // Structural validation of results
    {
        CodecError err;
        Value bad = Value::record({{"x", Value::int64(1)}, {"y", Value::string("2")}});
        expect_true(!validate_value(bad, point, "result", &err), "wrong field kind");
        expect_eq_str(err.path, "result.y", "validation path");
        expect_true(validate_value(Value::record({{"x", Value::int64(1)}, {"y", Value::int64(-1)}}), point, "result", &err),
                    "good record validates");
        expect_true(!validate_value(Value::int64(300), prim(PrimitiveKind::U8), "result", &err), "int kind for u8");
        expect_true(!validate_value(Value::uint64(300), prim(PrimitiveKind::U8), "result", &err), "u8 range");
    }

    // Named arguments -> ordered values
    {
        IntrospectResult ir = introspect(R"({"exports":[{"name":"translate","params":[
            {"name":"p","type":{"record":[{"name":"x","type":"s32"},{"name":"y","type":"s32"}]}},
            {"name":"dx","type":"s32"},{"name":"label","type":{"option":"string"}}],"result":"string"}]})");
        expect_true(ir.ok, "translate interface");
        const ToolSignature& sig = ir.schema.tools[0];

        json_mini::Doc args = json_mini::parse(R"({"dx":3,"p":{"y":2,"x":1}})");
        std::vector<Value> vals;
        CodecError err;
        expect_true(decode_arguments(args.root, sig, &vals, &err), "decode arguments");
        expect_eq_ll((long long)vals.size(), 3, "absent option becomes none");
        expect_eq_str(encode_arguments(vals, sig), R"([{"x":1,"y":2},3,null])", "wire order follows parameters");

        json_mini::Doc missing = json_mini::parse(R"({"p":{"x":1,"y":2}})");
        expect_true(!decode_arguments(missing.root, sig, &vals, &err), "missing argument");
        expect_eq_str(err.path, "dx", "missing argument path");

        json_mini::Doc extra = json_mini::parse(R"({"p":{"x":1,"y":2},"dx":1,"dy":2})");
        expect_true(!decode_arguments(extra.root, sig, &vals, &err), "unknown argument");
        expect_eq_str(err.path, "dy", "unknown argument path");

        json_mini::Doc nested = json_mini::parse(R"({"p":{"x":1,"y":true},"dx":1})");
        expect_true(!decode_arguments(nested.root, sig, &vals, &err), "bad nested argument");
        expect_eq_str(err.path, "p.y", "nested argument path");

        Value out;
        expect_true(decode_result_text("\"moved\"", sig.result, &out, &err) && out.s == "moved", "result text");
        expect_true(!decode_result_text("42", sig.result, &out, &err), "result of the wrong type");
        expect_true(!decode_result_text("{", sig.result, &out, &err), "result is not JSON");
    }

    // Input schemas
    {
        IntrospectResult ir = introspect(R"({"exports":[{"name":"f","params":[
            {"name":"n","type":"u8"},{"name":"o","type":{"option":"bool"}}]}]})");
        expect_true(ir.ok, "schema interface");
        json_mini::Doc s(tool_input_schema(ir.schema.tools[0]));
        expect_eq_str(json_mini::get_string(s.root, "type").value_or(""), "object", "object schema");
        std::vector<std::string> req = json_mini::get_array_strings(s.root, "required");
        expect_true(req.size() == 1 && req[0] == "n", "only non-option params are required");
        json_object* n = json_mini::member(json_mini::member(s.root, "properties"), "n");
        expect_eq_ll(json_mini::get_int(n, "maximum").value_or(-1), 255, "u8 maximum");
        expect_true(json_mini::get_bool(s.root, "additionalProperties") == std::optional<bool>(false),
                    "closed argument object");
    }

    std::cerr << "test_value_codec: ALL PASSED" << std::endl;
    return 0;
}
