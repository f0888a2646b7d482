#include "component_util.h"

#include <cstdlib>

// Exercises the composite types: records, variants, options, lists, bytes.
CAPSULE_COMPONENT_INTERFACE(R"({
  "world": "shapes",
  "version": "0.2.0",
  "imports": [],
  "types": [
    {"name": "point", "type": {"record": [{"name": "x", "type": "s32"}, {"name": "y", "type": "s32"}]}},
    {"name": "shape", "type": {"variant": [{"tag": "circle", "type": "f64"},
                                           {"tag": "square", "type": "f64"},
                                           {"tag": "empty"}]}}
  ],
  "exports": [
    {"name": "area", "doc": "Area of a shape", "params": [{"name": "s", "type": "shape"}], "result": "f64"},
    {"name": "translate", "params": [{"name": "p", "type": "point"}, {"name": "dx", "type": "s32"},
                                     {"name": "dy", "type": "s32"}], "result": "point"},
    {"name": "Greet-Label", "params": [{"name": "name", "type": {"option": "string"}}], "result": "string"},
    {"name": "sum", "params": [{"name": "values", "type": {"list": "s32"}}], "result": "s64"},
    {"name": "sign", "params": [{"name": "n", "type": "s64"}],
     "result": {"result": {"ok": "string", "err": "string"}}},
    {"name": "byte-count", "params": [{"name": "data", "type": "bytes"}], "result": "u32"},
    {"name": "bad-result", "params": [], "result": "s32"}
  ]
})");

TEST_COMPONENT_ABI

static double number_after_colon(const std::string& s) {
    size_t c = s.find(':');
    return c == std::string::npos ? 0.0 : std::atof(s.c_str() + c + 1);
}

CAPSULE_COMPONENT_EXPORT capsule_status capsule_component_call(const capsule_host* h, const char* function,
                                                               const char* args_json) {
    const std::string fn = function;
    auto args = testcomp::split_args(args_json);

    if (fn == "area" && args.size() == 1) {
        const std::string& s = args[0];
        double a = 0.0;
        if (s.find("circle") != std::string::npos) {
            double r = number_after_colon(s);
            a = 3.0 * r * r; // integral-friendly pi
        } else if (s.find("square") != std::string::npos) {
            double side = number_after_colon(s);
            a = side * side;
        }
        testcomp::result(h, std::to_string(a));
        return CAPSULE_OK;
    }
    if (fn == "translate" && args.size() == 3) {
        long long x = 0, y = 0;
        if (std::sscanf(args[0].c_str(), "{\"x\":%lld,\"y\":%lld}", &x, &y) != 2) {
            return testcomp::trap(h, "unexpected point encoding");
        }
        x += std::atoll(args[1].c_str());
        y += std::atoll(args[2].c_str());
        testcomp::result(h, "{\"x\":" + std::to_string(x) + ",\"y\":" + std::to_string(y) + "}");
        return CAPSULE_OK;
    }
    if (fn == "Greet-Label" && args.size() == 1) {
        // A none arrives as the raw token null, a some as the unescaped string.
        testcomp::result(h, testcomp::quote(args[0] == "null" ? "hello, anonymous" : "hello, " + args[0]));
        return CAPSULE_OK;
    }
    if (fn == "sum" && args.size() == 1) {
        long long total = 0;
        for (const auto& v : testcomp::split_args(args[0].c_str())) total += std::atoll(v.c_str());
        testcomp::result(h, std::to_string(total));
        return CAPSULE_OK;
    }
    if (fn == "sign" && args.size() == 1) {
        long long n = std::atoll(args[0].c_str());
        testcomp::result(h, n >= 0 ? "{\"ok\":\"non-negative\"}" : "{\"err\":\"negative\"}");
        return CAPSULE_OK;
    }
    if (fn == "byte-count" && args.size() == 1) {
        const std::string& b64 = args[0];
        size_t pad = 0;
        if (!b64.empty() && b64.back() == '=') pad++;
        if (b64.size() > 1 && b64[b64.size() - 2] == '=') pad++;
        testcomp::result(h, std::to_string(b64.size() / 4 * 3 - pad));
        return CAPSULE_OK;
    }
    if (fn == "bad-result") {
        testcomp::result(h, "\"not a number\"");
        return CAPSULE_OK;
    }
    return CAPSULE_NO_SUCH_FUNCTION;
}
