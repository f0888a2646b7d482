#include "test_common.h"
#include "capsule/introspect.h"
#include "capsule/json_mini.h"

using namespace capsule;

static SchemaErrorKind kind_of(const std::string& doc) {
    IntrospectResult r = introspect(doc);
    if (r.ok) return SchemaErrorKind::None;
    return r.error.kind;
}

static CallSchema schema_of(const std::string& doc) {
    IntrospectResult r = introspect(doc);
    if (!r.ok) die("introspect failed: " + r.error.message);
    return r.schema;
}

int main() {
    const std::string shapes = R"({
        "world":"shapes","version":"1.0.0","imports":["http"],
        "types":[
            {"name":"point","type":{"record":[{"name":"x","type":"s32"},{"name":"y","type":"s32"}]}},
            {"name":"shape","type":{"variant":[{"tag":"circle","type":"f64"},{"tag":"empty"}]}}],
        "exports":[
            {"name":"Area","doc":"Area of a shape.","params":[{"name":"s","type":"shape"}],"result":"f64"},
            {"name":"translate","params":[{"name":"p","type":"point"},{"name":"dx","type":"s32"}],"result":"point"},
            {"name":"sign","params":[{"name":"n","type":"s64"}],"result":{"result":{"ok":"string","err":"string"}}},
            {"name":"color-name","params":[{"name":"c","type":{"enum":["red","green"]}}],"result":"string"},
            {"name":"reset"}]})";

    // Well-formed document
    {
        CallSchema s = schema_of(shapes);
        expect_eq_str(s.world, "shapes", "world");
        expect_eq_ll((long long)s.tools.size(), 5, "tool count");
        expect_true(s.find("area") && s.find("area")->export_name == "Area", "names normalised, export kept");
        expect_true(s.find("area")->doc && *s.find("area")->doc == "Area of a shape.", "doc kept");
        expect_true(!s.find("translate")->doc, "absent doc stays absent");
        expect_true(s.find("color_name") != nullptr, "dash normalised");
        expect_true(s.find("reset")->result.is_unit() && s.find("reset")->params.empty(), "no params, unit result");

        const TypeTree& p = s.find("translate")->result;
        expect_true(p.kind == TypeKind::Record && p.names.size() == 2 && p.names[1] == "y", "named record inlined");
        const TypeTree& r = s.find("sign")->result;
        expect_true(r.kind == TypeKind::Variant && r.names[0] == "ok" && r.names[1] == "err", "result is ok/err variant");
        const TypeTree& e = s.find("color_name")->params[0].type;
        expect_true(e.kind == TypeKind::Variant && e.children[1].is_unit(), "enum is payload-less variant");
        expect_eq_str(type_to_string(p), "record{x: s32, y: s32}", "type rendering");
    }

    // Same input, byte-identical canonical schema
    {
        std::string a = schema_to_json(schema_of(shapes));
        std::string b = schema_to_json(schema_of(shapes));
        expect_true(!a.empty() && a == b, "schema serialisation is deterministic");
    }

    // Error classes
    {
        expect_true(kind_of("not json") == SchemaErrorKind::Malformed, "garbage");
        expect_true(kind_of("[]") == SchemaErrorKind::Malformed, "array root");
        expect_true(kind_of(R"({"exports":[]})") == SchemaErrorKind::Malformed, "no exports");
        expect_true(kind_of(R"({"exports":[{"name":"f","params":[{"name":"a","type":"s32"},{"name":"a","type":"s32"}]}]})") ==
                        SchemaErrorKind::Malformed, "duplicate parameter");
        expect_true(kind_of(R"({"exports":[{"name":"f","result":{"tuple":["s32"]}}]})") == SchemaErrorKind::Malformed,
                    "unknown constructor");
        expect_true(kind_of(R"({"exports":[{"name":"f/g"}]})") == SchemaErrorKind::Malformed, "bad export name");
        expect_true(kind_of(R"({"exports":[{"name":"f","params":[{"name":"a","type":"widget"}]}]})") ==
                        SchemaErrorKind::UnknownType, "unknown named type");
        expect_true(kind_of(R"({"types":[{"name":"node","type":{"record":[{"name":"next","type":{"option":"node"}}]}}],
                              "exports":[{"name":"f","result":"node"}]})") == SchemaErrorKind::RecursiveType,
                    "self-recursive type");
        expect_true(kind_of(R"({"types":[{"name":"a","type":{"list":"b"}},{"name":"b","type":{"list":"a"}}],
                              "exports":[{"name":"f","result":"a"}]})") == SchemaErrorKind::RecursiveType,
                    "mutually recursive types");
        expect_true(kind_of(R"({"types":[{"name":"a","type":{"list":"b"}},{"name":"b","type":{"option":"a"}}],
                              "exports":[{"name":"f","result":"s32"}]})") == SchemaErrorKind::RecursiveType,
                    "unused recursive types");
        expect_true(kind_of(R"({"types":[{"name":"a","type":"widget"}],"exports":[{"name":"f"}]})") ==
                        SchemaErrorKind::UnknownType, "unused type naming an unknown type");

        // t(i+1) = {a: t(i), b: t(i)} doubles per level; a handful of
        // declarations would expand to 2^30 leaves.
        std::string types = R"([{"name":"t0","type":"s32"})";
        for (int i = 1; i <= 30; i++) {
            const std::string prev = "t" + std::to_string(i - 1);
            types += R"(,{"name":"t)" + std::to_string(i) + R"(","type":{"record":[{"name":"a","type":")" + prev +
                     R"("},{"name":"b","type":")" + prev + R"("}]}})";
        }
        types += "]";
        IntrospectResult wide = introspect(R"({"types":)" + types + R"(,"exports":[{"name":"f","result":"t30"}]})");
        expect_true(!wide.ok && wide.error.kind == SchemaErrorKind::Malformed, "exponential expansion rejected");
        expect_true(wide.error.message.find("too many nodes") != std::string::npos, "expansion error message");
        expect_true(kind_of(R"({"types":[{"name":"p","type":{"record":[{"name":"x","type":"s32"}]}},
                                         {"name":"q","type":{"record":[{"name":"a","type":"p"},{"name":"b","type":"p"}]}}],
                              "exports":[{"name":"f","params":[{"name":"q1","type":"q"},{"name":"q2","type":"q"}]}]})") ==
                        SchemaErrorKind::None, "shared named types still fine");
        IntrospectResult dup = introspect(R"({"exports":[{"name":"get-item"},{"name":"Get.Item"}]})");
        expect_true(!dup.ok && dup.error.kind == SchemaErrorKind::DuplicateTool, "normalisation collision");
        expect_true(dup.error.message.find("get_item") != std::string::npos, "collision names the tool");
    }

    // Diffs between versions
    {
        CallSchema before = schema_of(R"({"exports":[{"name":"add","params":[{"name":"a","type":"s32"}],"result":"s32"},
                                                      {"name":"sub","params":[{"name":"a","type":"s32"}],"result":"s32"}]})");
        CallSchema additive = schema_of(R"({"exports":[{"name":"add","doc":"new docs","params":[{"name":"a","type":"s32"}],"result":"s32"},
                                                        {"name":"sub","params":[{"name":"a","type":"s32"}],"result":"s32"},
                                                        {"name":"mul","params":[{"name":"a","type":"s32"}],"result":"s32"}]})");
        SchemaDiff d = diff_schemas(before, additive);
        expect_true(!d.breaking(), "adding a tool is not breaking");
        expect_true(d.added.size() == 1 && d.added[0] == "mul", "added tool listed");
        expect_true(d.changed.empty(), "doc change is not a signature change");

        CallSchema changed = schema_of(R"({"exports":[{"name":"add","params":[{"name":"a","type":"s64"}],"result":"s32"}]})");
        d = diff_schemas(before, changed);
        expect_true(d.breaking(), "removal and retyping are breaking");
        expect_true(d.removed.size() == 1 && d.removed[0] == "sub", "removed tool listed");
        expect_true(d.changed.size() == 1 && d.changed[0] == "add", "changed tool listed");
        expect_true(diff_schemas(before, before).empty(), "identical schemas");
    }

    expect_true(supported_import("filesystem") && !supported_import("gpu"), "import families");
    expect_eq_str(normalize_tool_name("Fetch-Weather.v2 now"), "fetch_weather_v2_now", "normalisation");

    std::cerr << "test_introspect: ALL PASSED" << std::endl;
    return 0;
}
