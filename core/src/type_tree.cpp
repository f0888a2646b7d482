#include "capsule/type_tree.h"
#include "capsule/json_mini.h"

#include <cstdint>
#include <limits>
#include <sstream>

namespace capsule {

TypeTree TypeTree::primitive(PrimitiveKind k) {
    TypeTree t;
    t.kind = TypeKind::Primitive;
    t.prim = k;
    return t;
}

TypeTree TypeTree::list(TypeTree element) {
    TypeTree t;
    t.kind = TypeKind::List;
    t.children.push_back(std::move(element));
    return t;
}

TypeTree TypeTree::option(TypeTree inner) {
    TypeTree t;
    t.kind = TypeKind::Option;
    t.children.push_back(std::move(inner));
    return t;
}

TypeTree TypeTree::record(std::vector<std::pair<std::string, TypeTree>> fields) {
    TypeTree t;
    t.kind = TypeKind::Record;
    for (auto& f : fields) {
        t.names.push_back(std::move(f.first));
        t.children.push_back(std::move(f.second));
    }
    return t;
}

TypeTree TypeTree::variant(std::vector<std::pair<std::string, TypeTree>> cases) {
    TypeTree t;
    t.kind = TypeKind::Variant;
    for (auto& c : cases) {
        t.names.push_back(std::move(c.first));
        t.children.push_back(std::move(c.second));
    }
    return t;
}

bool TypeTree::operator==(const TypeTree& o) const {
    if (kind != o.kind) return false;
    if (kind == TypeKind::Primitive) return prim == o.prim;
    return names == o.names && children == o.children;
}

bool ToolSignature::same_shape(const ToolSignature& o) const {
    if (name != o.name || params.size() != o.params.size()) return false;
    for (size_t i = 0; i < params.size(); i++) {
        if (params[i].name != o.params[i].name) return false;
        if (params[i].type != o.params[i].type) return false;
    }
    return result == o.result;
}

const ToolSignature* CallSchema::find(const std::string& name) const {
    for (const auto& t : tools) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

const char* primitive_name(PrimitiveKind k) {
    switch (k) {
        case PrimitiveKind::Unit:   return "unit";
        case PrimitiveKind::Bool:   return "bool";
        case PrimitiveKind::S8:     return "s8";
        case PrimitiveKind::S16:    return "s16";
        case PrimitiveKind::S32:    return "s32";
        case PrimitiveKind::S64:    return "s64";
        case PrimitiveKind::U8:     return "u8";
        case PrimitiveKind::U16:    return "u16";
        case PrimitiveKind::U32:    return "u32";
        case PrimitiveKind::U64:    return "u64";
        case PrimitiveKind::F32:    return "f32";
        case PrimitiveKind::F64:    return "f64";
        case PrimitiveKind::Char:   return "char";
        case PrimitiveKind::String: return "string";
        case PrimitiveKind::Bytes:  return "bytes";
    }
    return "unit";
}

std::optional<PrimitiveKind> primitive_from_name(const std::string& s) {
    static const PrimitiveKind all[] = {
        PrimitiveKind::Unit, PrimitiveKind::Bool,
        PrimitiveKind::S8, PrimitiveKind::S16, PrimitiveKind::S32, PrimitiveKind::S64,
        PrimitiveKind::U8, PrimitiveKind::U16, PrimitiveKind::U32, PrimitiveKind::U64,
        PrimitiveKind::F32, PrimitiveKind::F64,
        PrimitiveKind::Char, PrimitiveKind::String, PrimitiveKind::Bytes,
    };
    for (auto k : all) {
        if (s == primitive_name(k)) return k;
    }
    return std::nullopt;
}

static void render(const TypeTree& t, std::ostringstream& out) {
    switch (t.kind) {
        case TypeKind::Primitive:
            out << primitive_name(t.prim);
            return;
        case TypeKind::List:
            out << "list<";
            render(t.children[0], out);
            out << ">";
            return;
        case TypeKind::Option:
            out << "option<";
            render(t.children[0], out);
            out << ">";
            return;
        case TypeKind::Record:
            out << "record{";
            for (size_t i = 0; i < t.names.size(); i++) {
                if (i) out << ", ";
                out << t.names[i] << ": ";
                render(t.children[i], out);
            }
            out << "}";
            return;
        case TypeKind::Variant:
            out << "variant{";
            for (size_t i = 0; i < t.names.size(); i++) {
                if (i) out << ", ";
                out << t.names[i];
                if (!t.children[i].is_unit()) {
                    out << "(";
                    render(t.children[i], out);
                    out << ")";
                }
            }
            out << "}";
            return;
    }
}

std::string type_to_string(const TypeTree& t) {
    std::ostringstream out;
    render(t, out);
    return out.str();
}

json_object* type_to_json(const TypeTree& t) {
    switch (t.kind) {
        case TypeKind::Primitive:
            return json_object_new_string(primitive_name(t.prim));
        case TypeKind::List: {
            json_object* o = json_object_new_object();
            json_object_object_add(o, "list", type_to_json(t.children[0]));
            return o;
        }
        case TypeKind::Option: {
            json_object* o = json_object_new_object();
            json_object_object_add(o, "option", type_to_json(t.children[0]));
            return o;
        }
        case TypeKind::Record: {
            json_object* fields = json_object_new_array();
            for (size_t i = 0; i < t.names.size(); i++) {
                json_object* f = json_object_new_object();
                json_object_object_add(f, "name", json_mini::new_string(t.names[i]));
                json_object_object_add(f, "type", type_to_json(t.children[i]));
                json_object_array_add(fields, f);
            }
            json_object* o = json_object_new_object();
            json_object_object_add(o, "record", fields);
            return o;
        }
        case TypeKind::Variant: {
            json_object* cases = json_object_new_array();
            for (size_t i = 0; i < t.names.size(); i++) {
                json_object* c = json_object_new_object();
                json_object_object_add(c, "tag", json_mini::new_string(t.names[i]));
                if (!t.children[i].is_unit()) {
                    json_object_object_add(c, "type", type_to_json(t.children[i]));
                }
                json_object_array_add(cases, c);
            }
            json_object* o = json_object_new_object();
            json_object_object_add(o, "variant", cases);
            return o;
        }
    }
    return json_object_new_string("unit");
}

json_object* schema_to_json_object(const CallSchema& s) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "world", json_mini::new_string(s.world));
    json_object_object_add(root, "version", json_mini::new_string(s.version));

    json_object* imports = json_object_new_array();
    for (const auto& i : s.imports) json_object_array_add(imports, json_mini::new_string(i));
    json_object_object_add(root, "imports", imports);

    json_object* tools = json_object_new_array();
    for (const auto& sig : s.tools) {
        json_object* t = json_object_new_object();
        json_object_object_add(t, "name", json_mini::new_string(sig.name));
        if (sig.doc) json_object_object_add(t, "doc", json_mini::new_string(*sig.doc));
        json_object* params = json_object_new_array();
        for (const auto& p : sig.params) {
            json_object* po = json_object_new_object();
            json_object_object_add(po, "name", json_mini::new_string(p.name));
            json_object_object_add(po, "type", type_to_json(p.type));
            json_object_array_add(params, po);
        }
        json_object_object_add(t, "params", params);
        json_object_object_add(t, "result", type_to_json(sig.result));
        json_object_array_add(tools, t);
    }
    json_object_object_add(root, "tools", tools);
    return root;
}

std::string schema_to_json(const CallSchema& s) {
    json_mini::Doc d(schema_to_json_object(s));
    return json_mini::dump(d.root);
}

static json_object* typed(const char* type_name) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "type", json_object_new_string(type_name));
    return o;
}

static json_object* integer_range(int64_t lo, int64_t hi) {
    json_object* o = typed("integer");
    json_object_object_add(o, "minimum", json_object_new_int64(lo));
    json_object_object_add(o, "maximum", json_object_new_int64(hi));
    return o;
}

// Types whose wire encoding can itself be null need an explicit wrapper when
// they sit inside an option, otherwise none and some(null) collide.
static bool nullable_encoding(const TypeTree& t) {
    return t.is_unit() || t.kind == TypeKind::Option;
}

json_object* type_json_schema(const TypeTree& t) {
    switch (t.kind) {
        case TypeKind::Primitive:
            switch (t.prim) {
                case PrimitiveKind::Unit:   return typed("null");
                case PrimitiveKind::Bool:   return typed("boolean");
                case PrimitiveKind::S8:     return integer_range(INT8_MIN, INT8_MAX);
                case PrimitiveKind::S16:    return integer_range(INT16_MIN, INT16_MAX);
                case PrimitiveKind::S32:    return integer_range(INT32_MIN, INT32_MAX);
                case PrimitiveKind::S64:    return typed("integer");
                case PrimitiveKind::U8:     return integer_range(0, UINT8_MAX);
                case PrimitiveKind::U16:    return integer_range(0, UINT16_MAX);
                case PrimitiveKind::U32:    return integer_range(0, UINT32_MAX);
                case PrimitiveKind::U64: {
                    json_object* o = typed("integer");
                    json_object_object_add(o, "minimum", json_object_new_int(0));
                    return o;
                }
                case PrimitiveKind::F32:
                case PrimitiveKind::F64:    return typed("number");
                case PrimitiveKind::Char: {
                    json_object* o = typed("string");
                    json_object_object_add(o, "minLength", json_object_new_int(1));
                    json_object_object_add(o, "maxLength", json_object_new_int(1));
                    return o;
                }
                case PrimitiveKind::String: return typed("string");
                case PrimitiveKind::Bytes: {
                    json_object* o = typed("string");
                    json_object_object_add(o, "contentEncoding", json_object_new_string("base64"));
                    return o;
                }
            }
            return typed("null");
        case TypeKind::List: {
            json_object* o = typed("array");
            json_object_object_add(o, "items", type_json_schema(t.children[0]));
            return o;
        }
        case TypeKind::Option: {
            const TypeTree& inner = t.children[0];
            json_object* some = nullptr;
            if (nullable_encoding(inner)) {
                some = typed("object");
                json_object* props = json_object_new_object();
                json_object_object_add(props, "some", type_json_schema(inner));
                json_object_object_add(some, "properties", props);
                json_object* req = json_object_new_array();
                json_object_array_add(req, json_object_new_string("some"));
                json_object_object_add(some, "required", req);
                json_object_object_add(some, "additionalProperties", json_object_new_boolean(0));
            } else {
                some = type_json_schema(inner);
            }
            json_object* any = json_object_new_array();
            json_object_array_add(any, some);
            json_object_array_add(any, typed("null"));
            json_object* o = json_object_new_object();
            json_object_object_add(o, "anyOf", any);
            return o;
        }
        case TypeKind::Record: {
            json_object* o = typed("object");
            json_object* props = json_object_new_object();
            json_object* req = json_object_new_array();
            for (size_t i = 0; i < t.names.size(); i++) {
                json_object_object_add(props, t.names[i].c_str(), type_json_schema(t.children[i]));
                if (t.children[i].kind != TypeKind::Option) {
                    json_object_array_add(req, json_mini::new_string(t.names[i]));
                }
            }
            json_object_object_add(o, "properties", props);
            json_object_object_add(o, "required", req);
            json_object_object_add(o, "additionalProperties", json_object_new_boolean(0));
            return o;
        }
        case TypeKind::Variant: {
            json_object* one = json_object_new_array();
            json_object* bare = json_object_new_array();
            for (size_t i = 0; i < t.names.size(); i++) {
                if (t.children[i].is_unit()) {
                    json_object_array_add(bare, json_mini::new_string(t.names[i]));
                    continue;
                }
                json_object* c = typed("object");
                json_object* props = json_object_new_object();
                json_object_object_add(props, t.names[i].c_str(), type_json_schema(t.children[i]));
                json_object_object_add(c, "properties", props);
                json_object* req = json_object_new_array();
                json_object_array_add(req, json_mini::new_string(t.names[i]));
                json_object_object_add(c, "required", req);
                json_object_object_add(c, "additionalProperties", json_object_new_boolean(0));
                json_object_array_add(one, c);
            }
            if (json_object_array_length(bare) > 0) {
                json_object* e = typed("string");
                json_object_object_add(e, "enum", bare);
                json_object_array_add(one, e);
            } else {
                json_object_put(bare);
            }
            json_object* o = json_object_new_object();
            json_object_object_add(o, "oneOf", one);
            return o;
        }
    }
    return typed("null");
}

json_object* tool_input_schema(const ToolSignature& sig) {
    json_object* o = typed("object");
    json_object* props = json_object_new_object();
    json_object* req = json_object_new_array();
    for (const auto& p : sig.params) {
        json_object_object_add(props, p.name.c_str(), type_json_schema(p.type));
        if (p.type.kind != TypeKind::Option) {
            json_object_array_add(req, json_mini::new_string(p.name));
        }
    }
    json_object_object_add(o, "properties", props);
    json_object_object_add(o, "required", req);
    json_object_object_add(o, "additionalProperties", json_object_new_boolean(0));
    return o;
}

} // namespace capsule
