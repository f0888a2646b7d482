#include "capsule/introspect.h"
#include "capsule/json_mini.h"

#include <algorithm>
#include <map>
#include <set>

namespace capsule {

namespace {

constexpr int kMaxTypeDepth = 64;
constexpr size_t kMaxTypeNodes = 100000;

bool set_error(SchemaError* err, SchemaErrorKind kind, const std::string& msg) {
    if (err) {
        err->kind = kind;
        err->message = msg;
    }
    return false;
}

bool malformed(SchemaError* err, const std::string& msg) {
    return set_error(err, SchemaErrorKind::Malformed, msg);
}

std::string str_of(json_object* j) {
    return std::string(json_object_get_string(j), static_cast<size_t>(json_object_get_string_len(j)));
}

// Expands type descriptors into TypeTrees, resolving named types once each.
class TypeResolver {
public:
    bool declare(json_object* types, SchemaError* err) {
        if (!types) return true;
        if (json_object_is_type(types, json_type_object)) {
            json_object_object_foreach(types, key, val) {
                if (!add_named(key, val, err)) return false;
            }
            return resolve_declared(err);
        }
        if (!json_object_is_type(types, json_type_array)) return malformed(err, "'types' must be an array or object");
        const size_t n = json_object_array_length(types);
        for (size_t i = 0; i < n; i++) {
            json_object* entry = json_object_array_get_idx(types, i);
            auto name = json_mini::get_string(entry, "name");
            json_object* t = json_mini::member(entry, "type");
            if (!name || !t) return malformed(err, "types[" + std::to_string(i) + "] needs 'name' and 'type'");
            if (!add_named(*name, t, err)) return false;
        }
        return resolve_declared(err);
    }

    bool resolve(json_object* desc, int depth, TypeTree* out, SchemaError* err) {
        if (!desc) return malformed(err, "missing type descriptor");
        if (depth > kMaxTypeDepth) return malformed(err, "type nesting too deep");
        if (++nodes_ > kMaxTypeNodes) return malformed(err, "type expands to too many nodes");

        if (json_object_is_type(desc, json_type_string)) {
            return resolve_name(str_of(desc), depth, out, err);
        }
        if (!json_object_is_type(desc, json_type_object) || json_object_object_length(desc) != 1) {
            return malformed(err, "type descriptor must be a name or a single-key object");
        }

        std::string key;
        json_object* body = nullptr;
        json_object_object_foreach(desc, k, v) {
            key = k;
            body = v;
        }

        if (key == "list" || key == "option") {
            TypeTree inner;
            if (!resolve(body, depth + 1, &inner, err)) return false;
            *out = key == "list" ? TypeTree::list(std::move(inner)) : TypeTree::option(std::move(inner));
            return true;
        }
        if (key == "record") return resolve_record(body, depth, out, err);
        if (key == "variant") return resolve_variant(body, depth, out, err);
        if (key == "enum") return resolve_enum(body, out, err);
        if (key == "result") return resolve_result(body, depth, out, err);
        return malformed(err, "unknown type constructor '" + key + "'");
    }

private:
    struct Resolved {
        TypeTree tree;
        size_t nodes{0}; // expanded size, charged again on every reuse
    };

    // Every declared type is resolved, so unused cycles and unknown names
    // are still rejected.
    bool resolve_declared(SchemaError* err) {
        for (const auto& kv : named_) {
            if (resolved_.count(kv.first)) continue;
            TypeTree ignored;
            if (!resolve_name(kv.first, 0, &ignored, err)) return false;
        }
        return true;
    }

    bool add_named(const std::string& name, json_object* desc, SchemaError* err) {
        if (name.empty()) return malformed(err, "named type with empty name");
        if (primitive_from_name(name)) return malformed(err, "named type '" + name + "' shadows a primitive");
        if (!named_.emplace(name, desc).second) return malformed(err, "named type '" + name + "' declared twice");
        return true;
    }

    bool resolve_name(const std::string& name, int depth, TypeTree* out, SchemaError* err) {
        if (auto p = primitive_from_name(name)) {
            *out = TypeTree::primitive(*p);
            return true;
        }
        auto done = resolved_.find(name);
        if (done != resolved_.end()) {
            if (done->second.nodes > kMaxTypeNodes - nodes_) {
                return malformed(err, "type expands to too many nodes");
            }
            nodes_ += done->second.nodes;
            *out = done->second.tree;
            return true;
        }
        auto it = std::find(stack_.begin(), stack_.end(), name);
        if (it != stack_.end()) {
            std::string chain;
            for (; it != stack_.end(); ++it) chain += *it + " -> ";
            return set_error(err, SchemaErrorKind::RecursiveType, "recursive type: " + chain + name);
        }
        auto decl = named_.find(name);
        if (decl == named_.end()) {
            return set_error(err, SchemaErrorKind::UnknownType, "unknown type '" + name + "'");
        }
        stack_.push_back(name);
        TypeTree t;
        const size_t before = nodes_;
        bool ok = resolve(decl->second, depth + 1, &t, err);
        stack_.pop_back();
        if (!ok) return false;
        resolved_[name] = Resolved{t, nodes_ - before};
        *out = std::move(t);
        return true;
    }

    bool resolve_record(json_object* body, int depth, TypeTree* out, SchemaError* err) {
        if (!body || !json_object_is_type(body, json_type_array)) return malformed(err, "record fields must be an array");
        std::vector<std::pair<std::string, TypeTree>> fields;
        std::set<std::string> seen;
        const size_t n = json_object_array_length(body);
        for (size_t i = 0; i < n; i++) {
            json_object* f = json_object_array_get_idx(body, i);
            auto name = json_mini::get_string(f, "name");
            if (!name || name->empty()) return malformed(err, "record field without a name");
            if (!seen.insert(*name).second) return malformed(err, "duplicate record field '" + *name + "'");
            TypeTree t;
            if (!resolve(json_mini::member(f, "type"), depth + 1, &t, err)) return false;
            fields.emplace_back(*name, std::move(t));
        }
        *out = TypeTree::record(std::move(fields));
        return true;
    }

    bool resolve_variant(json_object* body, int depth, TypeTree* out, SchemaError* err) {
        if (!body || !json_object_is_type(body, json_type_array) || json_object_array_length(body) == 0) {
            return malformed(err, "variant needs a non-empty array of cases");
        }
        std::vector<std::pair<std::string, TypeTree>> cases;
        std::set<std::string> seen;
        const size_t n = json_object_array_length(body);
        for (size_t i = 0; i < n; i++) {
            json_object* c = json_object_array_get_idx(body, i);
            auto tag = json_mini::get_string(c, "tag");
            if (!tag || tag->empty()) return malformed(err, "variant case without a tag");
            if (!seen.insert(*tag).second) return malformed(err, "duplicate variant tag '" + *tag + "'");
            TypeTree t = TypeTree::primitive(PrimitiveKind::Unit);
            json_object* payload = json_mini::member(c, "type");
            if (payload && !resolve(payload, depth + 1, &t, err)) return false;
            cases.emplace_back(*tag, std::move(t));
        }
        *out = TypeTree::variant(std::move(cases));
        return true;
    }

    bool resolve_enum(json_object* body, TypeTree* out, SchemaError* err) {
        if (!body || !json_object_is_type(body, json_type_array) || json_object_array_length(body) == 0) {
            return malformed(err, "enum needs a non-empty array of names");
        }
        std::vector<std::pair<std::string, TypeTree>> cases;
        std::set<std::string> seen;
        const size_t n = json_object_array_length(body);
        for (size_t i = 0; i < n; i++) {
            json_object* c = json_object_array_get_idx(body, i);
            if (!c || !json_object_is_type(c, json_type_string) || json_object_get_string_len(c) == 0) {
                return malformed(err, "enum case must be a non-empty string");
            }
            std::string tag = str_of(c);
            if (!seen.insert(tag).second) return malformed(err, "duplicate enum case '" + tag + "'");
            cases.emplace_back(tag, TypeTree::primitive(PrimitiveKind::Unit));
        }
        *out = TypeTree::variant(std::move(cases));
        return true;
    }

    bool resolve_result(json_object* body, int depth, TypeTree* out, SchemaError* err) {
        if (!body || !json_object_is_type(body, json_type_object)) return malformed(err, "result needs an object");
        json_object_object_foreach(body, k, v) {
            (void)v;
            if (std::string(k) != "ok" && std::string(k) != "err") {
                return malformed(err, "unknown result key '" + std::string(k) + "'");
            }
        }
        TypeTree ok_t = TypeTree::primitive(PrimitiveKind::Unit);
        TypeTree err_t = TypeTree::primitive(PrimitiveKind::Unit);
        json_object* okd = json_mini::member(body, "ok");
        json_object* errd = json_mini::member(body, "err");
        if (okd && !resolve(okd, depth + 1, &ok_t, err)) return false;
        if (errd && !resolve(errd, depth + 1, &err_t, err)) return false;
        *out = TypeTree::variant({{"ok", std::move(ok_t)}, {"err", std::move(err_t)}});
        return true;
    }

    std::map<std::string, json_object*> named_;
    std::map<std::string, Resolved> resolved_;
    std::vector<std::string> stack_;
    size_t nodes_{0};
};

bool valid_tool_name(const std::string& n) {
    if (n.empty()) return false;
    for (char c : n) {
        if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_')) return false;
    }
    return true;
}

} // namespace

bool supported_import(const std::string& family) {
    return family == "http" || family == "filesystem" || family == "environment";
}

std::string normalize_tool_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c >= 'A' && c <= 'Z') out.push_back(static_cast<char>(c - 'A' + 'a'));
        else if (c == '-' || c == '.' || c == ' ') out.push_back('_');
        else out.push_back(c);
    }
    return out;
}

IntrospectResult introspect(const std::string& interface_json) {
    IntrospectResult r;
    json_mini::Doc doc = json_mini::parse(interface_json);
    if (!doc || !json_object_is_type(doc.root, json_type_object)) {
        malformed(&r.error, "interface document is not a JSON object");
        return r;
    }
    json_object* root = doc.root;

    for (const char* key : {"world", "version"}) {
        json_object* v = json_mini::member(root, key);
        if (v && !json_object_is_type(v, json_type_string)) {
            malformed(&r.error, std::string("'") + key + "' must be a string");
            return r;
        }
    }
    r.schema.world = json_mini::get_string(root, "world").value_or("");
    r.schema.version = json_mini::get_string(root, "version").value_or("");

    if (json_object* imports = json_mini::member(root, "imports")) {
        if (!json_object_is_type(imports, json_type_array)) {
            malformed(&r.error, "'imports' must be an array");
            return r;
        }
        std::set<std::string> fams;
        const size_t n = json_object_array_length(imports);
        for (size_t i = 0; i < n; i++) {
            json_object* el = json_object_array_get_idx(imports, i);
            if (!el || !json_object_is_type(el, json_type_string)) {
                malformed(&r.error, "'imports' entries must be strings");
                return r;
            }
            fams.insert(str_of(el));
        }
        r.schema.imports.assign(fams.begin(), fams.end());
    }

    TypeResolver resolver;
    if (!resolver.declare(json_mini::member(root, "types"), &r.error)) return r;

    json_object* exports = json_mini::member(root, "exports");
    if (!exports || !json_object_is_type(exports, json_type_array) || json_object_array_length(exports) == 0) {
        malformed(&r.error, "'exports' must be a non-empty array");
        return r;
    }

    std::map<std::string, std::string> by_normalized;
    const size_t n = json_object_array_length(exports);
    for (size_t i = 0; i < n; i++) {
        json_object* ex = json_object_array_get_idx(exports, i);
        auto name = json_mini::get_string(ex, "name");
        if (!name || name->empty()) {
            malformed(&r.error, "exports[" + std::to_string(i) + "] has no name");
            return r;
        }
        ToolSignature sig;
        sig.export_name = *name;
        sig.name = normalize_tool_name(*name);
        if (!valid_tool_name(sig.name)) {
            malformed(&r.error, "export name '" + *name + "' has characters outside [A-Za-z0-9_.- ]");
            return r;
        }
        auto prev = by_normalized.find(sig.name);
        if (prev != by_normalized.end()) {
            set_error(&r.error, SchemaErrorKind::DuplicateTool,
                      "exports '" + prev->second + "' and '" + *name + "' both normalise to '" + sig.name + "'");
            return r;
        }
        by_normalized.emplace(sig.name, *name);

        if (json_object* d = json_mini::member(ex, "doc")) {
            if (!json_object_is_type(d, json_type_string)) {
                malformed(&r.error, "'" + *name + "': doc must be a string");
                return r;
            }
            sig.doc = str_of(d);
        }

        if (json_object* params = json_mini::member(ex, "params")) {
            if (!json_object_is_type(params, json_type_array)) {
                malformed(&r.error, "'" + *name + "': params must be an array");
                return r;
            }
            std::set<std::string> seen;
            const size_t np = json_object_array_length(params);
            for (size_t k = 0; k < np; k++) {
                json_object* p = json_object_array_get_idx(params, k);
                auto pname = json_mini::get_string(p, "name");
                if (!pname || pname->empty()) {
                    malformed(&r.error, "'" + *name + "': parameter without a name");
                    return r;
                }
                if (!seen.insert(*pname).second) {
                    malformed(&r.error, "'" + *name + "': duplicate parameter '" + *pname + "'");
                    return r;
                }
                Param param;
                param.name = *pname;
                if (!resolver.resolve(json_mini::member(p, "type"), 0, &param.type, &r.error)) return r;
                sig.params.push_back(std::move(param));
            }
        }

        sig.result = TypeTree::primitive(PrimitiveKind::Unit);
        if (json_object* res = json_mini::member(ex, "result")) {
            if (!resolver.resolve(res, 0, &sig.result, &r.error)) return r;
        }
        r.schema.tools.push_back(std::move(sig));
    }

    r.ok = true;
    return r;
}

SchemaDiff diff_schemas(const CallSchema& before, const CallSchema& after) {
    SchemaDiff d;
    for (const auto& t : before.tools) {
        const ToolSignature* now = after.find(t.name);
        if (!now) d.removed.push_back(t.name);
        else if (!t.same_shape(*now)) d.changed.push_back(t.name);
    }
    for (const auto& t : after.tools) {
        if (!before.find(t.name)) d.added.push_back(t.name);
    }
    return d;
}

const char* schema_error_name(SchemaErrorKind k) {
    switch (k) {
        case SchemaErrorKind::None:          return "None";
        case SchemaErrorKind::Malformed:     return "Malformed";
        case SchemaErrorKind::UnknownType:   return "UnknownType";
        case SchemaErrorKind::RecursiveType: return "RecursiveType";
        case SchemaErrorKind::DuplicateTool: return "DuplicateTool";
    }
    return "Unknown";
}

} // namespace capsule
