#pragma once

#include <json-c/json.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace capsule {

enum class PrimitiveKind {
    Unit,
    Bool,
    S8, S16, S32, S64,
    U8, U16, U32, U64,
    F32, F64,
    Char,
    String,
    Bytes,
};

enum class TypeKind {
    Primitive,
    List,
    Record,
    Variant,
    Option,
};

// Structural type of a parameter or result.
//
// Layout by kind:
//   Primitive: prim
//   List:      children[0] = element
//   Option:    children[0] = inner
//   Record:    names[i] = field name, children[i] = field type (declared order)
//   Variant:   names[i] = case tag,   children[i] = payload (Unit when the case has none)
struct TypeTree {
    TypeKind kind{TypeKind::Primitive};
    PrimitiveKind prim{PrimitiveKind::Unit};
    std::vector<std::string> names;
    std::vector<TypeTree> children;

    static TypeTree primitive(PrimitiveKind k);
    static TypeTree list(TypeTree element);
    static TypeTree option(TypeTree inner);
    static TypeTree record(std::vector<std::pair<std::string, TypeTree>> fields);
    static TypeTree variant(std::vector<std::pair<std::string, TypeTree>> cases);

    bool is_unit() const { return kind == TypeKind::Primitive && prim == PrimitiveKind::Unit; }

    bool operator==(const TypeTree& o) const;
    bool operator!=(const TypeTree& o) const { return !(*this == o); }
};

struct Param {
    std::string name;
    TypeTree type;
};

struct ToolSignature {
    std::string name;        // normalised tool name
    std::string export_name; // name as declared by the component (dispatch key)
    std::vector<Param> params;
    TypeTree result;
    std::optional<std::string> doc;

    // Signature identity for reload diffing; documentation is ignored.
    bool same_shape(const ToolSignature& o) const;
};

struct CallSchema {
    std::string world;
    std::string version;
    std::vector<std::string> imports;
    std::vector<ToolSignature> tools;

    const ToolSignature* find(const std::string& name) const;
};

const char* primitive_name(PrimitiveKind k);
std::optional<PrimitiveKind> primitive_from_name(const std::string& s);

// Human-readable rendering for error messages, e.g. "list<record{x: s32}>".
std::string type_to_string(const TypeTree& t);

// Canonical descriptor form (same grammar as interface documents, fully inlined).
json_object* type_to_json(const TypeTree& t);

// Canonical, byte-deterministic serialisation of a schema.
json_object* schema_to_json_object(const CallSchema& s);
std::string schema_to_json(const CallSchema& s);

// JSON Schema (draft 2020-12 subset) describing the wire encoding of a type.
json_object* type_json_schema(const TypeTree& t);

// Object schema with one property per parameter.
json_object* tool_input_schema(const ToolSignature& sig);

} // namespace capsule
