#pragma once

#include "type_tree.h"

#include <json-c/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace capsule {

enum class ValueKind {
    Unit,
    Bool,
    Int,     // s8..s64
    UInt,    // u8..u64
    Float,   // f32, f64
    Char,    // one code point, UTF-8 in s
    String,
    Bytes,
    List,
    Record,
    Variant,
    Option,
};

// Runtime value mirroring TypeTree.
//
//   List:    items
//   Record:  names[i] / items[i]
//   Variant: s = tag, items = {payload} (empty when the case has none)
//   Option:  items empty = none, items[0] = some
struct Value {
    ValueKind kind{ValueKind::Unit};
    bool b{false};
    int64_t i{0};
    uint64_t u{0};
    double f{0.0};
    std::string s;
    std::vector<std::string> names;
    std::vector<Value> items;

    static Value unit() { return Value{}; }
    static Value boolean(bool v);
    static Value int64(int64_t v);
    static Value uint64(uint64_t v);
    static Value float64(double v);
    static Value character(const std::string& utf8);
    static Value string(std::string v);
    static Value bytes(std::string v);
    static Value list(std::vector<Value> v);
    static Value record(std::vector<std::pair<std::string, Value>> fields);
    static Value variant(std::string tag, std::optional<Value> payload = std::nullopt);
    static Value none();
    static Value some(Value v);

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }
};

struct CodecError {
    std::string path;    // e.g. "point.x", "items[2]"
    std::string message;
};

// JSON payload -> Value, checked against the declared type.
bool decode_value(json_object* j, const TypeTree& t, const std::string& path,
                  Value* out, CodecError* err);

// Value -> JSON payload. The value must already satisfy validate_value().
json_object* encode_value(const Value& v, const TypeTree& t);

// Structural check of a runtime value against a type. Stops at the first divergence.
bool validate_value(const Value& v, const TypeTree& t, const std::string& path, CodecError* err);

// Named-argument object (protocol form) -> ordered argument values.
bool decode_arguments(json_object* args, const ToolSignature& sig,
                      std::vector<Value>* out, CodecError* err);

// Ordered argument values -> JSON array text (sandbox wire form).
std::string encode_arguments(const std::vector<Value>& args, const ToolSignature& sig);

// Result JSON text (sandbox wire form) -> Value.
bool decode_result_text(const std::string& json, const TypeTree& t, Value* out, CodecError* err);

std::string base64_encode(const std::string& in);
bool base64_decode(const std::string& in, std::string* out);

} // namespace capsule
