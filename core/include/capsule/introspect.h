#pragma once

#include "type_tree.h"

#include <string>
#include <vector>

namespace capsule {

enum class SchemaErrorKind {
    None,
    Malformed,      // not a well-formed interface document
    UnknownType,    // reference to an undeclared named type
    RecursiveType,  // named type (transitively) contains itself
    DuplicateTool,  // two exports collide after name normalisation
};

struct SchemaError {
    SchemaErrorKind kind{SchemaErrorKind::None};
    std::string message;
};

struct IntrospectResult {
    bool ok{false};
    CallSchema schema;
    SchemaError error;
};

// Import families a host can satisfy.
bool supported_import(const std::string& family);

// Lower-case; '-', '.' and ' ' become '_'.
std::string normalize_tool_name(const std::string& name);

// Interface document (JSON text) -> CallSchema.
// Pure: the same input always yields a byte-identical schema_to_json().
IntrospectResult introspect(const std::string& interface_json);

struct SchemaDiff {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> changed; // same name, different parameters or result

    bool breaking() const { return !removed.empty() || !changed.empty(); }
    bool empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

SchemaDiff diff_schemas(const CallSchema& before, const CallSchema& after);

const char* schema_error_name(SchemaErrorKind k);

} // namespace capsule
