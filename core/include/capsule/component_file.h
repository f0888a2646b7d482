#pragma once

#include "types.h"

#include <cstddef>
#include <filesystem>
#include <string>

namespace capsule {

// What the host learns from a component binary without executing it.
struct ComponentImage {
    std::string digest;          // sha256 hex of the whole file
    std::string interface_json;  // contents of the interface section
    size_t size{0};
};

// Read a component file, refusing anything larger than max_bytes.
bool read_component_file(const std::filesystem::path& path, size_t max_bytes,
                         std::string* bytes, LoadError* err);

// Validate the container format and extract the interface document.
//   Malformed:            not a 64-bit little-endian ELF shared object, or
//                         headers point outside the file
//   UnsupportedInterface: wrong machine, no interface section, or the
//                         required exports are missing from .dynsym
bool inspect_component(const std::string& bytes, ComponentImage* out, LoadError* err);

} // namespace capsule
