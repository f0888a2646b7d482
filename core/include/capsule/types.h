#pragma once
#include <cstdint>
#include <string>

namespace capsule {

// Stable component identifier (sanitised source stem or content digest).
using ComponentId = std::string;

enum class ComponentState {
    Loading,
    Ready,
    Failed,
    Unloading,
};

enum class LoadErrorKind {
    None,
    Malformed,            // not a component binary
    UnsupportedInterface, // export conventions or interface document missing/invalid
    InstantiationFailed,  // sandbox could not be constructed
};

struct LoadError {
    LoadErrorKind kind{LoadErrorKind::None};
    std::string message;
};

// Categories of effectful operation a grant can authorise.
enum class CapabilityKind {
    Network,
    Filesystem,
    Environment,
    Resource,
};

enum class CallErrorKind {
    None,
    TypeMismatch,
    ComponentFault,
    Timeout,
    CapabilityDenied,
    NotFound,
    Cancelled,
};

struct CallError {
    CallErrorKind kind{CallErrorKind::None};
    std::string detail;          // host-side detail; never forwarded verbatim for faults
    std::string path;            // offending field path (TypeMismatch)
    CapabilityKind capability{CapabilityKind::Network}; // CapabilityDenied only
};

enum class PolicyErrorKind {
    None,
    InvalidGrantPattern,
    UnknownComponent,
    InvalidDocument,
};

struct PolicyError {
    PolicyErrorKind kind{PolicyErrorKind::None};
    std::string message;
};

const char* component_state_name(ComponentState s);
const char* load_error_name(LoadErrorKind k);
const char* call_error_name(CallErrorKind k);
const char* capability_kind_name(CapabilityKind k);
const char* policy_error_name(PolicyErrorKind k);

} // namespace capsule
