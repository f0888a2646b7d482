#include "capsule/types.h"

namespace capsule {

const char* component_state_name(ComponentState s) {
    switch (s) {
        case ComponentState::Loading:   return "loading";
        case ComponentState::Ready:     return "ready";
        case ComponentState::Failed:    return "failed";
        case ComponentState::Unloading: return "unloading";
    }
    return "unknown";
}

const char* load_error_name(LoadErrorKind k) {
    switch (k) {
        case LoadErrorKind::None:                 return "None";
        case LoadErrorKind::Malformed:            return "Malformed";
        case LoadErrorKind::UnsupportedInterface: return "UnsupportedInterface";
        case LoadErrorKind::InstantiationFailed:  return "InstantiationFailed";
    }
    return "Unknown";
}

const char* call_error_name(CallErrorKind k) {
    switch (k) {
        case CallErrorKind::None:             return "None";
        case CallErrorKind::TypeMismatch:     return "TypeMismatch";
        case CallErrorKind::ComponentFault:   return "ComponentFault";
        case CallErrorKind::Timeout:          return "Timeout";
        case CallErrorKind::CapabilityDenied: return "CapabilityDenied";
        case CallErrorKind::NotFound:         return "NotFound";
        case CallErrorKind::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

const char* capability_kind_name(CapabilityKind k) {
    switch (k) {
        case CapabilityKind::Network:     return "NetworkHost";
        case CapabilityKind::Filesystem:  return "FilesystemPath";
        case CapabilityKind::Environment: return "EnvironmentVar";
        case CapabilityKind::Resource:    return "ResourceLimit";
    }
    return "Unknown";
}

const char* policy_error_name(PolicyErrorKind k) {
    switch (k) {
        case PolicyErrorKind::None:                return "None";
        case PolicyErrorKind::InvalidGrantPattern: return "InvalidGrantPattern";
        case PolicyErrorKind::UnknownComponent:    return "UnknownComponent";
        case PolicyErrorKind::InvalidDocument:     return "InvalidDocument";
    }
    return "Unknown";
}

} // namespace capsule
