#pragma once

// Component ABI (v1).
//
// A component is a shared object that:
//   - embeds its interface document with CAPSULE_COMPONENT_INTERFACE(...)
//   - exports capsule_component_abi_version() and capsule_component_call()
//   - reaches the outside world only through the capsule_host table it is
//     handed on every call. The host checks each import against the
//     component's grants before doing anything.
//
// The header is plain C so components can be built without linking
// anything from the host.

#include <stddef.h>
#include <stdint.h>

#define CAPSULE_COMPONENT_ABI_VERSION 1

#define CAPSULE_INTERFACE_SECTION ".capsule_interface"

#ifdef __cplusplus
#define CAPSULE_EXTERN_C extern "C"
#else
#define CAPSULE_EXTERN_C
#endif

#define CAPSULE_COMPONENT_EXPORT CAPSULE_EXTERN_C __attribute__((visibility("default")))

// Embed the interface document (a JSON string literal) into the binary.
#define CAPSULE_COMPONENT_INTERFACE(json_literal)                              \
    __attribute__((used, section(CAPSULE_INTERFACE_SECTION)))                  \
    static const char capsule_component_interface_[] = json_literal

#ifdef __cplusplus
extern "C" {
#endif

typedef enum capsule_status {
    CAPSULE_OK = 0,
    CAPSULE_DENIED = 1,           // capability not granted
    CAPSULE_CANCELLED = 2,        // the call was cancelled; return promptly
    CAPSULE_ERROR = 3,            // granted, but the operation failed
    CAPSULE_TRAP = 4,             // component-side fault (returned by components)
    CAPSULE_NO_SUCH_FUNCTION = 5, // returned by components for unknown exports
} capsule_status;

typedef struct capsule_host capsule_host;

// Buffers returned through char** out-params are owned by the host and must
// be handed back with release().
struct capsule_host {
    uint32_t abi_version;
    void* ctx;

    capsule_status (*http_request)(const capsule_host* h,
                                   const char* method, const char* url,
                                   const char* body, size_t body_len,
                                   int* http_status,
                                   char** response, size_t* response_len);

    capsule_status (*file_read)(const capsule_host* h, const char* path,
                                char** data, size_t* len);

    capsule_status (*file_write)(const capsule_host* h, const char* path,
                                 const char* data, size_t len);

    // Directory listing as a JSON array of entry names.
    capsule_status (*file_list)(const capsule_host* h, const char* path,
                                char** json, size_t* len);

    capsule_status (*env_get)(const capsule_host* h, const char* name,
                              char** value, size_t* len);

    // CAPSULE_CANCELLED once the host asked the call to stop.
    capsule_status (*checkpoint)(const capsule_host* h);

    void (*log)(const capsule_host* h, const char* level, const char* message);

    // JSON encoding of the return value (see the export's result type).
    void (*set_result)(const capsule_host* h, const char* json, size_t len);

    // Fault detail accompanying CAPSULE_TRAP. Kept host-side only.
    void (*set_error)(const capsule_host* h, const char* message);

    void (*release)(const capsule_host* h, char* buffer);
};

typedef int (*capsule_component_abi_version_fn)(void);

// args_json is a JSON array with one element per declared parameter.
typedef capsule_status (*capsule_component_call_fn)(const capsule_host* host,
                                                    const char* function,
                                                    const char* args_json);

#ifdef __cplusplus
}
#endif

#define CAPSULE_SYM_ABI_VERSION "capsule_component_abi_version"
#define CAPSULE_SYM_CALL "capsule_component_call"
