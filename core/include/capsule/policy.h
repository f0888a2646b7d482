#pragma once

#include "types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace capsule {

enum FsAccess : unsigned {
    FS_READ = 1u << 0,
    FS_WRITE = 1u << 1,
    FS_ALL = FS_READ | FS_WRITE,
};

struct CapabilityGrant {
    CapabilityKind kind{CapabilityKind::Network};
    std::string pattern;      // host pattern, path prefix or variable name
    unsigned access{0};       // Filesystem
    uint64_t memory_bytes{0}; // Resource (0 = unset)
    uint64_t cpu_ms{0};       // Resource (0 = unset)

    static CapabilityGrant network(std::string host_pattern);
    static CapabilityGrant filesystem(std::string prefix, unsigned access);
    static CapabilityGrant environment(std::string name);
    static CapabilityGrant resource(uint64_t memory_bytes, uint64_t cpu_ms);

    bool operator==(const CapabilityGrant& o) const;
};

// Which grants revoke() removes.
struct GrantSelector {
    enum class Scope { Exact, Kind, All };

    Scope scope{Scope::Exact};
    CapabilityKind kind{CapabilityKind::Network};
    std::string pattern;
    unsigned access{0}; // Filesystem: bits to remove (0 = the whole grant)

    static GrantSelector network(std::string host_pattern);
    static GrantSelector filesystem(std::string prefix, unsigned access = 0);
    static GrantSelector environment(std::string name);
    static GrantSelector resource();
    static GrantSelector kind_of(CapabilityKind k);
    static GrantSelector everything();
};

struct CapabilityRequest {
    CapabilityKind kind{CapabilityKind::Network};
    std::string target; // host, absolute path or variable name
    unsigned access{0}; // Filesystem

    static CapabilityRequest network(std::string host);
    static CapabilityRequest filesystem(std::string path, unsigned access);
    static CapabilityRequest environment(std::string name);
};

struct Decision {
    bool allowed{false};
    CapabilityKind kind{CapabilityKind::Network};
    std::string reason; // set on deny

    static Decision allow(CapabilityKind k) { return Decision{true, k, {}}; }
    static Decision deny(CapabilityKind k, std::string why) { return Decision{false, k, std::move(why)}; }
};

struct ResourceLimits {
    std::optional<uint64_t> memory_bytes;
    std::optional<uint64_t> cpu_ms;
};

// Host name as compared by the engine: lower-case, no trailing dot, no
// IPv6 brackets. Empty when the input is not a valid host.
std::string normalize_host(const std::string& host);

// Per-component grant sets. Every component starts with none (default deny).
// Checks read grants under a shared lock; grant/revoke take it exclusively,
// so a check that starts after a write returns sees that write. Filesystem
// paths are resolved after the lock is released.
class PolicyStore {
public:
    void create(const ComponentId& id);
    void drop(const ComponentId& id);
    bool exists(const ComponentId& id) const;

    PolicyError grant(const ComponentId& id, const CapabilityGrant& g);

    // Number of grants removed or narrowed. Unknown ids are a no-op.
    size_t revoke(const ComponentId& id, const GrantSelector& sel);

    void reset(const ComponentId& id);

    Decision check(const ComponentId& id, const CapabilityRequest& req) const;

    ResourceLimits resource_limits(const ComponentId& id) const;
    std::vector<CapabilityGrant> grants(const ComponentId& id) const;

    // Permission documents:
    //   {"version":"1.0","permissions":{
    //      "network":{"allow":[{"host":"api.example.com"}]},
    //      "storage":{"allow":[{"uri":"fs:///data","access":["read","write"]}]},
    //      "environment":{"allow":[{"key":"API_KEY"}]},
    //      "resources":{"limits":{"memory":"256Mi","cpu_ms":5000}}}}
    // All grants of a document are validated before any is applied.
    PolicyError apply_document(const ComponentId& id, const std::string& json);
    std::string export_document(const ComponentId& id) const;

private:
    PolicyError validate(CapabilityGrant* g) const;
    Decision check_filesystem(const ComponentId& id, const CapabilityRequest& req) const;
    void add_locked(std::vector<CapabilityGrant>& set, const CapabilityGrant& g);

    mutable std::shared_mutex mu_;
    std::map<ComponentId, std::vector<CapabilityGrant>> grants_;
};

bool parse_memory_quantity(const std::string& s, uint64_t* bytes);

} // namespace capsule
