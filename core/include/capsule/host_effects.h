#pragma once

#include "config.h"
#include "log.h"
#include "policy.h"
#include "wire.h"

#include <string>

namespace capsule {

// Host-side implementation of the component imports. Every operation asks
// the PolicyStore first, against the live grant set, and only then acts.
struct EffectResult {
    enum class Status { Ok, Denied, Error };

    Status status{Status::Error};
    CapabilityKind capability{CapabilityKind::Network};
    std::string data;
    int http_status{0};
    std::string message;
};

struct HttpUrl {
    std::string scheme; // http | https
    std::string host;   // normalised (no brackets)
    std::string port;
};

// scheme://host[:port][/...]; userinfo is refused.
bool parse_http_url(const std::string& url, HttpUrl* out, std::string* err);

// RFC 1918 / 5737 / 6598, loopback, link-local, ULA and cloud metadata.
bool is_private_or_reserved_ip(const std::string& ip);

class HostEffects {
public:
    HostEffects(const PolicyStore* policy, const RuntimeConfig& cfg, AuditLog* audit)
        : policy_(policy), cfg_(cfg), audit_(audit) {}

    EffectResult http(const ComponentId& id, const std::string& method,
                      const std::string& url, const std::string& body) const;
    EffectResult read_file(const ComponentId& id, const std::string& path) const;
    EffectResult write_file(const ComponentId& id, const std::string& path, const std::string& data) const;
    EffectResult list_dir(const ComponentId& id, const std::string& path) const;
    EffectResult env(const ComponentId& id, const std::string& name) const;

    // Run one "host" frame and build the matching host_reply.
    wire::Frame serve(const ComponentId& id, const wire::Frame& req) const;

private:
    EffectResult denied(const ComponentId& id, const Decision& d, const std::string& target) const;

    const PolicyStore* policy_;
    RuntimeConfig cfg_;
    AuditLog* audit_;
};

} // namespace capsule
