#include "capsule/policy.h"
#include "capsule/json_mini.h"

#include <arpa/inet.h>

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace capsule {

namespace fs = std::filesystem;

CapabilityGrant CapabilityGrant::network(std::string host_pattern) {
    CapabilityGrant g;
    g.kind = CapabilityKind::Network;
    g.pattern = std::move(host_pattern);
    return g;
}

CapabilityGrant CapabilityGrant::filesystem(std::string prefix, unsigned access) {
    CapabilityGrant g;
    g.kind = CapabilityKind::Filesystem;
    g.pattern = std::move(prefix);
    g.access = access;
    return g;
}

CapabilityGrant CapabilityGrant::environment(std::string name) {
    CapabilityGrant g;
    g.kind = CapabilityKind::Environment;
    g.pattern = std::move(name);
    return g;
}

CapabilityGrant CapabilityGrant::resource(uint64_t memory_bytes, uint64_t cpu_ms) {
    CapabilityGrant g;
    g.kind = CapabilityKind::Resource;
    g.memory_bytes = memory_bytes;
    g.cpu_ms = cpu_ms;
    return g;
}

bool CapabilityGrant::operator==(const CapabilityGrant& o) const {
    return kind == o.kind && pattern == o.pattern && access == o.access &&
           memory_bytes == o.memory_bytes && cpu_ms == o.cpu_ms;
}

GrantSelector GrantSelector::network(std::string host_pattern) {
    GrantSelector s;
    s.kind = CapabilityKind::Network;
    s.pattern = std::move(host_pattern);
    return s;
}

GrantSelector GrantSelector::filesystem(std::string prefix, unsigned access) {
    GrantSelector s;
    s.kind = CapabilityKind::Filesystem;
    s.pattern = std::move(prefix);
    s.access = access;
    return s;
}

GrantSelector GrantSelector::environment(std::string name) {
    GrantSelector s;
    s.kind = CapabilityKind::Environment;
    s.pattern = std::move(name);
    return s;
}

GrantSelector GrantSelector::resource() {
    GrantSelector s;
    s.kind = CapabilityKind::Resource;
    return s;
}

GrantSelector GrantSelector::kind_of(CapabilityKind k) {
    GrantSelector s;
    s.scope = Scope::Kind;
    s.kind = k;
    return s;
}

GrantSelector GrantSelector::everything() {
    GrantSelector s;
    s.scope = Scope::All;
    return s;
}

CapabilityRequest CapabilityRequest::network(std::string host) {
    return CapabilityRequest{CapabilityKind::Network, std::move(host), 0};
}

CapabilityRequest CapabilityRequest::filesystem(std::string path, unsigned access) {
    return CapabilityRequest{CapabilityKind::Filesystem, std::move(path), access};
}

CapabilityRequest CapabilityRequest::environment(std::string name) {
    return CapabilityRequest{CapabilityKind::Environment, std::move(name), 0};
}

namespace {

std::string lower_ascii(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

bool valid_dns_name(const std::string& h) {
    if (h.empty() || h.size() > 253) return false;
    size_t label = 0;
    char prev = '.';
    for (char c : h) {
        if (c == '.') {
            if (label == 0 || prev == '-') return false;
            label = 0;
        } else if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_') {
            if (label == 0 && c == '-') return false;
            if (++label > 63) return false;
        } else {
            return false;
        }
        prev = c;
    }
    return label > 0 && prev != '-';
}

bool is_ip_literal(const std::string& h) {
    unsigned char buf[16];
    return inet_pton(AF_INET, h.c_str(), buf) == 1 || inet_pton(AF_INET6, h.c_str(), buf) == 1;
}

// Strip a trailing separator so "/a/b/" and "/a/b" compare equal.
fs::path clean(fs::path p) {
    p = p.lexically_normal();
    if (p.has_relative_path() && p.filename().empty()) p = p.parent_path();
    return p;
}

// Lexical normalisation then symlink resolution of the existing prefix.
fs::path resolve_path(const fs::path& p) {
    std::error_code ec;
    fs::path r = fs::weakly_canonical(p.lexically_normal(), ec);
    if (ec) return clean(p);
    return clean(r);
}

bool path_within(const fs::path& prefix, const fs::path& p) {
    auto pi = p.begin();
    for (auto it = prefix.begin(); it != prefix.end(); ++it, ++pi) {
        if (pi == p.end() || *pi != *it) return false;
    }
    return true;
}

bool invalid(PolicyError* e, const std::string& msg) {
    e->kind = PolicyErrorKind::InvalidGrantPattern;
    e->message = msg;
    return false;
}

// Canonical stored form of a pattern; false when it cannot be a grant.
bool canonical_pattern(CapabilityKind kind, const std::string& raw, std::string* out, PolicyError* e) {
    switch (kind) {
        case CapabilityKind::Network: {
            std::string p = lower_ascii(raw);
            if (p.empty()) return invalid(e, "empty host pattern");
            if (p == "*") return invalid(e, "bare '*' is not a valid host pattern");
            bool wildcard = p.rfind("*.", 0) == 0;
            std::string rest = wildcard ? p.substr(2) : p;
            if (rest.find('*') != std::string::npos) {
                return invalid(e, "wildcard only allowed as a leading '*.' label: " + raw);
            }
            std::string host = normalize_host(rest);
            if (host.empty()) return invalid(e, "not a valid host: " + raw);
            if (wildcard && is_ip_literal(host)) return invalid(e, "wildcard over an IP address: " + raw);
            *out = wildcard ? "*." + host : host;
            return true;
        }
        case CapabilityKind::Filesystem: {
            std::string p = raw;
            if (p.rfind("fs://", 0) == 0) p = p.substr(5);
            if (p.empty() || p.find('\0') != std::string::npos) return invalid(e, "empty path prefix");
            fs::path fp(p);
            if (!fp.is_absolute()) return invalid(e, "path prefix must be absolute: " + raw);
            *out = clean(fp).string();
            return true;
        }
        case CapabilityKind::Environment:
            if (raw.empty()) return invalid(e, "empty environment variable name");
            if (raw.find('=') != std::string::npos || raw.find('\0') != std::string::npos) {
                return invalid(e, "invalid environment variable name: " + raw);
            }
            *out = raw;
            return true;
        case CapabilityKind::Resource:
            out->clear();
            return true;
    }
    return invalid(e, "unknown capability kind");
}

} // namespace

std::string normalize_host(const std::string& host) {
    std::string h = lower_ascii(host);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') h = h.substr(1, h.size() - 2);
    if (h.find(':') != std::string::npos) {
        unsigned char buf[16];
        if (inet_pton(AF_INET6, h.c_str(), buf) != 1) return "";
        char txt[INET6_ADDRSTRLEN];
        if (!inet_ntop(AF_INET6, buf, txt, sizeof(txt))) return "";
        return txt;
    }
    if (!h.empty() && h.back() == '.') h.pop_back();
    if (!valid_dns_name(h)) return "";
    return h;
}

PolicyError PolicyStore::validate(CapabilityGrant* g) const {
    PolicyError e;
    std::string canon;
    if (!canonical_pattern(g->kind, g->pattern, &canon, &e)) return e;
    g->pattern = canon;
    if (g->kind == CapabilityKind::Filesystem) {
        if (g->access == 0 || (g->access & ~static_cast<unsigned>(FS_ALL)) != 0) {
            e.kind = PolicyErrorKind::InvalidGrantPattern;
            e.message = "filesystem grant needs a non-empty subset of {read, write}";
            return e;
        }
    } else {
        g->access = 0;
    }
    if (g->kind == CapabilityKind::Resource) {
        if (g->memory_bytes == 0 && g->cpu_ms == 0) {
            e.kind = PolicyErrorKind::InvalidGrantPattern;
            e.message = "resource grant sets neither memory nor cpu";
            return e;
        }
    } else {
        g->memory_bytes = 0;
        g->cpu_ms = 0;
    }
    return e;
}

void PolicyStore::add_locked(std::vector<CapabilityGrant>& set, const CapabilityGrant& g) {
    for (auto& cur : set) {
        if (cur.kind != g.kind) continue;
        if (g.kind == CapabilityKind::Resource) {
            if (g.memory_bytes) cur.memory_bytes = g.memory_bytes;
            if (g.cpu_ms) cur.cpu_ms = g.cpu_ms;
            return;
        }
        if (cur.pattern != g.pattern) continue;
        cur.access |= g.access;
        return;
    }
    set.push_back(g);
}

void PolicyStore::create(const ComponentId& id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    grants_.emplace(id, std::vector<CapabilityGrant>{});
}

void PolicyStore::drop(const ComponentId& id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    grants_.erase(id);
}

bool PolicyStore::exists(const ComponentId& id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return grants_.count(id) != 0;
}

PolicyError PolicyStore::grant(const ComponentId& id, const CapabilityGrant& g) {
    CapabilityGrant canon = g;
    PolicyError e = validate(&canon);
    if (e.kind != PolicyErrorKind::None) return e;

    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = grants_.find(id);
    if (it == grants_.end()) {
        e.kind = PolicyErrorKind::UnknownComponent;
        e.message = "unknown component: " + id;
        return e;
    }
    add_locked(it->second, canon);
    return e;
}

size_t PolicyStore::revoke(const ComponentId& id, const GrantSelector& sel) {
    std::string canon;
    if (sel.scope == GrantSelector::Scope::Exact) {
        PolicyError ignored;
        if (!canonical_pattern(sel.kind, sel.pattern, &canon, &ignored)) return 0;
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = grants_.find(id);
    if (it == grants_.end()) return 0;
    auto& set = it->second;
    size_t n = 0;
    for (auto g = set.begin(); g != set.end();) {
        bool hit = false;
        switch (sel.scope) {
            case GrantSelector::Scope::All:  hit = true; break;
            case GrantSelector::Scope::Kind: hit = g->kind == sel.kind; break;
            case GrantSelector::Scope::Exact:
                hit = g->kind == sel.kind && (sel.kind == CapabilityKind::Resource || g->pattern == canon);
                break;
        }
        if (!hit) {
            ++g;
            continue;
        }
        n++;
        if (sel.scope == GrantSelector::Scope::Exact && sel.kind == CapabilityKind::Filesystem && sel.access != 0) {
            g->access &= ~sel.access;
            if (g->access != 0) {
                ++g;
                continue;
            }
        }
        g = set.erase(g);
    }
    return n;
}

void PolicyStore::reset(const ComponentId& id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = grants_.find(id);
    if (it != grants_.end()) it->second.clear();
}

// Path resolution touches the filesystem, so it runs outside the store lock
// against a copy of the component's filesystem grants.
Decision PolicyStore::check_filesystem(const ComponentId& id, const CapabilityRequest& req) const {
    if (req.target.empty() || req.target.find('\0') != std::string::npos) {
        return Decision::deny(req.kind, "malformed path");
    }
    if (req.access == 0 || (req.access & ~static_cast<unsigned>(FS_ALL)) != 0) {
        return Decision::deny(req.kind, "malformed access set");
    }
    fs::path p(req.target);
    if (!p.is_absolute()) return Decision::deny(req.kind, "path must be absolute");

    std::vector<std::string> prefixes;
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        auto it = grants_.find(id);
        if (it == grants_.end()) return Decision::deny(req.kind, "no policy for component");
        for (const auto& g : it->second) {
            if (g.kind != CapabilityKind::Filesystem) continue;
            if ((req.access & ~g.access) != 0) continue;
            prefixes.push_back(g.pattern);
        }
    }

    const fs::path target = resolve_path(p);
    for (const auto& prefix : prefixes) {
        if (path_within(resolve_path(prefix), target)) return Decision::allow(req.kind);
    }
    return Decision::deny(req.kind, "path not granted: " + target.string());
}

Decision PolicyStore::check(const ComponentId& id, const CapabilityRequest& req) const {
    if (req.kind == CapabilityKind::Filesystem) return check_filesystem(id, req);
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = grants_.find(id);
    if (it == grants_.end()) return Decision::deny(req.kind, "no policy for component");
    const auto& set = it->second;

    switch (req.kind) {
        case CapabilityKind::Network: {
            std::string host = normalize_host(req.target);
            if (host.empty()) return Decision::deny(req.kind, "malformed host");
            for (const auto& g : set) {
                if (g.kind != CapabilityKind::Network) continue;
                if (g.pattern == host) return Decision::allow(req.kind);
                if (g.pattern.rfind("*.", 0) == 0) {
                    const std::string suffix = g.pattern.substr(1); // ".example.com"
                    if (host.size() > suffix.size() &&
                        host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0) {
                        return Decision::allow(req.kind);
                    }
                }
            }
            return Decision::deny(req.kind, "host not granted: " + host);
        }
        case CapabilityKind::Filesystem:
            break;
        case CapabilityKind::Environment:
            for (const auto& g : set) {
                if (g.kind == CapabilityKind::Environment && g.pattern == req.target) return Decision::allow(req.kind);
            }
            return Decision::deny(req.kind, "environment variable not granted: " + req.target);
        case CapabilityKind::Resource:
            return Decision::deny(req.kind, "resource limits are not checked per request");
    }
    return Decision::deny(req.kind, "unknown capability kind");
}

ResourceLimits PolicyStore::resource_limits(const ComponentId& id) const {
    ResourceLimits r;
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = grants_.find(id);
    if (it == grants_.end()) return r;
    for (const auto& g : it->second) {
        if (g.kind != CapabilityKind::Resource) continue;
        if (g.memory_bytes) r.memory_bytes = g.memory_bytes;
        if (g.cpu_ms) r.cpu_ms = g.cpu_ms;
    }
    return r;
}

std::vector<CapabilityGrant> PolicyStore::grants(const ComponentId& id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = grants_.find(id);
    if (it == grants_.end()) return {};
    return it->second;
}

bool parse_memory_quantity(const std::string& s, uint64_t* bytes) {
    static const struct { const char* suffix; uint64_t mult; } units[] = {
        {"Ki", 1ULL << 10}, {"Mi", 1ULL << 20}, {"Gi", 1ULL << 30},
        {"K", 1000ULL}, {"M", 1000ULL * 1000}, {"G", 1000ULL * 1000 * 1000},
    };
    std::string num = s;
    uint64_t mult = 1;
    for (const auto& u : units) {
        const size_t n = std::char_traits<char>::length(u.suffix);
        if (num.size() > n && num.compare(num.size() - n, n, u.suffix) == 0) {
            num.resize(num.size() - n);
            mult = u.mult;
            break;
        }
    }
    if (num.empty() || num.find_first_not_of("0123456789") != std::string::npos) return false;
    uint64_t v = 0;
    try {
        v = std::stoull(num);
    } catch (const std::exception&) {
        return false;
    }
    if (v != 0 && mult > UINT64_MAX / v) return false;
    *bytes = v * mult;
    return true;
}

namespace {

json_object* allow_list(json_object* permissions, const char* section) {
    json_object* sec = json_mini::member(permissions, section);
    if (!sec) return nullptr;
    json_object* allow = json_mini::member(sec, "allow");
    return allow && json_object_is_type(allow, json_type_array) ? allow : nullptr;
}

bool doc_error(PolicyError* e, const std::string& msg) {
    e->kind = PolicyErrorKind::InvalidDocument;
    e->message = msg;
    return false;
}

bool grants_from_document(const std::string& json, std::vector<CapabilityGrant>* out, PolicyError* e) {
    json_mini::Doc d = json_mini::parse(json);
    if (!d || !json_object_is_type(d.root, json_type_object)) return doc_error(e, "policy document is not a JSON object");
    json_object* perms = json_mini::member(d.root, "permissions");
    if (!perms) return true;
    if (!json_object_is_type(perms, json_type_object)) return doc_error(e, "'permissions' must be an object");

    if (json_object* arr = allow_list(perms, "network")) {
        for (size_t i = 0; i < json_object_array_length(arr); i++) {
            auto host = json_mini::get_string(json_object_array_get_idx(arr, i), "host");
            if (!host) return doc_error(e, "network.allow entries need 'host'");
            out->push_back(CapabilityGrant::network(*host));
        }
    }
    if (json_object* arr = allow_list(perms, "storage")) {
        for (size_t i = 0; i < json_object_array_length(arr); i++) {
            json_object* el = json_object_array_get_idx(arr, i);
            auto uri = json_mini::get_string(el, "uri");
            if (!uri) return doc_error(e, "storage.allow entries need 'uri'");
            unsigned access = 0;
            for (const auto& a : json_mini::get_array_strings(el, "access")) {
                if (a == "read") access |= FS_READ;
                else if (a == "write") access |= FS_WRITE;
                else return doc_error(e, "unknown storage access '" + a + "'");
            }
            out->push_back(CapabilityGrant::filesystem(*uri, access));
        }
    }
    if (json_object* arr = allow_list(perms, "environment")) {
        for (size_t i = 0; i < json_object_array_length(arr); i++) {
            auto key = json_mini::get_string(json_object_array_get_idx(arr, i), "key");
            if (!key) return doc_error(e, "environment.allow entries need 'key'");
            out->push_back(CapabilityGrant::environment(*key));
        }
    }
    if (json_object* limits = json_mini::member(json_mini::member(perms, "resources"), "limits")) {
        uint64_t mem = 0, cpu = 0;
        json_object* m = json_mini::member(limits, "memory");
        if (m && json_object_is_type(m, json_type_string)) {
            if (!parse_memory_quantity(json_object_get_string(m), &mem)) return doc_error(e, "bad memory quantity");
        } else if (m && json_object_is_type(m, json_type_int) && json_object_get_int64(m) > 0) {
            mem = static_cast<uint64_t>(json_object_get_int64(m));
        } else if (m) {
            return doc_error(e, "bad memory quantity");
        }
        if (auto c = json_mini::get_int(limits, "cpu_ms")) {
            if (*c <= 0) return doc_error(e, "cpu_ms must be positive");
            cpu = static_cast<uint64_t>(*c);
        }
        if (mem || cpu) out->push_back(CapabilityGrant::resource(mem, cpu));
    }
    return true;
}

} // namespace

PolicyError PolicyStore::apply_document(const ComponentId& id, const std::string& json) {
    PolicyError e;
    std::vector<CapabilityGrant> parsed;
    if (!grants_from_document(json, &parsed, &e)) return e;
    for (auto& g : parsed) {
        e = validate(&g);
        if (e.kind != PolicyErrorKind::None) return e;
    }

    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = grants_.find(id);
    if (it == grants_.end()) {
        e.kind = PolicyErrorKind::UnknownComponent;
        e.message = "unknown component: " + id;
        return e;
    }
    for (const auto& g : parsed) add_locked(it->second, g);
    return e;
}

std::string PolicyStore::export_document(const ComponentId& id) const {
    const auto set = grants(id);

    json_object* net = json_object_new_array();
    json_object* storage = json_object_new_array();
    json_object* env = json_object_new_array();
    json_object* limits = nullptr;
    for (const auto& g : set) {
        switch (g.kind) {
            case CapabilityKind::Network: {
                json_object* o = json_object_new_object();
                json_object_object_add(o, "host", json_mini::new_string(g.pattern));
                json_object_array_add(net, o);
                break;
            }
            case CapabilityKind::Filesystem: {
                json_object* o = json_object_new_object();
                json_object_object_add(o, "uri", json_mini::new_string("fs://" + g.pattern));
                json_object* acc = json_object_new_array();
                if (g.access & FS_READ) json_object_array_add(acc, json_object_new_string("read"));
                if (g.access & FS_WRITE) json_object_array_add(acc, json_object_new_string("write"));
                json_object_object_add(o, "access", acc);
                json_object_array_add(storage, o);
                break;
            }
            case CapabilityKind::Environment: {
                json_object* o = json_object_new_object();
                json_object_object_add(o, "key", json_mini::new_string(g.pattern));
                json_object_array_add(env, o);
                break;
            }
            case CapabilityKind::Resource:
                limits = json_object_new_object();
                if (g.memory_bytes) json_object_object_add(limits, "memory", json_object_new_int64((int64_t)g.memory_bytes));
                if (g.cpu_ms) json_object_object_add(limits, "cpu_ms", json_object_new_int64((int64_t)g.cpu_ms));
                break;
        }
    }

    auto section = [](json_object* arr) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "allow", arr);
        return o;
    };
    json_object* perms = json_object_new_object();
    json_object_object_add(perms, "network", section(net));
    json_object_object_add(perms, "storage", section(storage));
    json_object_object_add(perms, "environment", section(env));
    if (limits) {
        json_object* res = json_object_new_object();
        json_object_object_add(res, "limits", limits);
        json_object_object_add(perms, "resources", res);
    }
    json_mini::Doc root(json_object_new_object());
    json_object_object_add(root.root, "version", json_object_new_string("1.0"));
    json_object_object_add(root.root, "permissions", perms);
    return json_mini::dump(root.root);
}

} // namespace capsule
