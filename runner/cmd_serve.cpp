#include "cmd_serve.h"
#include "runner_utils.h"
#include "transports.h"

#include "capsule/bridge.h"
#include "capsule/config.h"
#include "capsule/dispatcher.h"
#include "capsule/log.h"
#include "capsule/policy.h"
#include "capsule/registry.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace capsule;

int cmd_serve(int argc, char** argv) {
    enum class Transport { None, Stdio, Sse, Streamable };
    Transport transport = Transport::None;
    HttpServeOptions http;
    std::string plugin_dir;
    std::vector<std::string> components;
    int pool = 0;
    int timeout_ms = 0;
    std::string audit_path;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--stdio") { transport = Transport::Stdio; continue; }
        if (a == "--sse") { transport = Transport::Sse; continue; }
        if (a == "--streamable-http") { transport = Transport::Streamable; continue; }
        if (a == "--host" && i + 1 < argc) { http.host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { http.port = parse_int_flag(argv[++i], 1, 65535, http.port); continue; }
        if (a == "--plugin-dir" && i + 1 < argc) { plugin_dir = argv[++i]; continue; }
        if (a == "--component" && i + 1 < argc) { components.push_back(argv[++i]); continue; }
        if (a == "--pool" && i + 1 < argc) { pool = parse_int_flag(argv[++i], 1, 64, 0); continue; }
        if (a == "--timeout-ms" && i + 1 < argc) { timeout_ms = parse_int_flag(argv[++i], 10, 3600000, 0); continue; }
        if (a == "--audit-log" && i + 1 < argc) { audit_path = argv[++i]; continue; }
        std::cerr << "unknown serve option: " << a << "\n";
        return 2;
    }
    if (transport == Transport::None) {
        std::cerr << "usage: capsule_cli serve (--stdio | --sse | --streamable-http) [--host H] [--port P]\n"
                     "                        [--plugin-dir DIR] [--component FILE]... [--pool N]\n"
                     "                        [--timeout-ms MS] [--audit-log FILE]\n";
        return 2;
    }

    const Profile profile = detect_profile();
    apply_profile_defaults(profile);
    RuntimeConfig cfg = load_runtime_config();
    if (pool > 0) cfg.pool_size = pool;
    if (timeout_ms > 0) cfg.call_timeout_ms = timeout_ms;
    if (!audit_path.empty()) cfg.audit_log = audit_path;
    http.api_token = cfg.api_token;
    http.response_wait_ms = cfg.call_timeout_ms + cfg.cancel_grace_ms + 5000;

    std::error_code ec;
    if (!std::filesystem::exists(cfg.sandbox_bin, ec)) {
        std::cerr << "[registry] sandbox executable not found: " << cfg.sandbox_bin
                  << " (set CAPSULE_SANDBOX_BIN)\n";
        return 2;
    }

    std::cerr << "[registry] profile=" << profile_name(profile) << " pool=" << cfg.pool_size
              << " timeout_ms=" << cfg.call_timeout_ms << " seccomp=" << (cfg.seccomp ? "on" : "off")
              << " management_tools=" << (cfg.management_tools ? "on" : "off") << "\n";

    PolicyStore policy;
    AuditLog audit(cfg.audit_log);
    if (!cfg.audit_log.empty() && !audit.enabled()) {
        std::cerr << "[registry] cannot open audit log " << cfg.audit_log << "\n";
        return 2;
    }

    ComponentRegistry registry(cfg, &policy, &audit);
    for (const auto& path : components) {
        LoadResult r = registry.load(path);
        if (!r.ok) {
            std::cerr << "[registry] " << path << ": " << load_error_name(r.error.kind) << ": "
                      << r.error.message << "\n";
            registry.shutdown();
            return 2;
        }
    }
    if (!plugin_dir.empty()) {
        if (!std::filesystem::is_directory(plugin_dir, ec)) {
            std::cerr << "[registry] plugin dir is not a directory: " << plugin_dir << "\n";
            registry.shutdown();
            return 2;
        }
        registry.watch(plugin_dir);
    }

    int rc = 0;
    {
        CallDispatcher dispatcher(&registry, &audit);
        Bridge bridge(&registry, &dispatcher);
        install_stop_signals();

        switch (transport) {
            case Transport::Stdio:
                rc = serve_stdio(bridge, stop_requested());
                break;
            case Transport::Sse:
            case Transport::Streamable:
                http.mode = transport == Transport::Sse ? HttpMode::Sse : HttpMode::Streamable;
                rc = serve_http(bridge, http, stop_requested());
                break;
            case Transport::None:
                break;
        }
        bridge.shutdown();
    }
    registry.shutdown();
    std::cerr << "[registry] stopped\n";
    return rc;
}
