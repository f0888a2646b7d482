#include "capsule/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace capsule {

Profile detect_profile() {
    const char* env = std::getenv("CAPSULE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // Must run before any worker threads exist: setenv() races getenv().
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CAPSULE_MANAGEMENT_TOOLS",   "1",     NO_OVERWRITE);
            setenv("CAPSULE_HTTP_ALLOW_PRIVATE", "1",     NO_OVERWRITE);
            setenv("CAPSULE_CALL_TIMEOUT_MS",    "30000", NO_OVERWRITE);
            setenv("CAPSULE_WATCH_MS",           "500",   NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CAPSULE_SECCOMP_ENABLE",     "1",     NO_OVERWRITE);
            setenv("CAPSULE_MANAGEMENT_TOOLS",   "0",     NO_OVERWRITE);
            setenv("CAPSULE_HTTP_ALLOW_PRIVATE", "0",     NO_OVERWRITE);
            setenv("CAPSULE_CALL_TIMEOUT_MS",    "10000", NO_OVERWRITE);
            setenv("CAPSULE_WATCH_MS",           "2000",  NO_OVERWRITE);
            setenv("CAPSULE_RESTART_BUDGET",     "2",     NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* key, int defv) {
    if (const char* e = std::getenv(key)) {
        try {
            return std::stoi(e);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

bool getenv_bool(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : defv;
}

RuntimeConfig load_runtime_config() {
    RuntimeConfig c;
    c.call_timeout_ms = std::clamp(getenv_int("CAPSULE_CALL_TIMEOUT_MS", c.call_timeout_ms), 10, 3600000);
    c.cancel_grace_ms = std::clamp(getenv_int("CAPSULE_CANCEL_GRACE_MS", c.cancel_grace_ms), 0, 60000);
    c.unload_grace_ms = std::clamp(getenv_int("CAPSULE_UNLOAD_GRACE_MS", c.unload_grace_ms), 0, 600000);
    c.pool_size = std::clamp(getenv_int("CAPSULE_POOL_SIZE", c.pool_size), 1, 64);
    c.watch_ms = std::clamp(getenv_int("CAPSULE_WATCH_MS", c.watch_ms), 20, 60000);
    c.http_timeout_ms = std::clamp(getenv_int("CAPSULE_HTTP_TIMEOUT_MS", c.http_timeout_ms), 100, 600000);
    c.restart_budget = std::clamp(getenv_int("CAPSULE_RESTART_BUDGET", c.restart_budget), 0, 1000);
    c.handshake_timeout_ms = std::clamp(getenv_int("CAPSULE_HANDSHAKE_TIMEOUT_MS", c.handshake_timeout_ms), 100, 120000);

    c.default_memory_mb = (uint64_t)std::clamp(getenv_int("CAPSULE_MEMORY_MB", (int)c.default_memory_mb), 0, 1 << 20);
    c.default_cpu_ms = (uint64_t)std::clamp(getenv_int("CAPSULE_CPU_MS", (int)c.default_cpu_ms), 0, 86400000);
    c.max_component_mb = (uint64_t)std::clamp(getenv_int("CAPSULE_MAX_COMPONENT_MB", (int)c.max_component_mb), 1, 4096);

    c.seccomp = getenv_bool("CAPSULE_SECCOMP_ENABLE", c.seccomp);
    if (!c.seccomp) {
        std::cerr << "[sandbox] WARNING: CAPSULE_SECCOMP_ENABLE=0, components run without a syscall filter "
                     "and can bypass capability checks\n";
    }
    c.management_tools = getenv_bool("CAPSULE_MANAGEMENT_TOOLS", c.management_tools);
    c.http_allow_private = getenv_bool("CAPSULE_HTTP_ALLOW_PRIVATE", c.http_allow_private);

    c.sandbox_bin = getenv_str("CAPSULE_SANDBOX_BIN");
    std::error_code ec;
    if (c.sandbox_bin.empty()) {
        // Installed next to the running executable by default.
        auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        c.sandbox_bin = ec ? "capsule_sandbox" : (self.parent_path() / "capsule_sandbox").string();
        ec.clear();
    }
    auto tmp = std::filesystem::temp_directory_path(ec);
    c.staging_dir = getenv_str("CAPSULE_STAGING_DIR", ((ec ? std::filesystem::path("/tmp") : tmp) / "capsule-staging").string());
    c.audit_log = getenv_str("CAPSULE_AUDIT_LOG");
    c.api_token = getenv_str("CAPSULE_API_TOKEN");
    return c;
}

} // namespace capsule
