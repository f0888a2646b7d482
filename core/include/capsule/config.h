#pragma once
#include <cstdint>
#include <string>

namespace capsule {

enum class Profile { DEV, PROD };

// Detect profile from CAPSULE_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (management tools on, private targets allowed)
// PROD: strict (management tools off, private targets blocked, shorter
//       call deadline)
// The component syscall filter is on in both; CAPSULE_SECCOMP_ENABLE=0 is
// the only way to turn it off.
void apply_profile_defaults(Profile p);

struct RuntimeConfig {
    int call_timeout_ms{30000};
    int cancel_grace_ms{500};
    int unload_grace_ms{5000};
    int pool_size{1};
    int watch_ms{500};
    int http_timeout_ms{10000};
    int restart_budget{3};
    int handshake_timeout_ms{5000};

    uint64_t default_memory_mb{512};
    uint64_t default_cpu_ms{0}; // 0 = no CPU-time ceiling
    uint64_t max_component_mb{64};

    bool seccomp{true};
    bool management_tools{true};
    bool http_allow_private{false};

    std::string sandbox_bin;  // capsule_sandbox executable
    std::string staging_dir;  // content-addressed component copies
    std::string audit_log;    // empty = no audit trail
    std::string api_token;    // HTTP transports; empty = open
};

// Read CAPSULE_* variables (after apply_profile_defaults). Out-of-range
// values are clamped; unparsable ones fall back to the default.
RuntimeConfig load_runtime_config();

int getenv_int(const char* key, int defv);
bool getenv_bool(const char* key, bool defv);
std::string getenv_str(const char* key, const std::string& defv = "");

} // namespace capsule
