#include "runner_utils.h"

#include <algorithm>
#include <csignal>
#include <cstdlib>

namespace capsule {

static std::atomic<bool> g_stop{false};

std::atomic<bool>& stop_requested() {
    return g_stop;
}

void install_stop_signals() {
    g_stop.store(false);
    std::signal(SIGTERM, [](int) { g_stop.store(true); });
    std::signal(SIGINT,  [](int) { g_stop.store(true); });
    // Writing to a disconnected client must not kill the host
    std::signal(SIGPIPE, SIG_IGN);
}

int parse_int_flag(const std::string& v, int lo, int hi, int defv) {
    if (v.empty()) return defv;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (!end || *end != '\0') return defv;
    return (int)std::clamp<long>(n, lo, hi);
}

} // namespace capsule
