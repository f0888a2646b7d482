#pragma once

#include <atomic>
#include <string>

namespace capsule {

// Set by SIGINT / SIGTERM once install_stop_signals() ran.
std::atomic<bool>& stop_requested();
void install_stop_signals();

// Integer flag value clamped to [lo, hi]; defv when unparsable.
int parse_int_flag(const std::string& v, int lo, int hi, int defv);

} // namespace capsule
