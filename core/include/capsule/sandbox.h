#pragma once

// seccomp-BPF allowlist for sandbox instance processes.
//
// Installed by capsule_sandbox after the component is mapped and before it
// reports ready, so the filter only has to admit what a running
// component needs: pipe I/O to the host, memory management, signals,
// clocks and randomness. Notably absent: open/openat, socket/connect,
// execve, clone/fork, kill/tgkill, ptrace and every filesystem mutation.
// Effects go through host imports instead.
//
// Any syscall outside the list kills the process (SIGSYS); the host sees
// the instance die and recycles it.
//
// Architecture-aware: x86_64 and aarch64.

#include <string>

namespace capsule {

// Requires prctl(PR_SET_NO_NEW_PRIVS, 1) beforehand.
// Returns empty string on success, error message on failure.
std::string install_component_seccomp();

bool seccomp_available();

} // namespace capsule
