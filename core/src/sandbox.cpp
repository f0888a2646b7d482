#include "capsule/sandbox.h"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>

#if defined(__x86_64__)
  #define CAPSULE_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define CAPSULE_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define CAPSULE_AUDIT_ARCH 0
#endif

#define BPF_STMT_SC(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace capsule {

std::string install_component_seccomp() {
#if CAPSULE_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
#if defined(__x86_64__)
    static const unsigned int allowed[] = {
        0,    // read
        1,    // write
        3,    // close
        5,    // fstat
        7,    // poll
        8,    // lseek
        9,    // mmap
        10,   // mprotect (PROT_EXEC filtered below)
        11,   // munmap
        12,   // brk
        13,   // rt_sigaction
        14,   // rt_sigprocmask
        15,   // rt_sigreturn
        17,   // pread64
        19,   // readv
        20,   // writev
        24,   // sched_yield
        25,   // mremap
        28,   // madvise
        35,   // nanosleep
        39,   // getpid
        60,   // exit
        72,   // fcntl
        96,   // gettimeofday
        131,  // sigaltstack
        186,  // gettid
        202,  // futex
        218,  // set_tid_address
        219,  // restart_syscall
        228,  // clock_gettime
        229,  // clock_getres
        230,  // clock_nanosleep
        231,  // exit_group
        262,  // newfstatat
        270,  // pselect6
        271,  // ppoll
        273,  // set_robust_list
        318,  // getrandom
        334,  // rseq
    };
    const unsigned int mprotect_nr = 10;
#elif defined(__aarch64__)
    static const unsigned int allowed[] = {
        57,   // close
        62,   // lseek
        63,   // read
        64,   // write
        65,   // readv
        66,   // writev
        67,   // pread64
        25,   // fcntl
        79,   // fstatat
        80,   // fstat
        73,   // ppoll
        72,   // pselect6
        222,  // mmap
        226,  // mprotect
        215,  // munmap
        214,  // brk
        233,  // madvise
        216,  // mremap
        134,  // rt_sigaction
        135,  // rt_sigprocmask
        139,  // rt_sigreturn
        132,  // sigaltstack
        93,   // exit
        94,   // exit_group
        172,  // getpid
        178,  // gettid
        96,   // set_tid_address
        99,   // set_robust_list
        98,   // futex
        128,  // restart_syscall
        113,  // clock_gettime
        114,  // clock_getres
        115,  // clock_nanosleep
        169,  // gettimeofday
        278,  // getrandom
        101,  // nanosleep
        124,  // sched_yield
        293,  // rseq
    };
    const unsigned int mprotect_nr = 226;
#endif

    const size_t n_allowed = sizeof(allowed) / sizeof(allowed[0]);

    // Layout:
    //   [0]            load arch
    //   [1]            arch ok -> skip kill
    //   [2]            KILL (foreign arch)
    //   [3]            load syscall nr
    //   [4 .. 4+N-1]   JEQ allowed[s] -> ALLOW (mprotect -> MPROTECT_CHECK)
    //   [4+N]          KILL (default)
    //   [4+N+1]        MPROTECT_CHECK: load args[2]
    //   [4+N+2]        JSET PROT_EXEC -> KILL
    //   [4+N+3]        ALLOW (mprotect without PROT_EXEC)
    //   [4+N+4]        KILL (mprotect with PROT_EXEC)
    //   [4+N+5]        ALLOW
    std::vector<struct sock_filter> filter;
    filter.reserve(4 + n_allowed + 6);

    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, CAPSULE_AUDIT_ARCH, 1, 0));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (size_t s = 0; s < n_allowed; s++) {
        // jt counts instructions to skip after this one.
        unsigned char jt = (allowed[s] == mprotect_nr)
                               ? (unsigned char)(n_allowed - s)
                               : (unsigned char)(n_allowed + 4 - s);
        filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, allowed[s], jt, 0));
    }

    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS,
                                 offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JSET | BPF_K, 0x4, 1, 0));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog = {};
    prog.len = (unsigned short)filter.size();
    prog.filter = filter.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and inactive, 2: filter already active, -1/EINVAL: unsupported
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace capsule
