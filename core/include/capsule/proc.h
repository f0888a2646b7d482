#pragma once

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace capsule {

struct ProcLimits {
    int timeout_ms{2000};                 // one-shot runs only
    size_t stdout_max_bytes{64 * 1024};   // one-shot runs only
    bool merge_stderr{true};              // one-shot runs: false drops child stderr

    uint64_t rlimit_cpu_ms{0};            // CPU time; rounded up to whole seconds (0 = none)
    uint64_t rlimit_as_bytes{512ULL << 20}; // virtual memory (0 = none)
    size_t rlimit_fsize_mb{10};           // max file size MB
    int rlimit_nofile{64};                // max open fds

    bool no_new_privs{true};

    // Replace the environment with exactly these KEY=VALUE entries.
    bool clear_env{false};
    std::vector<std::string> env;
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout (+ stderr when merged)
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is executable), feed stdin_data, capture output,
// enforce timeout and rlimits. Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res);

// Long-lived child speaking a line protocol over its stdin/stdout. The
// child's stderr is inherited. Destruction kills and reaps the child.
class ChildProcess {
public:
    enum class ReadStatus { Line, Timeout, Closed };
    enum class WriteStatus { Done, Timeout, Closed };

    ChildProcess() = default;
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    bool spawn(const std::vector<std::string>& argv, const ProcLimits& lim, std::string* err);

    // Writes the whole buffer. The child's stdin is non-blocking, so a child
    // that stops reading yields Timeout after timeout_ms instead of a hang.
    WriteStatus write_all(const std::string& data, int timeout_ms);

    // Next '\n'-terminated line (without the newline). Lines longer than
    // max_bytes close the channel.
    ReadStatus read_line(std::string* line, int timeout_ms, size_t max_bytes);

    bool signal(int sig);
    void kill_and_reap();
    bool alive();

    pid_t pid() const { return pid_; }
    // 128+signal for signalled children, like a shell.
    int exit_code() const { return exit_code_; }

private:
    void close_fds();

    pid_t pid_{-1};
    int in_fd_{-1};
    int out_fd_{-1};
    bool reaped_{true};
    int exit_code_{-1};
    std::string buf_;
};

} // namespace capsule
