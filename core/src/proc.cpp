#include "capsule/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace capsule {

static void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Runs in the forked child between fork() and exec(): async-signal-safe calls only.
[[noreturn]] static void exec_child(const std::vector<char*>& cargv, char* const* envp,
                                    const std::string& cwd, const ProcLimits& lim) {
    (void)setpgid(0, 0);
    (void)umask(077);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

    if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);

    if (lim.rlimit_cpu_ms > 0) {
        rlim_t sec = (rlim_t)((lim.rlimit_cpu_ms + 999) / 1000);
        set_rlimit(RLIMIT_CPU, sec, sec + 1);
    }
    if (lim.rlimit_as_bytes > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_bytes, (rlim_t)lim.rlimit_as_bytes);
    if (lim.rlimit_fsize_mb > 0) {
        rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
        set_rlimit(RLIMIT_FSIZE, bytes, bytes);
    }
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);

    sigset_t none;
    sigemptyset(&none);
    (void)sigprocmask(SIG_SETMASK, &none, nullptr);
    (void)signal(SIGPIPE, SIG_DFL);

    if (envp) execve(cargv[0], cargv.data(), envp);
    else execvp(cargv[0], cargv.data());
    _exit(127);
}

struct ExecArgs {
    std::vector<std::string> env_store;
    std::vector<char*> cargv;
    std::vector<char*> cenv;

    ExecArgs(const std::vector<std::string>& argv, const ProcLimits& lim) {
        cargv.reserve(argv.size() + 1);
        for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);
        if (lim.clear_env) {
            env_store = lim.env;
            for (auto& e : env_store) cenv.push_back(&e[0]);
            cenv.push_back(nullptr);
        }
    }

    char* const* envp() { return cenv.empty() ? nullptr : cenv.data(); }
};

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};
    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int outp[2];
    int inp[2];
    if (pipe2(outp, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(inp, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close(outp[0]); close(outp[1]);
        return false;
    }

    (void)::signal(SIGPIPE, SIG_IGN);

    ExecArgs ea(argv, lim);
    int devnull = lim.merge_stderr ? -1 : open("/dev/null", O_WRONLY | O_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close(outp[0]); close(outp[1]); close(inp[0]); close(inp[1]);
        if (devnull >= 0) close(devnull);
        return false;
    }
    if (pid == 0) {
        (void)dup2(inp[0], STDIN_FILENO);
        (void)dup2(outp[1], STDOUT_FILENO);
        (void)dup2(devnull >= 0 ? devnull : outp[1], STDERR_FILENO);
        exec_child(ea.cargv, ea.envp(), cwd, lim);
    }

    (void)setpgid(pid, pid);
    close(outp[1]);
    close(inp[0]);
    if (devnull >= 0) close(devnull);
    set_nonblocking(outp[0]);
    set_nonblocking(inp[1]);

    int in_fd = inp[1];
    size_t in_off = 0;
    if (stdin_data.empty()) {
        close(in_fd);
        in_fd = -1;
    }

    auto start = std::chrono::steady_clock::now();
    std::string out;
    bool eof = false;
    bool child_exited = false;
    int status = 0;

    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(outp[0], buf, sizeof(buf));
            if (n > 0) {
                size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
                size_t take = std::min((size_t)n, can);
                if (take < (size_t)n) res->output_truncated = true;
                out.append(buf, take);
                continue;
            }
            if (n == 0) eof = true;
            break;
        }
    };

    while (true) {
        drain();

        if (in_fd >= 0) {
            ssize_t n = write(in_fd, stdin_data.data() + in_off, stdin_data.size() - in_off);
            if (n > 0) in_off += (size_t)n;
            if ((n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) || in_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
        if (lim.timeout_ms > 0 && elapsed_ms > lim.timeout_ms) {
            res->timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }

        struct pollfd pfd[2];
        int nfds = 0;
        if (!eof) pfd[nfds++] = {outp[0], POLLIN, 0};
        if (in_fd >= 0) pfd[nfds++] = {in_fd, POLLOUT, 0};
        int slice = 50;
        if (lim.timeout_ms > 0) slice = std::max(1, std::min(slice, lim.timeout_ms - elapsed_ms));
        (void)poll(pfd, (nfds_t)nfds, slice);
    }

    drain();
    if (in_fd >= 0) close(in_fd);
    close(outp[0]);

    res->output = std::move(out);
    res->exit_code = child_exited ? decode_status(status) : 128;
    return true;
}

ChildProcess::~ChildProcess() {
    kill_and_reap();
}

void ChildProcess::close_fds() {
    if (in_fd_ >= 0) close(in_fd_);
    if (out_fd_ >= 0) close(out_fd_);
    in_fd_ = -1;
    out_fd_ = -1;
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, const ProcLimits& lim, std::string* err) {
    kill_and_reap();
    buf_.clear();
    exit_code_ = -1;
    if (argv.empty() || argv[0].empty()) {
        if (err) *err = "empty argv";
        return false;
    }

    int to_child[2];
    int from_child[2];
    if (pipe2(to_child, O_CLOEXEC) != 0) {
        if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(from_child, O_CLOEXEC) != 0) {
        if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
        close(to_child[0]); close(to_child[1]);
        return false;
    }

    // A dead child must surface as a failed write, not kill the host.
    (void)::signal(SIGPIPE, SIG_IGN);

    ExecArgs ea(argv, lim);
    pid_t pid = fork();
    if (pid < 0) {
        if (err) *err = std::string("fork failed: ") + std::strerror(errno);
        close(to_child[0]); close(to_child[1]);
        close(from_child[0]); close(from_child[1]);
        return false;
    }
    if (pid == 0) {
        (void)dup2(to_child[0], STDIN_FILENO);
        (void)dup2(from_child[1], STDOUT_FILENO);
        exec_child(ea.cargv, ea.envp(), "", lim);
    }

    (void)setpgid(pid, pid);
    close(to_child[0]);
    close(from_child[1]);
    pid_ = pid;
    in_fd_ = to_child[1];
    out_fd_ = from_child[0];
    set_nonblocking(in_fd_);
    set_nonblocking(out_fd_);
    reaped_ = false;
    return true;
}

ChildProcess::WriteStatus ChildProcess::write_all(const std::string& data, int timeout_ms) {
    if (in_fd_ < 0) return WriteStatus::Closed;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(0, timeout_ms));
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(in_fd_, data.data() + off, data.size() - off);
        if (n > 0) {
            off += (size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return WriteStatus::Closed;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return WriteStatus::Timeout;
        int wait_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        struct pollfd pfd = {in_fd_, POLLOUT, 0};
        (void)poll(&pfd, 1, std::max(1, wait_ms));
    }
    return WriteStatus::Done;
}

ChildProcess::ReadStatus ChildProcess::read_line(std::string* line, int timeout_ms, size_t max_bytes) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(0, timeout_ms));
    while (true) {
        auto nl = buf_.find('\n');
        if (nl != std::string::npos) {
            line->assign(buf_, 0, nl);
            buf_.erase(0, nl + 1);
            return ReadStatus::Line;
        }
        if (buf_.size() > max_bytes || out_fd_ < 0) return ReadStatus::Closed;

        char tmp[8192];
        ssize_t n = ::read(out_fd_, tmp, sizeof(tmp));
        if (n > 0) {
            buf_.append(tmp, (size_t)n);
            continue;
        }
        if (n == 0) return ReadStatus::Closed;
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return ReadStatus::Closed;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return ReadStatus::Timeout;
        int wait_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        struct pollfd pfd = {out_fd_, POLLIN, 0};
        (void)poll(&pfd, 1, std::max(1, wait_ms));
    }
}

bool ChildProcess::signal(int sig) {
    if (pid_ <= 0 || reaped_) return false;
    return ::kill(pid_, sig) == 0;
}

bool ChildProcess::alive() {
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        return false;
    }
    return true;
}

void ChildProcess::kill_and_reap() {
    close_fds();
    if (pid_ > 0 && !reaped_) {
        (void)::kill(-pid_, SIGKILL);
        (void)::kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        exit_code_ = decode_status(status);
        reaped_ = true;
    }
    pid_ = -1;
}

} // namespace capsule
