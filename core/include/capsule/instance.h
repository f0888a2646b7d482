#pragma once

#include "config.h"
#include "host_effects.h"
#include "proc.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace capsule {

using SteadyTime = std::chrono::steady_clock::time_point;

// Set by whoever owns a call (a connection, a test) to ask for it to stop.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

struct InstanceSpec {
    ComponentId id;
    std::string staged_path;
    uint64_t memory_bytes{0}; // RLIMIT_AS (0 = none)
    uint64_t cpu_ms{0};       // RLIMIT_CPU (0 = none)
};

struct InstanceReply {
    bool ok{false};
    std::string result_json;
    CallError error;
    bool lost{false}; // the process is gone; the component needs re-instantiation
};

// One capsule_sandbox process bound to one component. Calls are serialised
// by the owning pool; a SandboxInstance is never used by two threads at once.
class SandboxInstance {
public:
    SandboxInstance(InstanceSpec spec, const RuntimeConfig& cfg, const HostEffects* effects);
    SandboxInstance(const SandboxInstance&) = delete;
    SandboxInstance& operator=(const SandboxInstance&) = delete;

    // Spawn and wait for the ready frame.
    bool start(std::string* err);

    InstanceReply call(const std::string& function, const std::string& args_json,
                       SteadyTime deadline, const CancelToken* cancel);

    bool alive() { return child_.alive(); }
    void stop();
    // SIGKILL from another thread; the thread running call() sees the loss.
    void interrupt();
    pid_t pid() const { return child_.pid(); }
    uint64_t recycles() const { return recycles_; }

private:
    InstanceReply lost(const std::string& detail);
    // Kill, respawn, and report the call as `kind`.
    InstanceReply recycle(CallErrorKind kind, const std::string& detail);
    ChildProcess::WriteStatus send(const wire::Frame& f, SteadyTime until);
    void reap();

    InstanceSpec spec_;
    RuntimeConfig cfg_;
    const HostEffects* effects_;
    ChildProcess child_;
    std::atomic<pid_t> live_pid_{-1};
    uint64_t next_call_{1};
    uint64_t recycles_{0};
};

// N interchangeable instances; each call takes the first free member.
class InstancePool {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(InstancePool* pool, size_t slot) : pool_(pool), slot_(slot) {}
        Lease(Lease&& o) noexcept : pool_(o.pool_), slot_(o.slot_) { o.pool_ = nullptr; }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        explicit operator bool() const { return pool_ != nullptr; }
        SandboxInstance* operator->() const;

    private:
        InstancePool* pool_{nullptr};
        size_t slot_{0};
    };

    InstancePool() = default;
    ~InstancePool();
    InstancePool(const InstancePool&) = delete;
    InstancePool& operator=(const InstancePool&) = delete;

    // All members start or none do.
    bool start(const InstanceSpec& spec, size_t size, const RuntimeConfig& cfg,
               const HostEffects* effects, std::string* err);

    // Empty lease once the deadline passes or the pool shut down.
    Lease acquire(SteadyTime deadline, const CancelToken* cancel);

    size_t size() const { return members_.size(); }
    size_t in_flight() const;

    // Wait until no call is running (or the timeout passes). True if idle.
    bool wait_idle(int timeout_ms);

    void shutdown();

private:
    void release(size_t slot);

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<SandboxInstance>> members_;
    std::vector<bool> busy_;
    size_t in_flight_{0};
    bool closed_{false};
};

} // namespace capsule
