#include "capsule/instance.h"
#include "capsule/component_abi.h"
#include "capsule/sandbox.h"

#include <algorithm>
#include <csignal>
#include <iostream>

namespace capsule {

using Clock = std::chrono::steady_clock;

static constexpr size_t kMaxFrameBytes = 32ULL * 1024 * 1024;
static constexpr int kPollSliceMs = 50;

static CallError make_error(CallErrorKind k, std::string detail) {
    CallError e;
    e.kind = k;
    e.detail = std::move(detail);
    return e;
}

static int ms_until(SteadyTime t) {
    auto d = std::chrono::duration_cast<std::chrono::milliseconds>(t - Clock::now()).count();
    return d < 0 ? 0 : (int)std::min<long long>(d, 1 << 30);
}

static bool capability_from_name(const std::string& s, CapabilityKind* out) {
    static const CapabilityKind all[] = {
        CapabilityKind::Network, CapabilityKind::Filesystem,
        CapabilityKind::Environment, CapabilityKind::Resource,
    };
    for (CapabilityKind k : all) {
        if (s == capability_kind_name(k)) {
            *out = k;
            return true;
        }
    }
    return false;
}

SandboxInstance::SandboxInstance(InstanceSpec spec, const RuntimeConfig& cfg, const HostEffects* effects)
    : spec_(std::move(spec)), cfg_(cfg), effects_(effects) {}

bool SandboxInstance::start(std::string* err) {
    if (cfg_.seccomp && !seccomp_available()) {
        if (err) *err = "seccomp is unavailable on this host (set CAPSULE_SECCOMP_ENABLE=0 to run unfiltered)";
        return false;
    }
    std::vector<std::string> argv = {cfg_.sandbox_bin, "--component", spec_.staged_path, "--id", spec_.id};
    if (cfg_.seccomp) argv.push_back("--seccomp");

    ProcLimits lim;
    lim.rlimit_as_bytes = spec_.memory_bytes;
    lim.rlimit_cpu_ms = spec_.cpu_ms;
    lim.rlimit_fsize_mb = 1;
    lim.rlimit_nofile = 32;
    lim.clear_env = true; // components see no host environment

    if (!child_.spawn(argv, lim, err)) return false;

    std::string line;
    auto st = child_.read_line(&line, cfg_.handshake_timeout_ms, kMaxFrameBytes);
    if (st != ChildProcess::ReadStatus::Line) {
        reap();
        if (err) {
            *err = st == ChildProcess::ReadStatus::Timeout
                       ? "sandbox handshake timed out"
                       : "sandbox exited during startup (code " + std::to_string(child_.exit_code()) + ")";
        }
        return false;
    }

    wire::Frame f;
    std::string perr;
    if (!wire::decode(line, &f, &perr)) {
        reap();
        if (err) *err = "bad handshake frame: " + perr;
        return false;
    }
    if (f.type == wire::FrameType::Fatal) {
        reap();
        if (err) *err = f.detail;
        return false;
    }
    if (f.type != wire::FrameType::Ready || f.abi != CAPSULE_COMPONENT_ABI_VERSION) {
        reap();
        if (err) *err = "unexpected handshake from sandbox";
        return false;
    }
    live_pid_.store(child_.pid());
    return true;
}

void SandboxInstance::reap() {
    live_pid_.store(-1);
    child_.kill_and_reap();
}

void SandboxInstance::stop() {
    reap();
}

void SandboxInstance::interrupt() {
    pid_t p = live_pid_.load();
    if (p > 0) (void)::kill(p, SIGKILL);
}

ChildProcess::WriteStatus SandboxInstance::send(const wire::Frame& f, SteadyTime until) {
    return child_.write_all(wire::encode(f) + "\n", std::max(1, ms_until(until)));
}

InstanceReply SandboxInstance::recycle(CallErrorKind kind, const std::string& detail) {
    reap();
    recycles_++;
    InstanceReply reply;
    reply.error = make_error(kind, detail);
    std::string err;
    if (!start(&err)) {
        std::cerr << "[sandbox] " << spec_.id << ": respawn after recycle failed: " << err << "\n";
        reply.lost = true;
    }
    return reply;
}

InstanceReply SandboxInstance::lost(const std::string& detail) {
    reap();
    InstanceReply r;
    r.lost = true;
    r.error = make_error(CallErrorKind::ComponentFault, detail);
    std::cerr << "[sandbox] " << spec_.id << ": " << detail << "\n";
    return r;
}

InstanceReply SandboxInstance::call(const std::string& function, const std::string& args_json,
                                    SteadyTime deadline, const CancelToken* cancel) {
    InstanceReply reply;
    if (!child_.alive()) return lost("instance is not running (code " + std::to_string(child_.exit_code()) + ")");
    if (Clock::now() >= deadline) {
        reply.error = make_error(CallErrorKind::Timeout, "deadline passed before dispatch");
        return reply;
    }

    wire::Frame req;
    req.type = wire::FrameType::Call;
    req.id = next_call_++;
    req.function = function;
    req.args = args_json;
    switch (send(req, deadline)) {
    case ChildProcess::WriteStatus::Done: break;
    case ChildProcess::WriteStatus::Closed: return lost("instance closed its input");
    case ChildProcess::WriteStatus::Timeout:
        return recycle(CallErrorKind::Timeout, "instance stopped reading its input; instance recycled");
    }

    bool cancel_sent = false;
    CallErrorKind stop_kind = CallErrorKind::Timeout;
    SteadyTime kill_at{};
    bool denied_seen = false;
    CapabilityKind denied_kind = CapabilityKind::Network;

    while (true) {
        auto now = Clock::now();
        if (!cancel_sent) {
            bool by_caller = cancel && cancel->cancelled();
            if (by_caller || now >= deadline) {
                stop_kind = by_caller ? CallErrorKind::Cancelled : CallErrorKind::Timeout;
                cancel_sent = true;
                kill_at = now + std::chrono::milliseconds(cfg_.cancel_grace_ms);
                (void)child_.signal(SIGUSR1);
            }
        } else if (now >= kill_at) {
            // Cooperative cancellation did not land in time: recycle.
            return recycle(stop_kind, "call did not stop within the grace period; instance recycled");
        }

        int wait = cancel_sent ? ms_until(kill_at) : ms_until(deadline);
        std::string line;
        auto st = child_.read_line(&line, std::max(1, std::min(wait, kPollSliceMs)), kMaxFrameBytes);
        if (st == ChildProcess::ReadStatus::Timeout) continue;
        if (st == ChildProcess::ReadStatus::Closed) {
            (void)child_.alive();
            reap();
            InstanceReply r = lost("instance exited during call (code " + std::to_string(child_.exit_code()) + ")");
            if (cancel_sent) r.error.kind = stop_kind;
            return r;
        }

        wire::Frame f;
        std::string perr;
        if (!wire::decode(line, &f, &perr)) return lost("protocol violation: " + perr);

        switch (f.type) {
        case wire::FrameType::Host: {
            wire::Frame hr;
            if (cancel_sent) {
                hr.type = wire::FrameType::HostReply;
                hr.status = "cancelled";
            } else {
                hr = effects_->serve(spec_.id, f);
                if (hr.status == "denied") {
                    denied_seen = capability_from_name(hr.capability, &denied_kind);
                }
            }
            // A component that floods host ops without reading the replies
            // cannot hold the host past the grace period.
            const SteadyTime until =
                cancel_sent ? kill_at : deadline + std::chrono::milliseconds(cfg_.cancel_grace_ms);
            auto ws = send(hr, until);
            if (ws == ChildProcess::WriteStatus::Closed) return lost("instance closed its input");
            if (ws == ChildProcess::WriteStatus::Timeout) {
                return recycle(cancel_sent ? stop_kind : CallErrorKind::Timeout,
                               "instance stopped reading host replies; instance recycled");
            }
            break;
        }
        case wire::FrameType::Log:
            std::cerr << "[sandbox] " << spec_.id << " " << f.level << ": "
                      << f.detail.substr(0, 512) << "\n";
            break;
        case wire::FrameType::Done: {
            if (f.id != req.id) return lost("protocol violation: reply for another call");
            if (cancel_sent) {
                reply.error = make_error(stop_kind, stop_kind == CallErrorKind::Timeout
                                                        ? "deadline exceeded"
                                                        : "cancelled by caller");
                return reply;
            }
            if (f.status == "ok") {
                reply.ok = true;
                reply.result_json = std::move(f.result);
            } else if (f.status == "trap") {
                reply.error = make_error(CallErrorKind::ComponentFault, f.detail.empty() ? "trap" : f.detail);
            } else if (f.status == "denied" && denied_seen) {
                reply.error = make_error(CallErrorKind::CapabilityDenied, "capability denied");
                reply.error.capability = denied_kind;
            } else if (f.status == "no_such_function") {
                reply.error = make_error(CallErrorKind::NotFound, "component has no export " + function);
            } else {
                reply.error = make_error(CallErrorKind::ComponentFault, "unexpected completion status " + f.status);
            }
            return reply;
        }
        default:
            return lost(std::string("protocol violation: unexpected ") + wire::frame_type_name(f.type) + " frame");
        }
    }
}

InstancePool::Lease::~Lease() {
    if (pool_) pool_->release(slot_);
}

SandboxInstance* InstancePool::Lease::operator->() const {
    return pool_->members_[slot_].get();
}

InstancePool::~InstancePool() {
    shutdown();
}

bool InstancePool::start(const InstanceSpec& spec, size_t size, const RuntimeConfig& cfg,
                         const HostEffects* effects, std::string* err) {
    std::vector<std::unique_ptr<SandboxInstance>> members;
    for (size_t i = 0; i < std::max<size_t>(1, size); i++) {
        auto inst = std::make_unique<SandboxInstance>(spec, cfg, effects);
        if (!inst->start(err)) return false; // started members are reaped by their destructors
        members.push_back(std::move(inst));
    }
    std::lock_guard<std::mutex> lk(mu_);
    members_ = std::move(members);
    busy_.assign(members_.size(), false);
    closed_ = false;
    return true;
}

InstancePool::Lease InstancePool::acquire(SteadyTime deadline, const CancelToken* cancel) {
    std::unique_lock<std::mutex> lk(mu_);
    while (true) {
        if (closed_) return Lease{};
        for (size_t i = 0; i < busy_.size(); i++) {
            if (!busy_[i]) {
                busy_[i] = true;
                in_flight_++;
                return Lease{this, i};
            }
        }
        if (Clock::now() >= deadline || (cancel && cancel->cancelled())) return Lease{};
        // Short slices so a cancelled caller does not wait out the whole deadline.
        cv_.wait_until(lk, std::min(deadline, Clock::now() + std::chrono::milliseconds(kPollSliceMs)));
    }
}

void InstancePool::release(size_t slot) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        busy_[slot] = false;
        in_flight_--;
    }
    cv_.notify_all();
}

size_t InstancePool::in_flight() const {
    std::lock_guard<std::mutex> lk(mu_);
    return in_flight_;
}

bool InstancePool::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, std::chrono::milliseconds(std::max(0, timeout_ms)),
                        [this] { return in_flight_ == 0; });
}

void InstancePool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        for (size_t i = 0; i < members_.size(); i++) {
            // A leased member belongs to the calling thread: kill it from
            // outside and let that thread reap it.
            if (busy_[i]) members_[i]->interrupt();
            else members_[i]->stop();
        }
    }
    cv_.notify_all();
}

} // namespace capsule
