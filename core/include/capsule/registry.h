#pragma once

#include "config.h"
#include "host_effects.h"
#include "instance.h"
#include "introspect.h"
#include "log.h"
#include "policy.h"
#include "type_tree.h"
#include "types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace capsule {

// Immutable snapshot. Every status change publishes a new record; the pool
// is shared between snapshots of the same instantiation.
struct ComponentRecord {
    ComponentId id;
    std::string source;       // canonical path; empty for byte-loaded components
    std::string staged_path;  // content-addressed copy the sandboxes map
    std::string binary_digest;
    std::chrono::system_clock::time_point load_time;
    CallSchema schema;
    ComponentState status{ComponentState::Loading};
    std::string failure;      // reason while Failed
    std::shared_ptr<InstancePool> pool;
    int restarts{0};          // consecutive failed re-instantiations
};

struct LoadResult {
    bool ok{false};
    ComponentId id;
    LoadError error;
    SchemaErrorKind schema_error{SchemaErrorKind::None};
    bool reloaded{false};
};

struct ComponentSummary {
    ComponentId id;
    CallSchema schema;
    ComponentState status{ComponentState::Loading};
    std::string failure;
    std::string source;
    std::string digest;
};

enum class RegistryEventKind { Added, Removed, Reloaded, Failed };

struct RegistryEvent {
    uint64_t seq{0};
    RegistryEventKind kind{RegistryEventKind::Added};
    ComponentId id;
};

using RegistryListener = std::function<void(const RegistryEvent&)>;

const char* registry_event_name(RegistryEventKind k);

// "weather-Tool.v2.so" -> "weather-tool_v2"
ComponentId component_id_from_path(const std::string& path);

// Single owner of all component records. Operations on one id are
// serialised; different ids proceed independently.
class ComponentRegistry {
public:
    ComponentRegistry(const RuntimeConfig& cfg, PolicyStore* policy, AuditLog* audit);
    ~ComponentRegistry();
    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    // A source that is already loaded is reloaded instead.
    LoadResult load(const std::string& path);
    LoadResult load_bytes(const std::string& bytes);

    // Breaking changes (removed tool, changed signature) are rejected and
    // the previous record keeps serving.
    LoadResult reload(const ComponentId& id);

    // Waits for in-flight calls up to the unload grace period.
    bool unload(const ComponentId& id);

    std::vector<ComponentSummary> list() const;
    // Ids with a lifecycle operation running or queued.
    size_t op_lock_count() const;
    std::shared_ptr<const ComponentRecord> get(const ComponentId& id) const;

    // Publish Failed for the instantiation `seen` belongs to. Ignored when
    // the record has moved on (reloaded, re-instantiated, removed).
    void mark_failed(const ComponentId& id, const ComponentRecord* seen, const std::string& reason);

    // Ready record, re-instantiating a Failed one first. nullptr when the
    // component is gone, unloading, or could not be brought back.
    std::shared_ptr<const ComponentRecord> ensure_ready(const ComponentId& id);

    // Events are delivered synchronously, in mutation order. Listeners must
    // not call back into the registry.
    size_t subscribe(RegistryListener listener);
    void unsubscribe(size_t token);

    // Poll `dir` for *.so additions, removals and modifications.
    void watch(const std::string& dir);
    void scan_once();
    void stop_watching();

    void shutdown();

    PolicyStore& policy() { return *policy_; }
    const RuntimeConfig& config() const { return cfg_; }

private:
    struct Prepared {
        std::string digest;
        CallSchema schema;
        std::string staged_path;
    };

    struct WatchedFile {
        uintmax_t size{0};
        std::filesystem::file_time_type mtime;
    };

    LoadResult load_new(const ComponentId& id, const std::string& source, const std::string& bytes);
    LoadResult reload_locked(const ComponentId& id);
    bool unload_locked(const ComponentId& id, bool drain);

    bool prepare(const std::string& bytes, Prepared* out, LoadResult* res);
    bool instantiate(const ComponentId& id, const Prepared& p, std::shared_ptr<InstancePool>* pool,
                     LoadResult* res);
    void apply_policy_file(const ComponentId& id, const std::string& source);

    ComponentId reserve_id(const std::string& source, bool* existing);
    void release_id(const ComponentId& id);

    // Serialises lifecycle operations on one id. The per-id mutex is
    // dropped from op_locks_ once nothing holds or waits for it.
    class OpLock {
    public:
        OpLock(ComponentRegistry* reg, const ComponentId& id);
        ~OpLock();
        OpLock(const OpLock&) = delete;
        OpLock& operator=(const OpLock&) = delete;

    private:
        ComponentRegistry* reg_;
        ComponentId id_;
        std::shared_ptr<std::mutex> m_;
    };

    void publish(std::shared_ptr<const ComponentRecord> rec);
    void erase(const ComponentId& id);
    void emit(RegistryEventKind kind, const ComponentId& id);
    void audit(const std::string& name, const ComponentId& id, const std::string& detail);
    void remove_staged_if_unused(const std::string& staged_path);

    void watch_loop();

    RuntimeConfig cfg_;
    PolicyStore* policy_;
    AuditLog* audit_;
    HostEffects effects_;

    mutable std::shared_mutex index_mu_;
    std::map<ComponentId, std::shared_ptr<const ComponentRecord>> index_;

    mutable std::mutex ids_mu_;
    std::map<std::string, ComponentId> sources_;   // canonical source -> id
    std::map<ComponentId, std::string> reserved_;  // id -> source (or digest)
    std::map<ComponentId, std::shared_ptr<std::mutex>> op_locks_;

    std::mutex events_mu_;
    uint64_t event_seq_{0};
    size_t next_listener_{1};
    std::map<size_t, RegistryListener> listeners_;

    std::mutex watch_mu_;
    std::condition_variable watch_cv_;
    bool watch_stop_{false};
    std::thread watcher_;
    std::mutex scan_mu_;
    std::filesystem::path watch_dir_;
    std::map<std::string, WatchedFile> watched_;
};

} // namespace capsule
