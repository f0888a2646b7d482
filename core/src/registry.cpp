#include "capsule/registry.h"
#include "capsule/component_file.h"
#include "capsule/crypto.h"
#include "capsule/json_mini.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace capsule {

const char* registry_event_name(RegistryEventKind k) {
    switch (k) {
        case RegistryEventKind::Added:    return "added";
        case RegistryEventKind::Removed:  return "removed";
        case RegistryEventKind::Reloaded: return "reloaded";
        case RegistryEventKind::Failed:   return "failed";
    }
    return "unknown";
}

ComponentId component_id_from_path(const std::string& path) {
    std::string stem = fs::path(path).stem().string();
    std::string out;
    for (char c : stem) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!keep) c = '_';
        // "__" separates component id and function in tool names.
        if (c == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(c);
    }
    while (!out.empty() && (out.back() == '_' || out.back() == '-')) out.pop_back();
    while (!out.empty() && (out.front() == '_' || out.front() == '-')) out.erase(out.begin());
    return out.empty() ? "component" : out;
}

static LoadResult load_failure(LoadErrorKind k, const std::string& msg) {
    LoadResult r;
    r.error.kind = k;
    r.error.message = msg;
    return r;
}

ComponentRegistry::ComponentRegistry(const RuntimeConfig& cfg, PolicyStore* policy, AuditLog* audit)
    : cfg_(cfg), policy_(policy), audit_(audit), effects_(policy, cfg, audit) {}

ComponentRegistry::~ComponentRegistry() {
    shutdown();
}

// ---- identity & locking ----------------------------------------------------

ComponentId ComponentRegistry::reserve_id(const std::string& source, bool* existing) {
    std::lock_guard<std::mutex> lk(ids_mu_);
    auto it = sources_.find(source);
    if (it != sources_.end()) {
        *existing = true;
        return it->second;
    }
    *existing = false;

    ComponentId base;
    if (source.rfind("bytes:", 0) == 0) base = "c" + source.substr(6, 12);
    else base = component_id_from_path(source);

    ComponentId id = base;
    for (int n = 2; reserved_.count(id); n++) id = base + "-" + std::to_string(n);
    reserved_[id] = source;
    sources_[source] = id;
    return id;
}

void ComponentRegistry::release_id(const ComponentId& id) {
    std::lock_guard<std::mutex> lk(ids_mu_);
    auto it = reserved_.find(id);
    if (it == reserved_.end()) return;
    sources_.erase(it->second);
    reserved_.erase(it);
}

ComponentRegistry::OpLock::OpLock(ComponentRegistry* reg, const ComponentId& id) : reg_(reg), id_(id) {
    {
        std::lock_guard<std::mutex> lk(reg_->ids_mu_);
        auto& m = reg_->op_locks_[id_];
        if (!m) m = std::make_shared<std::mutex>();
        m_ = m;
    }
    m_->lock();
}

ComponentRegistry::OpLock::~OpLock() {
    m_->unlock();
    m_.reset();
    std::lock_guard<std::mutex> lk(reg_->ids_mu_);
    auto it = reg_->op_locks_.find(id_);
    // Copies are only taken under ids_mu_, so a sole owner means no waiter.
    if (it != reg_->op_locks_.end() && it->second.use_count() == 1) reg_->op_locks_.erase(it);
}

size_t ComponentRegistry::op_lock_count() const {
    std::lock_guard<std::mutex> lk(ids_mu_);
    return op_locks_.size();
}

// ---- index & events --------------------------------------------------------

void ComponentRegistry::publish(std::shared_ptr<const ComponentRecord> rec) {
    std::unique_lock<std::shared_mutex> lk(index_mu_);
    index_[rec->id] = std::move(rec);
}

void ComponentRegistry::erase(const ComponentId& id) {
    std::unique_lock<std::shared_mutex> lk(index_mu_);
    index_.erase(id);
}

std::shared_ptr<const ComponentRecord> ComponentRegistry::get(const ComponentId& id) const {
    std::shared_lock<std::shared_mutex> lk(index_mu_);
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

std::vector<ComponentSummary> ComponentRegistry::list() const {
    std::shared_lock<std::shared_mutex> lk(index_mu_);
    std::vector<ComponentSummary> out;
    out.reserve(index_.size());
    for (const auto& kv : index_) {
        const ComponentRecord& r = *kv.second;
        out.push_back(ComponentSummary{r.id, r.schema, r.status, r.failure, r.source, r.binary_digest});
    }
    return out;
}

size_t ComponentRegistry::subscribe(RegistryListener listener) {
    std::lock_guard<std::mutex> lk(events_mu_);
    size_t token = next_listener_++;
    listeners_[token] = std::move(listener);
    return token;
}

void ComponentRegistry::unsubscribe(size_t token) {
    std::lock_guard<std::mutex> lk(events_mu_);
    listeners_.erase(token);
}

void ComponentRegistry::emit(RegistryEventKind kind, const ComponentId& id) {
    // Held across delivery so every listener sees events in seq order.
    std::lock_guard<std::mutex> lk(events_mu_);
    RegistryEvent ev{++event_seq_, kind, id};
    for (auto& kv : listeners_) kv.second(ev);
}

void ComponentRegistry::audit(const std::string& name, const ComponentId& id, const std::string& detail) {
    if (!audit_ || !audit_->enabled()) return;
    json_mini::Doc p(json_object_new_object());
    json_object_object_add(p.root, "component", json_mini::new_string(id));
    if (!detail.empty()) json_object_object_add(p.root, "detail", json_mini::new_string(detail));
    audit_->event(name, json_mini::dump(p.root));
}

void ComponentRegistry::remove_staged_if_unused(const std::string& staged_path) {
    if (staged_path.empty()) return;
    {
        std::shared_lock<std::shared_mutex> lk(index_mu_);
        for (const auto& kv : index_) {
            if (kv.second->staged_path == staged_path) return;
        }
    }
    std::error_code ec;
    fs::remove(staged_path, ec);
}

// ---- load pipeline ---------------------------------------------------------

bool ComponentRegistry::prepare(const std::string& bytes, Prepared* out, LoadResult* res) {
    ComponentImage img;
    if (!inspect_component(bytes, &img, &res->error)) return false;

    IntrospectResult ir = introspect(img.interface_json);
    if (!ir.ok) {
        res->error.kind = LoadErrorKind::UnsupportedInterface;
        res->error.message = std::string(schema_error_name(ir.error.kind)) + ": " + ir.error.message;
        res->schema_error = ir.error.kind;
        return false;
    }
    for (const auto& imp : ir.schema.imports) {
        if (!supported_import(imp)) {
            res->error.kind = LoadErrorKind::InstantiationFailed;
            res->error.message = "host does not provide import '" + imp + "'";
            return false;
        }
    }

    std::error_code ec;
    fs::create_directories(cfg_.staging_dir, ec);
    if (ec) {
        res->error.kind = LoadErrorKind::InstantiationFailed;
        res->error.message = "cannot create staging dir " + cfg_.staging_dir + ": " + ec.message();
        return false;
    }
    fs::path staged = fs::path(cfg_.staging_dir) / (img.digest + ".so");
    if (!fs::exists(staged, ec)) {
        fs::path tmp = staged;
        tmp += ".tmp." + random_hex(4);
        {
            std::ofstream o(tmp, std::ios::binary | std::ios::trunc);
            o.write(bytes.data(), (std::streamsize)bytes.size());
            if (!o) {
                res->error.kind = LoadErrorKind::InstantiationFailed;
                res->error.message = "cannot stage component at " + tmp.string();
                return false;
            }
        }
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_exec, ec);
        fs::rename(tmp, staged, ec);
        if (ec) {
            fs::remove(tmp, ec);
            res->error.kind = LoadErrorKind::InstantiationFailed;
            res->error.message = "cannot stage component: " + ec.message();
            return false;
        }
    }

    out->digest = img.digest;
    out->schema = std::move(ir.schema);
    out->staged_path = staged.string();
    return true;
}

bool ComponentRegistry::instantiate(const ComponentId& id, const Prepared& p,
                                    std::shared_ptr<InstancePool>* pool, LoadResult* res) {
    ResourceLimits lim = policy_->resource_limits(id);
    InstanceSpec spec;
    spec.id = id;
    spec.staged_path = p.staged_path;
    spec.memory_bytes = lim.memory_bytes.value_or(cfg_.default_memory_mb * 1024ULL * 1024ULL);
    spec.cpu_ms = lim.cpu_ms.value_or(cfg_.default_cpu_ms);

    auto np = std::make_shared<InstancePool>();
    std::string err;
    if (!np->start(spec, (size_t)cfg_.pool_size, cfg_, &effects_, &err)) {
        res->error.kind = LoadErrorKind::InstantiationFailed;
        res->error.message = err;
        return false;
    }
    *pool = std::move(np);
    return true;
}

void ComponentRegistry::apply_policy_file(const ComponentId& id, const std::string& source) {
    fs::path src(source);
    fs::path doc = src.parent_path() / (src.stem().string() + ".policy.json");
    std::error_code ec;
    if (!fs::is_regular_file(doc, ec)) return;

    std::ifstream in(doc);
    std::stringstream ss;
    ss << in.rdbuf();
    PolicyError pe = policy_->apply_document(id, ss.str());
    if (pe.kind != PolicyErrorKind::None) {
        // The component still loads, with no grants.
        std::cerr << "[registry] " << id << ": ignoring " << doc.string() << ": " << pe.message << "\n";
        return;
    }
    std::cerr << "[registry] " << id << ": applied " << doc.string() << "\n";
    audit("policy_file", id, doc.string());
}

LoadResult ComponentRegistry::load_new(const ComponentId& id, const std::string& source, const std::string& bytes) {
    LoadResult res;
    res.id = id;
    Prepared p;
    if (!prepare(bytes, &p, &res)) {
        release_id(id);
        std::cerr << "[registry] load " << (source.empty() ? id : source) << " failed: "
                  << load_error_name(res.error.kind) << ": " << res.error.message << "\n";
        return res;
    }

    auto loading = std::make_shared<ComponentRecord>();
    loading->id = id;
    loading->source = source;
    loading->staged_path = p.staged_path;
    loading->binary_digest = p.digest;
    loading->load_time = std::chrono::system_clock::now();
    loading->schema = p.schema;
    loading->status = ComponentState::Loading;
    publish(loading);

    policy_->create(id);
    if (!source.empty()) apply_policy_file(id, source);

    std::shared_ptr<InstancePool> pool;
    if (!instantiate(id, p, &pool, &res)) {
        erase(id);
        policy_->drop(id);
        release_id(id);
        remove_staged_if_unused(p.staged_path);
        std::cerr << "[registry] load " << (source.empty() ? id : source) << " failed: "
                  << load_error_name(res.error.kind) << ": " << res.error.message << "\n";
        audit("load_failed", id, res.error.message);
        return res;
    }

    auto ready = std::make_shared<ComponentRecord>(*loading);
    ready->status = ComponentState::Ready;
    ready->pool = std::move(pool);
    publish(ready);

    res.ok = true;
    std::cerr << "[registry] loaded " << id << " (" << p.schema.tools.size() << " tools, "
              << p.digest.substr(0, 12) << ")\n";
    audit("load", id, p.digest);
    emit(RegistryEventKind::Added, id);
    return res;
}

LoadResult ComponentRegistry::load(const std::string& path) {
    std::error_code ec;
    fs::path canon = fs::weakly_canonical(fs::absolute(path, ec), ec);
    if (ec) return load_failure(LoadErrorKind::Malformed, "cannot resolve " + path + ": " + ec.message());
    const std::string source = canon.string();

    // Retry when a concurrent failed load released the reservation under us.
    for (int attempt = 0; attempt < 3; attempt++) {
        bool existing = false;
        ComponentId id = reserve_id(source, &existing);
        OpLock op(this, id);
        {
            std::lock_guard<std::mutex> ik(ids_mu_);
            auto it = sources_.find(source);
            if (it == sources_.end() || it->second != id) continue;
        }
        if (get(id)) {
            LoadResult r = reload_locked(id);
            r.reloaded = true;
            return r;
        }

        std::string bytes;
        LoadResult res;
        res.id = id;
        if (!read_component_file(canon, (size_t)cfg_.max_component_mb * 1024 * 1024, &bytes, &res.error)) {
            release_id(id);
            return res;
        }
        return load_new(id, source, bytes);
    }
    return load_failure(LoadErrorKind::InstantiationFailed, "concurrent load of " + source + " kept failing");
}

LoadResult ComponentRegistry::load_bytes(const std::string& bytes) {
    if (bytes.size() > (size_t)cfg_.max_component_mb * 1024 * 1024) {
        return load_failure(LoadErrorKind::Malformed, "component exceeds size limit");
    }
    const std::string key = "bytes:" + sha256_hex(bytes);

    for (int attempt = 0; attempt < 3; attempt++) {
        bool existing = false;
        ComponentId id = reserve_id(key, &existing);
        OpLock op(this, id);
        {
            std::lock_guard<std::mutex> ik(ids_mu_);
            auto it = sources_.find(key);
            if (it == sources_.end() || it->second != id) continue;
        }
        if (get(id)) {
            // Identical bytes: the same component.
            LoadResult r;
            r.ok = true;
            r.id = id;
            return r;
        }
        return load_new(id, "", bytes);
    }
    return load_failure(LoadErrorKind::InstantiationFailed, "concurrent load kept failing");
}

// ---- reload ----------------------------------------------------------------

LoadResult ComponentRegistry::reload(const ComponentId& id) {
    OpLock op(this, id);
    return reload_locked(id);
}

LoadResult ComponentRegistry::reload_locked(const ComponentId& id) {
    LoadResult res;
    res.id = id;
    auto cur = get(id);
    if (!cur || cur->status == ComponentState::Unloading) {
        res.error.message = "unknown component: " + id;
        return res;
    }
    if (cur->source.empty()) {
        res.error.kind = LoadErrorKind::Malformed;
        res.error.message = "component was loaded from bytes; there is no source to re-read";
        return res;
    }

    std::string bytes;
    if (!read_component_file(cur->source, (size_t)cfg_.max_component_mb * 1024 * 1024, &bytes, &res.error)) {
        std::cerr << "[registry] reload " << id << " failed: " << res.error.message << "\n";
        return res;
    }
    if (sha256_hex(bytes) == cur->binary_digest && cur->status == ComponentState::Ready) {
        res.ok = true;
        return res;
    }

    Prepared p;
    if (!prepare(bytes, &p, &res)) {
        std::cerr << "[registry] reload " << id << " failed: " << load_error_name(res.error.kind)
                  << ": " << res.error.message << "; previous version keeps serving\n";
        audit("reload_failed", id, res.error.message);
        return res;
    }

    SchemaDiff diff = diff_schemas(cur->schema, p.schema);
    if (diff.breaking()) {
        std::ostringstream why;
        why << "reload would break advertised tools:";
        for (const auto& n : diff.removed) why << " removed " << n << ";";
        for (const auto& n : diff.changed) why << " changed " << n << ";";
        res.error.kind = LoadErrorKind::UnsupportedInterface;
        res.error.message = why.str();
        if (p.staged_path != cur->staged_path) remove_staged_if_unused(p.staged_path);
        std::cerr << "[registry] " << id << ": " << res.error.message << " previous version keeps serving\n";
        audit("reload_rejected", id, res.error.message);
        return res;
    }

    std::shared_ptr<InstancePool> pool;
    if (!instantiate(id, p, &pool, &res)) {
        if (p.staged_path != cur->staged_path) remove_staged_if_unused(p.staged_path);
        std::cerr << "[registry] reload " << id << " failed: " << res.error.message
                  << "; previous version keeps serving\n";
        audit("reload_failed", id, res.error.message);
        return res;
    }

    auto next = std::make_shared<ComponentRecord>();
    next->id = id;
    next->source = cur->source;
    next->staged_path = p.staged_path;
    next->binary_digest = p.digest;
    next->load_time = std::chrono::system_clock::now();
    next->schema = std::move(p.schema);
    next->status = ComponentState::Ready;
    next->pool = std::move(pool);
    publish(next);
    // Calls still running on the previous pool finish there; the pool goes
    // away with its last snapshot.
    if (cur->staged_path != next->staged_path) remove_staged_if_unused(cur->staged_path);

    res.ok = true;
    std::cerr << "[registry] reloaded " << id << " (+" << diff.added.size() << " tools)\n";
    audit("reload", id, next->binary_digest);
    emit(RegistryEventKind::Reloaded, id);
    return res;
}

// ---- unload & failure ------------------------------------------------------

bool ComponentRegistry::unload(const ComponentId& id) {
    OpLock op(this, id);
    return unload_locked(id, true);
}

bool ComponentRegistry::unload_locked(const ComponentId& id, bool drain) {
    auto cur = get(id);
    if (!cur) return false;

    auto closing = std::make_shared<ComponentRecord>(*cur);
    closing->status = ComponentState::Unloading;
    publish(closing);

    if (cur->pool) {
        if (drain && !cur->pool->wait_idle(cfg_.unload_grace_ms)) {
            std::cerr << "[registry] " << id << ": " << cur->pool->in_flight()
                      << " call(s) still running after the grace period; terminating\n";
        }
        cur->pool->shutdown();
    }

    erase(id);
    policy_->drop(id);
    release_id(id);
    remove_staged_if_unused(cur->staged_path);

    std::cerr << "[registry] unloaded " << id << "\n";
    audit("unload", id, "");
    emit(RegistryEventKind::Removed, id);
    return true;
}

void ComponentRegistry::mark_failed(const ComponentId& id, const ComponentRecord* seen, const std::string& reason) {
    OpLock op(this, id);
    auto cur = get(id);
    if (!cur || cur->status != ComponentState::Ready) return;
    if (seen && seen->pool != cur->pool) return;

    auto failed = std::make_shared<ComponentRecord>(*cur);
    failed->status = ComponentState::Failed;
    failed->failure = reason;
    publish(failed);

    std::cerr << "[registry] " << id << " failed: " << reason << "\n";
    audit("failed", id, reason);
    emit(RegistryEventKind::Failed, id);
}

std::shared_ptr<const ComponentRecord> ComponentRegistry::ensure_ready(const ComponentId& id) {
    auto cur = get(id);
    if (!cur) return nullptr;
    if (cur->status == ComponentState::Ready) return cur;
    if (cur->status != ComponentState::Failed) return nullptr;

    OpLock op(this, id);
    cur = get(id);
    if (!cur) return nullptr;
    if (cur->status == ComponentState::Ready) return cur;
    if (cur->status != ComponentState::Failed) return nullptr;

    Prepared p;
    p.digest = cur->binary_digest;
    p.schema = cur->schema;
    p.staged_path = cur->staged_path;
    LoadResult res;
    std::shared_ptr<InstancePool> pool;
    if (instantiate(id, p, &pool, &res)) {
        auto next = std::make_shared<ComponentRecord>(*cur);
        next->status = ComponentState::Ready;
        next->failure.clear();
        next->pool = std::move(pool);
        next->restarts = 0;
        publish(next);
        std::cerr << "[registry] " << id << " re-instantiated\n";
        audit("restart", id, "");
        emit(RegistryEventKind::Reloaded, id);
        return next;
    }

    int restarts = cur->restarts + 1;
    if (restarts >= cfg_.restart_budget) {
        std::cerr << "[registry] " << id << ": restart budget exhausted (" << res.error.message
                  << "); removing\n";
        audit("restart_budget_exhausted", id, res.error.message);
        unload_locked(id, false);
        return nullptr;
    }
    auto failed = std::make_shared<ComponentRecord>(*cur);
    failed->restarts = restarts;
    failed->failure = res.error.message;
    failed->pool.reset();
    publish(failed);
    std::cerr << "[registry] " << id << ": re-instantiation " << restarts << "/" << cfg_.restart_budget
              << " failed: " << res.error.message << "\n";
    return nullptr;
}

// ---- directory watching ----------------------------------------------------

void ComponentRegistry::watch(const std::string& dir) {
    stop_watching();
    {
        std::lock_guard<std::mutex> lk(scan_mu_);
        std::error_code ec;
        watch_dir_ = fs::weakly_canonical(fs::absolute(dir, ec), ec);
        watched_.clear();
    }
    scan_once();
    {
        std::lock_guard<std::mutex> lk(watch_mu_);
        watch_stop_ = false;
    }
    watcher_ = std::thread([this] { watch_loop(); });
}

void ComponentRegistry::watch_loop() {
    std::unique_lock<std::mutex> lk(watch_mu_);
    while (!watch_stop_) {
        watch_cv_.wait_for(lk, std::chrono::milliseconds(cfg_.watch_ms), [this] { return watch_stop_; });
        if (watch_stop_) break;
        lk.unlock();
        scan_once();
        lk.lock();
    }
}

void ComponentRegistry::stop_watching() {
    {
        std::lock_guard<std::mutex> lk(watch_mu_);
        watch_stop_ = true;
    }
    watch_cv_.notify_all();
    if (watcher_.joinable()) watcher_.join();
}

void ComponentRegistry::scan_once() {
    std::lock_guard<std::mutex> lk(scan_mu_);
    if (watch_dir_.empty()) return;

    std::map<std::string, WatchedFile> now;
    std::error_code ec;
    for (fs::directory_iterator it(watch_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec) || it->path().extension() != ".so") continue;
        WatchedFile wf;
        wf.size = it->file_size(fec);
        wf.mtime = it->last_write_time(fec);
        if (fec) continue;
        now[it->path().string()] = wf;
    }
    if (ec) {
        std::cerr << "[registry] cannot scan " << watch_dir_.string() << ": " << ec.message() << "\n";
        return;
    }

    auto id_for = [this](const std::string& path) -> ComponentId {
        std::error_code e;
        std::string canon = fs::weakly_canonical(path, e).string();
        std::lock_guard<std::mutex> ik(ids_mu_);
        auto it = sources_.find(canon);
        return it == sources_.end() ? ComponentId{} : it->second;
    };

    for (const auto& kv : now) {
        auto prev = watched_.find(kv.first);
        if (prev == watched_.end()) {
            (void)load(kv.first); // failures are logged and leave no record
            continue;
        }
        if (prev->second.size == kv.second.size && prev->second.mtime == kv.second.mtime) continue;
        ComponentId id = id_for(kv.first);
        if (!id.empty() && get(id)) (void)reload(id);
        else (void)load(kv.first);
    }
    for (const auto& kv : watched_) {
        if (now.count(kv.first)) continue;
        ComponentId id = id_for(kv.first);
        if (!id.empty()) (void)unload(id);
    }
    watched_ = std::move(now);
}

void ComponentRegistry::shutdown() {
    stop_watching();
    std::vector<std::shared_ptr<const ComponentRecord>> recs;
    {
        std::unique_lock<std::shared_mutex> lk(index_mu_);
        for (auto& kv : index_) recs.push_back(kv.second);
        index_.clear();
    }
    for (auto& r : recs) {
        if (r->pool) r->pool->shutdown();
        policy_->drop(r->id);
    }
    std::lock_guard<std::mutex> lk(ids_mu_);
    sources_.clear();
    reserved_.clear();
}

} // namespace capsule
