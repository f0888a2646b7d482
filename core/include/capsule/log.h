#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include <json-c/json.h>

namespace capsule {

// Append-only JSONL audit trail. Each line is canonical JSON (sorted keys)
// carrying chain_hash = SHA256(chain_prev || record); a run starts from a
// zero chain_prev. Thread-safe. A default-constructed or empty-path log
// drops events.
class AuditLog {
public:
    AuditLog() = default;
    explicit AuditLog(const std::string& path);

    bool enabled() const { return enabled_; }
    void event(const std::string& name, const std::string& payload_json);
    const std::string& path() const { return path_; }
    const std::string& run_id() const { return run_id_; }

private:
    std::mutex mu_;
    bool enabled_{false};
    std::string path_;
    std::string run_id_;
    std::ofstream out_;
    std::string chain_prev_;
    uint64_t seq_{0};
};

// Deterministic serialisation with sorted object keys.
std::string canonical_json(json_object* obj);

// Re-derive every chain_hash of one run in the file. Returns the number of
// records checked, or -1 (err filled) on the first broken link.
long verify_audit_chain(const std::string& path, const std::string& run_id, std::string* err);

} // namespace capsule
