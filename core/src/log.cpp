#include "capsule/log.h"
#include "capsule/crypto.h"
#include "capsule/json_mini.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace capsule {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

// Sorted keys (RFC 8785 subset) so the chain hash is reproducible.
static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_mini::new_string(keys[i]);
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

AuditLog::AuditLog(const std::string& path)
    : path_(path), run_id_(random_hex(8)), chain_prev_(std::string(64, '0')) {
    if (path_.empty()) return;
    out_.open(path_, std::ios::out | std::ios::app);
    enabled_ = out_.is_open();
}

static json_object* record_object(const std::string& name, const std::string& payload_json,
                                  const std::string& run_id, uint64_t seq, const std::string& ts) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_mini::new_string(name));
    json_mini::Doc p = json_mini::parse(payload_json);
    json_object_object_add(rec, "payload", p ? p.release() : json_mini::new_string(payload_json));
    json_object_object_add(rec, "run_id", json_mini::new_string(run_id));
    json_object_object_add(rec, "seq", json_object_new_int64(static_cast<int64_t>(seq)));
    json_object_object_add(rec, "ts", json_mini::new_string(ts));
    return rec;
}

void AuditLog::event(const std::string& name, const std::string& payload_json) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lk(mu_);
    const std::string ts = iso_now();

    json_mini::Doc rec(record_object(name, payload_json, run_id_, seq_, ts));
    const std::string record = canonical_json(rec.root);
    const std::string chain_hash = sha256_hex(chain_prev_ + record);

    json_object_object_add(rec.root, "chain_hash", json_mini::new_string(chain_hash));
    json_object_object_add(rec.root, "chain_prev", json_mini::new_string(chain_prev_));
    out_ << canonical_json(rec.root) << "\n";
    out_.flush();

    chain_prev_ = chain_hash;
    seq_++;
}

long verify_audit_chain(const std::string& path, const std::string& run_id, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return -1;
    }
    std::string prev(64, '0');
    long n = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        json_mini::Doc d = json_mini::parse(line);
        if (!d) {
            if (err) *err = "unparsable line";
            return -1;
        }
        if (json_mini::get_string(d.root, "run_id").value_or("") != run_id) continue;
        auto hash = json_mini::get_string(d.root, "chain_hash").value_or("");
        auto chain_prev = json_mini::get_string(d.root, "chain_prev").value_or("");
        json_object_object_del(d.root, "chain_hash");
        json_object_object_del(d.root, "chain_prev");
        if (chain_prev != prev || sha256_hex(prev + canonical_json(d.root)) != hash) {
            if (err) *err = "chain broken at record " + std::to_string(n);
            return -1;
        }
        prev = hash;
        n++;
    }
    return n;
}

} // namespace capsule
