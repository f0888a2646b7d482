#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace capsule {

// Incremental SHA-256. Used for component digests (content addressing and
// reload change detection) and the audit hash chain.
class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    std::array<uint8_t, 32> finish();
    std::string finish_hex();

private:
    void block(const uint8_t* p);

    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
};

std::string sha256_hex(const std::string& s);

// SHA-256 of a file's contents (empty string on error)
std::string sha256_hex_file(const std::filesystem::path& path);

// Constant-time string equality (bearer tokens)
bool constant_time_eq(const std::string& a, const std::string& b);

// Cryptographically secure random bytes as lowercase hex (session ids)
std::string random_hex(size_t n_bytes);

} // namespace capsule
