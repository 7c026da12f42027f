#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace planwarden {

// Incremental SHA-256 (FIPS 180-4).
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finishes the digest. The object must be reset() before reuse.
    std::array<uint8_t, 32> final();
    std::string final_hex();

    void reset();

private:
    uint32_t state_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
};

std::string to_hex(const uint8_t* data, size_t n);

std::string sha256_hex(const uint8_t* data, size_t n);
inline std::string sha256_hex(const std::string& s) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// SHA256 of a file's contents, streamed in chunks (empty string on error)
std::string sha256_hex_file(const std::filesystem::path& path);

// Constant-time string equality (for comparing hex digests)
bool constant_time_eq(const std::string& a, const std::string& b);

// Case-insensitive hex digest comparison, constant time over the longer input.
bool hex_digest_eq(const std::string& a, const std::string& b);

} // namespace planwarden
