#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace kyotee::hash {

// Incremental SHA-256. Used for the event-log hash chain and the
// config fingerprint in run_start.
class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }
    std::array<uint8_t, 32> finish();

private:
    void compress(const uint8_t block[64]);

    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_len_{0};
};

std::string to_hex(const uint8_t* data, size_t n);
std::string sha256_hex(const std::string& s);

// Digest of a file's contents; empty string if it cannot be read.
std::string sha256_file_hex(const std::string& path);

} // namespace kyotee::hash
