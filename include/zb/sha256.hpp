#pragma once

#include <zb/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace zb {

// Incremental SHA-256 (FIPS 180-4). Bottle hashes are compared as
// lower-case hex strings.
class Sha256 {
public:
    Sha256();

    // Feed data in chunks
    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalize and return the 32-byte digest. Object should not be
    // reused after this call.
    std::array<uint8_t, 32> finalize();
    std::string hex_digest();

    // One-shot helpers
    static std::string hash_hex(const std::string& input);
    static Result<std::string> hash_file(const std::filesystem::path& path);
    static std::string bytes_to_hex(const std::array<uint8_t, 32>& bytes);

    // Digest of a directory tree: sorted relative paths, entry type,
    // executable bit, file bytes and symlink targets.
    static Result<std::string> hash_tree(const std::filesystem::path& root);

    // 64 lower-case hex characters
    static bool is_hex_digest(const std::string& s);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 8> state_;   // H0..H7
    uint64_t total_bytes_;             // total bytes fed so far
    uint8_t  buffer_[64];              // partial block accumulator
    size_t   buffer_len_;              // bytes in buffer_
};

} // namespace zb
