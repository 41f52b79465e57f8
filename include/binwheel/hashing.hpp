#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace binwheel {

// ============================================================================
// SHA-256 Hashing
// ============================================================================
//
// Two renderings of the same digest are needed:
//   - hex_digest:    lowercase hex, used for summaries and general checks
//   - record_digest: "sha256=" + unpadded base64url, the RECORD form

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
    std::string record_digest;  // sha256=<base64url, no '='>
    std::uint64_t size = 0;     // Bytes hashed
};

// Stream a file through SHA-256 in fixed-size chunks
HashResult compute_sha256(const std::string& file_path);

// Hash an in-memory buffer
HashResult compute_sha256(const std::vector<std::uint8_t>& data);

// Incremental hasher for content that arrives in pieces
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    bool update(const void* data, std::size_t len);

    // Finish the digest. The hasher cannot be updated afterwards.
    HashResult finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Encoding helpers
std::string to_hex(const unsigned char* data, std::size_t len);
std::string base64url_nopad(const unsigned char* data, std::size_t len);

} // namespace binwheel
