#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace unbox {

// ============================================================================
// Remote Transport Utilities
// ============================================================================
//
// HTTP(S) access used to verify and download remote boxes, plus SHA-256
// helpers for pinning downloaded archives. Nothing here touches the
// destination directory.

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256(const std::string& file_path);

struct Sha256VerifyResult {
    bool ok = false;
    std::string error;
    std::string actual_digest;
    std::string expected_digest;
};

// Verify data matches expected SHA-256 digest (case-insensitive hex)
Sha256VerifyResult verify_sha256(const std::vector<uint8_t>& data,
                                  const std::string& expected_hex);

// True for exactly 64 hex characters
bool is_sha256_hex(const std::string& hex);

// ============================================================================
// HTTP
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    bool transport_error = false;   // no HTTP response at all (DNS, TLS, timeout...)
    std::vector<uint8_t> data;
    long http_status = 0;
    std::string content_type;
};

// GET a URL. Follows redirects and verifies TLS certificates.
FetchResult fetch_url(const std::string& url);

// HEAD a URL; ok only for a 2xx final status. Follows up to 50 redirects.
FetchResult probe_url(const std::string& url);

} // namespace unbox
